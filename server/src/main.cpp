/*
 * 설명: 서버 진입점으로 환경설정을 로드해 실행한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/leaderboard_flow_test.cpp
 */
#include <cstdlib>
#include <iostream>

#include "leaderboard/app.hpp"
#include "leaderboard/errors.hpp"

int main() {
  using namespace leaderboard;
  try {
    AppConfig config = LoadConfigFromEnv();
    ServerApp app(config);
    app.Run();
    app.Stop();
  } catch (const FatalConfigurationError& ex) {
    std::cerr << "기동 실패: " << ex.what() << "\n";
    return EXIT_FAILURE;
  } catch (const std::exception& ex) {
    std::cerr << "서버 실행 중 예외: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
