/*
 * 설명: 서버 진입점으로 환경설정을 로드해 실행한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/challenge_flow_test.cpp
 */
#include <csignal>
#include <exception>
#include <iostream>

#include "arena/app.hpp"

int main() {
  using namespace arena;
  // 자식 프로세스가 stdin을 닫기 전에 종료해도 서버가 죽지 않도록 한다.
  std::signal(SIGPIPE, SIG_IGN);

  try {
    AppConfig config = LoadConfigFromEnv();
    ServerApp app(config);

    std::signal(SIGINT, [](int) {
      std::cout << "SIGINT 수신, 종료를 준비합니다\n";
    });

    app.Run();
  } catch (const std::exception& ex) {
    std::cerr << "서버 초기화 실패: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
