/*
 * 설명: 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace arena {

struct SandboxToolchain {
  std::string python_bin;
  std::string node_bin;
  std::string gcc_bin;
  std::string gxx_bin;
  std::string javac_bin;
  std::string java_bin;
};

struct AppConfig {
  unsigned short port;
  std::string db_host;
  unsigned short db_port;
  std::string db_user;
  std::string db_password;
  std::string db_name;
  std::string store_backend;
  std::string problem_catalog_path;
  std::string log_level;
  std::string jwt_secret;
  std::string ops_token;
  std::size_t ws_queue_limit_messages;
  std::size_t ws_queue_limit_bytes;
  std::size_t lobby_timeout_seconds;
  std::size_t countdown_tick_ms;
  std::size_t timeout_sweep_seconds;
  std::size_t execution_workers;
  std::string sandbox_root;
  std::size_t compile_timeout_ms;
  std::size_t output_limit_bytes;
  std::size_t default_time_limit_ms;
  SandboxToolchain toolchain;
};

AppConfig LoadConfigFromEnv();

}  // namespace arena
