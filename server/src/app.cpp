/*
 * 설명: 서버 수명주기와 리스닝 스레드를 관리하고 환경변수 설정을 로드한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/challenge_flow_test.cpp, server/tests/unit/config_test.cpp
 */
#include "arena/app.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iostream>

#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "arena/http_session.hpp"
#include "arena/memory_room_store.hpp"
#include "arena/room_repository.hpp"

namespace arena {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, const AppConfig& config,
           std::shared_ptr<IdentityVerifier> identity, std::shared_ptr<MatchService> match_service,
           std::shared_ptr<NotificationHub> hub, std::shared_ptr<boost::asio::thread_pool> execution_pool,
           std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), config_(config), identity_(std::move(identity)),
        match_service_(std::move(match_service)), hub_(std::move(hub)), execution_pool_(std::move(execution_pool)),
        observability_(std::move(observability)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::beast::error_code ec;
    acceptor_.close(ec);
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->config_, self->identity_, self->match_service_,
                                          self->hub_, self->execution_pool_, self->observability_)
                ->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  AppConfig config_;
  std::shared_ptr<IdentityVerifier> identity_;
  std::shared_ptr<MatchService> match_service_;
  std::shared_ptr<NotificationHub> hub_;
  std::shared_ptr<boost::asio::thread_pool> execution_pool_;
  std::shared_ptr<Observability> observability_;
};

ServerApp::ServerApp(const AppConfig& config)
    : config_(config), ioc_(1), work_guard_(boost::asio::make_work_guard(ioc_)) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level));
  hub_ = std::make_shared<NotificationHub>();
  hub_->SetObservability(observability_);
  BuildStore();

  SandboxConfig sandbox_config;
  sandbox_config.root = config.sandbox_root;
  sandbox_config.compile_timeout = std::chrono::milliseconds(config.compile_timeout_ms);
  sandbox_config.output_limit = config.output_limit_bytes;
  sandbox_config.toolchain = config.toolchain;
  sandbox_ = std::make_shared<ExecutionSandbox>(sandbox_config, observability_);
  runner_ = std::make_shared<TestRunner>(sandbox_, observability_);
  resolver_ = std::make_shared<WinnerResolver>(store_, settlement_, hub_, observability_);
  lobby_timers_ = std::make_shared<LobbyTimerManager>(ioc_, observability_);

  MatchServiceConfig match_config;
  match_config.lobby_timeout = std::chrono::seconds(config.lobby_timeout_seconds);
  match_config.countdown_tick = std::chrono::milliseconds(config.countdown_tick_ms);
  match_config.default_time_limit_ms = static_cast<long>(config.default_time_limit_ms);
  match_service_ = std::make_shared<MatchService>(ioc_, match_config, store_, catalog_, runner_, resolver_,
                                                  lobby_timers_, hub_, observability_);
  std::weak_ptr<MatchService> weak_service = match_service_;
  lobby_timers_->SetHandler([weak_service](const std::string& room_id) {
    if (auto service = weak_service.lock()) {
      service->ExpireRoom(room_id);
    }
  });
  timeout_monitor_ = std::make_shared<MatchTimeoutMonitor>(
      ioc_, store_, catalog_, resolver_, std::chrono::seconds(config.timeout_sweep_seconds), observability_);
  identity_ = std::make_shared<IdentityVerifier>(config.jwt_secret);
  execution_pool_ = std::make_shared<boost::asio::thread_pool>(std::max<std::size_t>(1, config.execution_workers));
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::BuildStore() {
  if (config_.store_backend == "memory") {
    store_ = std::make_shared<MemoryRoomStore>();
    if (config_.problem_catalog_path.empty()) {
      catalog_ = std::make_shared<MemoryProblemCatalog>();
    } else {
      catalog_ = MemoryProblemCatalog::LoadFromFile(config_.problem_catalog_path);
    }
    settlement_ = std::make_shared<LoggingSettlementSink>(observability_);
    observability_->Event(LogLevel::kInfo, "store_backend", "메모리 저장소로 시작합니다");
    return;
  }
  DbConfig db_config{config_.db_host, config_.db_port, config_.db_user, config_.db_password, config_.db_name};
  db_client_ = std::make_shared<MariaDbClient>(db_config);
  store_ = std::make_shared<RoomRepository>(db_client_);
  catalog_ = std::make_shared<ProblemRepository>(db_client_);
  settlement_ = std::make_shared<MariaDbSettlementOutbox>(db_client_, observability_);
  observability_->Event(LogLevel::kInfo, "store_backend", "MariaDB 저장소로 시작합니다", std::nullopt,
                        {{"host", config_.db_host}, {"database", config_.db_name}});
}

void ServerApp::Run() {
  try {
    running_ = true;
    boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, config_, identity_, match_service_, hub_,
                                           execution_pool_, observability_);
    listener_->Run();
    timeout_monitor_->Start();
    std::cout << "서버 시작: 포트 " << config_.port << "\n";
    RunWorkers();
    ioc_.run();
  } catch (const std::exception& ex) {
    std::cerr << "서버 실행 중 예외: " << ex.what() << "\n";
  }
}

void ServerApp::RunWorkers() {
  const unsigned int thread_count = std::max(1u, std::thread::hardware_concurrency());
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (unsigned int i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  if (listener_) {
    listener_->Stop();
  }
  lobby_timers_->Shutdown();
  timeout_monitor_->Stop();
  execution_pool_->join();
  work_guard_.reset();
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const std::string& def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : def;
  };
  auto get_size = [&get_env](const char* key, const char* def) -> std::size_t {
    return static_cast<std::size_t>(std::stoul(get_env(key, def)));
  };

  const SandboxToolchain defaults = DefaultToolchain();
  AppConfig cfg;
  cfg.port = static_cast<unsigned short>(std::stoi(get_env("SERVER_PORT", "8080")));
  cfg.db_host = get_env("DB_HOST", "mariadb");
  cfg.db_port = static_cast<unsigned short>(std::stoi(get_env("DB_PORT", "3306")));
  cfg.db_user = get_env("DB_USER", "app");
  cfg.db_password = get_env("DB_PASSWORD", "app_pass");
  cfg.db_name = get_env("DB_NAME", "arena_db");
  cfg.store_backend = get_env("STORE_BACKEND", "mariadb");
  cfg.problem_catalog_path = get_env("PROBLEM_CATALOG_PATH", "");
  cfg.log_level = get_env("LOG_LEVEL", "info");
  cfg.jwt_secret = get_env("JWT_SECRET", "dev-secret-change-me");
  cfg.ops_token = get_env("OPS_TOKEN", "");
  cfg.ws_queue_limit_messages = get_size("WS_QUEUE_LIMIT_MESSAGES", "8");
  cfg.ws_queue_limit_bytes = get_size("WS_QUEUE_LIMIT_BYTES", "65536");
  cfg.lobby_timeout_seconds = get_size("LOBBY_TIMEOUT_SECONDS", "300");
  cfg.countdown_tick_ms = get_size("COUNTDOWN_TICK_MS", "1000");
  cfg.timeout_sweep_seconds = get_size("TIMEOUT_SWEEP_SECONDS", "30");
  cfg.execution_workers = get_size("EXECUTION_WORKERS", "4");
  cfg.sandbox_root = get_env("SANDBOX_ROOT", "");
  cfg.compile_timeout_ms = get_size("COMPILE_TIMEOUT_MS", "5000");
  cfg.output_limit_bytes = get_size("OUTPUT_LIMIT_BYTES", "1048576");
  cfg.default_time_limit_ms = get_size("DEFAULT_TIME_LIMIT_MS", "1000");
  cfg.toolchain.python_bin = get_env("PYTHON_BIN", defaults.python_bin);
  cfg.toolchain.node_bin = get_env("NODE_BIN", defaults.node_bin);
  cfg.toolchain.gcc_bin = get_env("GCC_BIN", defaults.gcc_bin);
  cfg.toolchain.gxx_bin = get_env("GXX_BIN", defaults.gxx_bin);
  cfg.toolchain.javac_bin = get_env("JAVAC_BIN", defaults.javac_bin);
  cfg.toolchain.java_bin = get_env("JAVA_BIN", defaults.java_bin);
  return cfg;
}

}  // namespace arena
