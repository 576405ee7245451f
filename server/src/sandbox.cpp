/*
 * 설명: Boost.Process 기반 자식 프로세스 실행, 제한 시간 종료, 작업 디렉터리 정리를 구현한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/sandbox_test.cpp
 */
#include "arena/sandbox.hpp"

#include <sys/wait.h>

#include <algorithm>
#include <array>
#include <csignal>
#include <fstream>
#include <functional>
#include <system_error>

#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/filesystem.hpp>
#include <boost/process.hpp>

namespace arena {
namespace bp = boost::process;
namespace fs = boost::filesystem;

namespace {
constexpr std::chrono::milliseconds kDrainGrace{500};

long ElapsedMs(std::chrono::steady_clock::time_point started) {
  return static_cast<long>(
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count());
}

// 시그널로 끝난 프로세스는 셸 관례대로 128 + 시그널 번호로 표기한다.
int DecodeExitStatus(int native) {
  if (WIFSIGNALED(native)) {
    return 128 + WTERMSIG(native);
  }
  if (WIFEXITED(native)) {
    return WEXITSTATUS(native);
  }
  return native;
}

// 파이프를 EOF까지 읽되 limit 바이트까지만 보관한다. 넘치면 on_overflow를 한 번 부르고 나머지는 버린다.
class CappedReader {
 public:
  CappedReader(bp::async_pipe& pipe, std::size_t limit, std::function<void()> on_overflow)
      : pipe_(pipe), limit_(limit), on_overflow_(std::move(on_overflow)) {}

  void Start() { ReadSome(); }

  std::string& Text() { return text_; }
  bool Overflowed() const { return overflowed_; }

 private:
  void ReadSome() {
    pipe_.async_read_some(boost::asio::buffer(chunk_), [this](const boost::system::error_code& ec, std::size_t n) {
      if (n > 0 && !overflowed_) {
        const std::size_t room = limit_ - std::min(limit_, text_.size());
        text_.append(chunk_.data(), std::min(n, room));
        if (n > room) {
          overflowed_ = true;
          on_overflow_();
        }
      }
      if (!ec) {
        ReadSome();
      }
    });
  }

  bp::async_pipe& pipe_;
  std::size_t limit_;
  std::function<void()> on_overflow_;
  std::array<char, 8192> chunk_{};
  std::string text_;
  bool overflowed_{false};
};

// 자식과 그 자손 전체에 SIGKILL. 이미 모두 끝난 그룹이면 실패해도 무방하다.
void KillGroup(bp::group& group) {
  std::error_code ec;
  group.terminate(ec);
}
}  // namespace

Workspace::Workspace(const fs::path& root, std::shared_ptr<Observability> observability)
    : observability_(std::move(observability)) {
  boost::system::error_code ec;
  fs::create_directories(root, ec);
  if (ec) {
    throw SandboxError("샌드박스 루트 생성 실패: " + ec.message());
  }
  path_ = root / fs::unique_path("arena-%%%%-%%%%-%%%%-%%%%");
  if (!fs::create_directory(path_, ec) || ec) {
    throw SandboxError("작업 디렉터리 생성 실패: " + (ec ? ec.message() : path_.string()));
  }
}

Workspace::~Workspace() {
  boost::system::error_code ec;
  fs::remove_all(path_, ec);
  if (ec && observability_) {
    observability_->IncrementCleanupFailure();
    observability_->Event(LogLevel::kWarn, "sandbox_cleanup_failed", ec.message(), std::nullopt,
                          {{"path", path_.string()}});
  }
}

void Workspace::WriteFile(const std::string& name, const std::string& content) const {
  std::ofstream out((path_ / name).string(), std::ios::binary | std::ios::trunc);
  if (!out) {
    throw SandboxError("소스 파일 기록 실패: " + name);
  }
  out << content;
  if (!out.good()) {
    throw SandboxError("소스 파일 기록 실패: " + name);
  }
}

ProcessResult RunProcess(const CommandLine& command, const fs::path& workdir, const std::string& stdin_text,
                         std::chrono::milliseconds time_limit, std::size_t output_limit) {
  ProcessResult result;
  fs::path exe = command.program.find('/') == std::string::npos ? bp::search_path(command.program)
                                                                 : fs::path(command.program);
  if (exe.empty() || !fs::exists(exe)) {
    result.spawn_failed = true;
    result.exit_status = 127;
    result.stderr_text = "실행 파일을 찾을 수 없습니다: " + command.program;
    return result;
  }

  boost::asio::io_context ioc;
  bp::async_pipe out_pipe(ioc);
  bp::async_pipe err_pipe(ioc);
  // 제출 코드가 fork한 손자까지 한 번에 죽일 수 있도록 프로세스 그룹으로 띄운다.
  // group 소멸 시에도 남은 구성원이 정리된다.
  bp::group group;
  CappedReader out_reader(out_pipe, output_limit, [&group]() { KillGroup(group); });
  CappedReader err_reader(err_pipe, output_limit, [&group]() { KillGroup(group); });

  std::error_code spawn_ec;
  auto started = std::chrono::steady_clock::now();
  bp::child child(exe, bp::args = command.args, bp::start_dir = workdir.string(),
                  bp::std_in < boost::asio::buffer(stdin_text), bp::std_out > out_pipe, bp::std_err > err_pipe, group,
                  ioc, spawn_ec);
  if (spawn_ec) {
    result.spawn_failed = true;
    result.exit_status = 127;
    result.stderr_text = "프로세스 생성 실패: " + spawn_ec.message();
    return result;
  }
  out_reader.Start();
  err_reader.Start();

  ioc.run_for(time_limit);
  if (!ioc.stopped()) {
    result.timed_out = !out_reader.Overflowed() && !err_reader.Overflowed();
    KillGroup(group);
    // 그룹 전체가 죽었으므로 파이프는 곧 EOF가 된다.
    ioc.run_for(kDrainGrace);
  }
  result.elapsed_ms = ElapsedMs(started);
  result.output_limit_exceeded = out_reader.Overflowed() || err_reader.Overflowed();

  std::error_code wait_ec;
  child.wait(wait_ec);
  result.exit_status = wait_ec ? -1 : DecodeExitStatus(child.native_exit_code());
  if ((result.timed_out || result.output_limit_exceeded) && result.exit_status == -1) {
    result.exit_status = 128 + SIGKILL;
  }
  result.stdout_text = std::move(out_reader.Text());
  result.stderr_text = std::move(err_reader.Text());
  return result;
}

ExecutionSandbox::ExecutionSandbox(SandboxConfig config, std::shared_ptr<Observability> observability)
    : config_(std::move(config)), observability_(std::move(observability)) {
  // 입력을 읽지 않고 종료한 자식에게 stdin을 쓰면 EPIPE가 나야 하며 프로세스가 죽어서는 안 된다.
  std::signal(SIGPIPE, SIG_IGN);
}

fs::path ExecutionSandbox::Root() const {
  if (config_.root.empty()) {
    return fs::temp_directory_path() / "arena-sandbox";
  }
  return fs::path(config_.root);
}

PrepareResult ExecutionSandbox::Prepare(Language language, const std::string& source) {
  PrepareResult prepared;
  auto runtime = MakeRuntime(language, config_.toolchain);

  auto rejection = std::visit([&](const auto& rt) { return rt.Validate(source); }, runtime);
  if (rejection) {
    prepared.compile_failed = true;
    prepared.compiler_output = *rejection;
    return prepared;
  }

  auto workspace = std::make_unique<Workspace>(Root(), observability_);
  auto file_name = std::visit([](const auto& rt) { return rt.SourceFileName(); }, runtime);
  workspace->WriteFile(file_name, source);
  const std::string workdir = workspace->Path().string();

  auto compile = std::visit([&](const auto& rt) { return rt.CompileCommand(workdir); }, runtime);
  if (compile) {
    auto compiled = RunProcess(*compile, workspace->Path(), "", config_.compile_timeout, config_.output_limit);
    prepared.compile_time_ms = compiled.elapsed_ms;
    if (compiled.spawn_failed) {
      prepared.spawn_failed = true;
      prepared.compiler_output = compiled.stderr_text;
      return prepared;
    }
    if (compiled.output_limit_exceeded) {
      prepared.compile_failed = true;
      prepared.compiler_output = "컴파일러 출력 한도 초과";
      return prepared;
    }
    if (compiled.timed_out) {
      prepared.compile_failed = true;
      prepared.compiler_output = "컴파일 시간 제한 초과";
      return prepared;
    }
    if (compiled.exit_status != 0) {
      prepared.compile_failed = true;
      prepared.compiler_output = compiled.stderr_text.empty() ? compiled.stdout_text : compiled.stderr_text;
      return prepared;
    }
  }

  auto run = std::visit([&](const auto& rt) { return rt.RunCommand(workdir); }, runtime);
  prepared.program = std::make_unique<PreparedProgram>(language, std::move(run), std::move(workspace));
  return prepared;
}

ProcessResult ExecutionSandbox::Run(const PreparedProgram& program, const std::string& stdin_text,
                                    std::chrono::milliseconds time_limit) {
  if (observability_) {
    observability_->IncrementExecution();
  }
  const Workspace* workspace = program.GetWorkspace();
  fs::path workdir = workspace ? workspace->Path() : Root();
  auto result = RunProcess(program.Command(), workdir, stdin_text, time_limit, config_.output_limit);
  if (observability_ && observability_->Enabled(LogLevel::kDebug)) {
    observability_->Event(LogLevel::kDebug, "sandbox_run", "실행 완료", std::nullopt,
                          {{"language", ToString(program.GetLanguage())},
                           {"exitStatus", result.exit_status},
                           {"timedOut", result.timed_out},
                           {"outputLimitExceeded", result.output_limit_exceeded},
                           {"elapsedMs", result.elapsed_ms}});
  }
  return result;
}

ProcessResult ExecutionSandbox::Execute(Language language, const std::string& source, const std::string& stdin_text,
                                        std::chrono::milliseconds time_limit) {
  auto prepared = Prepare(language, source);
  if (prepared.compile_failed || prepared.spawn_failed) {
    ProcessResult failed;
    failed.compile_failed = prepared.compile_failed;
    failed.spawn_failed = prepared.spawn_failed;
    failed.exit_status = prepared.spawn_failed ? 127 : 1;
    failed.stderr_text = prepared.compiler_output;
    failed.elapsed_ms = prepared.compile_time_ms;
    return failed;
  }
  return Run(*prepared.program, stdin_text, time_limit);
}

}  // namespace arena
