/*
 * 설명: 신뢰할 수 없는 코드를 일회용 작업 디렉터리에서 벽시계 제한 시간 아래 실행한다.
 *       컴파일 언어는 한 번 컴파일해 여러 입력에 재사용한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/sandbox_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>

#include <boost/filesystem/path.hpp>

#include "arena/config.hpp"
#include "arena/language_runtime.hpp"
#include "arena/observability.hpp"
#include "arena/room.hpp"

namespace arena {

// 실행 한 번이 stdout/stderr 각각에 대해 보관하는 최대 바이트 수.
constexpr std::size_t kDefaultOutputLimit = 1024 * 1024;

struct ProcessResult {
  std::string stdout_text;
  std::string stderr_text;
  int exit_status{0};
  bool timed_out{false};
  // 출력이 한도를 넘어 프로세스 그룹을 강제 종료함.
  bool output_limit_exceeded{false};
  bool spawn_failed{false};
  bool compile_failed{false};
  long elapsed_ms{0};
};

class SandboxError : public std::runtime_error {
 public:
  explicit SandboxError(const std::string& message) : std::runtime_error(message) {}
};

// 고유 이름의 임시 디렉터리. 소멸 시 내용 전체를 지우며 실패는 로그만 남긴다.
class Workspace {
 public:
  Workspace(const boost::filesystem::path& root, std::shared_ptr<Observability> observability);
  ~Workspace();
  Workspace(const Workspace&) = delete;
  Workspace& operator=(const Workspace&) = delete;

  const boost::filesystem::path& Path() const { return path_; }
  void WriteFile(const std::string& name, const std::string& content) const;

 private:
  boost::filesystem::path path_;
  std::shared_ptr<Observability> observability_;
};

// 실행 준비가 끝난 프로그램. 작업 디렉터리를 소유하며 해제와 함께 산출물이 삭제된다.
class PreparedProgram {
 public:
  PreparedProgram(Language language, CommandLine command, std::unique_ptr<Workspace> workspace)
      : language_(language), command_(std::move(command)), workspace_(std::move(workspace)) {}

  Language GetLanguage() const { return language_; }
  const CommandLine& Command() const { return command_; }
  const Workspace* GetWorkspace() const { return workspace_.get(); }

 private:
  Language language_;
  CommandLine command_;
  std::unique_ptr<Workspace> workspace_;
};

struct PrepareResult {
  bool compile_failed{false};
  // 컴파일러 바이너리를 띄우지 못함. 케이스별 runtime_error로 보고된다.
  bool spawn_failed{false};
  std::string compiler_output;
  long compile_time_ms{0};
  std::unique_ptr<PreparedProgram> program;
};

class ProgramExecutor {
 public:
  virtual ~ProgramExecutor() = default;
  virtual PrepareResult Prepare(Language language, const std::string& source) = 0;
  virtual ProcessResult Run(const PreparedProgram& program, const std::string& stdin_text,
                            std::chrono::milliseconds time_limit) = 0;
};

struct SandboxConfig {
  std::string root;
  std::chrono::milliseconds compile_timeout{5000};
  std::size_t output_limit{kDefaultOutputLimit};
  SandboxToolchain toolchain;
};

class ExecutionSandbox : public ProgramExecutor {
 public:
  ExecutionSandbox(SandboxConfig config, std::shared_ptr<Observability> observability);

  PrepareResult Prepare(Language language, const std::string& source) override;
  ProcessResult Run(const PreparedProgram& program, const std::string& stdin_text,
                    std::chrono::milliseconds time_limit) override;

  // 단발 실행 계약: 준비(필요 시 컴파일) 후 한 번 실행하고 작업 디렉터리를 정리한다.
  ProcessResult Execute(Language language, const std::string& source, const std::string& stdin_text,
                        std::chrono::milliseconds time_limit);

 private:
  boost::filesystem::path Root() const;

  SandboxConfig config_;
  std::shared_ptr<Observability> observability_;
};

// 자식 프로세스를 새 프로세스 그룹에서 띄워 stdin을 흘려보낸다.
// 제한 시간을 넘기거나 출력이 output_limit을 넘으면 그룹 전체를 종료시킨다.
ProcessResult RunProcess(const CommandLine& command, const boost::filesystem::path& workdir,
                         const std::string& stdin_text, std::chrono::milliseconds time_limit,
                         std::size_t output_limit = kDefaultOutputLimit);

}  // namespace arena
