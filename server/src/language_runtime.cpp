/*
 * 설명: 언어별 컴파일/실행 명령 구성과 Java Main 클래스 사전 검증을 구현한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/language_runtime_test.cpp
 */
#include "arena/language_runtime.hpp"

#include <regex>

namespace arena {
namespace {
std::string Join(const std::string& dir, const std::string& name) {
  if (!dir.empty() && dir.back() == '/') {
    return dir + name;
  }
  return dir + "/" + name;
}
}  // namespace

CommandLine PythonRuntime::RunCommand(const std::string& workdir) const {
  return CommandLine{interpreter, {Join(workdir, SourceFileName())}};
}

CommandLine JavaScriptRuntime::RunCommand(const std::string& workdir) const {
  return CommandLine{interpreter, {Join(workdir, SourceFileName())}};
}

std::optional<CommandLine> CRuntime::CompileCommand(const std::string& workdir) const {
  return CommandLine{compiler, {"-O2", "-o", Join(workdir, "main"), Join(workdir, SourceFileName()), "-lm"}};
}

CommandLine CRuntime::RunCommand(const std::string& workdir) const { return CommandLine{Join(workdir, "main"), {}}; }

std::optional<CommandLine> CppRuntime::CompileCommand(const std::string& workdir) const {
  return CommandLine{compiler, {"-O2", "-std=c++17", "-o", Join(workdir, "main"), Join(workdir, SourceFileName())}};
}

CommandLine CppRuntime::RunCommand(const std::string& workdir) const { return CommandLine{Join(workdir, "main"), {}}; }

std::optional<std::string> JavaRuntime::Validate(const std::string& source) const {
  static const std::regex kMainClass(R"(\bpublic\s+(final\s+)?class\s+Main\b)");
  if (!std::regex_search(source, kMainClass)) {
    return std::string("Java 코드는 \"public class Main\"을 선언해야 합니다");
  }
  return std::nullopt;
}

std::optional<CommandLine> JavaRuntime::CompileCommand(const std::string& workdir) const {
  return CommandLine{compiler, {"-encoding", "UTF-8", "-d", workdir, Join(workdir, SourceFileName())}};
}

CommandLine JavaRuntime::RunCommand(const std::string& workdir) const {
  return CommandLine{vm, {"-cp", workdir, "Main"}};
}

LanguageRuntime MakeRuntime(Language language, const SandboxToolchain& toolchain) {
  switch (language) {
    case Language::kPython:
      return PythonRuntime{toolchain.python_bin};
    case Language::kJavaScript:
      return JavaScriptRuntime{toolchain.node_bin};
    case Language::kC:
      return CRuntime{toolchain.gcc_bin};
    case Language::kCpp:
      return CppRuntime{toolchain.gxx_bin};
    case Language::kJava:
      return JavaRuntime{toolchain.javac_bin, toolchain.java_bin};
  }
  return PythonRuntime{toolchain.python_bin};
}

SandboxToolchain DefaultToolchain() {
  return SandboxToolchain{"python3", "node", "gcc", "g++", "javac", "java"};
}

}  // namespace arena
