/*
 * 설명: 지원 언어 다섯 종의 런타임 전략을 닫힌 variant로 정의한다.
 *       각 전략은 같은 계약(소스 파일명, 사전 검증, 컴파일 명령, 실행 명령)을 구현한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/language_runtime_test.cpp
 */
#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "arena/config.hpp"
#include "arena/room.hpp"

namespace arena {

struct CommandLine {
  std::string program;
  std::vector<std::string> args;
};

struct PythonRuntime {
  std::string interpreter;

  std::string SourceFileName() const { return "main.py"; }
  std::optional<std::string> Validate(const std::string&) const { return std::nullopt; }
  std::optional<CommandLine> CompileCommand(const std::string&) const { return std::nullopt; }
  CommandLine RunCommand(const std::string& workdir) const;
};

struct JavaScriptRuntime {
  std::string interpreter;

  std::string SourceFileName() const { return "main.js"; }
  std::optional<std::string> Validate(const std::string&) const { return std::nullopt; }
  std::optional<CommandLine> CompileCommand(const std::string&) const { return std::nullopt; }
  CommandLine RunCommand(const std::string& workdir) const;
};

struct CRuntime {
  std::string compiler;

  std::string SourceFileName() const { return "main.c"; }
  std::optional<std::string> Validate(const std::string&) const { return std::nullopt; }
  std::optional<CommandLine> CompileCommand(const std::string& workdir) const;
  CommandLine RunCommand(const std::string& workdir) const;
};

struct CppRuntime {
  std::string compiler;

  std::string SourceFileName() const { return "main.cpp"; }
  std::optional<std::string> Validate(const std::string&) const { return std::nullopt; }
  std::optional<CommandLine> CompileCommand(const std::string& workdir) const;
  CommandLine RunCommand(const std::string& workdir) const;
};

// javac는 public class 이름과 파일명이 다르면 알아보기 힘든 오류를 내므로 Main 선언을 먼저 확인한다.
struct JavaRuntime {
  std::string compiler;
  std::string vm;

  std::string SourceFileName() const { return "Main.java"; }
  std::optional<std::string> Validate(const std::string& source) const;
  std::optional<CommandLine> CompileCommand(const std::string& workdir) const;
  CommandLine RunCommand(const std::string& workdir) const;
};

using LanguageRuntime = std::variant<PythonRuntime, JavaScriptRuntime, CRuntime, CppRuntime, JavaRuntime>;

LanguageRuntime MakeRuntime(Language language, const SandboxToolchain& toolchain);
SandboxToolchain DefaultToolchain();

}  // namespace arena
