/*
 * 설명: 준비(컴파일) 1회 후 케이스별 실행, 출력 비교, 판정 집계를 구현한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/test_runner_test.cpp
 */
#include "arena/test_runner.hpp"

#include <algorithm>

#include "arena/output_normalizer.hpp"

namespace arena {
namespace {
std::string Truncate(const std::string& text) {
  if (text.size() <= kMaxCapturedOutput) {
    return text;
  }
  return text.substr(0, kMaxCapturedOutput);
}

RunReport FailEveryCase(const std::vector<GradedCase>& cases, ErrorKind kind, const std::string& detail) {
  RunReport report;
  report.total_count = cases.size();
  for (std::size_t i = 0; i < cases.size(); ++i) {
    TestVerdict verdict;
    verdict.index = i;
    verdict.passed = false;
    verdict.error_kind = kind;
    verdict.error_detail = Truncate(detail);
    verdict.is_sample = cases[i].is_sample;
    report.verdicts.push_back(std::move(verdict));
  }
  report.accepted = false;
  return report;
}

TestVerdict Grade(std::size_t index, const GradedCase& graded, const ProcessResult& result) {
  TestVerdict verdict;
  verdict.index = index;
  verdict.is_sample = graded.is_sample;
  verdict.execution_time_ms = result.elapsed_ms;
  verdict.actual_output = Truncate(result.stdout_text);
  if (result.spawn_failed) {
    verdict.error_kind = ErrorKind::kRuntimeError;
    verdict.error_detail = Truncate(result.stderr_text);
    return verdict;
  }
  if (result.output_limit_exceeded) {
    verdict.error_kind = ErrorKind::kRuntimeError;
    verdict.error_detail = "출력 한도 초과";
    return verdict;
  }
  if (result.timed_out) {
    verdict.error_kind = ErrorKind::kTimeLimitExceeded;
    verdict.error_detail = "시간 제한 초과";
    return verdict;
  }
  if (result.exit_status != 0) {
    verdict.error_kind = ErrorKind::kRuntimeError;
    verdict.error_detail = Truncate(result.stderr_text);
    return verdict;
  }
  verdict.passed = OutputsMatch(result.stdout_text, graded.test_case.expected_output);
  return verdict;
}
}  // namespace

TestRunner::TestRunner(std::shared_ptr<ProgramExecutor> executor, std::shared_ptr<Observability> observability)
    : executor_(std::move(executor)), observability_(std::move(observability)) {}

std::vector<GradedCase> TestRunner::Arrange(const std::vector<TestCase>& samples, const std::vector<TestCase>& hidden) {
  std::vector<GradedCase> cases;
  cases.reserve(samples.size() + hidden.size());
  for (const auto& tc : samples) {
    cases.push_back(GradedCase{tc, true});
  }
  for (const auto& tc : hidden) {
    cases.push_back(GradedCase{tc, false});
  }
  return cases;
}

RunReport TestRunner::Run(Language language, const std::string& code, const std::vector<GradedCase>& cases,
                          long time_limit_ms) const {
  PrepareResult prepared;
  try {
    prepared = executor_->Prepare(language, code);
  } catch (const SandboxError& ex) {
    if (observability_) {
      observability_->Event(LogLevel::kError, "sandbox_prepare_failed", ex.what());
    }
    return FailEveryCase(cases, ErrorKind::kRuntimeError, ex.what());
  }

  if (prepared.compile_failed) {
    return FailEveryCase(cases, ErrorKind::kCompileError, prepared.compiler_output);
  }
  if (prepared.spawn_failed || !prepared.program) {
    return FailEveryCase(cases, ErrorKind::kRuntimeError, prepared.compiler_output);
  }

  RunReport report;
  report.total_count = cases.size();
  const auto limit = std::chrono::milliseconds(time_limit_ms);
  for (std::size_t i = 0; i < cases.size(); ++i) {
    auto result = executor_->Run(*prepared.program, cases[i].test_case.input, limit);
    auto verdict = Grade(i, cases[i], result);
    report.max_time_ms = std::max(report.max_time_ms, verdict.execution_time_ms);
    if (verdict.passed) {
      ++report.passed_count;
    }
    report.verdicts.push_back(std::move(verdict));
  }
  report.accepted = !cases.empty() && report.passed_count == cases.size();
  return report;
}

}  // namespace arena
