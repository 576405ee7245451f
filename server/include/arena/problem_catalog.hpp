/*
 * 설명: 외부 문제 저장소 인터페이스와 MariaDB/메모리(JSON 카탈로그) 구현을 정의한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/problem_catalog_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "arena/db_client.hpp"
#include "arena/room.hpp"

namespace arena {

struct Problem {
  std::string id;
  std::string title;
  std::string description;
  std::string constraints;
  Difficulty difficulty{Difficulty::kUnknown};
  long time_limit_ms{0};
  std::vector<Language> allowed_languages;
  std::vector<TestCase> sample_cases;
  std::vector<TestCase> hidden_cases;

  // 허용 언어 목록이 비어 있으면 모든 언어를 허용한다.
  bool AllowsLanguage(Language language) const;
};

// 난이도별 대결 제한 시간. easy 15분, medium 30분, hard 60분, 그 외 30분.
std::chrono::seconds MatchTimeLimit(Difficulty difficulty);
// 케이스당 실행 제한. 문제 설정이 없으면 Java는 2초, 나머지는 기본값을 쓴다.
long CaseTimeLimitMs(const Problem& problem, Language language, long default_ms);
// 클라이언트용 스냅샷. 숨김 케이스는 include_hidden일 때만 포함한다.
nlohmann::json ProblemSnapshot(const Problem& problem, bool include_hidden);

class ProblemCatalog {
 public:
  virtual ~ProblemCatalog() = default;
  virtual std::optional<Problem> GetProblem(const std::string& problem_id) = 0;
};

class MemoryProblemCatalog : public ProblemCatalog {
 public:
  MemoryProblemCatalog() = default;

  static std::shared_ptr<MemoryProblemCatalog> FromJson(const nlohmann::json& catalog);
  static std::shared_ptr<MemoryProblemCatalog> LoadFromFile(const std::string& path);

  void Put(const Problem& problem);
  std::optional<Problem> GetProblem(const std::string& problem_id) override;

 private:
  std::mutex mutex_;
  std::unordered_map<std::string, Problem> problems_;
};

class ProblemRepository : public ProblemCatalog {
 public:
  explicit ProblemRepository(std::shared_ptr<MariaDbClient> db_client);

  std::optional<Problem> GetProblem(const std::string& problem_id) override;

 private:
  std::shared_ptr<MariaDbClient> db_client_;
};

Problem ProblemFromJson(const nlohmann::json& j);

}  // namespace arena
