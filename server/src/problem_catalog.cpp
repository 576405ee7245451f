/*
 * 설명: 문제 조회(MariaDB, JSON 카탈로그)와 제한 시간 계산, 클라이언트 스냅샷 생성을 구현한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/problem_catalog_test.cpp
 */
#include "arena/problem_catalog.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace arena {
namespace {
constexpr long kJavaDefaultTimeLimitMs = 2000;

std::vector<TestCase> CasesFromJson(const nlohmann::json& j) {
  std::vector<TestCase> cases;
  if (!j.is_array()) {
    return cases;
  }
  for (const auto& item : j) {
    cases.push_back(TestCase{item.value("input", std::string{}), item.value("expectedOutput", std::string{})});
  }
  return cases;
}

nlohmann::json CasesToJson(const std::vector<TestCase>& cases) {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto& c : cases) {
    arr.push_back({{"input", c.input}, {"expectedOutput", c.expected_output}});
  }
  return arr;
}

std::vector<Language> LanguagesFromJson(const nlohmann::json& j) {
  std::vector<Language> languages;
  if (!j.is_array()) {
    return languages;
  }
  for (const auto& item : j) {
    if (!item.is_string()) {
      continue;
    }
    if (auto language = ParseLanguage(item.get<std::string>())) {
      languages.push_back(*language);
    }
  }
  return languages;
}
}  // namespace

bool Problem::AllowsLanguage(Language language) const {
  return allowed_languages.empty() ||
         std::find(allowed_languages.begin(), allowed_languages.end(), language) != allowed_languages.end();
}

std::chrono::seconds MatchTimeLimit(Difficulty difficulty) {
  switch (difficulty) {
    case Difficulty::kEasy:
      return std::chrono::minutes(15);
    case Difficulty::kMedium:
      return std::chrono::minutes(30);
    case Difficulty::kHard:
      return std::chrono::minutes(60);
    case Difficulty::kUnknown:
      break;
  }
  return std::chrono::minutes(30);
}

long CaseTimeLimitMs(const Problem& problem, Language language, long default_ms) {
  if (problem.time_limit_ms > 0) {
    return problem.time_limit_ms;
  }
  if (language == Language::kJava) {
    return std::max(default_ms, kJavaDefaultTimeLimitMs);
  }
  return default_ms;
}

nlohmann::json ProblemSnapshot(const Problem& problem, bool include_hidden) {
  nlohmann::json languages = nlohmann::json::array();
  for (auto language : problem.allowed_languages) {
    languages.push_back(ToString(language));
  }
  nlohmann::json snapshot{{"id", problem.id},
                          {"title", problem.title},
                          {"difficulty", ToString(problem.difficulty)},
                          {"description", problem.description},
                          {"constraints", problem.constraints},
                          {"timeLimitMs", problem.time_limit_ms},
                          {"allowedLanguages", languages},
                          {"examples", CasesToJson(problem.sample_cases)},
                          {"hiddenTestCount", problem.hidden_cases.size()}};
  if (include_hidden) {
    snapshot["hiddenTestCases"] = CasesToJson(problem.hidden_cases);
  }
  return snapshot;
}

Problem ProblemFromJson(const nlohmann::json& j) {
  Problem problem;
  problem.id = j.at("id").get<std::string>();
  problem.title = j.value("title", std::string{});
  problem.description = j.value("description", std::string{});
  problem.constraints = j.value("constraints", std::string{});
  problem.difficulty = ParseDifficulty(j.value("difficulty", std::string{}));
  problem.time_limit_ms = j.value("timeLimitMs", 0L);
  problem.allowed_languages = LanguagesFromJson(j.value("allowedLanguages", nlohmann::json::array()));
  problem.sample_cases = CasesFromJson(j.value("sampleTestCases", nlohmann::json::array()));
  problem.hidden_cases = CasesFromJson(j.value("hiddenTestCases", nlohmann::json::array()));
  return problem;
}

std::shared_ptr<MemoryProblemCatalog> MemoryProblemCatalog::FromJson(const nlohmann::json& catalog) {
  auto result = std::make_shared<MemoryProblemCatalog>();
  const auto& problems = catalog.is_object() && catalog.contains("problems") ? catalog["problems"] : catalog;
  if (!problems.is_array()) {
    throw std::invalid_argument("문제 카탈로그는 배열이어야 합니다");
  }
  for (const auto& item : problems) {
    result->Put(ProblemFromJson(item));
  }
  return result;
}

std::shared_ptr<MemoryProblemCatalog> MemoryProblemCatalog::LoadFromFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("문제 카탈로그 파일을 열 수 없습니다: " + path);
  }
  return FromJson(nlohmann::json::parse(in));
}

void MemoryProblemCatalog::Put(const Problem& problem) {
  std::lock_guard<std::mutex> lock(mutex_);
  problems_[problem.id] = problem;
}

std::optional<Problem> MemoryProblemCatalog::GetProblem(const std::string& problem_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = problems_.find(problem_id);
  if (it == problems_.end()) {
    return std::nullopt;
  }
  return it->second;
}

ProblemRepository::ProblemRepository(std::shared_ptr<MariaDbClient> db_client) : db_client_(std::move(db_client)) {}

std::optional<Problem> ProblemRepository::GetProblem(const std::string& problem_id) {
  std::optional<Problem> result;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT problem_id, title, description, constraints_text, difficulty, time_limit_ms, allowed_languages "
           "FROM problems WHERE problem_id="
        << db_client_->Quote(conn, problem_id) << " AND is_active=1;";
    auto rows = db_client_->Query(conn, oss.str(), "문제 조회 실패");
    if (rows.empty()) {
      return;
    }
    const auto& row = rows.front();
    Problem problem;
    problem.id = row.At(0);
    problem.title = row.At(1);
    problem.description = row.At(2);
    problem.constraints = row.IsNull(3) ? std::string{} : row.At(3);
    problem.difficulty = ParseDifficulty(row.At(4));
    problem.time_limit_ms = row.IsNull(5) ? 0 : std::stol(row.At(5));
    if (!row.IsNull(6) && !row.At(6).empty()) {
      problem.allowed_languages = LanguagesFromJson(nlohmann::json::parse(row.At(6), nullptr, false));
    }

    std::ostringstream cases_sql;
    cases_sql << "SELECT is_sample, input_text, expected_output FROM problem_test_cases WHERE problem_id="
              << db_client_->Quote(conn, problem_id) << " ORDER BY is_sample DESC, ordinal ASC;";
    for (const auto& case_row : db_client_->Query(conn, cases_sql.str(), "테스트 케이스 조회 실패")) {
      TestCase test_case{case_row.At(1), case_row.At(2)};
      if (case_row.At(0) == "1") {
        problem.sample_cases.push_back(std::move(test_case));
      } else {
        problem.hidden_cases.push_back(std::move(test_case));
      }
    }
    result = std::move(problem);
  });
  return result;
}

}  // namespace arena
