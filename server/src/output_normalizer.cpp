/*
 * 설명: 실행 출력의 공백/줄바꿈을 정규화하고 기대 출력과 비교한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/output_normalizer_test.cpp
 */
#include "arena/output_normalizer.hpp"

namespace arena {
namespace {
bool IsSpace(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r'; }

void StripTrailing(std::string& line) {
  while (!line.empty() && IsSpace(line.back())) {
    line.pop_back();
  }
}
}  // namespace

std::string NormalizeOutput(std::string_view text) {
  std::string result;
  result.reserve(text.size());
  std::string line;
  for (std::size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c == '\r' || c == '\n') {
      if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
        ++i;
      }
      StripTrailing(line);
      result += line;
      result += '\n';
      line.clear();
      continue;
    }
    line += c;
  }
  StripTrailing(line);
  result += line;

  std::size_t begin = 0;
  while (begin < result.size() && IsSpace(result[begin])) {
    ++begin;
  }
  std::size_t end = result.size();
  while (end > begin && IsSpace(result[end - 1])) {
    --end;
  }
  return result.substr(begin, end - begin);
}

bool OutputsMatch(std::string_view actual, std::string_view expected) {
  return NormalizeOutput(actual) == NormalizeOutput(expected);
}

}  // namespace arena
