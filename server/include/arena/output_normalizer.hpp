/*
 * 설명: 실행 출력의 공백/줄바꿈을 정규화하고 기대 출력과 비교한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/output_normalizer_test.cpp
 */
#pragma once

#include <string>
#include <string_view>

namespace arena {

// \r\n, \r을 \n으로 통일하고 줄 끝 공백을 지운 뒤 전체 앞뒤 공백을 자른다. 멱등이다.
std::string NormalizeOutput(std::string_view text);

// 정규화 결과의 바이트 단위 동일성. 수치 허용 오차나 대소문자 무시는 없다.
bool OutputsMatch(std::string_view actual, std::string_view expected);

}  // namespace arena
