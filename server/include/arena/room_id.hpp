/*
 * 설명: ABC-123 형식의 방 코드 생성과 정규화.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/room_model_test.cpp
 */
#pragma once

#include <string>

namespace arena {

constexpr int kRoomIdAttempts = 10;

// OpenSSL 난수로 대문자 3자, '-', 숫자 3자를 만든다.
std::string GenerateRoomId();
std::string NormalizeRoomId(const std::string& raw);
bool IsWellFormedRoomId(const std::string& room_id);

}  // namespace arena
