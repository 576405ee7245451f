/*
 * 설명: 방 코드 생성/정규화 구현.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/room_model_test.cpp
 */
#include "arena/room_id.hpp"

#include <array>
#include <cctype>
#include <stdexcept>

#include <openssl/rand.h>

namespace arena {

std::string GenerateRoomId() {
  std::array<unsigned char, 6> bytes{};
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    throw std::runtime_error("난수 생성 실패");
  }
  std::string id;
  id.reserve(7);
  for (int i = 0; i < 3; ++i) {
    id.push_back(static_cast<char>('A' + bytes[i] % 26));
  }
  id.push_back('-');
  for (int i = 3; i < 6; ++i) {
    id.push_back(static_cast<char>('0' + bytes[i] % 10));
  }
  return id;
}

std::string NormalizeRoomId(const std::string& raw) {
  std::string out;
  out.reserve(raw.size());
  for (char c : raw) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      continue;
    }
    out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  }
  return out;
}

bool IsWellFormedRoomId(const std::string& room_id) {
  if (room_id.size() != 7 || room_id[3] != '-') {
    return false;
  }
  for (int i = 0; i < 3; ++i) {
    if (room_id[i] < 'A' || room_id[i] > 'Z') {
      return false;
    }
  }
  for (int i = 4; i < 7; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(room_id[i]))) {
      return false;
    }
  }
  return true;
}

}  // namespace arena
