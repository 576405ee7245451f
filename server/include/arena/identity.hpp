/*
 * 설명: 외부 신원 서비스가 발급한 HS256 베어러 토큰을 공유 비밀로 검증하고 사용자 ID를 꺼낸다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/identity_test.cpp
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace arena {

struct Identity {
  std::string user_id;
  std::string username;
};

class IdentityVerifier {
 public:
  explicit IdentityVerifier(std::string secret);

  std::optional<Identity> Verify(const std::string& token, std::string& error_code, std::string& error_message) const;
  // 개발/테스트용 발급. exp_epoch_seconds가 없으면 만료 클레임을 넣지 않는다.
  std::string Sign(const Identity& identity, std::optional<std::int64_t> exp_epoch_seconds = std::nullopt) const;

 private:
  std::string Mac(const std::string& signing_input) const;

  std::string secret_;
};

std::string ParseBearer(const std::string& header_value);
std::string Base64UrlEncode(const std::string& raw);
std::optional<std::string> Base64UrlDecode(const std::string& encoded);

}  // namespace arena
