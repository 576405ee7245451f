/*
 * 설명: HS256 토큰 서명 검증(OpenSSL HMAC)과 base64url 인코딩을 구현한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/identity_test.cpp
 */
#include "arena/identity.hpp"

#include <chrono>
#include <vector>

#include <nlohmann/json.hpp>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace arena {
namespace {
std::int64_t NowSeconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
      .count();
}
}  // namespace

std::string Base64UrlEncode(const std::string& raw) {
  std::vector<unsigned char> out(4 * ((raw.size() + 2) / 3) + 1);
  int len = EVP_EncodeBlock(out.data(), reinterpret_cast<const unsigned char*>(raw.data()),
                            static_cast<int>(raw.size()));
  std::string encoded(reinterpret_cast<const char*>(out.data()), static_cast<std::size_t>(len));
  while (!encoded.empty() && encoded.back() == '=') {
    encoded.pop_back();
  }
  for (auto& c : encoded) {
    if (c == '+') {
      c = '-';
    } else if (c == '/') {
      c = '_';
    }
  }
  return encoded;
}

std::optional<std::string> Base64UrlDecode(const std::string& encoded) {
  std::string standard = encoded;
  for (auto& c : standard) {
    if (c == '-') {
      c = '+';
    } else if (c == '_') {
      c = '/';
    }
  }
  std::size_t padding = (4 - standard.size() % 4) % 4;
  if (padding == 3) {
    return std::nullopt;
  }
  standard.append(padding, '=');
  std::vector<unsigned char> out(3 * (standard.size() / 4) + 1);
  int len = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(standard.data()),
                            static_cast<int>(standard.size()));
  if (len < 0) {
    return std::nullopt;
  }
  // EVP_DecodeBlock은 패딩 바이트까지 0으로 채워 길이에 포함한다.
  return std::string(reinterpret_cast<const char*>(out.data()), static_cast<std::size_t>(len) - padding);
}

std::string ParseBearer(const std::string& header_value) {
  const std::string prefix = "Bearer ";
  if (header_value.size() <= prefix.size()) {
    return "";
  }
  if (header_value.compare(0, prefix.size(), prefix) != 0) {
    return "";
  }
  return header_value.substr(prefix.size());
}

IdentityVerifier::IdentityVerifier(std::string secret) : secret_(std::move(secret)) {}

std::string IdentityVerifier::Mac(const std::string& signing_input) const {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  HMAC(EVP_sha256(), secret_.data(), static_cast<int>(secret_.size()),
       reinterpret_cast<const unsigned char*>(signing_input.data()), signing_input.size(), digest, &digest_len);
  return std::string(reinterpret_cast<const char*>(digest), digest_len);
}

std::optional<Identity> IdentityVerifier::Verify(const std::string& token, std::string& error_code,
                                                 std::string& error_message) const {
  error_code = "unauthorized";
  auto first = token.find('.');
  auto second = first == std::string::npos ? std::string::npos : token.find('.', first + 1);
  if (second == std::string::npos || token.find('.', second + 1) != std::string::npos) {
    error_message = "토큰 형식이 올바르지 않습니다";
    return std::nullopt;
  }
  auto header_raw = Base64UrlDecode(token.substr(0, first));
  auto claims_raw = Base64UrlDecode(token.substr(first + 1, second - first - 1));
  auto signature = Base64UrlDecode(token.substr(second + 1));
  if (!header_raw || !claims_raw || !signature) {
    error_message = "토큰 인코딩이 올바르지 않습니다";
    return std::nullopt;
  }

  auto header = nlohmann::json::parse(*header_raw, nullptr, false);
  if (header.is_discarded() || !header.is_object() || header.value("alg", std::string()) != "HS256") {
    error_message = "지원하지 않는 토큰 알고리즘입니다";
    return std::nullopt;
  }

  auto expected = Mac(token.substr(0, second));
  if (expected.size() != signature->size() ||
      CRYPTO_memcmp(expected.data(), signature->data(), expected.size()) != 0) {
    error_message = "토큰 서명이 올바르지 않습니다";
    return std::nullopt;
  }

  auto claims = nlohmann::json::parse(*claims_raw, nullptr, false);
  if (claims.is_discarded() || !claims.is_object()) {
    error_message = "토큰 클레임이 올바르지 않습니다";
    return std::nullopt;
  }
  Identity identity;
  if (claims.contains("sub") && claims["sub"].is_string()) {
    identity.user_id = claims["sub"].get<std::string>();
  } else if (claims.contains("sub") && claims["sub"].is_number_integer()) {
    identity.user_id = std::to_string(claims["sub"].get<std::int64_t>());
  }
  if (identity.user_id.empty()) {
    error_message = "토큰에 사용자 ID가 없습니다";
    return std::nullopt;
  }
  if (claims.contains("exp")) {
    if (!claims["exp"].is_number() || claims["exp"].get<std::int64_t>() <= NowSeconds()) {
      error_message = "토큰이 만료되었습니다";
      return std::nullopt;
    }
  }
  identity.username = claims.contains("username") && claims["username"].is_string()
                          ? claims["username"].get<std::string>()
                          : identity.user_id;
  error_code.clear();
  return identity;
}

std::string IdentityVerifier::Sign(const Identity& identity, std::optional<std::int64_t> exp_epoch_seconds) const {
  nlohmann::json header{{"alg", "HS256"}, {"typ", "JWT"}};
  nlohmann::json claims{{"sub", identity.user_id}, {"username", identity.username}, {"iat", NowSeconds()}};
  if (exp_epoch_seconds) {
    claims["exp"] = *exp_epoch_seconds;
  }
  std::string signing_input = Base64UrlEncode(header.dump()) + "." + Base64UrlEncode(claims.dump());
  return signing_input + "." + Base64UrlEncode(Mac(signing_input));
}

}  // namespace arena
