/*
 * 설명: MariaDB 연결, 조건부 쓰기용 헬퍼, 트랜잭션 재시도 정책을 캡슐화한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/room_repository_it_test.cpp
 */
#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <mariadb/mysql.h>

namespace arena {

struct DbConfig {
  std::string host;
  unsigned short port;
  std::string user;
  std::string password;
  std::string database;
};

class DbException : public std::runtime_error {
 public:
  DbException(const std::string& message, unsigned int code, bool retryable)
      : std::runtime_error(message), code(code), retryable(retryable) {}
  unsigned int code;
  bool retryable;
};

// 결과 셋을 행 단위 문자열로 옮겨 담는다. NULL 컬럼은 is_null로 구분한다.
struct DbRow {
  std::vector<std::string> values;
  std::vector<bool> is_null;

  const std::string& At(std::size_t i) const { return values.at(i); }
  bool IsNull(std::size_t i) const { return is_null.at(i); }
};

class MariaDbClient {
 public:
  explicit MariaDbClient(const DbConfig& config);

  bool ExecuteTransactionWithRetry(const std::function<bool(MYSQL*)>& work) const;
  void WithConnectionRetry(const std::function<void(MYSQL*)>& work) const;

  // 실패 시 DbException을 던지고, 영향받은 행 수를 돌려준다.
  std::uint64_t Execute(MYSQL* conn, const std::string& sql, const std::string& ctx) const;
  std::vector<DbRow> Query(MYSQL* conn, const std::string& sql, const std::string& ctx) const;

  [[noreturn]] void RaiseError(MYSQL* conn, const std::string& ctx) const;

  void SetTransientInjector(const std::function<bool(std::size_t)>& injector);

  std::string Escape(MYSQL* conn, const std::string& value) const;
  std::string Quote(MYSQL* conn, const std::string& value) const;

 private:
  struct ConnectionCloser {
    void operator()(MYSQL* conn) const {
      if (conn) {
        mysql_close(conn);
      }
    }
  };
  using ConnectionPtr = std::unique_ptr<MYSQL, ConnectionCloser>;

  ConnectionPtr Connect() const;
  bool IsRetryable(unsigned int code) const;
  void Backoff(std::size_t attempt) const;

  DbConfig config_;
  unsigned int connect_timeout_seconds_ = 2;
  unsigned int query_timeout_seconds_ = 2;
  std::function<bool(std::size_t)> transient_injector_;
};

}  // namespace arena
