#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace foreman::db::postgres {

/*
  PgPool

  Bounded connection pool used by PgRepository.

  - Each transaction borrows one connection for its lifetime.
  - libpqxx connections are not thread-safe, so never share one.
  - Prepared statements are installed once per new connection.
  - Acquire() blocks while max_connections are all borrowed.

  Lifetime:
    Repository owns shared_ptr<PgPool>
    Transaction holds the borrowed shared_ptr<pqxx::connection>, whose
    deleter returns it to the idle list
*/

class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(std::string conninfo, std::size_t max_connections = 16);

  std::shared_ptr<pqxx::connection> Acquire();

 private:
  static void                       PrepareStatements(pqxx::connection& conn);
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);

  std::string conninfo_;
  std::size_t max_connections_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace foreman::db::postgres
