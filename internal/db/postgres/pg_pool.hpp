#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace pokertable::db::postgres {

/*
  PgPool

  Connection pool used by PgRepository.

  - Each transaction holds its own connection until it is destroyed.
  - libpqxx connections are NOT thread-safe, never share one.
  - Prepared statements are installed once per connection.

  Lifetime:
    Repository owns shared_ptr<PgPool>
    Transaction acquires shared_ptr<pqxx::connection>
*/

class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(std::string conninfo, std::size_t max_connections = 16);

  // Blocks while max_connections are checked out.
  std::shared_ptr<pqxx::connection> Acquire();

  // Creates the poker schema if it does not exist yet.
  void BootstrapSchema();

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

} // namespace pokertable::db::postgres
