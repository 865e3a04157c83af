#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace projsync::db::postgres {

/*
  PgPool

  Bounded set of connections shared by PgRepository transactions.

  - libpqxx connections are not thread-safe; each transaction holds one
    connection exclusively until its shared_ptr is released.
  - Prepared statements (base rows, sequence, summary table) are
    installed when a connection is opened.
  - Acquire() waits at most `wait` for a free slot and then throws
    util::StoreUnavailable, the same failure a lock timeout produces.
  - A connection that is closed when released is dropped, not reused,
    so a database restart does not leave dead connections in the pool.

  Lifetime:
    Repository owns shared_ptr<PgPool>
    Transaction acquires shared_ptr<pqxx::connection>
*/

class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(std::string conninfo, std::size_t max_connections = 16);

  std::shared_ptr<pqxx::connection> Acquire(std::chrono::milliseconds wait);

  // Apply schema entries past the version stored in projsync_schema_version.
  // Returns the resulting version.
  std::size_t Migrate();

  std::size_t LiveConnections();

 private:
  static void                       PrepareStatements(pqxx::connection& conn);
  std::shared_ptr<pqxx::connection> Open();
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);

  std::string conninfo_;
  std::size_t max_connections_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace projsync::db::postgres
