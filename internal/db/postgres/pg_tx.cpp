#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace projsync::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool, std::chrono::milliseconds lock_timeout) {
  try {
    conn_ = pool->Acquire(lock_timeout);
    tx_   = std::make_unique<pqxx::work>(*conn_);
    tx_->exec("SET TRANSACTION ISOLATION LEVEL SERIALIZABLE");
    tx_->exec("SET LOCAL lock_timeout = " + tx_->quote(std::to_string(lock_timeout.count()) + "ms"));
  } catch (const pqxx::broken_connection& e) {
    throw util::StoreUnavailable(std::string("postgres connection failed: ") + e.what());
  }
}

PgTransaction::~PgTransaction() {
  if (!committed_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      PROJSYNC_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
    }
  }
}

void PgTransaction::Commit() {
  tx_->commit();
  committed_ = true;
}

void PgTransaction::Rollback() {
  committed_ = true;
  tx_->abort();
}

}
