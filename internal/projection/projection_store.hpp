#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/projection_mode.hpp"
#include "internal/model/row.hpp"

namespace projsync::projection {

enum class WriteOutcome {
  kApplied,
  // A row with a newer version is already stored.
  kSuperseded,
  // The store requires a base row and there is none.
  kBaseMissing,
};

const char* ToString(WriteOutcome outcome);

struct ScanPage {
  std::vector<model::DerivedRow> rows;
  // Key of the last row returned; absent once the range is exhausted.
  std::optional<model::RowKey> next_cursor;
};

class ScanSequence;

/*
  Holds the materialized derived rows in one physical shape.

  Writes are versioned compare-and-set: a version older than the stored
  one is rejected as superseded, an equal version overwrites. Every
  operation exists in a form that joins the caller's transaction and a
  form that runs its own.

  Single-key operations are linearizable. Scans page by key and may mix
  rows from before and after a concurrent write.
*/
class ProjectionStore {
 public:
  ProjectionStore(std::shared_ptr<db::Repository> repository, std::chrono::milliseconds lock_timeout);
  virtual ~ProjectionStore() = default;

  ProjectionStore(const ProjectionStore&)            = delete;
  ProjectionStore& operator=(const ProjectionStore&) = delete;

  virtual model::ProjectionMode Mode() const = 0;

  // ---------------------------------------------------------------------
  // Inside a caller transaction
  // ---------------------------------------------------------------------

  std::optional<model::DerivedRow> Get(db::Transaction& tx, model::RowKey key);
  WriteOutcome                     Upsert(db::Transaction& tx, const model::DerivedRow& row);
  WriteOutcome                     Remove(db::Transaction& tx, model::RowKey key, uint64_t version);
  ScanPage Scan(db::Transaction& tx, const model::KeyRange& range, std::optional<model::RowKey> cursor, std::size_t limit);

  // ---------------------------------------------------------------------
  // Own transaction
  // ---------------------------------------------------------------------

  std::optional<model::DerivedRow> Get(model::RowKey key);
  WriteOutcome                     Upsert(const model::DerivedRow& row);

  // Unversioned write: keeps the stored version, so it always overwrites.
  WriteOutcome Upsert(model::RowKey key, model::DerivedAttributes attributes);

  WriteOutcome Remove(model::RowKey key, uint64_t version);
  WriteOutcome Remove(model::RowKey key);

  ScanPage Scan(const model::KeyRange& range, std::optional<model::RowKey> cursor, std::size_t limit);

  // Lazy iteration over the whole range, one page per transaction.
  ScanSequence ScanAll(const model::KeyRange& range, std::size_t page_size = 256, std::optional<model::RowKey> cursor = std::nullopt);

  db::Repository& Repository() {
    return *repository_;
  }

 protected:
  virtual db::ProjectionTable Table() const = 0;

  virtual WriteOutcome DoUpsert(db::Transaction& tx, const model::DerivedRow& row)             = 0;
  virtual WriteOutcome DoRemove(db::Transaction& tx, model::RowKey key, uint64_t version) = 0;

  // Stored version, tombstones included.
  std::optional<uint64_t> StoredVersion(db::Transaction& tx, model::RowKey key);

  std::unique_ptr<db::Transaction> BeginTx();
  std::unique_ptr<db::Transaction> BeginReadTx();

  std::shared_ptr<db::Repository> repository_;
  std::chrono::milliseconds       lock_timeout_;
};

/*
  Restartable cursor over a store range. Next() fetches a page when the
  buffer runs dry; Cursor() is the key to resume after.
*/
class ScanSequence {
 public:
  ScanSequence(ProjectionStore& store, model::KeyRange range, std::size_t page_size, std::optional<model::RowKey> cursor);

  std::optional<model::DerivedRow> Next();

  std::optional<model::RowKey> Cursor() const {
    return cursor_;
  }

 private:
  ProjectionStore&               store_;
  model::KeyRange                range_;
  std::size_t                    page_size_;
  std::optional<model::RowKey>   cursor_;
  std::deque<model::DerivedRow>  buffer_;
  bool                           exhausted_ = false;
};

using ProjectionStorePtr = std::shared_ptr<ProjectionStore>;

ProjectionStorePtr MakeStore(model::ProjectionMode mode, std::shared_ptr<db::Repository> repository,
                             std::chrono::milliseconds lock_timeout = db::Repository::kDefaultLockTimeout);

} // namespace projsync::projection
