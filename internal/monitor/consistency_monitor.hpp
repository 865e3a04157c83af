#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "drift_sink.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/sync/synchronizer.hpp"

namespace projsync::monitor {

struct MonitorOptions {
  // Zero disables the background sweep; Sweep() still works on demand.
  std::chrono::milliseconds sweep_interval{0};
  std::size_t               batch_size = 256;
  bool                      self_heal  = false;

  // Pending keys older than this are reported. Zero disables the check.
  std::chrono::milliseconds staleness_window{0};

  // Summary table only. Zero keeps tombstones forever.
  std::chrono::milliseconds tombstone_retention{0};

  std::chrono::milliseconds lock_timeout{db::Repository::kDefaultLockTimeout};
};

struct SweepReport {
  uint64_t keys_checked       = 0;
  uint64_t drift              = 0;
  uint64_t healed             = 0;
  uint64_t tombstones_purged  = 0;
  std::vector<model::DriftRecord>       records;
  std::chrono::system_clock::time_point started_at{};
  std::chrono::system_clock::time_point finished_at{};
};

/*
  Re-derives every base row in batches and compares the result with the
  projection store.

  Reports Missing and Mismatch for base keys, Orphan for projection rows
  whose base row is gone, and StalenessExceeded for keys pending past the
  window. Keys the synchronizer is still working on are left alone. With
  self_heal, correctable drift is resynced through the synchronizer.
*/
class ConsistencyMonitor {
 public:
  ConsistencyMonitor(std::shared_ptr<sync::Synchronizer> synchronizer, std::shared_ptr<DriftSink> sink, MonitorOptions options = {});
  ~ConsistencyMonitor();

  ConsistencyMonitor(const ConsistencyMonitor&)            = delete;
  ConsistencyMonitor& operator=(const ConsistencyMonitor&) = delete;

  SweepReport Sweep();

  // Overrides for one call. A zero batch_size keeps the configured one.
  SweepReport Sweep(bool self_heal, std::size_t batch_size = 0);

  std::optional<SweepReport> LastReport() const;

  const MonitorOptions& Options() const {
    return options_;
  }

  void Start();
  void Stop();

 private:
  void CheckBaseRows(bool self_heal, std::size_t batch_size, SweepReport& report);
  void CheckOrphans(bool self_heal, std::size_t batch_size, SweepReport& report);
  void CheckStaleness(SweepReport& report);
  void PurgeTombstones(SweepReport& report);

  void Report(model::DriftRecord record, SweepReport& report);
  bool Busy(model::RowKey key) const;
  void Run();

  std::shared_ptr<sync::Synchronizer> synchronizer_;
  std::shared_ptr<DriftSink>          sink_;
  MonitorOptions                      options_;

  std::mutex                 sweep_mutex_;
  mutable std::mutex         mutex_;
  std::condition_variable    cv_;
  std::optional<SweepReport> last_report_;
  bool                       stopped_ = true;
  std::thread                thread_;
};

} // namespace projsync::monitor
