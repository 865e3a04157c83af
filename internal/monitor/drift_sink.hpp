#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <vector>

#include "internal/model/drift_record.hpp"

namespace projsync::monitor {

class DriftSink {
 public:
  virtual ~DriftSink() = default;

  virtual void Report(const model::DriftRecord& record) = 0;
};

/*
  Default sink: logs every record and keeps the newest ones in a bounded
  ring for the admin API.
*/
class DriftLedger final : public DriftSink {
 public:
  explicit DriftLedger(std::size_t capacity = 1024);

  void Report(const model::DriftRecord& record) override;

  // Newest first.
  std::vector<model::DriftRecord> Recent(std::size_t limit) const;

  // Records reported since start, including ones evicted from the ring.
  uint64_t Total() const;

 private:
  std::size_t                     capacity_;
  mutable std::mutex              mutex_;
  std::deque<model::DriftRecord>  records_;
  uint64_t                        total_ = 0;
};

} // namespace projsync::monitor
