#include "read_service.hpp"

#include <algorithm>

#include "internal/model/codec.hpp"
#include "internal/sync/synchronizer.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"

namespace projsync::service {

using namespace projsync::v1;

ReadService::ReadService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

GetResponse ReadService::Get(const GetRequest& req) {
  return ObserveRpc("ProjectionReadService.Get", req.key(), [&] {
    GetResponse resp;
    if (auto row = ctx_.synchronizer->Store().Get(req.key())) {
      resp.set_found(true);
      *resp.mutable_row() = projsync::model::ToProto(*row);
    }
    return resp;
  });
}

ScanResponse ReadService::Scan(const ScanRequest& req) {
  return ObserveRpc("ProjectionReadService.Scan", std::nullopt, [&] {
    projsync::model::KeyRange range;
    if (req.has_start_key()) range.begin = req.start_key();
    if (req.has_end_key()) range.end = req.end_key();
    if (range.begin && range.end && *range.begin > *range.end) {
      throw projsync::util::InvalidArgument("scan: start_key is past end_key");
    }

    const uint32_t limit = req.limit() == 0 ? kDefaultScanLimit : std::min(req.limit(), kMaxScanLimit);

    std::optional<projsync::model::RowKey> cursor;
    if (req.has_cursor()) cursor = req.cursor();

    auto page = ctx_.synchronizer->Store().Scan(range, cursor, limit);

    ScanResponse resp;
    for (const auto& row : page.rows) {
      *resp.add_rows() = projsync::model::ToProto(row);
    }
    if (page.next_cursor) resp.set_next_cursor(*page.next_cursor);
    return resp;
  });
}

} // namespace projsync::service
