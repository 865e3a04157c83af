#include "admin_service.hpp"

#include "internal/db/api/repository.hpp"
#include "internal/model/codec.hpp"
#include "internal/monitor/consistency_monitor.hpp"
#include "internal/monitor/drift_sink.hpp"
#include "internal/sync/synchronizer.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"

namespace projsync::service {

using namespace projsync::v1;

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

StatsResponse AdminService::Stats(const StatsRequest&) {
  return ObserveRpc("AdminService.Stats", std::nullopt, [&] {
    const auto stats = ctx_.synchronizer->Snapshot();

    StatsResponse resp;
    resp.set_mode(projsync::model::ToString(stats.mode));
    resp.set_keys_absent(stats.keys_absent);
    resp.set_keys_consistent(stats.keys_consistent);
    resp.set_keys_pending(stats.keys_pending);
    resp.set_keys_failed(stats.keys_failed);
    resp.set_queued_events(stats.queued_events);
    resp.set_pending_retries(stats.pending_retries);
    resp.set_drift_records(ctx_.drift ? ctx_.drift->Total() : 0);
    resp.set_events_applied(stats.events_applied);
    resp.set_events_skipped(stats.events_skipped);
    resp.set_events_discarded(stats.events_discarded);
    return resp;
  });
}

HealthResponse AdminService::Health(const HealthRequest&) {
  return ObserveRpc("AdminService.Health", std::nullopt, [&] {
    const auto result = ctx_.repository->Ping();
    if (!result) {
      throw projsync::util::StoreUnavailable("Service unhealthy: " + result.message);
    }

    HealthResponse resp;
    resp.set_status("healthy");
    resp.set_database("connected");
    return resp;
  });
}

SweepResponse AdminService::Sweep(const SweepRequest& req) {
  return ObserveRpc("AdminService.Sweep", std::nullopt, [&] {
    if (!ctx_.monitor) {
      throw projsync::util::InvalidArgument("sweep: consistency monitor is not configured");
    }

    const auto report = req.has_self_heal() ? ctx_.monitor->Sweep(req.self_heal(), req.batch_size())
                                            : ctx_.monitor->Sweep(ctx_.monitor->Options().self_heal, req.batch_size());

    SweepResponse resp;
    resp.set_keys_checked(report.keys_checked);
    resp.set_healed(report.healed);
    for (const auto& record : report.records) {
      *resp.add_drift() = projsync::model::ToProto(record);
    }
    return resp;
  });
}

ListDriftResponse AdminService::ListDrift(const ListDriftRequest& req) {
  return ObserveRpc("AdminService.ListDrift", std::nullopt, [&] {
    ListDriftResponse resp;
    if (!ctx_.drift) return resp;

    const uint32_t limit = req.limit() == 0 ? kDefaultDriftLimit : req.limit();
    for (const auto& record : ctx_.drift->Recent(limit)) {
      *resp.add_drift() = projsync::model::ToProto(record);
    }
    return resp;
  });
}

} // namespace projsync::service
