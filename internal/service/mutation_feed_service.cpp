#include "mutation_feed_service.hpp"

#include <vector>

#include "internal/model/codec.hpp"
#include "internal/sync/synchronizer.hpp"
#include "observe_rpc.hpp"

namespace projsync::service {

using namespace projsync::v1;

MutationFeedService::MutationFeedService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

ApplyResponse MutationFeedService::Apply(const ApplyRequest& req) {
  return ObserveRpc("MutationFeedService.Apply", std::nullopt, [&] {
    std::vector<projsync::model::MutationEvent> events;
    events.reserve(req.events_size());
    for (const auto& event : req.events()) {
      events.push_back(projsync::model::FromProto(event));
    }

    ApplyResponse resp;
    for (auto& event : events) {
      const auto outcome = ctx_.synchronizer->Submit(std::move(event));

      auto* result = resp.add_results();
      result->set_key(outcome.key);
      result->set_sequence(outcome.sequence);
      result->set_state(projsync::model::ToProto(outcome.state));
      result->set_error(outcome.error);
    }
    return resp;
  });
}

} // namespace projsync::service
