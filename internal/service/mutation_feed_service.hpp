#pragma once

#include "projsync/v1/services.pb.h"
#include "service_context.hpp"

namespace projsync::service {

/*
  Entry point for base-relation changes committed elsewhere. Every event
  in a request is decoded before any is submitted; they are then
  submitted in request order.
*/
class MutationFeedService {
public:
  explicit MutationFeedService(ServiceContext ctx);

  projsync::v1::ApplyResponse Apply(const projsync::v1::ApplyRequest& req);

private:
  ServiceContext ctx_;
};

}
