#pragma once

#include "config/config.pb.h"

#include "projsync/v1/types.pb.h"
#include "projsync/v1/services.pb.h"

#include "projsync/v1/services.grpc.pb.h"
