#pragma once

#include "dispatch/core/v1/types.pb.h"

#include "dispatch/cluster/v1/relay.pb.h"
#include "dispatch/realtime/v1/messages.pb.h"

#include "dispatch/services/v1/admin_service.pb.h"
#include "dispatch/services/v1/cluster_relay_service.pb.h"
#include "dispatch/services/v1/driver_service.pb.h"
#include "dispatch/services/v1/order_service.pb.h"
#include "dispatch/services/v1/realtime_service.pb.h"

#include "dispatch/services/v1/admin_service.grpc.pb.h"
#include "dispatch/services/v1/cluster_relay_service.grpc.pb.h"
#include "dispatch/services/v1/driver_service.grpc.pb.h"
#include "dispatch/services/v1/order_service.grpc.pb.h"
#include "dispatch/services/v1/realtime_service.grpc.pb.h"

namespace dispatch::v1 {
using namespace ::dispatch::core::v1;
using namespace ::dispatch::cluster::v1;
using namespace ::dispatch::realtime::v1;
using namespace ::dispatch::services::v1;
}
