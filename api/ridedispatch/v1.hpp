#pragma once

// Message types only; the *.grpc.pb.h stubs are included by the transport.

#include "ridedispatch/v1/types.pb.h"

#include "ridedispatch/services/v1/admin_service.pb.h"
#include "ridedispatch/services/v1/dispatch_service.pb.h"
#include "ridedispatch/services/v1/driver_service.pb.h"
#include "ridedispatch/services/v1/ride_service.pb.h"

namespace ridedispatch::api {

namespace types    = ::ridedispatch::v1;
namespace services = ::ridedispatch::services::v1;

} // namespace ridedispatch::api
