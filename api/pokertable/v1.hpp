#pragma once

#include "pokertable/core/v1/types.pb.h"
#include "pokertable/engine/v1/snapshot.pb.h"
#include "pokertable/runtime/v1/table_state.pb.h"

#include "pokertable/services/v1/table_service.pb.h"
#include "pokertable/services/v1/table_service.grpc.pb.h"

namespace pokertable::v1 {
using namespace ::pokertable::core::v1;
using namespace ::pokertable::engine::v1;
using namespace ::pokertable::runtime::v1;
using namespace ::pokertable::services::v1;
}
