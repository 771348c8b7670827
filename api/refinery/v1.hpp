#pragma once

#include "refinery/v1/merge_queue.pb.h"

#include "refinery/services/v1/queue_service.pb.h"

namespace refinery::api::v1 {
using namespace ::refinery::v1;
using namespace ::refinery::services::v1;
}
