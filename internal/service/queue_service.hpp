#pragma once

#include "internal/engine/process_result.hpp"
#include "internal/queue/anomaly_detector.hpp"
#include "internal/queue/mr_info.hpp"
#include "refinery/services/v1/queue_service.pb.h"
#include "service_context.hpp"

namespace refinery::service {

refinery::v1::MergeRequest  ToProto(const queue::MRInfo& mr);
refinery::v1::MRAnomaly     ToProto(const queue::MRAnomaly& anomaly);
refinery::v1::ProcessResult ToProto(const engine::ProcessResult& result);

/*
  Operator surface over the rig's engineer. Shared by the gRPC adapter and
  the one-shot CLI commands.
*/
class QueueService {
 public:
  explicit QueueService(ServiceContext ctx);

  refinery::services::v1::ListQueueResponse ListQueue(const refinery::services::v1::ListQueueRequest& req);

  refinery::services::v1::ListBlockedResponse ListBlocked(const refinery::services::v1::ListBlockedRequest& req);

  refinery::services::v1::ListAnomaliesResponse ListAnomalies(const refinery::services::v1::ListAnomaliesRequest& req);

  refinery::services::v1::ProcessNextResponse ProcessNext(const refinery::services::v1::ProcessNextRequest& req);

  refinery::services::v1::RejectMergeRequestResponse RejectMergeRequest(const refinery::services::v1::RejectMergeRequestRequest& req);

  refinery::services::v1::RetryMergeRequestResponse RetryMergeRequest(const refinery::services::v1::RetryMergeRequestRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace refinery::service
