#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/queue_service.hpp"
#include "refinery/services/v1/queue_service.grpc.pb.h"

namespace refinery::grpc {

class QueueServer final : public refinery::services::v1::RefineryQueueService::Service {
 public:
  explicit QueueServer(std::shared_ptr<refinery::service::QueueService> svc);

  ::grpc::Status ListQueue(::grpc::ServerContext*, const refinery::services::v1::ListQueueRequest*,
                           refinery::services::v1::ListQueueResponse*) override;

  ::grpc::Status ListBlocked(::grpc::ServerContext*, const refinery::services::v1::ListBlockedRequest*,
                             refinery::services::v1::ListBlockedResponse*) override;

  ::grpc::Status ListAnomalies(::grpc::ServerContext*, const refinery::services::v1::ListAnomaliesRequest*,
                               refinery::services::v1::ListAnomaliesResponse*) override;

  ::grpc::Status ProcessNext(::grpc::ServerContext*, const refinery::services::v1::ProcessNextRequest*,
                             refinery::services::v1::ProcessNextResponse*) override;

  ::grpc::Status RejectMergeRequest(::grpc::ServerContext*, const refinery::services::v1::RejectMergeRequestRequest*,
                                    refinery::services::v1::RejectMergeRequestResponse*) override;

  ::grpc::Status RetryMergeRequest(::grpc::ServerContext*, const refinery::services::v1::RetryMergeRequestRequest*,
                                   refinery::services::v1::RetryMergeRequestResponse*) override;

 private:
  std::shared_ptr<refinery::service::QueueService> service_;
};

} // namespace refinery::grpc
