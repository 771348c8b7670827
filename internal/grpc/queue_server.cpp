#include "queue_server.hpp"

#include "grpc_error.hpp"
#include "refinery/v1.hpp"

namespace refinery::grpc {

using namespace refinery::api::v1;

QueueServer::QueueServer(std::shared_ptr<refinery::service::QueueService> svc) : service_(std::move(svc)) {
}

::grpc::Status QueueServer::ListQueue(::grpc::ServerContext*, const ListQueueRequest* req, ListQueueResponse* resp) {
  try {
    *resp = service_->ListQueue(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueueServer::ListBlocked(::grpc::ServerContext*, const ListBlockedRequest* req, ListBlockedResponse* resp) {
  try {
    *resp = service_->ListBlocked(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueueServer::ListAnomalies(::grpc::ServerContext*, const ListAnomaliesRequest* req, ListAnomaliesResponse* resp) {
  try {
    *resp = service_->ListAnomalies(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueueServer::ProcessNext(::grpc::ServerContext*, const ProcessNextRequest* req, ProcessNextResponse* resp) {
  try {
    *resp = service_->ProcessNext(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueueServer::RejectMergeRequest(::grpc::ServerContext*, const RejectMergeRequestRequest* req, RejectMergeRequestResponse* resp) {
  try {
    *resp = service_->RejectMergeRequest(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueueServer::RetryMergeRequest(::grpc::ServerContext*, const RetryMergeRequestRequest* req, RetryMergeRequestResponse* resp) {
  try {
    *resp = service_->RetryMergeRequest(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace refinery::grpc
