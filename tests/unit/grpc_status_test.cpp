#include <cassert>
#include <iostream>
#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/queue_server.hpp"
#include "internal/service/queue_service.hpp"
#include "unit/support/engineer_rig.hpp"

namespace {

using namespace refinery::services::v1;
using refinery::testing::EngineerRig;
namespace util = refinery::util;

std::unique_ptr<refinery::grpc::QueueServer> ServerFor(EngineerRig& rig) {
  refinery::service::ServiceContext ctx;
  ctx.engineer = rig.engineer;
  return std::make_unique<refinery::grpc::QueueServer>(std::make_shared<refinery::service::QueueService>(ctx));
}

void TestExceptionMapping() {
  using ::grpc::StatusCode;
  using refinery::grpc::ToStatus;

  assert(ToStatus(util::NotFound("x")).error_code() == StatusCode::NOT_FOUND);
  assert(ToStatus(util::InvalidArgument("x")).error_code() == StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(util::InvalidState("x")).error_code() == StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(util::SlotContentionTimeout("x")).error_code() == StatusCode::RESOURCE_EXHAUSTED);
  assert(ToStatus(util::Cancelled("x")).error_code() == StatusCode::CANCELLED);
  assert(ToStatus(util::StoreError("x")).error_code() == StatusCode::UNAVAILABLE);
  assert(ToStatus(util::InfrastructureError("x")).error_code() == StatusCode::UNAVAILABLE);
  assert(ToStatus(std::runtime_error("x")).error_code() == StatusCode::INTERNAL);
  assert(ToStatus(util::NotFound("merge request gt-1")).error_message() == "merge request gt-1");
}

void TestRetryUnknownReturnsNotFound() {
  EngineerRig rig;
  auto        server = ServerFor(rig);

  RetryMergeRequestRequest  req;
  RetryMergeRequestResponse resp;
  req.set_id("gt-missing");
  ::grpc::ServerContext grpc_ctx;

  const auto status = server->RetryMergeRequest(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestRejectWithoutReasonIsInvalidArgument() {
  EngineerRig rig;
  rig.Add("gt-1", "feature/x", 2);
  auto server = ServerFor(rig);

  RejectMergeRequestRequest  req;
  RejectMergeRequestResponse resp;
  req.set_id_or_branch("gt-1");
  ::grpc::ServerContext grpc_ctx;

  const auto status = server->RejectMergeRequest(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestRejectClosedIsFailedPrecondition() {
  EngineerRig rig;
  rig.Add("gt-1", "feature/x", 2);
  auto server = ServerFor(rig);

  RejectMergeRequestRequest req;
  req.set_id_or_branch("gt-1");
  req.set_reason("duplicate");

  RejectMergeRequestResponse first;
  ::grpc::ServerContext      ctx1;
  assert(server->RejectMergeRequest(&ctx1, &req, &first).ok());
  assert(first.merge_request().id() == "gt-1");

  RejectMergeRequestResponse second;
  ::grpc::ServerContext      ctx2;
  const auto status = server->RejectMergeRequest(&ctx2, &req, &second);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestListQueueOk() {
  EngineerRig rig;
  rig.Add("gt-1", "feature/x", 2);
  auto server = ServerFor(rig);

  ListQueueRequest      req;
  ListQueueResponse     resp;
  ::grpc::ServerContext grpc_ctx;
  assert(server->ListQueue(&grpc_ctx, &req, &resp).ok());
  assert(resp.entries_size() == 1);
}

} // namespace

int main() {
  TestExceptionMapping();
  TestRetryUnknownReturnsNotFound();
  TestRejectWithoutReasonIsInvalidArgument();
  TestRejectClosedIsFailedPrecondition();
  TestListQueueOk();

  std::cout << "refinery_unit_grpc_status: pass\n";
  return 0;
}
