#include <grpcpp/grpcpp.h>

#include <iostream>
#include <memory>
#include <string>

#include "refinery/services/v1/queue_service.grpc.pb.h"
#include "refinery/v1.hpp"

using namespace refinery::api::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  refineryctl <addr> queue\n"
            << "  refineryctl <addr> blocked\n"
            << "  refineryctl <addr> anomalies\n"
            << "  refineryctl <addr> process-next\n"
            << "  refineryctl <addr> reject <id|branch> <reason> [--notify]\n"
            << "  refineryctl <addr> retry <id|branch>\n";
}

static void PrintMR(const MergeRequest& mr) {
  std::cout << mr.id() << " branch=" << mr.branch() << " target=" << mr.target() << " priority=P" << mr.priority();
  if (!mr.assignee().empty()) std::cout << " assignee=" << mr.assignee();
  if (!mr.blocked_by().empty()) std::cout << " blocked_by=" << mr.blocked_by();
  std::cout << "\n";
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = RefineryQueueService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "queue") {
    ListQueueResponse resp;
    auto              status = stub->ListQueue(&ctx, ListQueueRequest{}, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& entry : resp.entries()) {
      std::cout << entry.position() << ". score=" << entry.score() << " ";
      PrintMR(entry.merge_request());
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "blocked") {
    ListBlockedResponse resp;
    auto                status = stub->ListBlocked(&ctx, ListBlockedRequest{}, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& mr : resp.merge_requests()) PrintMR(mr);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "anomalies") {
    ListAnomaliesResponse resp;
    auto                  status = stub->ListAnomalies(&ctx, ListAnomaliesRequest{}, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& a : resp.anomalies()) {
      std::cout << a.severity() << " " << a.type() << " " << a.id() << " " << a.detail() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "process-next") {
    ProcessNextResponse resp;
    auto                status = stub->ProcessNext(&ctx, ProcessNextRequest{}, &resp);
    if (!status.ok()) return Fail(status);

    if (resp.merge_request_id().empty()) {
      std::cout << "queue empty\n";
      return 0;
    }
    if (resp.result().success()) {
      std::cout << "merged " << resp.merge_request_id() << " commit=" << resp.result().merge_commit() << "\n";
      return 0;
    }
    std::cout << "failed " << resp.merge_request_id() << ": " << resp.result().error() << "\n";
    return 3;
  }

  // ------------------------------------------------------------

  if (cmd == "reject") {
    if (argc < 5) return 1;

    RejectMergeRequestRequest req;
    req.set_id_or_branch(argv[3]);
    req.set_reason(argv[4]);
    req.set_notify(argc >= 6 && std::string(argv[5]) == "--notify");

    RejectMergeRequestResponse resp;
    auto                       status = stub->RejectMergeRequest(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "rejected " << resp.merge_request().id() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "retry") {
    if (argc < 4) return 1;

    RetryMergeRequestRequest req;
    req.set_id(argv[3]);

    RetryMergeRequestResponse resp;
    auto                      status = stub->RetryMergeRequest(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "retry scheduled\n";
    return 0;
  }

  Usage();
  return 1;
}
