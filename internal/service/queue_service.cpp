#include "queue_service.hpp"

#include <chrono>

#include "internal/engine/engineer.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/context.hpp"
#include "internal/util/errors.hpp"
#include "refinery/v1.hpp"

namespace refinery::service {

using namespace refinery::api::v1;
using observability::StringField;

namespace {

std::string FormatOptionalTime(const std::optional<util::TimePoint>& t) {
  return t ? util::FormatRfc3339(*t) : std::string{};
}

// Logs and rethrows so every route reports failures the same way.
template <typename Fn>
auto Route(const char* route, Fn&& fn) {
  try {
    return fn();
  } catch (const std::exception& ex) {
    REFINERY_LOG_ERROR("request failed", {StringField("route", route), StringField("error", ex.what())});
    throw;
  }
}

} // namespace

MergeRequest ToProto(const queue::MRInfo& mr) {
  MergeRequest out;
  out.set_id(mr.id);
  out.set_branch(mr.branch);
  out.set_target(mr.target);
  out.set_source_issue(mr.source_issue);
  out.set_worker(mr.worker);
  out.set_rig(mr.rig);
  out.set_title(mr.title);
  out.set_priority(mr.priority);
  out.set_agent_bead(mr.agent_bead);
  out.set_retry_count(mr.retry_count);
  out.set_convoy_id(mr.convoy_id);
  out.set_convoy_created_at(FormatOptionalTime(mr.convoy_created_at));
  out.set_created_at(FormatOptionalTime(mr.created_at));
  out.set_updated_at(FormatOptionalTime(mr.updated_at));
  out.set_assignee(mr.assignee);
  out.set_blocked_by(mr.blocked_by);
  out.set_branch_exists_local(mr.branch_exists_local);
  out.set_branch_exists_remote(mr.branch_exists_remote);
  return out;
}

refinery::v1::MRAnomaly ToProto(const queue::MRAnomaly& anomaly) {
  refinery::v1::MRAnomaly out;
  out.set_id(anomaly.id);
  out.set_branch(anomaly.branch);
  out.set_type(anomaly.type);
  out.set_severity(anomaly.severity);
  out.set_assignee(anomaly.assignee);
  out.set_age_seconds(std::chrono::duration_cast<std::chrono::seconds>(anomaly.age).count());
  out.set_detail(anomaly.detail);
  return out;
}

refinery::v1::ProcessResult ToProto(const engine::ProcessResult& result) {
  refinery::v1::ProcessResult out;
  out.set_success(result.success);
  out.set_merge_commit(result.merge_commit);
  out.set_error(result.error);
  out.set_conflict(result.conflict);
  out.set_tests_failed(result.tests_failed);
  out.set_slot_timeout(result.slot_timeout);
  return out;
}

QueueService::QueueService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.engineer) throw util::InvalidArgument("queue service needs an engineer");
}

ListQueueResponse QueueService::ListQueue(const ListQueueRequest&) {
  return Route("QueueService.ListQueue", [&] {
    ListQueueResponse resp;
    uint32_t          position = 0;
    for (const auto& ranked : ctx_.engineer->ListQueue()) {
      auto* entry = resp.add_entries();
      entry->set_position(++position);
      entry->set_score(ranked.score);
      *entry->mutable_merge_request() = ToProto(ranked.mr);
    }
    return resp;
  });
}

ListBlockedResponse QueueService::ListBlocked(const ListBlockedRequest&) {
  return Route("QueueService.ListBlocked", [&] {
    ListBlockedResponse resp;
    for (const auto& mr : ctx_.engineer->ListBlocked()) {
      *resp.add_merge_requests() = ToProto(mr);
    }
    return resp;
  });
}

ListAnomaliesResponse QueueService::ListAnomalies(const ListAnomaliesRequest&) {
  return Route("QueueService.ListAnomalies", [&] {
    ListAnomaliesResponse resp;
    for (const auto& anomaly : ctx_.engineer->ListAnomalies()) {
      *resp.add_anomalies() = ToProto(anomaly);
    }
    return resp;
  });
}

ProcessNextResponse QueueService::ProcessNext(const ProcessNextRequest&) {
  return Route("QueueService.ProcessNext", [&] {
    util::Context ctx;
    auto          outcome = ctx_.engineer->ProcessNext(ctx);

    ProcessNextResponse resp;
    if (outcome.processed) {
      resp.set_merge_request_id(outcome.mr.id);
      *resp.mutable_result() = ToProto(outcome.result);
    }
    return resp;
  });
}

RejectMergeRequestResponse QueueService::RejectMergeRequest(const RejectMergeRequestRequest& req) {
  return Route("QueueService.RejectMergeRequest", [&] {
    if (req.reason().empty()) throw util::InvalidArgument("reject reason is required");

    RejectMergeRequestResponse resp;
    *resp.mutable_merge_request() = ToProto(ctx_.engineer->RejectMR(req.id_or_branch(), req.reason(), req.notify()));
    return resp;
  });
}

RetryMergeRequestResponse QueueService::RetryMergeRequest(const RetryMergeRequestRequest& req) {
  return Route("QueueService.RetryMergeRequest", [&] {
    ctx_.engineer->RetryMR(req.id());
    return RetryMergeRequestResponse{};
  });
}

} // namespace refinery::service
