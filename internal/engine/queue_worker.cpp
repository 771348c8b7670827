#include "queue_worker.hpp"

#include <string>
#include <unordered_set>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace refinery::engine {

using observability::IntField;
using observability::StringField;

QueueWorker::QueueWorker(std::shared_ptr<Engineer> engineer, QueueWorkerOptions options, std::shared_ptr<util::Context> ctx)
    : engineer_(std::move(engineer)), options_(options), ctx_(std::move(ctx)) {
  if (!engineer_) throw util::InvalidArgument("queue worker needs an engineer");
  if (!ctx_) ctx_ = std::make_shared<util::Context>();
  if (options_.max_concurrent < 1) options_.max_concurrent = 1;
  if (options_.poll_interval <= util::Duration::zero()) throw util::InvalidArgument("poll interval must be positive");
}

QueueWorker::~QueueWorker() {
  Stop();
}

void QueueWorker::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&QueueWorker::Run, this);
  REFINERY_LOG_INFO("queue worker started", {StringField("poll_interval", util::FormatDuration(options_.poll_interval)),
                                             IntField("max_concurrent", options_.max_concurrent)});
}

void QueueWorker::Stop() {
  ctx_->Cancel();
  running_ = false;
  if (thread_.joinable()) {
    thread_.join();
    REFINERY_LOG_INFO("queue worker stopped");
  }
}

int QueueWorker::RunOnce(const util::Context& ctx) {
  // a failed MR is unclaimed right away; it waits for the next cycle
  std::unordered_set<std::string> attempted;
  int                             processed = 0;
  for (int i = 0; i < options_.max_concurrent && !ctx.IsCancelled(); ++i) {
    auto outcome = engineer_->ProcessNext(ctx, attempted);
    if (!outcome.processed) break;
    attempted.insert(outcome.mr.id);
    ++processed;
  }
  return processed;
}

void QueueWorker::Run() {
  while (running_) {
    try {
      const int n = RunOnce(*ctx_);
      if (n > 0) REFINERY_LOG_DEBUG("queue cycle done", {IntField("processed", n)});
    } catch (const util::Cancelled&) {
      break;
    } catch (const std::exception& e) {
      REFINERY_LOG_ERROR("queue cycle failed", {StringField("error", e.what())});
    }

    if (ctx_->WaitFor(options_.poll_interval)) break;
  }
}

} // namespace refinery::engine
