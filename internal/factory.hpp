#pragma once

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/beads/issue_store.hpp"
#include "internal/config/merge_queue_config.hpp"
#include "internal/engine/engineer.hpp"
#include "internal/engine/queue_worker.hpp"
#include "internal/queue/priority_scorer.hpp"
#include "internal/service/queue_service.hpp"
#include "internal/slot/merge_slot.hpp"
#include "internal/slot/slot_store.hpp"

#if REFINERY_WITH_GRPC
#include <grpcpp/impl/service_type.h>
#endif

namespace refinery::factory {

/*
  Application

  Owns every long-lived component of one rig's refinery. Nothing is started
  here; the caller decides whether to run the worker and the gRPC server.
*/
struct Application {
  config::MergeQueueConfig merge_queue;

  std::shared_ptr<beads::IssueStore>       store;
  std::shared_ptr<slot::MergeSlotStore>    slots;
  std::shared_ptr<engine::Engineer>        engineer;
  std::shared_ptr<engine::QueueWorker>     worker;
  std::shared_ptr<service::QueueService>   queue_service;

#if REFINERY_WITH_GRPC
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
#endif
};

// Throws util::InvalidArgument on bad durations or a negative retry count.
slot::MergeSlotOptions MergeSlotOptionsFromProto(const refinery::runtime::config::MergeSlotConfig& proto);

// Unset fields keep their defaults. Throws util::InvalidArgument for negative weights.
queue::ScoreWeights ScoreWeightsFromProto(const refinery::runtime::config::ScoringConfig& proto);

/*
  Build

  Composition root. The only place that knows the concrete store, git and
  notifier types. Requires rig.name and rig.work_dir.
*/
Application Build(const refinery::runtime::config::RuntimeConfig& config);

} // namespace refinery::factory
