#include <google/protobuf/util/json_util.h>

#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "refinery/v1.hpp"
#if REFINERY_WITH_GRPC
#include "internal/runtime/server.hpp"
#endif

using namespace refinery::api::v1;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void Usage() {
  std::cerr << "Usage: refinery --config <config.yaml> <command> [args]\n"
            << "  run                           poll the queue (and serve gRPC when enabled)\n"
            << "  queue                         ranked ready MRs\n"
            << "  blocked                       MRs waiting on an open blocker\n"
            << "  anomalies                     stale claims and orphaned branches\n"
            << "  process-next                  one merge attempt\n"
            << "  reject <id|branch> <reason> [--notify]\n"
            << "  retry <id|branch>\n";
}

static int PrintJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names    = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    std::cerr << "json encode failed: " << status.ToString() << "\n";
    return 2;
  }
  std::cout << json;
  return 0;
}

static int Run(refinery::factory::Application& app, const refinery::runtime::config::RuntimeConfig& config) {
  if (!app.merge_queue.enabled) {
    REFINERY_LOG_WARN("merge queue disabled in config, worker not started");
  } else {
    app.worker->Start();
  }

#if REFINERY_WITH_GRPC
  const bool serve = !config.server().has_enabled() || config.server().enabled();
  const auto bind  = config.server().bind_address().empty() ? std::string("0.0.0.0:50061") : config.server().bind_address();

  refinery::runtime::Server server(bind, std::move(app.grpc_services));
  if (serve) server.Start();
#else
  if (config.server().has_enabled() && config.server().enabled()) {
    REFINERY_LOG_WARN("built without gRPC, server section ignored");
  }
#endif

  REFINERY_LOG_INFO("refinery started", {refinery::observability::StringField("rig", config.rig().name())});

  while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

  REFINERY_LOG_INFO("shutting down refinery");

#if REFINERY_WITH_GRPC
  server.Stop();
#endif
  app.worker->Stop();
  return 0;
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  if (args.size() < 3 || args[0] != "--config") {
    Usage();
    return 1;
  }
  const std::string config_path = args[1];
  const std::string cmd         = args[2];

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = refinery::config::ConfigLoader::LoadFromYaml(config_path);

    refinery::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto  app     = refinery::factory::Build(config);
    auto& service = *app.queue_service;

    int rc = 1;
    if (cmd == "run") {
      std::signal(SIGINT, HandleSignal);
      std::signal(SIGTERM, HandleSignal);
      rc = Run(app, config);
    } else if (cmd == "queue") {
      rc = PrintJson(service.ListQueue(ListQueueRequest{}));
    } else if (cmd == "blocked") {
      rc = PrintJson(service.ListBlocked(ListBlockedRequest{}));
    } else if (cmd == "anomalies") {
      rc = PrintJson(service.ListAnomalies(ListAnomaliesRequest{}));
    } else if (cmd == "process-next") {
      auto resp = service.ProcessNext(ProcessNextRequest{});
      rc        = PrintJson(resp);
      if (rc == 0 && !resp.merge_request_id().empty() && !resp.result().success()) rc = 3;
    } else if (cmd == "reject" && args.size() >= 5) {
      RejectMergeRequestRequest req;
      req.set_id_or_branch(args[3]);
      req.set_reason(args[4]);
      req.set_notify(args.size() >= 6 && args[5] == "--notify");
      rc = PrintJson(service.RejectMergeRequest(req));
    } else if (cmd == "retry" && args.size() >= 4) {
      RetryMergeRequestRequest req;
      req.set_id(args[3]);
      service.RetryMergeRequest(req);
      std::cout << "cleared claim on " << args[3] << "\n";
      rc = 0;
    } else {
      Usage();
    }

    refinery::observability::ShutdownLogging();
    return rc;
  } catch (const std::exception& e) {
    REFINERY_LOG_ERROR("Fatal error", {refinery::observability::StringField("error", e.what())});
    refinery::observability::ShutdownLogging();
    return 2;
  }
}
