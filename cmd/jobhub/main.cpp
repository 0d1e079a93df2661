#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/job_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using jobhub::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void ShutdownObservability() {
  jobhub::observability::ShutdownLogging();
  jobhub::observability::ShutdownMetrics();
  jobhub::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: jobhub <config.yaml> OR jobhub --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = jobhub::config::ConfigLoader::LoadFromYaml(config_path);

    jobhub::observability::InitializeTracing(config);
    jobhub::observability::InitializeMetrics(config);
    jobhub::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = jobhub::factory::Build(config);

    std::vector<std::unique_ptr<::grpc::Service>> services;
    services.push_back(std::make_unique<jobhub::grpc::JobServer>(app.job_service));
    Server server(config.server().bind_address(), std::move(services));

    // Register signal handlers before starting to avoid a race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.manager->Start();
    server.Start();
    JOBHUB_LOG_INFO("jobhub started", {jobhub::observability::StringField("bind_address", config.server().bind_address()),
                                       jobhub::observability::IntField("jobs", static_cast<int64_t>(app.manager->GetJobs().size()))});

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    JOBHUB_LOG_INFO("shutting down jobhub");

    // Stopping the manager closes every event stream before the server drains.
    app.manager->Stop();
    server.Stop();
    ShutdownObservability();
  } catch (const std::exception& e) {
    JOBHUB_LOG_ERROR("fatal error", {jobhub::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
