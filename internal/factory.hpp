#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/core/job_manager.hpp"
#include "internal/db/api/job_repository.hpp"
#include "internal/jobs/handler_registry.hpp"
#include "internal/service/job_service.hpp"

namespace jobhub::factory {

/*
  Application

  Owns all long-lived objects used by the daemon. Transport adapters are
  built on top of `job_service` by the caller.
*/
struct Application {
  std::shared_ptr<db::JobRepository>   repository;
  std::shared_ptr<core::JobManager>    manager;
  std::shared_ptr<service::JobService> job_service;
};

// Registry with the built-in handlers ("command" and "process").
std::shared_ptr<jobs::HandlerRegistry> BuildHandlers();

// nullptr when no database is configured.
std::shared_ptr<db::JobRepository> BuildRepository(const jobhub::runtime::config::RuntimeConfig& config);

/*
  Build

  Composition root: restores persisted state, seeds the configured jobs
  that are not stored yet and wires the service layer. The manager is
  returned stopped.
*/
Application Build(const jobhub::runtime::config::RuntimeConfig& config);

} // namespace jobhub::factory
