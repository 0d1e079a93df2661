#include "factory.hpp"

#include <chrono>
#include <memory>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_job_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/jobs/command_handler.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"

namespace jobhub::factory {

using observability::StringField;

std::shared_ptr<jobs::HandlerRegistry> BuildHandlers() {
  auto registry = std::make_shared<jobs::HandlerRegistry>();
  auto command  = std::make_shared<jobs::CommandHandler>();
  registry->Register("command", command);
  registry->Register("process", command);
  return registry;
}

std::shared_ptr<db::JobRepository> BuildRepository(const jobhub::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    if (database.sqlite().path().empty()) {
      throw util::InvalidConfig("database.sqlite.path is required");
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    db::sqlite::BootstrapSchema(*sqlite_db);
    JOBHUB_LOG_INFO("using sqlite job repository", {StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteJobRepository>(std::move(sqlite_db));
  }

  return nullptr;
}

/*
    Build full application dependency graph
*/
Application Build(const jobhub::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  core::JobManagerOptions options;
  if (config.scheduler().tick_interval_ms() > 0) {
    options.tick_interval = std::chrono::milliseconds(config.scheduler().tick_interval_ms());
  }
  if (config.history().retention_per_job() > 0) {
    options.retention_per_job = config.history().retention_per_job();
  }
  if (config.events().subscriber_buffer_size() > 0) {
    options.subscriber_buffer_size = config.events().subscriber_buffer_size();
  }

  app.repository = BuildRepository(config);
  app.manager    = std::make_shared<core::JobManager>(options, BuildHandlers(), app.repository);
  app.manager->Restore();

  // ------------------------------------------------------------------
  // Seed jobs
  // ------------------------------------------------------------------
  for (const auto& definition : config.jobs()) {
    try {
      app.manager->CreateJob(definition);
    } catch (const util::AlreadyExists&) {
      JOBHUB_LOG_DEBUG("seed job already stored", {StringField("job_id", definition.id())});
    }
  }

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.manager = app.manager;
  if (config.events().keepalive_interval_sec() > 0) {
    ctx.keepalive_interval = std::chrono::seconds(config.events().keepalive_interval_sec());
  }

  app.job_service = std::make_shared<service::JobService>(ctx);
  return app;
}

} // namespace jobhub::factory
