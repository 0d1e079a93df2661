#include <assert.h>

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_job_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/util/time.hpp"
#include "jobhub/manager/v1.hpp"

namespace {

using jobhub::db::sqlite::SqliteDB;
using jobhub::db::sqlite::SqliteJobRepository;
using namespace jobhub::manager::v1;

std::shared_ptr<SqliteJobRepository> OpenRepository(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "jobhub_sqlite_repository_tests";
  std::filesystem::create_directories(dir);
  const auto path = dir / (name + ".db");
  std::filesystem::remove(path);
  std::filesystem::remove(path.string() + "-wal");
  std::filesystem::remove(path.string() + "-shm");

  auto db = std::make_shared<SqliteDB>(path.string());
  jobhub::db::sqlite::BootstrapSchema(*db);
  return std::make_shared<SqliteJobRepository>(std::move(db));
}

JobDefinition Definition(const std::string& id) {
  JobDefinition definition;
  definition.set_id(id);
  definition.set_name("Scan " + id);
  definition.set_type("process");
  definition.set_category("Files");
  definition.add_tags("scan");
  definition.add_tags("files");
  definition.set_enabled(true);
  definition.mutable_schedule()->set_type(SCHEDULE_TYPE_INTERVAL);
  definition.mutable_schedule()->set_interval_seconds(600);
  (*definition.mutable_config()->mutable_fields())["command"].set_string_value("python3");
  return definition;
}

Execution MakeExecution(const std::string& job_id, uint64_t sequence, ExecutionStatus status) {
  Execution execution;
  execution.set_execution_id(job_id + "-" + std::to_string(sequence));
  execution.set_job_id(job_id);
  execution.set_sequence(sequence);
  execution.set_trigger(TRIGGER_SCHEDULED);
  execution.set_status(status);
  *execution.mutable_started_at() = jobhub::util::ToProto(jobhub::util::Now());
  return execution;
}

void TestDefinitionsRoundTrip() {
  auto repo = OpenRepository("definitions");
  {
    auto tx = repo->Begin();
    assert(repo->UpsertJob(*tx, Definition("b")));
    assert(repo->UpsertJob(*tx, Definition("a")));
    tx->Commit();
  }

  auto changed = Definition("a");
  changed.set_enabled(false);
  {
    auto tx = repo->Begin();
    assert(repo->UpsertJob(*tx, changed));
    tx->Commit();
  }

  auto tx   = repo->Begin();
  auto jobs = repo->ListJobs(*tx);
  tx->Commit();

  assert(jobs.size() == 2);
  assert(jobs[0].id() == "a" && !jobs[0].enabled());
  assert(jobs[1].id() == "b" && jobs[1].enabled());
  assert(jobs[1].tags_size() == 2);
  assert(jobs[1].schedule().interval_seconds() == 600);
  assert(jobs[1].config().fields().at("command").string_value() == "python3");
}

void TestUncommittedWritesRollBack() {
  auto repo = OpenRepository("rollback");
  {
    auto tx = repo->Begin();
    assert(repo->UpsertJob(*tx, Definition("lost")));
  }

  auto tx = repo->Begin();
  assert(repo->ListJobs(*tx).empty());
  assert(!tx->IsFinished());
  tx->Commit();
  assert(tx->IsFinished());
}

void TestExecutionsNewestFirstAndTrim() {
  auto repo = OpenRepository("executions");
  {
    auto tx = repo->Begin();
    for (uint64_t seq = 1; seq <= 4; ++seq) {
      assert(repo->UpsertExecution(*tx, MakeExecution("job", seq, EXECUTION_STATUS_RUNNING)));
    }
    auto finished = MakeExecution("job", 4, EXECUTION_STATUS_FAILED);
    finished.set_error("exit status 2");
    finished.set_exit_code(2);
    *finished.mutable_ended_at() = jobhub::util::ToProto(jobhub::util::Now());
    assert(repo->UpsertExecution(*tx, finished));
    tx->Commit();
  }

  {
    auto tx  = repo->Begin();
    auto all = repo->ListExecutions(*tx, "job", 0);
    assert(all.size() == 4);
    assert(all[0].sequence() == 4);
    assert(all[0].status() == EXECUTION_STATUS_FAILED);
    assert(all[0].error() == "exit status 2");
    assert(all[0].exit_code() == 2);
    assert(jobhub::util::IsSet(all[0].ended_at()));
    assert(!jobhub::util::IsSet(all[1].ended_at()));
    assert(all[3].sequence() == 1);

    assert(repo->ListExecutions(*tx, "job", 2).size() == 2);
    assert(repo->TrimExecutions(*tx, "job", 2));
    tx->Commit();
  }

  auto tx   = repo->Begin();
  auto kept = repo->ListExecutions(*tx, "job", 0);
  tx->Commit();
  assert(kept.size() == 2);
  assert(kept[0].sequence() == 4 && kept[1].sequence() == 3);
}

} // namespace

int main() {
  TestDefinitionsRoundTrip();
  TestUncommittedWritesRollBack();
  TestExecutionsNewestFirstAndTrim();

  std::cout << "jobhub_unit_sqlite_job_repository: pass\n";
  return 0;
}
