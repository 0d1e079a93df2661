#include "sqlite_job_repository.hpp"

#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/time_util.h>
#include <sqlite3.h>

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace jobhub::db::sqlite {

using google::protobuf::util::TimeUtil;
using jobhub::db::ErrorCode;
using jobhub::db::Result;
using namespace jobhub::manager::v1;

namespace {

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

// 0 stands for an unset timestamp
int64_t ToMillis(const google::protobuf::Timestamp& ts) {
  return util::IsSet(ts) ? TimeUtil::TimestampToMilliseconds(ts) : 0;
}

void SetMillis(int64_t ms, google::protobuf::Timestamp* ts) {
  if (ms != 0) {
    *ts = TimeUtil::MillisecondsToTimestamp(ms);
  }
}

// Finalizes the statement on scope exit.
struct Statement {
  sqlite3_stmt* st = nullptr;
  ~Statement() {
    sqlite3_finalize(st);
  }
};

} // namespace

SqliteJobRepository::SqliteJobRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteJobRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteJobRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteJobRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Definitions
// ------------------------------------------------------------------

Result SqliteJobRepository::UpsertJob(Transaction& t, const JobDefinition& definition) {
  auto* db = TX(t).Handle();

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(definition, &json);
  if (!status.ok()) {
    return Result::Err(ErrorCode::InternalError, "encode job definition: " + std::string(status.message()));
  }

  const char* sql =
      "INSERT INTO jobs(id,name,type,enabled,definition,updated_at_ms) VALUES(?,?,?,?,?,?) "
      "ON CONFLICT(id) DO UPDATE SET name=excluded.name,type=excluded.type,enabled=excluded.enabled,"
      "definition=excluded.definition,updated_at_ms=excluded.updated_at_ms;";

  Statement stmt;
  if (sqlite3_prepare_v2(db, sql, -1, &stmt.st, nullptr) != SQLITE_OK) return Translate(db, sqlite3_errcode(db));

  BindText(stmt.st, 1, definition.id());
  BindText(stmt.st, 2, definition.name());
  BindText(stmt.st, 3, definition.type());
  BindI32(stmt.st, 4, definition.enabled() ? 1 : 0);
  BindText(stmt.st, 5, json);
  BindI64(stmt.st, 6, static_cast<int64_t>(util::ToUnixMillis(util::Now())));

  return Translate(db, sqlite3_step(stmt.st));
}

std::vector<JobDefinition> SqliteJobRepository::ListJobs(Transaction& t) {
  auto* db = TX(t).Handle();

  Statement stmt;
  if (sqlite3_prepare_v2(db, "SELECT id,definition FROM jobs ORDER BY id;", -1, &stmt.st, nullptr) != SQLITE_OK) {
    JOBHUB_LOG_ERROR("sqlite list jobs failed", {observability::StringField("error", sqlite3_errmsg(db))});
    return {};
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  std::vector<JobDefinition> out;
  while (sqlite3_step(stmt.st) == SQLITE_ROW) {
    const auto    id = ColText(stmt.st, 0);
    JobDefinition definition;
    auto          status = google::protobuf::util::JsonStringToMessage(ColText(stmt.st, 1), &definition, options);
    if (!status.ok()) {
      JOBHUB_LOG_WARN("skipping unreadable stored job",
                      {observability::StringField("job_id", id), observability::StringField("error", std::string(status.message()))});
      continue;
    }
    definition.set_id(id);
    out.push_back(std::move(definition));
  }
  return out;
}

// ------------------------------------------------------------------
// Executions
// ------------------------------------------------------------------

Result SqliteJobRepository::UpsertExecution(Transaction& t, const Execution& e) {
  auto* db = TX(t).Handle();

  const char* sql =
      "INSERT OR REPLACE INTO job_executions(execution_id,job_id,sequence,trigger_kind,forced,status,started_at_ms,ended_at_ms,"
      "duration_ms,message,error,output,exit_code) VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?);";

  Statement stmt;
  if (sqlite3_prepare_v2(db, sql, -1, &stmt.st, nullptr) != SQLITE_OK) return Translate(db, sqlite3_errcode(db));

  BindText(stmt.st, 1, e.execution_id());
  BindText(stmt.st, 2, e.job_id());
  BindI64(stmt.st, 3, static_cast<int64_t>(e.sequence()));
  BindI32(stmt.st, 4, static_cast<int>(e.trigger()));
  BindI32(stmt.st, 5, e.forced() ? 1 : 0);
  BindI32(stmt.st, 6, static_cast<int>(e.status()));
  BindI64(stmt.st, 7, ToMillis(e.started_at()));
  BindI64(stmt.st, 8, ToMillis(e.ended_at()));
  BindI64(stmt.st, 9, static_cast<int64_t>(e.duration_ms()));
  BindText(stmt.st, 10, e.message());
  BindText(stmt.st, 11, e.error());
  BindText(stmt.st, 12, e.output());
  BindI32(stmt.st, 13, e.exit_code());

  return Translate(db, sqlite3_step(stmt.st));
}

std::vector<Execution> SqliteJobRepository::ListExecutions(Transaction& t, const std::string& job_id, std::size_t limit) {
  auto* db = TX(t).Handle();

  const char* sql =
      "SELECT execution_id,job_id,sequence,trigger_kind,forced,status,started_at_ms,ended_at_ms,duration_ms,message,error,output,exit_code "
      "FROM job_executions WHERE job_id=? ORDER BY sequence DESC LIMIT ?;";

  Statement stmt;
  if (sqlite3_prepare_v2(db, sql, -1, &stmt.st, nullptr) != SQLITE_OK) {
    JOBHUB_LOG_ERROR("sqlite list executions failed", {observability::StringField("error", sqlite3_errmsg(db))});
    return {};
  }

  BindText(stmt.st, 1, job_id);
  // LIMIT -1 means no limit in sqlite
  BindI64(stmt.st, 2, limit == 0 ? -1 : static_cast<int64_t>(limit));

  std::vector<Execution> out;
  while (sqlite3_step(stmt.st) == SQLITE_ROW) {
    Execution e;
    e.set_execution_id(ColText(stmt.st, 0));
    e.set_job_id(ColText(stmt.st, 1));
    e.set_sequence(static_cast<uint64_t>(ColI64(stmt.st, 2)));
    e.set_trigger(static_cast<Trigger>(ColI32(stmt.st, 3)));
    e.set_forced(ColI32(stmt.st, 4) != 0);
    e.set_status(static_cast<ExecutionStatus>(ColI32(stmt.st, 5)));
    SetMillis(ColI64(stmt.st, 6), e.mutable_started_at());
    SetMillis(ColI64(stmt.st, 7), e.mutable_ended_at());
    e.set_duration_ms(static_cast<uint64_t>(ColI64(stmt.st, 8)));
    e.set_message(ColText(stmt.st, 9));
    e.set_error(ColText(stmt.st, 10));
    e.set_output(ColText(stmt.st, 11));
    e.set_exit_code(ColI32(stmt.st, 12));
    out.push_back(std::move(e));
  }
  return out;
}

Result SqliteJobRepository::TrimExecutions(Transaction& t, const std::string& job_id, std::size_t keep) {
  auto* db = TX(t).Handle();

  const char* sql =
      "DELETE FROM job_executions WHERE job_id=? AND execution_id NOT IN "
      "(SELECT execution_id FROM job_executions WHERE job_id=? ORDER BY sequence DESC LIMIT ?);";

  Statement stmt;
  if (sqlite3_prepare_v2(db, sql, -1, &stmt.st, nullptr) != SQLITE_OK) return Translate(db, sqlite3_errcode(db));

  BindText(stmt.st, 1, job_id);
  BindText(stmt.st, 2, job_id);
  BindI64(stmt.st, 3, static_cast<int64_t>(keep));

  return Translate(db, sqlite3_step(stmt.st));
}

} // namespace jobhub::db::sqlite
