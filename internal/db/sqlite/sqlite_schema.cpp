#include "sqlite_schema.hpp"

#include <string>
#include <vector>

namespace jobhub::db::sqlite {

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS jobs (id TEXT PRIMARY KEY, name TEXT NOT NULL, type TEXT NOT NULL, enabled INTEGER NOT NULL, definition TEXT NOT NULL, updated_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS job_executions (execution_id TEXT PRIMARY KEY, job_id TEXT NOT NULL, sequence INTEGER NOT NULL, trigger_kind INTEGER NOT NULL, forced INTEGER NOT NULL, status INTEGER NOT NULL, started_at_ms INTEGER NOT NULL, ended_at_ms INTEGER NOT NULL, duration_ms INTEGER NOT NULL, message TEXT, error TEXT, output TEXT, exit_code INTEGER NOT NULL DEFAULT 0);",
      "CREATE INDEX IF NOT EXISTS job_executions_by_job ON job_executions(job_id, sequence);",
      "CREATE TABLE IF NOT EXISTS job_schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);",
      "INSERT OR IGNORE INTO job_schema_migrations(version, applied_at_ms) VALUES (1, CAST(strftime('%s','now') AS INTEGER) * 1000);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }

  db.Exec("SELECT id,name,type,enabled,definition,updated_at_ms FROM jobs LIMIT 1;");
  db.Exec("SELECT execution_id,job_id,sequence,trigger_kind,forced,status,started_at_ms,ended_at_ms,duration_ms,message,error,output,exit_code FROM job_executions LIMIT 1;");
}

} // namespace jobhub::db::sqlite
