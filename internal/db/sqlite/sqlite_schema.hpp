#pragma once

#include "sqlite_db.hpp"

namespace jobhub::db::sqlite {

// Creates the job tables when missing and checks their column layout.
void BootstrapSchema(SqliteDB& db);

} // namespace jobhub::db::sqlite
