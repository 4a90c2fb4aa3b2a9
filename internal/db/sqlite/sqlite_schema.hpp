#pragma once

#include "sqlite_db.hpp"

namespace foreman::db::sqlite {

// Creates the run history tables and indexes if they do not exist.
void BootstrapSchema(SqliteDB& db);

} // namespace foreman::db::sqlite
