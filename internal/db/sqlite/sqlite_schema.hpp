#pragma once

#include <memory>

#include "sqlite_db.hpp"

namespace dispatch::db::sqlite {

// Creates tables and indexes if they are missing. Safe to run on every start.
void BootstrapSchema(SqliteDB& db);

} // namespace dispatch::db::sqlite
