#pragma once

#include <string>

namespace dispatch::db::postgres {

// Creates tables and indexes if they are missing. Safe to run on every start.
// Runs on its own connection: pooled connections prepare statements
// against these tables.
void BootstrapSchema(const std::string& conninfo);

} // namespace dispatch::db::postgres
