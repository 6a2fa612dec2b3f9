#pragma once

#include "sqlite_db.hpp"

namespace relay::db::sqlite {

// Creates the relay tables if missing, then probes every column the
// repository reads so a stale schema fails at startup.
void BootstrapSchema(SqliteDB& db);

} // namespace relay::db::sqlite
