#pragma once

#include "sqlite_db.hpp"

namespace statecore::db::sqlite {

// Creates or upgrades the state-core tables. Safe to call on every start.
void BootstrapSchema(SqliteDB& db);

}
