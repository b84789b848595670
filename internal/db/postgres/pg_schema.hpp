#pragma once

#include <memory>

#include "pg_pool.hpp"

namespace statecore::db::postgres {

// Creates or upgrades the state-core tables. Safe to call on every start.
void BootstrapSchema(const std::shared_ptr<PgPool>& pool);

}
