#pragma once

#include <memory>

#include "pg_pool.hpp"

namespace foreman::db::postgres {

// Creates the run history tables and indexes if they do not exist.
void BootstrapSchema(const std::shared_ptr<PgPool>& pool);

} // namespace foreman::db::postgres
