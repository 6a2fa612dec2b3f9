#pragma once

#include <memory>

#include "pg_pool.hpp"

namespace relay::db::postgres {

void BootstrapSchema(const std::shared_ptr<PgPool>& pool);

} // namespace relay::db::postgres
