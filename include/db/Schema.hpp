#pragma once

#include "config/Config.hpp"

namespace ovdm::db {

// Creates the tables the engine reads and writes if they are not there yet. Idempotent.
// Runs on its own connection, before the pool prepares statements against these tables.
void ensureSchema(const config::DatabaseConfig& cfg);

}
