#pragma once

#include "db.hpp"

namespace storefront {
namespace schema {

/**
 * Create the order tables and indexes if missing, and switch the database
 * to WAL journaling. Idempotent.
 *
 * The `variants` table belongs to the catalog; it is created here so the
 * core can run against a fresh database.
 */
void migrate(db::Connection& connection);

} // namespace schema
} // namespace storefront
