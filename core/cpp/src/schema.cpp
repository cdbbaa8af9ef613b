#include "storefront/schema.hpp"

namespace storefront {
namespace schema {

namespace {

constexpr const char* kSchema = R"sql(
CREATE TABLE IF NOT EXISTS variants (
    id          TEXT PRIMARY KEY,
    product_id  TEXT NOT NULL,
    stock       INTEGER NOT NULL DEFAULT 0,
    is_active   INTEGER NOT NULL DEFAULT 1
);

CREATE TABLE IF NOT EXISTS orders (
    id                    INTEGER PRIMARY KEY AUTOINCREMENT,
    order_number          TEXT NOT NULL UNIQUE,
    tenant_id             TEXT NOT NULL,
    buyer_name            TEXT,
    buyer_phone           TEXT,
    buyer_note            TEXT,
    delivery_address      TEXT,
    delivery_city         TEXT,
    delivery_province     TEXT,
    delivery_postal_code  TEXT,
    total_cents           INTEGER NOT NULL,
    item_count            INTEGER NOT NULL,
    message               TEXT NOT NULL DEFAULT '',
    status                TEXT NOT NULL DEFAULT 'PENDING'
                          CHECK (status IN ('PENDING', 'CONFIRMED', 'SHIPPED', 'DELIVERED', 'CANCELLED')),
    created_at            INTEGER NOT NULL,
    updated_at            INTEGER NOT NULL
);

CREATE INDEX IF NOT EXISTS orders_tenant_created
    ON orders (tenant_id, created_at DESC, id DESC);

CREATE TABLE IF NOT EXISTS order_items (
    id             INTEGER PRIMARY KEY AUTOINCREMENT,
    order_id       INTEGER NOT NULL REFERENCES orders (id) ON DELETE CASCADE,
    product_id     TEXT NOT NULL,
    variant_id     TEXT NOT NULL,
    product_name   TEXT NOT NULL,
    option1_label  TEXT NOT NULL DEFAULT '',
    option1_value  TEXT NOT NULL DEFAULT '',
    option2_label  TEXT NOT NULL DEFAULT '',
    option2_value  TEXT,
    price_cents    INTEGER NOT NULL CHECK (price_cents >= 0),
    quantity       INTEGER NOT NULL CHECK (quantity > 0)
);

CREATE INDEX IF NOT EXISTS order_items_order ON order_items (order_id);
)sql";

} // anonymous namespace

void migrate(db::Connection& connection) {
    connection.execute("PRAGMA journal_mode = WAL");
    db::Transaction tx(connection);
    connection.execute(kSchema);
    tx.commit();
}

} // namespace schema
} // namespace storefront
