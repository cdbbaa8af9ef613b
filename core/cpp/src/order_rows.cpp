#include "order_rows.hpp"
#include "storefront/errors.hpp"
#include "storefront/helpers.hpp"

#include <sqlite3.h>

namespace storefront {
namespace rows {

const char* const kOrderColumns =
    "id, order_number, tenant_id, buyer_name, buyer_phone, buyer_note, "
    "delivery_address, delivery_city, delivery_province, delivery_postal_code, "
    "total_cents, item_count, message, status, created_at, updated_at";

Order read_order(const db::Statement& stmt) {
    Order order;
    order.id = stmt.column_int64(0);
    order.order_number = stmt.column_text(1);
    order.tenant_id = stmt.column_text(2);
    order.buyer_name = stmt.column_optional_text(3);
    order.buyer_phone = stmt.column_optional_text(4);
    order.buyer_note = stmt.column_optional_text(5);
    order.delivery_address = stmt.column_optional_text(6);
    order.delivery_city = stmt.column_optional_text(7);
    order.delivery_province = stmt.column_optional_text(8);
    order.delivery_postal_code = stmt.column_optional_text(9);
    order.total_cents = stmt.column_int64(10);
    order.item_count = stmt.column_int64(11);
    order.message = stmt.column_text(12);

    auto status_name = stmt.column_text(13);
    auto status = parse_order_status(status_name);
    if (!status) {
        throw StoreError("order " + order.order_number + " has unknown status " + status_name,
                         SQLITE_MISMATCH);
    }
    order.status = *status;
    order.created_at = helpers::from_millis(stmt.column_int64(14));
    order.updated_at = helpers::from_millis(stmt.column_int64(15));
    return order;
}

std::vector<OrderItem> load_items(db::Connection& connection, int64_t order_id) {
    auto stmt = connection.prepare(
        "SELECT id, product_id, variant_id, product_name, option1_label, option1_value, "
        "option2_label, option2_value, price_cents, quantity "
        "FROM order_items WHERE order_id = ?1 ORDER BY id ASC");
    stmt.bind(1, order_id);

    std::vector<OrderItem> items;
    while (stmt.step()) {
        OrderItem item;
        item.id = stmt.column_int64(0);
        item.product_id = stmt.column_text(1);
        item.variant_id = stmt.column_text(2);
        item.product_name = stmt.column_text(3);
        item.option1_label = stmt.column_text(4);
        item.option1_value = stmt.column_text(5);
        item.option2_label = stmt.column_text(6);
        item.option2_value = stmt.column_optional_text(7);
        item.price_cents = stmt.column_int64(8);
        item.quantity = stmt.column_int64(9);
        items.push_back(std::move(item));
    }
    return items;
}

std::optional<Order> load_order(db::Connection& connection, int64_t order_id,
                                const std::optional<std::string>& tenant_id) {
    std::string sql = std::string("SELECT ") + kOrderColumns + " FROM orders WHERE id = ?1";
    if (tenant_id) sql += " AND tenant_id = ?2";

    auto stmt = connection.prepare(sql);
    stmt.bind(1, order_id);
    if (tenant_id) stmt.bind(2, *tenant_id);
    if (!stmt.step()) return std::nullopt;

    auto order = read_order(stmt);
    order.items = load_items(connection, order.id);
    return order;
}

std::optional<Order> load_order_by_number(db::Connection& connection,
                                          const std::string& order_number) {
    auto stmt = connection.prepare(
        std::string("SELECT ") + kOrderColumns + " FROM orders WHERE order_number = ?1");
    stmt.bind(1, order_number);
    if (!stmt.step()) return std::nullopt;

    auto order = read_order(stmt);
    order.items = load_items(connection, order.id);
    return order;
}

} // namespace rows
} // namespace storefront
