#include "storefront/order_queries.hpp"
#include "storefront/errors.hpp"
#include "storefront/helpers.hpp"
#include "storefront/order_number.hpp"
#include "order_rows.hpp"

namespace storefront {

OrderPage OrderQueries::list(const std::string& tenant_id, const ListOptions& options) {
    if (options.limit < 1 || options.limit > kMaxLimit) {
        throw ValidationFailedError("limit must be between 1 and " + std::to_string(kMaxLimit));
    }

    auto lease = pool_.acquire();
    db::Transaction tx(*lease, db::Transaction::Mode::Deferred);

    // Keyset position of the cursor order; a cursor from another tenant is unknown.
    int64_t after_created = 0;
    int64_t after_id = 0;
    if (options.cursor) {
        auto anchor = lease->prepare(
            "SELECT created_at, id FROM orders WHERE id = ?1 AND tenant_id = ?2");
        anchor.bind(1, *options.cursor).bind(2, tenant_id);
        if (!anchor.step()) return {};
        after_created = anchor.column_int64(0);
        after_id = anchor.column_int64(1);
    }

    std::string sql = std::string("SELECT ") + rows::kOrderColumns +
                      " FROM orders WHERE tenant_id = ?1";
    if (options.status) sql += " AND status = ?2";
    if (options.cursor) sql += " AND (created_at < ?3 OR (created_at = ?3 AND id < ?4))";
    sql += " ORDER BY created_at DESC, id DESC LIMIT ?5";

    auto stmt = lease->prepare(sql);
    stmt.bind(1, tenant_id);
    if (options.status) stmt.bind(2, to_string(*options.status));
    if (options.cursor) stmt.bind(3, after_created).bind(4, after_id);
    // One extra row tells whether another page follows.
    stmt.bind(5, static_cast<int64_t>(options.limit) + 1);

    OrderPage page;
    while (stmt.step()) {
        page.orders.push_back(rows::read_order(stmt));
    }

    if (page.orders.size() > static_cast<size_t>(options.limit)) {
        page.orders.pop_back();
        page.next_cursor = page.orders.back().id;
    }
    for (auto& order : page.orders) {
        order.items = rows::load_items(*lease, order.id);
    }

    tx.commit();
    return page;
}

std::optional<Order> OrderQueries::get(const std::string& tenant_id, int64_t order_id) {
    auto lease = pool_.acquire();
    db::Transaction tx(*lease, db::Transaction::Mode::Deferred);
    auto order = rows::load_order(*lease, order_id, tenant_id);
    tx.commit();
    return order;
}

std::optional<Order> OrderQueries::track(const std::string& order_number) {
    auto normalized = helpers::normalize_order_number(order_number);
    if (!OrderNumberGenerator::is_well_formed(normalized)) return std::nullopt;

    auto lease = pool_.acquire();
    db::Transaction tx(*lease, db::Transaction::Mode::Deferred);
    auto order = rows::load_order_by_number(*lease, normalized);
    tx.commit();

    // Anyone holding the number can track; strip what identifies the buyer or shop.
    if (order) {
        order->buyer_phone = helpers::mask_phone(order->buyer_phone);
        order->message.clear();
        order->tenant_id.clear();
    }
    return order;
}

OrderStats OrderQueries::stats(const std::string& tenant_id) {
    auto lease = pool_.acquire();
    auto stmt = lease->prepare(
        "SELECT status, COUNT(*), COALESCE(SUM(total_cents), 0) "
        "FROM orders WHERE tenant_id = ?1 GROUP BY status");
    stmt.bind(1, tenant_id);

    OrderStats stats;
    while (stmt.step()) {
        auto status = parse_order_status(stmt.column_text(0));
        if (!status) continue;

        auto count = stmt.column_int64(1);
        stats.total += count;
        switch (*status) {
            case OrderStatus::Pending: stats.pending = count; break;
            case OrderStatus::Confirmed: stats.confirmed = count; break;
            case OrderStatus::Shipped: stats.shipped = count; break;
            case OrderStatus::Delivered: stats.delivered = count; break;
            case OrderStatus::Cancelled: stats.cancelled = count; break;
        }
        if (*status != OrderStatus::Cancelled) {
            stats.revenue_cents += stmt.column_int64(2);
        }
    }
    return stats;
}

} // namespace storefront
