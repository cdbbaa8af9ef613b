#include "storefront/order_lifecycle.hpp"
#include "storefront/errors.hpp"
#include "storefront/helpers.hpp"
#include "storefront/logging.hpp"
#include "storefront/validation.hpp"
#include "storefront/wire.hpp"
#include "order_rows.hpp"

#include <sqlite3.h>

#include <exception>

namespace storefront {

OrderLifecycle::OrderLifecycle(db::ConnectionPool& pool, EventSink& events, Clock clock)
    : pool_(pool), events_(events),
      clock_(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); })) {}

Order OrderLifecycle::transition(const std::string& tenant_id, int64_t order_id,
                                 OrderStatus target) {
    validation::require_utf8(tenant_id, "tenant_id");

    auto lease = pool_.acquire();
    db::Transaction tx(*lease);

    auto lookup = lease->prepare(
        "SELECT status FROM orders WHERE id = ?1 AND tenant_id = ?2");
    lookup.bind(1, order_id).bind(2, tenant_id);
    if (!lookup.step()) {
        throw NotFoundError("Order not found");
    }
    auto status_name = lookup.column_text(0);
    lookup.reset();
    auto current = parse_order_status(status_name);
    if (!current) {
        throw StoreError("order " + std::to_string(order_id) + " has unknown status " + status_name,
                         SQLITE_MISMATCH);
    }

    if (!can_transition(*current, target)) {
        log_warn("order_lifecycle", "illegal_transition",
                 {{"order_id", order_id},
                  {"tenant_id", tenant_id},
                  {"current", to_string(*current)},
                  {"attempted", to_string(target)}});
        throw IllegalTransitionError(*current, target);
    }

    auto update = lease->prepare(
        "UPDATE orders SET status = ?1, updated_at = ?2 "
        "WHERE id = ?3 AND tenant_id = ?4 AND status = ?5");
    update.bind(1, to_string(target))
        .bind(2, helpers::to_millis(clock_()))
        .bind(3, order_id)
        .bind(4, tenant_id)
        .bind(5, to_string(*current));
    update.run();
    if (lease->changes() != 1) {
        // Write lock is held since BEGIN IMMEDIATE, so the row cannot have moved.
        throw StoreError("status update for order " + std::to_string(order_id) + " matched no row",
                         SQLITE_INTERNAL);
    }

    auto order = rows::load_order(*lease, order_id, tenant_id);
    if (!order) {
        throw StoreError("order " + std::to_string(order_id) + " vanished during transition",
                         SQLITE_INTERNAL);
    }
    tx.commit();

    log_info("order_lifecycle", "order_status_changed",
             {{"order_number", order->order_number},
              {"tenant_id", tenant_id},
              {"previous", to_string(*current)},
              {"current", to_string(target)}});

    try {
        v1::OrderStatusChanged changed;
        changed.set_order_id(order->id);
        changed.set_order_number(order->order_number);
        changed.set_tenant_id(order->tenant_id);
        changed.set_previous(wire::to_proto(*current));
        changed.set_current(wire::to_proto(target));
        events_.publish(changed);
    } catch (const std::exception& e) {
        log_error("order_lifecycle", "status_event_not_published",
                  {{"order_number", order->order_number}, {"error", e.what()}});
    }

    return std::move(*order);
}

} // namespace storefront
