#pragma once

#include <cstdint>
#include <string>
#include "db.hpp"
#include "order_engine.hpp"
#include "outbox.hpp"
#include "types.hpp"

namespace storefront {

/**
 * Seller-driven status changes for persisted orders.
 *
 * A transition is a single-row compare-and-set on the order's status; no
 * other entity is touched.
 */
class OrderLifecycle {
public:
    OrderLifecycle(db::ConnectionPool& pool, EventSink& events, Clock clock = nullptr);

    /**
     * Move a tenant's order to `target`.
     *
     * @return The updated order
     * @throws NotFoundError if the order does not exist for this tenant
     * @throws IllegalTransitionError if `target` is not reachable from the
     *         current status; the stored status is left unchanged
     * @throws StoreError on store failure
     */
    Order transition(const std::string& tenant_id, int64_t order_id, OrderStatus target);

private:
    db::ConnectionPool& pool_;
    EventSink& events_;
    Clock clock_;
};

} // namespace storefront
