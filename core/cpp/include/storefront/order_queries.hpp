#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "db.hpp"
#include "types.hpp"

namespace storefront {

struct ListOptions {
    std::optional<OrderStatus> status;
    int limit = 20;
    /// Id of the last order of the previous page.
    std::optional<int64_t> cursor;
};

struct OrderPage {
    std::vector<Order> orders;
    /// Set when more orders follow; pass back as ListOptions::cursor.
    std::optional<int64_t> next_cursor;
};

/**
 * Read side for seller dashboards and public tracking.
 */
class OrderQueries {
public:
    static constexpr int kDefaultLimit = 20;
    static constexpr int kMaxLimit = 100;

    explicit OrderQueries(db::ConnectionPool& pool) : pool_(pool) {}

    /**
     * A tenant's orders, newest first, optionally filtered by status.
     * An unknown cursor yields an empty page.
     *
     * @throws ValidationFailedError if the limit is outside 1..kMaxLimit
     */
    OrderPage list(const std::string& tenant_id, const ListOptions& options = {});

    /**
     * One order owned by the tenant. Orders of other tenants are reported
     * as absent, exactly like missing ones.
     */
    std::optional<Order> get(const std::string& tenant_id, int64_t order_id);

    /**
     * Public tracking by order number, across all tenants.
     *
     * The number is trimmed and upper-cased first. The buyer phone is masked
     * to its last 4 digits; the chat message and tenant id are left empty.
     */
    std::optional<Order> track(const std::string& order_number);

    /**
     * Status counts and revenue (non-cancelled orders) for a tenant.
     */
    OrderStats stats(const std::string& tenant_id);

private:
    db::ConnectionPool& pool_;
};

} // namespace storefront
