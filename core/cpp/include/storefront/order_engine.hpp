#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include "db.hpp"
#include "order_number.hpp"
#include "outbox.hpp"
#include "stock_validator.hpp"
#include "types.hpp"

namespace storefront {

/**
 * How the checkout transaction decrements stock.
 */
enum class DecrementPolicy {
    /// Decrement only while stock covers the quantity; otherwise abort the
    /// whole checkout with InsufficientStockError. Stock never goes negative.
    RejectOversell,
    /// Decrement unconditionally and reconcile later. Two checkouts that both
    /// pass the pre-check can drive stock below zero.
    AllowOversell
};

std::string to_string(DecrementPolicy policy);

struct EngineOptions {
    DecrementPolicy decrement_policy = DecrementPolicy::RejectOversell;
    /// Units left at or below this after a checkout raise LowStockDetected.
    int64_t low_stock_threshold = 5;
    size_t max_lines = 100;
};

using Clock = std::function<Timestamp()>;

/**
 * Order intake: validates a cart and persists the order, its line items and
 * the stock decrements as one transaction.
 *
 * Example:
 *   OrderEngine engine(pool, validator, numbers, outbox);
 *   auto order = engine.checkout(cart);
 *   // order.status == OrderStatus::Pending, stock already decremented
 */
class OrderEngine {
public:
    OrderEngine(db::ConnectionPool& pool, StockValidator& validator,
                OrderNumberGenerator& numbers, EventSink& events,
                EngineOptions options = {}, Clock clock = nullptr);

    /**
     * Full buyer checkout: cart validation, stock pre-check, then place().
     *
     * @throws ValidationFailedError for a malformed cart (no store access)
     * @throws InsufficientStockError listing every short line
     * @throws IdentifierExhaustedError if no unique order number was found
     * @throws StoreError on store failure; nothing is committed
     */
    Order checkout(const Cart& cart);

    /**
     * The atomic unit of work, without the advisory pre-check:
     * totals, order number, order + items insert, stock decrement.
     *
     * Totals are always computed here; the cart carries none.
     * Events are published only after commit.
     */
    Order place(const Cart& cart);

    const EngineOptions& options() const { return options_; }

private:
    struct Totals {
        int64_t total_cents = 0;
        int64_t item_count = 0;
    };

    struct Decrement {
        const CartLine* line;
        int64_t remaining;
    };

    Order commit(const Cart& cart, Timestamp started_at);
    void validate_cart(const Cart& cart) const;
    static Totals compute_totals(const Cart& cart);

    int64_t insert_order(db::Connection& connection, const Cart& cart,
                         const std::string& order_number, const Totals& totals,
                         Timestamp now);
    void insert_items(db::Connection& connection, int64_t order_id, const Cart& cart);
    std::vector<Decrement> decrement_stock(db::Connection& connection, const Cart& cart);

    void publish_placed(const Order& order, const std::vector<Decrement>& decrements) noexcept;
    void build_and_publish(const Order& order, const std::vector<Decrement>& decrements);

    db::ConnectionPool& pool_;
    StockValidator& validator_;
    OrderNumberGenerator& numbers_;
    EventSink& events_;
    EngineOptions options_;
    Clock clock_;
};

} // namespace storefront
