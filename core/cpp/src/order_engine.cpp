#include "storefront/order_engine.hpp"
#include "storefront/errors.hpp"
#include "storefront/helpers.hpp"
#include "storefront/logging.hpp"
#include "storefront/validation.hpp"
#include "storefront/wire.hpp"
#include "order_rows.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <exception>
#include <limits>
#include <map>

namespace storefront {

std::string to_string(DecrementPolicy policy) {
    switch (policy) {
        case DecrementPolicy::RejectOversell: return "reject-oversell";
        case DecrementPolicy::AllowOversell: return "allow-oversell";
    }
    return "unknown";
}

OrderEngine::OrderEngine(db::ConnectionPool& pool, StockValidator& validator,
                         OrderNumberGenerator& numbers, EventSink& events,
                         EngineOptions options, Clock clock)
    : pool_(pool), validator_(validator), numbers_(numbers), events_(events),
      options_(options),
      clock_(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); })) {}

Order OrderEngine::checkout(const Cart& cart) {
    auto started_at = clock_();
    validate_cart(cart);

    std::vector<StockRequest> requests;
    requests.reserve(cart.items.size());
    for (const auto& line : cart.items) {
        requests.push_back({line.variant_id, line.product_name, line.quantity});
    }

    auto check = validator_.validate(requests);
    if (!check.valid) {
        log_warn("order_engine", "checkout_rejected_insufficient_stock",
                 {{"tenant_id", cart.tenant_id},
                  {"shortfalls", static_cast<int>(check.shortfalls.size())}});
        throw InsufficientStockError(std::move(check.shortfalls));
    }

    return commit(cart, started_at);
}

Order OrderEngine::place(const Cart& cart) {
    auto started_at = clock_();
    validate_cart(cart);
    return commit(cart, started_at);
}

Order OrderEngine::commit(const Cart& cart, Timestamp started_at) {
    auto totals = compute_totals(cart);

    auto lease = pool_.acquire();
    db::Transaction tx(*lease);

    // Date is fixed at checkout start even if the day rolls over before commit.
    auto order_number = numbers_.allocate(*lease, started_at);
    auto order_id = insert_order(*lease, cart, order_number, totals, started_at);
    insert_items(*lease, order_id, cart);
    auto decrements = decrement_stock(*lease, cart);

    auto order = rows::load_order(*lease, order_id, cart.tenant_id);
    if (!order) {
        throw StoreError("order " + order_number + " vanished before commit", SQLITE_INTERNAL);
    }
    tx.commit();

    log_info("order_engine", "order_placed",
             {{"order_number", order->order_number},
              {"tenant_id", order->tenant_id},
              {"total_cents", order->total_cents},
              {"item_count", order->item_count}});

    publish_placed(*order, decrements);
    return std::move(*order);
}

void OrderEngine::validate_cart(const Cart& cart) const {
    validation::require_not_empty(cart.tenant_id, "tenant_id");
    validation::require_utf8(cart.tenant_id, "tenant_id");
    validation::require_not_empty(cart.items, "items");
    validation::require_at_most(cart.items, options_.max_lines, "items");

    validation::require_utf8(cart.buyer_name, "buyer_name");
    validation::require_utf8(cart.buyer_phone, "buyer_phone");
    validation::require_utf8(cart.buyer_note, "buyer_note");
    validation::require_utf8(cart.delivery_address, "delivery_address");
    validation::require_utf8(cart.delivery_city, "delivery_city");
    validation::require_utf8(cart.delivery_province, "delivery_province");
    validation::require_utf8(cart.delivery_postal_code, "delivery_postal_code");
    validation::require_utf8(cart.message, "message");

    for (size_t i = 0; i < cart.items.size(); ++i) {
        const auto& line = cart.items[i];
        auto field = "items[" + std::to_string(i) + "].";
        validation::require_not_empty(line.variant_id, field + "variant_id");
        validation::require_not_empty(line.product_id, field + "product_id");
        validation::require_not_empty(line.product_name, field + "product_name");
        validation::require_positive(line.quantity, field + "quantity");
        validation::require_non_negative(line.price_cents, field + "price_cents");
        validation::require_utf8(line.product_id, field + "product_id");
        validation::require_utf8(line.variant_id, field + "variant_id");
        validation::require_utf8(line.product_name, field + "product_name");
        validation::require_utf8(line.option1_label, field + "option1_label");
        validation::require_utf8(line.option1_value, field + "option1_value");
        validation::require_utf8(line.option2_label, field + "option2_label");
        validation::require_utf8(line.option2_value, field + "option2_value");
    }
}

OrderEngine::Totals OrderEngine::compute_totals(const Cart& cart) {
    constexpr auto kMax = std::numeric_limits<int64_t>::max();

    Totals totals;
    for (const auto& line : cart.items) {
        if (line.price_cents > 0 && line.quantity > kMax / line.price_cents) {
            throw ValidationFailedError("line total overflows for " + line.product_name);
        }
        int64_t line_total = line.price_cents * line.quantity;
        if (totals.total_cents > kMax - line_total || totals.item_count > kMax - line.quantity) {
            throw ValidationFailedError("order total overflows");
        }
        totals.total_cents += line_total;
        totals.item_count += line.quantity;
    }
    return totals;
}

int64_t OrderEngine::insert_order(db::Connection& connection, const Cart& cart,
                                  const std::string& order_number, const Totals& totals,
                                  Timestamp now) {
    auto stmt = connection.prepare(
        "INSERT INTO orders (order_number, tenant_id, buyer_name, buyer_phone, buyer_note, "
        "delivery_address, delivery_city, delivery_province, delivery_postal_code, "
        "total_cents, item_count, message, status, created_at, updated_at) "
        "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13, ?14, ?14)");
    stmt.bind(1, order_number)
        .bind(2, cart.tenant_id)
        .bind(3, cart.buyer_name)
        .bind(4, cart.buyer_phone)
        .bind(5, cart.buyer_note)
        .bind(6, cart.delivery_address)
        .bind(7, cart.delivery_city)
        .bind(8, cart.delivery_province)
        .bind(9, cart.delivery_postal_code)
        .bind(10, totals.total_cents)
        .bind(11, totals.item_count)
        .bind(12, cart.message)
        .bind(13, to_string(OrderStatus::Pending))
        .bind(14, helpers::to_millis(now));
    stmt.run();
    return connection.last_insert_id();
}

void OrderEngine::insert_items(db::Connection& connection, int64_t order_id, const Cart& cart) {
    auto stmt = connection.prepare(
        "INSERT INTO order_items (order_id, product_id, variant_id, product_name, "
        "option1_label, option1_value, option2_label, option2_value, price_cents, quantity) "
        "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10)");

    for (const auto& line : cart.items) {
        stmt.bind(1, order_id)
            .bind(2, line.product_id)
            .bind(3, line.variant_id)
            .bind(4, line.product_name)
            .bind(5, line.option1_label)
            .bind(6, line.option1_value)
            .bind(7, line.option2_label)
            .bind(8, line.option2_value)
            .bind(9, line.price_cents)
            .bind(10, line.quantity);
        stmt.run();
        stmt.reset();
    }
}

std::vector<OrderEngine::Decrement> OrderEngine::decrement_stock(db::Connection& connection,
                                                                 const Cart& cart) {
    // Single mutation contract for variants.stock; nothing else writes it.
    auto update = connection.prepare(
        options_.decrement_policy == DecrementPolicy::RejectOversell
            ? "UPDATE variants SET stock = stock - ?1 "
              "WHERE id = ?2 AND is_active = 1 AND stock >= ?1"
            : "UPDATE variants SET stock = stock - ?1 WHERE id = ?2");
    auto current = connection.prepare(
        "SELECT stock, is_active FROM variants WHERE id = ?1");

    std::vector<Decrement> decrements;
    std::vector<StockShortfall> shortfalls;

    for (const auto& line : cart.items) {
        update.bind(1, line.quantity).bind(2, line.variant_id);
        update.run();
        bool applied = connection.changes() == 1;
        update.reset();

        current.bind(1, line.variant_id);
        bool found = current.step();
        int64_t stock = found ? current.column_int64(0) : 0;
        bool active = found && current.column_int64(1) != 0;
        current.reset();

        if (applied) {
            decrements.push_back({&line, stock});
        } else {
            int64_t available = active ? std::max<int64_t>(stock, 0) : 0;
            shortfalls.push_back({line.variant_id, line.product_name, line.quantity, available});
        }
    }

    if (!shortfalls.empty()) {
        log_warn("order_engine", "checkout_aborted_at_commit",
                 {{"tenant_id", cart.tenant_id},
                  {"policy", to_string(options_.decrement_policy)},
                  {"shortfalls", static_cast<int>(shortfalls.size())}});
        throw InsufficientStockError(std::move(shortfalls));
    }

    if (options_.decrement_policy == DecrementPolicy::AllowOversell) {
        for (const auto& decrement : decrements) {
            if (decrement.remaining < 0) {
                log_warn("order_engine", "stock_oversold",
                         {{"variant_id", decrement.line->variant_id},
                          {"remaining", decrement.remaining}});
            }
        }
    }
    return decrements;
}

void OrderEngine::publish_placed(const Order& order,
                                 const std::vector<Decrement>& decrements) noexcept {
    // The order is committed; failing to build an event must not fail the checkout.
    try {
        build_and_publish(order, decrements);
    } catch (const std::exception& e) {
        log_error("order_engine", "order_events_not_published",
                  {{"order_number", order.order_number}, {"error", e.what()}});
    }
}

void OrderEngine::build_and_publish(const Order& order, const std::vector<Decrement>& decrements) {
    v1::OrderPlaced placed;
    *placed.mutable_order() = wire::to_proto(order);
    events_.publish(placed);

    // Last decrement per unit carries its final stock for this order.
    std::map<std::string, const Decrement*> latest;
    for (const auto& decrement : decrements) {
        latest[decrement.line->variant_id] = &decrement;
    }

    for (const auto& [variant_id, decrement] : latest) {
        if (decrement->remaining > options_.low_stock_threshold) continue;

        v1::LowStockDetected low;
        low.set_tenant_id(order.tenant_id);
        low.set_order_number(order.order_number);
        low.set_variant_id(variant_id);
        low.set_product_id(decrement->line->product_id);
        low.set_product_name(decrement->line->product_name);
        low.set_remaining(decrement->remaining);
        low.set_threshold(options_.low_stock_threshold);
        events_.publish(low);
    }
}

} // namespace storefront
