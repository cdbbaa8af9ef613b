#include "storefront/wire.hpp"
#include "storefront/helpers.hpp"

namespace storefront {
namespace wire {

namespace {

template<typename SetFn>
void set_optional(const std::optional<std::string>& value, SetFn set) {
    if (value) set(*value);
}

v1::OrderItem to_proto(const OrderItem& item) {
    v1::OrderItem out;
    out.set_id(item.id);
    out.set_product_id(item.product_id);
    out.set_variant_id(item.variant_id);
    out.set_product_name(item.product_name);
    out.set_option1_label(item.option1_label);
    out.set_option1_value(item.option1_value);
    out.set_option2_label(item.option2_label);
    if (item.option2_value) out.set_option2_value(*item.option2_value);
    out.set_price_cents(item.price_cents);
    out.set_quantity(item.quantity);
    return out;
}

CartLine from_proto(const v1::CartLine& line) {
    CartLine out;
    out.product_id = line.product_id();
    out.variant_id = line.variant_id();
    out.product_name = line.product_name();
    out.option1_label = line.option1_label();
    out.option1_value = line.option1_value();
    out.option2_label = line.option2_label();
    if (line.has_option2_value()) out.option2_value = line.option2_value();
    out.price_cents = line.price_cents();
    out.quantity = line.quantity();
    return out;
}

} // namespace

v1::OrderStatus to_proto(OrderStatus status) {
    switch (status) {
        case OrderStatus::Pending: return v1::PENDING;
        case OrderStatus::Confirmed: return v1::CONFIRMED;
        case OrderStatus::Shipped: return v1::SHIPPED;
        case OrderStatus::Delivered: return v1::DELIVERED;
        case OrderStatus::Cancelled: return v1::CANCELLED;
    }
    return v1::ORDER_STATUS_UNSPECIFIED;
}

std::optional<OrderStatus> from_proto(v1::OrderStatus status) {
    switch (status) {
        case v1::PENDING: return OrderStatus::Pending;
        case v1::CONFIRMED: return OrderStatus::Confirmed;
        case v1::SHIPPED: return OrderStatus::Shipped;
        case v1::DELIVERED: return OrderStatus::Delivered;
        case v1::CANCELLED: return OrderStatus::Cancelled;
        default: return std::nullopt;
    }
}

v1::Order to_proto(const Order& order) {
    v1::Order out;
    out.set_id(order.id);
    out.set_order_number(order.order_number);
    out.set_tenant_id(order.tenant_id);
    set_optional(order.buyer_name, [&](const std::string& v) { out.set_buyer_name(v); });
    set_optional(order.buyer_phone, [&](const std::string& v) { out.set_buyer_phone(v); });
    set_optional(order.buyer_note, [&](const std::string& v) { out.set_buyer_note(v); });

    auto* delivery = out.mutable_delivery();
    set_optional(order.delivery_address, [&](const std::string& v) { delivery->set_address(v); });
    set_optional(order.delivery_city, [&](const std::string& v) { delivery->set_city(v); });
    set_optional(order.delivery_province, [&](const std::string& v) { delivery->set_province(v); });
    set_optional(order.delivery_postal_code,
                 [&](const std::string& v) { delivery->set_postal_code(v); });

    out.set_total_cents(order.total_cents);
    out.set_item_count(order.item_count);
    out.set_message(order.message);
    out.set_status(to_proto(order.status));
    *out.mutable_created_at() = helpers::to_timestamp(order.created_at);
    *out.mutable_updated_at() = helpers::to_timestamp(order.updated_at);

    for (const auto& item : order.items) {
        *out.add_items() = to_proto(item);
    }
    return out;
}

v1::StockShortfalls to_proto(const std::vector<StockShortfall>& shortfalls) {
    v1::StockShortfalls out;
    for (const auto& shortfall : shortfalls) {
        auto* entry = out.add_shortfalls();
        entry->set_variant_id(shortfall.variant_id);
        entry->set_product_name(shortfall.product_name);
        entry->set_requested(shortfall.requested);
        entry->set_available(shortfall.available);
    }
    return out;
}

std::vector<StockShortfall> from_proto(const v1::StockShortfalls& shortfalls) {
    std::vector<StockShortfall> out;
    out.reserve(shortfalls.shortfalls_size());
    for (const auto& entry : shortfalls.shortfalls()) {
        out.push_back({entry.variant_id(), entry.product_name(), entry.requested(),
                       entry.available()});
    }
    return out;
}

OrderStats from_proto(const v1::OrderStats& stats) {
    OrderStats out;
    out.total = stats.total();
    out.pending = stats.pending();
    out.confirmed = stats.confirmed();
    out.shipped = stats.shipped();
    out.delivered = stats.delivered();
    out.cancelled = stats.cancelled();
    out.revenue_cents = stats.revenue_cents();
    return out;
}

v1::OrderStats to_proto(const OrderStats& stats) {
    v1::OrderStats out;
    out.set_total(stats.total);
    out.set_pending(stats.pending);
    out.set_confirmed(stats.confirmed);
    out.set_shipped(stats.shipped);
    out.set_delivered(stats.delivered);
    out.set_cancelled(stats.cancelled);
    out.set_revenue_cents(stats.revenue_cents);
    return out;
}

Cart from_proto(const v1::CheckoutRequest& request) {
    Cart cart;
    cart.tenant_id = request.tenant_id();
    cart.items.reserve(request.items_size());
    for (const auto& line : request.items()) {
        cart.items.push_back(from_proto(line));
    }
    if (request.has_buyer_name()) cart.buyer_name = request.buyer_name();
    if (request.has_buyer_phone()) cart.buyer_phone = request.buyer_phone();
    if (request.has_buyer_note()) cart.buyer_note = request.buyer_note();

    const auto& delivery = request.delivery();
    if (delivery.has_address()) cart.delivery_address = delivery.address();
    if (delivery.has_city()) cart.delivery_city = delivery.city();
    if (delivery.has_province()) cart.delivery_province = delivery.province();
    if (delivery.has_postal_code()) cart.delivery_postal_code = delivery.postal_code();

    cart.message = request.message();
    return cart;
}

std::vector<StockRequest> from_proto(const v1::ValidateStockRequest& request) {
    std::vector<StockRequest> out;
    out.reserve(request.items_size());
    for (const auto& line : request.items()) {
        out.push_back({line.variant_id(), line.product_name(), line.quantity()});
    }
    return out;
}

} // namespace wire
} // namespace storefront
