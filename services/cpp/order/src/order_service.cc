#include "order_service.hpp"
#include "storefront/errors.hpp"
#include "storefront/logging.hpp"
#include "storefront/wire.hpp"
#include <grpcpp/grpcpp.h>
#include <stdexcept>
#include <string>

namespace order_service {

namespace {

constexpr const char* kBearer = "Bearer ";

std::optional<int64_t> parse_cursor(const std::string& cursor) {
    if (cursor.empty()) return std::nullopt;
    size_t consumed = 0;
    int64_t id = 0;
    try {
        id = std::stoll(cursor, &consumed);
    } catch (const std::logic_error&) {
        throw storefront::ValidationFailedError("cursor is malformed");
    }
    if (consumed != cursor.size() || id <= 0) {
        throw storefront::ValidationFailedError("cursor is malformed");
    }
    return id;
}

storefront::OrderStatus require_status(storefront::v1::OrderStatus status) {
    auto parsed = storefront::wire::from_proto(status);
    if (!parsed) {
        throw storefront::ValidationFailedError(
            "status must be one of PENDING, CONFIRMED, SHIPPED, DELIVERED, CANCELLED");
    }
    return *parsed;
}

}  // namespace

std::optional<std::string> credential_from(const grpc::ServerContext& context) {
    const auto& metadata = context.client_metadata();
    auto it = metadata.find("authorization");
    if (it == metadata.end()) return std::nullopt;

    std::string value(it->second.data(), it->second.size());
    if (value.rfind(kBearer, 0) == 0) value = value.substr(std::string(kBearer).size());
    if (value.empty()) return std::nullopt;
    return value;
}

class OrderServiceImpl final : public storefront::v1::OrderService::Service {
public:
    explicit OrderServiceImpl(OrderComponents components) : c_(components) {}

    grpc::Status Checkout(grpc::ServerContext* context,
                          const storefront::v1::CheckoutRequest* request,
                          storefront::v1::CheckoutResponse* response) override {
        try {
            storefront::log_info("order_service", "checkout",
                {{"tenant_id", request->tenant_id()}, {"lines", request->items_size()}});
            auto order = c_.engine.checkout(storefront::wire::from_proto(*request));
            *response->mutable_order() = storefront::wire::to_proto(order);
            return grpc::Status::OK;
        } catch (const storefront::OrderError& e) {
            return e.to_grpc_status();
        }
    }

    grpc::Status ValidateStock(grpc::ServerContext* context,
                               const storefront::v1::ValidateStockRequest* request,
                               storefront::v1::ValidateStockResponse* response) override {
        try {
            auto check = c_.validator.validate(storefront::wire::from_proto(*request));
            response->set_valid(check.valid);
            auto shortfalls = storefront::wire::to_proto(check.shortfalls);
            *response->mutable_shortfalls() = shortfalls.shortfalls();
            return grpc::Status::OK;
        } catch (const storefront::OrderError& e) {
            return e.to_grpc_status();
        }
    }

    grpc::Status TrackOrder(grpc::ServerContext* context,
                            const storefront::v1::TrackOrderRequest* request,
                            storefront::v1::Order* response) override {
        try {
            auto order = c_.queries.track(request->order_number());
            if (!order) {
                return grpc::Status(grpc::StatusCode::NOT_FOUND, "Order not found");
            }
            *response = storefront::wire::to_proto(*order);
            return grpc::Status::OK;
        } catch (const storefront::OrderError& e) {
            return e.to_grpc_status();
        }
    }

    grpc::Status UpdateOrderStatus(grpc::ServerContext* context,
                                   const storefront::v1::UpdateOrderStatusRequest* request,
                                   storefront::v1::Order* response) override {
        try {
            auto caller = authenticate(*context);
            if (!caller) return unauthenticated();

            auto target = require_status(request->status());
            storefront::log_info("order_service", "updating_order_status",
                {{"tenant_id", caller->tenant_id}, {"caller_id", caller->caller_id},
                 {"order_id", request->order_id()}, {"status", storefront::to_string(target)}});
            auto order = c_.lifecycle.transition(caller->tenant_id, request->order_id(), target);
            *response = storefront::wire::to_proto(order);
            return grpc::Status::OK;
        } catch (const storefront::OrderError& e) {
            return e.to_grpc_status();
        }
    }

    grpc::Status ListOrders(grpc::ServerContext* context,
                            const storefront::v1::ListOrdersRequest* request,
                            storefront::v1::ListOrdersResponse* response) override {
        try {
            auto caller = authenticate(*context);
            if (!caller) return unauthenticated();

            storefront::ListOptions options;
            if (request->status() != storefront::v1::ORDER_STATUS_UNSPECIFIED) {
                options.status = require_status(request->status());
            }
            if (request->limit() != 0) options.limit = request->limit();
            options.cursor = parse_cursor(request->cursor());

            auto page = c_.queries.list(caller->tenant_id, options);
            for (const auto& order : page.orders) {
                *response->add_orders() = storefront::wire::to_proto(order);
            }
            if (page.next_cursor) response->set_next_cursor(std::to_string(*page.next_cursor));
            return grpc::Status::OK;
        } catch (const storefront::OrderError& e) {
            return e.to_grpc_status();
        }
    }

    grpc::Status GetOrder(grpc::ServerContext* context,
                          const storefront::v1::GetOrderRequest* request,
                          storefront::v1::Order* response) override {
        try {
            auto caller = authenticate(*context);
            if (!caller) return unauthenticated();

            auto order = c_.queries.get(caller->tenant_id, request->order_id());
            if (!order) {
                return grpc::Status(grpc::StatusCode::NOT_FOUND, "Order not found");
            }
            *response = storefront::wire::to_proto(*order);
            return grpc::Status::OK;
        } catch (const storefront::OrderError& e) {
            return e.to_grpc_status();
        }
    }

    grpc::Status GetOrderStats(grpc::ServerContext* context,
                               const storefront::v1::GetOrderStatsRequest* request,
                               storefront::v1::OrderStats* response) override {
        try {
            auto caller = authenticate(*context);
            if (!caller) return unauthenticated();

            *response = storefront::wire::to_proto(c_.queries.stats(caller->tenant_id));
            return grpc::Status::OK;
        } catch (const storefront::OrderError& e) {
            return e.to_grpc_status();
        }
    }

private:
    std::optional<storefront::Caller> authenticate(const grpc::ServerContext& context) const {
        auto credential = credential_from(context);
        if (!credential) return std::nullopt;
        return c_.resolver.resolve(*credential);
    }

    static grpc::Status unauthenticated() {
        return grpc::Status(grpc::StatusCode::UNAUTHENTICATED, "Unauthorized");
    }

    OrderComponents c_;
};

std::unique_ptr<storefront::v1::OrderService::Service> create_order_service(
    OrderComponents components) {
    return std::make_unique<OrderServiceImpl>(components);
}

}  // namespace order_service
