#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <google/protobuf/any.pb.h>
#include <grpcpp/grpcpp.h>
#include "storefront/orders.grpc.pb.h"
#include "storefront/orders.pb.h"
#include "errors.hpp"
#include "order_number.hpp"
#include "wire.hpp"

namespace storefront {

/**
 * Typed client for the order service.
 *
 * Failed calls are raised as the same error types the core throws, so a
 * remote checkout can be handled exactly like a local one:
 *
 *   OrderClient client(grpc::CreateChannel("localhost:50051",
 *                                          grpc::InsecureChannelCredentials()));
 *   try {
 *       auto order = client.checkout(request);
 *   } catch (const InsufficientStockError& e) {
 *       for (const auto& s : e.shortfalls()) { ... }
 *   }
 *
 * Seller calls need a credential set with set_credential().
 */
class OrderClient {
public:
    /**
     * Create a client from an existing channel.
     *
     * @param channel Shared gRPC channel
     */
    explicit OrderClient(std::shared_ptr<grpc::Channel> channel)
        : stub_(v1::OrderService::NewStub(channel)) {}

    /**
     * Seller credential sent as `authorization: Bearer <credential>`.
     */
    void set_credential(const std::string& credential) { credential_ = credential; }

    /**
     * Place an order.
     *
     * @throws ValidationFailedError, InsufficientStockError,
     *         IdentifierExhaustedError, or GrpcError
     */
    v1::Order checkout(const v1::CheckoutRequest& request) {
        v1::CheckoutResponse response;
        grpc::ClientContext context;
        check(stub_->Checkout(&context, request, &response));
        return response.order();
    }

    v1::ValidateStockResponse validate_stock(const v1::ValidateStockRequest& request) {
        v1::ValidateStockResponse response;
        grpc::ClientContext context;
        check(stub_->ValidateStock(&context, request, &response));
        return response;
    }

    /**
     * Public tracking. Returns nullopt for unknown order numbers.
     */
    std::optional<v1::Order> track_order(const std::string& order_number) {
        v1::TrackOrderRequest request;
        request.set_order_number(order_number);
        v1::Order response;
        grpc::ClientContext context;
        auto status = stub_->TrackOrder(&context, request, &response);
        if (status.error_code() == grpc::StatusCode::NOT_FOUND) return std::nullopt;
        check(status);
        return response;
    }

    /**
     * @throws IllegalTransitionError, NotFoundError, or GrpcError
     */
    v1::Order update_order_status(int64_t order_id, v1::OrderStatus status) {
        v1::UpdateOrderStatusRequest request;
        request.set_order_id(order_id);
        request.set_status(status);
        v1::Order response;
        grpc::ClientContext context;
        authorize(context);
        check(stub_->UpdateOrderStatus(&context, request, &response));
        return response;
    }

    v1::ListOrdersResponse list_orders(const v1::ListOrdersRequest& request) {
        v1::ListOrdersResponse response;
        grpc::ClientContext context;
        authorize(context);
        check(stub_->ListOrders(&context, request, &response));
        return response;
    }

    /**
     * Returns nullopt when the order does not exist for the caller's tenant.
     */
    std::optional<v1::Order> get_order(int64_t order_id) {
        v1::GetOrderRequest request;
        request.set_order_id(order_id);
        v1::Order response;
        grpc::ClientContext context;
        authorize(context);
        auto status = stub_->GetOrder(&context, request, &response);
        if (status.error_code() == grpc::StatusCode::NOT_FOUND) return std::nullopt;
        check(status);
        return response;
    }

    OrderStats get_order_stats() {
        v1::GetOrderStatsRequest request;
        v1::OrderStats response;
        grpc::ClientContext context;
        authorize(context);
        check(stub_->GetOrderStats(&context, request, &response));
        return wire::from_proto(response);
    }

private:
    std::unique_ptr<v1::OrderService::Stub> stub_;
    std::string credential_;

    void authorize(grpc::ClientContext& context) const {
        if (!credential_.empty()) {
            context.AddMetadata("authorization", "Bearer " + credential_);
        }
    }

    /**
     * Raise a failed status as the matching core error.
     */
    static void check(const grpc::Status& status) {
        if (status.ok()) return;

        google::protobuf::Any details;
        bool has_details = !status.error_details().empty() &&
                           details.ParseFromString(status.error_details());

        if (has_details && details.Is<v1::StockShortfalls>()) {
            v1::StockShortfalls shortfalls;
            details.UnpackTo(&shortfalls);
            throw InsufficientStockError(wire::from_proto(shortfalls));
        }
        if (has_details && details.Is<v1::TransitionRejected>()) {
            v1::TransitionRejected rejected;
            details.UnpackTo(&rejected);
            auto current = wire::from_proto(rejected.current());
            auto attempted = wire::from_proto(rejected.attempted());
            if (current && attempted) {
                throw IllegalTransitionError(*current, *attempted);
            }
        }

        switch (status.error_code()) {
            case grpc::StatusCode::INVALID_ARGUMENT:
                throw ValidationFailedError(status.error_message());
            case grpc::StatusCode::NOT_FOUND:
                throw NotFoundError(status.error_message());
            case grpc::StatusCode::ABORTED:
                throw IdentifierExhaustedError(OrderNumberGenerator::kMaxAttempts);
            default:
                throw GrpcError(status.error_message(), status.error_code());
        }
    }
};

} // namespace storefront
