#pragma once

#include <memory>
#include <optional>
#include <string>
#include <grpcpp/grpcpp.h>
#include "storefront/orders.grpc.pb.h"
#include "storefront/collaborators.hpp"
#include "storefront/order_engine.hpp"
#include "storefront/order_lifecycle.hpp"
#include "storefront/order_queries.hpp"
#include "storefront/stock_validator.hpp"

namespace order_service {

/**
 * Components the order service delegates to. All are owned by the caller
 * and must outlive the service.
 */
struct OrderComponents {
    storefront::OrderEngine& engine;
    storefront::StockValidator& validator;
    storefront::OrderLifecycle& lifecycle;
    storefront::OrderQueries& queries;
    const storefront::TenantResolver& resolver;
};

/**
 * Extract the credential from `authorization` metadata. A "Bearer " scheme
 * prefix is stripped; an empty or missing header yields nullopt.
 */
std::optional<std::string> credential_from(const grpc::ServerContext& context);

std::unique_ptr<storefront::v1::OrderService::Service> create_order_service(
    OrderComponents components);

}  // namespace order_service
