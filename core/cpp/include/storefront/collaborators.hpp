#pragma once

#include <map>
#include <optional>
#include <string>
#include "router.hpp"
#include "types.hpp"

namespace storefront {

/**
 * Maps a seller credential to the tenant it acts for.
 */
class TenantResolver {
public:
    virtual ~TenantResolver() = default;

    /**
     * @return The caller, or nullopt when the credential is unknown
     */
    virtual std::optional<Caller> resolve(const std::string& credential) const = 0;
};

/**
 * Resolver over a fixed token table (STOREFRONT_SELLER_TOKENS).
 */
class StaticTenantResolver : public TenantResolver {
public:
    explicit StaticTenantResolver(std::map<std::string, Caller> tokens)
        : tokens_(std::move(tokens)) {}

    std::optional<Caller> resolve(const std::string& credential) const override;

private:
    std::map<std::string, Caller> tokens_;
};

/**
 * Sends the order summary to the seller's chat channel.
 */
class ChatMessenger {
public:
    virtual ~ChatMessenger() = default;
    virtual void send(const v1::Order& order) = 0;
};

/**
 * Seller notifications (new order email, low-stock alert).
 */
class OrderNotifier {
public:
    virtual ~OrderNotifier() = default;
    virtual void notify_new_order(const v1::Order& order) = 0;
    virtual void notify_low_stock(const v1::LowStockDetected& alert) = 0;
};

/**
 * Route order events to the chat and notification collaborators.
 *
 * Handlers run on the outbox worker; whatever they throw is logged by the
 * router and dropped.
 */
void register_side_effects(EventRouter& router, ChatMessenger& messenger, OrderNotifier& notifier);

} // namespace storefront
