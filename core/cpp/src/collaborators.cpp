#include "storefront/collaborators.hpp"

namespace storefront {

std::optional<Caller> StaticTenantResolver::resolve(const std::string& credential) const {
    auto it = tokens_.find(credential);
    if (it == tokens_.end()) return std::nullopt;
    return it->second;
}

void register_side_effects(EventRouter& router, ChatMessenger& messenger, OrderNotifier& notifier) {
    router
        .on<v1::OrderPlaced>([&messenger](const v1::OrderPlaced& placed) {
            messenger.send(placed.order());
        })
        .on<v1::OrderPlaced>([&notifier](const v1::OrderPlaced& placed) {
            notifier.notify_new_order(placed.order());
        })
        .on<v1::LowStockDetected>([&notifier](const v1::LowStockDetected& alert) {
            notifier.notify_low_stock(alert);
        });
}

} // namespace storefront
