#pragma once

#include <functional>
#include <stdexcept>
#include <string>
#include <vector>
#include <google/protobuf/any.pb.h>
#include "storefront/orders.pb.h"

namespace storefront {

/**
 * Outcome of dispatching one event page.
 */
struct DispatchResult {
    size_t invoked = 0;
    size_t failed = 0;
};

/**
 * Routes published order events to side-effect handlers (functional pattern).
 *
 * Handlers are fire-and-forget: an exception thrown by one handler is logged
 * and counted, and never stops the other handlers or reaches the publisher.
 *
 * Example:
 *   EventRouter router("notifications");
 *   router.on("storefront.v1.OrderPlaced", [&](const google::protobuf::Any& any) {
 *       v1::OrderPlaced placed;
 *       if (any.UnpackTo(&placed)) messenger.send(placed.order());
 *   });
 */
class EventRouter {
public:
    using EventHandler = std::function<void(const google::protobuf::Any&)>;

    explicit EventRouter(const std::string& name) : name_(name) {}

    /**
     * Register a handler for a fully qualified event type name.
     * Several handlers may share a type; they run in registration order.
     */
    EventRouter& on(const std::string& type_name, EventHandler handler);

    /**
     * Register a typed handler keyed by the message's full name.
     * A payload that does not parse as Event counts as a failed handler.
     */
    template<typename Event>
    EventRouter& on(std::function<void(const Event&)> handler) {
        return on(Event::descriptor()->full_name(), [handler](const google::protobuf::Any& any) {
            Event event;
            if (!any.UnpackTo(&event)) {
                throw std::runtime_error("payload is not a valid " + Event::descriptor()->full_name());
            }
            handler(event);
        });
    }

    /**
     * Dispatch one page to every matching handler.
     */
    DispatchResult dispatch(const v1::EventPage& page) const;

    /**
     * Return registered event type names.
     */
    std::vector<std::string> types() const;

    const std::string& name() const { return name_; }

private:
    std::string name_;
    std::vector<std::pair<std::string, EventHandler>> handlers_;
};

} // namespace storefront
