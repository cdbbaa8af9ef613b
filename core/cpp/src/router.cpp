#include "storefront/router.hpp"
#include "storefront/helpers.hpp"
#include "storefront/logging.hpp"

#include <algorithm>
#include <exception>

namespace storefront {

EventRouter& EventRouter::on(const std::string& type_name, EventHandler handler) {
    handlers_.emplace_back(type_name, std::move(handler));
    return *this;
}

DispatchResult EventRouter::dispatch(const v1::EventPage& page) const {
    DispatchResult result;
    if (!page.has_event()) return result;

    const auto& type_url = page.event().type_url();
    for (const auto& [type_name, handler] : handlers_) {
        if (!helpers::type_url_matches(type_url, type_name)) continue;

        ++result.invoked;
        try {
            handler(page.event());
        } catch (const std::exception& e) {
            ++result.failed;
            log_error(name_, "event_handler_failed",
                      {{"event_type", type_name},
                       {"sequence", page.sequence()},
                       {"error", e.what()}});
        }
    }
    return result;
}

std::vector<std::string> EventRouter::types() const {
    std::vector<std::string> result;
    for (const auto& [type_name, _] : handlers_) {
        if (std::find(result.begin(), result.end(), type_name) == result.end()) {
            result.push_back(type_name);
        }
    }
    return result;
}

} // namespace storefront
