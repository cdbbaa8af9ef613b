#include "storefront/config.hpp"
#include "storefront/errors.hpp"

#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace storefront {

namespace {

int64_t parse_integer(const std::string& name, const std::string& value, int64_t min, int64_t max) {
    size_t consumed = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(value, &consumed);
    } catch (const std::logic_error&) {
        throw ConfigError(name + " must be an integer, got '" + value + "'");
    }
    if (consumed != value.size()) {
        throw ConfigError(name + " must be an integer, got '" + value + "'");
    }
    if (parsed < min || parsed > max) {
        throw ConfigError(name + " must be between " + std::to_string(min) + " and " +
                          std::to_string(max));
    }
    return parsed;
}

std::vector<std::string> split(const std::string& value, char separator) {
    std::vector<std::string> parts;
    std::stringstream ss(value);
    std::string part;
    while (std::getline(ss, part, separator)) {
        parts.push_back(part);
    }
    return parts;
}

} // anonymous namespace

DecrementPolicy parse_decrement_policy(const std::string& value) {
    if (value == "reject-oversell") return DecrementPolicy::RejectOversell;
    if (value == "allow-oversell") return DecrementPolicy::AllowOversell;
    throw ConfigError("STOREFRONT_DECREMENT_POLICY must be reject-oversell or allow-oversell, got '" +
                      value + "'");
}

std::map<std::string, Caller> parse_seller_tokens(const std::string& value) {
    std::map<std::string, Caller> tokens;
    for (const auto& entry : split(value, ',')) {
        if (entry.empty()) continue;

        auto fields = split(entry, ':');
        if (fields.size() < 2 || fields.size() > 3 || fields[0].empty() || fields[1].empty()) {
            throw ConfigError("STOREFRONT_SELLER_TOKENS entry must be token:tenant[:caller]");
        }
        Caller caller{fields[1], fields.size() == 3 && !fields[2].empty() ? fields[2] : fields[1]};
        if (!tokens.emplace(fields[0], caller).second) {
            throw ConfigError("STOREFRONT_SELLER_TOKENS has a duplicate token");
        }
    }
    return tokens;
}

Config Config::from_env() {
    return from_lookup([](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (!value) return std::nullopt;
        return std::string(value);
    });
}

Config Config::from_lookup(const Lookup& lookup) {
    Config config;

    if (auto port = lookup("PORT")) {
        parse_integer("PORT", *port, 1, 65535);
        config.port = *port;
    }
    if (auto path = lookup("STOREFRONT_DB_PATH")) {
        if (path->empty()) throw ConfigError("STOREFRONT_DB_PATH must not be empty");
        config.database_path = *path;
    }
    if (auto size = lookup("STOREFRONT_POOL_SIZE")) {
        config.pool_size = static_cast<size_t>(parse_integer("STOREFRONT_POOL_SIZE", *size, 1, 256));
    }
    if (auto prefix = lookup("STOREFRONT_ORDER_PREFIX")) {
        config.order_prefix = *prefix;
    }
    if (auto policy = lookup("STOREFRONT_DECREMENT_POLICY")) {
        config.decrement_policy = parse_decrement_policy(*policy);
    }
    if (auto threshold = lookup("STOREFRONT_LOW_STOCK_THRESHOLD")) {
        config.low_stock_threshold =
            parse_integer("STOREFRONT_LOW_STOCK_THRESHOLD", *threshold, 0, INT32_MAX);
    }
    if (auto timeout = lookup("STOREFRONT_BUSY_TIMEOUT_MS")) {
        config.busy_timeout_ms =
            static_cast<int>(parse_integer("STOREFRONT_BUSY_TIMEOUT_MS", *timeout, 0, 600000));
    }
    if (auto tokens = lookup("STOREFRONT_SELLER_TOKENS")) {
        config.seller_tokens = parse_seller_tokens(*tokens);
    }
    return config;
}

EngineOptions Config::engine_options() const {
    EngineOptions options;
    options.decrement_policy = decrement_policy;
    options.low_stock_threshold = low_stock_threshold;
    return options;
}

} // namespace storefront
