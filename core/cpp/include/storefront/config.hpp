#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include "order_engine.hpp"
#include "types.hpp"

namespace storefront {

/**
 * Server settings, read once at startup from the environment.
 *
 *   PORT                            gRPC listen port (50051)
 *   STOREFRONT_DB_PATH              SQLite database file (storefront.db)
 *   STOREFRONT_POOL_SIZE            store connections (4)
 *   STOREFRONT_ORDER_PREFIX         order number prefix (TF)
 *   STOREFRONT_DECREMENT_POLICY     reject-oversell | allow-oversell
 *   STOREFRONT_LOW_STOCK_THRESHOLD  low-stock alert level (5)
 *   STOREFRONT_BUSY_TIMEOUT_MS      store lock wait (5000)
 *   STOREFRONT_SELLER_TOKENS        token:tenant[:caller],...
 */
struct Config {
    std::string port = "50051";
    std::string database_path = "storefront.db";
    size_t pool_size = 4;
    std::string order_prefix = "TF";
    DecrementPolicy decrement_policy = DecrementPolicy::RejectOversell;
    int64_t low_stock_threshold = 5;
    int busy_timeout_ms = 5000;
    std::map<std::string, Caller> seller_tokens;

    using Lookup = std::function<std::optional<std::string>(const std::string&)>;

    /**
     * Build from the process environment.
     * @throws ConfigError for any malformed value
     */
    static Config from_env();

    /**
     * Build from an arbitrary variable lookup; unset variables keep defaults.
     * @throws ConfigError for any malformed value
     */
    static Config from_lookup(const Lookup& lookup);

    EngineOptions engine_options() const;
};

/**
 * Parse "reject-oversell" or "allow-oversell".
 * @throws ConfigError for anything else
 */
DecrementPolicy parse_decrement_policy(const std::string& value);

/**
 * Parse "token:tenant[:caller]" entries separated by commas. The caller id
 * defaults to the tenant id.
 * @throws ConfigError for malformed or duplicate entries
 */
std::map<std::string, Caller> parse_seller_tokens(const std::string& value);

} // namespace storefront
