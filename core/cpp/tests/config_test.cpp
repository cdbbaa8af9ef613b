#include <gtest/gtest.h>
#include <map>
#include <string>
#include "storefront/config.hpp"
#include "storefront/errors.hpp"

using namespace storefront;

namespace {

Config::Lookup lookup_from(std::map<std::string, std::string> vars) {
    return [vars](const std::string& name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end()) return std::nullopt;
        return it->second;
    };
}

}  // namespace

// =============================================================================
// Defaults
// =============================================================================

TEST(ConfigTest, FromLookup_NothingSet_ShouldUseDefaults) {
    auto config = Config::from_lookup(lookup_from({}));

    EXPECT_EQ(config.port, "50051");
    EXPECT_EQ(config.database_path, "storefront.db");
    EXPECT_EQ(config.pool_size, 4u);
    EXPECT_EQ(config.order_prefix, "TF");
    EXPECT_EQ(config.decrement_policy, DecrementPolicy::RejectOversell);
    EXPECT_EQ(config.low_stock_threshold, 5);
    EXPECT_EQ(config.busy_timeout_ms, 5000);
    EXPECT_TRUE(config.seller_tokens.empty());
}

TEST(ConfigTest, FromLookup_AllSet_ShouldOverrideDefaults) {
    auto config = Config::from_lookup(lookup_from({
        {"PORT", "6000"},
        {"STOREFRONT_DB_PATH", "/var/lib/storefront/orders.db"},
        {"STOREFRONT_POOL_SIZE", "8"},
        {"STOREFRONT_ORDER_PREFIX", "SHOP"},
        {"STOREFRONT_DECREMENT_POLICY", "allow-oversell"},
        {"STOREFRONT_LOW_STOCK_THRESHOLD", "2"},
        {"STOREFRONT_BUSY_TIMEOUT_MS", "250"},
        {"STOREFRONT_SELLER_TOKENS", "tok1:tenant-a,tok2:tenant-b:alice"},
    }));

    EXPECT_EQ(config.port, "6000");
    EXPECT_EQ(config.database_path, "/var/lib/storefront/orders.db");
    EXPECT_EQ(config.pool_size, 8u);
    EXPECT_EQ(config.order_prefix, "SHOP");
    EXPECT_EQ(config.decrement_policy, DecrementPolicy::AllowOversell);
    EXPECT_EQ(config.low_stock_threshold, 2);
    EXPECT_EQ(config.busy_timeout_ms, 250);
    ASSERT_EQ(config.seller_tokens.size(), 2u);
    EXPECT_EQ(config.seller_tokens.at("tok1").tenant_id, "tenant-a");
    EXPECT_EQ(config.seller_tokens.at("tok1").caller_id, "tenant-a");
    EXPECT_EQ(config.seller_tokens.at("tok2").caller_id, "alice");
}

TEST(ConfigTest, EngineOptions_ShouldCarryPolicyAndThreshold) {
    auto config = Config::from_lookup(lookup_from({
        {"STOREFRONT_DECREMENT_POLICY", "allow-oversell"},
        {"STOREFRONT_LOW_STOCK_THRESHOLD", "0"},
    }));

    auto options = config.engine_options();
    EXPECT_EQ(options.decrement_policy, DecrementPolicy::AllowOversell);
    EXPECT_EQ(options.low_stock_threshold, 0);
}

// =============================================================================
// Invalid Values
// =============================================================================

TEST(ConfigTest, FromLookup_NonNumericPort_ShouldThrowConfigError) {
    EXPECT_THROW(Config::from_lookup(lookup_from({{"PORT", "http"}})), ConfigError);
    EXPECT_THROW(Config::from_lookup(lookup_from({{"PORT", "70000"}})), ConfigError);
    EXPECT_THROW(Config::from_lookup(lookup_from({{"PORT", "80x"}})), ConfigError);
}

TEST(ConfigTest, FromLookup_ZeroPoolSize_ShouldThrowConfigError) {
    EXPECT_THROW(Config::from_lookup(lookup_from({{"STOREFRONT_POOL_SIZE", "0"}})), ConfigError);
}

TEST(ConfigTest, FromLookup_NegativeThreshold_ShouldThrowConfigError) {
    EXPECT_THROW(Config::from_lookup(lookup_from({{"STOREFRONT_LOW_STOCK_THRESHOLD", "-1"}})),
                 ConfigError);
}

TEST(ConfigTest, FromLookup_EmptyDatabasePath_ShouldThrowConfigError) {
    EXPECT_THROW(Config::from_lookup(lookup_from({{"STOREFRONT_DB_PATH", ""}})), ConfigError);
}

TEST(ConfigTest, ParseDecrementPolicy_UnknownValue_ShouldThrowConfigError) {
    EXPECT_EQ(parse_decrement_policy("reject-oversell"), DecrementPolicy::RejectOversell);
    EXPECT_THROW(parse_decrement_policy("oversell"), ConfigError);
    EXPECT_THROW(parse_decrement_policy("REJECT-OVERSELL"), ConfigError);
}

TEST(ConfigTest, ParseSellerTokens_MalformedEntry_ShouldThrowConfigError) {
    EXPECT_THROW(parse_seller_tokens("just-a-token"), ConfigError);
    EXPECT_THROW(parse_seller_tokens(":tenant-a"), ConfigError);
    EXPECT_THROW(parse_seller_tokens("tok:"), ConfigError);
    EXPECT_THROW(parse_seller_tokens("tok:a:b:c"), ConfigError);
}

TEST(ConfigTest, ParseSellerTokens_DuplicateToken_ShouldThrowConfigError) {
    EXPECT_THROW(parse_seller_tokens("tok:tenant-a,tok:tenant-b"), ConfigError);
}

TEST(ConfigTest, ParseSellerTokens_ShouldSkipEmptyEntries) {
    auto tokens = parse_seller_tokens("tok:tenant-a,,");
    EXPECT_EQ(tokens.size(), 1u);
}
