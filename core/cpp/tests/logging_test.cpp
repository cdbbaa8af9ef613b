#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include "storefront/helpers.hpp"
#include "storefront/logging.hpp"
#include "storefront/validation.hpp"

using namespace storefront;

// =============================================================================
// Log Records
// =============================================================================

TEST(LoggingTest, EmitLog_ShouldWriteOneJsonLine) {
    std::ostringstream out;

    detail::emit_log(out, "info", "order_engine", "order_placed",
                     {{"order_number", "TF-20260301-K7QD"}, {"total_cents", 50000}});

    auto line = out.str();
    ASSERT_FALSE(line.empty());
    EXPECT_EQ(line.back(), '\n');
    auto record = nlohmann::json::parse(line);
    EXPECT_EQ(record["level"], "info");
    EXPECT_EQ(record["component"], "order_engine");
    EXPECT_EQ(record["message"], "order_placed");
    EXPECT_EQ(record["order_number"], "TF-20260301-K7QD");
    EXPECT_EQ(record["total_cents"], 50000);
}

TEST(LoggingTest, EmitLog_InvalidUtf8Field_ShouldReplaceNotThrow) {
    // Given a field value with a stray 0xFF byte
    std::ostringstream out;
    nlohmann::json fields = {{"tenant_id", std::string("shop\xff")}};

    // When it is logged
    EXPECT_NO_THROW(detail::emit_log(out, "warn", "order_engine", "rejected", fields));

    // Then the record is still valid JSON with the byte replaced by U+FFFD
    auto record = nlohmann::json::parse(out.str());
    EXPECT_EQ(record["tenant_id"], "shop\xef\xbf\xbd");
}

// =============================================================================
// Text Encoding
// =============================================================================

TEST(Utf8Test, IsValidUtf8_WellFormedText_ShouldPass) {
    EXPECT_TRUE(helpers::is_valid_utf8(""));
    EXPECT_TRUE(helpers::is_valid_utf8("tenant-a"));
    EXPECT_TRUE(helpers::is_valid_utf8("Caf\xc3\xa9"));
    EXPECT_TRUE(helpers::is_valid_utf8("\xe2\x98\x95"));
    EXPECT_TRUE(helpers::is_valid_utf8("\xf0\x9f\x9b\x92"));
}

TEST(Utf8Test, IsValidUtf8_MalformedText_ShouldFail) {
    EXPECT_FALSE(helpers::is_valid_utf8("shop\xff"));
    EXPECT_FALSE(helpers::is_valid_utf8("\xc3"));               // truncated
    EXPECT_FALSE(helpers::is_valid_utf8("\xc3\x28"));           // bad continuation
    EXPECT_FALSE(helpers::is_valid_utf8("\xc0\xaf"));           // overlong
    EXPECT_FALSE(helpers::is_valid_utf8("\xe0\x80\xaf"));       // overlong
    EXPECT_FALSE(helpers::is_valid_utf8("\xed\xa0\x80"));       // surrogate
    EXPECT_FALSE(helpers::is_valid_utf8("\xf4\x90\x80\x80"));   // above U+10FFFF
}

TEST(Utf8Test, RequireUtf8_ShouldNameTheField) {
    try {
        validation::require_utf8(std::string("bad\xff"), "items[0].product_name");
        FAIL() << "Should have thrown ValidationFailedError";
    } catch (const ValidationFailedError& e) {
        EXPECT_EQ(std::string(e.what()), "items[0].product_name must be valid UTF-8");
    }
    EXPECT_NO_THROW(validation::require_utf8(std::optional<std::string>(), "buyer_name"));
}
