#include <gtest/gtest.h>
#include <algorithm>
#include <set>
#include <string>
#include <vector>
#include "storefront/errors.hpp"
#include "storefront/order_number.hpp"
#include "test_support.hpp"

using namespace storefront;
using storefront::testing::StoreTest;
using storefront::testing::utc;

namespace {

/// Token source that replays a fixed script, repeating the last entry.
OrderNumberGenerator::TokenSource scripted(std::vector<std::string> tokens, int* calls) {
    return [tokens, calls]() {
        size_t index = static_cast<size_t>(*calls);
        ++*calls;
        return tokens[std::min(index, tokens.size() - 1)];
    };
}

}  // namespace

class OrderNumberTest : public StoreTest {
protected:
    void persist(const std::string& order_number) {
        auto lease = pool().acquire();
        auto stmt = lease->prepare(
            "INSERT INTO orders (order_number, tenant_id, total_cents, item_count, status, "
            "created_at, updated_at) VALUES (?1, 'tenant-a', 0, 0, 'PENDING', 0, 0)");
        stmt.bind(1, order_number);
        stmt.run();
    }
};

// =============================================================================
// Format
// =============================================================================

TEST(OrderNumberFormatTest, Generate_ShouldUsePrefixUtcDateAndSuffix) {
    // Given a generator with the default prefix
    OrderNumberGenerator numbers("TF");

    // When a number is generated for 2026-03-01
    auto number = numbers.generate(utc(2026, 3, 1, 12, 0, 0));

    // Then it has the shape TF-20260301-XXXX
    EXPECT_EQ(number.substr(0, 12), "TF-20260301-");
    EXPECT_EQ(number.size(), 16u);
    EXPECT_TRUE(OrderNumberGenerator::is_well_formed(number));
}

TEST(OrderNumberFormatTest, Generate_ShouldNeverUseLookAlikeCharacters) {
    OrderNumberGenerator numbers("TF");
    for (int i = 0; i < 2000; ++i) {
        auto suffix = numbers.generate(utc(2026, 3, 1)).substr(12);
        EXPECT_EQ(suffix.find_first_of("0O1I"), std::string::npos) << suffix;
        EXPECT_EQ(suffix.find_first_not_of(OrderNumberGenerator::kAlphabet), std::string::npos)
            << suffix;
    }
}

TEST(OrderNumberFormatTest, Alphabet_ShouldHaveThirtyTwoSymbols) {
    EXPECT_EQ(std::string(OrderNumberGenerator::kAlphabet).size(), 32u);
}

TEST(OrderNumberFormatTest, Constructor_WithMalformedPrefix_ShouldThrowConfigError) {
    EXPECT_THROW(OrderNumberGenerator(""), ConfigError);
    EXPECT_THROW(OrderNumberGenerator("tf"), ConfigError);
    EXPECT_THROW(OrderNumberGenerator("T-F"), ConfigError);
    EXPECT_NO_THROW(OrderNumberGenerator("SHOP2"));
}

TEST(OrderNumberFormatTest, IsWellFormed_ShouldRejectMalformedNumbers) {
    EXPECT_TRUE(OrderNumberGenerator::is_well_formed("TF-20260301-K7QD"));
    EXPECT_FALSE(OrderNumberGenerator::is_well_formed("TF-20260301-K7Q"));
    EXPECT_FALSE(OrderNumberGenerator::is_well_formed("TF-2026031-K7QD"));
    EXPECT_FALSE(OrderNumberGenerator::is_well_formed("TF-20260301-K7Q0"));
    EXPECT_FALSE(OrderNumberGenerator::is_well_formed("tf-20260301-K7QD"));
    EXPECT_FALSE(OrderNumberGenerator::is_well_formed("-20260301-K7QD"));
    EXPECT_FALSE(OrderNumberGenerator::is_well_formed(""));
}

TEST(OrderNumberFormatTest, Generate_ShouldUseUtcCalendarDate) {
    // 23:30 UTC is already the next day in UTC+2, but the number follows UTC.
    OrderNumberGenerator numbers("TF");
    auto number = numbers.generate(utc(2026, 12, 31, 23, 30, 0));
    EXPECT_EQ(number.substr(3, 8), "20261231");
}

// =============================================================================
// Allocation
// =============================================================================

TEST_F(OrderNumberTest, Allocate_WhenFirstCandidateIsFree_ShouldReturnIt) {
    int calls = 0;
    OrderNumberGenerator numbers("TF", scripted({"K7QD"}, &calls));

    auto lease = pool().acquire();
    auto number = numbers.allocate(*lease, utc(2026, 3, 1));

    EXPECT_EQ(number, "TF-20260301-K7QD");
    EXPECT_EQ(calls, 1);
}

TEST_F(OrderNumberTest, Allocate_AfterTwoCollisions_ShouldSucceedOnThirdAttempt) {
    // Given TF-20260301-AAAA is already taken
    persist("TF-20260301-AAAA");
    int calls = 0;
    OrderNumberGenerator numbers("TF", scripted({"AAAA", "AAAA", "BBBB"}, &calls));

    // When a number is allocated
    auto lease = pool().acquire();
    auto number = numbers.allocate(*lease, utc(2026, 3, 1));

    // Then the third candidate is used
    EXPECT_EQ(number, "TF-20260301-BBBB");
    EXPECT_EQ(calls, 3);
}

TEST_F(OrderNumberTest, Allocate_WhenEveryCandidateCollides_ShouldThrowAfterFiveAttempts) {
    // Given a source that always yields a taken suffix
    persist("TF-20260301-AAAA");
    int calls = 0;
    OrderNumberGenerator numbers("TF", scripted({"AAAA"}, &calls));

    // When allocation is attempted
    auto lease = pool().acquire();
    try {
        numbers.allocate(*lease, utc(2026, 3, 1));
        FAIL() << "Should have thrown IdentifierExhaustedError";
    } catch (const IdentifierExhaustedError& e) {
        // Then exactly five candidates were tried
        EXPECT_EQ(e.attempts(), 5);
        EXPECT_TRUE(e.is_transient());
    }
    EXPECT_EQ(calls, 5);
}

TEST_F(OrderNumberTest, Allocate_SameSuffixOnDifferentDay_ShouldNotCollide) {
    persist("TF-20260301-AAAA");
    int calls = 0;
    OrderNumberGenerator numbers("TF", scripted({"AAAA"}, &calls));

    auto lease = pool().acquire();
    EXPECT_EQ(numbers.allocate(*lease, utc(2026, 3, 2)), "TF-20260302-AAAA");
}

TEST_F(OrderNumberTest, Allocate_TenThousandInOneDay_ShouldAllBeDistinct) {
    // Given the random source and one calendar day
    OrderNumberGenerator numbers("TF");
    auto day = utc(2026, 3, 1, 9, 0, 0);

    // When 10,000 numbers are allocated and persisted
    std::set<std::string> seen;
    {
        auto lease = pool().acquire();
        db::Transaction tx(*lease);
        auto insert = lease->prepare(
            "INSERT INTO orders (order_number, tenant_id, total_cents, item_count, status, "
            "created_at, updated_at) VALUES (?1, 'tenant-a', 0, 0, 'PENDING', 0, 0)");
        for (int i = 0; i < 10000; ++i) {
            auto number = numbers.allocate(*lease, day);
            insert.bind(1, number);
            insert.run();
            insert.reset();
            seen.insert(number);
        }
        tx.commit();
    }

    // Then all are distinct and persisted
    EXPECT_EQ(seen.size(), 10000u);
    EXPECT_EQ(count("SELECT COUNT(DISTINCT order_number) FROM orders"), 10000);
}
