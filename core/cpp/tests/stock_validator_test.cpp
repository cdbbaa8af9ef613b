#include <gtest/gtest.h>
#include "storefront/stock_validator.hpp"
#include "test_support.hpp"

using namespace storefront;
using storefront::testing::StoreTest;

class StockValidatorTest : public StoreTest {
protected:
    void SetUp() override {
        StoreTest::SetUp();
        validator_ = std::make_unique<StockValidator>(pool());
    }

    StockValidator& validator() { return *validator_; }

private:
    std::unique_ptr<StockValidator> validator_;
};

TEST_F(StockValidatorTest, Validate_WhenEveryLineFits_ShouldBeValid) {
    // Given units with enough stock
    seed_variant("v1", 10);
    seed_variant("v2", 2);

    // When the exact available quantities are requested
    auto check = validator().validate({{"v1", "Red Dress", 10}, {"v2", "Blue Hat", 2}});

    // Then the check passes with no shortfalls
    EXPECT_TRUE(check.valid);
    EXPECT_TRUE(check.shortfalls.empty());
}

TEST_F(StockValidatorTest, Validate_ShouldReportEveryShortLineInInputOrder) {
    // Given one unit with stock 1, one with enough, and one with none
    seed_variant("v1", 1);
    seed_variant("v2", 50);
    seed_variant("v3", 0);

    // When more than available is requested on two lines
    auto check = validator().validate(
        {{"v1", "Red Dress", 3}, {"v2", "Blue Hat", 5}, {"v3", "Green Scarf", 1}});

    // Then both shortfalls are reported, in order, and the sufficient line is not
    EXPECT_FALSE(check.valid);
    ASSERT_EQ(check.shortfalls.size(), 2u);
    EXPECT_EQ(check.shortfalls[0], (StockShortfall{"v1", "Red Dress", 3, 1}));
    EXPECT_EQ(check.shortfalls[1], (StockShortfall{"v3", "Green Scarf", 1, 0}));
}

TEST_F(StockValidatorTest, Validate_MissingUnit_ShouldCountAsZeroAvailable) {
    auto check = validator().validate({{"ghost", "Deleted Item", 1}});

    EXPECT_FALSE(check.valid);
    ASSERT_EQ(check.shortfalls.size(), 1u);
    EXPECT_EQ(check.shortfalls[0].available, 0);
}

TEST_F(StockValidatorTest, Validate_InactiveUnit_ShouldCountAsZeroAvailable) {
    seed_variant("v1", 40, false);

    auto check = validator().validate({{"v1", "Hidden Item", 1}});

    EXPECT_FALSE(check.valid);
    ASSERT_EQ(check.shortfalls.size(), 1u);
    EXPECT_EQ(check.shortfalls[0].available, 0);
}

TEST_F(StockValidatorTest, Validate_ShouldNotChangeStock) {
    seed_variant("v1", 4);

    validator().validate({{"v1", "Red Dress", 3}});
    validator().validate({{"v1", "Red Dress", 9}});

    EXPECT_EQ(stock_of("v1"), 4);
}

TEST_F(StockValidatorTest, Validate_EmptyRequest_ShouldBeValid) {
    auto check = validator().validate({});
    EXPECT_TRUE(check.valid);
}

TEST_F(StockValidatorTest, Validate_NegativeStock_ShouldReportZeroAvailable) {
    // Stock can sit below zero after an oversell under the allow-oversell policy.
    seed_variant("v1", -2);

    auto check = validator().validate({{"v1", "Red Dress", 1}});

    ASSERT_EQ(check.shortfalls.size(), 1u);
    EXPECT_EQ(check.shortfalls[0].available, 0);
}
