#include <gtest/gtest.h>
#include <atomic>
#include <future>
#include <thread>
#include <vector>
#include "storefront/errors.hpp"
#include "storefront/order_engine.hpp"
#include "test_support.hpp"

using namespace storefront;
using storefront::testing::RecordingSink;
using storefront::testing::StoreTest;
using storefront::testing::make_cart;
using storefront::testing::make_line;

/**
 * Two buyers race for the last unit. Each cart passes the stock pre-check
 * before either commits; the decrement policy decides what happens next.
 */
class OversellTest : public StoreTest {
protected:
    void SetUp() override {
        StoreTest::SetUp();
        validator_ = std::make_unique<StockValidator>(pool());
        numbers_ = std::make_unique<OrderNumberGenerator>("TF");
        seed_variant("last-one", 1);
    }

    OrderEngine make_engine(DecrementPolicy policy) {
        EngineOptions options;
        options.decrement_policy = policy;
        return OrderEngine(pool(), *validator_, *numbers_, sink_, options);
    }

    Cart buyer_cart() { return make_cart("tenant-a", {make_line("last-one", 9900, 1, "Vase")}); }

    RecordingSink sink_;
    std::unique_ptr<StockValidator> validator_;
    std::unique_ptr<OrderNumberGenerator> numbers_;
};

TEST_F(OversellTest, AllowOversell_BothPrecheckedCheckouts_ShouldSucceedAndDriveStockNegative) {
    // Given both buyers have passed the pre-check against stock 1
    auto engine = make_engine(DecrementPolicy::AllowOversell);
    ASSERT_TRUE(validator_->validate({{"last-one", "Vase", 1}}).valid);
    ASSERT_TRUE(validator_->validate({{"last-one", "Vase", 1}}).valid);

    // When both commit
    auto first = engine.place(buyer_cart());
    auto second = engine.place(buyer_cart());

    // Then both orders exist and stock is oversold
    EXPECT_NE(first.order_number, second.order_number);
    EXPECT_EQ(count("SELECT COUNT(*) FROM orders"), 2);
    EXPECT_EQ(stock_of("last-one"), -1);
}

TEST_F(OversellTest, RejectOversell_BothPrecheckedCheckouts_ShouldCommitOnlyOne) {
    // Given both buyers have passed the pre-check against stock 1
    auto engine = make_engine(DecrementPolicy::RejectOversell);
    ASSERT_TRUE(validator_->validate({{"last-one", "Vase", 1}}).valid);
    ASSERT_TRUE(validator_->validate({{"last-one", "Vase", 1}}).valid);

    // When both commit
    engine.place(buyer_cart());
    try {
        engine.place(buyer_cart());
        FAIL() << "Should have thrown InsufficientStockError";
    } catch (const InsufficientStockError& e) {
        // Then the second is refused with the unit's current stock
        ASSERT_EQ(e.shortfalls().size(), 1u);
        EXPECT_EQ(e.shortfalls()[0].available, 0);
        EXPECT_EQ(e.shortfalls()[0].product_name, "Vase");
    }

    EXPECT_EQ(count("SELECT COUNT(*) FROM orders"), 1);
    EXPECT_EQ(stock_of("last-one"), 0);
}

TEST_F(OversellTest, RejectOversell_ConcurrentCheckouts_ShouldNeverGoNegative) {
    // Given several buyers released at the same moment
    constexpr int kBuyers = 4;
    auto engine = make_engine(DecrementPolicy::RejectOversell);

    std::promise<void> start;
    auto gate = start.get_future().share();
    std::atomic<int> succeeded{0};
    std::atomic<int> refused{0};
    std::atomic<int> other{0};

    std::vector<std::thread> buyers;
    for (int i = 0; i < kBuyers; ++i) {
        buyers.emplace_back([&] {
            gate.wait();
            try {
                engine.checkout(buyer_cart());
                ++succeeded;
            } catch (const InsufficientStockError&) {
                ++refused;
            } catch (const OrderError&) {
                ++other;
            }
        });
    }

    // When they all check out for the last unit
    start.set_value();
    for (auto& buyer : buyers) buyer.join();

    // Then exactly one order is placed and stock stops at zero
    EXPECT_EQ(succeeded.load(), 1);
    EXPECT_EQ(refused.load(), kBuyers - 1);
    EXPECT_EQ(other.load(), 0);
    EXPECT_EQ(count("SELECT COUNT(*) FROM orders"), 1);
    EXPECT_EQ(count("SELECT COUNT(*) FROM order_items"), 1);
    EXPECT_EQ(stock_of("last-one"), 0);
}

TEST_F(OversellTest, ConcurrentCheckouts_ShouldKeepEveryOrderWhole) {
    // Given plenty of stock and many parallel multi-line checkouts
    seed_variant("a", 1000);
    seed_variant("b", 1000);
    auto engine = make_engine(DecrementPolicy::RejectOversell);

    constexpr int kThreads = 4;
    constexpr int kPerThread = 10;
    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < kPerThread; ++i) {
                try {
                    engine.checkout(make_cart("tenant-a", {make_line("a", 100, 2), make_line("b", 50, 3)}));
                } catch (const OrderError&) {
                    ++failures;
                }
            }
        });
    }
    for (auto& thread : threads) thread.join();

    // Then every order has both lines and stock matches the orders placed
    EXPECT_EQ(failures.load(), 0);
    auto orders = count("SELECT COUNT(*) FROM orders");
    EXPECT_EQ(orders, kThreads * kPerThread);
    EXPECT_EQ(count("SELECT COUNT(*) FROM order_items"), orders * 2);
    EXPECT_EQ(count("SELECT COUNT(*) FROM orders o WHERE "
                    "(SELECT COUNT(*) FROM order_items i WHERE i.order_id = o.id) != 2"), 0);
    EXPECT_EQ(stock_of("a"), 1000 - 2 * orders);
    EXPECT_EQ(stock_of("b"), 1000 - 3 * orders);
}
