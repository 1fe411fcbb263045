#include <gtest/gtest.h>
#include "orderbook.hpp"
#include "log_control.hpp"
#include <atomic>
#include <memory>
#include <thread>
#include <vector>

using namespace perp;

class OrderbookTest : public ::testing::Test {
protected:
    void SetUp() override {
        ScopedCoutSilencer silence(true);
        book = std::make_unique<Orderbook>("BTCUSDT");
    }

    void TearDown() override {
        book.reset();
    }

    static Decimal d(const char* text) {
        return Decimal::parse(text);
    }

    OrderId rest(Side side, const char* price, const char* amount, const std::string& user = "maker") {
        OrderEntry entry;
        entry.id = generate_id();
        entry.user_address = user;
        entry.price = d(price);
        entry.original_amount = d(amount);
        entry.remaining_amount = d(amount);
        entry.side = side;
        entry.timestamp = now_millis();
        book->add_order(entry);
        return entry.id;
    }

    Decimal take(Side side, const char* amount, std::optional<Decimal> limit,
                 std::vector<TradeExecution>& executions) {
        return book->match_order(generate_id(), "taker", side, d(amount), limit, fees, executions);
    }

    std::unique_ptr<Orderbook> book;
    FeeConfig fees;
};

// =============================================================================
// RESTING AND CANCELLING
// =============================================================================

TEST_F(OrderbookTest, EmptyBook) {
    EXPECT_FALSE(book->best_bid());
    EXPECT_FALSE(book->best_ask());
    EXPECT_FALSE(book->spread());
    EXPECT_FALSE(book->last_trade_price());
    EXPECT_EQ(book->order_count(), 0u);
    EXPECT_EQ(book->symbol(), "BTCUSDT");
}

TEST_F(OrderbookTest, BestPricesAndSpread) {
    rest(Side::BUY, "99", "1");
    rest(Side::BUY, "98.5", "1");
    rest(Side::SELL, "101", "1");
    rest(Side::SELL, "102", "1");

    EXPECT_EQ(*book->best_bid(), d("99"));
    EXPECT_EQ(*book->best_ask(), d("101"));
    EXPECT_EQ(*book->spread(), d("2"));
    EXPECT_EQ(book->bid_depth(), 2u);
    EXPECT_EQ(book->ask_depth(), 2u);
    EXPECT_EQ(book->order_count(), 4u);
}

TEST_F(OrderbookTest, CancelIsIdempotent) {
    OrderId id = rest(Side::BUY, "100", "1");
    ASSERT_TRUE(book->has_order(id));

    std::optional<OrderEntry> removed = book->cancel_order(id);
    ASSERT_TRUE(removed);
    EXPECT_EQ(removed->remaining_amount, d("1"));
    EXPECT_FALSE(book->has_order(id));
    EXPECT_EQ(book->bid_depth(), 0u); // Empty level removed

    EXPECT_FALSE(book->cancel_order(id));
    EXPECT_FALSE(book->cancel_order(generate_id()));
}

TEST_F(OrderbookTest, GetOrderReflectsPartialFill) {
    OrderId maker = rest(Side::SELL, "100", "2");
    std::vector<TradeExecution> executions;
    take(Side::BUY, "0.5", std::nullopt, executions);

    std::optional<OrderEntry> entry = book->get_order(maker);
    ASSERT_TRUE(entry);
    EXPECT_EQ(entry->remaining_amount, d("1.5"));
    EXPECT_EQ(entry->original_amount, d("2"));
}

// =============================================================================
// MATCHING
// =============================================================================

TEST_F(OrderbookTest, PriceTimePriority) {
    OrderId first = rest(Side::SELL, "100", "1", "first");
    OrderId second = rest(Side::SELL, "100", "1", "second");
    OrderId better = rest(Side::SELL, "99", "1", "better");

    std::vector<TradeExecution> executions;
    Decimal remaining = take(Side::BUY, "2.5", d("100"), executions);

    ASSERT_EQ(executions.size(), 3u);
    EXPECT_EQ(executions[0].maker_order_id, better);
    EXPECT_EQ(executions[1].maker_order_id, first);
    EXPECT_EQ(executions[2].maker_order_id, second);
    EXPECT_EQ(executions[2].amount, d("0.5"));
    EXPECT_TRUE(remaining.is_zero());

    EXPECT_FALSE(book->has_order(first));
    EXPECT_TRUE(book->has_order(second));
}

TEST_F(OrderbookTest, TradesExecuteAtMakerPrice) {
    rest(Side::BUY, "105", "1");

    std::vector<TradeExecution> executions;
    take(Side::SELL, "1", d("100"), executions);

    ASSERT_EQ(executions.size(), 1u);
    EXPECT_EQ(executions[0].price, d("105"));
    EXPECT_EQ(*book->last_trade_price(), d("105"));
}

TEST_F(OrderbookTest, LimitStopsAtPriceBound) {
    rest(Side::SELL, "100", "1");
    rest(Side::SELL, "101", "1");

    std::vector<TradeExecution> executions;
    Decimal remaining = take(Side::BUY, "5", d("100.5"), executions);

    ASSERT_EQ(executions.size(), 1u);
    for (const auto& trade : executions) {
        EXPECT_LE(trade.price, d("100.5"));
    }
    EXPECT_EQ(remaining, d("4"));
    EXPECT_EQ(*book->best_ask(), d("101"));
}

TEST_F(OrderbookTest, SellLimitWalksBidsDescending) {
    rest(Side::BUY, "98", "1");
    rest(Side::BUY, "100", "1");
    rest(Side::BUY, "99", "1");

    std::vector<TradeExecution> executions;
    Decimal remaining = take(Side::SELL, "3", d("99"), executions);

    ASSERT_EQ(executions.size(), 2u);
    EXPECT_EQ(executions[0].price, d("100"));
    EXPECT_EQ(executions[1].price, d("99"));
    EXPECT_EQ(remaining, d("1"));
    EXPECT_EQ(*book->best_bid(), d("98"));
}

TEST_F(OrderbookTest, MarketOrderExhaustsSide) {
    rest(Side::SELL, "100", "1");
    rest(Side::SELL, "200", "1");

    std::vector<TradeExecution> executions;
    Decimal remaining = take(Side::BUY, "3", std::nullopt, executions);

    EXPECT_EQ(executions.size(), 2u);
    EXPECT_EQ(remaining, d("1"));
    EXPECT_FALSE(book->best_ask());
    EXPECT_EQ(book->order_count(), 0u);
}

TEST_F(OrderbookTest, FeesFromTradeValue) {
    rest(Side::SELL, "100.0", "1.0");

    std::vector<TradeExecution> executions;
    take(Side::BUY, "1.0", d("100.0"), executions);

    ASSERT_EQ(executions.size(), 1u);
    EXPECT_EQ(executions[0].maker_fee, d("0.02"));
    EXPECT_EQ(executions[0].taker_fee, d("0.05"));
    EXPECT_EQ(executions[0].maker_address, "maker");
    EXPECT_EQ(executions[0].taker_address, "taker");
}

TEST_F(OrderbookTest, ConservationOfAmount) {
    rest(Side::SELL, "100", "0.3");
    rest(Side::SELL, "100.5", "0.7");
    rest(Side::SELL, "101", "2");

    std::vector<TradeExecution> executions;
    const Decimal requested = d("1.9");
    Decimal remaining = book->match_order(generate_id(), "taker", Side::BUY, requested,
                                          d("101"), fees, executions);

    Decimal filled;
    for (const auto& trade : executions) {
        filled += trade.amount;
    }
    EXPECT_EQ(filled + remaining, requested);
    EXPECT_TRUE(remaining.is_zero());
}

// =============================================================================
// SNAPSHOTS
// =============================================================================

TEST_F(OrderbookTest, SnapshotAggregatesLevels) {
    rest(Side::BUY, "99", "1");
    rest(Side::BUY, "99", "2.5");
    rest(Side::BUY, "98", "1");
    rest(Side::BUY, "97", "1");
    rest(Side::SELL, "101", "0.5");
    rest(Side::SELL, "102", "0.25");

    OrderbookSnapshot snap = book->snapshot(2);
    EXPECT_EQ(snap.symbol, "BTCUSDT");
    ASSERT_EQ(snap.bids.size(), 2u);
    EXPECT_EQ(snap.bids[0].price, d("99"));
    EXPECT_EQ(snap.bids[0].amount, d("3.5"));
    EXPECT_EQ(snap.bids[1].price, d("98"));
    ASSERT_EQ(snap.asks.size(), 2u);
    EXPECT_EQ(snap.asks[0].price, d("101"));
    EXPECT_EQ(snap.asks[1].amount, d("0.25"));
    EXPECT_FALSE(snap.last_price);
}

TEST_F(OrderbookTest, SnapshotReflectsPartialFills) {
    rest(Side::SELL, "100", "1");
    rest(Side::SELL, "100", "1");

    std::vector<TradeExecution> executions;
    take(Side::BUY, "1.25", std::nullopt, executions);

    OrderbookSnapshot snap = book->snapshot(10);
    ASSERT_EQ(snap.asks.size(), 1u);
    EXPECT_EQ(snap.asks[0].amount, d("0.75"));
    ASSERT_TRUE(snap.last_price);
    EXPECT_EQ(*snap.last_price, d("100"));
}

// =============================================================================
// CONCURRENCY
// =============================================================================

TEST_F(OrderbookTest, ConcurrentCancelAndMatchAgreeOnOutcome) {
    const int orders = 200;
    std::vector<OrderId> ids;
    for (int i = 0; i < orders; ++i) {
        ids.push_back(rest(Side::SELL, "100", "1"));
    }

    std::atomic<int> cancelled{0};
    std::thread canceller([&] {
        for (const auto& id : ids) {
            if (book->cancel_order(id)) {
                cancelled.fetch_add(1);
            }
        }
    });

    std::vector<TradeExecution> executions;
    for (int i = 0; i < orders; ++i) {
        take(Side::BUY, "1", std::nullopt, executions);
    }
    canceller.join();

    // Every maker was either filled or cancelled, never both
    EXPECT_EQ(static_cast<int>(executions.size()) + cancelled.load(), orders);
    EXPECT_EQ(book->order_count(), 0u);
    EXPECT_FALSE(book->best_ask());
}

// =============================================================================
// MAIN TEST RUNNER
// =============================================================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
