#include <gtest/gtest.h>
#include "history_manager.hpp"
#include <memory>

using namespace perp;

class HistoryManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        history = std::make_unique<HistoryManager>(5, 3);
    }

    void TearDown() override {
        history.reset();
    }

    static TradeEvent trade_at(const std::string& symbol, millis_t timestamp) {
        TradeExecution execution;
        execution.trade_id = generate_id();
        execution.price = Decimal(100);
        execution.amount = Decimal(1);
        execution.timestamp = timestamp;
        return TradeEvent(symbol, Side::BUY, execution);
    }

    static OrderRecord order_for(const std::string& user, const std::string& symbol,
                                 OrderStatus status, millis_t created_at) {
        OrderRecord record;
        record.order_id = generate_id();
        record.user_address = user;
        record.symbol = symbol;
        record.price = Decimal(100);
        record.original_amount = Decimal(2);
        record.status = status;
        record.created_at = created_at;
        record.updated_at = created_at;
        return record;
    }

    std::unique_ptr<HistoryManager> history;
};

// =============================================================================
// TRADES
// =============================================================================

TEST_F(HistoryManagerTest, TradesNewestFirstAndBounded) {
    for (millis_t ts = 1; ts <= 8; ++ts) {
        history->record_trade(trade_at("BTCUSDT", ts));
    }
    EXPECT_EQ(history->trade_count("BTCUSDT"), 5u);

    TradeHistoryResponse response = history->get_trades("BTCUSDT", TradeHistoryQuery());
    ASSERT_EQ(response.trades.size(), 5u);
    EXPECT_EQ(response.trades.front().trade.timestamp, 8);
    EXPECT_EQ(response.trades.back().trade.timestamp, 4);
    EXPECT_FALSE(response.has_more);
}

TEST_F(HistoryManagerTest, TradeTimeBoundsAreExclusive) {
    for (millis_t ts = 1; ts <= 5; ++ts) {
        history->record_trade(trade_at("BTCUSDT", ts));
    }
    TradeHistoryQuery query;
    query.after = 1;
    query.before = 5;
    query.limit = 2;

    TradeHistoryResponse response = history->get_trades("BTCUSDT", query);
    EXPECT_EQ(response.total_count, 3u);
    ASSERT_EQ(response.trades.size(), 2u);
    EXPECT_EQ(response.trades[0].trade.timestamp, 4);
    EXPECT_TRUE(response.has_more);
}

TEST_F(HistoryManagerTest, LimitClamped) {
    TradeHistoryQuery query;
    EXPECT_EQ(query.effective_limit(), 50u);
    query.limit = 0;
    EXPECT_EQ(query.effective_limit(), 1u);
    query.limit = 1000;
    EXPECT_EQ(query.effective_limit(), 100u);
}

TEST_F(HistoryManagerTest, UnknownSymbolIsEmpty) {
    TradeHistoryResponse response = history->get_trades("ETHUSDT", TradeHistoryQuery());
    EXPECT_TRUE(response.trades.empty());
    EXPECT_EQ(response.total_count, 0u);
}

// =============================================================================
// ORDERS
// =============================================================================

TEST_F(HistoryManagerTest, RecordOrderUpserts) {
    OrderRecord record = order_for("alice", "BTCUSDT", OrderStatus::OPEN, 10);
    history->record_order(record);
    record.status = OrderStatus::CANCELLED;
    history->record_order(record);

    EXPECT_EQ(history->order_count(), 1u);
    EXPECT_EQ(history->find_order(record.order_id)->status, OrderStatus::CANCELLED);
}

TEST_F(HistoryManagerTest, OldestOrdersEvictedPerUser) {
    OrderRecord oldest = order_for("alice", "BTCUSDT", OrderStatus::OPEN, 1);
    history->record_order(oldest);
    for (millis_t ts = 2; ts <= 4; ++ts) {
        history->record_order(order_for("alice", "BTCUSDT", OrderStatus::OPEN, ts));
    }
    history->record_order(order_for("bob", "BTCUSDT", OrderStatus::OPEN, 5));

    EXPECT_FALSE(history->find_order(oldest.order_id));
    EXPECT_EQ(history->order_count(), 4u);
}

TEST_F(HistoryManagerTest, ApplyFillTracksAverageAndStatus) {
    OrderRecord maker = order_for("alice", "BTCUSDT", OrderStatus::OPEN, 1);
    history->record_order(maker);

    TradeId first = generate_id();
    history->apply_fill(maker.order_id, Decimal(1), Decimal(100), first, 2);
    std::optional<OrderRecord> partial = history->find_order(maker.order_id);
    ASSERT_TRUE(partial);
    EXPECT_EQ(partial->status, OrderStatus::PARTIALLY_FILLED);
    EXPECT_EQ(partial->remaining_amount(), Decimal(1));

    history->apply_fill(maker.order_id, Decimal(1), Decimal(102), generate_id(), 3);
    std::optional<OrderRecord> filled = history->find_order(maker.order_id);
    EXPECT_EQ(filled->status, OrderStatus::FILLED);
    EXPECT_EQ(*filled->average_fill_price, Decimal(101));
    ASSERT_EQ(filled->trade_ids.size(), 2u);
    EXPECT_EQ(filled->trade_ids[0], first);
    EXPECT_EQ(filled->updated_at, 3);

    // Unknown ids are ignored
    history->apply_fill(generate_id(), Decimal(1), Decimal(1), generate_id(), 4);
    EXPECT_FALSE(history->update_status(generate_id(), OrderStatus::CANCELLED, 4));
}

TEST_F(HistoryManagerTest, OrderQueryFilters) {
    history->record_order(order_for("alice", "BTCUSDT", OrderStatus::OPEN, 1));
    history->record_order(order_for("alice", "ETHUSDT", OrderStatus::FILLED, 2));
    history->record_order(order_for("alice", "BTCUSDT", OrderStatus::FILLED, 3));

    OrderHistoryQuery all;
    all.status = "all";
    OrderHistoryResponse everything = history->get_orders("alice", all);
    EXPECT_EQ(everything.total_count, 3u);
    EXPECT_EQ(everything.orders.front().created_at, 3);

    OrderHistoryQuery filled_btc;
    filled_btc.status = "filled";
    filled_btc.symbol = "BTCUSDT";
    OrderHistoryResponse narrowed = history->get_orders("alice", filled_btc);
    ASSERT_EQ(narrowed.orders.size(), 1u);
    EXPECT_EQ(narrowed.orders[0].created_at, 3);

    OrderHistoryQuery window;
    window.after = 1;
    window.limit = 1;
    OrderHistoryResponse paged = history->get_orders("alice", window);
    EXPECT_EQ(paged.total_count, 2u);
    EXPECT_EQ(paged.orders.size(), 1u);
    EXPECT_TRUE(paged.has_more);

    EXPECT_EQ(history->get_orders("nobody", all).total_count, 0u);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
