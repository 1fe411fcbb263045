#pragma once

#include "in_memory_store.hpp"
#include "json_codec.hpp"
#include <fstream>
#include <mutex>
#include <string>

namespace perp {

/**
 * Append-only JSON-lines TradeStore.
 *
 * Every write is appended to the journal before it is applied to the
 * in-memory state, and the whole journal is replayed when the store is
 * opened, so open orders survive a restart. Each batch is a single line.
 */
class JournalTradeStore : public TradeStore {
public:
    /**
     * Opens (creating if needed) and replays `path`.
     * Throws StoreError when the file cannot be opened for append.
     */
    explicit JournalTradeStore(const std::string& path);
    ~JournalTradeStore() override;

    JournalTradeStore(const JournalTradeStore&) = delete;
    JournalTradeStore& operator=(const JournalTradeStore&) = delete;

    bool insert_trade(const TradeEvent& trade) override;
    void upsert_order(const OrderRecord& order) override;
    bool apply_maker_fill(const OrderId& order_id, const Decimal& amount, millis_t timestamp) override;
    bool update_order_status(const OrderId& order_id, OrderStatus status, millis_t timestamp) override;
    std::optional<uint32_t> find_order_leverage(const OrderId& order_id) const override;
    void insert_referral_earning(const ReferralEarning& earning) override;
    size_t write_batch(const TradeBatch& batch) override;
    std::vector<OrderRecord> load_open_orders() const override;

    const InMemoryTradeStore& state() const { return state_; }
    size_t replayed_entries() const { return replayed_; }
    size_t skipped_entries() const { return skipped_; }
    const std::string& path() const { return path_; }

private:
    void replay();
    void append(const std::string& op, const nlohmann::json& data);

    std::string path_;
    std::ofstream out_;
    std::mutex write_mutex_;
    InMemoryTradeStore state_;
    size_t replayed_;
    size_t skipped_;
};

} // namespace perp
