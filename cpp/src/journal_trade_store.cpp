#include "journal_trade_store.hpp"
#include "log_control.hpp"
#include <filesystem>
#include <iostream>

namespace perp {

// =============================================================================
// CONSTRUCTOR AND DESTRUCTOR
// =============================================================================

JournalTradeStore::JournalTradeStore(const std::string& path)
    : path_(path)
    , replayed_(0)
    , skipped_(0) {

    namespace fs = std::filesystem;
    fs::path journal(path_);
    if (journal.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(journal.parent_path(), ec);
        if (ec) {
            throw StoreError("Cannot create journal directory " + journal.parent_path().string() + ": " + ec.message());
        }
    }

    replay();

    out_.open(path_, std::ios::out | std::ios::app);
    if (!out_) {
        throw StoreError("Cannot open journal for append: " + path_);
    }

    std::cout << kLogJournal << "Opened " << path_ << " (" << replayed_ << " entries replayed";
    if (skipped_ > 0) {
        std::cout << ", " << skipped_ << " skipped";
    }
    std::cout << ")" << std::endl;
}

JournalTradeStore::~JournalTradeStore() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (out_.is_open()) {
        out_.flush();
        out_.close();
    }
}

// =============================================================================
// REPLAY
// =============================================================================

void JournalTradeStore::replay() {
    std::ifstream in(path_);
    if (!in) {
        return;
    }

    std::string line;
    size_t line_number = 0;
    while (std::getline(in, line)) {
        ++line_number;
        if (line.empty()) {
            continue;
        }
        try {
            const json entry = json::parse(line);
            const std::string op = entry.at("op").get<std::string>();
            const json& data = entry.at("data");

            if (op == "trade") {
                state_.insert_trade(data.get<TradeEvent>());
            } else if (op == "order") {
                state_.upsert_order(data.get<OrderRecord>());
            } else if (op == "fill") {
                state_.apply_maker_fill(data.at("order_id").get<OrderId>(),
                                        data.at("amount").get<Decimal>(),
                                        data.at("timestamp").get<millis_t>());
            } else if (op == "status") {
                state_.update_order_status(data.at("order_id").get<OrderId>(),
                                           data.at("status").get<OrderStatus>(),
                                           data.at("timestamp").get<millis_t>());
            } else if (op == "earning") {
                state_.insert_referral_earning(data.get<ReferralEarning>());
            } else if (op == "batch") {
                TradeBatch batch;
                data.at("trades").get_to(batch.trades);
                data.at("earnings").get_to(batch.earnings);
                state_.write_batch(batch);
            } else {
                throw std::invalid_argument("unknown op " + op);
            }
            ++replayed_;
        } catch (const std::exception& e) {
            std::cerr << kLogJournal << "Skipping entry at " << path_ << ":" << line_number
                      << ": " << e.what() << std::endl;
            ++skipped_;
        }
    }
}

void JournalTradeStore::append(const std::string& op, const json& data) {
    const json entry = {{"op", op}, {"data", data}};
    out_ << entry.dump() << '\n';
    out_.flush();
    if (!out_) {
        throw StoreError("Journal write failed: " + path_);
    }
}

// =============================================================================
// WRITES (journal first, then state)
// =============================================================================

bool JournalTradeStore::insert_trade(const TradeEvent& trade) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (state_.has_trade(trade.trade.trade_id)) {
        return false;
    }
    append("trade", trade);
    return state_.insert_trade(trade);
}

void JournalTradeStore::upsert_order(const OrderRecord& order) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    append("order", order);
    state_.upsert_order(order);
}

bool JournalTradeStore::apply_maker_fill(const OrderId& order_id, const Decimal& amount, millis_t timestamp) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (!state_.get_order(order_id)) {
        return false;
    }
    append("fill", json{{"order_id", order_id}, {"amount", amount}, {"timestamp", timestamp}});
    return state_.apply_maker_fill(order_id, amount, timestamp);
}

bool JournalTradeStore::update_order_status(const OrderId& order_id, OrderStatus status, millis_t timestamp) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (!state_.get_order(order_id)) {
        return false;
    }
    append("status", json{{"order_id", order_id}, {"status", status}, {"timestamp", timestamp}});
    return state_.update_order_status(order_id, status, timestamp);
}

std::optional<uint32_t> JournalTradeStore::find_order_leverage(const OrderId& order_id) const {
    return state_.find_order_leverage(order_id);
}

void JournalTradeStore::insert_referral_earning(const ReferralEarning& earning) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    append("earning", earning);
    state_.insert_referral_earning(earning);
}

size_t JournalTradeStore::write_batch(const TradeBatch& batch) {
    json trades = json::array();
    for (const auto& trade : batch.trades) {
        trades.push_back(trade);
    }
    json earnings = json::array();
    for (const auto& earning : batch.earnings) {
        earnings.push_back(earning);
    }

    std::lock_guard<std::mutex> lock(write_mutex_);
    append("batch", json{{"trades", trades}, {"earnings", earnings}});
    return state_.write_batch(batch);
}

std::vector<OrderRecord> JournalTradeStore::load_open_orders() const {
    return state_.load_open_orders();
}

} // namespace perp
