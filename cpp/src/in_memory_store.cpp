#include "in_memory_store.hpp"
#include "json_codec.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace perp {

namespace {

std::string lowercase(const std::string& text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

// =============================================================================
// IN-MEMORY TRADE STORE
// =============================================================================

void InMemoryTradeStore::check_writable() const {
    if (fail_writes_.load()) {
        throw StoreError("trade store unavailable");
    }
}

bool InMemoryTradeStore::insert_trade(const TradeEvent& trade) {
    check_writable();
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto inserted = trades_.emplace(trade.trade.trade_id, trade);
    if (!inserted.second) {
        return false;
    }
    trade_order_.push_back(trade.trade.trade_id);
    return true;
}

void InMemoryTradeStore::upsert_order(const OrderRecord& order) {
    check_writable();
    std::unique_lock<std::shared_mutex> lock(mutex_);
    orders_[order.order_id] = order;
}

bool InMemoryTradeStore::apply_maker_fill(const OrderId& order_id, const Decimal& amount, millis_t timestamp) {
    check_writable();
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = orders_.find(order_id);
    if (it == orders_.end()) {
        return false;
    }
    OrderRecord& order = it->second;
    order.filled_amount += amount;
    order.status = order.filled_amount >= order.original_amount
        ? OrderStatus::FILLED
        : OrderStatus::PARTIALLY_FILLED;
    order.updated_at = timestamp;
    return true;
}

bool InMemoryTradeStore::update_order_status(const OrderId& order_id, OrderStatus status, millis_t timestamp) {
    check_writable();
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = orders_.find(order_id);
    if (it == orders_.end()) {
        return false;
    }
    it->second.status = status;
    it->second.updated_at = timestamp;
    return true;
}

std::optional<uint32_t> InMemoryTradeStore::find_order_leverage(const OrderId& order_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = orders_.find(order_id);
    if (it == orders_.end()) {
        return std::nullopt;
    }
    return it->second.leverage;
}

void InMemoryTradeStore::insert_referral_earning(const ReferralEarning& earning) {
    check_writable();
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (earning_ids_.insert(earning.id).second) {
        earnings_.push_back(earning);
    }
}

size_t InMemoryTradeStore::write_batch(const TradeBatch& batch) {
    // Checked before any mutation so a failed batch leaves nothing behind
    check_writable();
    std::unique_lock<std::shared_mutex> lock(mutex_);

    size_t inserted = 0;
    for (const auto& trade : batch.trades) {
        if (trades_.emplace(trade.trade.trade_id, trade).second) {
            trade_order_.push_back(trade.trade.trade_id);
            ++inserted;
        }
    }
    for (const auto& earning : batch.earnings) {
        if (earning_ids_.insert(earning.id).second) {
            earnings_.push_back(earning);
        }
    }
    return inserted;
}

std::vector<OrderRecord> InMemoryTradeStore::load_open_orders() const {
    std::vector<OrderRecord> open;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& entry : orders_) {
            const OrderRecord& order = entry.second;
            if (order.status == OrderStatus::OPEN || order.status == OrderStatus::PARTIALLY_FILLED) {
                open.push_back(order);
            }
        }
    }
    std::stable_sort(open.begin(), open.end(), [](const OrderRecord& a, const OrderRecord& b) {
        return a.created_at < b.created_at;
    });
    return open;
}

bool InMemoryTradeStore::has_trade(const TradeId& trade_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return trades_.count(trade_id) > 0;
}

std::optional<TradeEvent> InMemoryTradeStore::get_trade(const TradeId& trade_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = trades_.find(trade_id);
    if (it == trades_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<OrderRecord> InMemoryTradeStore::get_order(const OrderId& order_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = orders_.find(order_id);
    if (it == orders_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<ReferralEarning> InMemoryTradeStore::referral_earnings() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return earnings_;
}

size_t InMemoryTradeStore::trade_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return trades_.size();
}

size_t InMemoryTradeStore::order_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return orders_.size();
}

// =============================================================================
// REFERRAL DIRECTORY
// =============================================================================

void InMemoryReferralDirectory::add_referral(const std::string& referee_address,
                                             const std::string& referrer_address,
                                             const Decimal& commission_rate) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    referrers_[lowercase(referee_address)] = Referrer{referrer_address, commission_rate};
}

size_t InMemoryReferralDirectory::load_from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open referral file: " + path);
    }

    json document;
    try {
        in >> document;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Malformed referral file " + path + ": " + e.what());
    }
    if (!document.is_array()) {
        throw std::runtime_error("Referral file must contain a JSON array: " + path);
    }

    size_t loaded = 0;
    for (const auto& row : document) {
        try {
            add_referral(row.at("referee").get<std::string>(),
                         row.at("referrer").get<std::string>(),
                         row.at("commission_rate").get<Decimal>());
            ++loaded;
        } catch (const std::exception& e) {
            throw std::runtime_error("Bad referral row in " + path + ": " + e.what());
        }
    }
    return loaded;
}

std::optional<Referrer> InMemoryReferralDirectory::find_referrer(const std::string& user_address) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = referrers_.find(lowercase(user_address));
    if (it == referrers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t InMemoryReferralDirectory::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return referrers_.size();
}

// =============================================================================
// POSITION LEDGER
// =============================================================================

void PositionLedger::increase_position(const std::string& user_address,
                                       const std::string& symbol,
                                       PositionSide side,
                                       const Decimal& collateral,
                                       uint32_t leverage,
                                       const Decimal& price,
                                       bool skip_min_size) {
    if (!price.is_positive() || leverage == 0) {
        throw std::invalid_argument("Position increase needs a positive price and leverage");
    }
    if (!skip_min_size && collateral < Decimal(MIN_POSITION_COLLATERAL)) {
        throw std::invalid_argument("Position collateral below minimum: " + collateral.to_string());
    }

    const Decimal added_size = collateral * Decimal(static_cast<int64_t>(leverage)) / price;

    std::lock_guard<std::mutex> lock(mutex_);
    PositionState& position = positions_[Key(user_address, symbol, side)];
    const Decimal new_size = position.size + added_size;
    if (new_size.is_positive()) {
        position.entry_price = (position.entry_price * position.size + price * added_size) / new_size;
    }
    position.size = new_size;
    position.collateral += collateral;
    position.leverage = leverage;
    ++position.increases;
    ++increase_count_;
}

std::optional<PositionState> PositionLedger::get_position(const std::string& user_address,
                                                          const std::string& symbol,
                                                          PositionSide side) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(Key(user_address, symbol, side));
    if (it == positions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t PositionLedger::position_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return positions_.size();
}

size_t PositionLedger::increase_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return increase_count_;
}

} // namespace perp
