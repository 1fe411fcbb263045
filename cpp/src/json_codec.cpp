#include "json_codec.hpp"
#include <stdexcept>

namespace nlohmann {

void adl_serializer<boost::uuids::uuid>::to_json(json& j, const boost::uuids::uuid& id) {
    j = perp::id_to_string(id);
}

void adl_serializer<boost::uuids::uuid>::from_json(const json& j, boost::uuids::uuid& id) {
    id = perp::parse_id(j.get<std::string>());
}

} // namespace nlohmann

namespace perp {

namespace {

json optional_decimal(const std::optional<Decimal>& value) {
    return value ? json(*value) : json(nullptr);
}

std::optional<Decimal> read_optional_decimal(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<Decimal>();
}

json encode_levels(const std::vector<LevelSummary>& levels) {
    json out = json::array();
    for (const auto& level : levels) {
        out.push_back(level);
    }
    return out;
}

} // namespace

// =============================================================================
// SCALARS
// =============================================================================

void to_json(json& j, const Decimal& value) {
    j = value.to_string();
}

void from_json(const json& j, Decimal& value) {
    if (j.is_string()) {
        value = Decimal::parse(j.get<std::string>());
    } else if (j.is_number_integer()) {
        value = Decimal(j.get<int64_t>());
    } else {
        throw std::invalid_argument("Decimal must be encoded as a string: " + j.dump());
    }
}

void to_json(json& j, Side side) {
    j = side_to_string(side);
}

void from_json(const json& j, Side& side) {
    side = parse_side(j.get<std::string>());
}

void to_json(json& j, OrderType type) {
    j = order_type_to_string(type);
}

void from_json(const json& j, OrderType& type) {
    type = parse_order_type(j.get<std::string>());
}

void to_json(json& j, OrderStatus status) {
    j = status_to_string(status);
}

void from_json(const json& j, OrderStatus& status) {
    status = parse_status(j.get<std::string>());
}

void to_json(json& j, const LevelSummary& level) {
    j = json::array({level.price.to_string(), level.amount.to_string()});
}

void from_json(const json& j, LevelSummary& level) {
    if (!j.is_array() || j.size() != 2) {
        throw std::invalid_argument("Book level must be a [price, amount] pair: " + j.dump());
    }
    level.price = j.at(0).get<Decimal>();
    level.amount = j.at(1).get<Decimal>();
}

// =============================================================================
// TRADES
// =============================================================================

void to_json(json& j, const TradeExecution& trade) {
    j = json{
        {"trade_id", trade.trade_id},
        {"maker_order_id", trade.maker_order_id},
        {"taker_order_id", trade.taker_order_id},
        {"maker_address", trade.maker_address},
        {"taker_address", trade.taker_address},
        {"price", trade.price},
        {"amount", trade.amount},
        {"maker_fee", trade.maker_fee},
        {"taker_fee", trade.taker_fee},
        {"timestamp", trade.timestamp}
    };
}

void from_json(const json& j, TradeExecution& trade) {
    j.at("trade_id").get_to(trade.trade_id);
    j.at("maker_order_id").get_to(trade.maker_order_id);
    j.at("taker_order_id").get_to(trade.taker_order_id);
    j.at("maker_address").get_to(trade.maker_address);
    j.at("taker_address").get_to(trade.taker_address);
    j.at("price").get_to(trade.price);
    j.at("amount").get_to(trade.amount);
    j.at("maker_fee").get_to(trade.maker_fee);
    j.at("taker_fee").get_to(trade.taker_fee);
    j.at("timestamp").get_to(trade.timestamp);
}

void to_json(json& j, const TradeEvent& event) {
    j = event.trade;
    j["symbol"] = event.symbol;
    j["side"] = event.side;
}

void from_json(const json& j, TradeEvent& event) {
    j.get_to(event.trade);
    j.at("symbol").get_to(event.symbol);
    j.at("side").get_to(event.side);
}

// =============================================================================
// BOOK VIEWS
// =============================================================================

void to_json(json& j, const OrderbookSnapshot& snapshot) {
    j = json{
        {"symbol", snapshot.symbol},
        {"bids", encode_levels(snapshot.bids)},
        {"asks", encode_levels(snapshot.asks)},
        {"last_price", optional_decimal(snapshot.last_price)},
        {"timestamp", snapshot.timestamp}
    };
}

void to_json(json& j, const OrderbookUpdate& update) {
    j = json{
        {"symbol", update.symbol},
        {"bids", encode_levels(update.bids)},
        {"asks", encode_levels(update.asks)},
        {"timestamp", update.timestamp}
    };
}

void from_json(const json& j, OrderbookUpdate& update) {
    j.at("symbol").get_to(update.symbol);
    j.at("bids").get_to(update.bids);
    j.at("asks").get_to(update.asks);
    j.at("timestamp").get_to(update.timestamp);
}

// =============================================================================
// ORDERS
// =============================================================================

void to_json(json& j, const OrderRecord& order) {
    j = json{
        {"order_id", order.order_id},
        {"user_address", order.user_address},
        {"symbol", order.symbol},
        {"side", order.side},
        {"order_type", order.order_type},
        {"price", optional_decimal(order.price)},
        {"original_amount", order.original_amount},
        {"filled_amount", order.filled_amount},
        {"remaining_amount", order.remaining_amount()},
        {"status", order.status},
        {"leverage", order.leverage},
        {"created_at", order.created_at},
        {"updated_at", order.updated_at},
        {"avg_fill_price", optional_decimal(order.average_fill_price)},
        {"trade_ids", order.trade_ids}
    };
}

void from_json(const json& j, OrderRecord& order) {
    j.at("order_id").get_to(order.order_id);
    j.at("user_address").get_to(order.user_address);
    j.at("symbol").get_to(order.symbol);
    j.at("side").get_to(order.side);
    j.at("order_type").get_to(order.order_type);
    order.price = read_optional_decimal(j, "price");
    j.at("original_amount").get_to(order.original_amount);
    j.at("filled_amount").get_to(order.filled_amount);
    j.at("status").get_to(order.status);
    j.at("leverage").get_to(order.leverage);
    j.at("created_at").get_to(order.created_at);
    j.at("updated_at").get_to(order.updated_at);
    order.average_fill_price = read_optional_decimal(j, "avg_fill_price");
    order.trade_ids.clear();
    if (j.contains("trade_ids")) {
        j.at("trade_ids").get_to(order.trade_ids);
    }
}

// =============================================================================
// REFERRALS AND RESULTS
// =============================================================================

void to_json(json& j, const ReferralEarning& earning) {
    j = json{
        {"id", earning.id},
        {"referrer_address", earning.referrer_address},
        {"referee_address", earning.referee_address},
        {"trade_id", earning.trade_id},
        {"event_type", earning.event_type},
        {"volume", earning.volume},
        {"commission", earning.commission},
        {"token", earning.token},
        {"status", earning.status},
        {"created_at", earning.created_at}
    };
}

void from_json(const json& j, ReferralEarning& earning) {
    j.at("id").get_to(earning.id);
    j.at("referrer_address").get_to(earning.referrer_address);
    j.at("referee_address").get_to(earning.referee_address);
    j.at("trade_id").get_to(earning.trade_id);
    j.at("event_type").get_to(earning.event_type);
    j.at("volume").get_to(earning.volume);
    j.at("commission").get_to(earning.commission);
    j.at("token").get_to(earning.token);
    j.at("status").get_to(earning.status);
    j.at("created_at").get_to(earning.created_at);
}

void to_json(json& j, const MatchResult& result) {
    json trades = json::array();
    for (const auto& trade : result.trades) {
        trades.push_back(trade);
    }
    j = json{
        {"order_id", result.order_id},
        {"status", result.status},
        {"filled_amount", result.filled_amount},
        {"remaining_amount", result.remaining_amount},
        {"average_price", optional_decimal(result.average_price)},
        {"trades", trades}
    };
}

} // namespace perp
