#pragma once

#include "types.hpp"
#include "collaborators.hpp"
#include <nlohmann/json.hpp>
#include <boost/uuid/uuid.hpp>

/**
 * JSON encoding shared by the journal store, referral loader and the
 * WebSocket publisher. Decimals and ids travel as strings so no precision
 * is lost; enums use their lower-case names; book levels are
 * [price, amount] string pairs.
 */

namespace nlohmann {
template<>
struct adl_serializer<boost::uuids::uuid> {
    static void to_json(json& j, const boost::uuids::uuid& id);
    static void from_json(const json& j, boost::uuids::uuid& id);
};
} // namespace nlohmann

namespace perp {

using json = nlohmann::json;

void to_json(json& j, const Decimal& value);
void from_json(const json& j, Decimal& value);

void to_json(json& j, Side side);
void from_json(const json& j, Side& side);
void to_json(json& j, OrderType type);
void from_json(const json& j, OrderType& type);
void to_json(json& j, OrderStatus status);
void from_json(const json& j, OrderStatus& status);

void to_json(json& j, const LevelSummary& level);
void from_json(const json& j, LevelSummary& level);

void to_json(json& j, const TradeExecution& trade);
void from_json(const json& j, TradeExecution& trade);

// Flat trade record: the execution fields plus symbol and taker side
void to_json(json& j, const TradeEvent& event);
void from_json(const json& j, TradeEvent& event);

void to_json(json& j, const OrderbookSnapshot& snapshot);
void to_json(json& j, const OrderbookUpdate& update);
void from_json(const json& j, OrderbookUpdate& update);

void to_json(json& j, const OrderRecord& order);
void from_json(const json& j, OrderRecord& order);

void to_json(json& j, const ReferralEarning& earning);
void from_json(const json& j, ReferralEarning& earning);

void to_json(json& j, const MatchResult& result);

} // namespace perp
