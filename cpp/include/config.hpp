#pragma once

#include "types.hpp"
#include "matching_engine.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace perp {

/**
 * Service configuration. Defaults are the production values; every field
 * can be overridden through a PERP_* environment variable.
 */
struct EngineConfig {
    std::vector<std::string> symbols;
    Decimal maker_fee_rate;
    Decimal taker_fee_rate;
    size_t broadcast_capacity;
    size_t orderbook_depth;
    size_t history_limit;
    size_t persistence_threads;
    std::string journal_path;
    std::string referrals_path;     // Empty: no referral file
    bool websocket_enabled;
    uint16_t websocket_port;

    EngineConfig()
        : symbols{"BTCUSDT", "ETHUSDT"}
        , maker_fee_rate(Decimal::from_raw(2, 4))
        , taker_fee_rate(Decimal::from_raw(5, 4))
        , broadcast_capacity(10000)
        , orderbook_depth(20)
        , history_limit(1000)
        , persistence_threads(4)
        , journal_path("data/trade_journal.jsonl")
        , referrals_path()
        , websocket_enabled(true)
        , websocket_port(9002) {}

    FeeConfig fee_config() const;
    EngineOptions engine_options() const;

    void print() const;
};

/**
 * Walk up from the working directory to the first .env file and export its
 * KEY=VALUE lines. Variables already set in the environment win.
 */
void load_dotenv();

/**
 * Defaults overridden by PERP_* variables. A malformed value is reported
 * on std::cerr and the default is kept.
 */
EngineConfig load_config_from_env();

/**
 * Comma-separated symbol list, normalized, duplicates and blanks dropped
 */
std::vector<std::string> parse_symbol_list(const std::string& text);

} // namespace perp
