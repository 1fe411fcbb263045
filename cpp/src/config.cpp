#include "config.hpp"
#include "symbol_registry.hpp"
#include "log_control.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace perp {

// =============================================================================
// HELPER FUNCTIONS
// =============================================================================

static inline void trim(std::string& s) {
    auto f = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), f));
    s.erase(std::find_if(s.rbegin(), s.rend(), f).base(), s.end());
}

static inline void strip_quotes(std::string& s) {
    if (s.size() > 1 && ((s.front() == '"' && s.back() == '"') || (s.front() == '\'' && s.back() == '\'')))
        s = s.substr(1, s.size() - 2);
}

void load_dotenv() {
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::path start = fs::current_path(ec);
    if (ec) {
        std::cerr << kLogConfig << "Cannot resolve working directory: " << ec.message() << std::endl;
        return;
    }
    for (fs::path p = start;; p = p.parent_path()) {
        fs::path env = p / ".env";
        if (fs::exists(env)) {
            std::ifstream in(env);
            std::string ln;
            while (std::getline(in, ln)) {
                if (ln.empty() || ln[0] == '#') continue;
                auto eq = ln.find('=');
                if (eq == std::string::npos) continue;
                std::string k = ln.substr(0, eq), v = ln.substr(eq + 1);
                trim(k);
                trim(v);
                strip_quotes(v);
                if (!std::getenv(k.c_str())) setenv(k.c_str(), v.c_str(), 0);
            }
            std::cout << kLogConfig << "Loaded " << env.string() << std::endl;
            break;
        }
        if (p == p.root_path()) break;
    }
}

namespace {

const char* env_value(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return nullptr;
    }
    return value;
}

void warn_malformed(const char* name, const std::string& value, const std::string& reason) {
    std::cerr << kLogConfig << "Ignoring " << name << "=\"" << value << "\": " << reason << std::endl;
}

void read_count(const char* name, size_t& target, size_t min_value, size_t max_value) {
    const char* raw = env_value(name);
    if (!raw) {
        return;
    }
    std::string text(raw);
    trim(text);
    if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        warn_malformed(name, raw, "expected a non-negative integer");
        return;
    }
    unsigned long long parsed = 0;
    try {
        parsed = std::stoull(text);
    } catch (const std::out_of_range&) {
        warn_malformed(name, raw, "out of range");
        return;
    }
    if (parsed < min_value || parsed > max_value) {
        std::ostringstream reason;
        reason << "must be between " << min_value << " and " << max_value;
        warn_malformed(name, raw, reason.str());
        return;
    }
    target = static_cast<size_t>(parsed);
}

void read_rate(const char* name, Decimal& target) {
    const char* raw = env_value(name);
    if (!raw) {
        return;
    }
    std::string text(raw);
    trim(text);
    try {
        Decimal rate = Decimal::parse(text);
        if (rate.is_negative()) {
            warn_malformed(name, raw, "fee rate cannot be negative");
            return;
        }
        target = rate;
    } catch (const std::exception& e) {
        warn_malformed(name, raw, e.what());
    }
}

void read_flag(const char* name, bool& target) {
    const char* raw = env_value(name);
    if (!raw) {
        return;
    }
    std::string text(raw);
    trim(text);
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (text == "1" || text == "true" || text == "yes" || text == "on") {
        target = true;
    } else if (text == "0" || text == "false" || text == "no" || text == "off") {
        target = false;
    } else {
        warn_malformed(name, raw, "expected true or false");
    }
}

void read_string(const char* name, std::string& target) {
    const char* raw = std::getenv(name);
    if (raw) {
        target = raw;
        trim(target);
    }
}

} // namespace

std::vector<std::string> parse_symbol_list(const std::string& text) {
    std::vector<std::string> symbols;
    std::stringstream stream(text);
    std::string item;
    while (std::getline(stream, item, ',')) {
        std::string symbol = SymbolRegistry::normalize(item);
        if (symbol.empty()) {
            continue;
        }
        if (std::find(symbols.begin(), symbols.end(), symbol) == symbols.end()) {
            symbols.push_back(symbol);
        }
    }
    return symbols;
}

// =============================================================================
// CONFIG LOADING
// =============================================================================

EngineConfig load_config_from_env() {
    EngineConfig config;

    if (const char* raw = env_value("PERP_SYMBOLS")) {
        std::vector<std::string> symbols = parse_symbol_list(raw);
        if (symbols.empty()) {
            warn_malformed("PERP_SYMBOLS", raw, "no symbols listed");
        } else {
            config.symbols = std::move(symbols);
        }
    }

    read_rate("PERP_MAKER_FEE_RATE", config.maker_fee_rate);
    read_rate("PERP_TAKER_FEE_RATE", config.taker_fee_rate);
    read_count("PERP_BROADCAST_CAPACITY", config.broadcast_capacity, 1, std::numeric_limits<uint32_t>::max());
    read_count("PERP_ORDERBOOK_DEPTH", config.orderbook_depth, 1, 1000);
    read_count("PERP_HISTORY_LIMIT", config.history_limit, 1, std::numeric_limits<uint32_t>::max());
    read_count("PERP_PERSISTENCE_THREADS", config.persistence_threads, 1, 256);
    read_string("PERP_JOURNAL_PATH", config.journal_path);
    read_string("PERP_REFERRALS_PATH", config.referrals_path);
    read_flag("PERP_WS_ENABLED", config.websocket_enabled);

    size_t port = config.websocket_port;
    read_count("PERP_WS_PORT", port, 1, 65535);
    config.websocket_port = static_cast<uint16_t>(port);

    if (config.journal_path.empty()) {
        std::cerr << kLogConfig << "PERP_JOURNAL_PATH is empty, using data/trade_journal.jsonl" << std::endl;
        config.journal_path = "data/trade_journal.jsonl";
    }
    return config;
}

// =============================================================================
// ENGINE CONFIG
// =============================================================================

FeeConfig EngineConfig::fee_config() const {
    return FeeConfig(maker_fee_rate, taker_fee_rate);
}

EngineOptions EngineConfig::engine_options() const {
    EngineOptions options;
    options.broadcast_capacity = broadcast_capacity;
    options.orderbook_broadcast_depth = orderbook_depth;
    options.history_limit = history_limit;
    return options;
}

void EngineConfig::print() const {
    std::cout << kLogConfig << "Configuration:" << std::endl;
    std::cout << "  Symbols: ";
    for (size_t i = 0; i < symbols.size(); ++i) {
        std::cout << (i ? "," : "") << symbols[i];
    }
    std::cout << std::endl;
    std::cout << "  Fees (maker/taker): " << maker_fee_rate << " / " << taker_fee_rate << std::endl;
    std::cout << "  Broadcast capacity: " << broadcast_capacity << std::endl;
    std::cout << "  Orderbook depth: " << orderbook_depth << std::endl;
    std::cout << "  History limit: " << history_limit << std::endl;
    std::cout << "  Persistence threads: " << persistence_threads << std::endl;
    std::cout << "  Journal: " << journal_path << std::endl;
    std::cout << "  Referrals: " << (referrals_path.empty() ? "(none)" : referrals_path) << std::endl;
    std::cout << "  WebSocket: " << (websocket_enabled ? "port " + std::to_string(websocket_port) : "disabled")
              << std::endl;
}

} // namespace perp
