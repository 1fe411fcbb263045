#pragma once

#include <string>
#include <vector>

namespace perp {

/**
 * The fixed set of tradable symbols, built once at startup and passed to
 * the engine by reference. Symbols are stored in normalized form.
 */
class SymbolRegistry {
public:
    explicit SymbolRegistry(const std::vector<std::string>& symbols);

    /**
     * Canonical form: upper-case, separators (- / _) removed, and a bare
     * USD quote mapped to USDT. "btc-usd" -> "BTCUSDT".
     */
    static std::string normalize(const std::string& symbol);

    bool contains(const std::string& symbol) const;
    const std::vector<std::string>& symbols() const { return symbols_; }
    size_t size() const { return symbols_.size(); }

private:
    std::vector<std::string> symbols_;
};

} // namespace perp
