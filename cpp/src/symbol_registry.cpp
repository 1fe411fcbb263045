#include "symbol_registry.hpp"
#include <algorithm>
#include <cctype>

namespace perp {

SymbolRegistry::SymbolRegistry(const std::vector<std::string>& symbols) {
    for (const auto& raw : symbols) {
        std::string symbol = normalize(raw);
        if (symbol.empty() || contains(symbol)) {
            continue;
        }
        symbols_.push_back(std::move(symbol));
    }
}

std::string SymbolRegistry::normalize(const std::string& symbol) {
    std::string out;
    out.reserve(symbol.size() + 1);
    for (unsigned char c : symbol) {
        if (c == '-' || c == '/' || c == '_' || std::isspace(c)) {
            continue;
        }
        out.push_back(static_cast<char>(std::toupper(c)));
    }
    const std::string usd = "USD";
    if (out.size() > usd.size() && out.compare(out.size() - usd.size(), usd.size(), usd) == 0) {
        out.push_back('T');
    }
    return out;
}

bool SymbolRegistry::contains(const std::string& symbol) const {
    return std::find(symbols_.begin(), symbols_.end(), symbol) != symbols_.end();
}

} // namespace perp
