#include "config/instrument_config.hpp"
#include "market/errors.hpp"

#include <algorithm>
#include <cctype>

namespace gbce {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

} // anonymous namespace

StockKind parse_stock_kind(const std::string& text) {
    auto lowered = to_lower(text);
    if (lowered == "common") return StockKind::Common;
    if (lowered == "preferred") return StockKind::Preferred;
    throw InvalidInstrument("stock type '" + text + "' must be \"common\" or \"preferred\"");
}

const char* to_string(StockKind kind) {
    switch (kind) {
        case StockKind::Common:    return "common";
        case StockKind::Preferred: return "preferred";
    }
    return "unknown";
}

void validate_instrument_config(const InstrumentConfig& config) {
    const auto& sym = config.symbol;
    if (sym.empty()) {
        throw InvalidInstrument("stock symbol must not be empty");
    }
    bool upper_alpha = std::all_of(sym.begin(), sym.end(), [](unsigned char c) {
        return std::isalpha(c) && std::isupper(c);
    });
    if (!upper_alpha) {
        throw InvalidInstrument("stock symbol '" + sym + "' must be uppercase alphabetic");
    }
    if (config.last_dividend < 0) {
        throw InvalidInstrument(sym + ": last dividend must be non-negative");
    }
    if (config.par_value < 0) {
        throw InvalidInstrument(sym + ": par value must be non-negative");
    }

    if (config.kind == StockKind::Preferred) {
        if (!config.fixed_dividend_rate) {
            throw InvalidInstrument(sym + ": preferred stock requires a fixed dividend rate");
        }
        double rate = *config.fixed_dividend_rate;
        // Negated form also rejects NaN.
        if (!(rate >= 0.0 && rate <= 1.0)) {
            throw InvalidInstrument(sym + ": fixed dividend rate must lie in [0, 1]");
        }
    } else if (config.fixed_dividend_rate) {
        throw InvalidInstrument(sym + ": common stock must not carry a fixed dividend rate");
    }
}

InstrumentConfig make_instrument_config(const std::string& symbol,
                                        const std::string& kind,
                                        Price last_dividend,
                                        std::optional<double> fixed_dividend_rate,
                                        Price par_value) {
    InstrumentConfig config{
        .symbol              = to_upper(symbol),
        .kind                = parse_stock_kind(kind),
        .last_dividend       = last_dividend,
        .fixed_dividend_rate = fixed_dividend_rate,
        .par_value           = par_value,
    };
    validate_instrument_config(config);
    return config;
}

} // namespace gbce
