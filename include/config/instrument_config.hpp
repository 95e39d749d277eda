#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace gbce {

using Price    = int64_t;   // minor currency units (pennies)
using Quantity = int64_t;   // shares

enum class StockKind { Common, Preferred };

struct InstrumentConfig {
    std::string           symbol;
    StockKind             kind          = StockKind::Common;
    Price                 last_dividend = 0;
    std::optional<double> fixed_dividend_rate;   // set iff kind == Preferred, in [0, 1]
    Price                 par_value     = 0;
};

// "common" / "preferred", case-insensitive. Throws InvalidInstrument otherwise.
StockKind parse_stock_kind(const std::string& text);
const char* to_string(StockKind kind);

// Throws InvalidInstrument if any field breaks the invariants above.
void validate_instrument_config(const InstrumentConfig& config);

// Builds a validated config from caller-supplied fields; the symbol is upper-cased.
InstrumentConfig make_instrument_config(const std::string& symbol,
                                        const std::string& kind,
                                        Price last_dividend,
                                        std::optional<double> fixed_dividend_rate,
                                        Price par_value);

} // namespace gbce
