#pragma once

#include "config/instrument_config.hpp"
#include "market/instrument_registry.hpp"
#include "market/trade.hpp"
#include "market/trade_window.hpp"

#include <iosfwd>
#include <stdexcept>
#include <string>
#include <vector>

namespace gbce {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// Trade listed in the config file; its timestamp is `age` before load time.
struct SeedTrade {
    std::string symbol;
    TradeSide   side     = TradeSide::Buy;
    Quantity    quantity = 0;
    Price       price    = 0;
    Duration    age{0};
};

struct AppConfig {
    std::vector<InstrumentConfig> instruments;
    std::vector<SeedTrade>        trades;
    Duration                      window = kDefaultPriceWindow;
};

struct PopulateResult {
    size_t instruments = 0;
    size_t trades      = 0;
    size_t skipped     = 0;
};

// Throws ConfigError unless `minutes` is a non-negative number that fits a Duration.
Duration window_from_minutes(double minutes);

// Throws ConfigError on malformed JSON. Invalid instrument or trade entries
// are reported to `warn` and left out.
AppConfig parse_config(const std::string& json, std::ostream& warn);

// Throws ConfigError if the file cannot be read.
AppConfig load_config(const std::string& path, std::ostream& warn);

// Registers every instrument, then records every seed trade at
// registry.clock().now() - age. Rejected entries are reported to `warn`.
PopulateResult populate_registry(const AppConfig& config,
                                 InstrumentRegistry& registry,
                                 std::ostream& warn);

} // namespace gbce
