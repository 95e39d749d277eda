#pragma once

#include "config/instrument_config.hpp"
#include "market/trade.hpp"
#include "market/trade_window.hpp"
#include "util/clock.hpp"

#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace gbce {

// One instrument's static terms plus its append-only trade history.
// record_trade() is the only mutator; it takes the lock exclusively and the
// queries take it shared.
class InstrumentLedger {
public:
    // Throws InvalidInstrument if the config breaks its invariants.
    InstrumentLedger(InstrumentConfig config, const IClock& clock);

    InstrumentLedger(const InstrumentLedger&) = delete;
    InstrumentLedger& operator=(const InstrumentLedger&) = delete;

    // Throws InvalidTrade on quantity <= 0, price < 0 or ts after clock.now().
    void record_trade(TradeSide side, Quantity quantity, Price price, Timestamp ts);

    // Default timestamp is clock.now().
    void buy(Quantity quantity, Price price, std::optional<Timestamp> ts = std::nullopt);
    void sell(Quantity quantity, Price price, std::optional<Timestamp> ts = std::nullopt);

    double price(Duration window = kDefaultPriceWindow) const;
    WindowPrice price_details(Duration window = kDefaultPriceWindow) const;

    // Throws DivisionUndefined when the price is zero.
    double dividend_yield(Duration window = kDefaultPriceWindow) const;

    // Throws DivisionUndefined when the dividend is zero.
    double pe_ratio(Duration window = kDefaultPriceWindow) const;

    // last_dividend for common stock, fixed rate * par value for preferred.
    double dividend() const;

    const InstrumentConfig& config() const { return config_; }
    const std::string& symbol() const { return config_.symbol; }
    StockKind kind() const { return config_.kind; }

    std::vector<Trade> trades() const;
    size_t trade_count() const;

    std::string describe() const;

private:
    const InstrumentConfig config_;
    const IClock&          clock_;

    mutable std::shared_mutex mutex_;
    std::vector<Trade>        trades_;
};

} // namespace gbce
