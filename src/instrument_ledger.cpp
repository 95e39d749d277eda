#include "market/instrument_ledger.hpp"
#include "market/errors.hpp"

#include <iomanip>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>

namespace gbce {

InstrumentLedger::InstrumentLedger(InstrumentConfig config, const IClock& clock)
    : config_(std::move(config)), clock_(clock) {
    validate_instrument_config(config_);
}

void InstrumentLedger::record_trade(TradeSide side, Quantity quantity, Price price, Timestamp ts) {
    if (quantity <= 0) {
        throw InvalidTrade(config_.symbol + ": trade quantity " + std::to_string(quantity)
                           + " must be positive");
    }
    if (price < 0) {
        throw InvalidTrade(config_.symbol + ": trade price " + std::to_string(price)
                           + " must be non-negative");
    }
    if (ts > clock_.now()) {
        throw InvalidTrade(config_.symbol + ": trade timestamp lies in the future");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    trades_.push_back(Trade{.side = side, .quantity = quantity, .price = price, .ts = ts});
}

void InstrumentLedger::buy(Quantity quantity, Price price, std::optional<Timestamp> ts) {
    record_trade(TradeSide::Buy, quantity, price, ts.value_or(clock_.now()));
}

void InstrumentLedger::sell(Quantity quantity, Price price, std::optional<Timestamp> ts) {
    record_trade(TradeSide::Sell, quantity, price, ts.value_or(clock_.now()));
}

double InstrumentLedger::price(Duration window) const {
    return price_details(window).price;
}

WindowPrice InstrumentLedger::price_details(Duration window) const {
    Timestamp now = clock_.now();
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return windowed_price(trades_, config_.par_value, now, window);
}

double InstrumentLedger::dividend() const {
    if (config_.kind == StockKind::Preferred) {
        return config_.fixed_dividend_rate.value_or(0.0) * static_cast<double>(config_.par_value);
    }
    return static_cast<double>(config_.last_dividend);
}

double InstrumentLedger::dividend_yield(Duration window) const {
    double p = price(window);
    if (p == 0.0) {
        throw DivisionUndefined(config_.symbol + ": dividend yield undefined at zero price");
    }
    return dividend() / p;
}

double InstrumentLedger::pe_ratio(Duration window) const {
    double d = dividend();
    if (d == 0.0) {
        throw DivisionUndefined(config_.symbol + ": P/E ratio undefined with zero dividend");
    }
    return price(window) / d;
}

std::vector<Trade> InstrumentLedger::trades() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return trades_;
}

size_t InstrumentLedger::trade_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return trades_.size();
}

std::string InstrumentLedger::describe() const {
    std::ostringstream ss;
    ss << config_.symbol << " (" << to_string(config_.kind) << "): "
       << "LastDiv: " << config_.last_dividend << ", FixedDiv: ";
    if (config_.fixed_dividend_rate) {
        ss << std::fixed << std::setprecision(2) << *config_.fixed_dividend_rate;
    } else {
        ss << "-";
    }
    ss << ", ParVal: " << config_.par_value
       << ", Trades: " << trade_count();
    return ss.str();
}

} // namespace gbce
