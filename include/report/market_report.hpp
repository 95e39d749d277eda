#pragma once

#include "config/instrument_config.hpp"
#include "market/instrument_registry.hpp"
#include "market/share_index.hpp"

#include <optional>
#include <string>
#include <vector>

namespace gbce {

struct InstrumentFigures {
    std::string           symbol;
    StockKind             kind           = StockKind::Common;
    Price                 last_dividend  = 0;
    std::optional<double> fixed_dividend_rate;
    Price                 par_value      = 0;
    size_t                trades_total   = 0;
    size_t                trades_used    = 0;   // trades inside the price window
    double                price          = 0.0;
    bool                  price_from_par = true;
    std::optional<double> dividend_yield;       // nullopt: undefined at zero price
    std::optional<double> pe_ratio;             // nullopt: undefined with zero dividend
};

// Snapshot of every instrument's figures and the All Share Index, taken once
// at construction so the markdown and CSV agree.
class MarketReport {
public:
    MarketReport(const InstrumentRegistry& registry, Duration window);

    const std::vector<InstrumentFigures>& figures() const { return figures_; }
    const IndexBreakdown& index() const { return index_; }
    Duration window() const { return window_; }

    std::string generate_report() const;
    void write_report(const std::string& path) const;
    void write_csv(const std::string& path) const;

private:
    Duration                       window_;
    std::vector<InstrumentFigures> figures_;
    IndexBreakdown                 index_;
};

} // namespace gbce
