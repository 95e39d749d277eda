#pragma once

#include "market/instrument_registry.hpp"
#include "market/trade_window.hpp"

#include <string>
#include <utility>
#include <vector>

namespace gbce {

struct IndexBreakdown {
    double index = 0.0;
    std::vector<std::pair<std::string, double>> prices;   // every instrument, symbol order
    std::vector<std::string> excluded;                    // zero-price symbols

    size_t contributing() const { return prices.size() - excluded.size(); }
};

// Geometric mean of the non-zero prices, computed in log space.
// Returns 0 when the input is empty or every price is zero.
double geometric_mean(const std::vector<double>& prices);

// GBCE All Share Index over a registry. Never throws: zero-price instruments
// are left out of the mean and reported in IndexBreakdown::excluded.
class ShareIndex {
public:
    explicit ShareIndex(Duration window = kDefaultPriceWindow);

    double compute(const InstrumentRegistry& registry) const;
    IndexBreakdown breakdown(const InstrumentRegistry& registry) const;

    // Index over prices that were already computed, e.g. for a report snapshot.
    static IndexBreakdown from_prices(std::vector<std::pair<std::string, double>> prices);

    Duration window() const { return window_; }

private:
    Duration window_;
};

inline double geometric_mean_index(const InstrumentRegistry& registry,
                                   Duration window = kDefaultPriceWindow) {
    return ShareIndex(window).compute(registry);
}

} // namespace gbce
