#include "market/share_index.hpp"

#include <cmath>
#include <utility>

namespace gbce {

double geometric_mean(const std::vector<double>& prices) {
    double log_sum = 0.0;
    size_t zeros = 0;

    for (double p : prices) {
        if (p == 0.0) {
            ++zeros;
            continue;
        }
        log_sum += std::log(p);
    }

    if (zeros == prices.size()) {
        return 0.0;
    }
    return std::exp(log_sum / static_cast<double>(prices.size() - zeros));
}

ShareIndex::ShareIndex(Duration window)
    : window_(window) {}

double ShareIndex::compute(const InstrumentRegistry& registry) const {
    return breakdown(registry).index;
}

IndexBreakdown ShareIndex::breakdown(const InstrumentRegistry& registry) const {
    std::vector<std::pair<std::string, double>> prices;
    prices.reserve(registry.count());

    registry.for_each([&](const InstrumentLedger& ledger) {
        prices.emplace_back(ledger.symbol(), ledger.price(window_));
    });

    return from_prices(std::move(prices));
}

IndexBreakdown ShareIndex::from_prices(std::vector<std::pair<std::string, double>> prices) {
    IndexBreakdown result;
    std::vector<double> values;
    values.reserve(prices.size());

    for (const auto& [symbol, p] : prices) {
        values.push_back(p);
        if (p == 0.0) {
            result.excluded.push_back(symbol);
        }
    }

    result.index = geometric_mean(values);
    result.prices = std::move(prices);
    return result;
}

} // namespace gbce
