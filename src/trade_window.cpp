#include "market/trade_window.hpp"

#include <algorithm>
#include <limits>

namespace gbce {

namespace {

using Rep = Duration::rep;

// a - b clamped to the range of Rep.
Rep saturating_sub(Rep a, Rep b) {
    if (b > 0 && a < std::numeric_limits<Rep>::min() + b) return std::numeric_limits<Rep>::min();
    if (b < 0 && a > std::numeric_limits<Rep>::max() + b) return std::numeric_limits<Rep>::max();
    return a - b;
}

Duration elapsed(Timestamp from, Timestamp to) {
    return Duration(saturating_sub(to.time_since_epoch().count(), from.time_since_epoch().count()));
}

Timestamp rewind(Timestamp t, Duration length) {
    return Timestamp(Duration(saturating_sub(t.time_since_epoch().count(), length.count())));
}

struct WindowSums {
    double notional = 0.0;
    double volume   = 0.0;
    size_t count    = 0;
};

WindowSums sum_window(const std::vector<Trade>& trades, const TradeWindow& window) {
    WindowSums sums;
    for (const auto& t : trades) {
        if (!window.contains(t.ts)) continue;
        sums.notional += static_cast<double>(t.price) * static_cast<double>(t.quantity);
        sums.volume += static_cast<double>(t.quantity);
        ++sums.count;
    }
    return sums;
}

} // anonymous namespace

std::optional<TradeWindow> select_window(const std::vector<Trade>& trades,
                                         Timestamp now,
                                         Duration length) {
    if (trades.empty()) {
        return std::nullopt;
    }

    // Recording order is not chronological; look at every timestamp.
    auto latest_it = std::max_element(trades.begin(), trades.end(),
                                      [](const Trade& a, const Trade& b) { return a.ts < b.ts; });
    Timestamp latest = latest_it->ts;

    TradeWindow window;
    window.anchored_at_now = elapsed(latest, now) <= length;
    window.end = window.anchored_at_now ? now : latest;
    window.start = rewind(window.end, length);
    return window;
}

std::optional<double> weighted_price(const std::vector<Trade>& trades,
                                     const TradeWindow& window) {
    auto sums = sum_window(trades, window);
    if (sums.volume <= 0) {
        return std::nullopt;
    }
    return sums.notional / sums.volume;
}

WindowPrice windowed_price(const std::vector<Trade>& trades,
                           Price par_value,
                           Timestamp now,
                           Duration length) {
    WindowPrice result;
    result.price = static_cast<double>(par_value);

    auto window = select_window(trades, now, length);
    if (!window) {
        return result;
    }
    result.window = *window;

    // Empty when every trade is newer than `now` (clock moved back) or the
    // length is negative; both fall back to par.
    auto sums = sum_window(trades, *window);
    if (sums.volume <= 0) {
        return result;
    }

    result.price       = sums.notional / sums.volume;
    result.volume      = sums.volume;
    result.trade_count = sums.count;
    result.from_trades = true;
    return result;
}

} // namespace gbce
