#pragma once

#include "market/trade.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <vector>

namespace gbce {

inline constexpr Duration kDefaultPriceWindow = std::chrono::minutes(15);

// Closed interval [start, end] of trade timestamps that count toward a price.
struct TradeWindow {
    Timestamp start{};
    Timestamp end{};
    bool      anchored_at_now = false;   // false: anchored at the newest trade

    bool contains(Timestamp ts) const { return ts >= start && ts <= end; }
};

struct WindowPrice {
    double      price       = 0.0;
    double      volume      = 0.0;     // shares inside the window
    size_t      trade_count = 0;       // trades inside the window
    bool        from_trades = false;   // false: par value fallback
    TradeWindow window;
};

// Anchors the window at `now` when the newest trade is at most `length` old,
// otherwise at the newest trade. Empty history has no window.
std::optional<TradeWindow> select_window(const std::vector<Trade>& trades,
                                         Timestamp now,
                                         Duration length);

// Volume-weighted mean of the trades inside `window`, or nullopt if none are.
std::optional<double> weighted_price(const std::vector<Trade>& trades,
                                     const TradeWindow& window);

// Full pricing policy: weighted mean over the selected window, par value when
// there is no history or the selected window is empty.
WindowPrice windowed_price(const std::vector<Trade>& trades,
                           Price par_value,
                           Timestamp now,
                           Duration length = kDefaultPriceWindow);

} // namespace gbce
