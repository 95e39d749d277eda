#pragma once

#include "config/instrument_config.hpp"
#include "util/clock.hpp"

namespace gbce {

enum class TradeSide { Buy, Sell };

// +1 for a buy, -1 for a sell.
inline int side_sign(TradeSide side) {
    return side == TradeSide::Buy ? 1 : -1;
}

inline const char* to_string(TradeSide side) {
    return side == TradeSide::Buy ? "buy" : "sell";
}

struct Trade {
    TradeSide side     = TradeSide::Buy;
    Quantity  quantity = 0;
    Price     price    = 0;
    Timestamp ts{};
};

} // namespace gbce
