#include <gtest/gtest.h>
#include "market/trade_window.hpp"

#include <limits>

using namespace gbce;
using namespace std::chrono_literals;

class TradeWindowTest : public ::testing::Test {
protected:
    Trade make_trade(Quantity qty, Price px, Duration age, TradeSide side = TradeSide::Buy) const {
        return Trade{.side = side, .quantity = qty, .price = px, .ts = now - age};
    }

    Timestamp now = SimulatedClock().now();
};

TEST_F(TradeWindowTest, EmptyHistoryHasNoWindow) {
    std::vector<Trade> trades;
    EXPECT_FALSE(select_window(trades, now, 15min).has_value());

    auto result = windowed_price(trades, 60, now, 15min);
    EXPECT_DOUBLE_EQ(result.price, 60.0);
    EXPECT_FALSE(result.from_trades);
    EXPECT_EQ(result.trade_count, 0u);
}

TEST_F(TradeWindowTest, AnchorsAtNowWhenRecentTradeExists) {
    std::vector<Trade> trades = {make_trade(10, 100, 3min)};
    auto window = select_window(trades, now, 15min);
    ASSERT_TRUE(window.has_value());
    EXPECT_TRUE(window->anchored_at_now);
    EXPECT_EQ(window->end, now);
    EXPECT_EQ(window->start, now - 15min);
}

TEST_F(TradeWindowTest, AnchorsAtLatestTradeWhenNothingRecent) {
    std::vector<Trade> trades = {make_trade(10, 100, 40min), make_trade(10, 100, 50min)};
    auto window = select_window(trades, now, 15min);
    ASSERT_TRUE(window.has_value());
    EXPECT_FALSE(window->anchored_at_now);
    EXPECT_EQ(window->end, now - 40min);
    EXPECT_EQ(window->start, now - 55min);
}

TEST_F(TradeWindowTest, LatestIsMaxTimestampNotLastAppended) {
    // Newest trade recorded first
    std::vector<Trade> trades = {make_trade(10, 100, 20min), make_trade(10, 100, 60min)};
    auto window = select_window(trades, now, 15min);
    ASSERT_TRUE(window.has_value());
    EXPECT_EQ(window->end, now - 20min);
}

TEST_F(TradeWindowTest, NewestTradeExactlyWindowOldStillAnchorsAtNow) {
    std::vector<Trade> trades = {make_trade(10, 100, 15min)};
    auto window = select_window(trades, now, 15min);
    ASSERT_TRUE(window.has_value());
    EXPECT_TRUE(window->anchored_at_now);
}

TEST_F(TradeWindowTest, WeightedAverageOfTwoTrades) {
    std::vector<Trade> trades = {
        make_trade(500, 25, 1min),
        make_trade(300, 15, 30s, TradeSide::Sell),
    };
    auto result = windowed_price(trades, 60, now, 15min);
    EXPECT_TRUE(result.from_trades);
    EXPECT_DOUBLE_EQ(result.price, (500.0 * 25 + 300.0 * 15) / (500 + 300));
    EXPECT_DOUBLE_EQ(result.volume, 800.0);
    EXPECT_EQ(result.trade_count, 2u);
}

TEST_F(TradeWindowTest, BoundaryIsInclusive) {
    std::vector<Trade> trades = {
        make_trade(10, 100, 0min),
        make_trade(10, 200, 15min),   // exactly on the start edge
    };
    auto result = windowed_price(trades, 0, now, 15min);
    EXPECT_DOUBLE_EQ(result.price, 150.0);
    EXPECT_EQ(result.trade_count, 2u);
}

TEST_F(TradeWindowTest, TradeOlderThanWindowIsExcluded) {
    std::vector<Trade> trades = {
        make_trade(500, 25, 1min),
        make_trade(300, 15, 1min),
    };
    double before = windowed_price(trades, 60, now, 15min).price;

    trades.push_back(make_trade(100, 87, 16min));
    trades.push_back(make_trade(100, 87, 15min + 1ms));
    auto after = windowed_price(trades, 60, now, 15min);

    EXPECT_DOUBLE_EQ(after.price, before);
    EXPECT_EQ(after.trade_count, 2u);
}

TEST_F(TradeWindowTest, StaleHistoryUsesWindowEndingAtNewestTrade) {
    std::vector<Trade> trades = {
        make_trade(10, 100, 60min),
        make_trade(30, 200, 70min),
        make_trade(50, 999, 80min),   // 20 min before the newest: outside
    };
    auto result = windowed_price(trades, 5, now, 15min);
    EXPECT_TRUE(result.from_trades);
    EXPECT_FALSE(result.window.anchored_at_now);
    EXPECT_DOUBLE_EQ(result.price, (10.0 * 100 + 30.0 * 200) / 40);
}

TEST_F(TradeWindowTest, TradesNewerThanNowFallBackToPar) {
    // Clock read earlier than every trade: window ends at `now`, nothing inside.
    std::vector<Trade> trades = {make_trade(10, 100, -5min)};
    auto result = windowed_price(trades, 42, now, 1min);
    EXPECT_FALSE(result.from_trades);
    EXPECT_DOUBLE_EQ(result.price, 42.0);
}

TEST_F(TradeWindowTest, WeightedPriceOverExplicitWindow) {
    std::vector<Trade> trades = {make_trade(1, 10, 1min), make_trade(3, 20, 2min)};

    TradeWindow window{.start = now - 90s, .end = now, .anchored_at_now = true};
    auto p = weighted_price(trades, window);
    ASSERT_TRUE(p.has_value());
    EXPECT_DOUBLE_EQ(*p, 10.0);

    TradeWindow empty{.start = now - 10min, .end = now - 5min, .anchored_at_now = false};
    EXPECT_FALSE(weighted_price(trades, empty).has_value());
}

TEST_F(TradeWindowTest, ZeroPriceTradesAverageToZero) {
    std::vector<Trade> trades = {make_trade(10, 0, 1min)};
    auto result = windowed_price(trades, 100, now, 15min);
    EXPECT_TRUE(result.from_trades);
    EXPECT_DOUBLE_EQ(result.price, 0.0);
}

TEST_F(TradeWindowTest, LargeQuantitiesDoNotOverflowVolume) {
    const Quantity half = std::numeric_limits<Quantity>::max() / 2 + 1;
    std::vector<Trade> trades = {make_trade(half, 10, 1min), make_trade(half, 20, 2min)};

    auto result = windowed_price(trades, 60, now, 15min);
    EXPECT_TRUE(result.from_trades);
    EXPECT_DOUBLE_EQ(result.price, 15.0);
    EXPECT_DOUBLE_EQ(result.volume, 2.0 * static_cast<double>(half));
}

TEST_F(TradeWindowTest, ExtremeTimestampsSaturate) {
    Timestamp earliest{Duration::min()};
    std::vector<Trade> trades = {Trade{.side = TradeSide::Buy, .quantity = 5, .price = 70, .ts = earliest}};

    auto window = select_window(trades, now, 15min);
    ASSERT_TRUE(window.has_value());
    EXPECT_FALSE(window->anchored_at_now);
    EXPECT_EQ(window->end, earliest);
    EXPECT_EQ(window->start, earliest);

    auto result = windowed_price(trades, 60, now, 15min);
    EXPECT_TRUE(result.from_trades);
    EXPECT_DOUBLE_EQ(result.price, 70.0);

    // Window longer than the whole representable range.
    auto wide = windowed_price(trades, 60, Timestamp{Duration::max()}, Duration::max());
    EXPECT_TRUE(wide.window.anchored_at_now);
    EXPECT_EQ(wide.window.start, Timestamp{Duration(0)});
    EXPECT_FALSE(wide.from_trades);
}
