#include "report/market_report.hpp"

#include <chrono>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace gbce {

namespace {

void write_optional(std::ostream& os, const std::optional<double>& value, const char* missing) {
    if (value) {
        os << *value;
    } else {
        os << missing;
    }
}

} // anonymous namespace

MarketReport::MarketReport(const InstrumentRegistry& registry, Duration window)
    : window_(window) {
    std::vector<std::pair<std::string, double>> prices;

    registry.for_each([&](const InstrumentLedger& ledger) {
        const auto& cfg = ledger.config();
        auto details = ledger.price_details(window_);

        InstrumentFigures f;
        f.symbol              = cfg.symbol;
        f.kind                = cfg.kind;
        f.last_dividend       = cfg.last_dividend;
        f.fixed_dividend_rate = cfg.fixed_dividend_rate;
        f.par_value           = cfg.par_value;
        f.trades_total        = ledger.trade_count();
        f.trades_used         = details.trade_count;
        f.price               = details.price;
        f.price_from_par      = !details.from_trades;

        // Undefined ratios stay nullopt.
        if (f.price != 0.0) {
            f.dividend_yield = ledger.dividend() / f.price;
        }
        if (ledger.dividend() != 0.0) {
            f.pe_ratio = f.price / ledger.dividend();
        }
        prices.emplace_back(f.symbol, f.price);
        figures_.push_back(std::move(f));
    });

    index_ = ShareIndex::from_prices(std::move(prices));
}

std::string MarketReport::generate_report() const {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(4);

    auto minutes = std::chrono::duration<double, std::ratio<60>>(window_).count();

    ss << "# GBCE Market Report\n\n";
    ss << "Price window: " << std::setprecision(1) << minutes << " min\n\n";
    ss << std::setprecision(4);

    ss << "## Instruments\n\n";
    ss << "| Symbol | Type | Last Div | Fixed Div | Par | Trades | In Window | Price | Div Yield | P/E |\n";
    ss << "|--------|------|----------|-----------|-----|--------|-----------|-------|-----------|-----|\n";

    for (const auto& f : figures_) {
        ss << "| " << f.symbol
           << " | " << to_string(f.kind)
           << " | " << f.last_dividend
           << " | ";
        write_optional(ss, f.fixed_dividend_rate, "-");
        ss << " | " << f.par_value
           << " | " << f.trades_total
           << " | " << f.trades_used
           << " | " << f.price << (f.price_from_par ? " (par)" : "")
           << " | ";
        write_optional(ss, f.dividend_yield, "n/a");
        ss << " | ";
        write_optional(ss, f.pe_ratio, "n/a");
        ss << " |\n";
    }
    ss << "\n";

    ss << "## All Share Index\n\n";
    ss << "| Metric | Value |\n";
    ss << "|--------|-------|\n";
    ss << "| Index | " << index_.index << " |\n";
    ss << "| Instruments | " << index_.prices.size() << " |\n";
    ss << "| Contributing | " << index_.contributing() << " |\n";
    ss << "| Excluded (zero price) | ";
    if (index_.excluded.empty()) {
        ss << "-";
    }
    for (size_t i = 0; i < index_.excluded.size(); ++i) {
        if (i > 0) ss << ", ";
        ss << index_.excluded[i];
    }
    ss << " |\n";

    return ss.str();
}

void MarketReport::write_report(const std::string& path) const {
    std::ofstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("Failed to open report file: " + path);
    }
    f << generate_report();
}

void MarketReport::write_csv(const std::string& path) const {
    std::ofstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("Failed to open CSV file: " + path);
    }

    f << "symbol,type,last_dividend,fixed_dividend,par_value,trades,trades_in_window,price,dividend_yield,pe_ratio\n";
    f << std::fixed << std::setprecision(6);
    for (const auto& fig : figures_) {
        f << fig.symbol << ","
          << to_string(fig.kind) << ","
          << fig.last_dividend << ",";
        write_optional(f, fig.fixed_dividend_rate, "");
        f << "," << fig.par_value << ","
          << fig.trades_total << ","
          << fig.trades_used << ","
          << fig.price << ",";
        write_optional(f, fig.dividend_yield, "");
        f << ",";
        write_optional(f, fig.pe_ratio, "");
        f << "\n";
    }
}

} // namespace gbce
