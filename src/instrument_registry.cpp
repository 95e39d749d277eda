#include "market/instrument_registry.hpp"

#include <utility>

namespace gbce {

InstrumentRegistry::InstrumentRegistry(const IClock& clock)
    : clock_(clock) {}

InstrumentLedger* InstrumentRegistry::register_instrument(const InstrumentConfig& config) {
    if (ledgers_.count(config.symbol) > 0) return nullptr;

    auto ledger = std::make_unique<InstrumentLedger>(config, clock_);
    auto* raw = ledger.get();
    ledgers_.emplace(config.symbol, std::move(ledger));
    return raw;
}

InstrumentLedger* InstrumentRegistry::find(const std::string& symbol) {
    auto it = ledgers_.find(symbol);
    if (it == ledgers_.end()) return nullptr;
    return it->second.get();
}

const InstrumentLedger* InstrumentRegistry::find(const std::string& symbol) const {
    auto it = ledgers_.find(symbol);
    if (it == ledgers_.end()) return nullptr;
    return it->second.get();
}

std::vector<std::string> InstrumentRegistry::all_symbols() const {
    std::vector<std::string> symbols;
    symbols.reserve(ledgers_.size());
    for (const auto& [symbol, _] : ledgers_) {
        symbols.push_back(symbol);
    }
    return symbols;
}

std::vector<const InstrumentLedger*> InstrumentRegistry::ledgers() const {
    std::vector<const InstrumentLedger*> result;
    result.reserve(ledgers_.size());
    for (const auto& [_, ledger] : ledgers_) {
        result.push_back(ledger.get());
    }
    return result;
}

void InstrumentRegistry::for_each(const std::function<void(const InstrumentLedger&)>& fn) const {
    for (const auto& [_, ledger] : ledgers_) {
        fn(*ledger);
    }
}

} // namespace gbce
