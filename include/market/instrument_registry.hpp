#pragma once

#include "market/instrument_ledger.hpp"
#include "util/clock.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace gbce {

// Symbol -> ledger. Owned by the caller and passed by reference; every ledger
// it creates reads time from the registry's clock.
class InstrumentRegistry {
public:
    explicit InstrumentRegistry(const IClock& clock);

    // Returns nullptr if the symbol is already registered.
    // Throws InvalidInstrument if the config is invalid.
    InstrumentLedger* register_instrument(const InstrumentConfig& config);

    InstrumentLedger* find(const std::string& symbol);
    const InstrumentLedger* find(const std::string& symbol) const;

    // Symbol order.
    std::vector<std::string> all_symbols() const;
    std::vector<const InstrumentLedger*> ledgers() const;
    void for_each(const std::function<void(const InstrumentLedger&)>& fn) const;

    size_t count() const { return ledgers_.size(); }
    bool empty() const { return ledgers_.empty(); }

    const IClock& clock() const { return clock_; }

private:
    const IClock& clock_;
    std::map<std::string, std::unique_ptr<InstrumentLedger>> ledgers_;
};

} // namespace gbce
