#pragma once

#include <stdexcept>
#include <string>

namespace gbce {

// Trade rejected by the ledger (bad quantity, price or future timestamp).
class InvalidTrade : public std::runtime_error {
public:
    explicit InvalidTrade(const std::string& what) : std::runtime_error(what) {}
};

// Dividend yield with a zero price, or P/E with a zero dividend.
class DivisionUndefined : public std::runtime_error {
public:
    explicit DivisionUndefined(const std::string& what) : std::runtime_error(what) {}
};

// Instrument definition failed validation.
class InvalidInstrument : public std::runtime_error {
public:
    explicit InvalidInstrument(const std::string& what) : std::runtime_error(what) {}
};

} // namespace gbce
