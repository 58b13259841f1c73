#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace stratlab {

class BacktestError : public std::runtime_error {
public:
    explicit BacktestError(const std::string& what) : std::runtime_error(what) {}
};

// Fewer bars than the policy needs to produce a single signal
class InsufficientDataError : public BacktestError {
public:
    InsufficientDataError(const std::string& what, size_t available, size_t required)
        : BacktestError(what), available_(available), required_(required) {}

    size_t available() const { return available_; }
    size_t required() const { return required_; }

private:
    size_t available_;
    size_t required_;
};

// NaN or non-positive price, out-of-order or duplicate dates
class MalformedPriceSeriesError : public BacktestError {
public:
    explicit MalformedPriceSeriesError(const std::string& what) : BacktestError(what) {}
};

class NonStationaryPairError : public BacktestError {
public:
    explicit NonStationaryPairError(const std::string& what) : BacktestError(what) {}
};

class SymbolNotFoundError : public BacktestError {
public:
    explicit SymbolNotFoundError(const std::string& symbol)
        : BacktestError("Symbol not found: " + symbol), symbol_(symbol) {}

    const std::string& symbol() const { return symbol_; }

private:
    std::string symbol_;
};

class DataUnavailableError : public BacktestError {
public:
    explicit DataUnavailableError(const std::string& what) : BacktestError(what) {}
};

class UnknownStrategyError : public BacktestError {
public:
    explicit UnknownStrategyError(const std::string& id)
        : BacktestError("Unknown strategy: " + id) {}
};

class BacktestCancelledError : public BacktestError {
public:
    BacktestCancelledError() : BacktestError("Backtest cancelled") {}
};

} // namespace stratlab
