#pragma once

#include <stdexcept>
#include <string>

namespace clmm {

// Root of every failure raised by the backtest core. None of these are caught
// inside the core; they abort the operation that raised them.
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed caller input: naive calendar times, zero prices read from chain.
class InvalidInput : public Error {
public:
    using Error::Error;
};

// Target time lies after the latest known block.
class FutureTarget : public InvalidInput {
public:
    using InvalidInput::InvalidInput;
};

// Block search spent its probe budget without the bracket collapsing.
class NoConvergence : public Error {
public:
    using Error::Error;
};

// Inverted bounds, non-positive prices, ticks outside the pool grid.
class InvalidRange : public Error {
public:
    using Error::Error;
};

// Liquidity sizing denominator is exactly zero.
class DegenerateRange : public Error {
public:
    using Error::Error;
};

// Non-positive elapsed time between two snapshots.
class InvalidPeriod : public Error {
public:
    using Error::Error;
};

// A chain-state or price-source read failed.
class UpstreamUnavailable : public Error {
public:
    using Error::Error;
};

} // namespace clmm
