#pragma once

#include <stdexcept>
#include <string>

// ---------------------------------------------------------------------------
// DataShapeError — malformed input (lengths, NaN/Inf, ordering). Fatal:
// raised before any fitting starts.
// ---------------------------------------------------------------------------
class DataShapeError : public std::invalid_argument {
public:
    explicit DataShapeError(const std::string& msg)
        : std::invalid_argument("DataShapeError: " + msg) {}
};

// ---------------------------------------------------------------------------
// NumericalDivergenceError — optimizer / filter failure inside one stage.
// Caught at the stage boundary and turned into a degraded result.
// ---------------------------------------------------------------------------
class NumericalDivergenceError : public std::runtime_error {
public:
    explicit NumericalDivergenceError(const std::string& msg)
        : std::runtime_error("NumericalDivergenceError: " + msg) {}
};

// ---------------------------------------------------------------------------
// UnderdeterminedModelError — model requested without enough information
// (e.g. VECM over a single series). Non-fatal.
// ---------------------------------------------------------------------------
class UnderdeterminedModelError : public std::runtime_error {
public:
    explicit UnderdeterminedModelError(const std::string& msg)
        : std::runtime_error("UnderdeterminedModelError: " + msg) {}
};
