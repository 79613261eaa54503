// indicator_types.hpp
// Shared Series, Direction, Signal and Status Types for the Indicator Pipeline
// Every derived series carries "no value yet" explicitly as an empty optional

#pragma once

#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace almatrend {

// ============================================================================
// Series Types
// ============================================================================

// Oldest bar first. An empty optional marks an index without enough history.
using OptionalSeries = std::vector<std::optional<double>>;

enum class Direction : int8_t {
    UP = 1,
    DOWN = -1
};

using DirectionSeries = std::vector<std::optional<Direction>>;

// OHLCV columns of one symbol, oldest bar first. Only close feeds the indicator.
struct PriceSeries {
    std::vector<int64_t> timestamps;
    std::vector<double> open;
    std::vector<double> high;
    std::vector<double> low;
    std::vector<double> close;
    std::vector<double> volume;

    size_t size() const { return close.size(); }
    bool empty() const { return close.empty(); }

    void reserve(size_t n) {
        timestamps.reserve(n);
        open.reserve(n);
        high.reserve(n);
        low.reserve(n);
        close.reserve(n);
        volume.reserve(n);
    }

    // Keep only the most recent n bars. Columns are aligned at the newest bar;
    // a column left empty (close-only input) stays empty.
    PriceSeries tail(size_t n) const {
        if (n >= size()) return *this;
        PriceSeries out;
        out.timestamps = lastN(timestamps, n);
        out.open = lastN(open, n);
        out.high = lastN(high, n);
        out.low = lastN(low, n);
        out.close = lastN(close, n);
        out.volume = lastN(volume, n);
        return out;
    }

private:
    template <typename T>
    static std::vector<T> lastN(const std::vector<T>& column, size_t n) {
        const size_t from = column.size() > n ? column.size() - n : 0;
        return std::vector<T>(column.begin() + from, column.end());
    }
};

// ============================================================================
// Result Status and Signal Enumerations
// ============================================================================

enum class IndicatorStatus {
    OK,
    CONFIGURATION_ERROR,   // non-positive length, window or sigma
    INSUFFICIENT_HISTORY   // input shorter than the lookback, or too few defined bars
};

enum class Signal {
    LONG_CROSS,
    SHORT_CROSS,
    BULL,
    BEAR,
    NEUTRAL
};

enum class MarketTrend {
    BULL,
    BEAR,
    NEUTRAL
};

enum class SignalAction {
    BUY,
    SELL,
    HOLD
};

inline const char* toString(IndicatorStatus status) {
    switch (status) {
        case IndicatorStatus::OK: return "OK";
        case IndicatorStatus::CONFIGURATION_ERROR: return "CONFIGURATION_ERROR";
        case IndicatorStatus::INSUFFICIENT_HISTORY: return "INSUFFICIENT_HISTORY";
    }
    return "UNKNOWN";
}

inline const char* toString(Signal signal) {
    switch (signal) {
        case Signal::LONG_CROSS: return "LONG_CROSS";
        case Signal::SHORT_CROSS: return "SHORT_CROSS";
        case Signal::BULL: return "BULL";
        case Signal::BEAR: return "BEAR";
        case Signal::NEUTRAL: return "NEUTRAL";
    }
    return "UNKNOWN";
}

inline const char* toString(MarketTrend trend) {
    switch (trend) {
        case MarketTrend::BULL: return "BULL";
        case MarketTrend::BEAR: return "BEAR";
        case MarketTrend::NEUTRAL: return "NEUTRAL";
    }
    return "UNKNOWN";
}

inline const char* toString(SignalAction action) {
    switch (action) {
        case SignalAction::BUY: return "BUY";
        case SignalAction::SELL: return "SELL";
        case SignalAction::HOLD: return "HOLD";
    }
    return "UNKNOWN";
}

inline const char* toString(Direction direction) {
    return direction == Direction::UP ? "UP" : "DOWN";
}

// ============================================================================
// Series Helpers
// ============================================================================

// Index of the first defined value, or series.size() if there is none
inline size_t firstDefinedIndex(const OptionalSeries& series) {
    for (size_t i = 0; i < series.size(); ++i) {
        if (series[i].has_value()) return i;
    }
    return series.size();
}

// Number of consecutive defined values ending at the last index
inline size_t trailingDefinedCount(const OptionalSeries& series) {
    size_t count = 0;
    for (auto it = series.rbegin(); it != series.rend() && it->has_value(); ++it) {
        ++count;
    }
    return count;
}

inline size_t definedCount(const OptionalSeries& series) {
    size_t count = 0;
    for (const auto& value : series) {
        if (value) ++count;
    }
    return count;
}

inline bool isSample(double value) {
    return std::isfinite(value);
}

} // namespace almatrend
