// adaptive_band_engine.hpp
// Supertrend Band/Direction State Machine over ALMA and Rolling Dispersion
// Ratchets support/resistance bands and flips direction when price breaks through

#pragma once

#include <vector>
#include <algorithm>
#include "../core/indicator_types.hpp"

namespace almatrend {

// ============================================================================
// Band Engine Output
// ============================================================================

struct SupertrendSeries {
    IndicatorStatus status = IndicatorStatus::OK;
    size_t start_index = 0;        // first index with band values; size() when none
    OptionalSeries upper_band;
    OptionalSeries lower_band;
    DirectionSeries direction;
    OptionalSeries trend_line;

    bool ok() const { return status == IndicatorStatus::OK; }
    size_t size() const { return trend_line.size(); }

    void resize(size_t n) {
        upper_band.assign(n, std::nullopt);
        lower_band.assign(n, std::nullopt);
        direction.assign(n, std::nullopt);
        trend_line.assign(n, std::nullopt);
    }
};

// ============================================================================
// Adaptive Band Engine
// ============================================================================

class AdaptiveBandEngine {
public:
    // Processes bars strictly left to right; index i reads only state at indices < i
    // plus the inputs at i. The trend line equality test against the previous upper
    // band is an exact comparison and selects which band the direction follows.
    static SupertrendSeries compute(const std::vector<double>& closes,
                                    const OptionalSeries& filter,
                                    const OptionalSeries& dispersion,
                                    double factor) {
        SupertrendSeries out;
        const size_t n = closes.size();
        out.resize(n);
        out.start_index = n;

        if (filter.size() != n || dispersion.size() != n) {
            out.status = IndicatorStatus::CONFIGURATION_ERROR;
            return out;
        }

        const size_t filter_start = firstDefinedIndex(filter);
        const size_t dispersion_start = firstDefinedIndex(dispersion);
        if (filter_start == n || dispersion_start == n) {
            out.status = IndicatorStatus::INSUFFICIENT_HISTORY;
            return out;
        }

        const size_t start = std::max(filter_start, dispersion_start);
        out.start_index = start;

        for (size_t i = start; i < n; ++i) {
            if (!filter[i] || !dispersion[i]) continue;

            const double ub_basic = *filter[i] + factor * *dispersion[i];
            const double lb_basic = *filter[i] - factor * *dispersion[i];

            // Self-seed from the basic bands on the first bar or after a gap
            const bool has_prev = i > start;
            const double prev_ub = (has_prev && out.upper_band[i - 1]) ? *out.upper_band[i - 1] : ub_basic;
            const double prev_lb = (has_prev && out.lower_band[i - 1]) ? *out.lower_band[i - 1] : lb_basic;

            const bool has_prev_close = i > 0 && isSample(closes[i - 1]);
            const double prev_close = has_prev_close ? closes[i - 1] : 0.0;

            const double upper = (ub_basic < prev_ub || (has_prev_close && prev_close > prev_ub))
                                     ? ub_basic : prev_ub;
            const double lower = (lb_basic > prev_lb || (has_prev_close && prev_close < prev_lb))
                                     ? lb_basic : prev_lb;
            out.upper_band[i] = upper;
            out.lower_band[i] = lower;

            Direction dir;
            if (i == start || !dispersion[i - 1]) {
                dir = Direction::UP;
            } else if (out.trend_line[i - 1] && out.upper_band[i - 1] &&
                       *out.trend_line[i - 1] == *out.upper_band[i - 1]) {
                dir = closes[i] > upper ? Direction::DOWN : Direction::UP;
            } else {
                dir = closes[i] < lower ? Direction::UP : Direction::DOWN;
            }

            out.direction[i] = dir;
            out.trend_line[i] = (dir == Direction::DOWN) ? lower : upper;
        }

        return out;
    }
};

} // namespace almatrend
