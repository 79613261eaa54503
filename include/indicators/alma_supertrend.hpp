// alma_supertrend.hpp
// ALMA SD Supertrend Indicator Pipeline
// ALMA filter and rolling sample deviation feed the adaptive band engine

#pragma once

#include <vector>
#include <algorithm>
#include <utility>
#include "../core/indicator_types.hpp"
#include "alma_filter.hpp"
#include "rolling_dispersion.hpp"
#include "adaptive_band_engine.hpp"

namespace almatrend {

// ============================================================================
// Indicator Configuration
// ============================================================================

struct SupertrendConfig {
    int alma_length;
    double alma_offset;
    double alma_sigma;
    int sd_length;       // rolling dispersion window
    double factor;       // band width in deviations

    SupertrendConfig()
        : alma_length(5)
        , alma_offset(0.85)
        , alma_sigma(2.75)
        , sd_length(20)
        , factor(1.8) {}

    static SupertrendConfig getDefault() {
        return SupertrendConfig();
    }

    FilterParameters filterParameters() const {
        return FilterParameters(alma_length, alma_offset, alma_sigma);
    }

    // Bars needed before the first band value exists
    size_t lookback() const {
        return static_cast<size_t>(std::max(std::max(alma_length, sd_length), 0));
    }

    IndicatorStatus validate() const {
        if (alma_length <= 0 || sd_length <= 0 || !(alma_sigma > 0.0)) {
            return IndicatorStatus::CONFIGURATION_ERROR;
        }
        return IndicatorStatus::OK;
    }
};

struct TrendLineResult {
    IndicatorStatus status = IndicatorStatus::OK;
    OptionalSeries trend_line;

    bool ok() const { return status == IndicatorStatus::OK; }
};

// ============================================================================
// Pipeline
// ============================================================================

class AlmaSupertrend {
public:
    // Full band state. Every series has the input's length; a failed status
    // comes with all-Undefined series.
    static SupertrendSeries compute(const std::vector<double>& closes, const SupertrendConfig& config) {
        SupertrendSeries out;

        IndicatorStatus status = config.validate();
        if (status == IndicatorStatus::OK && closes.size() < config.lookback()) {
            status = IndicatorStatus::INSUFFICIENT_HISTORY;
        }
        if (status != IndicatorStatus::OK) {
            out.resize(closes.size());
            out.start_index = closes.size();
            out.status = status;
            return out;
        }

        const OptionalSeries filter = AlmaFilter::compute(closes, config.filterParameters());
        const OptionalSeries dispersion = RollingDispersion::compute(closes, config.sd_length);
        return AdaptiveBandEngine::compute(closes, filter, dispersion, config.factor);
    }

    // High and low are accepted for call-site compatibility and never read
    static SupertrendSeries compute(const std::vector<double>& closes,
                                    const std::vector<double>& /*highs*/,
                                    const std::vector<double>& /*lows*/,
                                    const SupertrendConfig& config) {
        return compute(closes, config);
    }

    static SupertrendSeries compute(const PriceSeries& bars, const SupertrendConfig& config) {
        return compute(bars.close, config);
    }
};

inline SupertrendConfig makeSupertrendConfig(const FilterParameters& filter_params,
                                             int dispersion_window,
                                             double band_factor) {
    SupertrendConfig config;
    config.alma_length = filter_params.length;
    config.alma_offset = filter_params.offset;
    config.alma_sigma = filter_params.sigma;
    config.sd_length = dispersion_window;
    config.factor = band_factor;
    return config;
}

inline SupertrendSeries computeSupertrend(const std::vector<double>& closes,
                                          const FilterParameters& filter_params,
                                          int dispersion_window,
                                          double band_factor) {
    return AlmaSupertrend::compute(closes, makeSupertrendConfig(filter_params, dispersion_window, band_factor));
}

inline TrendLineResult computeTrendLine(const std::vector<double>& closes,
                                        const FilterParameters& filter_params,
                                        int dispersion_window,
                                        double band_factor) {
    SupertrendSeries series = computeSupertrend(closes, filter_params, dispersion_window, band_factor);
    TrendLineResult result;
    result.status = series.status;
    result.trend_line = std::move(series.trend_line);
    return result;
}

inline TrendLineResult computeTrendLine(const std::vector<double>& closes, const SupertrendConfig& config) {
    SupertrendSeries series = AlmaSupertrend::compute(closes, config);
    TrendLineResult result;
    result.status = series.status;
    result.trend_line = std::move(series.trend_line);
    return result;
}

} // namespace almatrend
