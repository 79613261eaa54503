// alma_filter.hpp
// Arnaud Legoux Moving Average (Gaussian-weighted moving average)
// Weights are computed once per parameter set and applied to every full window

#pragma once

#include <cmath>
#include <vector>
#include "../core/indicator_types.hpp"

namespace almatrend {

// ============================================================================
// Filter Parameters
// ============================================================================

struct FilterParameters {
    int length;      // window size in bars
    double offset;   // kernel centre as a fraction of the window, 0 = oldest, 1 = newest
    double sigma;    // kernel sharpness, larger is sharper

    FilterParameters()
        : length(5)
        , offset(0.85)
        , sigma(2.75) {}

    FilterParameters(int len, double off, double sig)
        : length(len)
        , offset(off)
        , sigma(sig) {}

    static FilterParameters getDefault() {
        return FilterParameters();
    }
};

// ============================================================================
// ALMA Filter
// ============================================================================

class AlmaFilter {
private:
    FilterParameters params_;
    std::vector<double> weights_;   // weights_[k], k = 0 is the oldest sample in the window
    double weight_sum_ = 0.0;

    void buildWeights() {
        weights_.clear();
        weight_sum_ = 0.0;
        if (params_.length <= 0) return;

        const double m = params_.offset * static_cast<double>(params_.length - 1);
        const double s = static_cast<double>(params_.length) / params_.sigma;
        const double denom = 2.0 * (s * s);

        weights_.reserve(static_cast<size_t>(params_.length));
        for (int k = 0; k < params_.length; ++k) {
            const double d = static_cast<double>(k) - m;
            const double w = std::exp(-(d * d) / denom);
            weights_.push_back(w);
            weight_sum_ += w;
        }
    }

public:
    explicit AlmaFilter(const FilterParameters& params)
        : params_(params) {
        buildWeights();
    }

    bool isValid() const { return params_.length > 0; }

    const FilterParameters& getParameters() const { return params_; }
    const std::vector<double>& getWeights() const { return weights_; }
    double getWeightSum() const { return weight_sum_; }

    // Weighted average of the window ending at index `end` (inclusive).
    // Caller guarantees end + 1 >= length.
    std::optional<double> valueAt(const std::vector<double>& prices, size_t end) const {
        const size_t len = weights_.size();
        const size_t first = end + 1 - len;

        double acc = 0.0;
        for (size_t k = 0; k < len; ++k) {
            const double price = prices[first + k];
            if (!isSample(price)) return std::nullopt;
            acc += weights_[k] * price;
        }
        return acc / weight_sum_;
    }

    // Same length as the input; Undefined before index length-1, and everywhere
    // when the parameters are malformed.
    OptionalSeries compute(const std::vector<double>& prices) const {
        OptionalSeries out(prices.size());
        if (!isValid()) return out;

        const size_t len = weights_.size();
        for (size_t i = len - 1; i < prices.size(); ++i) {
            out[i] = valueAt(prices, i);
        }
        return out;
    }

    static OptionalSeries compute(const std::vector<double>& prices, const FilterParameters& params) {
        return AlmaFilter(params).compute(prices);
    }
};

} // namespace almatrend
