// rolling_dispersion.hpp
// Rolling Sample Standard Deviation over a Fixed Trailing Window
// Two-pass recomputation per bar so identical windows always give identical results

#pragma once

#include <cmath>
#include <deque>
#include <vector>
#include <algorithm>
#include "../core/indicator_types.hpp"

namespace almatrend {

// ============================================================================
// Rolling Window Statistics
// ============================================================================

class RollingStatistics {
private:
    size_t window_size_;
    std::deque<double> values_;
    size_t non_finite_count_ = 0;   // samples in the window that are NaN or infinite

    double mean_ = 0.0;
    double variance_ = 0.0;
    double std_dev_ = 0.0;

    void recompute() {
        const size_t n = values_.size();
        if (n == 0 || non_finite_count_ > 0) {
            mean_ = 0.0;
            variance_ = 0.0;
            std_dev_ = 0.0;
            return;
        }

        double sum = 0.0;
        for (double v : values_) sum += v;
        mean_ = sum / static_cast<double>(n);

        if (n > 1) {
            double ss = 0.0;
            for (double v : values_) {
                const double d = v - mean_;
                ss += d * d;
            }
            // Sample variance: divisor n-1
            variance_ = ss / static_cast<double>(n - 1);
            std_dev_ = std::sqrt(variance_);
        } else {
            variance_ = 0.0;
            std_dev_ = 0.0;
        }
    }

public:
    explicit RollingStatistics(size_t window_size)
        : window_size_(window_size) {}

    void update(double value) {
        values_.push_back(value);
        if (!isSample(value)) ++non_finite_count_;

        if (values_.size() > window_size_) {
            if (!isSample(values_.front())) --non_finite_count_;
            values_.pop_front();
        }

        recompute();
    }

    // Full window of finite samples with at least two of them
    bool hasSampleStdDev() const {
        return window_size_ > 1 && values_.size() == window_size_ && non_finite_count_ == 0;
    }

    double getMean() const { return mean_; }
    double getVariance() const { return variance_; }
    double getStdDev() const { return std_dev_; }
    size_t getCount() const { return values_.size(); }
    size_t getWindowSize() const { return window_size_; }
    bool isFull() const { return values_.size() == window_size_; }

    void reset() {
        values_.clear();
        non_finite_count_ = 0;
        mean_ = 0.0;
        variance_ = 0.0;
        std_dev_ = 0.0;
    }

    const std::deque<double>& getValues() const { return values_; }
};

// ============================================================================
// Rolling Dispersion Series
// ============================================================================

class RollingDispersion {
public:
    // Undefined before index window-1. A window of one sample has no sample
    // standard deviation, so window 1 leaves every index Undefined.
    static OptionalSeries compute(const std::vector<double>& prices, int window) {
        OptionalSeries out(prices.size());
        if (window <= 0) return out;

        RollingStatistics stats(static_cast<size_t>(window));
        for (size_t i = 0; i < prices.size(); ++i) {
            stats.update(prices[i]);
            if (stats.hasSampleStdDev()) {
                out[i] = stats.getStdDev();
            }
        }
        return out;
    }
};

} // namespace almatrend
