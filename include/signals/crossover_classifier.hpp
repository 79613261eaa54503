// crossover_classifier.hpp
// Close/Trend-Line Crossover Classification for the Latest Completed Bars
// Turns the supertrend line into one discrete signal per call

#pragma once

#include <optional>
#include <vector>
#include "../core/indicator_types.hpp"

namespace almatrend {

// ============================================================================
// Classification Types
// ============================================================================

// Second clause of the bear trend test. LEGACY_PREVIOUS_CLOSE, the default,
// compares trendLine[t-2] with close[t-1] as the production bot does.
// MIRRORED compares it with close[t-2], like the bull test.
enum class BearTrendRule {
    MIRRORED,
    LEGACY_PREVIOUS_CLOSE
};

struct CrossoverFlags {
    bool long_cross = false;
    bool short_cross = false;
    bool bull_trend = false;
    bool bear_trend = false;
};

struct Classification {
    IndicatorStatus status = IndicatorStatus::INSUFFICIENT_HISTORY;
    std::optional<Signal> signal;   // set only when status is OK
    CrossoverFlags flags;

    bool ok() const { return status == IndicatorStatus::OK; }
};

// ============================================================================
// Crossover Classifier
// ============================================================================

class CrossoverClassifier {
public:
    static constexpr size_t REQUIRED_BARS = 3;

    // t is the last index. Bars t-1 and t-2 decide the signal; bar t must be
    // defined as well.
    static Classification classify(const OptionalSeries& trend_line,
                                   const std::vector<double>& closes,
                                   BearTrendRule bear_rule = BearTrendRule::LEGACY_PREVIOUS_CLOSE) {
        Classification result;

        if (trend_line.size() != closes.size()) {
            result.status = IndicatorStatus::CONFIGURATION_ERROR;
            return result;
        }
        if (trailingDefinedCount(trend_line) < REQUIRED_BARS || !hasTrailingSamples(closes)) {
            result.status = IndicatorStatus::INSUFFICIENT_HISTORY;
            return result;
        }

        const size_t t = closes.size() - 1;
        const double trend1 = *trend_line[t - 1];
        const double trend2 = *trend_line[t - 2];
        const double close1 = closes[t - 1];
        const double close2 = closes[t - 2];

        CrossoverFlags& f = result.flags;
        f.long_cross = trend2 > close2 && trend1 < close1;
        f.short_cross = trend2 < close2 && trend1 > close1;
        f.bull_trend = trend1 < close1 && trend2 < close2;
        if (bear_rule == BearTrendRule::LEGACY_PREVIOUS_CLOSE) {
            f.bear_trend = trend1 > close1 && trend2 > close1;
        } else {
            f.bear_trend = trend1 > close1 && trend2 > close2;
        }

        if (f.long_cross) {
            result.signal = Signal::LONG_CROSS;
        } else if (f.short_cross) {
            result.signal = Signal::SHORT_CROSS;
        } else if (f.bull_trend) {
            result.signal = Signal::BULL;
        } else if (f.bear_trend) {
            result.signal = Signal::BEAR;
        } else {
            result.signal = Signal::NEUTRAL;
        }

        result.status = IndicatorStatus::OK;
        return result;
    }

private:
    static bool hasTrailingSamples(const std::vector<double>& closes) {
        if (closes.size() < REQUIRED_BARS) return false;
        for (size_t i = closes.size() - REQUIRED_BARS; i < closes.size(); ++i) {
            if (!isSample(closes[i])) return false;
        }
        return true;
    }
};

inline Classification classify(const OptionalSeries& trend_line,
                               const std::vector<double>& closes,
                               BearTrendRule bear_rule = BearTrendRule::LEGACY_PREVIOUS_CLOSE) {
    return CrossoverClassifier::classify(trend_line, closes, bear_rule);
}

// ============================================================================
// Signal Interpretation
// ============================================================================

inline MarketTrend toMarketTrend(Signal signal) {
    switch (signal) {
        case Signal::LONG_CROSS:
        case Signal::BULL:
            return MarketTrend::BULL;
        case Signal::SHORT_CROSS:
        case Signal::BEAR:
            return MarketTrend::BEAR;
        case Signal::NEUTRAL:
            break;
    }
    return MarketTrend::NEUTRAL;
}

inline SignalAction toSignalAction(Signal signal) {
    if (signal == Signal::LONG_CROSS) return SignalAction::BUY;
    if (signal == Signal::SHORT_CROSS) return SignalAction::SELL;
    return SignalAction::HOLD;
}

// Distance of the latest close from the latest trend value, in percent
inline std::optional<double> trendDistancePercent(const OptionalSeries& trend_line,
                                                  const std::vector<double>& closes) {
    if (trend_line.empty() || trend_line.size() != closes.size()) return std::nullopt;
    const auto& last = trend_line.back();
    if (!last || *last == 0.0 || !isSample(closes.back())) return std::nullopt;
    return 100.0 * (closes.back() / *last - 1.0);
}

} // namespace almatrend
