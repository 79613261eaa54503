// trend_evaluator.hpp
// Per-Symbol ALMA Supertrend Evaluation
// Applies the history policy, runs the indicator pipeline and classifies the latest bars

#pragma once

#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include "../core/indicator_types.hpp"
#include "../core/exceptions.hpp"
#include "../indicators/alma_supertrend.hpp"
#include "../signals/crossover_classifier.hpp"

namespace almatrend {

// ============================================================================
// Evaluation Report
// ============================================================================

struct SignalReport {
    std::string symbol;
    IndicatorStatus status = IndicatorStatus::INSUFFICIENT_HISTORY;
    std::optional<Signal> signal;
    MarketTrend market_trend = MarketTrend::NEUTRAL;
    SignalAction action = SignalAction::HOLD;
    CrossoverFlags flags;
    size_t bars_used = 0;

    std::optional<double> reference_trend;     // trend line at t-1, the level a cross is recorded at
    std::optional<double> latest_trend;        // trend line at t
    double latest_close = 0.0;
    std::optional<double> trend_distance_pct;  // latest close vs latest trend, percent

    bool ok() const { return status == IndicatorStatus::OK; }
};

// ============================================================================
// Trend Evaluator
// ============================================================================

class TrendEvaluator {
public:
    struct EvaluatorConfig {
        SupertrendConfig supertrend;
        size_t min_bars_required;   // fewer bars than this is reported as insufficient history
        size_t max_bars;            // trailing window fed to the indicator, 0 = all
        BearTrendRule bear_rule;
        bool verbose;

        EvaluatorConfig()
            : supertrend(SupertrendConfig::getDefault())
            , min_bars_required(100)
            , max_bars(750)
            , bear_rule(BearTrendRule::LEGACY_PREVIOUS_CLOSE)
            , verbose(false) {}

        static EvaluatorConfig getDefault() {
            return EvaluatorConfig();
        }
    };

private:
    EvaluatorConfig config_;

public:
    TrendEvaluator() : TrendEvaluator(EvaluatorConfig::getDefault()) {}

    explicit TrendEvaluator(const EvaluatorConfig& config)
        : config_(config) {
        if (config_.supertrend.validate() != IndicatorStatus::OK) {
            throw ConfigException("ALMA length, SD length and sigma must be positive");
        }
        if (config_.max_bars != 0 && config_.max_bars < config_.min_bars_required) {
            throw ConfigException("max_bars (" + std::to_string(config_.max_bars) +
                                  ") is below min_bars_required (" +
                                  std::to_string(config_.min_bars_required) + ")");
        }
        if (config_.max_bars != 0 && config_.max_bars < CrossoverClassifier::REQUIRED_BARS) {
            throw ConfigException("max_bars must cover at least " +
                                  std::to_string(CrossoverClassifier::REQUIRED_BARS) + " bars");
        }
    }

    const EvaluatorConfig& getConfig() const { return config_; }

    // Trailing window the indicator actually sees
    PriceSeries window(const PriceSeries& bars) const {
        return config_.max_bars == 0 ? bars : bars.tail(config_.max_bars);
    }

    SupertrendSeries computeSeries(const PriceSeries& bars) const {
        return AlmaSupertrend::compute(window(bars), config_.supertrend);
    }

    SignalReport evaluate(const std::string& symbol, const PriceSeries& bars) const {
        SignalReport report;
        report.symbol = symbol;

        if (bars.empty() || bars.size() < config_.min_bars_required) {
            report.status = IndicatorStatus::INSUFFICIENT_HISTORY;
            report.bars_used = bars.size();
            if (config_.verbose) {
                std::cout << "[Evaluator] " << symbol << " insufficient klines: " << bars.size()
                          << " (need " << config_.min_bars_required << ")" << std::endl;
            }
            return report;
        }

        const PriceSeries input = window(bars);
        report.bars_used = input.size();
        report.latest_close = input.close.back();

        const SupertrendSeries series = AlmaSupertrend::compute(input, config_.supertrend);
        if (!series.ok()) {
            report.status = series.status;
            if (config_.verbose) {
                std::cout << "[Evaluator] " << symbol << " supertrend failed: "
                          << toString(series.status) << std::endl;
            }
            return report;
        }

        const Classification cls = CrossoverClassifier::classify(series.trend_line, input.close,
                                                                 config_.bear_rule);
        report.status = cls.status;
        report.flags = cls.flags;
        if (!cls.ok()) {
            if (config_.verbose) {
                std::cout << "[Evaluator] " << symbol << " classification failed: "
                          << toString(cls.status) << std::endl;
            }
            return report;
        }

        const size_t t = input.size() - 1;
        report.signal = cls.signal;
        report.market_trend = toMarketTrend(*cls.signal);
        report.action = toSignalAction(*cls.signal);
        report.reference_trend = series.trend_line[t - 1];
        report.latest_trend = series.trend_line[t];
        report.trend_distance_pct = trendDistancePercent(series.trend_line, input.close);

        if (config_.verbose) {
            std::cout << "[Evaluator] " << symbol << " " << toString(*cls.signal)
                      << " trend=" << toString(report.market_trend)
                      << " action=" << toString(report.action)
                      << " close=" << report.latest_close
                      << " supertrend=" << *report.latest_trend;
            if (report.trend_distance_pct) {
                std::ostringstream pct;
                pct << std::fixed << std::setprecision(2) << *report.trend_distance_pct;
                std::cout << " distance=" << pct.str() << "%";
            }
            std::cout << std::endl;
        }

        return report;
    }
};

} // namespace almatrend
