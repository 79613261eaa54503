// test_crossover_classifier.cpp
// Unit tests for crossover classification and signal interpretation

#include <limits>
#include <random>
#include <vector>
#include "../include/signals/crossover_classifier.hpp"
#include "test_reporter.hpp"

using namespace almatrend;

namespace {

// Three defined bars: [t-2, t-1, t]
Classification classifyBars(double trend2, double close2, double trend1, double close1,
                            BearTrendRule rule = BearTrendRule::MIRRORED) {
    OptionalSeries trend = {std::nullopt, trend2, trend1, 100.0};
    std::vector<double> closes = {100.0, close2, close1, 100.0};
    return classify(trend, closes, rule);
}

void checkSignal(const Classification& c, Signal expected, const std::string& what) {
    check(c.ok(), what + ": status " + toString(c.status));
    check(c.signal.has_value(), what + ": no signal");
    check(*c.signal == expected, what + ": expected " + toString(expected) + ", got " + toString(*c.signal));
}

} // namespace

void test_long_cross() {
    auto c = classifyBars(110, 100, 90, 100);
    checkSignal(c, Signal::LONG_CROSS, "trend crosses below close");
    check(c.flags.long_cross && !c.flags.short_cross, "long flag only");
}

void test_short_cross() {
    auto c = classifyBars(90, 100, 110, 100);
    checkSignal(c, Signal::SHORT_CROSS, "trend crosses above close");
    check(c.flags.short_cross && !c.flags.long_cross, "short flag only");
}

void test_bull_trend() {
    auto c = classifyBars(90, 100, 95, 101);
    checkSignal(c, Signal::BULL, "trend below close on both bars");
    check(c.flags.bull_trend && !c.flags.bear_trend, "bull flag");
}

void test_bear_trend() {
    auto c = classifyBars(110, 100, 108, 99);
    checkSignal(c, Signal::BEAR, "trend above close on both bars");
    check(c.flags.bear_trend && !c.flags.bull_trend, "bear flag");
}

void test_neutral_when_touching() {
    checkSignal(classifyBars(100, 100, 100, 100), Signal::NEUTRAL, "trend equals close");
    checkSignal(classifyBars(100, 100, 90, 100), Signal::NEUTRAL, "touch then below");
    checkSignal(classifyBars(90, 100, 100, 100), Signal::NEUTRAL, "below then touch");
}

void test_only_previous_bars_decide() {
    // The newest bar is not part of the crossover test
    OptionalSeries trend = {110.0, 90.0, 1000.0};
    std::vector<double> closes = {100.0, 100.0, 1.0};
    checkSignal(classify(trend, closes), Signal::LONG_CROSS, "bars t-2 and t-1");
}

void test_bear_rule_variants() {
    // trendLine[t-2] equals close[t-2] but sits above close[t-1]
    auto mirrored = classifyBars(100, 100, 97, 95, BearTrendRule::MIRRORED);
    checkSignal(mirrored, Signal::NEUTRAL, "mirrored rule");

    auto legacy = classifyBars(100, 100, 97, 95, BearTrendRule::LEGACY_PREVIOUS_CLOSE);
    checkSignal(legacy, Signal::BEAR, "legacy rule");

    // Both rules agree in the ordinary case
    checkSignal(classifyBars(110, 100, 108, 99, BearTrendRule::LEGACY_PREVIOUS_CLOSE),
                Signal::BEAR, "legacy ordinary bear");
}

void test_default_bear_rule_uses_previous_close() {
    // trendLine[t-2] = 102 is above close[t-2] = 100 but below close[t-1] = 103
    OptionalSeries trend = {102.0, 104.0, 100.0};
    std::vector<double> closes = {100.0, 103.0, 100.0};
    checkSignal(classify(trend, closes), Signal::NEUTRAL, "default rule");
    checkSignal(classify(trend, closes, BearTrendRule::LEGACY_PREVIOUS_CLOSE), Signal::NEUTRAL,
                "previous-close rule");
    checkSignal(classify(trend, closes, BearTrendRule::MIRRORED), Signal::BEAR, "mirrored rule");
}

void test_insufficient_history() {
    OptionalSeries trend = {std::nullopt, 1.0, 2.0};
    std::vector<double> closes = {1.0, 1.0, 1.0};
    auto c = classify(trend, closes);
    check(c.status == IndicatorStatus::INSUFFICIENT_HISTORY, "only two defined bars");
    check(!c.signal.has_value(), "no signal without history");

    check(classify({1.0, 2.0}, {1.0, 2.0}).status == IndicatorStatus::INSUFFICIENT_HISTORY, "two bars");
    check(classify({}, {}).status == IndicatorStatus::INSUFFICIENT_HISTORY, "empty");

    OptionalSeries last_missing = {1.0, 2.0, 3.0, std::nullopt};
    check(classify(last_missing, {1, 2, 3, 4}).status == IndicatorStatus::INSUFFICIENT_HISTORY,
          "newest trend value undefined");

    std::vector<double> bad_close = {1.0, std::numeric_limits<double>::quiet_NaN(), 1.0};
    check(classify({1.0, 1.0, 1.0}, bad_close).status == IndicatorStatus::INSUFFICIENT_HISTORY,
          "non-finite close");
}

void test_length_mismatch() {
    OptionalSeries trend = {1.0, 2.0, 3.0};
    std::vector<double> closes = {1.0, 2.0, 3.0, 4.0};
    check(classify(trend, closes).status == IndicatorStatus::CONFIGURATION_ERROR, "mismatched lengths");
}

void test_exactly_one_signal() {
    std::mt19937 rng(7);
    std::uniform_int_distribution<int> level(0, 4);
    for (int n = 0; n < 2000; ++n) {
        double t2 = 98 + level(rng), c2 = 98 + level(rng);
        double t1 = 98 + level(rng), c1 = 98 + level(rng);
        auto c = classifyBars(t2, c2, t1, c1);
        check(c.ok() && c.signal.has_value(), "classified");
        check(!(c.flags.long_cross && c.flags.short_cross), "long and short never both hold");

        Signal expected = Signal::NEUTRAL;
        if (c.flags.long_cross) expected = Signal::LONG_CROSS;
        else if (c.flags.short_cross) expected = Signal::SHORT_CROSS;
        else if (c.flags.bull_trend) expected = Signal::BULL;
        else if (c.flags.bear_trend) expected = Signal::BEAR;
        check(*c.signal == expected, "precedence order");
    }
}

void test_signal_interpretation() {
    check(toMarketTrend(Signal::LONG_CROSS) == MarketTrend::BULL, "long cross is bullish");
    check(toMarketTrend(Signal::BULL) == MarketTrend::BULL, "bull");
    check(toMarketTrend(Signal::SHORT_CROSS) == MarketTrend::BEAR, "short cross is bearish");
    check(toMarketTrend(Signal::BEAR) == MarketTrend::BEAR, "bear");
    check(toMarketTrend(Signal::NEUTRAL) == MarketTrend::NEUTRAL, "neutral");

    check(toSignalAction(Signal::LONG_CROSS) == SignalAction::BUY, "buy on long cross");
    check(toSignalAction(Signal::SHORT_CROSS) == SignalAction::SELL, "sell on short cross");
    check(toSignalAction(Signal::BULL) == SignalAction::HOLD, "hold in trend");
    check(toSignalAction(Signal::NEUTRAL) == SignalAction::HOLD, "hold when neutral");

    check(std::string(toString(Signal::SHORT_CROSS)) == "SHORT_CROSS", "signal name");
}

void test_trend_distance() {
    OptionalSeries trend = {std::nullopt, 100.0};
    std::vector<double> closes = {1.0, 110.0};
    auto d = trendDistancePercent(trend, closes);
    check(d.has_value(), "distance defined");
    checkNear(*d, 10.0, 1e-9, "ten percent above");

    check(!trendDistancePercent({1.0, std::nullopt}, {1.0, 1.0}).has_value(), "undefined trend");
    check(!trendDistancePercent({1.0, 0.0}, {1.0, 1.0}).has_value(), "zero trend");
}

int main() {
    std::cout << "\n=== Crossover Classifier Tests ===\n" << std::endl;

    TestReporter reporter;
    reporter.test("Long Cross", test_long_cross);
    reporter.test("Short Cross", test_short_cross);
    reporter.test("Bull Trend", test_bull_trend);
    reporter.test("Bear Trend", test_bear_trend);
    reporter.test("Neutral When Touching", test_neutral_when_touching);
    reporter.test("Only Previous Bars Decide", test_only_previous_bars_decide);
    reporter.test("Bear Rule Variants", test_bear_rule_variants);
    reporter.test("Default Bear Rule", test_default_bear_rule_uses_previous_close);
    reporter.test("Insufficient History", test_insufficient_history);
    reporter.test("Length Mismatch", test_length_mismatch);
    reporter.test("Exactly One Signal", test_exactly_one_signal);
    reporter.test("Signal Interpretation", test_signal_interpretation);
    reporter.test("Trend Distance", test_trend_distance);

    return reporter.report();
}
