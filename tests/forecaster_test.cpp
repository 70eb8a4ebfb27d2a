#include "codec/abi_word.hpp"
#include "codec/signal_codec.hpp"
#include "forecast/forecaster.hpp"

#include <cassert>
#include <cstdint>
#include <stdexcept>
#include <vector>

using augur::core::Uint256;
using augur::forecast::Forecaster;
using augur::forecast::ForecasterConfig;

namespace {

constexpr uint64_t kEth = 1'000'000'000'000'000'000ULL;

void test_upward_trend_buys() {
    const Forecaster forecaster;
    const auto report = forecaster.forecast(3'600'000'000'000'000'000ULL); // 3.6 ETH

    assert(report.trend.slope > 0);
    assert(report.next_index == 31);
    assert(report.forecast_native == 3718);
    assert(report.threshold == 3216);
    assert(report.forecast_native > static_cast<int64_t>(report.threshold));

    const auto& signal = report.signal;
    assert(signal.decision == DECISION_BUY);
    assert(signal.confidence == Uint256(97));
    assert(signal.confidence <= Uint256(100));
    assert(signal.forecast_value == Uint256(4'182'750'000'000'000'000ULL));
}

void test_deterministic() {
    const Forecaster first;
    const Forecaster second;
    const auto a = augur::codec::encode_signal(first.run(3'700'000'000'000'000'000ULL));
    const auto b = augur::codec::encode_signal(second.run(3'700'000'000'000'000'000ULL));
    const auto c = augur::codec::encode_signal(first.run(3'700'000'000'000'000'000ULL));
    assert(a == b);
    assert(a == c);
}

void test_decision_ignores_observed_amount() {
    const Forecaster forecaster;
    const auto small = forecaster.forecast(3'600'000'000'000'000'000ULL);
    const auto large = forecaster.forecast(5'000'000'000'000'000'000ULL); // 5.0 ETH

    const uint8_t expected = (large.forecast_native > static_cast<int64_t>(large.threshold)) ? DECISION_BUY : DECISION_SELL;
    assert(large.signal.decision == expected);
    assert(large.signal.decision == small.signal.decision);
    assert(large.signal.forecast_value == Uint256(5'809'375'000'000'000'000ULL));

    const auto none = forecaster.run(0);
    assert(none.decision == small.signal.decision);
    assert(none.forecast_value.is_zero());
}

void test_output_range() {
    const Forecaster forecaster;
    const auto signal = forecaster.run(3'700'000'000'000'000'000ULL);
    assert(signal.decision == DECISION_SELL || signal.decision == DECISION_BUY);
    assert(signal.confidence <= Uint256(100));
    assert(signal.forecast_value > Uint256(1 * kEth));
    assert(signal.forecast_value < Uint256(18 * kEth));
    assert(signal.forecast_value == Uint256(4'298'937'500'000'000'000ULL));
}

void test_wide_rescale_does_not_wrap() {
    const Forecaster forecaster;
    const auto signal = forecaster.run(UINT64_MAX);
    assert(!signal.forecast_value.fits_u64());
    assert(signal.forecast_value.to_string() == "21432810770641285282");
}

void test_config_variants() {
    // Raising the reference to the forecast itself leaves no +0.5% headroom.
    ForecasterConfig at_forecast{};
    at_forecast.reference_price = 3718;
    const Forecaster flat_reference(at_forecast);
    const auto hold = flat_reference.forecast(2 * kEth);
    assert(hold.threshold == 3736);
    assert(hold.signal.decision == DECISION_SELL);
    assert(hold.signal.forecast_value == Uint256(2 * kEth));

    // Zero reference: the observed amount passes through unscaled.
    ForecasterConfig zero_reference{};
    zero_reference.reference_price = 0;
    const auto passthrough = Forecaster(zero_reference).run(kEth);
    assert(passthrough.forecast_value == Uint256(kEth));
    assert(passthrough.decision == DECISION_BUY);

    // Zero divisor: the threshold is the reference itself.
    ForecasterConfig no_margin{};
    no_margin.threshold_divisor = 0;
    assert(Forecaster(no_margin).forecast(kEth).threshold == 3200);

    // A trend projecting below zero sells and forecasts nothing.
    ForecasterConfig crash{};
    crash.series = {{1, 200}, {2, 100}, {3, 0}};
    const auto crashed = Forecaster(crash).forecast(kEth);
    assert(crashed.forecast_native == -100);
    assert(crashed.signal.decision == DECISION_SELL);
    assert(crashed.signal.forecast_value.is_zero());
    assert(crashed.signal.confidence == Uint256(100));

    // Flat prices above the threshold: a buy with zero confidence.
    ForecasterConfig flat{};
    flat.series = {{1, 3300}, {2, 3300}, {3, 3300}};
    const auto level = Forecaster(flat).run(kEth);
    assert(level.confidence.is_zero());
    assert(level.decision == DECISION_BUY);
    assert(level.forecast_value == Uint256(1'031'250'000'000'000'000ULL));
}

void test_rejects_bad_series() {
    ForecasterConfig bad{};
    bad.series = {{5, 100}};
    bool threw = false;
    try {
        Forecaster forecaster(bad);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    bad.series = {{2, 100}, {2, 101}};
    threw = false;
    try {
        Forecaster forecaster(bad);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

void test_guest_entry() {
    const Forecaster forecaster;
    const std::vector<uint8_t> input = augur::codec::encode_observed_amount(3'600'000'000'000'000'000ULL);
    assert(input.size() == 32);

    auto journal = augur::forecast::run_guest(forecaster, input.data(), input.size());
    assert(journal.has_value());
    assert(journal.value() == augur::codec::encode_signal(forecaster.run(3'600'000'000'000'000'000ULL)));
    assert(journal.value()[31] == DECISION_BUY);
    assert(journal.value()[63] == 97);

    auto short_input = augur::forecast::run_guest(forecaster, input.data(), input.size() - 1);
    assert(!short_input);
    assert(short_input.error() == augur::core::ErrorCode::WrongLength);

    std::vector<uint8_t> wide = input;
    wide[0] = 0x01;
    auto too_wide = augur::forecast::run_guest(forecaster, wide.data(), wide.size());
    assert(!too_wide);
    assert(too_wide.error() == augur::core::ErrorCode::Range);
}

}

int main() {
    test_upward_trend_buys();
    test_deterministic();
    test_decision_ignores_observed_amount();
    test_output_range();
    test_wide_rescale_does_not_wrap();
    test_config_variants();
    test_rejects_bad_series();
    test_guest_entry();
    return 0;
}
