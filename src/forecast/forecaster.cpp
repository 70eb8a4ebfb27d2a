#include "forecast/forecaster.hpp"

#include "codec/abi_word.hpp"

#include <stdexcept>
#include <utility>

namespace augur::forecast {

Forecaster::Forecaster(ForecasterConfig config) : config_(std::move(config)) {
    if (validate_series(config_.series.data(), config_.series.size()) != AUGUR_OK) {
        throw std::invalid_argument("forecaster series needs two or more points with increasing time indices");
    }
}

core::SignalResult Forecaster::run(uint64_t observed_amount) const {
    return forecast(observed_amount).signal;
}

ForecastReport Forecaster::forecast(uint64_t observed_amount) const {
    ForecastReport report{};
    report.trend = fit_trend(config_.series.data(), config_.series.size());
    report.next_index = config_.series.back().time_index + 1;
    report.forecast_native = predict(report.trend, report.next_index);

    const uint64_t reference = config_.reference_price;
    report.threshold = (config_.threshold_divisor != 0)
        ? reference + reference / config_.threshold_divisor
        : reference;

    // A falling trend can project below zero; there is nothing to rescale then.
    const uint64_t native = (report.forecast_native > 0) ? static_cast<uint64_t>(report.forecast_native) : 0;

    core::SignalResult& signal = report.signal;
    signal.confidence = core::Uint256(report.trend.confidence);
    signal.forecast_value = (reference != 0)
        ? core::Uint256(observed_amount).mul_u64(native).div_u64(reference)
        : core::Uint256(observed_amount);

    // Decided in native USD space, never on the rescaled amount.
    signal.decision = (report.forecast_native > 0 && native > report.threshold) ? DECISION_BUY : DECISION_SELL;
    return report;
}

core::Expected<codec::CanonicalBytes> run_guest(const Forecaster& forecaster, const uint8_t* input, size_t size) {
    auto amount = codec::decode_observed_amount(input, size);
    if (!amount) return amount.error();
    return codec::encode_signal(forecaster.run(amount.value()));
}

} // namespace augur::forecast
