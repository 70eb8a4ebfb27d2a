#pragma once

#include "codec/signal_codec.hpp"
#include "core/error.hpp"
#include "core/signal_result.hpp"
#include "core/types.h"
#include "forecast/price_history.hpp"
#include "forecast/trend_model.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace augur::forecast {

// USD per ETH assumed for the observed amount; forecasts are rescaled against it.
constexpr uint64_t kAssumedCurrentUsdPrice = 3200;
// Threshold = reference + reference / 200, i.e. +0.5%.
constexpr uint64_t kBuyThresholdDivisor = 200;

struct ForecasterConfig {
    std::vector<PricePoint> series = default_series();
    uint64_t reference_price = kAssumedCurrentUsdPrice;
    uint64_t threshold_divisor = kBuyThresholdDivisor;
};

/**
 * @struct ForecastReport
 * @brief Every intermediate of one run, for logging and tests.
 */
struct ForecastReport {
    TrendModel trend{};
    uint64_t next_index = 0;
    int64_t forecast_native = 0;
    uint64_t threshold = 0;
    core::SignalResult signal{};
};

/**
 * @class Forecaster
 * @brief Deterministic trend forecast and buy/sell decision over a fixed price series.
 * Pure integer arithmetic; identical input gives an identical result on every run.
 */
class Forecaster {
public:
    /**
     * @throws std::invalid_argument if the series fails validate_series.
     */
    explicit Forecaster(ForecasterConfig config = {});

    core::SignalResult run(uint64_t observed_amount) const;
    ForecastReport forecast(uint64_t observed_amount) const;

    const ForecasterConfig& config() const { return config_; }

private:
    ForecasterConfig config_;
};

/**
 * @brief Isolated-environment entry: ABI uint256 input in, committed canonical journal out.
 * @return WrongLength or Range from the input decode; never fails once the input is valid.
 */
core::Expected<codec::CanonicalBytes> run_guest(const Forecaster& forecaster, const uint8_t* input, size_t size);

} // namespace augur::forecast
