#pragma once

#include "core/signal_result.hpp"
#include "core/types.h"

#include <cstddef>
#include <cstdint>

namespace augur::forecast {

/**
 * @struct TrendModel
 * @brief Integer least-squares line through a price series.
 * confidence is the coefficient of determination as a percentage, clamped to [0, 100].
 */
struct TrendModel {
    int64_t slope = 0;
    int64_t intercept = 0;
    uint64_t confidence = 0;
};

/**
 * @brief Fit a trend with truncating integer arithmetic throughout.
 * Means, slope and the R^2 ratio all truncate toward zero, so the result is bit-identical on
 * every platform. A zero time variance gives slope 0; a zero price variance gives confidence 0.
 * Values are expected to keep the sums of squared deviations inside int64_t.
 */
TrendModel fit_trend(const PricePoint* points, size_t count);

int64_t predict(const TrendModel& model, uint64_t time_index);

} // namespace augur::forecast
