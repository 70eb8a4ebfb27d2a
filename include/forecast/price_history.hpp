#pragma once

#include "core/types.h"
#include "core/errors.h"

#include <array>
#include <cstddef>
#include <vector>

namespace augur::forecast {

constexpr size_t kEthUsdHistoryLength = 30;

/**
 * @brief Thirty daily ETH prices in USD, days 1 through 30.
 * The table is compiled in; every forecast is computed from it unless a test injects another series.
 */
const std::array<PricePoint, kEthUsdHistoryLength>& eth_usd_history();

std::vector<PricePoint> default_series();

/**
 * @brief Check the shape a regression needs.
 * @return AUGUR_ERR_INVALID for a null pointer, fewer than two points, or time indices that
 *         are not strictly increasing.
 */
AugurStatus validate_series(const PricePoint* points, size_t count);

} // namespace augur::forecast
