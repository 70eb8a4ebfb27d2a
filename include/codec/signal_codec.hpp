#pragma once

#include "core/error.hpp"
#include "core/signal_result.hpp"
#include "core/types.h"

#include <array>
#include <cstddef>
#include <cstdint>

namespace augur::codec {

constexpr size_t kCanonicalSize = AUGUR_CANONICAL_SIZE;

// Field offsets inside the canonical buffer, ABI tuple (uint8, uint256, uint256).
constexpr size_t kDecisionOffset = 0;
constexpr size_t kConfidenceOffset = 32;
constexpr size_t kForecastValueOffset = 64;

using CanonicalBytes = std::array<uint8_t, kCanonicalSize>;

/**
 * @brief Encode a signal in the canonical 96-byte layout.
 * The decision occupies byte 31 of a zeroed first word; confidence and forecast_value follow
 * as big-endian words.
 */
CanonicalBytes encode_signal(const core::SignalResult& result);

/**
 * @brief Strict decode of exactly one canonical buffer.
 * @return WrongLength unless size == 96; DecisionOutOfRange if bytes 0-30 are not all zero or
 *         byte 31 is not 0 or 1. Wide confidence/forecast values are returned untruncated.
 */
core::Expected<core::SignalResult> decode_signal(const uint8_t* data, size_t size);

} // namespace augur::codec
