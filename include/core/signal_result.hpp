#pragma once

#include "core/types.h"
#include "core/uint256.hpp"

#include <cstdint>

namespace augur::core {

constexpr uint64_t kMaxConfidence = 100;

/**
 * @struct SignalResult
 * @brief The (decision, confidence, forecast_value) triple committed by the forecaster.
 * confidence is a percentage; forecast_value is in the observed amount's subunit (wei).
 * Both are 256-bit so a decoded wire value is never truncated.
 */
struct SignalResult {
    uint8_t decision = DECISION_SELL;
    Uint256 confidence;
    Uint256 forecast_value;
};

inline bool operator==(const SignalResult& a, const SignalResult& b) {
    return a.decision == b.decision &&
           a.confidence == b.confidence &&
           a.forecast_value == b.forecast_value;
}

inline bool operator!=(const SignalResult& a, const SignalResult& b) {
    return !(a == b);
}

inline const char* decision_to_string(uint8_t decision) {
    switch (decision) {
        case DECISION_BUY: return "BUY";
        case DECISION_SELL: return "SELL";
        default: return "UNKNOWN";
    }
}

} // namespace augur::core
