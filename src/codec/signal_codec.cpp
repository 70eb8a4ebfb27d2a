#include "codec/signal_codec.hpp"

#include "codec/abi_word.hpp"

namespace augur::codec {

CanonicalBytes encode_signal(const core::SignalResult& result) {
    CanonicalBytes out{};
    out[kDecisionOffset + kWordSize - 1] = result.decision;
    write_word(result.confidence, out.data() + kConfidenceOffset);
    write_word(result.forecast_value, out.data() + kForecastValueOffset);
    return out;
}

core::Expected<core::SignalResult> decode_signal(const uint8_t* data, size_t size) {
    if (!data || size != kCanonicalSize) return core::ErrorCode::WrongLength;

    for (size_t i = kDecisionOffset; i < kDecisionOffset + kWordSize - 1; ++i) {
        if (data[i] != 0) return core::ErrorCode::DecisionOutOfRange;
    }
    const uint8_t decision = data[kDecisionOffset + kWordSize - 1];
    if (decision != DECISION_SELL && decision != DECISION_BUY) {
        return core::ErrorCode::DecisionOutOfRange;
    }

    core::SignalResult result{};
    result.decision = decision;
    result.confidence = read_word(data + kConfidenceOffset);
    result.forecast_value = read_word(data + kForecastValueOffset);
    return result;
}

} // namespace augur::codec
