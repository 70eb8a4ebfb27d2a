#include "codec/signal_recovery.hpp"

namespace augur::codec {

namespace {

const core::Uint256& field_value(const core::SignalResult& candidate, SignalField field, core::Uint256* scratch) {
    switch (field) {
        case SignalField::Confidence: return candidate.confidence;
        case SignalField::ForecastValue: return candidate.forecast_value;
        case SignalField::Decision:
        default:
            *scratch = core::Uint256(candidate.decision);
            return *scratch;
    }
}

} // namespace

const char* signal_field_to_string(SignalField field) {
    switch (field) {
        case SignalField::Decision: return "decision";
        case SignalField::Confidence: return "confidence";
        case SignalField::ForecastValue: return "forecast_value";
        default: return "unknown";
    }
}

PlausibilityFilter PlausibilityFilter::defaults() {
    PlausibilityFilter filter;
    filter.checks = {
        RangeCheck{SignalField::Decision, core::Uint256(DECISION_SELL), core::Uint256(DECISION_BUY)},
        RangeCheck{SignalField::Confidence, core::Uint256(0), core::Uint256(core::kMaxConfidence)},
        RangeCheck{SignalField::ForecastValue, core::Uint256(kForecastSanityFloor + 1), core::Uint256::max()},
    };
    return filter;
}

bool PlausibilityFilter::accepts(const core::SignalResult& candidate, const RangeCheck** failed) const {
    core::Uint256 scratch;
    for (const RangeCheck& check : checks) {
        const core::Uint256& value = field_value(candidate, check.field, &scratch);
        if (value < check.min || value > check.max) {
            if (failed) *failed = &check;
            return false;
        }
    }
    return true;
}

std::vector<size_t> candidate_offsets(size_t blob_size, const RecoveryOptions& options) {
    std::vector<size_t> offsets;
    if (blob_size < kCanonicalSize) return offsets;

    const size_t stride = (options.stride == 0) ? kWordSize : options.stride;
    const size_t last = blob_size - kCanonicalSize;

    const bool envelope_first = blob_size >= options.envelope_min_size && options.envelope_offset <= last;
    if (envelope_first) {
        offsets.push_back(options.envelope_offset);
    }
    for (size_t offset = 0; offset <= last; offset += stride) {
        if (envelope_first && offset == options.envelope_offset) continue;
        offsets.push_back(offset);
    }
    return offsets;
}

core::Expected<core::SignalResult> recover_signal(const uint8_t* data,
                                                  size_t size,
                                                  const RecoveryOptions& options,
                                                  size_t* out_offset) {
    if (!data || size < kCanonicalSize) return core::ErrorCode::TooShort;

    for (size_t offset : candidate_offsets(size, options)) {
        auto decoded = decode_signal(data + offset, kCanonicalSize);
        if (!decoded) continue;

        const core::SignalResult& candidate = decoded.value();
        if (candidate.confidence > core::Uint256(core::kMaxConfidence)) continue;
        if (!options.filter.accepts(candidate)) continue;

        if (out_offset) *out_offset = offset;
        return candidate;
    }
    return core::ErrorCode::NoValidTuple;
}

} // namespace augur::codec
