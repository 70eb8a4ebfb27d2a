#pragma once

#include "codec/abi_word.hpp"
#include "codec/signal_codec.hpp"
#include "core/error.hpp"
#include "core/signal_result.hpp"
#include "core/uint256.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace augur::codec {

// 0.1 ETH in wei. A recovered forecast must lie strictly above it.
constexpr uint64_t kForecastSanityFloor = 100'000'000'000'000'000ULL;

// Settlement envelope: offset word, request id word, two pointer words, then the journal.
constexpr size_t kEnvelopeJournalOffset = 128;
constexpr size_t kEnvelopeMinSize = kEnvelopeJournalOffset + kCanonicalSize;

enum class SignalField {
    Decision = 0,
    Confidence = 1,
    ForecastValue = 2
};

const char* signal_field_to_string(SignalField field);

/**
 * @struct RangeCheck
 * @brief Inclusive [min, max] bound on one field of a decoded candidate.
 */
struct RangeCheck {
    SignalField field = SignalField::Decision;
    core::Uint256 min;
    core::Uint256 max = core::Uint256::max();
};

/**
 * @struct PlausibilityFilter
 * @brief The predicates a strictly decoded window must also satisfy to be accepted.
 * Framing bytes can satisfy the strict decoder by accident; these domain bounds reject them.
 */
struct PlausibilityFilter {
    std::vector<RangeCheck> checks;

    // decision in [0, 1], confidence in [0, 100], forecast_value above kForecastSanityFloor.
    static PlausibilityFilter defaults();

    /**
     * @param failed If non-null, receives the first failing check.
     */
    bool accepts(const core::SignalResult& candidate, const RangeCheck** failed = nullptr) const;
};

struct RecoveryOptions {
    PlausibilityFilter filter = PlausibilityFilter::defaults();
    size_t stride = kWordSize;
    size_t envelope_offset = kEnvelopeJournalOffset;
    size_t envelope_min_size = kEnvelopeMinSize;
};

/**
 * @brief Offsets recover_signal will try, in order.
 * The envelope offset leads when the blob is envelope-sized; the stride scan follows in
 * increasing order without repeating it.
 */
std::vector<size_t> candidate_offsets(size_t blob_size, const RecoveryOptions& options);

/**
 * @brief Locate a canonical signal inside an externally framed blob.
 * Every candidate window is strictly decoded and then filtered. confidence above 100 is
 * rejected even if the configured filter omits that check.
 * @param out_offset If non-null, receives the offset of the accepted window.
 * @return TooShort below 96 bytes; NoValidTuple when no candidate is accepted.
 */
core::Expected<core::SignalResult> recover_signal(const uint8_t* data,
                                                  size_t size,
                                                  const RecoveryOptions& options = {},
                                                  size_t* out_offset = nullptr);

} // namespace augur::codec
