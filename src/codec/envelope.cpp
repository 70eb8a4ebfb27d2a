#include "codec/envelope.hpp"

#include "codec/abi_word.hpp"

#include <cstring>

namespace augur::codec {

namespace {

constexpr size_t kHeadOffsetWord = 0;
constexpr size_t kRequestIdWord = 32;
constexpr size_t kJournalPointerWord = 64;
constexpr size_t kSealPointerWord = 96;
constexpr size_t kSealLengthOffset = kEnvelopeJournalOffset + kCanonicalSize;

size_t padded_size(size_t size) {
    return (size + kWordSize - 1) / kWordSize * kWordSize;
}

} // namespace

std::vector<uint8_t> wrap_fulfillment(const CanonicalBytes& journal,
                                      const core::Uint256& request_id,
                                      const std::vector<uint8_t>& seal) {
    std::vector<uint8_t> out(kSealLengthOffset + kWordSize + padded_size(seal.size()), 0);

    write_word(core::Uint256(kWordSize), out.data() + kHeadOffsetWord);
    write_word(request_id, out.data() + kRequestIdWord);
    write_word(core::Uint256(kEnvelopeJournalOffset - kWordSize), out.data() + kJournalPointerWord);
    write_word(core::Uint256(kSealLengthOffset - kWordSize), out.data() + kSealPointerWord);

    std::memcpy(out.data() + kEnvelopeJournalOffset, journal.data(), journal.size());

    write_word(core::Uint256(seal.size()), out.data() + kSealLengthOffset);
    if (!seal.empty()) {
        std::memcpy(out.data() + kSealLengthOffset + kWordSize, seal.data(), seal.size());
    }
    return out;
}

} // namespace augur::codec
