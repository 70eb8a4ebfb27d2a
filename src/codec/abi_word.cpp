#include "codec/abi_word.hpp"

namespace augur::codec {

Word encode_word(const core::Uint256& value) {
    Word word{};
    value.to_be_bytes(word.data());
    return word;
}

void write_word(const core::Uint256& value, uint8_t* out) {
    value.to_be_bytes(out);
}

core::Uint256 read_word(const uint8_t* data) {
    return core::Uint256::from_be_bytes(data);
}

std::vector<uint8_t> encode_observed_amount(uint64_t amount) {
    const Word word = encode_word(core::Uint256(amount));
    return std::vector<uint8_t>(word.begin(), word.end());
}

core::Expected<uint64_t> decode_observed_amount(const uint8_t* data, size_t size) {
    if (!data || size != kWordSize) return core::ErrorCode::WrongLength;
    const core::Uint256 value = read_word(data);
    if (!value.fits_u64()) return core::ErrorCode::Range;
    return value.low_u64();
}

} // namespace augur::codec
