#pragma once

#include "core/error.hpp"
#include "core/types.h"
#include "core/uint256.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace augur::codec {

constexpr size_t kWordSize = AUGUR_WORD_SIZE;

using Word = std::array<uint8_t, kWordSize>;

// Big-endian, right-aligned 32-byte word.
Word encode_word(const core::Uint256& value);
void write_word(const core::Uint256& value, uint8_t* out);
core::Uint256 read_word(const uint8_t* data);

/**
 * @brief ABI encoding of the forecaster's single uint256 input.
 */
std::vector<uint8_t> encode_observed_amount(uint64_t amount);

/**
 * @brief Decode the forecaster input word.
 * @return WrongLength unless exactly one word; Range if the value needs more than 64 bits.
 */
core::Expected<uint64_t> decode_observed_amount(const uint8_t* data, size_t size);

} // namespace augur::codec
