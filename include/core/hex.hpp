#pragma once

#include "core/errors.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace augur::core {

std::string to_hex(const uint8_t* data, size_t size);
std::string to_hex(const std::vector<uint8_t>& data);

/**
 * @brief Parse a hex string into bytes.
 * Accepts an optional "0x" prefix and ignores ASCII whitespace between digits.
 * @return AUGUR_ERR_PARSE on a non-hex digit or an odd digit count.
 */
AugurStatus from_hex(const std::string& text, std::vector<uint8_t>* out);

} // namespace augur::core
