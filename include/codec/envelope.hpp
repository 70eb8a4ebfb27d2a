#pragma once

#include "codec/signal_codec.hpp"
#include "codec/signal_recovery.hpp"
#include "core/uint256.hpp"

#include <cstdint>
#include <vector>

namespace augur::codec {

/**
 * @brief Wrap a journal the way the settlement market returns fulfillment data.
 *
 * Layout (all words 32 bytes, pointers relative to byte 32):
 *   [0]   head offset (32)
 *   [32]  request id
 *   [64]  journal pointer (96)  -> journal at byte 128
 *   [96]  seal pointer (192)    -> seal length word at byte 224
 *   [128] 96-byte canonical journal
 *   [224] seal length, then the seal zero-padded to a whole word
 *
 * An empty seal yields a 256-byte envelope.
 */
std::vector<uint8_t> wrap_fulfillment(const CanonicalBytes& journal,
                                      const core::Uint256& request_id,
                                      const std::vector<uint8_t>& seal);

} // namespace augur::codec
