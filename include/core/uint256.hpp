#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace augur::core {

/**
 * @class Uint256
 * @brief Unsigned 256-bit integer with the subset of arithmetic the signal path needs.
 * Limbs are stored least significant first; the wire form is 32 bytes big-endian.
 */
class Uint256 {
public:
    static constexpr size_t kBytes = 32;
    static constexpr size_t kLimbs = 4;

    constexpr Uint256() : limbs_{0, 0, 0, 0} {}
    constexpr Uint256(uint64_t value) : limbs_{value, 0, 0, 0} {}

    static Uint256 max();
    static Uint256 from_be_bytes(const uint8_t* data);
    void to_be_bytes(uint8_t* out) const;

    bool is_zero() const;
    bool fits_u64() const;
    uint64_t low_u64() const { return limbs_[0]; }
    uint64_t limb(size_t index) const { return index < kLimbs ? limbs_[index] : 0; }

    /**
     * @brief Multiply by a 64-bit factor.
     * @param overflow Set to true when bits were carried out of the top limb.
     */
    Uint256 mul_u64(uint64_t factor, bool* overflow = nullptr) const;

    /**
     * @brief Truncating division by a 64-bit divisor.
     * A zero divisor yields zero and leaves the remainder untouched; callers guard it.
     */
    Uint256 div_u64(uint64_t divisor, uint64_t* remainder = nullptr) const;

    std::string to_string() const;

    int compare(const Uint256& other) const;

    friend bool operator==(const Uint256& a, const Uint256& b) { return a.compare(b) == 0; }
    friend bool operator!=(const Uint256& a, const Uint256& b) { return a.compare(b) != 0; }
    friend bool operator<(const Uint256& a, const Uint256& b) { return a.compare(b) < 0; }
    friend bool operator<=(const Uint256& a, const Uint256& b) { return a.compare(b) <= 0; }
    friend bool operator>(const Uint256& a, const Uint256& b) { return a.compare(b) > 0; }
    friend bool operator>=(const Uint256& a, const Uint256& b) { return a.compare(b) >= 0; }

private:
    std::array<uint64_t, kLimbs> limbs_;
};

/**
 * @brief Render a subunit amount as a decimal in whole units, e.g. wei -> "4.18".
 * The fractional part is truncated to `precision` digits.
 */
std::string format_units(const Uint256& value, unsigned decimals, unsigned precision);

} // namespace augur::core
