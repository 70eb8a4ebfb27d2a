#include "core/uint256.hpp"

#include <algorithm>

namespace augur::core {

namespace {

// 64x64 -> 128 multiply on 32-bit halves, portable across compilers.
void mul_64x64(uint64_t a, uint64_t b, uint64_t* hi, uint64_t* lo) {
    const uint64_t a_lo = a & 0xFFFFFFFFULL;
    const uint64_t a_hi = a >> 32;
    const uint64_t b_lo = b & 0xFFFFFFFFULL;
    const uint64_t b_hi = b >> 32;

    const uint64_t p0 = a_lo * b_lo;
    const uint64_t p1 = a_lo * b_hi;
    const uint64_t p2 = a_hi * b_lo;
    const uint64_t p3 = a_hi * b_hi;

    const uint64_t middle = (p0 >> 32) + (p1 & 0xFFFFFFFFULL) + (p2 & 0xFFFFFFFFULL);
    *lo = (middle << 32) | (p0 & 0xFFFFFFFFULL);
    *hi = p3 + (p1 >> 32) + (p2 >> 32) + (middle >> 32);
}

} // namespace

Uint256 Uint256::max() {
    Uint256 value;
    value.limbs_.fill(~0ULL);
    return value;
}

Uint256 Uint256::from_be_bytes(const uint8_t* data) {
    Uint256 value;
    if (!data) return value;
    for (size_t i = 0; i < kBytes; ++i) {
        const size_t limb = (kBytes - 1 - i) / 8;
        value.limbs_[limb] = (value.limbs_[limb] << 8) | data[i];
    }
    return value;
}

void Uint256::to_be_bytes(uint8_t* out) const {
    if (!out) return;
    for (size_t i = 0; i < kBytes; ++i) {
        const size_t byte_index = kBytes - 1 - i;
        out[i] = static_cast<uint8_t>(limbs_[byte_index / 8] >> ((byte_index % 8) * 8));
    }
}

bool Uint256::is_zero() const {
    return std::all_of(limbs_.begin(), limbs_.end(), [](uint64_t limb) { return limb == 0; });
}

bool Uint256::fits_u64() const {
    return limbs_[1] == 0 && limbs_[2] == 0 && limbs_[3] == 0;
}

Uint256 Uint256::mul_u64(uint64_t factor, bool* overflow) const {
    Uint256 result;
    uint64_t carry = 0;
    for (size_t i = 0; i < kLimbs; ++i) {
        uint64_t hi = 0;
        uint64_t lo = 0;
        mul_64x64(limbs_[i], factor, &hi, &lo);
        lo += carry;
        if (lo < carry) ++hi;
        result.limbs_[i] = lo;
        carry = hi;
    }
    if (overflow) *overflow = (carry != 0);
    return result;
}

Uint256 Uint256::div_u64(uint64_t divisor, uint64_t* remainder) const {
    Uint256 quotient;
    if (divisor == 0) return quotient;

    uint64_t rem = 0;
    for (int bit = static_cast<int>(kBytes * 8) - 1; bit >= 0; --bit) {
        const size_t limb = static_cast<size_t>(bit) / 64;
        const unsigned shift = static_cast<unsigned>(bit) % 64;
        // The shifted remainder may need 65 bits; a carried-out top bit always exceeds the divisor.
        const bool carry = (rem >> 63) != 0;
        rem = (rem << 1) | ((limbs_[limb] >> shift) & 1ULL);
        if (carry || rem >= divisor) {
            rem -= divisor;
            quotient.limbs_[limb] |= (1ULL << shift);
        }
    }
    if (remainder) *remainder = rem;
    return quotient;
}

std::string Uint256::to_string() const {
    if (is_zero()) return "0";
    std::string digits;
    Uint256 value = *this;
    while (!value.is_zero()) {
        uint64_t digit = 0;
        value = value.div_u64(10, &digit);
        digits.push_back(static_cast<char>('0' + digit));
    }
    std::reverse(digits.begin(), digits.end());
    return digits;
}

int Uint256::compare(const Uint256& other) const {
    for (size_t i = kLimbs; i-- > 0;) {
        if (limbs_[i] < other.limbs_[i]) return -1;
        if (limbs_[i] > other.limbs_[i]) return 1;
    }
    return 0;
}

std::string format_units(const Uint256& value, unsigned decimals, unsigned precision) {
    std::string digits = value.to_string();
    if (decimals == 0) return digits;
    if (digits.size() <= decimals) {
        digits.insert(0, decimals - digits.size() + 1, '0');
    }
    const size_t split = digits.size() - decimals;
    std::string whole = digits.substr(0, split);
    if (precision == 0) return whole;
    std::string fraction = digits.substr(split, std::min<size_t>(precision, decimals));
    if (fraction.size() < precision) fraction.append(precision - fraction.size(), '0');
    return whole + "." + fraction;
}

} // namespace augur::core
