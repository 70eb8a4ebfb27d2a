#include "core/hex.hpp"

#include <cctype>
#include <utility>

namespace augur::core {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string to_hex(const uint8_t* data, size_t size) {
    std::string out;
    if (!data || size == 0) return out;
    out.reserve(size * 2);
    for (size_t i = 0; i < size; ++i) {
        out.push_back(kHexDigits[data[i] >> 4]);
        out.push_back(kHexDigits[data[i] & 0x0F]);
    }
    return out;
}

std::string to_hex(const std::vector<uint8_t>& data) {
    return to_hex(data.data(), data.size());
}

AugurStatus from_hex(const std::string& text, std::vector<uint8_t>* out) {
    if (!out) return AUGUR_ERR_INVALID;

    size_t pos = 0;
    if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        pos = 2;
    }

    std::vector<uint8_t> bytes;
    bytes.reserve((text.size() - pos) / 2);
    int high = -1;
    for (; pos < text.size(); ++pos) {
        const char c = text[pos];
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        const int value = hex_value(c);
        if (value < 0) return AUGUR_ERR_PARSE;
        if (high < 0) {
            high = value;
        } else {
            bytes.push_back(static_cast<uint8_t>((high << 4) | value));
            high = -1;
        }
    }
    if (high >= 0) return AUGUR_ERR_PARSE;

    *out = std::move(bytes);
    return AUGUR_OK;
}

} // namespace augur::core
