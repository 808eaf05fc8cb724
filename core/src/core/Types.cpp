#include "shroud/core/Types.hpp"
#include "shroud/core/Hash.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string_view>

namespace shroud {

std::string toHex(const Bytes32& b) {
    std::ostringstream out;
    out << "0x";
    for (uint8_t byte : b)
        out << std::hex << std::setw(2) << std::setfill('0')
            << static_cast<int>(byte);
    return out.str();
}

static int hexNibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

Bytes32 fromHex(const std::string& hex) {
    std::string_view s(hex);
    if (s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
        s.remove_prefix(2);
    }
    if (s.size() != 64) {
        throw std::invalid_argument("bytes32 hex must be 64 digits: " + hex);
    }

    Bytes32 out{};
    for (size_t i = 0; i < out.size(); ++i) {
        int hi = hexNibble(s[2 * i]);
        int lo = hexNibble(s[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("invalid hex digit in: " + hex);
        }
        out[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return out;
}

bool isZero(const Bytes32& b) {
    return std::all_of(b.begin(), b.end(), [](uint8_t x) { return x == 0; });
}

std::string int128ToString(Int128 v) {
    if (v == 0) return "0";

    bool negative = v < 0;
    // Work on the unsigned magnitude so INT128_MIN does not overflow.
    unsigned __int128 mag = negative
        ? static_cast<unsigned __int128>(-(v + 1)) + 1
        : static_cast<unsigned __int128>(v);

    std::string digits;
    while (mag > 0) {
        digits.push_back(static_cast<char>('0' + static_cast<int>(mag % 10)));
        mag /= 10;
    }
    if (negative) digits.push_back('-');
    std::reverse(digits.begin(), digits.end());
    return digits;
}

size_t Bytes32Hash::operator()(const Bytes32& b) const noexcept {
    return fnv1a_32(std::string_view(
        reinterpret_cast<const char*>(b.data()), b.size()));
}

}
