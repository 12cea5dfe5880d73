#pragma once

#include <array>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <string_view>

namespace ferry::core {

/// Random (version 4, RFC 4122 variant) UUID in lowercase 8-4-4-4-12 form.
inline std::string generateUUID() {
    static thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<int> byte(0, 255);

    std::array<std::uint8_t, 16> raw{};
    for (auto& b : raw)
        b = static_cast<std::uint8_t>(byte(rng));
    raw[6] = static_cast<std::uint8_t>((raw[6] & 0x0F) | 0x40);
    raw[8] = static_cast<std::uint8_t>((raw[8] & 0x3F) | 0x80);

    constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (std::size_t i = 0; i < raw.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10)
            out.push_back('-');
        out.push_back(kHex[raw[i] >> 4]);
        out.push_back(kHex[raw[i] & 0x0F]);
    }
    return out;
}

/**
 * True for the canonical 8-4-4-4-12 hex layout (either case). Version and
 * variant nibbles are not checked.
 */
inline bool isUUID(std::string_view s) {
    if (s.size() != 36)
        return false;
    for (std::size_t i = 0; i < s.size(); ++i) {
        const bool dash = (i == 8 || i == 13 || i == 18 || i == 23);
        if (dash) {
            if (s[i] != '-')
                return false;
        } else if (!std::isxdigit(static_cast<unsigned char>(s[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace ferry::core
