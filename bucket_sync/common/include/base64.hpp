#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace bucket_sync::util {

// Standard alphabet with padding; used for the Content-MD5 header.
static constexpr std::string_view kBase64Chars =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

inline std::string base64_encode(std::span<const unsigned char> input) {
    std::string output;
    output.reserve(((input.size() + 2) / 3) * 4);

    uint32_t accumulator = 0;
    int bits_collected = 0;

    for (unsigned char c : input) {
        accumulator = (accumulator << 8) | c;
        bits_collected += 8;
        while (bits_collected >= 6) {
            bits_collected -= 6;
            output.push_back(kBase64Chars[(accumulator >> bits_collected) & 0x3F]);
        }
    }

    if (bits_collected > 0) {
        accumulator <<= 6 - bits_collected;
        output.push_back(kBase64Chars[accumulator & 0x3F]);
    }

    while (output.size() % 4 != 0) {
        output.push_back('=');
    }

    return output;
}

}  // namespace bucket_sync::util
