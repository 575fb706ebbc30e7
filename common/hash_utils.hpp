#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

class HashUtils {
public:

    // rsync style block checksum: a is the byte sum, b weights every byte by
    // its distance from the end of the block. Both halves are kept mod 2^16.
    static uint32_t computeWeakHash(const char* data, size_t len) {
        const uint32_t mod = 1u << 16;

        uint32_t a = 0, b = 0;
        for (size_t i = 0; i < len; ++i) {
            uint32_t c = static_cast<unsigned char>(data[i]);
            a += c;
            b += static_cast<uint32_t>(len - i) * c;
        }
        return (a % mod) + mod * (b % mod);
    }

    static std::string toHex(const std::string& digest) {
        static const char* hex = "0123456789abcdef";
        std::string result;
        result.reserve(digest.size() * 2);
        for (unsigned char c : digest) {
            result += hex[(c >> 4) & 0xF];
            result += hex[c & 0xF];
        }
        return result;
    }

};
