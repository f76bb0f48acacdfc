#include "hash.h"
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <vector>

namespace peerq {

namespace {

const uint32_t K[] = {
    0x5A827999, 0x6ED9EBA1, 0x8F1BBCDC, 0xCA62C1D6
};

uint32_t left_rotate(uint32_t value, int amount) {
    return (value << amount) | (value >> (32 - amount));
}

void process_block(const uint8_t* block, uint32_t h[5]) {
    uint32_t w[80];

    for (int i = 0; i < 16; i++) {
        w[i] = (static_cast<uint32_t>(block[i * 4]) << 24) |
               (static_cast<uint32_t>(block[i * 4 + 1]) << 16) |
               (static_cast<uint32_t>(block[i * 4 + 2]) << 8) |
               (static_cast<uint32_t>(block[i * 4 + 3]));
    }

    for (int i = 16; i < 80; i++) {
        w[i] = left_rotate(w[i - 3] ^ w[i - 8] ^ w[i - 14] ^ w[i - 16], 1);
    }

    uint32_t a = h[0], b = h[1], c = h[2], d = h[3], e = h[4];

    for (int i = 0; i < 80; i++) {
        uint32_t f;
        uint32_t k = K[i / 20];

        if (i < 20) {
            f = (b & c) | (~b & d);
        } else if (i < 40 || i >= 60) {
            f = b ^ c ^ d;
        } else {
            f = (b & c) | (b & d) | (c & d);
        }

        uint32_t temp = left_rotate(a, 5) + f + e + k + w[i];
        e = d;
        d = c;
        c = left_rotate(b, 30);
        b = a;
        a = temp;
    }

    h[0] += a;
    h[1] += b;
    h[2] += c;
    h[3] += d;
    h[4] += e;
}

} // namespace

std::string sha1_hex(const std::string& input) {
    uint32_t h[5] = {0x67452301, 0xEFCDAB89, 0x98BADCFE, 0x10325476, 0xC3D2E1F0};

    // Message, a single 1 bit, zero padding to 56 mod 64, 64-bit length
    std::vector<uint8_t> message(input.begin(), input.end());
    uint64_t bit_length = static_cast<uint64_t>(input.size()) * 8;

    message.push_back(0x80);
    while (message.size() % 64 != 56) {
        message.push_back(0x00);
    }
    for (int i = 7; i >= 0; i--) {
        message.push_back(static_cast<uint8_t>(bit_length >> (i * 8)));
    }

    for (size_t offset = 0; offset < message.size(); offset += 64) {
        process_block(message.data() + offset, h);
    }

    std::ostringstream result;
    result << std::hex << std::setfill('0');
    for (uint32_t word : h) {
        result << std::setw(8) << word;
    }
    return result.str();
}

} // namespace peerq
