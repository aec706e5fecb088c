#include "voice_relay/utils/base64.hpp"

#include <array>
#include <cstdint>
#include <stdexcept>

namespace voice_relay::utils {

namespace {

constexpr char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::array<int8_t, 256> make_decode_table() {
    std::array<int8_t, 256> table{};
    table.fill(-1);
    for (int i = 0; i < 64; ++i) {
        table[static_cast<unsigned char>(kAlphabet[i])] = static_cast<int8_t>(i);
    }
    return table;
}

}

std::string base64_encode(const std::string& bytes) {
    std::string out;
    out.reserve((bytes.size() + 2) / 3 * 4);
    size_t i = 0;
    for (; i + 2 < bytes.size(); i += 3) {
        const uint32_t chunk = (static_cast<uint8_t>(bytes[i]) << 16) |
                               (static_cast<uint8_t>(bytes[i + 1]) << 8) |
                               static_cast<uint8_t>(bytes[i + 2]);
        out.push_back(kAlphabet[(chunk >> 18) & 0x3F]);
        out.push_back(kAlphabet[(chunk >> 12) & 0x3F]);
        out.push_back(kAlphabet[(chunk >> 6) & 0x3F]);
        out.push_back(kAlphabet[chunk & 0x3F]);
    }
    const size_t rest = bytes.size() - i;
    if (rest == 1) {
        const uint32_t chunk = static_cast<uint8_t>(bytes[i]) << 16;
        out.push_back(kAlphabet[(chunk >> 18) & 0x3F]);
        out.push_back(kAlphabet[(chunk >> 12) & 0x3F]);
        out += "==";
    } else if (rest == 2) {
        const uint32_t chunk = (static_cast<uint8_t>(bytes[i]) << 16) |
                               (static_cast<uint8_t>(bytes[i + 1]) << 8);
        out.push_back(kAlphabet[(chunk >> 18) & 0x3F]);
        out.push_back(kAlphabet[(chunk >> 12) & 0x3F]);
        out.push_back(kAlphabet[(chunk >> 6) & 0x3F]);
        out.push_back('=');
    }
    return out;
}

std::string base64_decode(const std::string& encoded) {
    static const auto table = make_decode_table();
    if (encoded.size() % 4 != 0) {
        throw std::invalid_argument("base64 input length is not a multiple of 4");
    }
    std::string out;
    out.reserve(encoded.size() / 4 * 3);
    for (size_t i = 0; i < encoded.size(); i += 4) {
        const bool last = i + 4 == encoded.size();
        int padding = 0;
        uint32_t chunk = 0;
        for (size_t j = 0; j < 4; ++j) {
            const auto ch = static_cast<unsigned char>(encoded[i + j]);
            if (ch == '=' && last && j >= 2) {
                ++padding;
                chunk <<= 6;
                continue;
            }
            if (padding > 0 || table[ch] < 0) {
                throw std::invalid_argument("invalid base64 character at offset " +
                                            std::to_string(i + j));
            }
            chunk = (chunk << 6) | static_cast<uint32_t>(table[ch]);
        }
        out.push_back(static_cast<char>((chunk >> 16) & 0xFF));
        if (padding < 2) {
            out.push_back(static_cast<char>((chunk >> 8) & 0xFF));
        }
        if (padding < 1) {
            out.push_back(static_cast<char>(chunk & 0xFF));
        }
    }
    return out;
}

}
