// TALLY - Base64url Encoding Implementation
// Copyright (c) 2024 TALLY Developers
// MIT License

#include "tally/util/base64.h"

#include <array>

namespace tally {
namespace util {

namespace {

constexpr const char* ALPHABET =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

constexpr std::array<int, 256> BuildDecodeTable() {
    std::array<int, 256> table{};
    for (auto& entry : table) {
        entry = -1;
    }
    for (int i = 0; i < 64; ++i) {
        table[static_cast<unsigned char>(ALPHABET[i])] = i;
    }
    return table;
}

constexpr auto DECODE_TABLE = BuildDecodeTable();

} // namespace

std::string Base64UrlEncode(const uint8_t* data, size_t len) {
    std::string encoded;
    encoded.reserve((len * 4 + 2) / 3);

    uint32_t val = 0;
    int valb = -6;
    for (size_t i = 0; i < len; ++i) {
        val = (val << 8) | data[i];
        valb += 8;
        while (valb >= 0) {
            encoded.push_back(ALPHABET[(val >> valb) & 0x3f]);
            valb -= 6;
        }
    }
    if (valb > -6) {
        encoded.push_back(ALPHABET[((val << 8) >> (valb + 8)) & 0x3f]);
    }
    return encoded;
}

std::optional<std::vector<uint8_t>> Base64UrlDecode(const std::string& input) {
    // A single trailing sextet cannot carry a whole byte
    if (input.size() % 4 == 1) {
        return std::nullopt;
    }

    std::vector<uint8_t> out;
    out.reserve(input.size() * 3 / 4);

    uint32_t val = 0;
    int valb = -8;
    for (unsigned char c : input) {
        int decoded = DECODE_TABLE[c];
        if (decoded < 0) {
            return std::nullopt;
        }
        val = (val << 6) | static_cast<uint32_t>(decoded);
        valb += 6;
        if (valb >= 0) {
            out.push_back(static_cast<uint8_t>((val >> valb) & 0xff));
            valb -= 8;
        }
    }
    return out;
}

std::optional<std::string> Base64UrlDecodeString(const std::string& input) {
    auto bytes = Base64UrlDecode(input);
    if (!bytes) {
        return std::nullopt;
    }
    return std::string(bytes->begin(), bytes->end());
}

} // namespace util
} // namespace tally
