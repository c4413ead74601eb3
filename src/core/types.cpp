// TALLY - Core Types Implementation
// Copyright (c) 2024 TALLY Developers
// MIT License

#include "tally/core/types.h"

#include <cctype>
#include <iomanip>
#include <sstream>

namespace tally {

namespace {

/// Parse "[-]digits[.digits]" into a scaled integer with `scaleDigits` places.
std::optional<int64_t> ParseScaled(const std::string& str, int scaleDigits, int64_t limit) {
    std::string s = str;

    // Trim whitespace
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.pop_back();
    }
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
        ++start;
    }
    s = s.substr(start);

    if (s.empty()) {
        return std::nullopt;
    }

    bool negative = false;
    if (s[0] == '-' || s[0] == '+') {
        negative = (s[0] == '-');
        s.erase(0, 1);
    }

    size_t dotPos = s.find('.');
    std::string wholeStr = s.substr(0, dotPos);
    std::string fracStr = (dotPos == std::string::npos) ? "" : s.substr(dotPos + 1);

    if (wholeStr.empty() && fracStr.empty()) {
        return std::nullopt;
    }
    if (static_cast<int>(fracStr.size()) > scaleDigits) {
        return std::nullopt;
    }

    int64_t scale = 1;
    for (int i = 0; i < scaleDigits; ++i) {
        scale *= 10;
    }

    int64_t whole = 0;
    for (char c : wholeStr) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        whole = whole * 10 + (c - '0');
        if (whole > limit / scale) {
            return std::nullopt;
        }
    }

    int64_t frac = 0;
    for (int i = 0; i < scaleDigits; ++i) {
        frac *= 10;
        if (i < static_cast<int>(fracStr.size())) {
            char c = fracStr[i];
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return std::nullopt;
            }
            frac += c - '0';
        }
    }

    int64_t value = whole * scale + frac;
    if (value > limit) {
        return std::nullopt;
    }
    return negative ? -value : value;
}

std::string FormatScaled(int64_t value, int scaleDigits, int decimals) {
    int64_t scale = 1;
    for (int i = 0; i < scaleDigits; ++i) {
        scale *= 10;
    }

    bool negative = value < 0;
    // Work on the magnitude in unsigned space so INT64_MIN cannot overflow
    uint64_t magnitude = negative ? (0 - static_cast<uint64_t>(value))
                                  : static_cast<uint64_t>(value);

    std::ostringstream ss;
    if (negative) {
        ss << "-";
    }
    ss << magnitude / static_cast<uint64_t>(scale);

    if (decimals > 0) {
        std::ostringstream fracSS;
        fracSS << std::setfill('0') << std::setw(scaleDigits)
               << magnitude % static_cast<uint64_t>(scale);
        ss << "." << fracSS.str().substr(0, static_cast<size_t>(decimals));
    }
    return ss.str();
}

} // namespace

std::string FormatAmount(Amount amount, int decimals) {
    if (decimals > AMOUNT_DECIMALS) decimals = AMOUNT_DECIMALS;
    if (decimals < 0) decimals = 0;
    return FormatScaled(amount, AMOUNT_DECIMALS, decimals);
}

std::optional<Amount> ParseAmount(const std::string& str, Amount limit) {
    return ParseScaled(str, AMOUNT_DECIMALS, limit);
}

std::string FormatPercent(BasisPoints bp) {
    return FormatScaled(bp, 2, 2);
}

std::optional<BasisPoints> ParsePercent(const std::string& str) {
    // Anything above 100% is rejected by rule validation, not here
    return ParseScaled(str, 2, 1000 * FULL_PERCENT);
}

} // namespace tally
