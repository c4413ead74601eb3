// TALLY - Core Types Header
// Copyright (c) 2024 TALLY Developers
// MIT License
//
// This file defines fundamental types used throughout TALLY: fixed-point
// amounts, basis-point percentages and wall-clock helpers.

#ifndef TALLY_CORE_TYPES_H
#define TALLY_CORE_TYPES_H

#include <chrono>
#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>

namespace tally {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Amount in smallest units (8 decimal places)
using Amount = int64_t;

/// Percentage in basis points (10000 = 100%)
using BasisPoints = int64_t;

/// Timestamp (Unix epoch seconds)
using Timestamp = int64_t;

/// Number of decimal places carried by an Amount
constexpr int AMOUNT_DECIMALS = 8;

/// Constants
constexpr Amount COIN = 100000000LL;                 // 1.00 = 100 million units
constexpr Amount MAX_MONEY = 10000000000LL * COIN;   // 10 billion whole units

/// Limit on the sum of all account balances; differences stay within int64
constexpr Amount MAX_TREASURY = 9 * MAX_MONEY;

/// Accumulator for sums over an unbounded number of amounts
using AmountSum = __int128;

/// 100% expressed in basis points
constexpr BasisPoints FULL_PERCENT = 10000;

/// Check if amount is in valid range
inline bool MoneyRange(Amount value) {
    return value >= 0 && value <= MAX_MONEY;
}

// ============================================================================
// Time Functions
// ============================================================================

/// Get current Unix timestamp
inline Timestamp GetTime() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

/// Get current time in milliseconds
inline int64_t GetTimeMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

// ============================================================================
// Amount Formatting
// ============================================================================

/**
 * Format an amount as a plain decimal string.
 *
 * @param amount Amount in smallest units
 * @param decimals Number of fractional digits to emit (0-8)
 * @return e.g. "100.00000000" or "-0.50"
 */
std::string FormatAmount(Amount amount, int decimals = AMOUNT_DECIMALS);

/**
 * Parse a decimal string into an amount.
 *
 * Accepts an optional leading sign, a whole part and at most 8 fractional
 * digits. Returns nullopt on malformed input, excess precision or a value
 * outside +/- limit.
 */
std::optional<Amount> ParseAmount(const std::string& str, Amount limit = MAX_MONEY);

/// Format basis points as a percentage string (2500 -> "25.00")
std::string FormatPercent(BasisPoints bp);

/// Parse a percentage string with at most 2 decimals into basis points
std::optional<BasisPoints> ParsePercent(const std::string& str);

/**
 * Compute truncate(amount * bp / 10000) without overflowing 64 bits.
 * The amount must be non-negative.
 */
inline Amount ApplyBasisPoints(Amount amount, BasisPoints bp) {
    return (amount / FULL_PERCENT) * bp + (amount % FULL_PERCENT) * bp / FULL_PERCENT;
}

} // namespace tally

#endif // TALLY_CORE_TYPES_H
