#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "strata/core/errors/Error.hpp"

namespace sta::conf
{

static constexpr int64_t KB = 1024;
static constexpr int64_t MB = KB * 1024;
static constexpr int64_t GB = MB * 1024;
static constexpr int64_t TB = GB * 1024;
static constexpr int64_t PB = TB * 1024;

/**
 * @brief Parses a human readable space size such as "8MB", "1.5 kb" or "512".
 *
 * The number may have a fractional part and is followed by an optional unit
 * (B, K, KB, M, MB, G, GB, T, TB, P, PB, case-insensitive, powers of 1024).
 * The result is truncated to whole bytes.
 */
Expected<int64_t, std::string> parse_space_size(std::string_view text);

/**
 * @brief Formats a byte count with the largest unit that keeps it above 1, e.g. "8.00MB"
 */
std::string format_space_size(int64_t bytes);

}  // namespace sta::conf
