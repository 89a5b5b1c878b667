#pragma once

#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>

#include "strata/client/block/BlockId.hpp"
#include "strata/core/errors/Error.hpp"
#include "strata/core/io/InStream.hpp"

namespace sta::client::cli {

struct BlockcatArgs {
    block::BlockId block_id = 0;
    std::optional<std::string> dir;
    std::optional<std::string> conf;
    int64_t offset = 0;
    std::optional<int64_t> length;
};

static constexpr const char* BlockcatUsage =
    "usage: blockcat <block-id> [--dir DIR] [--conf FILE] [--offset N] [--length N]";

/**
 * @brief Parses `blockcat <block-id> [--dir DIR] [--conf FILE] [--offset N] [--length N]`
 *
 * argv[0] is the program name. Offsets and lengths must be non-negative integers.
 */
Expected<BlockcatArgs, std::string> parse_blockcat_args(int argc, const char* const argv[]);

/**
 * @brief Bytes to copy once the stream sits at the requested offset: the requested
 * length clamped to what is left, or everything left when no length was given
 */
int64_t blockcat_copy_length(const BlockcatArgs& args, int64_t remaining);

/**
 * @brief Copies `length` bytes (or fewer if the stream ends first) from `in` to `out`
 * in bulk reads of `chunk_size` bytes
 *
 * @return number of bytes written
 */
AnyExpected<int64_t> copy_stream(io::InStream& in, int64_t length, std::FILE* out, size_t chunk_size = 64 * 1024);

} // namespace sta::client::cli
