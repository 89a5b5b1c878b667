#include "strata/client/cli/Blockcat.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <string_view>
#include <utility>
#include <vector>

#include "strata/core/errors/IoError.hpp"

namespace sta::client::cli {

namespace {

std::optional<int64_t> parse_int(std::string_view s) {
    int64_t v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (s.empty() || ec != std::errc() || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return v;
}

} // namespace

Expected<BlockcatArgs, std::string> parse_blockcat_args(int argc, const char* const argv[]) {
    BlockcatArgs args;
    bool have_block = false;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg == "--dir" || arg == "--conf" || arg == "--offset" || arg == "--length") {
            if (i + 1 >= argc) {
                return make_error(ErrorCode::InvalidArgument, fmt::format("{} needs a value", arg));
            }
            std::string_view value = argv[++i];

            if (arg == "--dir") {
                args.dir = std::string(value);
            } else if (arg == "--conf") {
                args.conf = std::string(value);
            } else {
                std::optional<int64_t> n = parse_int(value);
                if (!n || *n < 0) {
                    return make_error(
                        ErrorCode::InvalidArgument,
                        fmt::format("{} must be a non-negative integer, got '{}'", arg, value)
                    );
                }
                if (arg == "--offset") {
                    args.offset = *n;
                } else {
                    args.length = *n;
                }
            }
        } else if (!have_block) {
            std::optional<int64_t> id = parse_int(arg);
            if (!id) {
                return make_error(ErrorCode::InvalidArgument, fmt::format("invalid block id '{}'", arg));
            }
            args.block_id = *id;
            have_block = true;
        } else {
            return make_error(ErrorCode::InvalidArgument, fmt::format("unexpected argument '{}'", arg));
        }
    }

    if (!have_block) {
        return make_error(ErrorCode::InvalidArgument, "missing block id");
    }
    return args;
}

int64_t blockcat_copy_length(const BlockcatArgs& args, int64_t remaining) {
    return args.length ? std::min(*args.length, remaining) : remaining;
}

AnyExpected<int64_t> copy_stream(io::InStream& in, int64_t length, std::FILE* out, size_t chunk_size) {
    std::vector<uint8_t> chunk(chunk_size);
    int64_t copied = 0;

    while (copied < length) {
        int64_t want = std::min(length - copied, static_cast<int64_t>(chunk.size()));

        auto n_read = in.read(chunk, 0, want);
        if (!n_read) {
            return nonstd::make_unexpected(std::move(n_read.error()));
        }
        if (*n_read == 0) {
            break;
        }

        size_t n = static_cast<size_t>(*n_read);
        if (std::fwrite(chunk.data(), 1, n, out) != n) {
            return make_error(
                ErrorCode::TransportFailure,
                IoErrorData {.path = "<output>", .offset = copied, .sys_errno = errno}
            );
        }
        copied += *n_read;
    }

    return copied;
}

} // namespace sta::client::cli
