#pragma once

#include <fmt/format.h>

#include <algorithm>
#include <cstdint>
#include <nonstd/span.hpp>
#include <utility>

#include "strata/client/BlockStoreContext.hpp"
#include "strata/core/errors/Error.hpp"

namespace sta::client::block {

/**
 * @brief Transport serving a block held in memory. The caller keeps the data alive.
 */
class MemoryBlockTransport {
public:
    MemoryBlockTransport(BlockStoreContext ctx, nonstd::span<const uint8_t> data) :
        ctx_(std::move(ctx)),
        data_(data) {}

    AnyExpected<size_t> read(int64_t pos, nonstd::span<uint8_t> dst) {
        if (pos < 0 || static_cast<uint64_t>(pos) > data_.size()) {
            return make_error(
                ErrorCode::TransportFailure,
                fmt::format("read at offset {} outside of {} byte block", pos, data_.size())
            );
        }

        auto src = data_.subspan(static_cast<size_t>(pos));
        size_t n_read = std::min(dst.size(), src.size());

        std::copy_n(src.begin(), n_read, dst.begin());

        return n_read;
    }

    void on_bytes_read(int64_t n) noexcept {
        ctx_.metrics().inc_bytes_read_memory(n);
    }

    void close() noexcept {
        data_ = {};
    }

private:
    BlockStoreContext ctx_;
    nonstd::span<const uint8_t> data_;
};

} // namespace sta::client::block
