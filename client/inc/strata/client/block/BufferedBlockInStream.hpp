#pragma once

#include <fmt/format.h>

#include <algorithm>
#include <cstdint>
#include <nonstd/span.hpp>
#include <optional>
#include <utility>
#include <vector>

#include "strata/client/BlockStoreContext.hpp"
#include "strata/client/block/BlockId.hpp"
#include "strata/core/errors/Error.hpp"
#include "strata/core/errors/Try.hpp"
#include "strata/core/io/InStream.hpp"
#include "strata/core/log/Log.hpp"
#include "strata/core/types/NonZero.hpp"

namespace sta::client::block {

/**
 * @brief Buffered, seekable stream over a single block of known size.
 *
 * Small reads are served from an internal buffer, refilled from the transport at the
 * current position whenever the buffer does not cover it. Reads longer than what is
 * buffered go straight from the transport into the caller's memory and invalidate the
 * buffer. Reading the last byte with read_byte() does not close the stream, the next
 * read_byte() call does and returns nullopt; bulk reads never close it.
 *
 * TransportT must provide:
 *  - AnyExpected<size_t> read(int64_t pos, nonstd::span<uint8_t> dst): reads up to
 *    dst.size() bytes of the block starting at offset pos
 *  - void on_bytes_read(int64_t n) noexcept: observes bytes handed to the consumer
 *  - void close() noexcept: releases the transport resources
 *
 * Not thread safe: one instance belongs to one consumer.
 */
template <typename TransportT>
class BufferedBlockInStream : public io::InStream {
public:
    BufferedBlockInStream(BlockId block_id, int64_t block_size, BlockStoreContext ctx, TransportT transport) :
        block_id_(block_id),
        block_size_(block_size),
        ctx_(std::move(ctx)),
        transport_(std::move(transport)),
        buffer_(allocate_buffer(ctx_)) {
        STA_ASSERT(block_size_ >= 0, "Block {} has negative size {}", block_id_, block_size_);
    }

    ~BufferedBlockInStream() override {
        close();
    }

    BufferedBlockInStream(const BufferedBlockInStream&) = delete;
    BufferedBlockInStream(BufferedBlockInStream&&) = delete;

    BufferedBlockInStream& operator=(const BufferedBlockInStream&) = delete;
    BufferedBlockInStream& operator=(BufferedBlockInStream&&) = delete;

    using io::InStream::read;

    AnyExpected<std::optional<uint8_t>> read_byte() override {
        if (closed_) {
            return closed_error();
        }
        if (pos_ == block_size_) {
            close();
            return std::optional<uint8_t> {};
        }

        if (buffered_at_pos() == 0) {
            if (auto refilled = refill(); !refilled) {
                return nonstd::make_unexpected(std::move(refilled.error()));
            }
        }

        uint8_t byte = buffer_[static_cast<size_t>(pos_ - buffer_pos_)];
        pos_++;
        transport_.on_bytes_read(1);

        return std::optional<uint8_t> {byte};
    }

    AnyExpected<int64_t> read(nonstd::span<uint8_t> buf, int64_t offset, int64_t length) override {
        if (closed_) {
            return closed_error();
        }

        const auto buf_len = static_cast<int64_t>(buf.size());
        if (offset < 0 || length < 0 || length > buf_len || offset > buf_len - length) {
            return make_error(
                ErrorCode::InvalidArgument,
                fmt::format("Buffer length ({}), offset({}), len({})", buf_len, offset, length)
            );
        }
        if (length == 0) {
            return 0;
        }

        int64_t to_read = std::min(length, remaining());
        if (to_read == 0) {
            return 0;
        }

        nonstd::span<uint8_t> dst = buf.subspan(static_cast<size_t>(offset), static_cast<size_t>(to_read));

        if (length > buffered_at_pos()) {
            return direct_read(dst);
        }

        std::copy_n(buffer_.begin() + (pos_ - buffer_pos_), dst.size(), dst.begin());
        pos_ += to_read;
        transport_.on_bytes_read(to_read);

        return to_read;
    }

    AnyExpected<int64_t> skip(int64_t n) override {
        if (closed_) {
            return closed_error();
        }
        if (n <= 0) {
            return 0;
        }

        int64_t to_skip = std::min(remaining(), n);
        pos_ += to_skip;

        return to_skip;
    }

    AnyExpected<void> seek(int64_t pos) override {
        if (closed_) {
            return closed_error();
        }
        if (pos < 0) {
            return make_error(ErrorCode::InvalidArgument, fmt::format("Seek position is negative: {}", pos));
        }
        if (pos > block_size_) {
            return make_error(
                ErrorCode::InvalidArgument,
                fmt::format("Seek position {} is past end of block: {}", pos, block_size_)
            );
        }

        pos_ = pos;

        return {};
    }

    int64_t remaining() const override {
        return block_size_ - pos_;
    }

    void close() override {
        if (closed_) {
            return;
        }

        closed_ = true;
        std::vector<uint8_t>().swap(buffer_);
        std::vector<uint8_t>().swap(spare_);
        buffer_len_ = 0;
        transport_.close();

        STA_LOG_DEBUG("Closed stream of block {} at offset {}/{}", block_id_, pos_, block_size_);
    }

    bool is_closed() const override {
        return closed_;
    }

    BlockId block_id() const {
        return block_id_;
    }

    int64_t block_size() const {
        return block_size_;
    }

    int64_t pos() const {
        return pos_;
    }

    size_t buffer_capacity() const {
        return buffer_.size();
    }

    TransportT& transport() {
        return transport_;
    }

private:
    static std::vector<uint8_t> allocate_buffer(const BlockStoreContext& ctx) {
        NonZero<size_t> size(static_cast<size_t>(ctx.config().remote_read_buffer_size_bytes));
        return std::vector<uint8_t>(static_cast<size_t>(size));
    }

    static nonstd::unexpected_type<Error<std::string>> closed_error() {
        return make_error(ErrorCode::IllegalState, "Cannot do operations on a closed BlockInStream");
    }

    // Bytes of the buffer window that start at pos_, 0 if the window does not cover pos_
    int64_t buffered_at_pos() const {
        if (buffer_len_ == 0 || pos_ < buffer_pos_) {
            return 0;
        }

        int64_t window_end = buffer_pos_ + static_cast<int64_t>(buffer_len_);
        return pos_ < window_end ? window_end - pos_ : 0;
    }

    // Loads the buffer with the block bytes starting at pos_. Requires remaining() > 0.
    AnyExpected<void> refill() {
        size_t wanted = static_cast<size_t>(std::min(static_cast<int64_t>(buffer_.size()), remaining()));

        // A valid window stays untouched until the transport has delivered its replacement
        if (buffer_len_ > 0 && spare_.size() != buffer_.size()) {
            spare_.resize(buffer_.size());
        }
        std::vector<uint8_t>& target = buffer_len_ > 0 ? spare_ : buffer_;

        size_t n_read = TRY(transport_.read(pos_, nonstd::span<uint8_t>(target.data(), wanted)));
        if (n_read == 0 || n_read > wanted) {
            return make_error(
                ErrorCode::TransportFailure,
                fmt::format("Block {}: refill at offset {} returned {} of {} bytes", block_id_, pos_, n_read, wanted)
            );
        }

        if (&target == &spare_) {
            buffer_.swap(spare_);
        }
        buffer_pos_ = pos_;
        buffer_len_ = n_read;
        ctx_.metrics().inc_buffer_refills();

        STA_LOG_TRACE("Block {}: buffered [{}, {})", block_id_, buffer_pos_, buffer_pos_ + static_cast<int64_t>(n_read));

        return {};
    }

    AnyExpected<int64_t> direct_read(nonstd::span<uint8_t> dst) {
        size_t n_read = TRY(transport_.read(pos_, dst));
        if (n_read == 0 || n_read > dst.size()) {
            return make_error(
                ErrorCode::TransportFailure,
                fmt::format("Block {}: direct read at offset {} returned {} of {} bytes",
                            block_id_, pos_, n_read, dst.size())
            );
        }

        buffer_len_ = 0;
        pos_ += static_cast<int64_t>(n_read);
        ctx_.metrics().inc_direct_reads();
        transport_.on_bytes_read(static_cast<int64_t>(n_read));

        STA_LOG_TRACE("Block {}: direct read of {} bytes, now at offset {}", block_id_, n_read, pos_);

        return static_cast<int64_t>(n_read);
    }

    const BlockId block_id_;
    const int64_t block_size_;
    BlockStoreContext ctx_;
    TransportT transport_;

    std::vector<uint8_t> buffer_;
    // Refill target while buffer_ holds a valid window, allocated on first use
    std::vector<uint8_t> spare_;
    // Block offset of buffer_[0]
    int64_t buffer_pos_ = 0;
    // Valid bytes in buffer_, 0 when the window is invalid
    size_t buffer_len_ = 0;

    int64_t pos_ = 0;
    bool closed_ = false;
};

} // namespace sta::client::block
