#pragma once

#include <cstdint>
#include <nonstd/span.hpp>
#include <optional>

#include "strata/core/errors/Error.hpp"

namespace sta::io {

/**
 * @brief Bounded, seekable byte input stream.
 *
 * The stream knows its total length: positions are absolute offsets in [0, length].
 * Not thread safe.
 */
class InStream {
public:
    InStream() = default;

    virtual ~InStream() = default;

    /**
     * @brief Reads one byte
     *
     * @return the byte, or nullopt at the end of the stream
     */
    virtual AnyExpected<std::optional<uint8_t>> read_byte() = 0;

    /**
     * @brief Reads up to `length` bytes into buf[offset, offset + length)
     *
     * @return number of bytes read, 0 only if length is 0 or the stream is exhausted
     */
    virtual AnyExpected<int64_t> read(nonstd::span<uint8_t> buf, int64_t offset, int64_t length) = 0;

    AnyExpected<int64_t> read(nonstd::span<uint8_t> buf) {
        return read(buf, 0, static_cast<int64_t>(buf.size()));
    }

    virtual AnyExpected<int64_t> skip(int64_t n) = 0;

    virtual AnyExpected<void> seek(int64_t pos) = 0;

    virtual int64_t remaining() const = 0;

    virtual void close() = 0;

    virtual bool is_closed() const = 0;
};

} // namespace sta::io
