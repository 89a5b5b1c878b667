#pragma once

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <nonstd/span.hpp>

#include "strata/client/BlockStoreContext.hpp"
#include "strata/client/block/BlockId.hpp"
#include "strata/core/errors/Error.hpp"

namespace sta::client::block {

/**
 * @brief Transport reading a block stored as a single file on the local worker.
 */
class LocalBlockTransport {
public:
    /**
     * @brief Opens block `block_id` from the configured local block directory
     */
    static AnyExpected<LocalBlockTransport> open(BlockStoreContext ctx, BlockId block_id);

    static AnyExpected<LocalBlockTransport> open(BlockStoreContext ctx, const std::filesystem::path& path);

    /**
     * @brief Reads up to dst.size() bytes at absolute offset `pos`. Short only at end of file.
     */
    AnyExpected<size_t> read(int64_t pos, nonstd::span<uint8_t> dst);

    void on_bytes_read(int64_t n) noexcept {
        ctx_.metrics().inc_bytes_read_local(n);
    }

    void close() noexcept;

    int64_t file_size() const {
        return file_size_;
    }

    const std::filesystem::path& path() const {
        return path_;
    }

private:
    struct FileCloser {
        void operator()(std::FILE* f) const noexcept {
            std::fclose(f);
        }
    };

    LocalBlockTransport(BlockStoreContext ctx, std::filesystem::path path, std::FILE* file, int64_t file_size);

    BlockStoreContext ctx_;
    std::filesystem::path path_;
    std::unique_ptr<std::FILE, FileCloser> file_;
    int64_t file_size_;
};

} // namespace sta::client::block
