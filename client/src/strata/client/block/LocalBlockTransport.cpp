#include "strata/client/block/LocalBlockTransport.hpp"

#include <fmt/format.h>

#include <cerrno>
#include <string>
#include <system_error>
#include <utility>

#include "strata/core/errors/IoError.hpp"
#include "strata/core/log/Log.hpp"

namespace fs = std::filesystem;

namespace sta::client::block {

AnyExpected<LocalBlockTransport> LocalBlockTransport::open(BlockStoreContext ctx, BlockId block_id) {
    const std::string& dir = ctx.config().local_block_dir;
    if (dir.empty()) {
        return make_error(
            ErrorCode::InvalidConfig,
            fmt::format("cannot open block {}: {} is not set", block_id, keys::WorkerDataFolder)
        );
    }

    fs::path path = fs::path(dir) / std::to_string(block_id);
    return open(std::move(ctx), path);
}

AnyExpected<LocalBlockTransport>
LocalBlockTransport::open(BlockStoreContext ctx, const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        STA_LOG_WARN("Block file {} does not exist", path.string());
        return make_error(ErrorCode::NotFound, fmt::format("no block file at {}", path.string()));
    }

    uintmax_t size = fs::file_size(path, ec);
    if (ec) {
        STA_LOG_WARN("Cannot stat block file {}: {}", path.string(), ec.message());
        return make_error(
            ErrorCode::TransportFailure,
            IoErrorData {.path = path.string(), .offset = 0, .sys_errno = ec.value()}
        );
    }

    std::FILE* file = std::fopen(path.c_str(), "rb");
    if (file == nullptr) {
        int err = errno;
        STA_LOG_WARN("Cannot open block file {}", path.string());
        return make_error(
            ErrorCode::TransportFailure,
            IoErrorData {.path = path.string(), .offset = 0, .sys_errno = err}
        );
    }

    STA_LOG_DEBUG("Opened local block file {} ({} bytes)", path.string(), size);

    return LocalBlockTransport(std::move(ctx), path, file, static_cast<int64_t>(size));
}

LocalBlockTransport::LocalBlockTransport(
    BlockStoreContext ctx,
    fs::path path,
    std::FILE* file,
    int64_t file_size
) :
    ctx_(std::move(ctx)),
    path_(std::move(path)),
    file_(file),
    file_size_(file_size) {}

AnyExpected<size_t> LocalBlockTransport::read(int64_t pos, nonstd::span<uint8_t> dst) {
    if (!file_) {
        return make_error(ErrorCode::IllegalState, fmt::format("block file {} is closed", path_.string()));
    }
    if (pos < 0) {
        return make_error(ErrorCode::InvalidArgument, fmt::format("negative read offset {}", pos));
    }

    if (fseeko(file_.get(), static_cast<off_t>(pos), SEEK_SET) != 0) {
        return make_error(
            ErrorCode::TransportFailure,
            IoErrorData {.path = path_.string(), .offset = pos, .sys_errno = errno}
        );
    }

    size_t total = 0;
    while (total < dst.size()) {
        size_t n = std::fread(dst.data() + total, 1, dst.size() - total, file_.get());
        total += n;

        if (n == 0) {
            if (std::ferror(file_.get())) {
                int err = errno;
                std::clearerr(file_.get());
                return make_error(
                    ErrorCode::TransportFailure,
                    IoErrorData {.path = path_.string(), .offset = pos + static_cast<int64_t>(total), .sys_errno = err}
                );
            }
            break;
        }
    }

    return total;
}

void LocalBlockTransport::close() noexcept {
    if (file_) {
        STA_LOG_DEBUG("Closing local block file {}", path_.native());
        file_.reset();
    }
}

} // namespace sta::client::block
