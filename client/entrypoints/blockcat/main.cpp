#include <fmt/core.h>

#include <cstdio>
#include <utility>

#include "strata/client/BlockStoreContext.hpp"
#include "strata/client/block/BufferedBlockInStream.hpp"
#include "strata/client/block/LocalBlockTransport.hpp"
#include "strata/client/cli/Blockcat.hpp"
#include "strata/client/conf/ClientConfig.hpp"
#include "strata/core/conf/SpaceSize.hpp"
#include "strata/core/log/Log.hpp"

using namespace sta;
using namespace sta::client;
using namespace sta::client::block;
using namespace sta::client::cli;

int main(int argc, char* argv[]) {
    auto args = parse_blockcat_args(argc, argv);
    if (!args) {
        fmt::print(stderr, "blockcat: {}\n{}\n", args.error().data(), BlockcatUsage);
        return 1;
    }

    ClientConfig config {};
    if (args->conf) {
        auto loaded = ClientConfig::from_file(*args->conf);
        if (!loaded) {
            fmt::print(stderr, "blockcat: {}\n", loaded.error().message());
            return 1;
        }
        config = *loaded;
    }
    if (args->dir) {
        config.local_block_dir = *args->dir;
    }
    config.apply_log_level();

    BlockStoreContext ctx(config);

    auto transport = LocalBlockTransport::open(ctx, args->block_id);
    if (!transport) {
        fmt::print(stderr, "blockcat: {}\n", transport.error().message());
        return 1;
    }

    int64_t block_size = transport->file_size();
    STA_LOG_INFO(
        "Reading block {} from {} ({}) with a {} buffer",
        args->block_id, transport->path().string(),
        conf::format_space_size(block_size), conf::format_space_size(config.remote_read_buffer_size_bytes)
    );

    BufferedBlockInStream<LocalBlockTransport> stream(args->block_id, block_size, ctx, std::move(*transport));

    if (auto sought = stream.seek(args->offset); !sought) {
        fmt::print(stderr, "blockcat: {}\n", sought.error().message());
        return 1;
    }

    auto copied = copy_stream(stream, blockcat_copy_length(*args, stream.remaining()), stdout);
    if (!copied) {
        fmt::print(stderr, "blockcat: {}\n", copied.error().message());
        return 1;
    }

    stream.close();

    ClientMetrics::Snapshot m = ctx.metrics().snapshot();
    STA_LOG_DEBUG(
        "Block {}: {} copied, {} bytes read locally, {} refills, {} direct reads",
        args->block_id, conf::format_space_size(*copied), m.bytes_read_local, m.buffer_refills, m.direct_reads
    );

    return 0;
}
