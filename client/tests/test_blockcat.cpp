#include <lest/lest.hpp>

#define CASE(name) lest_CASE(specification(), name)
extern lest::tests& specification();

#include <cstdio>
#include <string>
#include <vector>

#include "strata/client/BlockStoreContext.hpp"
#include "strata/client/block/BufferedBlockInStream.hpp"
#include "strata/client/block/MemoryBlockTransport.hpp"
#include "strata/client/cli/Blockcat.hpp"

using namespace sta;
using namespace sta::client;
using namespace sta::client::block;
using namespace sta::client::cli;

namespace {

template <size_t N>
Expected<BlockcatArgs, std::string> parse(const char* const (&argv)[N]) {
    return parse_blockcat_args(static_cast<int>(N), argv);
}

std::vector<uint8_t> read_back(std::FILE* f) {
    std::vector<uint8_t> out;
    std::rewind(f);
    int c;
    while ((c = std::fgetc(f)) != EOF) {
        out.push_back(static_cast<uint8_t>(c));
    }
    return out;
}

} // namespace

CASE(
    "Arguments in any order"
    "[Blockcat]")
{
    const char* const argv[] = {"blockcat", "--offset", "10", "42", "--length", "5", "--dir", "/data", "--conf", "a.properties"};
    auto args = parse(argv);
    EXPECT(args.has_value());
    EXPECT(args->block_id == 42);
    EXPECT(args->offset == 10);
    EXPECT(args->length.has_value());
    EXPECT(*args->length == 5);
    EXPECT(*args->dir == "/data");
    EXPECT(*args->conf == "a.properties");

    const char* const only_id[] = {"blockcat", "-3"};
    auto minimal = parse(only_id);
    EXPECT(minimal.has_value());
    EXPECT(minimal->block_id == -3);
    EXPECT(minimal->offset == 0);
    EXPECT_NOT(minimal->length.has_value());
    EXPECT_NOT(minimal->dir.has_value());
}

CASE(
    "Malformed arguments"
    "[Blockcat]")
{
    SETUP("Parsing")
    {
        SECTION("No block id")
        {
            const char* const argv[] = {"blockcat", "--offset", "1"};
            auto args = parse(argv);
            EXPECT_NOT(args.has_value());
            EXPECT(args.error().code() == ErrorCode::InvalidArgument);
            EXPECT(args.error().data() == "missing block id");
        }

        SECTION("Block id is not a number")
        {
            const char* const argv[] = {"blockcat", "block7"};
            EXPECT_NOT(parse(argv).has_value());
        }

        SECTION("Option without a value")
        {
            const char* const argv[] = {"blockcat", "7", "--length"};
            auto args = parse(argv);
            EXPECT_NOT(args.has_value());
            EXPECT(args.error().data() == "--length needs a value");
        }

        SECTION("Negative offset")
        {
            const char* const argv[] = {"blockcat", "7", "--offset", "-1"};
            EXPECT_NOT(parse(argv).has_value());
        }

        SECTION("Trailing garbage in a length")
        {
            const char* const argv[] = {"blockcat", "7", "--length", "12x"};
            EXPECT_NOT(parse(argv).has_value());
        }

        SECTION("Second block id")
        {
            const char* const argv[] = {"blockcat", "7", "8"};
            auto args = parse(argv);
            EXPECT_NOT(args.has_value());
            EXPECT(args.error().data() == "unexpected argument '8'");
        }
    }
}

CASE(
    "Copy length is clamped to the rest of the block"
    "[Blockcat]")
{
    BlockcatArgs args;
    EXPECT(blockcat_copy_length(args, 100) == 100);
    EXPECT(blockcat_copy_length(args, 0) == 0);

    args.length = 30;
    EXPECT(blockcat_copy_length(args, 100) == 30);
    EXPECT(blockcat_copy_length(args, 20) == 20);

    args.length = 0;
    EXPECT(blockcat_copy_length(args, 100) == 0);
}

CASE(
    "Copies a range of a block in chunks"
    "[Blockcat]")
{
    std::vector<uint8_t> data(40);
    for (size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<uint8_t>(i * 3 + 1);
    }

    ClientConfig config {};
    config.remote_read_buffer_size_bytes = 8;
    BlockStoreContext ctx(config);

    BufferedBlockInStream<MemoryBlockTransport> stream(5, 40, ctx, MemoryBlockTransport(ctx, data));
    EXPECT(stream.seek(5).has_value());

    BlockcatArgs args;
    args.length = 100;

    std::FILE* out = std::tmpfile();
    EXPECT(out != nullptr);

    auto copied = copy_stream(stream, blockcat_copy_length(args, stream.remaining()), out, 3);
    EXPECT(copied.has_value());
    EXPECT(*copied == 35);
    EXPECT(stream.remaining() == 0);
    EXPECT_NOT(stream.is_closed());

    std::vector<uint8_t> written = read_back(out);
    std::fclose(out);

    EXPECT(written == std::vector<uint8_t>(data.begin() + 5, data.end()));
    EXPECT(ctx.metrics().snapshot().bytes_read_memory == 35);
}

CASE(
    "Copy stops on a stream error"
    "[Blockcat]")
{
    std::vector<uint8_t> data(10);
    ClientConfig config {};
    config.remote_read_buffer_size_bytes = 4;
    BlockStoreContext ctx(config);

    BufferedBlockInStream<MemoryBlockTransport> stream(6, 10, ctx, MemoryBlockTransport(ctx, data));
    stream.close();

    std::FILE* out = std::tmpfile();
    EXPECT(out != nullptr);

    auto copied = copy_stream(stream, 10, out);
    std::fclose(out);

    EXPECT_NOT(copied.has_value());
    EXPECT(copied.error().code() == ErrorCode::IllegalState);
}
