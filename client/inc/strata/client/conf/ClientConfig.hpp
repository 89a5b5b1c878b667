#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>

#include "strata/core/conf/SpaceSize.hpp"
#include "strata/core/errors/Error.hpp"
#include "strata/core/log/Log.hpp"

namespace sta::client {

namespace keys {
static constexpr const char* RemoteReadBufferSize = "strata.user.remote.read.buffer.size.byte";
static constexpr const char* LoggerLevel          = "strata.logger.level";
static constexpr const char* WorkerDataFolder     = "strata.worker.data.folder";
} // namespace keys

using Properties = std::map<std::string, std::string>;

/**
 * @brief Parses properties text: one key=value (or key: value) per line, '#' and '!' start comments.
 */
Expected<Properties, std::string> parse_properties(std::string_view text);

/**
 * @brief Resolved client settings. Default-constructed values are the built-in defaults.
 */
struct ClientConfig {
    static constexpr int64_t MaxReadBufferSize = (int64_t {1} << 31) - 1;

    // Capacity of the buffer each block stream allocates
    int64_t remote_read_buffer_size_bytes = 8 * sta::conf::MB;

    log::Level log_level = log::Level::Info;

    // Directory holding one file per locally stored block
    std::string local_block_dir;

    /**
     * @brief Builds a config from defaults overridden by `props`. Unknown keys are ignored.
     */
    static Expected<ClientConfig, std::string> from_properties(const Properties& props);

    static Expected<ClientConfig, std::string> from_file(const std::filesystem::path& path);

    // Installs log_level as the process-wide log threshold
    void apply_log_level() const;
};

} // namespace sta::client
