#include "strata/client/conf/ClientConfig.hpp"

#include <fmt/format.h>

#include <cctype>
#include <fstream>
#include <sstream>

namespace sta::client {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

} // namespace

Expected<Properties, std::string> parse_properties(std::string_view text) {
    Properties props;

    size_t line_no = 0;
    while (!text.empty()) {
        size_t eol = text.find('\n');
        std::string_view line = trim(text.substr(0, eol));
        text = eol == std::string_view::npos ? std::string_view {} : text.substr(eol + 1);
        ++line_no;

        if (line.empty() || line.front() == '#' || line.front() == '!') {
            continue;
        }

        size_t sep = line.find_first_of("=:");
        if (sep == std::string_view::npos) {
            return make_error(
                ErrorCode::InvalidConfig,
                fmt::format("line {}: expected key=value, got '{}'", line_no, line)
            );
        }

        std::string_view key = trim(line.substr(0, sep));
        if (key.empty()) {
            return make_error(ErrorCode::InvalidConfig, fmt::format("line {}: empty key", line_no));
        }

        props[std::string(key)] = std::string(trim(line.substr(sep + 1)));
    }

    return props;
}

Expected<ClientConfig, std::string> ClientConfig::from_properties(const Properties& props) {
    ClientConfig config {};

    if (auto it = props.find(keys::RemoteReadBufferSize); it != props.end()) {
        auto size = sta::conf::parse_space_size(it->second);
        if (!size) {
            return make_error(
                ErrorCode::InvalidConfig,
                fmt::format("{}: {}", keys::RemoteReadBufferSize, size.error().data())
            );
        }
        if (*size <= 0 || *size > MaxReadBufferSize) {
            return make_error(
                ErrorCode::InvalidConfig,
                fmt::format("{} must be between 1B and {}, got {}",
                            keys::RemoteReadBufferSize, MaxReadBufferSize, it->second)
            );
        }
        config.remote_read_buffer_size_bytes = *size;
    }

    if (auto it = props.find(keys::LoggerLevel); it != props.end()) {
        std::optional<log::Level> lvl = log::parse_level(it->second);
        if (!lvl) {
            return make_error(
                ErrorCode::InvalidConfig,
                fmt::format("{}: unknown log level '{}'", keys::LoggerLevel, it->second)
            );
        }
        config.log_level = *lvl;
    }

    if (auto it = props.find(keys::WorkerDataFolder); it != props.end()) {
        config.local_block_dir = it->second;
    }

    return config;
}

Expected<ClientConfig, std::string> ClientConfig::from_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return make_error(ErrorCode::NotFound, fmt::format("cannot open config file {}", path.string()));
    }

    std::stringstream contents;
    contents << in.rdbuf();

    auto props = parse_properties(contents.str());
    if (!props) {
        return make_error(
            ErrorCode::InvalidConfig,
            fmt::format("{}: {}", path.string(), props.error().data())
        );
    }

    return from_properties(*props);
}

void ClientConfig::apply_log_level() const {
    log::set_level(log_level);
}

} // namespace sta::client
