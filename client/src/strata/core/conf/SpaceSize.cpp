#include "strata/core/conf/SpaceSize.hpp"

#include <fmt/format.h>

#include <array>
#include <cctype>
#include <cstdlib>
#include <cmath>
#include <limits>
#include <utility>

namespace sta::conf
{

namespace
{
struct Unit {
    std::string_view suffix;
    int64_t factor;
};

constexpr std::array<Unit, 11> UNITS {{
    {"b", 1},
    {"k", KB},
    {"kb", KB},
    {"m", MB},
    {"mb", MB},
    {"g", GB},
    {"gb", GB},
    {"t", TB},
    {"tb", TB},
    {"p", PB},
    {"pb", PB},
}};

std::string_view trim(std::string_view s)
{
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}
}  // namespace

Expected<int64_t, std::string> parse_space_size(std::string_view text)
{
    std::string_view s = trim(text);

    size_t num_end = 0;
    while (num_end < s.size() && (std::isdigit(static_cast<unsigned char>(s[num_end])) || s[num_end] == '.')) {
        ++num_end;
    }

    if (num_end == 0) {
        return make_error(ErrorCode::InvalidConfig, fmt::format("'{}' is not a space size", text));
    }

    std::string number(s.substr(0, num_end));
    char* parse_end = nullptr;
    double value    = std::strtod(number.c_str(), &parse_end);
    if (parse_end != number.c_str() + number.size()) {
        return make_error(ErrorCode::InvalidConfig, fmt::format("'{}' is not a space size", text));
    }

    std::string unit;
    for (char c : trim(s.substr(num_end))) {
        unit.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    int64_t factor = 1;
    if (!unit.empty()) {
        bool found = false;
        for (const Unit& u : UNITS) {
            if (u.suffix == unit) {
                factor = u.factor;
                found  = true;
                break;
            }
        }
        if (!found) {
            return make_error(ErrorCode::InvalidConfig, fmt::format("unknown size unit '{}' in '{}'", unit, text));
        }
    }

    double bytes = value * static_cast<double>(factor);
    if (!std::isfinite(bytes) || bytes >= static_cast<double>(std::numeric_limits<int64_t>::max())) {
        return make_error(ErrorCode::InvalidConfig, fmt::format("space size '{}' is too large", text));
    }

    return static_cast<int64_t>(bytes);
}

std::string format_space_size(int64_t bytes)
{
    constexpr std::array<std::pair<int64_t, const char*>, 5> SCALES {{
        {PB, "PB"},
        {TB, "TB"},
        {GB, "GB"},
        {MB, "MB"},
        {KB, "KB"},
    }};

    for (const auto& [factor, name] : SCALES) {
        if (bytes >= factor) {
            return fmt::format("{:.2f}{}", static_cast<double>(bytes) / static_cast<double>(factor), name);
        }
    }
    return fmt::format("{}B", bytes);
}

}  // namespace sta::conf
