#pragma once

#include <fmt/format.h>

#include <cstdint>
#include <cstring>
#include <string>

#include "Error.hpp"

namespace sta
{

struct IoErrorData {
    std::string path;
    int64_t offset;
    int sys_errno;
};

template <>
struct ErrorDataToString<IoErrorData> {
    static std::string data_string(const IoErrorData& data)
    {
        return fmt::format("I/O error on {} at offset {}: {}", data.path, data.offset,
                           data.sys_errno != 0 ? std::strerror(data.sys_errno) : "unexpected end of file");
    }
};

using IoError = Error<IoErrorData>;

}  // namespace sta
