#pragma once

#include "Diagnostics.hpp"

namespace sta
{
enum class ErrorCode {
    InvalidArgument  = 1,
    IllegalState     = 2,
    TransportFailure = 3,
    NotFound         = 4,
    InvalidConfig    = 5,
};

inline const char* error_code_string(ErrorCode err)
{
    STA_BEGIN_NO_DEFAULT_CASE();
    switch (err) {
        case ErrorCode::InvalidArgument:
            return "InvalidArgument";
        case ErrorCode::IllegalState:
            return "IllegalState";
        case ErrorCode::TransportFailure:
            return "TransportFailure";
        case ErrorCode::NotFound:
            return "NotFound";
        case ErrorCode::InvalidConfig:
            return "InvalidConfig";
    }
    STA_END_NO_DEFAULT_CASE();
    return "";
}

}  // namespace sta
