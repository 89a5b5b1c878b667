#include "strata/core/errors/Error.hpp"

namespace sta
{

const char* ErrorBase::code_str() const
{
    return error_code_string(code());
}

}  // namespace sta
