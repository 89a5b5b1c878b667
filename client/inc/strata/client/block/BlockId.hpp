#pragma once

#include <cstdint>

namespace sta::client::block {

// Opaque identifier of a block, assigned by the block master
using BlockId = int64_t;

} // namespace sta::client::block
