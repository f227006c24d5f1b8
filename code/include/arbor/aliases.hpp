#pragma once

#include <limits>
#include <cstddef>
#include <cstdint>

namespace arbor {

using lexeme_id = uint32_t;
using hash_type = uint32_t;

constexpr uint32_t invalid_id{ (std::numeric_limits<uint32_t>::max)() };

} // namespace arbor
