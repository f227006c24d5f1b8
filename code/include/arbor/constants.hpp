#pragma once

#include "arbor/aliases.hpp"

namespace arbor::constants {

constexpr size_t max_arguments{ 255 };

/// Parser limit for nested statements, expressions and operator chains
constexpr size_t max_nesting_depth{ 512 };

/// Interpreter limit for nested statement and expression evaluation, calls included
constexpr size_t max_execution_depth{ 2048 };

} // namespace arbor::constants
