#pragma once

#include "arbor/execution/callable.hpp"

namespace arbor {
class ARBOR_EXPORT lexeme_database;
} // namespace arbor

namespace arbor::native {

/** @return count of registered functions */
ARBOR_EXPORT auto add_native_functions(lexeme_database &db, execution::environment &env) -> size_t;

/// Seconds since the epoch
[[nodiscard]] ARBOR_EXPORT auto fn_clock_impl(execution::interpreter &, std::span<const execution::value>) -> execution::value;

} // namespace arbor::native
