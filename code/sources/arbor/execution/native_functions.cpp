#include <chrono>

#include "arbor/execution/native_functions.hpp"
#include "arbor/lexeme_database.hpp"

namespace arbor::native {

auto add_native_functions(lexeme_database &db, execution::environment &env) -> size_t {
	env.define(db.add("clock"), std::make_shared<execution::native_function>(fn_clock_impl, 0u));
	return 1u;
}

auto fn_clock_impl(execution::interpreter &, std::span<const execution::value>) -> execution::value {
	using seconds = std::chrono::duration<double>;
	return std::chrono::duration_cast<seconds>(
		std::chrono::system_clock::now().time_since_epoch()
	).count();
}

} // namespace arbor::native
