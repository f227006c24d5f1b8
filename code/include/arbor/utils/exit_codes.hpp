#pragma once

#include <cstdint>

#include "arbor/session.hpp"

namespace arbor::utils {

/// sysexits.h values reported by the command line host
enum class exit_codes : int32_t {
	ok,
	usage = 64,    /* command line usage error */
	dataerr = 65,  /* script failed to compile */
	software = 70, /* script stopped on a runtime error */
	ioerr = 74,    /* script could not be read */
};

[[nodiscard]] constexpr auto as_int(const exit_codes code) noexcept -> int32_t {
	return static_cast<int32_t>(code);
}

[[nodiscard]] constexpr auto exit_code_of(const run_status status) noexcept -> exit_codes {
	switch (status) {
		using enum run_status;

		case compile_error: return exit_codes::dataerr;
		case runtime_error: return exit_codes::software;

		default: break;
	}
	return exit_codes::ok;
}

} // namespace arbor::utils
