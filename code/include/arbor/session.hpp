#pragma once

#include <memory>
#include <string>
#include <vector>
#include <functional>

#include "arbor/program.hpp"
#include "arbor/error_handler.hpp"
#include "arbor/lexeme_database.hpp"
#include "arbor/types/context.hpp"
#include "arbor/execution/interpreter.hpp"

namespace arbor {

enum class run_status : uint8_t {
	ok,
	compile_error, /// lexical, syntax or resolution errors. Nothing was executed
	runtime_error,
};

struct ARBOR_EXPORT run_result {
	run_status status{ run_status::ok };
	std::vector<diagnostic> diagnostics{};

	[[nodiscard]] auto ok() const noexcept -> bool { return status == run_status::ok; }
};

/// Scans, parses, resolves and runs scripts against one set of globals
class ARBOR_EXPORT session {
public:
	using output_sink = execution::interpreter::output_sink;
	using inspector = std::function<void(const context &, const program &, const lexeme_database &)>;

	struct options {
		std::string path{ "script" };  /// shown in diagnostics
		output_sink output{};          /// stdout when empty
		inspector on_parsed{};         /// called with every parsed program before it runs
	};

	session();
	explicit session(options opts);

	session(const session &) = delete;
	session &operator=(const session &) = delete;

	[[nodiscard]] auto run(std::string_view source) -> run_result;

	/// Formatted diagnostics of the last run
	void export_records(const error_exporter auto & ...exporter) const {
		m_errors.export_records(exporter...);
	}

private:
	options m_options;
	lexeme_database m_lexemes{};
	error_handler m_errors;
	std::unique_ptr<execution::interpreter> m_interpreter;

	static void write_stdout(std::string_view text);
};

} // namespace arbor
