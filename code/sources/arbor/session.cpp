#include <cstdio>

#include "arbor/session.hpp"
#include "arbor/scanner.hpp"
#include "arbor/parser.hpp"
#include "arbor/resolver.hpp"
#include "arbor/execution/native_functions.hpp"

namespace arbor {

session::session() : session{ options{} } {}

session::session(options opts)
	: m_options{ std::move(opts) }
	, m_errors{ m_options.path } {
	if (!m_options.output) {
		m_options.output = &session::write_stdout;
	}

	m_interpreter = std::make_unique<execution::interpreter>(m_lexemes, m_errors, m_options.output);
	native::add_native_functions(m_lexemes, *m_interpreter->globals());
}

auto session::run(std::string_view source) -> run_result {
	m_errors.reset(source);

	scanner scanner{ source, m_lexemes, m_errors };
	const auto ctx{ scanner.scan() };

	parser parser{ ctx, m_errors };
	auto prog{ std::make_shared<program>(parser.parse()) };

	// resolution also runs after lexical and syntax errors to report everything at once
	resolver resolver{ *prog, m_lexemes, m_errors };
	prog->bind(resolver.resolve());

	if (m_options.on_parsed) {
		m_options.on_parsed(ctx, *prog, m_lexemes);
	}

	if (!std::empty(m_errors)) {
		return run_result{ .status = run_status::compile_error, .diagnostics = m_errors.diagnostics() };
	}

	if (m_interpreter->run(std::move(prog)) != execution::status::ok) {
		return run_result{ .status = run_status::runtime_error, .diagnostics = m_errors.diagnostics() };
	}

	return run_result{ .status = run_status::ok };
}

void session::write_stdout(std::string_view text) {
	std::fwrite(std::data(text), sizeof(char), std::size(text), stdout);
}

} // namespace arbor
