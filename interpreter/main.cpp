#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <tuple>
#include <string>
#include <iostream>

#include "arbor/session.hpp"
#include "arbor/utils/exit_codes.hpp"

#if defined(ARBOR_DEBUG)
#include "arbor/utils/ast_printer.hpp"
#endif // defined(ARBOR_DEBUG)

namespace {

using arbor::utils::exit_codes;

void print_error(std::string_view err) {
	std::fprintf(stderr, "%.*s", static_cast<int32_t>(std::size(err)), std::data(err));
}

#if defined(ARBOR_DEBUG)
void dump(const arbor::lexeme_database &lexemes, const arbor::context &ctx, const arbor::program &prog) {
	std::printf("Tokens:\n");
	for (const auto &token : ctx.tokens) {
		const auto lexeme{ ctx.lexeme(token) };
		std::printf("%3u:%-3u %-14s %.*s\n", token.line, token.position,
			std::data(arbor::token_name(token.type)),
			static_cast<int32_t>(std::size(lexeme)), std::data(lexeme)
		);
	}

	const auto tree{ arbor::utils::ast_printer{ prog, lexemes }.print() };
	std::printf("AST:\n%s\n", std::data(tree));
}
#endif // defined(ARBOR_DEBUG)

auto make_options(std::string path) -> arbor::session::options {
	arbor::session::options opts{ .path = std::move(path) };
#if defined(ARBOR_DEBUG)
	opts.on_parsed = [](const arbor::context &ctx, const arbor::program &prog, const arbor::lexeme_database &lexemes) {
		dump(lexemes, ctx, prog);
	};
#endif // defined(ARBOR_DEBUG)
	return opts;
}

auto evaluate(arbor::session &session, const std::string_view script) -> exit_codes {
	const auto result{ session.run(script) };
	if (!result.ok()) {
		session.export_records(print_error);
	}
	return arbor::utils::exit_code_of(result.status);
}

auto run_file(const std::string_view path) -> exit_codes {
	auto file{ std::fopen(std::data(path), "rb") };
	if (file == nullptr) {
		std::fprintf(stderr, R"(Failed to open "%s" file: %s)" "\n", std::data(path), std::strerror(errno));
		return exit_codes::ioerr;
	}

	std::string script{};
	std::array<char, 4096> chunk{};
	for (size_t read_bytes{}; (read_bytes = std::fread(std::data(chunk), sizeof(char), std::size(chunk), file)) > 0u;) {
		script.append(std::data(chunk), read_bytes);
	}

	const auto failed{ std::ferror(file) != 0 };
	std::fclose(file);
	if (failed) {
		std::fprintf(stderr, R"(Failed to read file "%s")" "\n", std::data(path));
		return exit_codes::ioerr;
	}

	arbor::session session{ make_options(std::string{ path }) };
	return evaluate(session, script);
}

auto run_prompt() -> exit_codes {
	std::printf("Arbor 1.0.0\n> ");
	std::fflush(stdout);

	arbor::session session{ make_options("console") };
	for (std::string line{}; std::getline(std::cin, line); std::printf("> "), std::fflush(stdout)) {
		std::ignore = evaluate(session, line);
	}

	return exit_codes::ok;
}

} // namespace

int main(const int argc, const char *argv[]) {
	using arbor::utils::as_int;

	if (argc > 2) {
		const std::string_view executable{ argv[0] };
		const auto file_name{ executable.substr(executable.find_last_of("/\\") + 1) };
		std::fprintf(stderr, "Usage: %.*s [script]\n",
			static_cast<int32_t>(std::size(file_name)),
			std::data(file_name)
		);
		return as_int(exit_codes::usage);
	}

	if (argc == 2) {
		return as_int(run_file(argv[1]));
	}
	return as_int(run_prompt());
}
