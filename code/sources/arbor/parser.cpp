#include <fmt/format.h>

#include "arbor/parser.hpp"
#include "arbor/constants.hpp"

namespace arbor {

parser::parser(const context &ctx, error_handler &errs) noexcept
	: ctx{ ctx }
	, errout{ errs }
{}

auto parser::parse() -> program {
	program out{ std::string{ ctx.script } };

	try {
		while (!at_end()) {
			if (const auto stmt_{ declaration(out) }; !std::empty(stmt_)) {
				out.add_statement(stmt_);
			}
		}
	} catch (const nesting_error &) {
		m_current = std::size(ctx.tokens) - 1u;
	}

	return out;
}

auto parser::declaration(program &prog) -> statement_id {
	using enum token_type;

	nesting_scope nesting{ *this };
	nesting.enter(peek());

	try {
		if (match<kw_class>()) {
			return class_declaration(prog);
		}
		if (check(kw_fun) && check_next(identifier)) {
			advance();
			return prog.emplace<statement_type::function>(function(prog, function_kind::function));
		}
		if (match<kw_var>()) {
			return variable_declaration(prog);
		}

		return stmt(prog);
	} catch (const error &) {
		synchronize();
	}

	return statement_id{};
}

auto parser::class_declaration(program &prog) -> statement_id {
	using enum token_type;

	const auto &name{ consume(identifier, "Expect class name.", error_code::pe_expected_identifier) };

	expression_id superclass{};
	if (match<less>()) {
		consume(identifier, "Expect superclass name.", error_code::pe_expected_identifier);
		superclass = prog.emplace<expression_type::identifier>(previous());
	}

	consume(left_brace, "Expect '{' before class body.");

	std::vector<function_declaration> methods{};
	while (!check(right_brace) && !at_end()) {
		methods.emplace_back(function(prog, function_kind::method));
	}

	consume(right_brace, "Expect '}' after class body.", error_code::pe_broken_symmetry);

	return prog.emplace<statement_type::klass>(name, superclass, std::move(methods));
}

auto parser::variable_declaration(program &prog) -> statement_id {
	// var IDENTIFIER [= expression];
	const auto &name{ consume(token_type::identifier, "Expect variable name.",
		error_code::pe_expected_identifier
	) };

	expression_id initializer{};
	if (match<token_type::equal>()) {
		initializer = expr(prog);
	}

	consume(token_type::semicolon, "Expect ';' after variable declaration.",
		error_code::pe_missing_end_of_statement
	);

	return prog.emplace<statement_type::variable>(name, initializer);
}

auto parser::function(program &prog, const function_kind kind) -> function_declaration {
	using enum token_type;

	function_declaration output{};
	if (kind != function_kind::lambda) {
		output.name = consume(identifier, fmt::format("Expect {} name.", kind_name(kind)),
			error_code::pe_expected_identifier
		);
		consume(left_paren, fmt::format("Expect '(' after {} name.", kind_name(kind)));
	} else {
		consume(left_paren, "Expect '(' after 'fun'.");
	}

	if (!check(right_paren)) {
		do {
			if (std::size(output.params) >= constants::max_arguments) {
				report(fmt::format("Can't have more than {} parameters.", constants::max_arguments),
					error_code::pe_too_many_parameters, peek()
				);
			}
			output.params.emplace_back(consume(identifier, "Expect parameter name.",
				error_code::pe_expected_identifier
			));
		} while (match<comma>());
	}
	consume(right_paren, "Expect ')' after parameters.", error_code::pe_broken_symmetry);

	consume(left_brace, fmt::format("Expect '{{' before {} body.", kind_name(kind)));
	output.body = block(prog);

	return output;
}

auto parser::stmt(program &prog) -> statement_id {
	using enum token_type;

	nesting_scope nesting{ *this };
	nesting.enter(peek());

	if (match<kw_print>()) {
		return print_stmt(prog);
	}
	if (match<kw_return>()) {
		return return_stmt(prog);
	}
	if (match<kw_if>()) {
		return branch_stmt(prog);
	}
	if (match<kw_while>()) {
		return loop_stmt(prog);
	}
	if (match<kw_for>()) {
		return for_loop_stmt(prog);
	}
	if (match<left_brace>()) {
		return scope_stmt(prog);
	}

	return make_stmt<statement_type::expression>(prog, &parser::expr, "Expect ';' after expression.");
}

auto parser::print_stmt(program &prog) -> statement_id {
	const auto &keyword{ previous() };
	auto value{ expr(prog) };
	consume(token_type::semicolon, "Expect ';' after value.", error_code::pe_missing_end_of_statement);
	return prog.emplace<statement_type::print>(keyword, value);
}

auto parser::return_stmt(program &prog) -> statement_id {
	const auto &keyword{ previous() };

	expression_id value{};
	if (!check(token_type::semicolon)) {
		value = expr(prog);
	}

	consume(token_type::semicolon, "Expect ';' after return value.", error_code::pe_missing_end_of_statement);
	return prog.emplace<statement_type::ret>(keyword, value);
}

auto parser::branch_stmt(program &prog) -> statement_id {
	using enum token_type;

	consume(left_paren, "Expect '(' after 'if'.");
	auto condition{ expr(prog) };
	consume(right_paren, "Expect ')' after if condition.", error_code::pe_broken_symmetry);

	auto then_branch{ stmt(prog) };
	auto else_branch{ match<kw_else>() ? stmt(prog) : statement_id{} };

	return prog.emplace<statement_type::branch>(condition, then_branch, else_branch);
}

auto parser::loop_stmt(program &prog) -> statement_id {
	using enum token_type;

	consume(left_paren, "Expect '(' after 'while'.");
	auto condition{ expr(prog) };
	consume(right_paren, "Expect ')' after condition.", error_code::pe_broken_symmetry);

	auto body{ stmt(prog) };
	return prog.emplace<statement_type::loop>(statement_id{}, condition, expression_id{}, body);
}

auto parser::for_loop_stmt(program &prog) -> statement_id {
	using enum token_type;

	consume(left_paren, "Expect '(' after 'for'.");

	statement_id initializer{};
	if (match<kw_var>()) {
		initializer = variable_declaration(prog);
	} else if (!match<semicolon>()) {
		initializer = make_stmt<statement_type::expression>(prog, &parser::expr, "Expect ';' after expression.");
	}

	expression_id condition{};
	if (!check(semicolon)) {
		condition = expr(prog);
	}
	consume(semicolon, "Expect ';' after loop condition.", error_code::pe_missing_end_of_statement);

	expression_id increment{};
	if (!check(right_paren)) {
		increment = expr(prog);
	}
	consume(right_paren, "Expect ')' after for clauses.", error_code::pe_broken_symmetry);

	auto body{ stmt(prog) };

	if (std::empty(condition)) {
		condition = prog.emplace<expression_type::literal>(literal{ true });
	}
	return prog.emplace<statement_type::loop>(initializer, condition, increment, body);
}

auto parser::scope_stmt(program &prog) -> statement_id {
	return prog.emplace<statement_type::scope>(block(prog));
}

auto parser::block(program &prog) -> statement_list {
	using enum token_type;

	statement_list statements{};
	while (!check(right_brace) && !at_end()) {
		if (const auto stmt_{ declaration(prog) }; !std::empty(stmt_)) {
			statements.emplace_back(stmt_);
		}
	}

	consume(right_brace, "Expect '}' after block.", error_code::pe_broken_symmetry);
	return statements;
}

auto parser::expr(program &prog) -> expression_id {
	return assignment(prog);
}

auto parser::assignment(program &prog) -> expression_id {
	nesting_scope nesting{ *this };
	nesting.enter(peek());

	auto target{ logical_or(prog) };

	if (match<token_type::equal>()) {
		const auto &equals_token{ previous() };
		auto value{ assignment(prog) };

		if (target.is(expression_type::identifier)) {
			const auto name{ prog.get<expression_type::identifier>(target).name };
			return prog.emplace<expression_type::assignment>(name, value);
		}
		if (target.is(expression_type::get)) {
			const auto get{ prog.get<expression_type::get>(target) };
			return prog.emplace<expression_type::set>(get.name, get.object, value);
		}

		report("Invalid assignment target.", error_code::pe_lvalue_assignment, equals_token);
	}

	return target;
}

auto parser::logical_or(program &prog) -> expression_id {
	return iterate_through<expression_type::logical, token_type::kw_or>(prog, &parser::logical_and);
}

auto parser::logical_and(program &prog) -> expression_id {
	return iterate_through<expression_type::logical, token_type::kw_and>(prog, &parser::equality);
}

auto parser::equality(program &prog) -> expression_id {
	using enum token_type;
	return iterate_through<expression_type::binary, bang_equal, equal_equal>(prog, &parser::comparison);
}

auto parser::comparison(program &prog) -> expression_id {
	using enum token_type;
	return iterate_through<expression_type::binary, greater, greater_equal, less, less_equal>(prog, &parser::term);
}

auto parser::term(program &prog) -> expression_id {
	using enum token_type;
	return iterate_through<expression_type::binary, minus, plus>(prog, &parser::factor);
}

auto parser::factor(program &prog) -> expression_id {
	using enum token_type;
	return iterate_through<expression_type::binary, slash, star>(prog, &parser::unary);
}

auto parser::unary(program &prog) -> expression_id {
	if (match<token_type::bang, token_type::minus>()) {
		const auto &op{ previous() };

		nesting_scope nesting{ *this };
		nesting.enter(op);
		auto right{ unary(prog) };
		return prog.emplace<expression_type::unary>(op, right);
	}
	return call(prog);
}

auto parser::call(program &prog) -> expression_id {
	using enum token_type;

	nesting_scope nesting{ *this };
	auto expr_{ primary(prog) };

	while (true) {
		if (check(left_paren) || check(dot)) {
			nesting.enter(peek());
		}

		if (match<left_paren>()) {
			expr_ = call_finish(prog, expr_);
		} else if (match<dot>()) {
			const auto &name{ consume(identifier, "Expect property name after '.'.",
				error_code::pe_expected_identifier
			) };
			expr_ = prog.emplace<expression_type::get>(name, expr_);
		} else {
			break;
		}
	}

	return expr_;
}

auto parser::call_finish(program &prog, expression_id caller) -> expression_id {
	std::vector<expression_id> arguments{};
	if (!check(token_type::right_paren)) {
		do {
			if (std::size(arguments) >= constants::max_arguments) {
				report(fmt::format("Can't have more than {} arguments.", constants::max_arguments),
					error_code::pe_too_many_arguments, peek()
				);
			}

			arguments.emplace_back(expr(prog));
		} while (match<token_type::comma>());
	}

	const auto &paren{ consume(token_type::right_paren,
		"Expect ')' after arguments.", error_code::pe_broken_symmetry
	) };
	return prog.emplace<expression_type::call>(paren, caller, std::move(arguments));
}

auto parser::primary(program &prog) -> expression_id {
	using enum token_type;

	if (match<string, number, boolean, nil>()) {
		const auto value{ ctx.literal_of(previous()) };
		return prog.emplace<expression_type::literal>(value != nullptr ? *value : nil_literal);
	}

	if (match<kw_this>()) {
		return prog.emplace<expression_type::self>(previous());
	}

	if (match<kw_super>()) {
		const auto &keyword{ previous() };
		consume(dot, "Expect '.' after 'super'.");
		const auto &method{ consume(identifier, "Expect superclass method name.",
			error_code::pe_expected_identifier
		) };
		return prog.emplace<expression_type::super>(keyword, method);
	}

	if (match<identifier>()) {
		return prog.emplace<expression_type::identifier>(previous());
	}

	if (match<kw_fun>()) {
		const auto &keyword{ previous() };
		auto declaration_{ function(prog, function_kind::lambda) };
		return prog.emplace<expression_type::lambda>(keyword, std::move(declaration_));
	}

	if (match<left_paren>()) {
		auto expr_{ expr(prog) };
		consume(right_paren, "Expect ')' after expression.", error_code::pe_broken_symmetry);
		return prog.emplace<expression_type::grouping>(expr_);
	}

	throw make_error("Expect expression.", error_code::pe_missing_expression, peek());
}

void parser::descend(const token &tok) {
	if (++m_nesting <= constants::max_nesting_depth) return;

	report("Too deeply nested.", error_code::pe_too_deep_nesting, tok);
	throw nesting_error{ "Too deeply nested." };
}

void parser::synchronize() {
	advance();

	while (!at_end()) {
		if (previous().type == token_type::semicolon) return;

		switch (peek().type) {
			using enum token_type;
			case kw_class: [[fallthrough]];
			case kw_fun: [[fallthrough]];
			case kw_var: [[fallthrough]];
			case kw_for: [[fallthrough]];
			case kw_if: [[fallthrough]];
			case kw_while: [[fallthrough]];
			case kw_print: [[fallthrough]];
			case kw_return:
				return;

			default: break;
		}

		advance();
	}
}

auto parser::consume(token_type type, std::string_view on_error, error_code code) -> const token & {
	if (!check(type)) {
		throw make_error(on_error, code, peek());
	}
	return advance();
}

auto parser::advance() -> const token & {
	m_current += static_cast<size_t>(!at_end());
	return previous();
}

auto parser::check(const token_type type) const -> bool {
	return !at_end() && peek().type == type;
}

auto parser::check_next(const token_type type) const -> bool {
	const auto next{ m_current + 1u };
	return next < std::size(ctx.tokens) && ctx.tokens[next].type == type;
}

auto parser::at_end() const -> bool {
	return peek().type == token_type::end_of_file;
}

auto parser::peek() const -> const token & {
	return ctx.tokens.at(m_current);
}

auto parser::previous() const -> const token & {
	return ctx.tokens.at(m_current - 1ull);
}

auto parser::kind_name(const function_kind kind) noexcept -> std::string_view {
	using namespace std::string_view_literals;
	return kind == function_kind::method ? "method"sv : "function"sv;
}

void parser::report(std::string_view msg, error_code code, const token &tok) const {
	const auto where{ tok.type == token_type::end_of_file
		? std::string{ " at end" }
		: fmt::format(" at '{}'", ctx.lexeme(tok))
	};

	errout.report(fmt::format("Error{}: {}", where, msg), error_record{
		.code = code,
		.line = tok.line,
		.from = tok.position,
		.to   = tok.position + tok.length
	});
}

auto parser::make_error(std::string_view msg, error_code code, const token &tok) const -> error {
	report(msg, code, tok);
	return error{ msg };
}

} // namespace arbor
