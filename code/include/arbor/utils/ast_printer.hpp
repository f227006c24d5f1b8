#pragma once

#include <string>

#include "arbor/program.hpp"
#include "arbor/lexeme_database.hpp"

namespace arbor::utils {

/// Parenthesized prefix form of the syntax tree, e.g. "(+ 1 (group (- 2)))"
class ARBOR_EXPORT ast_printer final {
public:
	ast_printer(const program &prog, const lexeme_database &lexemes) noexcept
		: prog{ prog }, lexemes{ lexemes } {}

	[[nodiscard]] auto print(expression_id expr) -> std::string;
	[[nodiscard]] auto print(statement_id stmt) -> std::string;

	/// Every root statement, one per line
	[[nodiscard]] auto print() -> std::string;

private:
	const program &prog;
	const lexeme_database &lexemes;
	std::string value;

	void write(expression_id expr);
	void write(statement_id stmt);
	void write(const statement_list &statements);
	void write(const function_declaration &function);
	void write(const token &tok);

	void accept(const expression_literal &expr);
	void accept(const expression_identifier &expr);
	void accept(const expression_assignment &expr);
	void accept(const expression_unary &expr);
	void accept(const expression_binary &expr);
	void accept(const expression_logical &expr);
	void accept(const expression_call &expr);
	void accept(const expression_get &expr);
	void accept(const expression_set &expr);
	void accept(const expression_self &expr);
	void accept(const expression_super &expr);
	void accept(const expression_grouping &expr);
	void accept(const expression_lambda &expr);

	void accept(const statement_expression &stmt);
	void accept(const statement_print &stmt);
	void accept(const statement_variable &stmt);
	void accept(const statement_scope &stmt);
	void accept(const statement_branch &stmt);
	void accept(const statement_loop &stmt);
	void accept(const statement_function &stmt);
	void accept(const statement_return &stmt);
	void accept(const statement_class &stmt);

	template<class ...Nodes>
	void parenthesize(std::string_view name, const Nodes &...nodes) {
		value.append("(");
		value.append(name);

		([this] (const auto &node) {
			if (!std::empty(node)) {
				value.append(" ");
				write(node);
			}
		} (nodes), ...);

		value.append(")");
	}
};

} // namespace arbor::utils
