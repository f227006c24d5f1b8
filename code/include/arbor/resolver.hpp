#pragma once

#include <vector>
#include <utility>
#include <unordered_map>

#include "arbor/program.hpp"
#include "arbor/error_handler.hpp"
#include "arbor/lexeme_database.hpp"

namespace arbor {

/// Static pass computing the hop count of every local variable reference.
/// Unresolved names are globals and stay out of the table
class ARBOR_EXPORT resolver {
public:
	resolver(const program &prog, lexeme_database &lexemes, error_handler &errs);

	[[nodiscard]] auto resolve() -> resolution_table;

private:
	enum class function_type : uint8_t { none, function, initializer, method };
	enum class class_type : uint8_t { none, klass, subclass };

	/// name -> defined (false while its initializer is resolved)
	using scope = std::unordered_map<lexeme_id, bool>;

	const program &prog;
	error_handler &errout;
	lexeme_id m_self_id;
	lexeme_id m_super_id;
	lexeme_id m_init_id;

	std::vector<scope> m_scopes{};
	resolution_table m_locals{};
	function_type m_function{ function_type::none };
	class_type m_class{ class_type::none };

	void resolve(statement_id stmt);
	void resolve(expression_id expr);
	void resolve(const statement_list &statements);
	void resolve_function(const function_declaration &function, function_type type);
	void resolve_local(expression_id expr, lexeme_id name);

#pragma region expressions

	void accept(expression_id id, const expression_literal &value);
	void accept(expression_id id, const expression_identifier &identifier);
	void accept(expression_id id, const expression_assignment &assign);
	void accept(expression_id id, const expression_unary &unary);
	void accept(expression_id id, const expression_binary &binary);
	void accept(expression_id id, const expression_logical &logic);
	void accept(expression_id id, const expression_call &call);
	void accept(expression_id id, const expression_get &get);
	void accept(expression_id id, const expression_set &set);
	void accept(expression_id id, const expression_self &self);
	void accept(expression_id id, const expression_super &super);
	void accept(expression_id id, const expression_grouping &group);
	void accept(expression_id id, const expression_lambda &lambda);

#pragma endregion expressions

#pragma region statements

	void accept(const statement_expression &expr);
	void accept(const statement_print &print);
	void accept(const statement_variable &var);
	void accept(const statement_scope &scope);
	void accept(const statement_branch &branch);
	void accept(const statement_loop &loop);
	void accept(const statement_function &func);
	void accept(const statement_return &ret);
	void accept(const statement_class &klass);

#pragma endregion statements

	void begin_scope();
	void end_scope();
	void declare(const token &name);
	void define(const token &name);

	void error(error_code code, std::string_view msg, const token &tok) const;
};

} // namespace arbor
