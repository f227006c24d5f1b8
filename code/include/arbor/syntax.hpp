#pragma once

#include <vector>
#include <variant>

#include "arbor/id.hpp"
#include "arbor/types/token.hpp"
#include "arbor/types/literal.hpp"

namespace arbor {

/// Order matches the alternatives of arbor::expression
enum class expression_type : uint8_t {
	literal,
	identifier,
	assignment,
	unary,
	binary,
	logical,
	call,
	get,
	set,
	self,
	super,
	grouping,
	lambda,
};

/// Order matches the alternatives of arbor::statement
enum class statement_type : uint8_t {
	expression,
	print,
	variable,
	scope,
	branch,
	loop,
	function,
	ret,
	klass,
};

using expression_id  = ID<expression_type>;
using statement_id   = ID<statement_type>;
using statement_list = std::vector<statement_id>;

/// Shared by function statements, methods and function literals.
/// Function literals have a name token of token_type::invalid
struct function_declaration {
	token name{};
	std::vector<token> params{};
	statement_list body{};

	[[nodiscard]] auto anonymous() const noexcept -> bool { return name.type != token_type::identifier; }
};

#pragma region expressions

struct expression_literal {
	literal value{};
};

struct expression_identifier {
	token name{};
};

struct expression_assignment {
	token name{};
	expression_id value{};
};

struct expression_unary {
	token op{};
	expression_id expr{};
};

struct expression_binary {
	token op{};
	expression_id left{};
	expression_id right{};
};

struct expression_logical {
	token op{};
	expression_id left{};
	expression_id right{};
};

struct expression_call {
	token paren{};
	expression_id caller{};
	std::vector<expression_id> args{};
};

struct expression_get {
	token name{};
	expression_id object{};
};

struct expression_set {
	token name{};
	expression_id object{};
	expression_id value{};
};

struct expression_self {
	token keyword{};
};

struct expression_super {
	token keyword{};
	token method{};
};

struct expression_grouping {
	expression_id expr{};
};

struct expression_lambda {
	token keyword{};
	function_declaration function{};
};

#pragma endregion expressions

#pragma region statements

struct statement_expression {
	expression_id expr{};
};

struct statement_print {
	token keyword{};
	expression_id expr{};
};

struct statement_variable {
	token identifier{};
	expression_id initializer{};
};

struct statement_scope {
	statement_list statements{};
};

struct statement_branch {
	expression_id condition{};
	statement_id then_branch{};
	statement_id else_branch{};
};

/// while and for loops. A for loop keeps its initializer and increment
struct statement_loop {
	statement_id initializer{};
	expression_id condition{};
	expression_id increment{};
	statement_id body{};
};

struct statement_function {
	function_declaration function{};
};

struct statement_return {
	token keyword{};
	expression_id value{};
};

struct statement_class {
	token name{};
	expression_id superclass{};
	std::vector<function_declaration> methods{};
};

#pragma endregion statements

using expression = std::variant<
	expression_literal,
	expression_identifier,
	expression_assignment,
	expression_unary,
	expression_binary,
	expression_logical,
	expression_call,
	expression_get,
	expression_set,
	expression_self,
	expression_super,
	expression_grouping,
	expression_lambda
>;

using statement = std::variant<
	statement_expression,
	statement_print,
	statement_variable,
	statement_scope,
	statement_branch,
	statement_loop,
	statement_function,
	statement_return,
	statement_class
>;

static_assert(std::variant_size_v<expression> == static_cast<size_t>(expression_type::lambda) + 1u);
static_assert(std::variant_size_v<statement> == static_cast<size_t>(statement_type::klass) + 1u);

} // namespace arbor
