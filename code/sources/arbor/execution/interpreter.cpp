#include <tuple>
#include <optional>
#include <utility>
#include <algorithm>
#include <functional>

#include <fmt/format.h>
#include <tl/expected.hpp>

#include "arbor/constants.hpp"
#include "arbor/execution/interpreter.hpp"

namespace arbor::execution {

namespace {

struct evaluation_failure {
	error_code code{ error_code::ee_literal_not_suitable_for_operation };
	std::string message{};
};

using evaluation_result = tl::expected<value, evaluation_failure>;

auto make_failure(std::string message, error_code code = error_code::ee_literal_not_suitable_for_operation) {
	return tl::make_unexpected(evaluation_failure{ .code = code, .message = std::move(message) });
}

namespace traits {

template<token_type Type>
struct operation { using type = void; };

template<> struct operation<token_type::plus>          { using type = std::plus<>;          };
template<> struct operation<token_type::minus>         { using type = std::minus<>;         };
template<> struct operation<token_type::star>          { using type = std::multiplies<>;    };
template<> struct operation<token_type::slash>         { using type = std::divides<>;       };

template<> struct operation<token_type::less>          { using type = std::less<>;          };
template<> struct operation<token_type::less_equal>    { using type = std::less_equal<>;    };
template<> struct operation<token_type::greater>       { using type = std::greater<>;       };
template<> struct operation<token_type::greater_equal> { using type = std::greater_equal<>; };

} // namespace traits

template<token_type Type, class Operation = typename traits::operation<Type>::type>
auto eval_numeric(const value &lhv, const value &rhv) -> std::optional<value> {
	const auto lhs{ lhv.as<double>() };
	const auto rhs{ rhv.as<double>() };
	if (lhs == nullptr || rhs == nullptr) {
		return std::nullopt;
	}

	const Operation oper{};
	return value{ oper(*lhs, *rhs) };
}

template<token_type Operation>
struct operation {
	static_assert(token_traits::is_arithmetic_v<Operation> || token_traits::is_comparison_v<Operation>);

	[[nodiscard]]
	static auto eval(const value &lhv, const value &rhv) -> evaluation_result {
		if (auto result{ eval_numeric<Operation>(lhv, rhv) }; result.has_value()) {
			return std::move(result).value();
		}
		return make_failure("Operands must be numbers.");
	}
};

template<>
struct operation<token_type::plus> {
	[[nodiscard]]
	static auto eval(const value &lhv, const value &rhv) -> evaluation_result {
		if (auto result{ eval_numeric<token_type::plus>(lhv, rhv) }; result.has_value()) {
			return std::move(result).value();
		}

		const auto lhs{ lhv.as<std::string>() };
		const auto rhs{ rhv.as<std::string>() };
		if (lhs != nullptr && rhs != nullptr) {
			return value{ concat(*lhs, *rhs) };
		}

		return make_failure("Operands must be two numbers or two strings.");
	}

	[[nodiscard]]
	static auto concat(std::string_view lhv, std::string_view rhv) -> std::string {
		std::string result(std::size(lhv) + std::size(rhv), '\0');
		auto [_, pos]{ std::ranges::copy(lhv, std::begin(result)) };
		std::ranges::copy(rhv, pos);
		return result;
	}
};

template<>
struct operation<token_type::slash> {
	[[nodiscard]]
	static auto eval(const value &lhv, const value &rhv) -> evaluation_result {
		const auto rhs{ rhv.as<double>() };
		if (lhv.as<double>() == nullptr || rhs == nullptr) {
			return make_failure("Operands must be numbers.");
		}
		if (*rhs == 0.0) {
			return make_failure("Division by zero.", error_code::ee_division_by_zero);
		}
		return eval_numeric<token_type::slash>(lhv, rhv).value_or(nil_value);
	}
};

template<>
struct operation<token_type::equal_equal> {
	[[nodiscard]]
	static auto eval(const value &lhv, const value &rhv) -> evaluation_result {
		return value{ equals(lhv, rhv) };
	}
};

template<>
struct operation<token_type::bang_equal> {
	[[nodiscard]]
	static auto eval(const value &lhv, const value &rhv) -> evaluation_result {
		return value{ !equals(lhv, rhv) };
	}
};

/// Restores the previous content of the slot on scope exit
template<class T>
class scoped_assignment {
public:
	scoped_assignment(T &slot, T next)
		: m_slot{ slot }, m_previous{ std::exchange(slot, std::move(next)) } {}

	~scoped_assignment() { m_slot = std::move(m_previous); }

	scoped_assignment(const scoped_assignment &) = delete;
	scoped_assignment &operator=(const scoped_assignment &) = delete;

private:
	T &m_slot;
	T m_previous;
};

} // namespace


interpreter::interpreter(lexeme_database &lexemes, error_handler &handler, output_sink output)
	: m_lexemes{ lexemes }
	, errout{ handler }
	, m_output{ std::move(output) }
	, m_keywords{
		.self  = lexemes.add("this"),
		.super = lexemes.add("super"),
		.init  = lexemes.add("init")
	}
	, m_globals{ std::make_shared<environment>() }
	, m_env{ m_globals } {}

interpreter::~interpreter() {
	// closures and instances may reference each other, break the cycles
	for (const auto &weak : m_instances) {
		if (const auto object{ weak.lock() }; object) object->clear();
	}
	for (const auto &weak : m_closures) {
		if (const auto env{ weak.lock() }; env) env->clear();
	}
	m_env.reset();
	m_globals->clear();
}

auto interpreter::run(std::shared_ptr<const program> prog) -> status try {
	if (prog == nullptr) return status::invalid_program;

	m_program = std::move(prog);
	m_env = m_globals;
	m_depth = 0u;

	for (const auto stmt : m_program->statements()) {
		std::ignore = execute(stmt);
	}
	return status::ok;
} catch (const execution_error &err) {
	m_env = m_globals;
	m_depth = 0u;
	return err.reason;
}

auto interpreter::execute_body(
	const std::shared_ptr<const program> &prog,
	const statement_list &body,
	std::shared_ptr<environment> env
) -> completion {
	const scoped_assignment program_guard{ m_program, prog };
	return execute_block(body, std::move(env));
}

void interpreter::track(const std::shared_ptr<instance> &object) {
	if (std::size(m_instances) == m_instances.capacity()) {
		std::erase_if(m_instances, [](const auto &weak) { return weak.expired(); });
	}
	m_instances.emplace_back(object);
}

void interpreter::track(const std::shared_ptr<environment> &env) {
	if (env == m_globals) return;

	if (std::size(m_closures) == m_closures.capacity()) {
		std::erase_if(m_closures, [](const auto &weak) { return weak.expired(); });
	}
	m_closures.emplace_back(env);
}

auto interpreter::execute(statement_id stmt) -> completion {
	if (std::empty(stmt)) return normal_completion{};

	const scoped_assignment depth_guard{ m_depth, m_depth + 1u };
	return m_program->accept(stmt, [this](const auto &node) { return accept(node); });
}

auto interpreter::evaluate(expression_id expr) -> value {
	if (std::empty(expr)) return nil_value;

	const scoped_assignment depth_guard{ m_depth, m_depth + 1u };
	return m_program->accept(expr, [this, expr](const auto &node) { return accept(expr, node); });
}

auto interpreter::execute_block(const statement_list &statements, std::shared_ptr<environment> env) -> completion {
	const scoped_assignment env_guard{ m_env, std::move(env) };

	for (const auto stmt : statements) {
		if (auto result{ execute(stmt) }; std::holds_alternative<return_completion>(result)) {
			return result;
		}
	}
	return normal_completion{};
}

#pragma region expressions

auto interpreter::accept(expression_id, const expression_literal &lit) -> value {
	return from_literal(lit.value);
}

auto interpreter::accept(const expression_id id, const expression_identifier &identifier) -> value {
	return look_up_variable(id, identifier.name);
}

auto interpreter::accept(const expression_id id, const expression_assignment &assign) -> value {
	auto result{ evaluate(assign.value) };
	assign_variable(id, assign.name, result);
	return result;
}

auto interpreter::accept(expression_id, const expression_unary &unary) -> value {
	const auto operand{ evaluate(unary.expr) };

	switch (unary.op.type) {
		using enum token_type;

		case minus:
			if (const auto num{ operand.as<double>() }; num) {
				return value{ -*num };
			}
			throw error(error_code::ee_literal_not_suitable_for_operation, "Operand must be a number.", unary.op);

		case bang:
			return value{ !is_truthy(operand) };

		default: break;
	}

	return nil_value;
}

auto interpreter::accept(expression_id, const expression_binary &binary) -> value {
	const auto lhv{ evaluate(binary.left) };
	const auto rhv{ evaluate(binary.right) };

	auto throw_error{ [this, &op = binary.op] (const evaluation_failure &failure) {
		throw error(failure.code, failure.message, op);
	} };

	return [op{ binary.op.type }, &lhv, &rhv] {
		switch (op) {
			using enum token_type;

			case plus:  return operation<plus>::eval(lhv, rhv);
			case minus: return operation<minus>::eval(lhv, rhv);
			case star:  return operation<star>::eval(lhv, rhv);
			case slash: return operation<slash>::eval(lhv, rhv);

			case equal_equal:   return operation<equal_equal>::eval(lhv, rhv);
			case bang_equal:    return operation<bang_equal>::eval(lhv, rhv);
			case less:          return operation<less>::eval(lhv, rhv);
			case less_equal:    return operation<less_equal>::eval(lhv, rhv);
			case greater:       return operation<greater>::eval(lhv, rhv);
			case greater_equal: return operation<greater_equal>::eval(lhv, rhv);

			default: break;
		}

		return evaluation_result{ make_failure(
			fmt::format("Unknown operation '{}' ({})", token_string(op), token_name(op))
		) };
	}()
		.or_else(std::move(throw_error))
		.value_or(nil_value)
	;
}

auto interpreter::accept(expression_id, const expression_logical &logic) -> value {
	auto left{ evaluate(logic.left) };

	if (logic.op.type == token_type::kw_or) {
		if (is_truthy(left)) return left;
	} else if (!is_truthy(left)) {
		return left;
	}

	return evaluate(logic.right);
}

auto interpreter::accept(expression_id, const expression_call &call) -> value {
	const auto callee{ evaluate(call.caller) };

	std::vector<value> args;
	args.reserve(std::size(call.args));
	for (const auto arg : call.args) {
		args.emplace_back(evaluate(arg));
	}

	const auto function{ callee.as_callable() };
	if (function == nullptr) {
		throw error(error_code::ee_invalid_callable, "Can only call functions and classes.", call.paren);
	}

	if (const auto arity{ function->arity() }; arity != std::size(args)) {
		throw error(error_code::ee_invalid_arguments_count,
			fmt::format("Expected {} arguments but got {}.", arity, std::size(args)),
			call.paren
		);
	}

	// nesting between two calls is bounded by the parser limit
	if (m_depth >= constants::max_execution_depth) {
		throw error(error_code::ee_stack_overflow, "Stack overflow.", call.paren);
	}

	return function->call(*this, args);
}

auto interpreter::accept(expression_id, const expression_get &get) -> value {
	const auto object{ evaluate(get.object) };

	const auto target{ object.as<std::shared_ptr<instance>>() };
	if (target == nullptr) {
		throw error(error_code::ee_not_an_instance, "Only instances have properties.", get.name);
	}

	if (const auto field{ (*target)->field(get.name.lexeme_id) }; field) {
		return *field;
	}

	if (const auto method{ (*target)->klass()->find_method(get.name.lexeme_id) }; method) {
		return bind_method(*target, *method);
	}

	throw error(error_code::ee_undefined_property,
		fmt::format("Undefined property '{}'.", m_lexemes.get(get.name.lexeme_id)), get.name
	);
}

auto interpreter::accept(expression_id, const expression_set &set) -> value {
	const auto object{ evaluate(set.object) };

	const auto target{ object.as<std::shared_ptr<instance>>() };
	if (target == nullptr) {
		throw error(error_code::ee_not_an_instance, "Only instances have fields.", set.name);
	}

	auto result{ evaluate(set.value) };
	(*target)->set(set.name.lexeme_id, result);
	return result;
}

auto interpreter::accept(const expression_id id, const expression_self &self) -> value {
	return look_up_variable(id, self.keyword);
}

auto interpreter::accept(const expression_id id, const expression_super &super) -> value {
	const auto depth{ m_program->depth_of(id) };
	if (!depth.has_value() || *depth == 0u) {
		throw error(error_code::ee_undefined_identifier, "Undefined variable 'super'.", super.keyword);
	}

	const auto superclass_value{ m_env->look_up_at(*depth, m_keywords.super) };
	const auto self_value{ m_env->look_up_at(*depth - 1u, m_keywords.self) };

	const auto superclass{ superclass_value != nullptr
		? superclass_value->as<std::shared_ptr<class_object>>()
		: nullptr
	};
	const auto object{ self_value != nullptr
		? self_value->as<std::shared_ptr<instance>>()
		: nullptr
	};
	if (superclass == nullptr || object == nullptr) {
		throw error(error_code::ee_undefined_identifier, "Undefined variable 'super'.", super.keyword);
	}

	if (const auto method{ (*superclass)->find_method(super.method.lexeme_id) }; method) {
		return bind_method(*object, *method);
	}

	throw error(error_code::ee_undefined_property,
		fmt::format("Undefined property '{}'.", m_lexemes.get(super.method.lexeme_id)), super.method
	);
}

auto interpreter::accept(expression_id, const expression_grouping &group) -> value {
	return evaluate(group.expr);
}

auto interpreter::accept(expression_id, const expression_lambda &lambda) -> value {
	return make_function(lambda.function, std::string{}, false);
}

#pragma endregion expressions

#pragma region statements

auto interpreter::accept(const statement_expression &expr) -> completion {
	std::ignore = evaluate(expr.expr);
	return normal_completion{};
}

auto interpreter::accept(const statement_print &print) -> completion {
	auto text{ to_string(evaluate(print.expr)) };
	text.push_back('\n');
	if (m_output) m_output(text);
	return normal_completion{};
}

auto interpreter::accept(const statement_variable &var) -> completion {
	m_env->define(var.identifier.lexeme_id,
		!std::empty(var.initializer) ? evaluate(var.initializer) : nil_value
	);
	return normal_completion{};
}

auto interpreter::accept(const statement_scope &scope) -> completion {
	return execute_block(scope.statements, std::make_shared<environment>(m_env));
}

auto interpreter::accept(const statement_branch &branch) -> completion {
	if (is_truthy(evaluate(branch.condition))) {
		return execute(branch.then_branch);
	}
	return execute(branch.else_branch);
}

auto interpreter::accept(const statement_loop &loop) -> completion {
	if (std::empty(loop.initializer)) {
		while (is_truthy(evaluate(loop.condition))) {
			if (auto result{ execute(loop.body) }; std::holds_alternative<return_completion>(result)) {
				return result;
			}
			std::ignore = evaluate(loop.increment);
		}
		return normal_completion{};
	}

	const scoped_assignment env_guard{ m_env, std::make_shared<environment>(m_env) };
	std::ignore = execute(loop.initializer);

	while (is_truthy(evaluate(loop.condition))) {
		if (auto result{ execute(loop.body) }; std::holds_alternative<return_completion>(result)) {
			return result;
		}

		// closures of the finished iteration keep their own copy of the loop variables
		m_env = m_env->copy();
		std::ignore = evaluate(loop.increment);
	}
	return normal_completion{};
}

auto interpreter::accept(const statement_function &func) -> completion {
	const auto &declaration{ func.function };
	m_env->define(declaration.name.lexeme_id,
		make_function(declaration, std::string{ m_lexemes.get(declaration.name.lexeme_id) }, false)
	);
	return normal_completion{};
}

auto interpreter::accept(const statement_return &ret) -> completion {
	return return_completion{
		.result = !std::empty(ret.value) ? evaluate(ret.value) : nil_value
	};
}

auto interpreter::accept(const statement_class &klass) -> completion {
	std::shared_ptr<class_object> superclass{};
	if (!std::empty(klass.superclass)) {
		const auto parent{ evaluate(klass.superclass) };
		const auto parent_class{ parent.as<std::shared_ptr<class_object>>() };
		if (parent_class == nullptr) {
			throw error(error_code::ee_invalid_superclass, "Superclass must be a class.",
				m_program->get<expression_type::identifier>(klass.superclass).name
			);
		}
		superclass = *parent_class;
	}

	m_env->define(klass.name.lexeme_id, nil_value);

	std::shared_ptr<class_object> object{};
	{
		const scoped_assignment env_guard{ m_env,
			superclass != nullptr ? std::make_shared<environment>(m_env) : m_env
		};
		if (superclass != nullptr) {
			m_env->define(m_keywords.super, superclass);
		}

		method_table methods;
		for (const auto &method : klass.methods) {
			const auto id{ method.name.lexeme_id };
			methods.insert_or_assign(id, make_function(method, std::string{ m_lexemes.get(id) }, id == m_keywords.init));
		}

		object = std::make_shared<class_object>(
			std::string{ m_lexemes.get(klass.name.lexeme_id) }, superclass, std::move(methods), m_keywords.init
		);
	}

	m_env->define(klass.name.lexeme_id, std::move(object));
	return normal_completion{};
}

#pragma endregion statements

auto interpreter::look_up_variable(const expression_id id, const token &name) const -> value {
	const auto depth{ m_program->depth_of(id) };
	const auto found{ depth.has_value()
		? m_env->look_up_at(*depth, name.lexeme_id)
		: m_globals->look_up(name.lexeme_id)
	};

	if (found == nullptr) {
		throw error(error_code::ee_undefined_identifier,
			fmt::format("Undefined variable '{}'.", m_lexemes.get(name.lexeme_id)), name
		);
	}
	return *found;
}

void interpreter::assign_variable(const expression_id id, const token &name, value val) {
	const auto depth{ m_program->depth_of(id) };
	const auto assigned{ depth.has_value()
		? m_env->assign_at(*depth, name.lexeme_id, std::move(val))
		: m_globals->assign(name.lexeme_id, std::move(val))
	};

	if (!assigned) {
		throw error(error_code::ee_undefined_identifier,
			fmt::format("Undefined variable '{}'.", m_lexemes.get(name.lexeme_id)), name
		);
	}
}

auto interpreter::make_function(const function_declaration &declaration, std::string name, bool is_initializer)
	-> std::shared_ptr<user_function> {
	track(m_env);
	return std::make_shared<user_function>(m_program, declaration, m_env, std::move(name), is_initializer);
}

auto interpreter::bind_method(const std::shared_ptr<instance> &object, const user_function &method)
	-> std::shared_ptr<user_function> {
	auto bound{ method.bind(object, m_keywords.self) };
	track(bound->closure());
	return bound;
}

auto interpreter::error(error_code err_no, std::string_view msg, const token &tok) const -> execution_error {
	errout.report(msg, error_record{
		.code = err_no,
		.line = tok.line,
		.from = tok.position,
		.to   = tok.position + tok.length
	}, m_program->source());
	return execution_error{ std::string{ msg } };
}

} // namespace arbor::execution
