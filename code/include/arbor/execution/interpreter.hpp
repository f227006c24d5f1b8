#pragma once

#include <memory>
#include <vector>
#include <variant>
#include <stdexcept>
#include <functional>

#include "arbor/program.hpp"
#include "arbor/error_handler.hpp"
#include "arbor/lexeme_database.hpp"
#include "arbor/execution/callable.hpp"
#include "arbor/execution/environment.hpp"

namespace arbor::execution {

enum class status : uint8_t {
	ok,
	invalid_program,
	runtime_error,
};

struct normal_completion {};
struct return_completion {
	value result{};
};

/// Outcome of a statement. A return unwinds every enclosing statement up to the call
using completion = std::variant<normal_completion, return_completion>;

class ARBOR_EXPORT interpreter final {
public:
	using output_sink = std::function<void(std::string_view)>;

	struct execution_error : public std::runtime_error {
		using std::runtime_error::runtime_error;
		status reason{ status::runtime_error };
	};

	struct keyword_ids {
		lexeme_id self{ invalid_id };
		lexeme_id super{ invalid_id };
		lexeme_id init{ invalid_id };
	};

	interpreter(lexeme_database &lexemes, error_handler &handler, output_sink output);
	~interpreter();

	interpreter(const interpreter &) = delete;
	interpreter &operator=(const interpreter &) = delete;

	/// Executes the top-level statements. Globals survive between runs
	[[nodiscard]] auto run(std::shared_ptr<const program> prog) -> status;

	/// Runs a function body in its call environment
	[[nodiscard]] auto execute_body(
		const std::shared_ptr<const program> &prog,
		const statement_list &body,
		std::shared_ptr<environment> env
	) -> completion;

	void track(const std::shared_ptr<instance> &object);

	[[nodiscard]] auto globals() const noexcept -> const std::shared_ptr<environment> & { return m_globals; }
	[[nodiscard]] auto keywords() const noexcept -> const keyword_ids & { return m_keywords; }

private:
	lexeme_database &m_lexemes;
	error_handler &errout;
	output_sink m_output;
	keyword_ids m_keywords;

	std::shared_ptr<environment> m_globals;
	std::shared_ptr<environment> m_env;
	std::shared_ptr<const program> m_program{};
	size_t m_depth{};

	std::vector<std::weak_ptr<environment>> m_closures{};
	std::vector<std::weak_ptr<instance>> m_instances{};

	[[nodiscard]] auto execute(statement_id stmt) -> completion;
	[[nodiscard]] auto evaluate(expression_id expr) -> value;
	[[nodiscard]] auto execute_block(const statement_list &statements, std::shared_ptr<environment> env) -> completion;

#pragma region expressions

	[[nodiscard]] auto accept(expression_id id, const expression_literal &lit) -> value;
	[[nodiscard]] auto accept(expression_id id, const expression_identifier &identifier) -> value;
	[[nodiscard]] auto accept(expression_id id, const expression_assignment &assign) -> value;
	[[nodiscard]] auto accept(expression_id id, const expression_unary &unary) -> value;
	[[nodiscard]] auto accept(expression_id id, const expression_binary &binary) -> value;
	[[nodiscard]] auto accept(expression_id id, const expression_logical &logic) -> value;
	[[nodiscard]] auto accept(expression_id id, const expression_call &call) -> value;
	[[nodiscard]] auto accept(expression_id id, const expression_get &get) -> value;
	[[nodiscard]] auto accept(expression_id id, const expression_set &set) -> value;
	[[nodiscard]] auto accept(expression_id id, const expression_self &self) -> value;
	[[nodiscard]] auto accept(expression_id id, const expression_super &super) -> value;
	[[nodiscard]] auto accept(expression_id id, const expression_grouping &group) -> value;
	[[nodiscard]] auto accept(expression_id id, const expression_lambda &lambda) -> value;

#pragma endregion expressions

#pragma region statements

	[[nodiscard]] auto accept(const statement_expression &expr) -> completion;
	[[nodiscard]] auto accept(const statement_print &print) -> completion;
	[[nodiscard]] auto accept(const statement_variable &var) -> completion;
	[[nodiscard]] auto accept(const statement_scope &scope) -> completion;
	[[nodiscard]] auto accept(const statement_branch &branch) -> completion;
	[[nodiscard]] auto accept(const statement_loop &loop) -> completion;
	[[nodiscard]] auto accept(const statement_function &func) -> completion;
	[[nodiscard]] auto accept(const statement_return &ret) -> completion;
	[[nodiscard]] auto accept(const statement_class &klass) -> completion;

#pragma endregion statements

	[[nodiscard]] auto look_up_variable(expression_id id, const token &name) const -> value;
	void assign_variable(expression_id id, const token &name, value val);

	[[nodiscard]] auto make_function(const function_declaration &declaration, std::string name, bool is_initializer)
		-> std::shared_ptr<user_function>;
	[[nodiscard]] auto bind_method(const std::shared_ptr<instance> &object, const user_function &method)
		-> std::shared_ptr<user_function>;
	void track(const std::shared_ptr<environment> &env);

	[[nodiscard]] auto error(error_code err_no, std::string_view msg, const token &tok) const -> execution_error;
};

} // namespace arbor::execution
