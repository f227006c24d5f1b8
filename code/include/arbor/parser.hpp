#pragma once

#include <stdexcept>
#include <functional>

#include "arbor/program.hpp"
#include "arbor/error_handler.hpp"
#include "arbor/types/context.hpp"

namespace arbor {

class ARBOR_EXPORT parser {
public:
	struct error : public std::runtime_error {
		explicit error(std::string_view msg) : std::runtime_error{ std::string{ msg } } {}
	};

	/// Nesting past constants::max_nesting_depth. Abandons the rest of the source
	struct nesting_error : public std::runtime_error {
		explicit nesting_error(std::string_view msg) : std::runtime_error{ std::string{ msg } } {}
	};

	parser(const context &ctx, error_handler &errs) noexcept;

	/// Failed declarations are reported and left out of the program
	[[nodiscard]] auto parse() -> program;

private:
	enum class function_kind : uint8_t { function, method, lambda };

	/// Restores the nesting depth of the enclosing rule on scope exit
	class nesting_scope {
	public:
		explicit nesting_scope(parser &owner) noexcept : m_owner{ owner }, m_saved{ owner.m_nesting } {}
		~nesting_scope() { m_owner.m_nesting = m_saved; }

		nesting_scope(const nesting_scope &) = delete;
		nesting_scope &operator=(const nesting_scope &) = delete;

		void enter(const token &tok) { m_owner.descend(tok); }

	private:
		parser &m_owner;
		size_t m_saved;
	};

	const context &ctx;
	error_handler &errout;
	size_t m_current{};
	size_t m_nesting{};

	auto declaration(program &out) -> statement_id;
	auto class_declaration(program &out) -> statement_id;
	auto variable_declaration(program &out) -> statement_id;
	auto function(program &out, function_kind kind) -> function_declaration;

	auto stmt(program &out) -> statement_id;
	auto print_stmt(program &out) -> statement_id;
	auto return_stmt(program &out) -> statement_id;
	auto branch_stmt(program &out) -> statement_id;
	auto loop_stmt(program &out) -> statement_id;
	auto for_loop_stmt(program &out) -> statement_id;
	auto scope_stmt(program &out) -> statement_id;
	auto block(program &out) -> statement_list;

	template<statement_type Type>
	auto make_stmt(program &out, auto content_gen, std::string_view on_missing_semicolon) -> statement_id {
		auto content{ std::invoke(content_gen, this, out) };
		consume(token_type::semicolon, on_missing_semicolon, error_code::pe_missing_end_of_statement);
		return out.emplace<Type>(content);
	}

	template<expression_type Expr, token_type ...Types>
	auto iterate_through(program &out, auto next) -> expression_id {
		nesting_scope nesting{ *this };
		auto expr_{ std::invoke(next, this, out) };

		while (match<Types...>()) {
			const auto &op{ previous() };
			nesting.enter(op);
			auto right{ std::invoke(next, this, out) };
			expr_ = out.emplace<Expr>(op, expr_, right);
		}

		return expr_;
	}

	template<token_type ...Types>
	auto match() -> bool {
		if (at_end()) return false;

		if (const auto type{ peek().type }; ((type == Types) || ...)) {
			++m_current;
			return true;
		}
		return false;
	}

	auto expr(program &out) -> expression_id;
	auto assignment(program &out) -> expression_id;
	auto logical_or(program &out) -> expression_id;
	auto logical_and(program &out) -> expression_id;
	auto equality(program &out) -> expression_id;
	auto comparison(program &out) -> expression_id;
	auto term(program &out) -> expression_id;
	auto factor(program &out) -> expression_id;
	auto unary(program &out) -> expression_id;
	auto call(program &out) -> expression_id;
	auto call_finish(program &out, expression_id caller) -> expression_id;
	auto primary(program &out) -> expression_id;

	void synchronize();
	void descend(const token &tok);

	auto consume(token_type type, std::string_view on_error,
		error_code code = error_code::pe_unexpected_token
	) -> const token &;

	auto advance() -> const token &;
	auto check(token_type type) const -> bool;
	auto check_next(token_type type) const -> bool;
	auto at_end() const -> bool;
	auto peek() const -> const token &;
	auto previous() const -> const token &;

	void report(std::string_view msg, error_code code, const token &tok) const;
	auto make_error(std::string_view msg, error_code code, const token &tok) const -> error;

	static auto kind_name(function_kind kind) noexcept -> std::string_view;
};

} // namespace arbor
