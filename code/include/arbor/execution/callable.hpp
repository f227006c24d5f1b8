#pragma once

#include <span>
#include <memory>
#include <string>
#include <functional>
#include <unordered_map>

#include "arbor/program.hpp"
#include "arbor/execution/value.hpp"
#include "arbor/execution/environment.hpp"

namespace arbor::execution {

class interpreter;

class ARBOR_EXPORT callable {
public:
	virtual ~callable() = default;

	[[nodiscard]] virtual auto arity() const noexcept -> size_t = 0;
	[[nodiscard]] virtual auto call(interpreter &runner, std::span<const value> args) -> value = 0;
	[[nodiscard]] virtual auto to_string() const -> std::string = 0;
};

class ARBOR_EXPORT native_function final : public callable {
public:
	using signature = value(interpreter &, std::span<const value>);

	native_function(std::function<signature> function, size_t arity) noexcept
		: m_func{ std::move(function) }, m_arity{ arity } {}

	[[nodiscard]] auto arity() const noexcept -> size_t override { return m_arity; }
	[[nodiscard]] auto call(interpreter &runner, std::span<const value> args) -> value override;
	[[nodiscard]] auto to_string() const -> std::string override { return "<native fn>"; }

private:
	std::function<signature> m_func{};
	size_t m_arity{};
};

/// Function declaration paired with the environment it was declared in.
/// Keeps the declaring program alive for as long as the function exists
class ARBOR_EXPORT user_function final : public callable {
public:
	user_function(
		std::shared_ptr<const program> prog,
		const function_declaration &declaration,
		std::shared_ptr<environment> closure,
		std::string name,
		bool is_initializer
	) noexcept;

	[[nodiscard]] auto arity() const noexcept -> size_t override;
	[[nodiscard]] auto call(interpreter &runner, std::span<const value> args) -> value override;
	[[nodiscard]] auto to_string() const -> std::string override;

	/// Method copy whose closure binds `this` to the instance
	[[nodiscard]] auto bind(std::shared_ptr<instance> self, lexeme_id self_id) const -> std::shared_ptr<user_function>;

	[[nodiscard]] auto closure() const noexcept -> const std::shared_ptr<environment> & { return m_closure; }

private:
	std::shared_ptr<const program> m_program;
	const function_declaration &m_declaration;
	std::shared_ptr<environment> m_closure;
	std::string m_name;
	bool m_is_initializer{ false };
};

using method_table = std::unordered_map<lexeme_id, std::shared_ptr<user_function>>;

class ARBOR_EXPORT class_object final
	: public callable
	, public std::enable_shared_from_this<class_object> {
public:
	class_object(
		std::string name,
		std::shared_ptr<class_object> superclass,
		method_table methods,
		lexeme_id init_id
	);

	[[nodiscard]] auto arity() const noexcept -> size_t override;
	[[nodiscard]] auto call(interpreter &runner, std::span<const value> args) -> value override;
	[[nodiscard]] auto to_string() const -> std::string override { return m_name; }

	/// Searches this class first, then the superclass chain
	[[nodiscard]] auto find_method(lexeme_id id) const -> std::shared_ptr<user_function>;

	[[nodiscard]] auto name() const noexcept -> std::string_view { return m_name; }

private:
	std::string m_name;
	std::shared_ptr<class_object> m_superclass;
	method_table m_methods;
	std::shared_ptr<user_function> m_initializer;
};

class ARBOR_EXPORT instance final {
public:
	explicit instance(std::shared_ptr<class_object> klass) noexcept : m_class{ std::move(klass) } {}

	[[nodiscard]] auto field(lexeme_id id) const noexcept -> const value *;
	void set(lexeme_id id, value val);

	void clear() noexcept { m_fields.clear(); }

	[[nodiscard]] auto klass() const noexcept -> const std::shared_ptr<class_object> & { return m_class; }
	[[nodiscard]] auto to_string() const -> std::string;

private:
	std::shared_ptr<class_object> m_class;
	std::unordered_map<lexeme_id, value> m_fields{};
};

} // namespace arbor::execution
