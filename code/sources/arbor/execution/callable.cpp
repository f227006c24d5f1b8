#include <tuple>

#include <fmt/format.h>

#include "arbor/execution/callable.hpp"
#include "arbor/execution/interpreter.hpp"

namespace arbor::execution {

auto native_function::call(interpreter &runner, std::span<const value> args) -> value {
	if (m_func == nullptr) return nil_value;
	return m_func(runner, args);
}


user_function::user_function(
	std::shared_ptr<const program> prog,
	const function_declaration &declaration,
	std::shared_ptr<environment> closure,
	std::string name,
	bool is_initializer
) noexcept
	: m_program{ std::move(prog) }
	, m_declaration{ declaration }
	, m_closure{ std::move(closure) }
	, m_name{ std::move(name) }
	, m_is_initializer{ is_initializer } {}

auto user_function::arity() const noexcept -> size_t {
	return std::size(m_declaration.params);
}

auto user_function::call(interpreter &runner, std::span<const value> args) -> value {
	auto env{ std::make_shared<environment>(m_closure) };
	for (size_t i{}; i < std::size(args) && i < std::size(m_declaration.params); ++i) {
		env->define(m_declaration.params[i].lexeme_id, args[i]);
	}

	const auto result{ runner.execute_body(m_program, m_declaration.body, std::move(env)) };

	// init always yields the instance, even after a bare return
	if (m_is_initializer) {
		if (const auto self{ m_closure->look_up_at(0u, runner.keywords().self) }; self) {
			return *self;
		}
	}

	if (const auto returned{ std::get_if<return_completion>(&result) }; returned) {
		return returned->result;
	}
	return nil_value;
}

auto user_function::to_string() const -> std::string {
	if (m_declaration.anonymous()) return "<fn>";
	return fmt::format("<fn {}>", m_name);
}

auto user_function::bind(std::shared_ptr<instance> self, lexeme_id self_id) const -> std::shared_ptr<user_function> {
	auto env{ std::make_shared<environment>(m_closure) };
	env->define(self_id, std::move(self));
	return std::make_shared<user_function>(m_program, m_declaration, std::move(env), m_name, m_is_initializer);
}


class_object::class_object(
	std::string name,
	std::shared_ptr<class_object> superclass,
	method_table methods,
	lexeme_id init_id
)
	: m_name{ std::move(name) }
	, m_superclass{ std::move(superclass) }
	, m_methods{ std::move(methods) } {
	m_initializer = find_method(init_id);
}

auto class_object::arity() const noexcept -> size_t {
	return m_initializer != nullptr ? m_initializer->arity() : 0u;
}

auto class_object::call(interpreter &runner, std::span<const value> args) -> value {
	auto object{ std::make_shared<instance>(shared_from_this()) };
	runner.track(object);

	if (m_initializer != nullptr) {
		std::ignore = m_initializer->bind(object, runner.keywords().self)->call(runner, args);
	}
	return object;
}

auto class_object::find_method(lexeme_id id) const -> std::shared_ptr<user_function> {
	for (auto klass{ this }; klass != nullptr; klass = klass->m_superclass.get()) {
		if (const auto found{ klass->m_methods.find(id) }; found != std::end(klass->m_methods)) {
			return found->second;
		}
	}
	return nullptr;
}


auto instance::field(lexeme_id id) const noexcept -> const value * {
	if (const auto found{ m_fields.find(id) }; found != std::end(m_fields)) {
		return &found->second;
	}
	return nullptr;
}

void instance::set(lexeme_id id, value val) {
	m_fields.insert_or_assign(id, std::move(val));
}

auto instance::to_string() const -> std::string {
	return fmt::format("{} instance", m_class->name());
}

} // namespace arbor::execution
