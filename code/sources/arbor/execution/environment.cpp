#include <utility>

#include "arbor/execution/environment.hpp"

namespace arbor::execution {

environment::environment(std::shared_ptr<environment> enclosing) noexcept
	: m_enclosing{ std::move(enclosing) } {}

void environment::define(lexeme_id id, value val) {
	if (const auto index{ index_of(id) }; index >= 0ll) {
		m_values[index] = std::move(val);
		return;
	}

	m_keys.emplace_back(id);
	m_values.emplace_back(std::move(val));
}

auto environment::look_up(lexeme_id id) const noexcept -> const value * {
	if (const auto index{ index_of(id) }; index >= 0ll) {
		return &m_values[index];
	}
	return m_enclosing != nullptr ? m_enclosing->look_up(id) : nullptr;
}

auto environment::look_up_at(uint32_t distance, lexeme_id id) const noexcept -> const value * {
	const auto env{ ancestor(distance) };
	if (env == nullptr) return nullptr;

	if (const auto index{ env->index_of(id) }; index >= 0ll) {
		return &env->m_values[index];
	}
	return nullptr;
}

auto environment::assign(lexeme_id id, value val) -> bool {
	if (const auto index{ index_of(id) }; index >= 0ll) {
		m_values[index] = std::move(val);
		return true;
	}
	return m_enclosing != nullptr && m_enclosing->assign(id, std::move(val));
}

auto environment::assign_at(uint32_t distance, lexeme_id id, value val) -> bool {
	const auto env{ ancestor(distance) };
	if (env == nullptr) return false;

	if (const auto index{ env->index_of(id) }; index >= 0ll) {
		env->m_values[index] = std::move(val);
		return true;
	}
	return false;
}

auto environment::ancestor(uint32_t distance) const noexcept -> const environment * {
	auto env{ this };
	for (; env != nullptr && distance > 0u; --distance) {
		env = env->m_enclosing.get();
	}
	return env;
}

auto environment::ancestor(uint32_t distance) noexcept -> environment * {
	return const_cast<environment *>(std::as_const(*this).ancestor(distance));
}

auto environment::copy() const -> std::shared_ptr<environment> {
	auto output{ std::make_shared<environment>(m_enclosing) };
	output->m_keys = m_keys;
	output->m_values = m_values;
	return output;
}

void environment::clear() noexcept {
	m_keys.clear();
	m_values.clear();
	m_enclosing.reset();
}

auto environment::index_of(lexeme_id id) const noexcept -> int64_t {
	int64_t index{ static_cast<int64_t>(std::size(m_keys)) - 1ll };
	for (; index >= 0ll && id != m_keys[index]; --index) { }
	return index;
}

} // namespace arbor::execution
