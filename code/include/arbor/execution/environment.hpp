#pragma once

#include <memory>
#include <vector>

#include "arbor/aliases.hpp"
#include "arbor/execution/value.hpp"

namespace arbor::execution {

/// One scope of bindings linked to its enclosing scope
class ARBOR_EXPORT environment {
public:
	explicit environment(std::shared_ptr<environment> enclosing = nullptr) noexcept;

	/// Rebinding an existing name in the same scope overwrites it
	void define(lexeme_id id, value val);

	[[nodiscard]] auto look_up(lexeme_id id) const noexcept -> const value *;
	[[nodiscard]] auto look_up_at(uint32_t distance, lexeme_id id) const noexcept -> const value *;

	[[nodiscard]] auto assign(lexeme_id id, value val) -> bool;
	[[nodiscard]] auto assign_at(uint32_t distance, lexeme_id id, value val) -> bool;

	[[nodiscard]] auto ancestor(uint32_t distance) const noexcept -> const environment *;
	[[nodiscard]] auto ancestor(uint32_t distance) noexcept -> environment *;

	/// Sibling scope with the same enclosing scope and a copy of the bindings
	[[nodiscard]] auto copy() const -> std::shared_ptr<environment>;

	/// Drops bindings and the enclosing link
	void clear() noexcept;

private:
	std::shared_ptr<environment> m_enclosing;
	std::vector<lexeme_id> m_keys{};
	std::vector<value> m_values{};

	auto index_of(lexeme_id id) const noexcept -> int64_t;
};

} // namespace arbor::execution
