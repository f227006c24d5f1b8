#pragma once

#include <string>
#include <vector>
#include <utility>
#include <string_view>
#include <optional>
#include <unordered_map>

#include "arbor/syntax.hpp"

namespace arbor {

/// Hop count of every resolved local reference, keyed by expression index
using resolution_table = std::unordered_map<expression_id::index_type, uint32_t>;

/// Node arena of a single parse. Handles stay valid for the program lifetime.
/// Keeps the parsed text so diagnostics can quote it after the next parse
class program {
public:
	using statement_list = arbor::statement_list;

	explicit program(std::string source = {}) : m_source{ std::move(source) } {}

	[[nodiscard]] auto source() const noexcept -> std::string_view { return m_source; }

	auto add_statement(statement_id stmt) -> statement_id {
		return m_statements.emplace_back(stmt);
	}

	template<statement_type Type, class ...Args>
	auto emplace(Args &&...args) -> statement_id {
		const auto index{ static_cast<statement_id::index_type>(std::size(m_statement_nodes)) };
		m_statement_nodes.emplace_back(
			std::in_place_index<static_cast<size_t>(Type)>, std::forward<Args>(args)...
		);
		return statement_id{ index, Type };
	}

	template<expression_type Type, class ...Args>
	auto emplace(Args &&...args) -> expression_id {
		const auto index{ static_cast<expression_id::index_type>(std::size(m_expression_nodes)) };
		m_expression_nodes.emplace_back(
			std::in_place_index<static_cast<size_t>(Type)>, std::forward<Args>(args)...
		);
		return expression_id{ index, Type };
	}

	template<expression_type Type>
	[[nodiscard]] auto get(expression_id id) const -> const auto & {
		return std::get<static_cast<size_t>(Type)>(m_expression_nodes.at(id.index));
	}

	template<statement_type Type>
	[[nodiscard]] auto get(statement_id id) const -> const auto & {
		return std::get<static_cast<size_t>(Type)>(m_statement_nodes.at(id.index));
	}

	template<statement_type Type>
	[[nodiscard]] auto get(statement_id id) -> auto & {
		return std::get<static_cast<size_t>(Type)>(m_statement_nodes.at(id.index));
	}

	template<class Visitor>
	decltype(auto) accept(expression_id id, Visitor &&visitor) const {
		return std::visit(std::forward<Visitor>(visitor), m_expression_nodes.at(id.index));
	}

	template<class Visitor>
	decltype(auto) accept(statement_id id, Visitor &&visitor) const {
		return std::visit(std::forward<Visitor>(visitor), m_statement_nodes.at(id.index));
	}

	[[nodiscard]] auto statements() const noexcept -> const statement_list & { return m_statements; }
	[[nodiscard]] auto begin() const noexcept { return std::begin(m_statements); }
	[[nodiscard]] auto end() const noexcept { return std::end(m_statements); }
	[[nodiscard]] auto empty() const noexcept -> bool { return std::empty(m_statements); }

	void bind(resolution_table locals) { m_locals = std::move(locals); }

	[[nodiscard]] auto depth_of(expression_id id) const -> std::optional<uint32_t> {
		if (const auto found{ m_locals.find(id.index) }; found != std::end(m_locals)) {
			return found->second;
		}
		return std::nullopt;
	}

private:
	std::string m_source;
	std::vector<expression> m_expression_nodes{};
	std::vector<statement> m_statement_nodes{};
	statement_list m_statements{};
	resolution_table m_locals{};
};

} // namespace arbor
