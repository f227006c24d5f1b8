#pragma once

#include <vector>
#include <string>
#include <optional>
#include <string_view>

#include "arbor/types/context.hpp"
#include "arbor/error_handler.hpp"
#include "arbor/lexeme_database.hpp"

namespace arbor {

class ARBOR_EXPORT scanner {
public:
	using output_type = context;

	/// Slots of nil, true and false at the front of every literal table
	static constexpr uint32_t nil_slot{ 0u };
	static constexpr uint32_t true_slot{ 1u };
	static constexpr uint32_t false_slot{ 2u };

	scanner(const std::string_view script, lexeme_database &lexemes, error_handler &errs) noexcept;

	[[nodiscard]] auto scan() -> output_type;

private:
	error_handler &errout;
	lexeme_database &lexemes;
	std::string_view m_script;
	uint32_t m_line{ 1u };

	auto end_position() const noexcept -> uint32_t;

	auto next_token(uint32_t position, output_type &output) -> uint32_t;

	auto parse_string_token(uint32_t position, output_type &output) -> uint32_t;
	auto parse_number_token(uint32_t position, output_type &output) -> uint32_t;
	auto parse_identifier_token(uint32_t position, output_type &output) -> uint32_t;
	auto try_parse_nil_or_boolean(uint32_t position, uint32_t end, output_type &output) -> bool;

	auto skip_till(const char matches, uint32_t from) const noexcept -> uint32_t;
	auto skip_whitespaces(uint32_t position) noexcept -> uint32_t;

	auto emplace_literal(literal lit, std::vector<literal> &out) -> uint32_t;
	void make_error_unexpected_symbol(uint32_t pos) const;
};

} // namespace arbor
