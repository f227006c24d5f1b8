#pragma once

#include <map>
#include <limits>
#include <vector>
#include <cstdint>
#include <string_view>

#include "arbor/export.hpp"
#include "arbor/aliases.hpp"

namespace arbor {

/// Interns identifier text. Equal names always map to the same id
class ARBOR_EXPORT lexeme_database {
public:
	static constexpr auto npos{ (std::numeric_limits<lexeme_id>::max)() };

	struct section {
		uint32_t offset{};
		uint32_t length{};
	};

	[[nodiscard]] auto add(std::string_view lexeme) -> lexeme_id;
	[[nodiscard]] auto find(std::string_view lexeme) const noexcept -> lexeme_id;
	[[nodiscard]] auto get(lexeme_id id) const noexcept -> std::string_view;
	[[nodiscard]] auto size() const noexcept -> size_t { return std::size(m_sections) - 1u; }

private:
	std::vector<char> m_buffer{};
	std::vector<section> m_sections{ section{ 0u, 0u } };
	std::multimap<hash_type, lexeme_id> m_lookup_table{};

	auto find(hash_type hash, std::string_view lexeme) const noexcept -> lexeme_id;
};

} // namespace arbor
