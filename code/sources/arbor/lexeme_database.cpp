#include <algorithm>

#include "arbor/lexeme_database.hpp"
#include "arbor/utils/strhash.hpp"

namespace arbor {

auto lexeme_database::add(std::string_view lexeme) -> lexeme_id {
	if (std::empty(lexeme)) {
		return npos;
	}

	const auto hash{ utils::fnv1a(lexeme) };
	if (const auto found{ find(hash, lexeme) }; found != npos) {
		return found;
	}

	const auto offset{ static_cast<uint32_t>(std::size(m_buffer)) };
	m_buffer.insert(std::end(m_buffer), std::begin(lexeme), std::end(lexeme));

	const auto id{ static_cast<lexeme_id>(std::size(m_sections)) };
	m_sections.emplace_back(offset, static_cast<uint32_t>(std::size(lexeme)));

	m_lookup_table.emplace(hash, id);

	return id;
}

auto lexeme_database::find(std::string_view lexeme) const noexcept -> lexeme_id {
	if (!std::empty(lexeme)) {
		return find(utils::fnv1a(lexeme), lexeme);
	}
	return npos;
}

auto lexeme_database::get(lexeme_id id) const noexcept -> std::string_view {
	if (id != 0u && id < std::size(m_sections)) {
		const auto [offset, length]{ m_sections[id] };
		return std::string_view{ std::next(std::data(m_buffer), offset), length };
	}

	return {};
}

auto lexeme_database::find(hash_type hash, std::string_view lexeme) const noexcept -> lexeme_id {
	const auto [first, last]{ m_lookup_table.equal_range(hash) };
	const auto found{ std::find_if(first, last, [this, lexeme](const auto &entry) {
		return get(entry.second) == lexeme;
	}) };
	return found != last ? found->second : npos;
}

} // namespace arbor
