#pragma once

#include <vector>
#include <string_view>

#include "arbor/types/token.hpp"
#include "arbor/types/literal.hpp"

namespace arbor {

/// Scanner output. The script view must outlive the context
struct context {
	std::string_view script{};
	std::vector<token> tokens{};
	std::vector<literal> literals{};

	[[nodiscard]] auto lexeme(const token &tok) const noexcept -> std::string_view {
		if (tok.position >= std::size(script)) return {};
		return script.substr(tok.position, tok.length);
	}

	[[nodiscard]] auto literal_of(const token &tok) const noexcept -> const literal * {
		if (tok.literal_id < std::size(literals)) return &literals[tok.literal_id];
		return nullptr;
	}
};

} // namespace arbor
