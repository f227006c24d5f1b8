#pragma once

#include <string>
#include <cstdint>
#include <variant>
#include <string_view>

#include "arbor/export.hpp"

namespace arbor {

enum class literal_type : uint8_t {
	nil,
	boolean,
	number,
	string
};

using literal_base = std::variant<std::monostate, bool, double, std::string>;

struct ARBOR_EXPORT literal : public literal_base {
	using literal_base::variant;

	[[nodiscard]] auto is(literal_type type) const noexcept -> bool;
	[[nodiscard]] auto type() const noexcept -> literal_type;

	template<class T>
	[[nodiscard]] auto as() const noexcept -> const T * { return std::get_if<T>(this); }

	template<class T>
	[[nodiscard]] auto as() noexcept -> T * { return std::get_if<T>(this); }

private:
	static constexpr auto _id(const literal_type t) noexcept -> size_t {
		return static_cast<size_t>(t);
	}
};

inline const literal nil_literal{};

/// Parses decimal number text ("12", "3.25"). Non-numbers yield nil
[[nodiscard]] ARBOR_EXPORT auto to_number_literal(const std::string_view str_value) -> literal;
[[nodiscard]] ARBOR_EXPORT auto to_string(const literal &lit) -> std::string;
[[nodiscard]] ARBOR_EXPORT auto format_number(double value) -> std::string;

} // namespace arbor
