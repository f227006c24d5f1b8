#include <cmath>

#include <fmt/format.h>
#include <fast_float/fast_float.h>

#include "arbor/types/literal.hpp"

namespace arbor {

auto literal::is(literal_type type) const noexcept -> bool {
	return index() == _id(type);
}

auto literal::type() const noexcept -> literal_type {
	return static_cast<literal_type>(index());
}


auto to_number_literal(const std::string_view str_value) -> literal {
	if (std::empty(str_value)) return nil_literal;

	const auto b{ std::data(str_value) };
	const auto e{ std::next(std::data(str_value), std::size(str_value)) };

	if (double val{}; fast_float::from_chars(b, e, val).ec == std::errc{}) {
		return literal{ val };
	}

	return nil_literal;
}

auto to_string(const literal &lit) -> std::string {
	switch (lit.type()) {
		using enum literal_type;

		case boolean: return *lit.as<bool>() ? "true" : "false";
		case number:  return format_number(*lit.as<double>());
		case string:  return fmt::format("\"{}\"", *lit.as<std::string>());

		default: break;
	}

	return "nil";
}

auto format_number(const double value) -> std::string {
	if (std::isnan(value)) return "nan";
	if (std::isinf(value)) return value < 0.0 ? "-inf" : "inf";

	// shortest round-trip form, integral values are printed without ".0"
	return fmt::format("{}", value);
}

} // namespace arbor
