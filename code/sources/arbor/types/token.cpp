#include "arbor/types/token.hpp"
#include "arbor/utils/strhash.hpp"

namespace arbor {

auto from_keyword(const std::string_view name) noexcept -> token_type {
	using enum token_type;

	const auto type{ [name] {
		switch (utils::fnv1a(name)) {
			using namespace utils::fnv1a_literals;

			case "var"_fnv1a:    return kw_var;
			case "print"_fnv1a:  return kw_print;
			case "and"_fnv1a:    return kw_and;
			case "or"_fnv1a:     return kw_or;
			case "if"_fnv1a:     return kw_if;
			case "else"_fnv1a:   return kw_else;
			case "while"_fnv1a:  return kw_while;
			case "for"_fnv1a:    return kw_for;
			case "fun"_fnv1a:    return kw_fun;
			case "return"_fnv1a: return kw_return;
			case "class"_fnv1a:  return kw_class;
			case "this"_fnv1a:   return kw_this;
			case "super"_fnv1a:  return kw_super;

			default: break;
		}
		return identifier;
	}() };

	// the hash only narrows the candidate, the text decides
	if (type != identifier && keyword_name(type) != name) {
		return identifier;
	}
	return type;
}

} // namespace arbor
