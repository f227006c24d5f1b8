#pragma once

#include <concepts>
#include <type_traits>

namespace arbor::utils::ct {

template<class T>
concept enumeration = std::is_enum_v<T>;

/// True when value equals one of the enumerators listed
template<auto First, auto ...Rest>
	requires enumeration<decltype(First)> && (std::same_as<decltype(First), decltype(Rest)> && ...)
[[nodiscard]] constexpr bool any_from(const decltype(First) value) noexcept {
	return value == First || ((value == Rest) || ...);
}

} // namespace arbor::utils::ct
