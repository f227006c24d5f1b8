#pragma once

#include <memory>
#include <string>
#include <variant>

#include "arbor/export.hpp"
#include "arbor/types/literal.hpp"

namespace arbor::execution {

class callable;
class class_object;
class instance;

enum class value_type : uint8_t {
	nil,
	boolean,
	number,
	string,
	callable,
	klass,
	instance,
};

using value_base = std::variant<
	std::monostate,
	bool,
	double,
	std::string,
	std::shared_ptr<callable>,
	std::shared_ptr<class_object>,
	std::shared_ptr<instance>
>;

/// Runtime value. Callables, classes and instances are shared by reference
struct ARBOR_EXPORT value : public value_base {
	using value_base::variant;

	[[nodiscard]] auto is(value_type type) const noexcept -> bool;
	[[nodiscard]] auto type() const noexcept -> value_type;

	template<class T>
	[[nodiscard]] auto as() const noexcept -> const T * { return std::get_if<T>(this); }

	template<class T>
	[[nodiscard]] auto as() noexcept -> T * { return std::get_if<T>(this); }

	/// Functions and classes. Null for everything else
	[[nodiscard]] auto as_callable() const -> std::shared_ptr<callable>;
};

inline const value nil_value{};

[[nodiscard]] ARBOR_EXPORT auto from_literal(const literal &lit) -> value;

/// Text written by print. Strings are not quoted
[[nodiscard]] ARBOR_EXPORT auto to_string(const value &val) -> std::string;
[[nodiscard]] ARBOR_EXPORT auto is_truthy(const value &val) noexcept -> bool;
[[nodiscard]] ARBOR_EXPORT auto equals(const value &lhv, const value &rhv) noexcept -> bool;

} // namespace arbor::execution
