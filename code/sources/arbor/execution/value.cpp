#include "arbor/execution/value.hpp"
#include "arbor/execution/callable.hpp"

namespace arbor::execution {

auto value::is(value_type type) const noexcept -> bool {
	return index() == static_cast<size_t>(type);
}

auto value::type() const noexcept -> value_type {
	return static_cast<value_type>(index());
}

auto value::as_callable() const -> std::shared_ptr<callable> {
	if (const auto function{ as<std::shared_ptr<callable>>() }; function) {
		return *function;
	}
	if (const auto klass{ as<std::shared_ptr<class_object>>() }; klass) {
		return *klass;
	}
	return nullptr;
}

auto from_literal(const literal &lit) -> value {
	return std::visit([](const auto &content) -> value {
		return value{ content };
	}, static_cast<const literal_base &>(lit));
}

auto to_string(const value &val) -> std::string {
	switch (val.type()) {
		case value_type::nil:      return "nil";
		case value_type::boolean:  return *val.as<bool>() ? "true" : "false";
		case value_type::number:   return format_number(*val.as<double>());
		case value_type::string:   return *val.as<std::string>();
		case value_type::callable: return (*val.as<std::shared_ptr<callable>>())->to_string();
		case value_type::klass:    return (*val.as<std::shared_ptr<class_object>>())->to_string();
		case value_type::instance: return (*val.as<std::shared_ptr<instance>>())->to_string();

		default: break;
	}
	return "nil";
}

auto is_truthy(const value &val) noexcept -> bool {
	if (val.is(value_type::nil)) return false;
	if (const auto boolean{ val.as<bool>() }; boolean) return *boolean;
	return true;
}

auto equals(const value &lhv, const value &rhv) noexcept -> bool {
	return static_cast<const value_base &>(lhv) == static_cast<const value_base &>(rhv);
}

} // namespace arbor::execution
