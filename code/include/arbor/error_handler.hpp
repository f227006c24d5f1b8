#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <memory_resource>

#include "arbor/export.hpp"
#include "arbor/aliases.hpp"

namespace arbor {

enum class error_code : uint32_t {
	no_error,

	scanner_error_begin,
	se_unexpected_symbol,        /// Found unexpected symbol during scan
	se_unterminated_string,      /// The closing '"' was not found on the same line
	scanner_error_end = 99,

	parser_error_begin,
	pe_missing_end_of_statement,
	pe_unexpected_token,
	pe_broken_symmetry,          /// The symmetry character like () or {} was not closed
	pe_expected_identifier,
	pe_missing_expression,
	pe_lvalue_assignment,
	pe_too_many_arguments,
	pe_too_many_parameters,
	pe_too_deep_nesting,         /// Statements or expressions nested past the parser limit
	parser_error_end = 199,

	resolver_error_begin,
	re_self_initialization,      /// Local variable is read inside its own initializer
	re_redeclaration,
	re_this_outside_class,
	re_super_outside_class,
	re_super_without_superclass,
	re_return_outside_function,
	re_return_from_initializer,
	re_self_inheritance,
	resolver_error_end = 299,

	evaluation_error_begin,
	ee_literal_not_suitable_for_operation,
	ee_undefined_identifier,
	ee_undefined_property,
	ee_invalid_callable,
	ee_invalid_arguments_count,
	ee_division_by_zero,
	ee_invalid_superclass,
	ee_not_an_instance,
	ee_stack_overflow,
	evaluation_error_end = 399,
};

enum class diagnostic_category : uint8_t {
	lexical,
	syntax,
	resolution,
	runtime,
};

[[nodiscard]] constexpr auto category_of(const error_code code) noexcept -> diagnostic_category {
	using enum error_code;
	if (code < scanner_error_end) return diagnostic_category::lexical;
	if (code < parser_error_end) return diagnostic_category::syntax;
	if (code < resolver_error_end) return diagnostic_category::resolution;
	return diagnostic_category::runtime;
}

[[nodiscard]] constexpr auto category_name(const diagnostic_category category) noexcept -> std::string_view {
	using namespace std::string_view_literals;
	switch (category) {
		using enum diagnostic_category;

		case lexical:    return "lexical"sv;
		case syntax:     return "syntax"sv;
		case resolution: return "resolution"sv;
		case runtime:    return "runtime"sv;

		default: break;
	}
	return "unknown"sv;
}

struct ARBOR_EXPORT error_record {
	error_code code{};
	uint32_t line{};
	uint32_t from{}; /// underscore from position
	uint32_t to{};   /// underscore to position
};

struct ARBOR_EXPORT diagnostic {
	error_code code{};
	diagnostic_category category{};
	uint32_t line{};
	uint32_t column{};
	std::string message{};
};

template<class T>
concept error_exporter = requires(const T &pr) {
	{ pr(std::string_view{}) };
};

class ARBOR_EXPORT error_handler {
public:
	static constexpr char eol{ '\n' };
	static constexpr std::pmr::pool_options buffer_options{
		.max_blocks_per_chunk = 4,
		.largest_required_pool_block = 256
	};

	struct file_info {
		std::string path{};
		std::string_view source_code{};
	};

	explicit error_handler(std::string path, std::string_view source_code = {}) noexcept;

	[[nodiscard]] auto empty() const noexcept -> bool { return std::empty(m_errors); }
	[[nodiscard]] auto size() const noexcept -> size_t { return std::size(m_errors); }

	void report(std::string_view message, error_record record);

	/// Reports a location inside other text than the current source
	void report(std::string_view message, error_record record, std::string_view source_code);
	void clear();

	/// Drops collected records and switches to the next source text
	void reset(std::string_view source_code);

	[[nodiscard]] auto diagnostics() const -> std::vector<diagnostic>;

	void export_records(const error_exporter auto & ...exporter) const {
		std::pmr::monotonic_buffer_resource resource{};
		std::pmr::polymorphic_allocator<char> allocator{ &resource };
		std::pmr::string buffer{ allocator };

		for (size_t i{}; i < std::size(m_errors); ++i) {
			buffer.clear();
			make_msg(buffer, i, m_errors[i]);
			const std::string_view message{ buffer };
			(exporter(message), ...);
		}
	}

private:
	std::pmr::unsynchronized_pool_resource m_memory_resource{ buffer_options };
	std::pmr::polymorphic_allocator<char> m_allocator{ &m_memory_resource };
	std::pmr::unordered_map<uint32_t, std::pmr::string> m_lines{ m_allocator };

	file_info m_file;
	std::vector<std::string> m_error_messages{};
	std::vector<error_record> m_errors{};

	void make_msg(std::pmr::string &buffer, size_t id, const error_record &record) const;
	auto take_line(const std::string_view source, uint32_t position) const -> std::pmr::string;

	static auto line_start(const std::string_view src, uint32_t pos) noexcept -> uint32_t;
	static auto code_value(const error_code code) noexcept -> uint32_t;
};

} // namespace arbor
