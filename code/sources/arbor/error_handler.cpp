#include <utility>
#include <iterator>

#include <fmt/format.h>

#include "arbor/error_handler.hpp"

namespace arbor {

error_handler::error_handler(std::string path, std::string_view source_code) noexcept
	: m_file{ .path = std::move(path), .source_code = source_code } {}

void error_handler::report(std::string_view message, error_record record) {
	report(message, std::move(record), m_file.source_code);
}

void error_handler::report(std::string_view message, error_record record, std::string_view source_code) {
	const auto in_source{ record.from < std::size(source_code) };
	if (in_source && !m_lines.contains(record.line)) {
		m_lines.try_emplace(record.line, take_line(source_code, record.from));
	}

	if (in_source) {
		const auto start{ line_start(source_code, record.from) };
		const auto width{ record.to > record.from ? record.to - record.from : 0u };
		record.from -= start;
		record.to = record.from + width;
	} else {
		record.from = record.to = 0u;
	}

	m_errors.emplace_back(std::move(record));
	m_error_messages.emplace_back(message);
}

void error_handler::clear() {
	m_lines.clear();
	m_error_messages.clear();
	m_errors.clear();
}

void error_handler::reset(std::string_view source_code) {
	clear();
	m_file.source_code = source_code;
}

auto error_handler::diagnostics() const -> std::vector<diagnostic> {
	std::vector<diagnostic> output;
	output.reserve(std::size(m_errors));
	for (size_t i{}; i < std::size(m_errors); ++i) {
		const auto &record{ m_errors[i] };
		output.emplace_back(diagnostic{
			.code     = record.code,
			.category = category_of(record.code),
			.line     = record.line,
			.column   = record.from + 1u,
			.message  = m_error_messages[i]
		});
	}
	return output;
}

void error_handler::make_msg(std::pmr::string &buffer, size_t id, const error_record &record) const {
	auto out{ std::back_inserter(buffer) };

	fmt::format_to(out, "{}:{}:{} > {} error #{:04}:",
		m_file.path, record.line, record.from + 1u,
		category_name(category_of(record.code)), code_value(record.code)
	);

	if (const auto found{ m_lines.find(record.line) }; found != std::end(m_lines)) {
		fmt::format_to(out, "\n\n{:3} | {}\n", record.line, found->second);
		if (record.to > record.from) {
			fmt::format_to(out, "    | {:>{}}{:^>{}}\n", "", record.from, "", record.to - record.from);
			fmt::format_to(out, "    | {:>{}}", "", record.from);
		}
	}

	fmt::format_to(out, " {}\n", m_error_messages.at(id));
}

auto error_handler::take_line(const std::string_view source, const uint32_t position) const -> std::pmr::string {
	const auto start{ line_start(source, position) };
	const auto line_end{ source.find(eol, position) };

	const auto line{ source.substr(start,
		line_end != std::string_view::npos ? line_end - start : line_end
	) };

	return std::pmr::string{ line, m_allocator };
}

auto error_handler::line_start(const std::string_view src, uint32_t pos) noexcept -> uint32_t {
	if (pos == 0u) return 0u;

	const size_t last_eol{ src.rfind(eol, pos - 1u) };
	return last_eol != std::string_view::npos ? static_cast<uint32_t>(last_eol + 1u) : 0u;
}

auto error_handler::code_value(const error_code code) noexcept -> uint32_t {
	return static_cast<uint32_t>(code);
}

} // namespace arbor
