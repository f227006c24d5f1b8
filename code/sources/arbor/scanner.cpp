#include <cctype>

#include <fmt/format.h>

#include "arbor/scanner.hpp"
#include "arbor/utils/strhash.hpp"
#include "arbor/utils/compile_time.hpp"

namespace arbor {

namespace {

[[nodiscard]] auto is_digit(const char c) noexcept -> bool {
	return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

[[nodiscard]] auto is_alpha(const char c) noexcept -> bool {
	return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
}

[[nodiscard]] auto is_alnum(const char c) noexcept -> bool {
	return is_alpha(c) || is_digit(c);
}

} // namespace

scanner::scanner(const std::string_view script, lexeme_database &lexemes, error_handler &err) noexcept
	: errout{ err }
	, lexemes{ lexemes }
	, m_script{ script }
{}

auto scanner::scan() -> output_type {
	output_type output{ .script = m_script };

	output.literals = std::vector<literal>{
		nil_literal, true, false,
	};

	m_line = 1u;
	const auto end_pos{ end_position() };
	uint32_t position{ skip_whitespaces(0u) };
	while (position < end_pos) {
		position = skip_whitespaces(next_token(position, output));
	}

	output.tokens.emplace_back(token{
		.line     = m_line,
		.position = end_pos,
		.type     = token_type::end_of_file
	});

	return output;
}

auto scanner::end_position() const noexcept -> uint32_t {
	return static_cast<uint32_t>(std::size(m_script));
}

auto scanner::next_token(uint32_t pos, output_type &output) -> uint32_t {
	constexpr uint32_t symbol_size{ static_cast<uint32_t>(sizeof(char)) };

	const auto symbol{ m_script[pos] };
	const auto add_token{ [&tokens = output.tokens, line{ m_line }, pos] (auto type, uint32_t length = 1u) {
		tokens.emplace_back(token{ .line = line, .position = pos, .length = length, .type = type });
		return pos + length;
	} };
	const auto next_is{ [&script = m_script, pos, end{ end_position() }](const auto expected) {
		if (pos + symbol_size < end && script[pos + 1] == expected) {
			return 1u;
		}
		return 0u;
	} };

	const auto is_next_equal{ next_is('=') };

	switch (symbol) {
		case '(': return add_token(token_type::left_paren);
		case ')': return add_token(token_type::right_paren);
		case '{': return add_token(token_type::left_brace);
		case '}': return add_token(token_type::right_brace);
		case ';': return add_token(token_type::semicolon);
		case ',': return add_token(token_type::comma);
		case '.': return add_token(token_type::dot);
		case '-': return add_token(token_type::minus);
		case '+': return add_token(token_type::plus);
		case '*': return add_token(token_type::star);
		case '/':
			if (next_is('/')) {
				return skip_till('\n', pos + 2);
			}
			return add_token(token_type::slash);

		case '"': return parse_string_token(pos, output);

		default: break;
	}

	switch (symbol) {
		case '!': return add_token(
			is_next_equal ? token_type::bang_equal : token_type::bang,
			symbol_size + is_next_equal
		);
		case '=': return add_token(
			is_next_equal ? token_type::equal_equal : token_type::equal,
			symbol_size + is_next_equal
		);
		case '<': return add_token(
			is_next_equal ? token_type::less_equal : token_type::less,
			symbol_size + is_next_equal
		);
		case '>': return add_token(
			is_next_equal ? token_type::greater_equal : token_type::greater,
			symbol_size + is_next_equal
		);

		default: break;
	}

	if (is_digit(symbol)) {
		return parse_number_token(pos, output);
	}

	if (is_alpha(symbol)) {
		return parse_identifier_token(pos, output);
	}

	make_error_unexpected_symbol(pos);

	return pos + symbol_size; // keep going
}

auto scanner::parse_string_token(const uint32_t pos, output_type &output) -> uint32_t {
	const auto end{ end_position() };

	auto cur{ pos + 1u };
	while (cur < end && m_script[cur] != '"' && m_script[cur] != '\n') {
		++cur;
	}

	if (cur == end || m_script[cur] == '\n') {
		errout.report("Unterminated string.", error_record{
			.code = error_code::se_unterminated_string,
			.line = m_line,
			.from = pos,
			.to   = cur
		});

		return cur; // the new line is consumed by skip_whitespaces
	}

	const auto id{ emplace_literal(std::string{ m_script.substr(pos + 1u, cur - pos - 1u) }, output.literals) };
	output.tokens.emplace_back(token{
		.line       = m_line,
		.position   = pos,
		.length     = cur + 1u - pos,
		.literal_id = id,
		.type       = token_type::string
	});

	return cur + 1u;
}

auto scanner::parse_number_token(const uint32_t pos, output_type &output) -> uint32_t {
	const auto end{ end_position() };
	const auto skip_digits{ [this, end](uint32_t cur) {
		while (cur < end && is_digit(m_script[cur])) {
			++cur;
		}
		return cur;
	} };

	auto cur{ skip_digits(pos + 1u) };
	if (cur + 1u < end && m_script[cur] == '.' && is_digit(m_script[cur + 1u])) {
		cur = skip_digits(cur + 1u);
	}

	const auto id{ emplace_literal(to_number_literal(m_script.substr(pos, cur - pos)), output.literals) };
	output.tokens.emplace_back(token{
		.line       = m_line,
		.position   = pos,
		.length     = cur - pos,
		.literal_id = id,
		.type       = token_type::number
	});

	return cur;
}

auto scanner::parse_identifier_token(uint32_t pos, output_type &output) -> uint32_t {
	const auto end{ end_position() };

	auto cur{ pos + 1u };
	while (cur != end && is_alnum(m_script[cur])) {
		++cur;
	}

	if (try_parse_nil_or_boolean(pos, cur, output)) {
		return cur;
	}

	const auto lexeme{ m_script.substr(pos, cur - pos) };
	const auto type{ from_keyword(lexeme) };
	auto id{ invalid_id };
	if (utils::ct::any_from<token_type::identifier, token_type::kw_this, token_type::kw_super>(type)) {
		id = lexemes.add(lexeme);
	}

	output.tokens.emplace_back(token{
		.line      = m_line,
		.position  = pos,
		.length    = cur - pos,
		.lexeme_id = id,
		.type      = type
	});

	return cur;
}

auto scanner::try_parse_nil_or_boolean(uint32_t pos, uint32_t end, output_type &output) -> bool {
	if (constexpr std::string_view check{ "ntf" }; check.find(m_script[pos]) == std::string_view::npos) {
		return false;
	}

	const auto add{ [&, this](literal lit, token_type type) {
		output.tokens.emplace_back(token{
			.line       = m_line,
			.position   = pos,
			.length     = end - pos,
			.literal_id = emplace_literal(std::move(lit), output.literals),
			.type       = type
		});
		return true;
	} };

	const auto identifier{ m_script.substr(pos, end - pos) };
	switch (utils::fnv1a(identifier)) {
		using namespace utils::fnv1a_literals;
		case "nil"_fnv1a:
			if (identifier == "nil") return add(nil_literal, token_type::nil);
			break;

		case "true"_fnv1a:
			if (identifier == "true") return add(true, token_type::boolean);
			break;

		case "false"_fnv1a:
			if (identifier == "false") return add(false, token_type::boolean);
			break;

		default: break;
	}

	return false;
}

auto scanner::skip_till(const char matches, uint32_t pos) const noexcept -> uint32_t {
	const auto end{ end_position() };
	while (pos < end && m_script[pos] != matches) {
		++pos;
	}
	return pos;
}

auto scanner::skip_whitespaces(uint32_t pos) noexcept -> uint32_t {
	for (const auto end{ end_position() }; pos < end; ++pos) {
		if (const auto ch{ m_script[pos] }; std::isspace(static_cast<unsigned char>(ch))) {
			if (ch == '\n') ++m_line;
			continue;
		}
		break;
	}
	return pos;
}

auto scanner::emplace_literal(literal lit, std::vector<literal> &out) -> uint32_t {
	if (lit.is(literal_type::nil)) return nil_slot;
	if (lit.is(literal_type::boolean)) return *lit.as<bool>() ? true_slot : false_slot;

	const auto id{ static_cast<uint32_t>(std::size(out)) };
	out.emplace_back(std::move(lit));
	return id;
}

void scanner::make_error_unexpected_symbol(const uint32_t pos) const {
	errout.report(fmt::format("Unexpected character '{}'.", m_script[pos]), error_record{
		.code = error_code::se_unexpected_symbol,
		.line = m_line,
		.from = pos,
		.to   = pos + 1u
	});
}

} // namespace arbor
