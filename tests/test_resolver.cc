#include <gtest/gtest.h>

#include <vector>
#include <algorithm>

#include "arbor/scanner.hpp"
#include "arbor/parser.hpp"
#include "arbor/resolver.hpp"

namespace {

struct resolved {
	arbor::resolution_table locals;
	std::vector<arbor::diagnostic> errors;
};

auto resolve(std::string_view source) -> resolved {
	arbor::lexeme_database lexemes{};
	arbor::error_handler errout{ "test", source };

	arbor::scanner scanner{ source, lexemes, errout };
	const auto ctx{ scanner.scan() };

	arbor::parser parser{ ctx, errout };
	const auto prog{ parser.parse() };
	EXPECT_TRUE(errout.empty()) << "syntax errors in: " << source;

	arbor::resolver resolver{ prog, lexemes, errout };
	auto locals{ resolver.resolve() };
	return resolved{ std::move(locals), errout.diagnostics() };
}

auto single_error(std::string_view source) -> arbor::error_code {
	const auto [locals, errors]{ resolve(source) };
	EXPECT_EQ(errors.size(), 1u) << source;
	if (errors.empty()) return arbor::error_code::no_error;

	EXPECT_EQ(errors[0].category, arbor::diagnostic_category::resolution);
	return errors[0].code;
}

auto depths(const arbor::resolution_table &locals) -> std::vector<uint32_t> {
	std::vector<uint32_t> output;
	for (const auto &[_, depth] : locals) {
		output.push_back(depth);
	}
	std::ranges::sort(output);
	return output;
}

} // namespace

TEST(ResolverTest, GlobalsStayUnresolved) {
	const auto [locals, errors]{ resolve("var g = 1; print g; g = 2; fun f() { return g; }") };

	EXPECT_TRUE(errors.empty());
	EXPECT_TRUE(locals.empty());
}

TEST(ResolverTest, ComputesHopCounts) {
	const auto [locals, errors]{ resolve("{ var a = 1; { var b = 2; print a; print b; } }") };

	ASSERT_TRUE(errors.empty());
	EXPECT_EQ(depths(locals), (std::vector<uint32_t>{ 0u, 1u }));
}

TEST(ResolverTest, ParametersLiveInTheFunctionScope) {
	const auto [locals, errors]{ resolve("fun f(a) { print a; a = 3; }") };

	ASSERT_TRUE(errors.empty());
	EXPECT_EQ(depths(locals), (std::vector<uint32_t>{ 0u, 0u }));
}

TEST(ResolverTest, LoopVariablesHaveTheirOwnScope) {
	const auto [locals, errors]{ resolve("for (var i = 0; i < 3; i = i + 1) { fun f() { return i; } }") };

	ASSERT_TRUE(errors.empty());
	// condition, increment (read and write) at 0, the closure read at 2
	EXPECT_EQ(depths(locals), (std::vector<uint32_t>{ 0u, 0u, 0u, 2u }));
}

TEST(ResolverTest, ThisAndSuperResolveThroughClassScopes) {
	const auto [locals, errors]{ resolve(
		"class A { f() {} } class B < A { g() { this.f(); super.f(); } }"
	) };

	ASSERT_TRUE(errors.empty());
	// this: function scope -> this scope, super: one more hop
	EXPECT_EQ(depths(locals), (std::vector<uint32_t>{ 1u, 2u }));
}

TEST(ResolverTest, LocalReadInOwnInitializer) {
	EXPECT_EQ(single_error("{ var a = a; }"), arbor::error_code::re_self_initialization);

	const auto [locals, errors]{ resolve("var a = a;") };
	EXPECT_TRUE(errors.empty());
}

TEST(ResolverTest, RedeclarationInLocalScope) {
	EXPECT_EQ(single_error("{ var a = 1; var a = 2; }"), arbor::error_code::re_redeclaration);
	EXPECT_EQ(single_error("fun f(a, a) {}"), arbor::error_code::re_redeclaration);

	const auto [locals, errors]{ resolve("var a = 1; var a = 2;") };
	EXPECT_TRUE(errors.empty());
}

TEST(ResolverTest, ThisOutsideClass) {
	EXPECT_EQ(single_error("print this;"), arbor::error_code::re_this_outside_class);
	EXPECT_EQ(single_error("fun f() { return this; }"), arbor::error_code::re_this_outside_class);
}

TEST(ResolverTest, SuperMisuse) {
	EXPECT_EQ(single_error("print super.f;"), arbor::error_code::re_super_outside_class);
	EXPECT_EQ(single_error("class A { f() { super.f(); } }"), arbor::error_code::re_super_without_superclass);
}

TEST(ResolverTest, ReturnRules) {
	EXPECT_EQ(single_error("return 1;"), arbor::error_code::re_return_outside_function);
	EXPECT_EQ(single_error("class A { init() { return 1; } }"), arbor::error_code::re_return_from_initializer);

	const auto [locals, errors]{ resolve("class A { init() { return; } f() { return 1; } }") };
	EXPECT_TRUE(errors.empty());
}

TEST(ResolverTest, ClassCannotInheritFromItself) {
	EXPECT_EQ(single_error("class A < A {}"), arbor::error_code::re_self_inheritance);
}

TEST(ResolverTest, AccumulatesErrors) {
	const auto [locals, errors]{ resolve("return 1; print this; { var a = 1; var a = 2; }") };

	ASSERT_EQ(errors.size(), 3u);
	EXPECT_EQ(errors[0].message, "Can't return from top-level code.");
	EXPECT_EQ(errors[1].message, "Can't use 'this' outside of a class.");
	EXPECT_EQ(errors[2].message, "Already a variable with this name in this scope.");
}
