#include <gtest/gtest.h>

#include <string>
#include <algorithm>

#include "arbor/session.hpp"

namespace {

auto make_session(std::string &output) -> arbor::session::options {
	return arbor::session::options{
		.path = "test",
		.output = [&output](std::string_view text) { output.append(text); }
	};
}

auto has_category(const arbor::run_result &result, arbor::diagnostic_category category) -> bool {
	return std::ranges::any_of(result.diagnostics, [category](const auto &diag) {
		return diag.category == category;
	});
}

} // namespace

// ============================================================================
// COMPILE ERRORS
// ============================================================================

TEST(SessionTest, CompileErrorsPreventExecution) {
	std::string output;
	arbor::session session{ make_session(output) };

	const auto result{ session.run("print 1;\nprint 2 +;\n") };

	EXPECT_EQ(result.status, arbor::run_status::compile_error);
	EXPECT_TRUE(output.empty());
	ASSERT_EQ(result.diagnostics.size(), 1u);
	EXPECT_EQ(result.diagnostics[0].category, arbor::diagnostic_category::syntax);
	EXPECT_EQ(result.diagnostics[0].line, 2u);
}

TEST(SessionTest, ReportsEveryStageAtOnce) {
	std::string output;
	arbor::session session{ make_session(output) };

	const auto result{ session.run("var s = \"abc\n;\nprint 1 +;\nreturn 2;\n") };

	EXPECT_EQ(result.status, arbor::run_status::compile_error);
	EXPECT_TRUE(output.empty());
	EXPECT_TRUE(has_category(result, arbor::diagnostic_category::lexical));
	EXPECT_TRUE(has_category(result, arbor::diagnostic_category::syntax));
	EXPECT_TRUE(has_category(result, arbor::diagnostic_category::resolution));
	EXPECT_FALSE(has_category(result, arbor::diagnostic_category::runtime));
}

TEST(SessionTest, ResolutionErrorIsACompileError) {
	std::string output;
	arbor::session session{ make_session(output) };

	const auto result{ session.run("print 1; { var a = 1; var a = 2; }") };

	EXPECT_EQ(result.status, arbor::run_status::compile_error);
	EXPECT_TRUE(output.empty());
	ASSERT_EQ(result.diagnostics.size(), 1u);
	EXPECT_EQ(result.diagnostics[0].code, arbor::error_code::re_redeclaration);
}

TEST(SessionTest, InspectorSeesEveryParsedProgram) {
	std::string output;
	size_t calls{};
	auto options{ make_session(output) };
	options.on_parsed = [&calls](const arbor::context &, const arbor::program &, const arbor::lexeme_database &) {
		++calls;
	};
	arbor::session session{ std::move(options) };

	EXPECT_TRUE(session.run("print 1;").ok());
	EXPECT_FALSE(session.run("print ;").ok());
	EXPECT_EQ(calls, 2u);
}

// ============================================================================
// INTERACTIVE SESSIONS
// ============================================================================

TEST(SessionTest, GlobalsPersistAcrossRuns) {
	std::string output;
	arbor::session session{ make_session(output) };

	EXPECT_TRUE(session.run("var a = 21;").ok());
	EXPECT_TRUE(session.run("fun twice(x) { return x * 2; }").ok());
	EXPECT_TRUE(session.run("class Box { init(v) { this.v = v; } }").ok());
	EXPECT_TRUE(session.run("print twice(Box(a).v);").ok());

	EXPECT_EQ(output, "42\n");
}

TEST(SessionTest, ClosuresOutliveTheirRun) {
	std::string output;
	arbor::session session{ make_session(output) };

	EXPECT_TRUE(session.run("fun counter() { var n = 0; fun next() { n = n + 1; return n; } return next; }").ok());
	EXPECT_TRUE(session.run("var next = counter();").ok());
	EXPECT_TRUE(session.run("next(); print next();").ok());

	EXPECT_EQ(output, "2\n");
}

TEST(SessionTest, RecoversAfterRuntimeError) {
	std::string output;
	arbor::session session{ make_session(output) };

	const auto failed{ session.run("var a = 1; print nope;") };
	EXPECT_EQ(failed.status, arbor::run_status::runtime_error);

	const auto next{ session.run("print a;") };
	EXPECT_TRUE(next.ok());
	EXPECT_TRUE(next.diagnostics.empty());
	EXPECT_EQ(output, "1\n");
}

TEST(SessionTest, FailedCompilationDefinesNothing) {
	std::string output;
	arbor::session session{ make_session(output) };

	EXPECT_EQ(session.run("var a = 1; print;").status, arbor::run_status::compile_error);

	const auto result{ session.run("print a;") };
	EXPECT_EQ(result.status, arbor::run_status::runtime_error);
	ASSERT_EQ(result.diagnostics.size(), 1u);
	EXPECT_EQ(result.diagnostics[0].message, "Undefined variable 'a'.");
}

// ============================================================================
// DIAGNOSTICS
// ============================================================================

TEST(SessionTest, RuntimeDiagnosticPointsAtToken) {
	std::string output;
	arbor::session session{ make_session(output) };

	const auto result{ session.run("print 1;\nprint x;\n") };

	EXPECT_EQ(output, "1\n");
	ASSERT_EQ(result.diagnostics.size(), 1u);
	EXPECT_EQ(result.diagnostics[0].line, 2u);
	EXPECT_EQ(result.diagnostics[0].column, 7u);

	std::string exported;
	session.export_records([&exported](std::string_view message) { exported.append(message); });
	EXPECT_NE(exported.find("test:2:7 > runtime error #0302:"), std::string::npos) << exported;
	EXPECT_NE(exported.find("Undefined variable 'x'."), std::string::npos) << exported;
	EXPECT_NE(exported.find("print x;"), std::string::npos) << exported;
}

TEST(SessionTest, RuntimeDiagnosticQuotesTheDefiningRun) {
	std::string output;
	arbor::session session{ make_session(output) };

	EXPECT_TRUE(session.run("fun broken() {\n  return missing;\n}\n").ok());

	const auto result{ session.run("print 1;\nbroken();\n") };
	EXPECT_EQ(result.status, arbor::run_status::runtime_error);
	ASSERT_EQ(result.diagnostics.size(), 1u);
	EXPECT_EQ(result.diagnostics[0].line, 2u);
	EXPECT_EQ(result.diagnostics[0].column, 10u);

	std::string exported;
	session.export_records([&exported](std::string_view message) { exported.append(message); });
	EXPECT_NE(exported.find("test:2:10 > runtime error"), std::string::npos) << exported;
	EXPECT_NE(exported.find("  return missing;"), std::string::npos) << exported;
	EXPECT_EQ(exported.find("broken();"), std::string::npos) << exported;
}

TEST(SessionTest, DiagnosticsBelongToTheLastRun) {
	std::string output;
	arbor::session session{ make_session(output) };

	EXPECT_FALSE(session.run("print ;").ok());

	std::string exported;
	EXPECT_TRUE(session.run("print 1;").ok());
	session.export_records([&exported](std::string_view message) { exported.append(message); });
	EXPECT_TRUE(exported.empty());
}

// ============================================================================
// LIFETIME AND DETERMINISM
// ============================================================================

TEST(SessionTest, RunsAreDeterministic) {
	constexpr std::string_view source{ R"(
		class A { init(n) { this.n = n; } value() { return this.n * 1.5; } }
		var total = 0;
		for (var i = 0; i < 10; i = i + 1) total = total + A(i).value();
		print total;
		print "done " + "now";
	)" };

	std::string first;
	std::string second;
	{
		arbor::session session{ make_session(first) };
		EXPECT_TRUE(session.run(source).ok());
		EXPECT_TRUE(session.run(source).ok());
	}
	{
		arbor::session session{ make_session(second) };
		EXPECT_TRUE(session.run(source).ok());
		EXPECT_TRUE(session.run(source).ok());
	}

	EXPECT_EQ(first, "67.5\ndone now\n67.5\ndone now\n");
	EXPECT_EQ(first, second);
}

TEST(SessionTest, TeardownWithReferenceCycles) {
	std::string output;
	{
		arbor::session session{ make_session(output) };
		EXPECT_TRUE(session.run(R"(
			class Node { init() { this.self = this; this.get = fun () { return this; }; } }
			var node = Node();
			fun outer() { fun inner() { return inner; } return inner; }
			var f = outer();
			print node.get() == node;
		)").ok());
	}
	EXPECT_EQ(output, "true\n");
}

TEST(SessionTest, DefaultOptions) {
	arbor::session session;

	EXPECT_TRUE(session.run("var answer = 42; answer = answer + 1;").ok());
	EXPECT_EQ(session.run("answer();").status, arbor::run_status::runtime_error);
}
