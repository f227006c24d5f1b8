#include <gtest/gtest.h>

#include <array>
#include <string>
#include <utility>
#include <functional>

#include "arbor/session.hpp"

namespace {

struct script_run {
	arbor::run_result result;
	std::string output;
};

auto run(std::string_view source) -> script_run {
	std::string output;
	arbor::session session{ arbor::session::options{
		.path = "test",
		.output = [&output](std::string_view text) { output.append(text); }
	} };

	auto result{ session.run(source) };
	return script_run{ std::move(result), std::move(output) };
}

auto output_of(std::string_view source) -> std::string {
	auto [result, output]{ run(source) };
	EXPECT_EQ(result.status, arbor::run_status::ok) << source;
	for (const auto &diag : result.diagnostics) {
		ADD_FAILURE() << diag.line << ":" << diag.column << " " << diag.message;
	}
	return output;
}

auto runtime_error_of(std::string_view source) -> arbor::diagnostic {
	auto [result, output]{ run(source) };
	EXPECT_EQ(result.status, arbor::run_status::runtime_error) << source;
	EXPECT_EQ(result.diagnostics.size(), 1u) << source;
	if (result.diagnostics.empty()) return {};

	EXPECT_EQ(result.diagnostics[0].category, arbor::diagnostic_category::runtime);
	return result.diagnostics[0];
}

} // namespace

// ============================================================================
// ARITHMETIC AND VALUES
// ============================================================================

TEST(InterpreterTest, EvaluatesArithmetic) {
	EXPECT_EQ(output_of("print 1 + 2 * 3;"), "7\n");
	EXPECT_EQ(output_of("print (1 + 2) * 3;"), "9\n");
	EXPECT_EQ(output_of("print 10 / 4;"), "2.5\n");
	EXPECT_EQ(output_of("print -3 - -1;"), "-2\n");
	EXPECT_EQ(output_of("print 0.1 + 0.2;"), "0.30000000000000004\n");
}

TEST(InterpreterTest, ArithmeticFollowsDoublePrecision) {
	using operation = std::function<double(double, double)>;
	const std::array<std::pair<std::string_view, double>, 5> numbers{ {
		{ "0.5", 0.5 }, { "3", 3.0 }, { "7", 7.0 }, { "0.001", 0.001 }, { "123456.789", 123456.789 }
	} };
	const std::array<std::pair<std::string_view, operation>, 4> operations{ {
		{ "+", std::plus<>{} }, { "-", std::minus<>{} }, { "*", std::multiplies<>{} }, { "/", std::divides<>{} }
	} };

	for (const auto &[op, eval] : operations) {
		for (const auto &[lhs_text, lhs] : numbers) {
			for (const auto &[rhs_text, rhs] : numbers) {
				const auto source{ "print " + std::string{ lhs_text } + " " + std::string{ op } + " "
					+ std::string{ rhs_text } + ";" };
				EXPECT_EQ(output_of(source), arbor::format_number(eval(lhs, rhs)) + "\n") << source;
			}
		}
	}
}

TEST(InterpreterTest, ComparesNumbers) {
	EXPECT_EQ(output_of("print 1 < 2; print 2 <= 1; print 3 > 3; print 3 >= 3;"), "true\nfalse\nfalse\ntrue\n");
}

TEST(InterpreterTest, ConcatenatesStrings) {
	EXPECT_EQ(output_of(R"(print "foo" + "bar";)"), "foobar\n");
	EXPECT_EQ(output_of(R"(var s = "a"; s = s + s; print s + s;)"), "aaaa\n");
}

TEST(InterpreterTest, EqualityNeverConvertsTypes) {
	EXPECT_EQ(
		output_of(R"(print nil == nil; print 1 == "1"; print "a" == "a"; print nil == false; print 2 != 2;)"),
		"true\nfalse\ntrue\nfalse\nfalse\n"
	);
}

TEST(InterpreterTest, OnlyNilAndFalseAreFalsy) {
	EXPECT_EQ(
		output_of(R"(if (0) print "zero"; if ("") print "empty"; if (nil) print "nil"; else print "no"; print !false;)"),
		"zero\nempty\nno\ntrue\n"
	);
}

TEST(InterpreterTest, LogicalOperatorsYieldOperands) {
	EXPECT_EQ(output_of(R"(print nil or "x"; print 1 and 2; print false and 1; print "a" or "b";)"), "x\n2\nfalse\na\n");
}

TEST(InterpreterTest, LogicalOperatorsShortCircuit) {
	EXPECT_EQ(output_of("var a = 0; false and (a = 1); true or (a = 2); print a;"), "0\n");
}

TEST(InterpreterTest, PrintsValues) {
	EXPECT_EQ(
		output_of("fun f() {} class K {} print f; print clock; print K; print K(); print fun () {}; print nil; print true;"),
		"<fn f>\n<native fn>\nK\nK instance\n<fn>\nnil\ntrue\n"
	);
}

TEST(InterpreterTest, PreservesLiteralText) {
	EXPECT_EQ(output_of(R"(print "  spaced   text "; print 3.25; print 1234567.5;)"), "  spaced   text \n3.25\n1234567.5\n");
}

TEST(InterpreterTest, PrintsEveryLiteralOfLongScripts) {
	std::string source;
	for (int i{}; i < 65'540; ++i) {
		source.append("print ").append(std::to_string(i)).append(";\n");
	}
	source.append("print 65531; print 65532; print 65533; print 65536; print 65539;");

	const auto output{ output_of(source) };
	EXPECT_TRUE(output.ends_with("65539\n65531\n65532\n65533\n65536\n65539\n"))
		<< output.substr(output.size() > 80u ? output.size() - 80u : 0u);
}

// ============================================================================
// VARIABLES AND CONTROL FLOW
// ============================================================================

TEST(InterpreterTest, ScopesShadowAndRestore) {
	EXPECT_EQ(
		output_of("var a = 1; { var a = 2; print a; { a = 3; print a; } } print a;"),
		"2\n3\n1\n"
	);
}

TEST(InterpreterTest, UninitializedVariablesAreNil) {
	EXPECT_EQ(output_of("var a; print a;"), "nil\n");
}

TEST(InterpreterTest, Loops) {
	EXPECT_EQ(output_of("var i = 0; while (i < 3) { print i; i = i + 1; }"), "0\n1\n2\n");
	EXPECT_EQ(output_of("for (var i = 0; i < 3; i = i + 1) print i;"), "0\n1\n2\n");
	EXPECT_EQ(output_of("var i; for (i = 5; i < 7; i = i + 1) print i; print i;"), "5\n6\n7\n");
}

// ============================================================================
// FUNCTIONS AND CLOSURES
// ============================================================================

TEST(InterpreterTest, CallsFunctions) {
	EXPECT_EQ(
		output_of("fun fib(n) { if (n < 2) return n; return fib(n - 1) + fib(n - 2); } print fib(15);"),
		"610\n"
	);
	EXPECT_EQ(output_of("fun f() {} print f();"), "nil\n");
	EXPECT_EQ(output_of("fun f() { while (true) { for (;;) { return 7; } } } print f();"), "7\n");
}

TEST(InterpreterTest, ClosuresKeepTheirEnvironment) {
	EXPECT_EQ(output_of(R"(
		fun make_counter() {
			var i = 0;
			fun count() { i = i + 1; return i; }
			return count;
		}
		var a = make_counter();
		var b = make_counter();
		print a(); print a(); print b();
	)"), "1\n2\n1\n");
}

TEST(InterpreterTest, ClosuresShareTheirDeclaringScope) {
	EXPECT_EQ(output_of(R"(
		var get; var set;
		{
			var value = "before";
			get = fun () { return value; };
			set = fun (v) { value = v; };
		}
		set("after");
		print get();
	)"), "after\n");
}

TEST(InterpreterTest, LoopClosuresCaptureEachIteration) {
	EXPECT_EQ(output_of(R"(
		var f0; var f1; var f2;
		for (var i = 0; i < 3; i = i + 1) {
			fun capture() { return i; }
			if (i == 0) f0 = capture;
			if (i == 1) f1 = capture;
			if (i == 2) f2 = capture;
		}
		print f0(); print f1(); print f2();
	)"), "0\n1\n2\n");
}

TEST(InterpreterTest, ClosuresBindLexically) {
	EXPECT_EQ(output_of(R"(
		var a = "global";
		{
			fun show_a() { print a; }
			show_a();
			var a = "block";
			show_a();
		}
	)"), "global\nglobal\n");
}

TEST(InterpreterTest, FunctionLiteralsAreFirstClass) {
	EXPECT_EQ(output_of(R"(
		fun twice(f, x) { return f(f(x)); }
		print twice(fun (n) { return n * 3; }, 2);
	)"), "18\n");
}

// ============================================================================
// CLASSES
// ============================================================================

TEST(InterpreterTest, InstancesHoldFields) {
	EXPECT_EQ(output_of(R"(
		class Point {
			init(x, y) { this.x = x; this.y = y; }
			sum() { return this.x + this.y; }
		}
		var p = Point(1, 2);
		p.x = 10;
		print p.sum();
	)"), "12\n");
}

TEST(InterpreterTest, InheritedInitializer) {
	EXPECT_EQ(output_of("class A { init(x) { this.x = x; } } class B < A { } var b = B(5); print b.x;"), "5\n");
}

TEST(InterpreterTest, InitializerReturnsInstance) {
	EXPECT_EQ(
		output_of("class A { init() { this.v = 1; return; } } var a = A(); print a.init() == a; print a.v;"),
		"true\n1\n"
	);
}

TEST(InterpreterTest, SuperCallsUseDeclaringClass) {
	EXPECT_EQ(output_of(R"(
		class A { method() { print "A method"; } }
		class B < A { method() { print "B method"; } test() { super.method(); } }
		class C < B {}
		C().test();
	)"), "A method\n");
}

TEST(InterpreterTest, BoundMethodsRememberThis) {
	EXPECT_EQ(output_of(R"(
		class Greeter {
			init(name) { this.name = name; }
			greet() { print "hi " + this.name; }
		}
		var greet = Greeter("bob").greet;
		greet();
	)"), "hi bob\n");
}

TEST(InterpreterTest, FieldsShadowMethods) {
	EXPECT_EQ(output_of(R"(
		class A { f() { return "method"; } }
		var a = A();
		a.f = fun () { return "field"; };
		print a.f();
	)"), "field\n");
}

// ============================================================================
// RUNTIME ERRORS
// ============================================================================

TEST(InterpreterTest, OperandTypeErrors) {
	EXPECT_EQ(runtime_error_of(R"(print "a" + 1;)").message, "Operands must be two numbers or two strings.");
	EXPECT_EQ(runtime_error_of(R"(print "a" < "b";)").message, "Operands must be numbers.");
	EXPECT_EQ(runtime_error_of(R"(print -"a";)").message, "Operand must be a number.");
}

TEST(InterpreterTest, DivisionByZeroIsAnError) {
	const auto error{ runtime_error_of("print 1 / 0;") };
	EXPECT_EQ(error.code, arbor::error_code::ee_division_by_zero);
	EXPECT_EQ(error.message, "Division by zero.");
}

TEST(InterpreterTest, UndefinedVariable) {
	const auto error{ runtime_error_of("print nope;") };
	EXPECT_EQ(error.code, arbor::error_code::ee_undefined_identifier);
	EXPECT_EQ(error.message, "Undefined variable 'nope'.");

	EXPECT_EQ(runtime_error_of("nope = 1;").message, "Undefined variable 'nope'.");
}

TEST(InterpreterTest, CallErrors) {
	EXPECT_EQ(runtime_error_of(R"("text"();)").message, "Can only call functions and classes.");
	EXPECT_EQ(runtime_error_of("fun f(a, b) {} f(1);").message, "Expected 2 arguments but got 1.");
	EXPECT_EQ(runtime_error_of("class A { init(x) {} } A();").message, "Expected 1 arguments but got 0.");
}

TEST(InterpreterTest, UndefinedPropertyNamesTheProperty) {
	const auto error{ runtime_error_of("class A {} class B < A {} var b = B(); b.missing();") };
	EXPECT_EQ(error.code, arbor::error_code::ee_undefined_property);
	EXPECT_EQ(error.message, "Undefined property 'missing'.");
}

TEST(InterpreterTest, PropertiesNeedInstances) {
	EXPECT_EQ(runtime_error_of("var x = 1; print x.y;").message, "Only instances have properties.");
	EXPECT_EQ(runtime_error_of("var x = 1; x.y = 2;").message, "Only instances have fields.");
}

TEST(InterpreterTest, SuperclassMustBeAClass) {
	const auto error{ runtime_error_of("var NotAClass = 1; class B < NotAClass {}") };
	EXPECT_EQ(error.code, arbor::error_code::ee_invalid_superclass);
	EXPECT_EQ(error.message, "Superclass must be a class.");
}

TEST(InterpreterTest, DeepRecursionOverflows) {
	const auto error{ runtime_error_of("fun f() { f(); } f();") };
	EXPECT_EQ(error.code, arbor::error_code::ee_stack_overflow);
	EXPECT_EQ(error.message, "Stack overflow.");
}

TEST(InterpreterTest, DeepNestingInsideRecursionOverflows) {
	std::string body{ "return 1 + f(n - 1);" };
	for (int i{}; i < 50; ++i) body = "{ " + body + " }";

	const auto error{ runtime_error_of("fun f(n) { if (n == 0) return 0; " + body + " } print f(500);") };
	EXPECT_EQ(error.code, arbor::error_code::ee_stack_overflow);
	EXPECT_EQ(error.message, "Stack overflow.");
}

TEST(InterpreterTest, ModerateRecursionSucceeds) {
	EXPECT_EQ(output_of("fun sum(n) { if (n == 0) return 0; { { return n + sum(n - 1); } } } print sum(200);"), "20100\n");
}

TEST(InterpreterTest, RuntimeErrorKeepsEarlierOutput) {
	auto [result, output]{ run("print 1; print nil + 1; print 2;") };

	EXPECT_EQ(result.status, arbor::run_status::runtime_error);
	EXPECT_EQ(output, "1\n");
	ASSERT_EQ(result.diagnostics.size(), 1u);
	EXPECT_EQ(result.diagnostics[0].line, 1u);
	EXPECT_EQ(result.diagnostics[0].column, 20u);
}
