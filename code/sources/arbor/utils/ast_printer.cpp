#include "arbor/utils/ast_printer.hpp"

namespace arbor::utils {

auto ast_printer::print(expression_id expr) -> std::string {
	value.clear();
	write(expr);
	return std::move(value);
}

auto ast_printer::print(statement_id stmt) -> std::string {
	value.clear();
	write(stmt);
	return std::move(value);
}

auto ast_printer::print() -> std::string {
	value.clear();
	for (const auto stmt : prog.statements()) {
		write(stmt);
		value.append("\n");
	}
	return std::move(value);
}

void ast_printer::write(expression_id expr) {
	if (std::empty(expr)) return;
	prog.accept(expr, [this](const auto &node) { accept(node); });
}

void ast_printer::write(statement_id stmt) {
	if (std::empty(stmt)) return;
	prog.accept(stmt, [this](const auto &node) { accept(node); });
}

void ast_printer::write(const statement_list &statements) {
	for (const auto stmt : statements) {
		value.append(" ");
		write(stmt);
	}
}

void ast_printer::write(const function_declaration &function) {
	value.append("(");
	for (size_t i{}; i < std::size(function.params); ++i) {
		if (i != 0u) value.append(" ");
		write(function.params[i]);
	}
	value.append(")");
	write(function.body);
}

void ast_printer::write(const token &tok) {
	value.append(lexemes.get(tok.lexeme_id));
}

void ast_printer::accept(const expression_literal &expr) {
	value.append(to_string(expr.value));
}

void ast_printer::accept(const expression_identifier &expr) {
	write(expr.name);
}

void ast_printer::accept(const expression_assignment &expr) {
	value.append("(= ");
	write(expr.name);
	value.append(" ");
	write(expr.value);
	value.append(")");
}

void ast_printer::accept(const expression_unary &expr) {
	parenthesize(token_string(expr.op.type), expr.expr);
}

void ast_printer::accept(const expression_binary &expr) {
	parenthesize(token_string(expr.op.type), expr.left, expr.right);
}

void ast_printer::accept(const expression_logical &expr) {
	parenthesize(token_string(expr.op.type), expr.left, expr.right);
}

void ast_printer::accept(const expression_call &expr) {
	parenthesize("call", expr.caller);
	value.pop_back();
	for (const auto arg : expr.args) {
		value.append(" ");
		write(arg);
	}
	value.append(")");
}

void ast_printer::accept(const expression_get &expr) {
	parenthesize(".", expr.object);
	value.pop_back();
	value.append(" ");
	write(expr.name);
	value.append(")");
}

void ast_printer::accept(const expression_set &expr) {
	parenthesize("=", expr.object);
	value.pop_back();
	value.append(" ");
	write(expr.name);
	value.append(" ");
	write(expr.value);
	value.append(")");
}

void ast_printer::accept(const expression_self &) {
	value.append("this");
}

void ast_printer::accept(const expression_super &expr) {
	value.append("(super ");
	write(expr.method);
	value.append(")");
}

void ast_printer::accept(const expression_grouping &expr) {
	parenthesize("group", expr.expr);
}

void ast_printer::accept(const expression_lambda &expr) {
	value.append("(fun ");
	write(expr.function);
	value.append(")");
}

void ast_printer::accept(const statement_expression &stmt) {
	parenthesize(";", stmt.expr);
}

void ast_printer::accept(const statement_print &stmt) {
	parenthesize("print", stmt.expr);
}

void ast_printer::accept(const statement_variable &stmt) {
	value.append("(var ");
	write(stmt.identifier);
	if (!std::empty(stmt.initializer)) {
		value.append(" ");
		write(stmt.initializer);
	}
	value.append(")");
}

void ast_printer::accept(const statement_scope &stmt) {
	value.append("(block");
	write(stmt.statements);
	value.append(")");
}

void ast_printer::accept(const statement_branch &stmt) {
	parenthesize("if", stmt.condition, stmt.then_branch, stmt.else_branch);
}

void ast_printer::accept(const statement_loop &stmt) {
	if (std::empty(stmt.initializer) && std::empty(stmt.increment)) {
		parenthesize("while", stmt.condition, stmt.body);
		return;
	}
	parenthesize("for", stmt.initializer, stmt.condition, stmt.increment, stmt.body);
}

void ast_printer::accept(const statement_function &stmt) {
	value.append("(fun ");
	write(stmt.function.name);
	write(stmt.function);
	value.append(")");
}

void ast_printer::accept(const statement_return &stmt) {
	parenthesize("return", stmt.value);
}

void ast_printer::accept(const statement_class &stmt) {
	value.append("(class ");
	write(stmt.name);
	if (!std::empty(stmt.superclass)) {
		value.append(" < ");
		write(stmt.superclass);
	}
	for (const auto &method : stmt.methods) {
		value.append(" (");
		write(method.name);
		write(method);
		value.append(")");
	}
	value.append(")");
}

} // namespace arbor::utils
