#include "arbor/resolver.hpp"

namespace arbor {

resolver::resolver(const program &prog, lexeme_database &lexemes, error_handler &errs)
	: prog{ prog }
	, errout{ errs }
	, m_self_id{ lexemes.add("this") }
	, m_super_id{ lexemes.add("super") }
	, m_init_id{ lexemes.add("init") }
{}

auto resolver::resolve() -> resolution_table {
	m_locals.clear();
	resolve(prog.statements());
	return std::move(m_locals);
}

void resolver::resolve(const statement_id stmt) {
	if (std::empty(stmt)) return;
	prog.accept(stmt, [this](const auto &node) { accept(node); });
}

void resolver::resolve(const expression_id expr) {
	if (std::empty(expr)) return;
	prog.accept(expr, [this, expr](const auto &node) { accept(expr, node); });
}

void resolver::resolve(const statement_list &statements) {
	for (const auto stmt : statements) {
		resolve(stmt);
	}
}

void resolver::resolve_function(const function_declaration &function, const function_type type) {
	const auto enclosing{ std::exchange(m_function, type) };

	begin_scope();
	for (const auto &param : function.params) {
		declare(param);
		define(param);
	}
	resolve(function.body);
	end_scope();

	m_function = enclosing;
}

void resolver::resolve_local(const expression_id expr, const lexeme_id name) {
	for (size_t depth{}; depth < std::size(m_scopes); ++depth) {
		const auto &scope{ m_scopes[std::size(m_scopes) - 1u - depth] };
		if (scope.contains(name)) {
			m_locals.insert_or_assign(expr.index, static_cast<uint32_t>(depth));
			return;
		}
	}
}

#pragma region expressions

void resolver::accept(expression_id, const expression_literal &) {}

void resolver::accept(const expression_id id, const expression_identifier &identifier) {
	if (!std::empty(m_scopes)) {
		const auto &scope{ m_scopes.back() };
		if (const auto found{ scope.find(identifier.name.lexeme_id) };
			found != std::end(scope) && !found->second
		) {
			error(error_code::re_self_initialization,
				"Can't read local variable in its own initializer.", identifier.name
			);
		}
	}

	resolve_local(id, identifier.name.lexeme_id);
}

void resolver::accept(const expression_id id, const expression_assignment &assign) {
	resolve(assign.value);
	resolve_local(id, assign.name.lexeme_id);
}

void resolver::accept(expression_id, const expression_unary &unary) {
	resolve(unary.expr);
}

void resolver::accept(expression_id, const expression_binary &binary) {
	resolve(binary.left);
	resolve(binary.right);
}

void resolver::accept(expression_id, const expression_logical &logic) {
	resolve(logic.left);
	resolve(logic.right);
}

void resolver::accept(expression_id, const expression_call &call) {
	resolve(call.caller);
	for (const auto arg : call.args) {
		resolve(arg);
	}
}

void resolver::accept(expression_id, const expression_get &get) {
	resolve(get.object);
}

void resolver::accept(expression_id, const expression_set &set) {
	resolve(set.value);
	resolve(set.object);
}

void resolver::accept(const expression_id id, const expression_self &self) {
	if (m_class == class_type::none) {
		error(error_code::re_this_outside_class, "Can't use 'this' outside of a class.", self.keyword);
		return;
	}
	resolve_local(id, m_self_id);
}

void resolver::accept(const expression_id id, const expression_super &super) {
	if (m_class == class_type::none) {
		error(error_code::re_super_outside_class, "Can't use 'super' outside of a class.", super.keyword);
		return;
	}
	if (m_class != class_type::subclass) {
		error(error_code::re_super_without_superclass,
			"Can't use 'super' in a class with no superclass.", super.keyword
		);
		return;
	}
	resolve_local(id, m_super_id);
}

void resolver::accept(expression_id, const expression_grouping &group) {
	resolve(group.expr);
}

void resolver::accept(expression_id, const expression_lambda &lambda) {
	resolve_function(lambda.function, function_type::function);
}

#pragma endregion expressions

#pragma region statements

void resolver::accept(const statement_expression &expr) {
	resolve(expr.expr);
}

void resolver::accept(const statement_print &print) {
	resolve(print.expr);
}

void resolver::accept(const statement_variable &var) {
	declare(var.identifier);
	resolve(var.initializer);
	define(var.identifier);
}

void resolver::accept(const statement_scope &scope) {
	begin_scope();
	resolve(scope.statements);
	end_scope();
}

void resolver::accept(const statement_branch &branch) {
	resolve(branch.condition);
	resolve(branch.then_branch);
	resolve(branch.else_branch);
}

void resolver::accept(const statement_loop &loop) {
	// the loop variables live in their own scope, re-created for each iteration
	const auto scoped{ !std::empty(loop.initializer) };
	if (scoped) {
		begin_scope();
		resolve(loop.initializer);
	}

	resolve(loop.condition);
	resolve(loop.body);
	resolve(loop.increment);

	if (scoped) {
		end_scope();
	}
}

void resolver::accept(const statement_function &func) {
	declare(func.function.name);
	define(func.function.name);

	resolve_function(func.function, function_type::function);
}

void resolver::accept(const statement_return &ret) {
	if (m_function == function_type::none) {
		error(error_code::re_return_outside_function, "Can't return from top-level code.", ret.keyword);
	}

	if (!std::empty(ret.value)) {
		if (m_function == function_type::initializer) {
			error(error_code::re_return_from_initializer,
				"Can't return a value from an initializer.", ret.keyword
			);
		}
		resolve(ret.value);
	}
}

void resolver::accept(const statement_class &klass) {
	const auto enclosing{ std::exchange(m_class, class_type::klass) };

	declare(klass.name);
	define(klass.name);

	const auto has_superclass{ !std::empty(klass.superclass) };
	if (has_superclass) {
		const auto &superclass{ prog.get<expression_type::identifier>(klass.superclass) };
		if (superclass.name.lexeme_id == klass.name.lexeme_id) {
			error(error_code::re_self_inheritance, "A class can't inherit from itself.", superclass.name);
		}

		m_class = class_type::subclass;
		resolve(klass.superclass);

		begin_scope();
		m_scopes.back().insert_or_assign(m_super_id, true);
	}

	begin_scope();
	m_scopes.back().insert_or_assign(m_self_id, true);

	for (const auto &method : klass.methods) {
		const auto type{ method.name.lexeme_id == m_init_id
			? function_type::initializer
			: function_type::method
		};
		resolve_function(method, type);
	}

	end_scope();

	if (has_superclass) {
		end_scope();
	}

	m_class = enclosing;
}

#pragma endregion statements

void resolver::begin_scope() {
	m_scopes.emplace_back();
}

void resolver::end_scope() {
	m_scopes.pop_back();
}

void resolver::declare(const token &name) {
	if (std::empty(m_scopes)) return;

	auto &scope{ m_scopes.back() };
	if (scope.contains(name.lexeme_id)) {
		error(error_code::re_redeclaration, "Already a variable with this name in this scope.", name);
	}
	scope.insert_or_assign(name.lexeme_id, false);
}

void resolver::define(const token &name) {
	if (std::empty(m_scopes)) return;
	m_scopes.back().insert_or_assign(name.lexeme_id, true);
}

void resolver::error(error_code code, std::string_view msg, const token &tok) const {
	errout.report(msg, error_record{
		.code = code,
		.line = tok.line,
		.from = tok.position,
		.to   = tok.position + tok.length
	});
}

} // namespace arbor
