//---------------------------------------------------------------------------//
// Copyright (c) 2026 circuitgen authors
//
// MIT License
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.
//---------------------------------------------------------------------------//
// @file This file defines the driver that resolves a program, binds the
// inputs of its main function and enforces its body.
//---------------------------------------------------------------------------//

#ifndef CIRCUITGEN_INCLUDE_NIL_CIRCUITGEN_GENERATOR_HPP_
#define CIRCUITGEN_INCLUDE_NIL_CIRCUITGEN_GENERATOR_HPP_

#include <boost/format.hpp>
#include <boost/log/trivial.hpp>

#include <nil/circuitgen/ast.hpp>
#include <nil/circuitgen/boolean.hpp>
#include <nil/circuitgen/constrained_program.hpp>
#include <nil/circuitgen/errors.hpp>
#include <nil/circuitgen/field_element.hpp>
#include <nil/circuitgen/integer.hpp>
#include <nil/circuitgen/logger.hpp>
#include <nil/circuitgen/r1cs/constraint_system.hpp>
#include <nil/circuitgen/statistics.hpp>
#include <nil/circuitgen/types.hpp>
#include <nil/circuitgen/value.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace nil {
    namespace circuitgen {

        struct generation_options {
            boost::log::trivial::severity_level log_level = boost::log::trivial::info;
            /// Nested calls deeper than this fail with `function_error_kind::recursion_limit`.
            std::size_t max_call_depth = 64;
            /// Check every constraint once generation with a complete assignment finishes.
            bool check_satisfiability = false;
            /// Print per-operation constraint statistics after generation.
            bool size_estimation = false;
        };

        template<typename FieldT>
        struct circuit_generator {

            using value_type = constrained_value<FieldT>;
            using cs_type = r1cs::constraint_system<FieldT>;
            using boolean_type = gadgets::boolean<FieldT>;
            using parameters_type = std::vector<std::optional<input_value>>;

            circuit_generator(const generation_options &options = generation_options()) :
                options(options), log(options.log_level) {
            }

            /**
             * @brief Resolve `program`, bind `parameters` to the inputs of its main function and
             * enforce the body.
             *
             * Missing trailing parameters are free witnesses. Constraints emitted before a failure
             * stay in `cs`; a failed generation must be discarded.
             */
            llvm::Expected<value_type> generate(cs_type &cs, const ast::program &program,
                                                const parameters_type &parameters) {
                identifiers = constrained_program<FieldT>();
                resolved_programs.clear();
                resolving_programs.clear();
                call_counts.clear();
                call_depth = 0;

                if (auto err = resolve_definitions(cs, program)) {
                    return std::move(err);
                }

                std::string main_name = new_scope(program.name, "main");
                const value_type *main_value = identifiers.get(main_name);
                if (main_value == nullptr) {
                    return llvm::make_error<compiler_error>(compiler_error_kind::no_main, main_name);
                }
                const function_value *main_function = main_value->as_function();
                if (main_function == nullptr) {
                    return llvm::make_error<compiler_error>(compiler_error_kind::no_main_function,
                                                            main_name + " is " + main_value->to_string());
                }
                // the table may grow while main runs, keep a copy of the callee
                function_value callee = *main_function;

                auto result = enforce_main_function(cs, callee, parameters);
                if (!result) {
                    return result.takeError();
                }

                if (options.check_satisfiability && cs.is_fully_assigned()) {
                    if (auto violated = cs.first_unsatisfied()) {
                        return llvm::make_error<compiler_error>(compiler_error_kind::unsatisfied, *violated);
                    }
                }

                log.debug(boost::format("output: %1%, %2% constraints, %3% variables") % result->to_string() %
                          cs.num_constraints() % cs.num_variables());
                if (options.size_estimation) {
                    statistics.print();
                }
                return result;
            }

            const constraint_statistics &get_statistics() const {
                return statistics;
            }

            const constrained_program<FieldT> &get_identifiers() const {
                return identifiers;
            }

        private:
            using statements_type = std::vector<ast::statement_ptr>;
            /// Values of an executed `return`, empty while the body keeps running.
            using returned_type = std::optional<std::vector<value_type>>;

            llvm::Error resolve_definitions(cs_type &cs, const ast::program &program) {
                if (resolving_programs.count(program.name) != 0) {
                    return llvm::make_error<import_error>(import_error_kind::cyclic_import, program.name);
                }
                if (resolved_programs.count(program.name) != 0) {
                    return llvm::Error::success();
                }
                resolving_programs.insert(program.name);
                for (const auto &import : program.imports) {
                    if (auto err = resolve_import(cs, program.name, import)) {
                        return err;
                    }
                }
                for (const auto &constant : program.constants) {
                    auto value = enforce_expression(cs, program.name, program.name, *constant.value);
                    if (!value) {
                        return value.takeError();
                    }
                    identifiers.store(new_scope(program.name, constant.name), std::move(*value));
                }
                for (const auto &function : program.functions) {
                    identifiers.store(new_scope(program.name, function->name),
                                      value_type(function_value {function, program.name}));
                }
                resolving_programs.erase(program.name);
                resolved_programs.insert(program.name);
                return llvm::Error::success();
            }

            llvm::Error resolve_import(cs_type &cs, const std::string &scope, const ast::import &import) {
                const ast::program &source = *import.source;
                if (auto err = resolve_definitions(cs, source)) {
                    return err;
                }
                if (import.symbol == "*") {
                    for (const auto &constant : source.constants) {
                        if (auto err = import_symbol(scope, source.name, constant.name, constant.name)) {
                            return err;
                        }
                    }
                    for (const auto &function : source.functions) {
                        if (auto err = import_symbol(scope, source.name, function->name, function->name)) {
                            return err;
                        }
                    }
                    return llvm::Error::success();
                }
                return import_symbol(scope, source.name, import.symbol, import.alias.value_or(import.symbol));
            }

            llvm::Error import_symbol(const std::string &scope, const std::string &source_scope,
                                      const std::string &symbol, const std::string &name) {
                const value_type *value = identifiers.get(new_scope(source_scope, symbol));
                if (value == nullptr) {
                    return llvm::make_error<import_error>(import_error_kind::unknown_symbol,
                                                          symbol + " in " + source_scope);
                }
                value_type copy = *value;
                identifiers.store(new_scope(scope, name), std::move(copy));
                return llvm::Error::success();
            }

            llvm::Expected<value_type> enforce_main_function(cs_type &cs, const function_value &main_function,
                                                             const parameters_type &parameters) {
                const ast::function &definition = *main_function.definition;
                if (parameters.size() > definition.inputs.size()) {
                    return llvm::make_error<function_error>(
                        function_error_kind::arguments_length,
                        "main expects " + std::to_string(definition.inputs.size()) + " inputs, got " +
                            std::to_string(parameters.size()));
                }
                std::string function_scope = new_scope(main_function.scope, definition.name);
                // primary inputs occupy the first variables of the protoboard
                for (bool allocate_private : {false, true}) {
                    for (std::size_t i = 0; i < definition.inputs.size(); ++i) {
                        const input_model &model = definition.inputs[i];
                        if (model.is_private != allocate_private) {
                            continue;
                        }
                        std::optional<input_value> parameter;
                        if (i < parameters.size()) {
                            parameter = parameters[i];
                        }
                        std::size_t constraints = cs.num_constraints();
                        std::size_t variables = cs.num_variables();
                        auto value = allocate_input(cs, model, parameter);
                        if (!value) {
                            return value.takeError();
                        }
                        statistics.add_record(model.parameter_type.to_string() + " input",
                                              cs.num_constraints() - constraints, cs.num_variables() - variables);
                        log.debug(boost::format("input %1% = %2%") % model.to_string() % value->to_string());
                        identifiers.store(new_scope(function_scope, model.name), std::move(*value));
                        identifiers.set_mutable(new_scope(function_scope, model.name), false);
                    }
                }
                return enforce_function_body(cs, main_function.scope, function_scope, definition);
            }

            llvm::Expected<value_type> allocate_input(cs_type &cs, const input_model &model,
                                                      const std::optional<input_value> &value) {
                switch (model.parameter_type.get_kind()) {
                    case type::kind::integer:
                        return integer_from_parameter(cs, model, value);
                    case type::kind::field_element:
                        return field_element_from_parameter(cs, model, value);
                    case type::kind::boolean:
                        return boolean_from_parameter(cs, model, value);
                }
                CIRCUITGEN_UNREACHABLE("invalid `type::kind` value");
            }

            llvm::Expected<value_type> enforce_function_body(cs_type &cs, const std::string &file_scope,
                                                             const std::string &function_scope,
                                                             const ast::function &definition) {
                auto returned = enforce_statements(cs, file_scope, function_scope, definition.body);
                if (!returned) {
                    return returned.takeError();
                }
                std::vector<value_type> values;
                if (*returned) {
                    values = std::move(**returned);
                }
                if (values.size() != definition.returns.size()) {
                    return llvm::make_error<function_error>(
                        function_error_kind::return_length,
                        definition.name + " returns " + std::to_string(definition.returns.size()) +
                            " values, got " + std::to_string(values.size()));
                }
                for (std::size_t i = 0; i < values.size(); ++i) {
                    if (values[i].get_type() != definition.returns[i]) {
                        return llvm::make_error<function_error>(
                            function_error_kind::return_type,
                            "expected " + definition.returns[i].to_string() + ", got " + values[i].to_string());
                    }
                }
                if (values.size() == 1) {
                    return std::move(values.front());
                }
                return value_type(returns_value<FieldT> {std::move(values)});
            }

            llvm::Expected<returned_type> enforce_statements(cs_type &cs, const std::string &file_scope,
                                                             const std::string &function_scope,
                                                             const statements_type &statements) {
                for (const auto &stmt : statements) {
                    log.log_statement(function_scope, *stmt);
                    auto returned = enforce_statement(cs, file_scope, function_scope, *stmt);
                    if (!returned) {
                        return returned.takeError();
                    }
                    if (*returned) {
                        return returned;
                    }
                }
                return returned_type();
            }

            llvm::Expected<returned_type> enforce_statement(cs_type &cs, const std::string &file_scope,
                                                            const std::string &function_scope,
                                                            const ast::statement &stmt) {
                if (auto definition = std::get_if<ast::definition_statement>(&stmt.node)) {
                    if (auto err = enforce_definition(cs, file_scope, function_scope, *definition)) {
                        return std::move(err);
                    }
                    return returned_type();
                }
                if (auto assignment = std::get_if<ast::assign_statement>(&stmt.node)) {
                    if (auto err = enforce_assignment(cs, file_scope, function_scope, *assignment)) {
                        return std::move(err);
                    }
                    return returned_type();
                }
                if (auto ret = std::get_if<ast::return_statement>(&stmt.node)) {
                    std::vector<value_type> values;
                    for (const auto &expr : ret->values) {
                        auto value = enforce_expression(cs, file_scope, function_scope, *expr);
                        if (!value) {
                            return value.takeError();
                        }
                        values.push_back(std::move(*value));
                    }
                    return returned_type(std::move(values));
                }
                if (auto assertion = std::get_if<ast::assert_eq_statement>(&stmt.node)) {
                    if (auto err = enforce_assert_eq(cs, file_scope, function_scope, *assertion)) {
                        return std::move(err);
                    }
                    return returned_type();
                }
                if (auto conditional = std::get_if<ast::conditional_statement>(&stmt.node)) {
                    return enforce_conditional(cs, file_scope, function_scope, *conditional);
                }
                if (auto iteration = std::get_if<ast::iteration_statement>(&stmt.node)) {
                    return enforce_iteration(cs, file_scope, function_scope, *iteration);
                }
                const auto &expr = std::get<ast::expression_statement>(stmt.node);
                auto value = enforce_expression(cs, file_scope, function_scope, *expr.value);
                if (!value) {
                    return value.takeError();
                }
                return returned_type();
            }

            llvm::Error enforce_definition(cs_type &cs, const std::string &file_scope,
                                           const std::string &function_scope,
                                           const ast::definition_statement &definition) {
                auto value = enforce_expression(cs, file_scope, function_scope, *definition.value);
                if (!value) {
                    return value.takeError();
                }
                if (definition.declared_type && value->get_type() != definition.declared_type) {
                    return llvm::make_error<statement_error>(statement_error_kind::type_mismatch,
                                                             definition.name + ": " +
                                                                 definition.declared_type->to_string() + " = " +
                                                                 value->to_string());
                }
                log.debug(boost::format("\t\t%1% = %2%") % definition.name % value->to_string());
                std::string name = new_scope(function_scope, definition.name);
                identifiers.store(name, std::move(*value));
                identifiers.set_mutable(name, definition.is_mutable);
                return llvm::Error::success();
            }

            llvm::Error enforce_assignment(cs_type &cs, const std::string &file_scope,
                                           const std::string &function_scope,
                                           const ast::assign_statement &assignment) {
                std::string name = new_scope(function_scope, assignment.name);
                const value_type *current = identifiers.get(name);
                if (current == nullptr) {
                    return llvm::make_error<statement_error>(statement_error_kind::undefined_variable,
                                                             assignment.name);
                }
                if (!identifiers.is_mutable(name)) {
                    return llvm::make_error<statement_error>(statement_error_kind::immutable_assign,
                                                             assignment.name);
                }
                // evaluating the right-hand side may invalidate `current`
                std::optional<type> current_type = current->get_type();
                auto value = enforce_expression(cs, file_scope, function_scope, *assignment.value);
                if (!value) {
                    return value.takeError();
                }
                if (!current_type || value->get_type() != current_type) {
                    return llvm::make_error<statement_error>(statement_error_kind::type_mismatch,
                                                             assignment.name + " = " + value->to_string());
                }
                identifiers.store(name, std::move(*value));
                return llvm::Error::success();
            }

            llvm::Error enforce_assert_eq(cs_type &cs, const std::string &file_scope,
                                          const std::string &function_scope,
                                          const ast::assert_eq_statement &assertion) {
                auto left = enforce_expression(cs, file_scope, function_scope, *assertion.left);
                if (!left) {
                    return left.takeError();
                }
                auto right = enforce_expression(cs, file_scope, function_scope, *assertion.right);
                if (!right) {
                    return right.takeError();
                }
                std::string description = left->to_string() + " == " + right->to_string();
                if (!left->same_kind(*right)) {
                    return llvm::make_error<statement_error>(statement_error_kind::assertion_type_mismatch,
                                                             description);
                }

                std::size_t constraints = cs.num_constraints();
                std::size_t variables = cs.num_variables();
                if (auto err = dispatch_assert_eq(cs, *left, *right)) {
                    return err;
                }
                statistics.add_record("assert_eq", cs.num_constraints() - constraints,
                                      cs.num_variables() - variables);
                return llvm::Error::success();
            }

            llvm::Error dispatch_assert_eq(cs_type &cs, const value_type &left, const value_type &right) {
                if (auto lhs = left.as_boolean()) {
                    return enforce_boolean_eq(cs, *lhs, *right.as_boolean());
                }
                if (auto lhs = left.as_integer()) {
                    return enforce_integer_eq(cs, *lhs, *right.as_integer());
                }
                if (auto lhs = left.as_field()) {
                    return enforce_field_eq(cs, *lhs, *right.as_field());
                }
                return llvm::make_error<statement_error>(statement_error_kind::assertion_type_mismatch,
                                                         left.to_string() + " == " + right.to_string());
            }

            llvm::Expected<bool> constant_condition(cs_type &cs, const std::string &file_scope,
                                                    const std::string &function_scope, const ast::expression &expr) {
                auto value = enforce_expression(cs, file_scope, function_scope, expr);
                if (!value) {
                    return value.takeError();
                }
                const boolean_type *condition = value->as_boolean();
                if (condition == nullptr) {
                    return llvm::make_error<statement_error>(statement_error_kind::condition_not_boolean,
                                                             value->to_string());
                }
                if (!condition->is_constant()) {
                    return llvm::make_error<statement_error>(statement_error_kind::condition_not_constant,
                                                             ast::to_string(expr));
                }
                return *condition->get_value();
            }

            llvm::Expected<returned_type> enforce_conditional(cs_type &cs, const std::string &file_scope,
                                                              const std::string &function_scope,
                                                              const ast::conditional_statement &conditional) {
                auto condition = constant_condition(cs, file_scope, function_scope, *conditional.condition);
                if (!condition) {
                    return condition.takeError();
                }
                log.debug(boost::format("\t\tbranch %1%") % (*condition ? "taken" : "skipped"));
                return enforce_statements(cs, file_scope, function_scope,
                                          *condition ? conditional.then_branch : conditional.else_branch);
            }

            llvm::Expected<std::uint32_t> loop_bound(cs_type &cs, const std::string &file_scope,
                                                     const std::string &function_scope, const ast::expression &expr) {
                auto value = enforce_expression(cs, file_scope, function_scope, expr);
                if (!value) {
                    return value.takeError();
                }
                const integer<FieldT> *bound = value->as_integer();
                if (bound == nullptr || bound->get_type() != integer_type::u32 || !bound->is_constant()) {
                    return llvm::make_error<statement_error>(statement_error_kind::invalid_loop_bounds,
                                                             "expected a constant u32, got " + value->to_string());
                }
                return static_cast<std::uint32_t>(bound->get_value()->getZExtValue());
            }

            llvm::Expected<returned_type> enforce_iteration(cs_type &cs, const std::string &file_scope,
                                                            const std::string &function_scope,
                                                            const ast::iteration_statement &iteration) {
                auto start = loop_bound(cs, file_scope, function_scope, *iteration.start);
                if (!start) {
                    return start.takeError();
                }
                auto stop = loop_bound(cs, file_scope, function_scope, *iteration.stop);
                if (!stop) {
                    return stop.takeError();
                }
                if (*start > *stop) {
                    return llvm::make_error<statement_error>(statement_error_kind::invalid_loop_bounds,
                                                             std::to_string(*start) + ".." + std::to_string(*stop));
                }
                std::string index_name = new_scope(function_scope, iteration.index);
                for (std::uint32_t i = *start; i < *stop; ++i) {
                    identifiers.store(index_name,
                                      value_type(integer<FieldT>::constant(integer_type::u32,
                                                                                       llvm::APInt(32, i))));
                    identifiers.set_mutable(index_name, false);
                    auto returned = enforce_statements(cs, file_scope, function_scope, iteration.body);
                    if (!returned) {
                        return returned.takeError();
                    }
                    if (*returned) {
                        return returned;
                    }
                }
                return returned_type();
            }

            /// @brief Look `name` up in the function scope, then in the file scope.
            const value_type *lookup(const std::string &file_scope, const std::string &function_scope,
                                     const std::string &name) const {
                if (auto value = identifiers.get(new_scope(function_scope, name))) {
                    return value;
                }
                return identifiers.get(new_scope(file_scope, name));
            }

            llvm::Expected<value_type> enforce_expression(cs_type &cs, const std::string &file_scope,
                                                          const std::string &function_scope,
                                                          const ast::expression &expr) {
                if (auto identifier = std::get_if<ast::identifier_expression>(&expr.node)) {
                    const value_type *value = lookup(file_scope, function_scope, identifier->name);
                    if (value == nullptr) {
                        return llvm::make_error<expression_error>(expression_error_kind::undefined_identifier,
                                                                  identifier->name);
                    }
                    return *value;
                }
                if (auto literal = std::get_if<integer_literal>(&expr.node)) {
                    return value_type(integer<FieldT>::constant(literal->type, literal->value));
                }
                if (auto literal = std::get_if<field_literal>(&expr.node)) {
                    return field_element_from_literal<FieldT>(literal->value);
                }
                if (auto literal = std::get_if<boolean_literal>(&expr.node)) {
                    return value_type(boolean_type::constant(literal->value));
                }
                if (auto binary = std::get_if<ast::binary_expression>(&expr.node)) {
                    auto left = enforce_expression(cs, file_scope, function_scope, *binary->left);
                    if (!left) {
                        return left.takeError();
                    }
                    auto right = enforce_expression(cs, file_scope, function_scope, *binary->right);
                    if (!right) {
                        return right.takeError();
                    }
                    return enforce_binary(cs, binary->op, *left, *right);
                }
                if (auto negation = std::get_if<ast::not_expression>(&expr.node)) {
                    auto operand = enforce_expression(cs, file_scope, function_scope, *negation->operand);
                    if (!operand) {
                        return operand.takeError();
                    }
                    return evaluate_not(*operand);
                }
                if (auto ternary = std::get_if<ast::ternary_expression>(&expr.node)) {
                    return enforce_ternary(cs, file_scope, function_scope, *ternary);
                }
                return enforce_call(cs, file_scope, function_scope, std::get<ast::call_expression>(expr.node));
            }

            static llvm::Error incompatible(const value_type &left, ast::binary_operator op,
                                            const value_type &right) {
                return llvm::make_error<expression_error>(expression_error_kind::incompatible_types,
                                                          left.to_string() + " " + ast::to_string(op) + " " +
                                                              right.to_string());
            }

            std::string operation_name(const value_type &left, ast::binary_operator op) const {
                auto operand_type = left.get_type();
                return (operand_type ? operand_type->to_string() : std::string("value")) + " " + ast::to_string(op);
            }

            llvm::Expected<value_type> enforce_binary(cs_type &cs, ast::binary_operator op, const value_type &left,
                                                      const value_type &right) {
                std::size_t constraints = cs.num_constraints();
                std::size_t variables = cs.num_variables();
                auto result = dispatch_binary(cs, op, left, right);
                if (result) {
                    statistics.add_record(operation_name(left, op), cs.num_constraints() - constraints,
                                          cs.num_variables() - variables);
                }
                return result;
            }

            llvm::Expected<value_type> dispatch_binary(cs_type &cs, ast::binary_operator op, const value_type &left,
                                                       const value_type &right) {
                using ast::binary_operator;
                if (op == binary_operator::logical_and) {
                    return enforce_and(cs, left, right);
                }
                if (op == binary_operator::logical_or) {
                    return enforce_or(cs, left, right);
                }
                if (!left.same_kind(right)) {
                    return incompatible(left, op, right);
                }
                if (op == binary_operator::eq || op == binary_operator::ne) {
                    auto equal = enforce_equality(cs, left, right);
                    if (!equal || op == binary_operator::eq) {
                        return equal;
                    }
                    return evaluate_not(*equal);
                }
                if (auto lhs = left.as_integer()) {
                    const integer<FieldT> &rhs = *right.as_integer();
                    switch (op) {
                        case binary_operator::add:
                            return enforce_integer_add(cs, *lhs, rhs);
                        case binary_operator::sub:
                            return enforce_integer_sub(cs, *lhs, rhs);
                        case binary_operator::mul:
                            return enforce_integer_mul(cs, *lhs, rhs);
                        case binary_operator::div:
                            return enforce_integer_div(cs, *lhs, rhs);
                        case binary_operator::pow:
                            return enforce_integer_pow(cs, *lhs, rhs);
                        case binary_operator::lt:
                            return enforce_integer_lt(cs, *lhs, rhs);
                        case binary_operator::le:
                            return enforce_integer_le(cs, *lhs, rhs);
                        case binary_operator::gt:
                            return enforce_integer_gt(cs, *lhs, rhs);
                        case binary_operator::ge:
                            return enforce_integer_ge(cs, *lhs, rhs);
                        default:
                            CIRCUITGEN_UNREACHABLE("logical and equality operators are handled above");
                    }
                }
                if (auto lhs = left.as_field()) {
                    const gadgets::field_element<FieldT> &rhs = *right.as_field();
                    switch (op) {
                        case binary_operator::add:
                            return enforce_field_add(*lhs, rhs);
                        case binary_operator::sub:
                            return enforce_field_sub(*lhs, rhs);
                        case binary_operator::mul:
                            return enforce_field_mul(cs, *lhs, rhs);
                        case binary_operator::div:
                            return enforce_field_div(cs, *lhs, rhs);
                        default:
                            return llvm::make_error<field_element_error>(
                                field_element_error_kind::cannot_enforce,
                                left.to_string() + " " + ast::to_string(op) + " " + right.to_string());
                    }
                }
                return incompatible(left, op, right);
            }

            /// @brief Equality bit, folded without constraints when both operands are constants.
            llvm::Expected<value_type> enforce_equality(cs_type &cs, const value_type &left,
                                                        const value_type &right) {
                bool fold = left.is_constant() && right.is_constant();
                if (auto lhs = left.as_boolean()) {
                    const boolean_type &rhs = *right.as_boolean();
                    if (fold) {
                        return evaluate_boolean_eq(*lhs, rhs);
                    }
                    return enforce_boolean_is_equal(cs, *lhs, rhs);
                }
                if (auto lhs = left.as_integer()) {
                    const integer<FieldT> &rhs = *right.as_integer();
                    if (fold) {
                        return evaluate_integer_eq(*lhs, rhs);
                    }
                    return enforce_integer_is_equal(cs, *lhs, rhs);
                }
                if (auto lhs = left.as_field()) {
                    const gadgets::field_element<FieldT> &rhs = *right.as_field();
                    if (fold) {
                        return evaluate_field_eq(*lhs, rhs);
                    }
                    return enforce_field_is_equal(cs, *lhs, rhs);
                }
                return incompatible(left, ast::binary_operator::eq, right);
            }

            llvm::Expected<value_type> enforce_ternary(cs_type &cs, const std::string &file_scope,
                                                       const std::string &function_scope,
                                                       const ast::ternary_expression &ternary) {
                auto condition_value = enforce_expression(cs, file_scope, function_scope, *ternary.condition);
                if (!condition_value) {
                    return condition_value.takeError();
                }
                const boolean_type *condition = condition_value->as_boolean();
                if (condition == nullptr) {
                    return llvm::make_error<expression_error>(expression_error_kind::incompatible_types,
                                                              "condition " + condition_value->to_string() +
                                                                  " is not a boolean");
                }
                if (condition->is_constant()) {
                    return enforce_expression(cs, file_scope, function_scope,
                                              *condition->get_value() ? *ternary.first : *ternary.second);
                }
                auto first = enforce_expression(cs, file_scope, function_scope, *ternary.first);
                if (!first) {
                    return first.takeError();
                }
                auto second = enforce_expression(cs, file_scope, function_scope, *ternary.second);
                if (!second) {
                    return second.takeError();
                }
                if (first->same_kind(*second)) {
                    if (auto lhs = first->as_boolean()) {
                        return conditionally_select_boolean(cs, *condition, *lhs, *second->as_boolean());
                    }
                    if (auto lhs = first->as_integer()) {
                        return conditionally_select_integer(cs, *condition, *lhs, *second->as_integer());
                    }
                    if (auto lhs = first->as_field()) {
                        return conditionally_select_field(cs, *condition, *lhs, *second->as_field());
                    }
                }
                return llvm::make_error<expression_error>(expression_error_kind::incompatible_types,
                                                          condition->to_string() + " ? " + first->to_string() +
                                                              " : " + second->to_string());
            }

            llvm::Expected<value_type> enforce_call(cs_type &cs, const std::string &file_scope,
                                                    const std::string &function_scope,
                                                    const ast::call_expression &call) {
                const value_type *callee_value = lookup(file_scope, function_scope, call.function);
                if (callee_value == nullptr) {
                    return llvm::make_error<expression_error>(expression_error_kind::undefined_identifier,
                                                              call.function);
                }
                const function_value *callee_pointer = callee_value->as_function();
                if (callee_pointer == nullptr) {
                    return llvm::make_error<expression_error>(expression_error_kind::not_a_function,
                                                              call.function + " is " + callee_value->to_string());
                }
                function_value callee = *callee_pointer;
                const ast::function &definition = *callee.definition;

                if (call_depth >= options.max_call_depth) {
                    return llvm::make_error<function_error>(function_error_kind::recursion_limit,
                                                            definition.name + " at depth " +
                                                                std::to_string(call_depth));
                }
                if (call.arguments.size() != definition.inputs.size()) {
                    return llvm::make_error<function_error>(
                        function_error_kind::arguments_length,
                        definition.name + " expects " + std::to_string(definition.inputs.size()) +
                            " arguments, got " + std::to_string(call.arguments.size()));
                }

                std::vector<value_type> arguments;
                for (std::size_t i = 0; i < call.arguments.size(); ++i) {
                    auto argument = enforce_expression(cs, file_scope, function_scope, *call.arguments[i]);
                    if (!argument) {
                        return argument.takeError();
                    }
                    const input_model &model = definition.inputs[i];
                    if (argument->get_type() != model.parameter_type) {
                        return llvm::make_error<function_error>(function_error_kind::invalid_argument_type,
                                                                model.to_string() + ", got " +
                                                                    argument->to_string());
                    }
                    arguments.push_back(std::move(*argument));
                }

                std::string qualified_name = new_scope(callee.scope, definition.name);
                std::size_t call_index = call_counts[qualified_name]++;
                std::string callee_scope = new_scope(callee.scope, definition.name + "#" + std::to_string(call_index));
                for (std::size_t i = 0; i < arguments.size(); ++i) {
                    std::string name = new_scope(callee_scope, definition.inputs[i].name);
                    identifiers.store(name, std::move(arguments[i]));
                    identifiers.set_mutable(name, false);
                }

                ++call_depth;
                auto result = enforce_function_body(cs, callee.scope, callee_scope, definition);
                --call_depth;
                return result;
            }

            generation_options options;
            logger log;
            constraint_statistics statistics;
            constrained_program<FieldT> identifiers;
            std::set<std::string> resolved_programs;
            std::set<std::string> resolving_programs;
            std::map<std::string, std::size_t> call_counts;
            std::size_t call_depth = 0;
        };

        /**
         * @brief Generate the constraints of `program` into `cs` and return the value of its main function.
         *
         * `parameters[i]` supplies the literal for the i-th input of main; absent entries and
         * missing trailing entries allocate free witnesses.
         */
        template<typename FieldT>
        llvm::Expected<constrained_value<FieldT>>
            generate_constraints(r1cs::constraint_system<FieldT> &cs, const ast::program &program,
                                 const std::vector<std::optional<input_value>> &parameters,
                                 const generation_options &options = generation_options()) {
            circuit_generator<FieldT> generator(options);
            return generator.generate(cs, program, parameters);
        }

    }    // namespace circuitgen
}    // namespace nil

#endif    // CIRCUITGEN_INCLUDE_NIL_CIRCUITGEN_GENERATOR_HPP_
