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
// @file This file defines the resolved, typed program tree consumed by
// constraint generation.
//---------------------------------------------------------------------------//

#ifndef CIRCUITGEN_INCLUDE_NIL_CIRCUITGEN_AST_HPP_
#define CIRCUITGEN_INCLUDE_NIL_CIRCUITGEN_AST_HPP_

#include <nil/circuitgen/errors.hpp>
#include <nil/circuitgen/types.hpp>

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace nil {
    namespace circuitgen {
        namespace ast {

            struct expression;
            struct statement;
            struct function;
            struct program;

            using expression_ptr = std::shared_ptr<const expression>;
            using statement_ptr = std::shared_ptr<const statement>;
            using function_ptr = std::shared_ptr<const function>;
            using program_ptr = std::shared_ptr<const program>;

            enum class binary_operator {
                add,
                sub,
                mul,
                div,
                pow,
                eq,
                ne,
                lt,
                le,
                gt,
                ge,
                logical_and,
                logical_or,
            };

            inline const char *to_string(binary_operator op) {
                switch (op) {
                    case binary_operator::add:
                        return "+";
                    case binary_operator::sub:
                        return "-";
                    case binary_operator::mul:
                        return "*";
                    case binary_operator::div:
                        return "/";
                    case binary_operator::pow:
                        return "**";
                    case binary_operator::eq:
                        return "==";
                    case binary_operator::ne:
                        return "!=";
                    case binary_operator::lt:
                        return "<";
                    case binary_operator::le:
                        return "<=";
                    case binary_operator::gt:
                        return ">";
                    case binary_operator::ge:
                        return ">=";
                    case binary_operator::logical_and:
                        return "&&";
                    case binary_operator::logical_or:
                        return "||";
                }
                CIRCUITGEN_UNREACHABLE("invalid `binary_operator` value");
            }

            struct identifier_expression {
                std::string name;
            };

            struct binary_expression {
                binary_operator op;
                expression_ptr left;
                expression_ptr right;
            };

            struct not_expression {
                expression_ptr operand;
            };

            /// @brief `condition ? first : second`.
            struct ternary_expression {
                expression_ptr condition;
                expression_ptr first;
                expression_ptr second;
            };

            struct call_expression {
                std::string function;
                std::vector<expression_ptr> arguments;
            };

            struct expression {
                using node_type = std::variant<identifier_expression, integer_literal, field_literal, boolean_literal,
                                               binary_expression, not_expression, ternary_expression, call_expression>;
                node_type node;
            };

            /// @brief `let [mut] name [: type] = value`.
            struct definition_statement {
                std::string name;
                bool is_mutable;
                std::optional<type> declared_type;
                expression_ptr value;
            };

            struct assign_statement {
                std::string name;
                expression_ptr value;
            };

            struct return_statement {
                std::vector<expression_ptr> values;
            };

            struct assert_eq_statement {
                expression_ptr left;
                expression_ptr right;
            };

            struct conditional_statement {
                expression_ptr condition;
                std::vector<statement_ptr> then_branch;
                std::vector<statement_ptr> else_branch;
            };

            /// @brief `for index in start..stop { body }`, with `stop` excluded.
            struct iteration_statement {
                std::string index;
                expression_ptr start;
                expression_ptr stop;
                std::vector<statement_ptr> body;
            };

            struct expression_statement {
                expression_ptr value;
            };

            struct statement {
                using node_type = std::variant<definition_statement, assign_statement, return_statement,
                                               assert_eq_statement, conditional_statement, iteration_statement,
                                               expression_statement>;
                node_type node;
            };

            struct function {
                std::string name;
                std::vector<input_model> inputs;
                std::vector<type> returns;
                std::vector<statement_ptr> body;
            };

            /// @brief Top-level `const name = value`.
            struct constant_definition {
                std::string name;
                expression_ptr value;
            };

            /**
             * @brief Import of `symbol` from an already parsed program.
             *
             * The symbol `*` imports every constant and function of `source`.
             */
            struct import {
                program_ptr source;
                std::string symbol;
                std::optional<std::string> alias;
            };

            struct program {
                std::string name;
                std::vector<import> imports;
                std::vector<constant_definition> constants;
                std::vector<function_ptr> functions;
            };

            inline expression_ptr make_expression(expression::node_type node) {
                return std::make_shared<const expression>(expression {std::move(node)});
            }

            inline statement_ptr make_statement(statement::node_type node) {
                return std::make_shared<const statement>(statement {std::move(node)});
            }

            inline expression_ptr identifier(std::string name) {
                return make_expression(identifier_expression {std::move(name)});
            }

            inline llvm::Expected<expression_ptr> integer_value(integer_type type, std::uint64_t value) {
                auto bits = integer_bits(type, value);
                if (!bits) {
                    return bits.takeError();
                }
                return make_expression(integer_literal {type, std::move(*bits)});
            }

            inline expression_ptr integer_value(integer_type type, const llvm::APInt &value) {
                CIRCUITGEN_ASSERT(value.getBitWidth() == bit_width(type));
                return make_expression(integer_literal {type, value});
            }

            inline expression_ptr field_value(std::string decimal) {
                return make_expression(field_literal {std::move(decimal)});
            }

            inline expression_ptr boolean_value(bool value) {
                return make_expression(boolean_literal {value});
            }

            inline expression_ptr binary(binary_operator op, expression_ptr left, expression_ptr right) {
                return make_expression(binary_expression {op, std::move(left), std::move(right)});
            }

            inline expression_ptr negation(expression_ptr operand) {
                return make_expression(not_expression {std::move(operand)});
            }

            inline expression_ptr ternary(expression_ptr condition, expression_ptr first, expression_ptr second) {
                return make_expression(ternary_expression {std::move(condition), std::move(first), std::move(second)});
            }

            inline expression_ptr call(std::string function, std::vector<expression_ptr> arguments) {
                return make_expression(call_expression {std::move(function), std::move(arguments)});
            }

            inline statement_ptr definition(std::string name, expression_ptr value,
                                            std::optional<type> declared_type = std::nullopt,
                                            bool is_mutable = false) {
                return make_statement(
                    definition_statement {std::move(name), is_mutable, std::move(declared_type), std::move(value)});
            }

            inline statement_ptr assignment(std::string name, expression_ptr value) {
                return make_statement(assign_statement {std::move(name), std::move(value)});
            }

            inline statement_ptr return_values(std::vector<expression_ptr> values) {
                return make_statement(return_statement {std::move(values)});
            }

            inline statement_ptr assert_equal(expression_ptr left, expression_ptr right) {
                return make_statement(assert_eq_statement {std::move(left), std::move(right)});
            }

            inline statement_ptr conditional(expression_ptr condition, std::vector<statement_ptr> then_branch,
                                             std::vector<statement_ptr> else_branch = {}) {
                return make_statement(
                    conditional_statement {std::move(condition), std::move(then_branch), std::move(else_branch)});
            }

            inline statement_ptr iteration(std::string index, expression_ptr start, expression_ptr stop,
                                           std::vector<statement_ptr> body) {
                return make_statement(
                    iteration_statement {std::move(index), std::move(start), std::move(stop), std::move(body)});
            }

            inline statement_ptr evaluate(expression_ptr value) {
                return make_statement(expression_statement {std::move(value)});
            }

            inline std::string to_string(const expression &expr);

            namespace detail {
                inline std::string join(const std::vector<expression_ptr> &expressions) {
                    std::string result;
                    for (std::size_t i = 0; i < expressions.size(); ++i) {
                        if (i != 0) {
                            result += ", ";
                        }
                        result += to_string(*expressions[i]);
                    }
                    return result;
                }

                struct expression_printer {
                    std::string operator()(const identifier_expression &expr) const {
                        return expr.name;
                    }

                    std::string operator()(const integer_literal &expr) const {
                        return circuitgen::to_string(expr.value) + circuitgen::to_string(expr.type);
                    }

                    std::string operator()(const field_literal &expr) const {
                        return expr.value + "field";
                    }

                    std::string operator()(const boolean_literal &expr) const {
                        return expr.value ? "true" : "false";
                    }

                    std::string operator()(const binary_expression &expr) const {
                        return "(" + to_string(*expr.left) + " " + ast::to_string(expr.op) + " " +
                               to_string(*expr.right) + ")";
                    }

                    std::string operator()(const not_expression &expr) const {
                        return "!" + to_string(*expr.operand);
                    }

                    std::string operator()(const ternary_expression &expr) const {
                        return "(" + to_string(*expr.condition) + " ? " + to_string(*expr.first) + " : " +
                               to_string(*expr.second) + ")";
                    }

                    std::string operator()(const call_expression &expr) const {
                        return expr.function + "(" + join(expr.arguments) + ")";
                    }
                };

                /// Blocks render as their header only.
                struct statement_printer {
                    std::string operator()(const definition_statement &stmt) const {
                        std::string result = stmt.is_mutable ? "let mut " : "let ";
                        result += stmt.name;
                        if (stmt.declared_type) {
                            result += ": " + stmt.declared_type->to_string();
                        }
                        return result + " = " + to_string(*stmt.value);
                    }

                    std::string operator()(const assign_statement &stmt) const {
                        return stmt.name + " = " + to_string(*stmt.value);
                    }

                    std::string operator()(const return_statement &stmt) const {
                        return "return " + join(stmt.values);
                    }

                    std::string operator()(const assert_eq_statement &stmt) const {
                        return "assert_eq!(" + to_string(*stmt.left) + ", " + to_string(*stmt.right) + ")";
                    }

                    std::string operator()(const conditional_statement &stmt) const {
                        return "if " + to_string(*stmt.condition);
                    }

                    std::string operator()(const iteration_statement &stmt) const {
                        return "for " + stmt.index + " in " + to_string(*stmt.start) + ".." + to_string(*stmt.stop);
                    }

                    std::string operator()(const expression_statement &stmt) const {
                        return to_string(*stmt.value);
                    }
                };
            }    // namespace detail

            inline std::string to_string(const expression &expr) {
                return std::visit(detail::expression_printer {}, expr.node);
            }

            inline std::string to_string(const statement &stmt) {
                return std::visit(detail::statement_printer {}, stmt.node);
            }

        }    // namespace ast
    }        // namespace circuitgen
}    // namespace nil

#endif    // CIRCUITGEN_INCLUDE_NIL_CIRCUITGEN_AST_HPP_
