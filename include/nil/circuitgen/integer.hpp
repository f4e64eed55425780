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
// @file This file defines width-dispatched equality, arithmetic, comparison
// and input allocation for integer values.
//---------------------------------------------------------------------------//

#ifndef CIRCUITGEN_INCLUDE_NIL_CIRCUITGEN_INTEGER_HPP_
#define CIRCUITGEN_INCLUDE_NIL_CIRCUITGEN_INTEGER_HPP_

#include <nil/circuitgen/errors.hpp>
#include <nil/circuitgen/gadgets/boolean.hpp>
#include <nil/circuitgen/r1cs/constraint_system.hpp>
#include <nil/circuitgen/types.hpp>
#include <nil/circuitgen/value.hpp>

#include <optional>
#include <string>
#include <type_traits>
#include <variant>

namespace nil {
    namespace circuitgen {

        namespace detail {
            template<typename FieldT>
            std::string describe_operation(const integer<FieldT> &left, const char *op,
                                           const integer<FieldT> &right) {
                return left.to_string() + " " + op + " " + right.to_string();
            }

            template<typename FieldT>
            llvm::Error integer_mismatch(integer_error_kind kind, const integer<FieldT> &left,
                                         const char *op, const integer<FieldT> &right) {
                return llvm::make_error<integer_error>(kind, describe_operation(left, op, right));
            }

            /**
             * @brief Apply `op` to the gadgets of two integers of the same width.
             *
             * `op(cs, left, right, annotation)` returns `llvm::Expected` of a gadget. Differing
             * widths are rejected with `cannot_enforce` before anything is emitted.
             */
            template<typename FieldT, typename Op>
            llvm::Expected<constrained_value<FieldT>>
                enforce_integer_binary(r1cs::constraint_system<FieldT> &cs,
                                       const integer<FieldT> &left,
                                       const integer<FieldT> &right, const char *op, Op &&gadget_op) {
                using result_type = llvm::Expected<constrained_value<FieldT>>;
                return std::visit(
                    [&](const auto &lhs, const auto &rhs) -> result_type {
                        using lhs_type = std::decay_t<decltype(lhs)>;
                        using rhs_type = std::decay_t<decltype(rhs)>;
                        if constexpr (std::is_same_v<lhs_type, rhs_type>) {
                            std::string annotation = to_string(left.get_type()) + " " + op;
                            llvm::Expected<lhs_type> result = gadget_op(cs, lhs, rhs, annotation);
                            if (!result) {
                                return result.takeError();
                            }
                            return constrained_value<FieldT>(std::move(*result));
                        } else {
                            return integer_mismatch(integer_error_kind::cannot_enforce, left, op, right);
                        }
                    },
                    left.get(), right.get());
            }

            /// @brief Same as `enforce_integer_binary` for operations producing a boolean.
            template<typename FieldT, typename Op>
            llvm::Expected<constrained_value<FieldT>>
                enforce_integer_predicate(r1cs::constraint_system<FieldT> &cs,
                                          const integer<FieldT> &left,
                                          const integer<FieldT> &right, const char *op,
                                          Op &&gadget_op) {
                using result_type = llvm::Expected<constrained_value<FieldT>>;
                return std::visit(
                    [&](const auto &lhs, const auto &rhs) -> result_type {
                        using lhs_type = std::decay_t<decltype(lhs)>;
                        using rhs_type = std::decay_t<decltype(rhs)>;
                        if constexpr (std::is_same_v<lhs_type, rhs_type>) {
                            std::string annotation = to_string(left.get_type()) + " " + op;
                            return constrained_value<FieldT>(gadget_op(cs, lhs, rhs, annotation));
                        } else {
                            return integer_mismatch(integer_error_kind::cannot_enforce, left, op, right);
                        }
                    },
                    left.get(), right.get());
            }
        }    // namespace detail

        /**
         * @brief Constraint-free comparison used for constant folding.
         *
         * Compares the known values of two integers of the same width; two unknown values
         * compare equal.
         */
        template<typename FieldT>
        llvm::Expected<constrained_value<FieldT>>
            evaluate_integer_eq(const integer<FieldT> &left, const integer<FieldT> &right) {
            using result_type = llvm::Expected<constrained_value<FieldT>>;
            return std::visit(
                [&](const auto &lhs, const auto &rhs) -> result_type {
                    if constexpr (std::is_same_v<std::decay_t<decltype(lhs)>, std::decay_t<decltype(rhs)>>) {
                        return constrained_value<FieldT>(
                            gadgets::boolean<FieldT>::constant(lhs.get_value() == rhs.get_value()));
                    } else {
                        return detail::integer_mismatch(integer_error_kind::cannot_evaluate, left, "==", right);
                    }
                },
                left.get(), right.get());
        }

        template<typename FieldT>
        llvm::Error enforce_integer_eq(r1cs::constraint_system<FieldT> &cs,
                                       const integer<FieldT> &left,
                                       const integer<FieldT> &right) {
            return std::visit(
                [&](const auto &lhs, const auto &rhs) -> llvm::Error {
                    using lhs_type = std::decay_t<decltype(lhs)>;
                    if constexpr (std::is_same_v<lhs_type, std::decay_t<decltype(rhs)>>) {
                        return lhs_type::enforce_equal(cs, lhs, rhs, to_string(left.get_type()) + " ==");
                    } else {
                        return detail::integer_mismatch(integer_error_kind::cannot_enforce, left, "==", right);
                    }
                },
                left.get(), right.get());
        }

        template<typename FieldT>
        llvm::Expected<constrained_value<FieldT>>
            enforce_integer_add(r1cs::constraint_system<FieldT> &cs,
                                const integer<FieldT> &left, const integer<FieldT> &right) {
            return detail::enforce_integer_binary(
                cs, left, right, "+", [](auto &cs, const auto &lhs, const auto &rhs, const std::string &annotation) {
                    return std::decay_t<decltype(lhs)>::add(cs, lhs, rhs, annotation);
                });
        }

        template<typename FieldT>
        llvm::Expected<constrained_value<FieldT>>
            enforce_integer_sub(r1cs::constraint_system<FieldT> &cs,
                                const integer<FieldT> &left, const integer<FieldT> &right) {
            return detail::enforce_integer_binary(
                cs, left, right, "-", [](auto &cs, const auto &lhs, const auto &rhs, const std::string &annotation) {
                    return std::decay_t<decltype(lhs)>::sub(cs, lhs, rhs, annotation);
                });
        }

        template<typename FieldT>
        llvm::Expected<constrained_value<FieldT>>
            enforce_integer_mul(r1cs::constraint_system<FieldT> &cs,
                                const integer<FieldT> &left, const integer<FieldT> &right) {
            return detail::enforce_integer_binary(
                cs, left, right, "*", [](auto &cs, const auto &lhs, const auto &rhs, const std::string &annotation) {
                    return std::decay_t<decltype(lhs)>::mul(cs, lhs, rhs, annotation);
                });
        }

        /// @brief Truncating division; a divisor known to be zero is a `division_by_zero` gadget error.
        template<typename FieldT>
        llvm::Expected<constrained_value<FieldT>>
            enforce_integer_div(r1cs::constraint_system<FieldT> &cs,
                                const integer<FieldT> &left, const integer<FieldT> &right) {
            return detail::enforce_integer_binary(
                cs, left, right, "/", [](auto &cs, const auto &lhs, const auto &rhs, const std::string &annotation) {
                    return std::decay_t<decltype(lhs)>::div(cs, lhs, rhs, annotation);
                });
        }

        template<typename FieldT>
        llvm::Expected<constrained_value<FieldT>>
            enforce_integer_pow(r1cs::constraint_system<FieldT> &cs,
                                const integer<FieldT> &left, const integer<FieldT> &right) {
            return detail::enforce_integer_binary(
                cs, left, right, "**", [](auto &cs, const auto &lhs, const auto &rhs, const std::string &annotation) {
                    return std::decay_t<decltype(lhs)>::pow(cs, lhs, rhs, annotation);
                });
        }

        template<typename FieldT>
        llvm::Expected<constrained_value<FieldT>>
            enforce_integer_is_equal(r1cs::constraint_system<FieldT> &cs,
                                     const integer<FieldT> &left,
                                     const integer<FieldT> &right) {
            return detail::enforce_integer_predicate(
                cs, left, right, "==", [](auto &cs, const auto &lhs, const auto &rhs, const std::string &annotation) {
                    return std::decay_t<decltype(lhs)>::is_equal(cs, lhs, rhs, annotation);
                });
        }

        template<typename FieldT>
        llvm::Expected<constrained_value<FieldT>>
            enforce_integer_lt(r1cs::constraint_system<FieldT> &cs,
                               const integer<FieldT> &left, const integer<FieldT> &right) {
            return detail::enforce_integer_predicate(
                cs, left, right, "<", [](auto &cs, const auto &lhs, const auto &rhs, const std::string &annotation) {
                    return std::decay_t<decltype(lhs)>::less_than(cs, lhs, rhs, annotation);
                });
        }

        template<typename FieldT>
        llvm::Expected<constrained_value<FieldT>>
            enforce_integer_le(r1cs::constraint_system<FieldT> &cs,
                               const integer<FieldT> &left, const integer<FieldT> &right) {
            return detail::enforce_integer_predicate(
                cs, left, right, "<=", [](auto &cs, const auto &lhs, const auto &rhs, const std::string &annotation) {
                    return std::decay_t<decltype(lhs)>::less_or_equal(cs, lhs, rhs, annotation);
                });
        }

        template<typename FieldT>
        llvm::Expected<constrained_value<FieldT>>
            enforce_integer_gt(r1cs::constraint_system<FieldT> &cs,
                               const integer<FieldT> &left, const integer<FieldT> &right) {
            return detail::enforce_integer_predicate(
                cs, left, right, ">", [](auto &cs, const auto &lhs, const auto &rhs, const std::string &annotation) {
                    return std::decay_t<decltype(lhs)>::less_than(cs, rhs, lhs, annotation);
                });
        }

        template<typename FieldT>
        llvm::Expected<constrained_value<FieldT>>
            enforce_integer_ge(r1cs::constraint_system<FieldT> &cs,
                               const integer<FieldT> &left, const integer<FieldT> &right) {
            return detail::enforce_integer_predicate(
                cs, left, right, ">=", [](auto &cs, const auto &lhs, const auto &rhs, const std::string &annotation) {
                    return std::decay_t<decltype(lhs)>::less_or_equal(cs, rhs, lhs, annotation);
                });
        }

        template<typename FieldT>
        llvm::Expected<constrained_value<FieldT>>
            conditionally_select_integer(r1cs::constraint_system<FieldT> &cs,
                                         const gadgets::boolean<FieldT> &cond,
                                         const integer<FieldT> &first,
                                         const integer<FieldT> &second) {
            using result_type = llvm::Expected<constrained_value<FieldT>>;
            return std::visit(
                [&](const auto &lhs, const auto &rhs) -> result_type {
                    using lhs_type = std::decay_t<decltype(lhs)>;
                    if constexpr (std::is_same_v<lhs_type, std::decay_t<decltype(rhs)>>) {
                        return constrained_value<FieldT>(
                            lhs_type::select(cs, cond, lhs, rhs, to_string(first.get_type()) + " select"));
                    } else {
                        return llvm::make_error<integer_error>(integer_error_kind::cannot_enforce,
                                                               cond.to_string() + " ? " + first.to_string() + " : " +
                                                                   second.to_string());
                    }
                },
                first.get(), second.get());
        }

        /**
         * @brief Allocate a main function parameter of integer type.
         *
         * Without `value` the witness is free; with it the witness is assigned and bound to the
         * literal, which must be an integer literal of exactly the declared width.
         */
        template<typename FieldT>
        llvm::Expected<constrained_value<FieldT>>
            integer_from_parameter(r1cs::constraint_system<FieldT> &cs, const input_model &model,
                                   const std::optional<input_value> &value) {
            if (!model.parameter_type.is_integer()) {
                return llvm::make_error<integer_error>(integer_error_kind::invalid_type,
                                                       model.parameter_type.to_string());
            }
            integer_type declared = model.parameter_type.get_integer_type();
            std::optional<llvm::APInt> literal;
            if (value) {
                const integer_literal *int_literal = value->as_integer();
                if (int_literal == nullptr || int_literal->type != declared) {
                    return llvm::make_error<integer_error>(integer_error_kind::invalid_integer,
                                                           to_string(declared) + ", got " + value->to_string());
                }
                literal = int_literal->value;
            }
            return constrained_value<FieldT>(
                integer<FieldT>::from_input(cs, declared, literal, model.name, model.is_private));
        }

    }    // namespace circuitgen
}    // namespace nil

#endif    // CIRCUITGEN_INCLUDE_NIL_CIRCUITGEN_INTEGER_HPP_
