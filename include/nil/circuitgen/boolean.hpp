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
// @file This file defines equality, logic and input allocation for boolean
// values.
//---------------------------------------------------------------------------//

#ifndef CIRCUITGEN_INCLUDE_NIL_CIRCUITGEN_BOOLEAN_HPP_
#define CIRCUITGEN_INCLUDE_NIL_CIRCUITGEN_BOOLEAN_HPP_

#include <nil/circuitgen/errors.hpp>
#include <nil/circuitgen/gadgets/boolean.hpp>
#include <nil/circuitgen/r1cs/constraint_system.hpp>
#include <nil/circuitgen/types.hpp>
#include <nil/circuitgen/value.hpp>

#include <optional>
#include <string>

namespace nil {
    namespace circuitgen {

        /// @brief Constant folding of `left == right`; both operands must be constants.
        template<typename FieldT>
        llvm::Expected<constrained_value<FieldT>>
            evaluate_boolean_eq(const gadgets::boolean<FieldT> &left,
                                const gadgets::boolean<FieldT> &right) {
            if (!left.is_constant() || !right.is_constant()) {
                return llvm::make_error<boolean_error>(boolean_error_kind::cannot_evaluate,
                                                       left.to_string() + " == " + right.to_string());
            }
            return constrained_value<FieldT>(
                gadgets::boolean<FieldT>::constant(*left.get_value() == *right.get_value()));
        }

        template<typename FieldT>
        llvm::Error enforce_boolean_eq(r1cs::constraint_system<FieldT> &cs,
                                       const gadgets::boolean<FieldT> &left,
                                       const gadgets::boolean<FieldT> &right) {
            return gadgets::boolean<FieldT>::enforce_equal(cs, left, right, "bool ==");
        }

        /// @brief Equality bit of two booleans: `!(left ^ right)`.
        template<typename FieldT>
        constrained_value<FieldT>
            enforce_boolean_is_equal(r1cs::constraint_system<FieldT> &cs,
                                     const gadgets::boolean<FieldT> &left,
                                     const gadgets::boolean<FieldT> &right) {
            return gadgets::boolean<FieldT>::logical_xor(cs, left, right, "bool ==").negate();
        }

        template<typename FieldT>
        llvm::Expected<constrained_value<FieldT>>
            enforce_and(r1cs::constraint_system<FieldT> &cs,
                        const constrained_value<FieldT> &left,
                        const constrained_value<FieldT> &right) {
            auto lhs = left.as_boolean();
            auto rhs = right.as_boolean();
            if (lhs == nullptr || rhs == nullptr) {
                return llvm::make_error<boolean_error>(boolean_error_kind::cannot_enforce,
                                                       left.to_string() + " && " + right.to_string());
            }
            return constrained_value<FieldT>(
                gadgets::boolean<FieldT>::logical_and(cs, *lhs, *rhs, "bool &&"));
        }

        template<typename FieldT>
        llvm::Expected<constrained_value<FieldT>>
            enforce_or(r1cs::constraint_system<FieldT> &cs,
                       const constrained_value<FieldT> &left,
                       const constrained_value<FieldT> &right) {
            auto lhs = left.as_boolean();
            auto rhs = right.as_boolean();
            if (lhs == nullptr || rhs == nullptr) {
                return llvm::make_error<boolean_error>(boolean_error_kind::cannot_enforce,
                                                       left.to_string() + " || " + right.to_string());
            }
            return constrained_value<FieldT>(
                gadgets::boolean<FieldT>::logical_or(cs, *lhs, *rhs, "bool ||"));
        }

        /// @brief `!value`. Negation emits no constraints.
        template<typename FieldT>
        llvm::Expected<constrained_value<FieldT>>
            evaluate_not(const constrained_value<FieldT> &value) {
            auto operand = value.as_boolean();
            if (operand == nullptr) {
                return llvm::make_error<boolean_error>(boolean_error_kind::cannot_evaluate, "!" + value.to_string());
            }
            return constrained_value<FieldT>(operand->negate());
        }

        template<typename FieldT>
        constrained_value<FieldT>
            conditionally_select_boolean(r1cs::constraint_system<FieldT> &cs,
                                         const gadgets::boolean<FieldT> &cond,
                                         const gadgets::boolean<FieldT> &first,
                                         const gadgets::boolean<FieldT> &second) {
            return gadgets::boolean<FieldT>::select(cs, cond, first, second, "bool select");
        }

        template<typename FieldT>
        llvm::Expected<constrained_value<FieldT>>
            boolean_from_parameter(r1cs::constraint_system<FieldT> &cs, const input_model &model,
                                   const std::optional<input_value> &value) {
            if (model.parameter_type != type::boolean()) {
                return llvm::make_error<boolean_error>(boolean_error_kind::invalid_type,
                                                       model.parameter_type.to_string());
            }
            std::optional<bool> literal;
            if (value) {
                const boolean_literal *bool_literal = value->as_boolean();
                if (bool_literal == nullptr) {
                    return llvm::make_error<boolean_error>(boolean_error_kind::invalid_boolean,
                                                           "bool, got " + value->to_string());
                }
                literal = bool_literal->value;
            }
            auto result = gadgets::boolean<FieldT>::alloc(cs, literal, model.name, model.is_private);
            if (literal) {
                cs.enforce(result.lc(), r1cs::one<FieldT>(),
                           gadgets::boolean<FieldT>::constant(*literal).lc(), model.name + " literal");
            }
            return constrained_value<FieldT>(result);
        }

    }    // namespace circuitgen
}    // namespace nil

#endif    // CIRCUITGEN_INCLUDE_NIL_CIRCUITGEN_BOOLEAN_HPP_
