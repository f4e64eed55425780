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
// @file This file defines equality, arithmetic and input allocation for
// native field elements.
//---------------------------------------------------------------------------//

#ifndef CIRCUITGEN_INCLUDE_NIL_CIRCUITGEN_FIELD_ELEMENT_HPP_
#define CIRCUITGEN_INCLUDE_NIL_CIRCUITGEN_FIELD_ELEMENT_HPP_

#include <gmpxx.h>

#include <nil/circuitgen/errors.hpp>
#include <nil/circuitgen/gadgets/arithmetic.hpp>
#include <nil/circuitgen/gadgets/boolean.hpp>
#include <nil/circuitgen/gadgets/field_element.hpp>
#include <nil/circuitgen/r1cs/constraint_system.hpp>
#include <nil/circuitgen/types.hpp>
#include <nil/circuitgen/value.hpp>

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>

namespace nil {
    namespace circuitgen {

        /**
         * @brief Parse a decimal field literal.
         *
         * The literal must be a non-empty run of digits denoting a value below the field modulus.
         */
        template<typename FieldT>
        llvm::Expected<FieldT> parse_field_literal(const std::string &decimal) {
            const std::size_t buflen = 256;
            bool is_decimal = !decimal.empty() && decimal.size() < buflen &&
                              std::all_of(decimal.begin(), decimal.end(),
                                          [](unsigned char c) { return std::isdigit(c) != 0; });
            if (!is_decimal) {
                return llvm::make_error<field_element_error>(field_element_error_kind::invalid_field,
                                                             "\"" + decimal + "\" is not a decimal number");
            }
            mpz_class number(decimal, 10);
            if (number >= gadgets::field_modulus<FieldT>()) {
                return llvm::make_error<field_element_error>(field_element_error_kind::invalid_field,
                                                             decimal + " does not fit into the field modulus");
            }
            return gadgets::field_from_mpz<FieldT>(number);
        }

        template<typename FieldT>
        llvm::Expected<constrained_value<FieldT>> field_element_from_literal(const std::string &decimal) {
            auto value = parse_field_literal<FieldT>(decimal);
            if (!value) {
                return value.takeError();
            }
            return constrained_value<FieldT>(gadgets::field_element<FieldT>::constant(*value));
        }

        /// @brief Constant folding of `left == right`; both operands must be constants.
        template<typename FieldT>
        llvm::Expected<constrained_value<FieldT>>
            evaluate_field_eq(const gadgets::field_element<FieldT> &left,
                              const gadgets::field_element<FieldT> &right) {
            if (!left.is_constant() || !right.is_constant()) {
                return llvm::make_error<field_element_error>(field_element_error_kind::cannot_evaluate,
                                                             left.to_string() + " == " + right.to_string());
            }
            return constrained_value<FieldT>(
                gadgets::boolean<FieldT>::constant(*left.get_value() == *right.get_value()));
        }

        template<typename FieldT>
        llvm::Error enforce_field_eq(r1cs::constraint_system<FieldT> &cs,
                                     const gadgets::field_element<FieldT> &left,
                                     const gadgets::field_element<FieldT> &right) {
            return gadgets::field_element<FieldT>::enforce_equal(cs, left, right, "field ==");
        }

        template<typename FieldT>
        constrained_value<FieldT>
            enforce_field_is_equal(r1cs::constraint_system<FieldT> &cs,
                                   const gadgets::field_element<FieldT> &left,
                                   const gadgets::field_element<FieldT> &right) {
            return gadgets::field_element<FieldT>::is_equal(cs, left, right, "field ==");
        }

        template<typename FieldT>
        constrained_value<FieldT> enforce_field_add(const gadgets::field_element<FieldT> &left,
                                                                const gadgets::field_element<FieldT> &right) {
            return gadgets::field_element<FieldT>::add(left, right);
        }

        template<typename FieldT>
        constrained_value<FieldT> enforce_field_sub(const gadgets::field_element<FieldT> &left,
                                                                const gadgets::field_element<FieldT> &right) {
            return gadgets::field_element<FieldT>::sub(left, right);
        }

        template<typename FieldT>
        constrained_value<FieldT> enforce_field_mul(r1cs::constraint_system<FieldT> &cs,
                                                                const gadgets::field_element<FieldT> &left,
                                                                const gadgets::field_element<FieldT> &right) {
            return gadgets::field_element<FieldT>::mul(cs, left, right, "field *");
        }

        template<typename FieldT>
        llvm::Expected<constrained_value<FieldT>>
            enforce_field_div(r1cs::constraint_system<FieldT> &cs,
                              const gadgets::field_element<FieldT> &left,
                              const gadgets::field_element<FieldT> &right) {
            auto result = gadgets::field_element<FieldT>::div(cs, left, right, "field /");
            if (!result) {
                return result.takeError();
            }
            return constrained_value<FieldT>(std::move(*result));
        }

        template<typename FieldT>
        constrained_value<FieldT>
            conditionally_select_field(r1cs::constraint_system<FieldT> &cs,
                                       const gadgets::boolean<FieldT> &cond,
                                       const gadgets::field_element<FieldT> &first,
                                       const gadgets::field_element<FieldT> &second) {
            return gadgets::field_element<FieldT>::select(cs, cond, first, second, "field select");
        }

        template<typename FieldT>
        llvm::Expected<constrained_value<FieldT>>
            field_element_from_parameter(r1cs::constraint_system<FieldT> &cs, const input_model &model,
                                         const std::optional<input_value> &value) {
            if (model.parameter_type != type::field_element()) {
                return llvm::make_error<field_element_error>(field_element_error_kind::invalid_type,
                                                             model.parameter_type.to_string());
            }
            std::optional<FieldT> literal;
            if (value) {
                const field_literal *literal_value = value->as_field();
                if (literal_value == nullptr) {
                    return llvm::make_error<field_element_error>(field_element_error_kind::invalid_field,
                                                                 "field, got " + value->to_string());
                }
                auto parsed = parse_field_literal<FieldT>(literal_value->value);
                if (!parsed) {
                    return parsed.takeError();
                }
                literal = *parsed;
            }
            return constrained_value<FieldT>(
                gadgets::field_element<FieldT>::from_input(cs, literal, model.name, model.is_private));
        }

    }    // namespace circuitgen
}    // namespace nil

#endif    // CIRCUITGEN_INCLUDE_NIL_CIRCUITGEN_FIELD_ELEMENT_HPP_
