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
// @file This file defines the field conversions and the primitive
// multiplication and selection helpers shared by the gadgets.
//---------------------------------------------------------------------------//

#ifndef CIRCUITGEN_INCLUDE_NIL_CIRCUITGEN_GADGETS_ARITHMETIC_HPP_
#define CIRCUITGEN_INCLUDE_NIL_CIRCUITGEN_GADGETS_ARITHMETIC_HPP_

#include <gmpxx.h>
#include <libff/algebra/fields/bigint.hpp>
#include <llvm/ADT/APInt.h>

#include <nil/circuitgen/r1cs/constraint_system.hpp>
#include <nil/circuitgen/types.hpp>

#include <optional>
#include <string>

namespace nil {
    namespace circuitgen {
        namespace gadgets {

            template<typename FieldT>
            mpz_class field_modulus() {
                mpz_class result;
                FieldT::mod.to_mpz(result.get_mpz_t());
                return result;
            }

            /// @brief Reduce a non-negative integer below the modulus into the field.
            template<typename FieldT>
            FieldT field_from_mpz(const mpz_class &number) {
                CIRCUITGEN_ASSERT(number >= 0 && number < field_modulus<FieldT>());
                return FieldT(libff::bigint<FieldT::num_limbs>(number.get_mpz_t()));
            }

            template<typename FieldT>
            FieldT field_from_apint(const llvm::APInt &value) {
                return field_from_mpz<FieldT>(mpz_class(to_string(value), 10));
            }

            template<typename FieldT>
            std::string field_to_string(const FieldT &value) {
                mpz_class number;
                value.as_bigint().to_mpz(number.get_mpz_t());
                return number.get_str(10);
            }

            template<typename FieldT>
            FieldT power_of_two(unsigned exponent) {
                mpz_class result;
                mpz_ui_pow_ui(result.get_mpz_t(), 2, exponent);
                return field_from_mpz<FieldT>(result);
            }

            /**
             * @brief Product of two linear combinations.
             *
             * Scales when either side is constant, otherwise allocates a witness `w`
             * and enforces `x * y = w`.
             */
            template<typename FieldT>
            r1cs::linear_combination<FieldT> multiply(r1cs::constraint_system<FieldT> &cs,
                                                      const r1cs::linear_combination<FieldT> &x,
                                                      const r1cs::linear_combination<FieldT> &y,
                                                      const std::string &annotation) {
                if (r1cs::is_constant(x)) {
                    return y * r1cs::constant_term(x);
                }
                if (r1cs::is_constant(y)) {
                    return x * r1cs::constant_term(y);
                }
                std::optional<FieldT> value;
                auto x_value = cs.evaluate(x);
                auto y_value = cs.evaluate(y);
                if (x_value && y_value) {
                    value = *x_value * *y_value;
                }
                r1cs::variable<FieldT> product = cs.allocate_witness(value, annotation);
                cs.enforce(x, y, product, annotation);
                return product;
            }

            /**
             * @brief `cond ? x : y` for a boolean-valued `cond`.
             *
             * Enforces `cond * (x - y) = r - y`.
             */
            template<typename FieldT>
            r1cs::linear_combination<FieldT> conditionally_select(r1cs::constraint_system<FieldT> &cs,
                                                                  const r1cs::linear_combination<FieldT> &cond,
                                                                  const r1cs::linear_combination<FieldT> &x,
                                                                  const r1cs::linear_combination<FieldT> &y,
                                                                  const std::string &annotation) {
                using lc_type = r1cs::linear_combination<FieldT>;
                if (r1cs::is_constant(cond)) {
                    return r1cs::constant_term(cond).is_zero() ? y : x;
                }
                if (x == y) {
                    return x;
                }
                std::optional<FieldT> value;
                auto cond_value = cs.evaluate(cond);
                if (cond_value) {
                    value = cond_value->is_zero() ? cs.evaluate(y) : cs.evaluate(x);
                }
                r1cs::variable<FieldT> result = cs.allocate_witness(value, annotation);
                cs.enforce(cond, x - y, lc_type(result) - y, annotation);
                return result;
            }

        }    // namespace gadgets
    }        // namespace circuitgen
}    // namespace nil

#endif    // CIRCUITGEN_INCLUDE_NIL_CIRCUITGEN_GADGETS_ARITHMETIC_HPP_
