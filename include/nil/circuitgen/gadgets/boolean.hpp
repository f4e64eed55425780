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
// @file This file defines the circuit boolean gadget.
//---------------------------------------------------------------------------//

#ifndef CIRCUITGEN_INCLUDE_NIL_CIRCUITGEN_GADGETS_BOOLEAN_HPP_
#define CIRCUITGEN_INCLUDE_NIL_CIRCUITGEN_GADGETS_BOOLEAN_HPP_

#include <libsnark/gadgetlib1/gadgets/basic_gadgets.hpp>
#include <libsnark/gadgetlib1/pb_variable.hpp>

#include <nil/circuitgen/errors.hpp>
#include <nil/circuitgen/gadgets/arithmetic.hpp>
#include <nil/circuitgen/r1cs/constraint_system.hpp>

#include <optional>
#include <string>

namespace nil {
    namespace circuitgen {
        namespace gadgets {

            /**
             * @brief Boolean wire: a constant, or a linear combination constrained to {0, 1}.
             *
             * All operations fold constants without touching the constraint system.
             */
            template<typename FieldT>
            class boolean {
            public:
                using value_type = FieldT;
                using lc_type = r1cs::linear_combination<FieldT>;
                using cs_type = r1cs::constraint_system<FieldT>;
                using variable_type = r1cs::variable<FieldT>;

                static boolean constant(bool value) {
                    return boolean(value ? r1cs::one<FieldT>() : lc_type(), value);
                }

                static boolean alloc(cs_type &cs, std::optional<bool> value, const std::string &annotation,
                                     bool is_private = true) {
                    std::optional<value_type> assignment;
                    if (value) {
                        assignment = *value ? value_type::one() : value_type::zero();
                    }
                    variable_type var = is_private ? cs.allocate_witness(assignment, annotation) :
                                                     cs.allocate_input(assignment, annotation);
                    cs.apply(annotation + " booleanity", true, [&var, &annotation](auto &pb) {
                        libsnark::generate_boolean_r1cs_constraint<FieldT>(pb, var, annotation + " booleanity");
                    });
                    return boolean(var, value);
                }

                /// @brief Wrap a combination already known to be 0 or 1.
                static boolean from_lc(const lc_type &lc, std::optional<bool> value) {
                    return boolean(lc, value);
                }

                const lc_type &lc() const {
                    return wire;
                }

                std::optional<bool> get_value() const {
                    return value;
                }

                bool is_constant() const {
                    return r1cs::is_constant(wire);
                }

                boolean negate() const {
                    std::optional<bool> negated;
                    if (value) {
                        negated = !*value;
                    }
                    return boolean(r1cs::one<FieldT>() - wire, negated);
                }

                /// @brief `a * b = r`.
                static boolean logical_and(cs_type &cs, const boolean &a, const boolean &b,
                                           const std::string &annotation) {
                    if (a.is_constant()) {
                        return *a.value ? b : constant(false);
                    }
                    if (b.is_constant()) {
                        return *b.value ? a : constant(false);
                    }
                    std::optional<bool> result;
                    if (a.value && b.value) {
                        result = *a.value && *b.value;
                    }
                    variable_type var = cs.allocate_witness(to_field(result), annotation);
                    cs.enforce(a.wire, b.wire, var, annotation);
                    return boolean(var, result);
                }

                /// @brief `(1 - a) * (1 - b) = 1 - r`.
                static boolean logical_or(cs_type &cs, const boolean &a, const boolean &b,
                                          const std::string &annotation) {
                    if (a.is_constant()) {
                        return *a.value ? constant(true) : b;
                    }
                    if (b.is_constant()) {
                        return *b.value ? constant(true) : a;
                    }
                    std::optional<bool> result;
                    if (a.value && b.value) {
                        result = *a.value || *b.value;
                    }
                    variable_type var = cs.allocate_witness(to_field(result), annotation);
                    cs.enforce(r1cs::one<FieldT>() - a.wire, r1cs::one<FieldT>() - b.wire,
                               r1cs::one<FieldT>() - lc_type(var), annotation);
                    return boolean(var, result);
                }

                /// @brief `2a * b = a + b - r`.
                static boolean logical_xor(cs_type &cs, const boolean &a, const boolean &b,
                                           const std::string &annotation) {
                    if (a.is_constant()) {
                        return *a.value ? b.negate() : b;
                    }
                    if (b.is_constant()) {
                        return *b.value ? a.negate() : a;
                    }
                    std::optional<bool> result;
                    if (a.value && b.value) {
                        result = *a.value != *b.value;
                    }
                    variable_type var = cs.allocate_witness(to_field(result), annotation);
                    cs.enforce(a.wire + a.wire, b.wire, a.wire + b.wire - lc_type(var), annotation);
                    return boolean(var, result);
                }

                static boolean select(cs_type &cs, const boolean &cond, const boolean &x, const boolean &y,
                                      const std::string &annotation) {
                    std::optional<bool> result;
                    if (cond.value) {
                        result = *cond.value ? x.value : y.value;
                    }
                    return boolean(conditionally_select(cs, cond.wire, x.wire, y.wire, annotation), result);
                }

                static llvm::Error enforce_equal(cs_type &cs, const boolean &a, const boolean &b,
                                                 const std::string &annotation) {
                    if (a.is_constant() && b.is_constant()) {
                        if (*a.value != *b.value) {
                            return llvm::make_error<gadget_error>(gadget_error_kind::assertion_failed,
                                                                  a.to_string() + " == " + b.to_string());
                        }
                        return llvm::Error::success();
                    }
                    cs.enforce(a.wire - b.wire, r1cs::one<FieldT>(), lc_type(), annotation);
                    return llvm::Error::success();
                }

                /**
                 * @brief Bit which is set iff `diff` evaluates to zero.
                 *
                 * `diff` is bound to a fresh witness whose disjunction is negated.
                 */
                static boolean is_zero(cs_type &cs, const lc_type &diff, const std::string &annotation) {
                    if (r1cs::is_constant(diff)) {
                        return constant(r1cs::constant_term(diff).is_zero());
                    }
                    std::optional<value_type> diff_value = cs.evaluate(diff);
                    std::optional<bool> result;
                    std::optional<value_type> nonzero;
                    if (diff_value) {
                        result = diff_value->is_zero();
                        nonzero = *result ? value_type::zero() : value_type::one();
                    }
                    libsnark::pb_variable_array<FieldT> inputs;
                    inputs.emplace_back(cs.allocate_witness(diff_value, annotation + " difference"));
                    cs.enforce(inputs[0], r1cs::one<FieldT>(), diff, annotation + " difference");
                    variable_type output = cs.allocate_witness(nonzero, annotation + " nonzero");
                    cs.apply(annotation, diff_value.has_value(), [&](auto &pb) {
                        libsnark::disjunction_gadget<FieldT> disjunction(pb, inputs, output, annotation);
                        disjunction.generate_r1cs_constraints();
                        if (diff_value) {
                            disjunction.generate_r1cs_witness();
                        }
                    });
                    return boolean(r1cs::one<FieldT>() - lc_type(output), result);
                }

                std::string to_string() const {
                    if (!value) {
                        return "[allocated bool]";
                    }
                    return *value ? "true" : "false";
                }

            private:
                boolean(const lc_type &wire, std::optional<bool> value) : wire(wire), value(value) {
                }

                static std::optional<value_type> to_field(std::optional<bool> value) {
                    if (!value) {
                        return std::nullopt;
                    }
                    return *value ? value_type::one() : value_type::zero();
                }

                lc_type wire;
                std::optional<bool> value;
            };

        }    // namespace gadgets
    }        // namespace circuitgen
}    // namespace nil

#endif    // CIRCUITGEN_INCLUDE_NIL_CIRCUITGEN_GADGETS_BOOLEAN_HPP_
