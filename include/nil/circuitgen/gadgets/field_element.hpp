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
// @file This file defines the native field element gadget.
//---------------------------------------------------------------------------//

#ifndef CIRCUITGEN_INCLUDE_NIL_CIRCUITGEN_GADGETS_FIELD_ELEMENT_HPP_
#define CIRCUITGEN_INCLUDE_NIL_CIRCUITGEN_GADGETS_FIELD_ELEMENT_HPP_

#include <nil/circuitgen/errors.hpp>
#include <nil/circuitgen/gadgets/arithmetic.hpp>
#include <nil/circuitgen/gadgets/boolean.hpp>
#include <nil/circuitgen/r1cs/constraint_system.hpp>

#include <optional>
#include <string>

namespace nil {
    namespace circuitgen {
        namespace gadgets {

            template<typename FieldT>
            class field_element {
            public:
                using value_type = FieldT;
                using lc_type = r1cs::linear_combination<FieldT>;
                using cs_type = r1cs::constraint_system<FieldT>;
                using variable_type = r1cs::variable<FieldT>;
                using boolean_type = boolean<FieldT>;

                static field_element constant(const value_type &value) {
                    return field_element(r1cs::constant(value), value);
                }

                static field_element alloc(cs_type &cs, const std::optional<value_type> &value,
                                           const std::string &annotation, bool is_private = true) {
                    variable_type var = is_private ? cs.allocate_witness(value, annotation) :
                                                     cs.allocate_input(value, annotation);
                    return field_element(var, value);
                }

                static field_element from_input(cs_type &cs, const std::optional<value_type> &value,
                                                const std::string &annotation, bool is_private = true) {
                    field_element result = alloc(cs, value, annotation, is_private);
                    if (value) {
                        cs.enforce(result.wire, r1cs::one<FieldT>(), r1cs::constant(*value), annotation + " literal");
                    }
                    return result;
                }

                const lc_type &lc() const {
                    return wire;
                }

                const std::optional<value_type> &get_value() const {
                    return value;
                }

                bool is_constant() const {
                    return r1cs::is_constant(wire);
                }

                std::string to_string() const {
                    if (!value) {
                        return "[allocated field]";
                    }
                    return field_to_string<FieldT>(*value) + "field";
                }

                static field_element add(const field_element &a, const field_element &b) {
                    return field_element(a.wire + b.wire, combine(a.value, b.value, [](const value_type &x,
                                                                                      const value_type &y) {
                                             return x + y;
                                         }));
                }

                static field_element sub(const field_element &a, const field_element &b) {
                    return field_element(a.wire - b.wire, combine(a.value, b.value, [](const value_type &x,
                                                                                      const value_type &y) {
                                             return x - y;
                                         }));
                }

                static field_element mul(cs_type &cs, const field_element &a, const field_element &b,
                                         const std::string &annotation) {
                    return field_element(multiply(cs, a.wire, b.wire, annotation),
                                         combine(a.value, b.value, [](const value_type &x, const value_type &y) {
                                             return x * y;
                                         }));
                }

                /// @brief `a / b` through an inverse witness constrained by `b * inv = 1`.
                static llvm::Expected<field_element> div(cs_type &cs, const field_element &a, const field_element &b,
                                                         const std::string &annotation) {
                    if (b.value && b.value->is_zero()) {
                        return llvm::make_error<gadget_error>(gadget_error_kind::division_by_zero,
                                                              a.to_string() + " / " + b.to_string());
                    }
                    if (b.is_constant()) {
                        value_type inverse = b.value->inverse();
                        return field_element(a.wire * inverse, combine(a.value, b.value, [&inverse](
                                                                                             const value_type &x,
                                                                                             const value_type &) {
                                                 return x * inverse;
                                             }));
                    }
                    std::optional<value_type> inverse;
                    if (b.value) {
                        inverse = b.value->inverse();
                    }
                    variable_type inv = cs.allocate_witness(inverse, annotation + " inverse");
                    cs.enforce(b.wire, inv, r1cs::one<FieldT>(), annotation + " inverse");
                    return mul(cs, a, field_element(inv, inverse), annotation);
                }

                static llvm::Error enforce_equal(cs_type &cs, const field_element &a, const field_element &b,
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

                static boolean_type is_equal(cs_type &cs, const field_element &a, const field_element &b,
                                             const std::string &annotation) {
                    return boolean_type::is_zero(cs, a.wire - b.wire, annotation);
                }

                static field_element select(cs_type &cs, const boolean_type &cond, const field_element &x,
                                            const field_element &y, const std::string &annotation) {
                    std::optional<value_type> result;
                    if (cond.get_value()) {
                        result = *cond.get_value() ? x.value : y.value;
                    }
                    return field_element(conditionally_select(cs, cond.lc(), x.wire, y.wire, annotation), result);
                }

            private:
                field_element(const lc_type &wire, const std::optional<value_type> &value) :
                    wire(wire), value(value) {
                }

                template<typename Op>
                static std::optional<value_type> combine(const std::optional<value_type> &x,
                                                         const std::optional<value_type> &y, Op op) {
                    if (!x || !y) {
                        return std::nullopt;
                    }
                    return op(*x, *y);
                }

                lc_type wire;
                std::optional<value_type> value;
            };

        }    // namespace gadgets
    }        // namespace circuitgen
}    // namespace nil

#endif    // CIRCUITGEN_INCLUDE_NIL_CIRCUITGEN_GADGETS_FIELD_ELEMENT_HPP_
