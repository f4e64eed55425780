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
// @file This file defines the fixed-width unsigned integer gadget.
//---------------------------------------------------------------------------//

#ifndef CIRCUITGEN_INCLUDE_NIL_CIRCUITGEN_GADGETS_UINT_HPP_
#define CIRCUITGEN_INCLUDE_NIL_CIRCUITGEN_GADGETS_UINT_HPP_

#include <libsnark/gadgetlib1/gadgets/basic_gadgets.hpp>
#include <libsnark/gadgetlib1/pb_variable.hpp>
#include <llvm/ADT/APInt.h>

#include <nil/circuitgen/errors.hpp>
#include <nil/circuitgen/gadgets/arithmetic.hpp>
#include <nil/circuitgen/gadgets/boolean.hpp>
#include <nil/circuitgen/r1cs/constraint_system.hpp>
#include <nil/circuitgen/types.hpp>

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace nil {
    namespace circuitgen {
        namespace gadgets {

            /**
             * @brief Unsigned integer of `Bits` bits, stored as booleans least significant bit first.
             *
             * Addition, subtraction, multiplication and exponentiation wrap modulo `2^Bits`.
             * Division truncates and fails on a divisor known to be zero.
             *
             * Products are computed over half-width limbs, so every intermediate sum stays below
             * `2^(3 * Bits / 2 + 2)`. Decompositions wider than the field capacity are rejected.
             */
            template<typename FieldT, unsigned Bits>
            class uint_gadget {
                static_assert(Bits % 2 == 0, "integer width must be even");

            public:
                using value_type = FieldT;
                using lc_type = r1cs::linear_combination<FieldT>;
                using cs_type = r1cs::constraint_system<FieldT>;
                using variable_type = r1cs::variable<FieldT>;
                using boolean_type = boolean<FieldT>;

                static constexpr unsigned width = Bits;

                static uint_gadget constant(const llvm::APInt &value) {
                    llvm::APInt resized = value.zextOrTrunc(Bits);
                    std::vector<boolean_type> bits;
                    bits.reserve(Bits);
                    for (unsigned i = 0; i < Bits; ++i) {
                        bits.push_back(boolean_type::constant(resized[i]));
                    }
                    return uint_gadget(std::move(bits));
                }

                /// @brief Allocate `Bits` boolean witnesses, assigned from `value` when it is known.
                static uint_gadget alloc(cs_type &cs, const std::optional<llvm::APInt> &value,
                                         const std::string &annotation, bool is_private = true) {
                    std::vector<boolean_type> bits;
                    bits.reserve(Bits);
                    for (unsigned i = 0; i < Bits; ++i) {
                        std::optional<bool> bit;
                        if (value) {
                            bit = value->zextOrTrunc(Bits)[i];
                        }
                        bits.push_back(
                            boolean_type::alloc(cs, bit, annotation + " bit " + std::to_string(i), is_private));
                    }
                    return uint_gadget(std::move(bits));
                }

                /**
                 * @brief Allocate a main function input.
                 *
                 * With a literal the packed witness is additionally bound to it by one constraint,
                 * without one the witness is free.
                 */
                static uint_gadget from_input(cs_type &cs, const std::optional<llvm::APInt> &value,
                                              const std::string &annotation, bool is_private = true) {
                    uint_gadget result = alloc(cs, value, annotation, is_private);
                    if (value) {
                        cs.enforce(result.packed(), r1cs::one<FieldT>(),
                                   r1cs::constant(field_from_apint<FieldT>(value->zextOrTrunc(Bits))),
                                   annotation + " literal");
                    }
                    return result;
                }

                const std::vector<boolean_type> &get_bits() const {
                    return bits;
                }

                std::optional<llvm::APInt> get_value() const {
                    llvm::APInt result(Bits, 0);
                    for (unsigned i = 0; i < Bits; ++i) {
                        auto bit = bits[i].get_value();
                        if (!bit) {
                            return std::nullopt;
                        }
                        if (*bit) {
                            result.setBit(i);
                        }
                    }
                    return result;
                }

                bool is_constant() const {
                    for (const auto &bit : bits) {
                        if (!bit.is_constant()) {
                            return false;
                        }
                    }
                    return true;
                }

                lc_type packed() const {
                    return pack(bits, 0, Bits);
                }

                std::string to_string() const {
                    auto value = get_value();
                    if (!value) {
                        return "[allocated u" + std::to_string(Bits) + "]";
                    }
                    return circuitgen::to_string(*value) + "u" + std::to_string(Bits);
                }

                static llvm::Error enforce_equal(cs_type &cs, const uint_gadget &a, const uint_gadget &b,
                                                 const std::string &annotation) {
                    if (a.is_constant() && b.is_constant()) {
                        if (*a.get_value() != *b.get_value()) {
                            return llvm::make_error<gadget_error>(gadget_error_kind::assertion_failed,
                                                                  a.to_string() + " == " + b.to_string());
                        }
                        return llvm::Error::success();
                    }
                    cs.enforce(a.packed() - b.packed(), r1cs::one<FieldT>(), lc_type(), annotation);
                    return llvm::Error::success();
                }

                static llvm::Expected<uint_gadget> add(cs_type &cs, const uint_gadget &a, const uint_gadget &b,
                                                       const std::string &annotation) {
                    auto a_value = a.get_value();
                    auto b_value = b.get_value();
                    if (a.is_constant() && b.is_constant()) {
                        return constant(*a_value + *b_value);
                    }
                    std::optional<llvm::APInt> sum;
                    if (a_value && b_value) {
                        sum = a_value->zext(Bits + 1) + b_value->zext(Bits + 1);
                    }
                    return truncated(decompose(cs, a.packed() + b.packed(), sum, Bits + 1, annotation));
                }

                /// @brief `a - b` computed as the low bits of `a + 2^Bits - b`.
                static llvm::Expected<uint_gadget> sub(cs_type &cs, const uint_gadget &a, const uint_gadget &b,
                                                       const std::string &annotation) {
                    auto a_value = a.get_value();
                    auto b_value = b.get_value();
                    if (a.is_constant() && b.is_constant()) {
                        return constant(*a_value - *b_value);
                    }
                    std::optional<llvm::APInt> difference;
                    if (a_value && b_value) {
                        difference = a_value->zext(Bits + 1) + llvm::APInt::getOneBitSet(Bits + 1, Bits) -
                                     b_value->zext(Bits + 1);
                    }
                    lc_type target = a.packed() - b.packed() + r1cs::constant(power_of_two<FieldT>(Bits));
                    return truncated(decompose(cs, target, difference, Bits + 1, annotation));
                }

                static llvm::Expected<uint_gadget> mul(cs_type &cs, const uint_gadget &a, const uint_gadget &b,
                                                       const std::string &annotation) {
                    return wrapping_mul(cs, a, b, annotation);
                }

                static llvm::Expected<uint_gadget> div(cs_type &cs, const uint_gadget &a, const uint_gadget &b,
                                                       const std::string &annotation) {
                    auto a_value = a.get_value();
                    auto b_value = b.get_value();
                    if (b_value && b_value->isZero()) {
                        return llvm::make_error<gadget_error>(gadget_error_kind::division_by_zero,
                                                              a.to_string() + " / " + b.to_string());
                    }
                    if (a.is_constant() && b.is_constant()) {
                        return constant(a_value->udiv(*b_value));
                    }

                    std::optional<llvm::APInt> quotient_value;
                    std::optional<llvm::APInt> remainder_value;
                    if (a_value && b_value) {
                        quotient_value = a_value->udiv(*b_value);
                        remainder_value = a_value->urem(*b_value);
                    }
                    uint_gadget quotient = alloc(cs, quotient_value, annotation + " quotient");
                    uint_gadget remainder = alloc(cs, remainder_value, annotation + " remainder");

                    // quotient * b + remainder = a, with no wraparound of the product
                    limb_product product = multiply_limbs(cs, quotient, b, annotation);
                    cs.enforce(product.high_lhs, product.high_rhs, lc_type(), annotation + " high limbs");
                    cs.enforce(product.low + remainder.packed(), r1cs::one<FieldT>(), a.packed(), annotation);

                    boolean_type bounded = less_than(cs, remainder, b, annotation + " remainder bound");
                    cs.enforce(bounded.lc(), r1cs::one<FieldT>(), r1cs::one<FieldT>(), annotation + " remainder bound");
                    return quotient;
                }

                /// @brief Square-and-multiply over the exponent bits, wrapping modulo `2^Bits`.
                static llvm::Expected<uint_gadget> pow(cs_type &cs, const uint_gadget &base,
                                                       const uint_gadget &exponent, const std::string &annotation) {
                    unsigned steps = Bits;
                    if (exponent.is_constant()) {
                        steps = exponent.get_value()->getActiveBits();
                    }
                    uint_gadget result = constant(llvm::APInt(Bits, 1));
                    uint_gadget power = base;
                    for (unsigned i = 0; i < steps; ++i) {
                        std::string step = annotation + " step " + std::to_string(i);
                        const boolean_type &bit = exponent.bits[i];
                        if (bit.is_constant()) {
                            if (*bit.get_value()) {
                                result = wrapping_mul(cs, result, power, step);
                            }
                        } else {
                            uint_gadget product = wrapping_mul(cs, result, power, step);
                            result = select(cs, bit, product, result, step + " select");
                        }
                        if (i + 1 < steps) {
                            power = wrapping_mul(cs, power, power, step + " square");
                        }
                    }
                    return result;
                }

                static boolean_type is_equal(cs_type &cs, const uint_gadget &a, const uint_gadget &b,
                                             const std::string &annotation) {
                    return boolean_type::is_zero(cs, a.packed() - b.packed(), annotation);
                }

                /// @brief `a < b` through libsnark's comparison of the packed values.
                static boolean_type less_than(cs_type &cs, const uint_gadget &a, const uint_gadget &b,
                                              const std::string &annotation) {
                    return compare(cs, a, b, annotation).first;
                }

                /// @brief `a <= b`.
                static boolean_type less_or_equal(cs_type &cs, const uint_gadget &a, const uint_gadget &b,
                                                  const std::string &annotation) {
                    return compare(cs, a, b, annotation).second;
                }

                static uint_gadget select(cs_type &cs, const boolean_type &cond, const uint_gadget &x,
                                          const uint_gadget &y, const std::string &annotation) {
                    if (cond.is_constant()) {
                        return *cond.get_value() ? x : y;
                    }
                    std::vector<boolean_type> bits;
                    bits.reserve(Bits);
                    for (unsigned i = 0; i < Bits; ++i) {
                        bits.push_back(boolean_type::select(cs, cond, x.bits[i], y.bits[i],
                                                            annotation + " bit " + std::to_string(i)));
                    }
                    return uint_gadget(std::move(bits));
                }

            private:
                static constexpr unsigned half = Bits / 2;
                static constexpr unsigned limb_product_bits = 3 * half + 2;

                struct limb_product {
                    lc_type low;
                    lc_type high_lhs;
                    lc_type high_rhs;
                };

                explicit uint_gadget(std::vector<boolean_type> bits) : bits(std::move(bits)) {
                    CIRCUITGEN_ASSERT(this->bits.size() == Bits);
                }

                static lc_type pack(const std::vector<boolean_type> &bits, unsigned begin, unsigned end) {
                    lc_type result;
                    value_type coeff = value_type::one();
                    for (unsigned i = begin; i < end; ++i) {
                        result = result + bits[i].lc() * coeff;
                        coeff += coeff;
                    }
                    return result;
                }

                /// @brief Allocate `bit_count` bits of `value` and enforce that they pack to `target`.
                static std::vector<boolean_type> decompose(cs_type &cs, const lc_type &target,
                                                           const std::optional<llvm::APInt> &value,
                                                           unsigned bit_count, const std::string &annotation) {
                    CIRCUITGEN_ASSERT(bit_count < FieldT::capacity());
                    libsnark::pb_variable_array<FieldT> variables;
                    std::vector<boolean_type> bits;
                    bits.reserve(bit_count);
                    for (unsigned i = 0; i < bit_count; ++i) {
                        std::optional<bool> bit;
                        if (value) {
                            bit = (*value)[i];
                        }
                        variables.emplace_back(cs.allocate_witness(
                            bit ? std::optional<value_type>(*bit ? value_type::one() : value_type::zero()) :
                                  std::nullopt,
                            annotation + " bit " + std::to_string(i)));
                        bits.push_back(boolean_type::from_lc(variables.back(), bit));
                    }
                    cs.apply(annotation, value.has_value(), [&variables, &target, &annotation](auto &pb) {
                        libsnark::pb_linear_combination<FieldT> packed;
                        packed.assign(pb, target);
                        libsnark::packing_gadget<FieldT> packing(pb, variables, packed, annotation);
                        packing.generate_r1cs_constraints(true);
                    });
                    return bits;
                }

                /// @brief Pair of `a < b` and `a <= b`.
                static std::pair<boolean_type, boolean_type> compare(cs_type &cs, const uint_gadget &a,
                                                                     const uint_gadget &b,
                                                                     const std::string &annotation) {
                    auto a_value = a.get_value();
                    auto b_value = b.get_value();
                    if (a.is_constant() && b.is_constant()) {
                        return {boolean_type::constant(a_value->ult(*b_value)),
                                boolean_type::constant(a_value->ule(*b_value))};
                    }
                    std::optional<bool> less_value;
                    std::optional<bool> less_or_eq_value;
                    if (a_value && b_value) {
                        less_value = a_value->ult(*b_value);
                        less_or_eq_value = a_value->ule(*b_value);
                    }
                    variable_type less = cs.allocate_witness(to_field(less_value), annotation + " less");
                    variable_type less_or_eq =
                        cs.allocate_witness(to_field(less_or_eq_value), annotation + " less or equal");
                    lc_type a_packed = a.packed();
                    lc_type b_packed = b.packed();
                    bool known = less_value.has_value();
                    cs.apply(annotation, known, [&](auto &pb) {
                        libsnark::pb_linear_combination<FieldT> lhs;
                        libsnark::pb_linear_combination<FieldT> rhs;
                        lhs.assign(pb, a_packed);
                        rhs.assign(pb, b_packed);
                        libsnark::comparison_gadget<FieldT> comparison(pb, Bits, lhs, rhs, less, less_or_eq,
                                                                       annotation);
                        comparison.generate_r1cs_constraints();
                        if (known) {
                            comparison.generate_r1cs_witness();
                        }
                    });
                    return {boolean_type::from_lc(less, less_value),
                            boolean_type::from_lc(less_or_eq, less_or_eq_value)};
                }

                static std::optional<value_type> to_field(std::optional<bool> value) {
                    if (!value) {
                        return std::nullopt;
                    }
                    return *value ? value_type::one() : value_type::zero();
                }

                static uint_gadget truncated(std::vector<boolean_type> bits) {
                    bits.erase(bits.begin() + Bits, bits.end());
                    return uint_gadget(std::move(bits));
                }

                /**
                 * @brief `a * b` split as `low + (a1 * b1) * 2^Bits` where `a = a0 + a1 * 2^half`.
                 *
                 * `low = a0 * b0 + (a0 * b1 + a1 * b0) * 2^half` is materialized, the high
                 * limbs are returned for the caller to constrain.
                 */
                static limb_product multiply_limbs(cs_type &cs, const uint_gadget &a, const uint_gadget &b,
                                                   const std::string &annotation) {
                    lc_type a0 = pack(a.bits, 0, half);
                    lc_type a1 = pack(a.bits, half, Bits);
                    lc_type b0 = pack(b.bits, 0, half);
                    lc_type b1 = pack(b.bits, half, Bits);
                    lc_type low = multiply(cs, a0, b0, annotation + " limbs 0 0");
                    lc_type middle = multiply(cs, a0, b1, annotation + " limbs 0 1") +
                                     multiply(cs, a1, b0, annotation + " limbs 1 0");
                    return limb_product {low + middle * power_of_two<FieldT>(half), a1, b1};
                }

                static std::optional<llvm::APInt> limb_product_value(const std::optional<llvm::APInt> &a,
                                                                     const std::optional<llvm::APInt> &b) {
                    if (!a || !b) {
                        return std::nullopt;
                    }
                    auto limb = [](const llvm::APInt &v, unsigned offset) {
                        return v.extractBits(half, offset).zext(limb_product_bits);
                    };
                    llvm::APInt middle = limb(*a, 0) * limb(*b, half) + limb(*a, half) * limb(*b, 0);
                    return limb(*a, 0) * limb(*b, 0) + middle.shl(half);
                }

                static uint_gadget wrapping_mul(cs_type &cs, const uint_gadget &a, const uint_gadget &b,
                                                const std::string &annotation) {
                    auto a_value = a.get_value();
                    auto b_value = b.get_value();
                    if (a.is_constant() && b.is_constant()) {
                        return constant(*a_value * *b_value);
                    }
                    if (a.is_constant() && a_value->isOne()) {
                        return b;
                    }
                    if (b.is_constant() && b_value->isOne()) {
                        return a;
                    }
                    limb_product product = multiply_limbs(cs, a, b, annotation);
                    return truncated(decompose(cs, product.low, limb_product_value(a_value, b_value),
                                               limb_product_bits, annotation));
                }

                std::vector<boolean_type> bits;
            };

        }    // namespace gadgets
    }        // namespace circuitgen
}    // namespace nil

#endif    // CIRCUITGEN_INCLUDE_NIL_CIRCUITGEN_GADGETS_UINT_HPP_
