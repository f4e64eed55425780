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
// @file This file defines the closed set of values a circuit carries during
// constraint generation.
//---------------------------------------------------------------------------//

#ifndef CIRCUITGEN_INCLUDE_NIL_CIRCUITGEN_VALUE_HPP_
#define CIRCUITGEN_INCLUDE_NIL_CIRCUITGEN_VALUE_HPP_

#include <llvm/ADT/APInt.h>

#include <nil/circuitgen/ast.hpp>
#include <nil/circuitgen/errors.hpp>
#include <nil/circuitgen/gadgets/boolean.hpp>
#include <nil/circuitgen/gadgets/field_element.hpp>
#include <nil/circuitgen/gadgets/uint.hpp>
#include <nil/circuitgen/r1cs/constraint_system.hpp>
#include <nil/circuitgen/types.hpp>

#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace nil {
    namespace circuitgen {

        /**
         * @brief Fixed-width integer: one case per width.
         *
         * The wrapped gadget always has exactly the width of its case.
         */
        template<typename FieldT>
        class integer {
        public:
            using u8_type = gadgets::uint_gadget<FieldT, 8>;
            using u16_type = gadgets::uint_gadget<FieldT, 16>;
            using u32_type = gadgets::uint_gadget<FieldT, 32>;
            using u64_type = gadgets::uint_gadget<FieldT, 64>;
            using u128_type = gadgets::uint_gadget<FieldT, 128>;
            using variant_type = std::variant<u8_type, u16_type, u32_type, u64_type, u128_type>;
            using cs_type = r1cs::constraint_system<FieldT>;

            template<unsigned Bits>
            integer(gadgets::uint_gadget<FieldT, Bits> value) : value(std::move(value)) {
            }

            static integer constant(integer_type type, const llvm::APInt &value) {
                switch (type) {
                    case integer_type::u8:
                        return u8_type::constant(value);
                    case integer_type::u16:
                        return u16_type::constant(value);
                    case integer_type::u32:
                        return u32_type::constant(value);
                    case integer_type::u64:
                        return u64_type::constant(value);
                    case integer_type::u128:
                        return u128_type::constant(value);
                }
                CIRCUITGEN_UNREACHABLE("invalid `integer_type` value");
            }

            static integer from_input(cs_type &cs, integer_type type, const std::optional<llvm::APInt> &literal,
                                      const std::string &annotation, bool is_private) {
                switch (type) {
                    case integer_type::u8:
                        return u8_type::from_input(cs, literal, annotation, is_private);
                    case integer_type::u16:
                        return u16_type::from_input(cs, literal, annotation, is_private);
                    case integer_type::u32:
                        return u32_type::from_input(cs, literal, annotation, is_private);
                    case integer_type::u64:
                        return u64_type::from_input(cs, literal, annotation, is_private);
                    case integer_type::u128:
                        return u128_type::from_input(cs, literal, annotation, is_private);
                }
                CIRCUITGEN_UNREACHABLE("invalid `integer_type` value");
            }

            const variant_type &get() const {
                return value;
            }

            integer_type get_type() const {
                return std::visit(
                    [](const auto &gadget) {
                        return type_of_width(std::decay_t<decltype(gadget)>::width);
                    },
                    value);
            }

            std::optional<llvm::APInt> get_value() const {
                return std::visit([](const auto &gadget) { return gadget.get_value(); }, value);
            }

            bool is_constant() const {
                return std::visit([](const auto &gadget) { return gadget.is_constant(); }, value);
            }

            std::string to_string() const {
                return std::visit([](const auto &gadget) { return gadget.to_string(); }, value);
            }

        private:
            static integer_type type_of_width(unsigned width) {
                switch (width) {
                    case 8:
                        return integer_type::u8;
                    case 16:
                        return integer_type::u16;
                    case 32:
                        return integer_type::u32;
                    case 64:
                        return integer_type::u64;
                    case 128:
                        return integer_type::u128;
                }
                CIRCUITGEN_UNREACHABLE("unsupported integer width");
            }

            variant_type value;
        };

        /// @brief Resolved function together with the file scope it was defined in.
        struct function_value {
            ast::function_ptr definition;
            std::string scope;
        };

        template<typename FieldT>
        class constrained_value;

        /// @brief Values produced by a function that returns zero or several values.
        template<typename FieldT>
        struct returns_value {
            std::vector<constrained_value<FieldT>> values;
        };

        /**
         * @brief Runtime value of the circuit. Exactly one case is active and it never changes.
         */
        template<typename FieldT>
        class constrained_value {
        public:
            using boolean_type = gadgets::boolean<FieldT>;
            using integer_value = integer<FieldT>;
            using field_type = gadgets::field_element<FieldT>;
            using returns_type = returns_value<FieldT>;
            using variant_type = std::variant<boolean_type, integer_value, field_type, function_value, returns_type>;

            constrained_value(boolean_type value) : value(std::move(value)) {
            }

            constrained_value(integer_value value) : value(std::move(value)) {
            }

            template<unsigned Bits>
            constrained_value(gadgets::uint_gadget<FieldT, Bits> value) :
                value(integer_value(std::move(value))) {
            }

            constrained_value(field_type value) : value(std::move(value)) {
            }

            constrained_value(function_value value) : value(std::move(value)) {
            }

            constrained_value(returns_type value) : value(std::move(value)) {
            }

            const variant_type &get() const {
                return value;
            }

            const boolean_type *as_boolean() const {
                return std::get_if<boolean_type>(&value);
            }

            const integer_value *as_integer() const {
                return std::get_if<integer_value>(&value);
            }

            const field_type *as_field() const {
                return std::get_if<field_type>(&value);
            }

            const function_value *as_function() const {
                return std::get_if<function_value>(&value);
            }

            const returns_type *as_returns() const {
                return std::get_if<returns_type>(&value);
            }

            /// @brief Static type of a scalar value; functions and return tuples have none.
            std::optional<type> get_type() const {
                if (as_boolean()) {
                    return type::boolean();
                }
                if (auto int_value = as_integer()) {
                    return type::integer(int_value->get_type());
                }
                if (as_field()) {
                    return type::field_element();
                }
                return std::nullopt;
            }

            bool same_kind(const constrained_value &other) const {
                return value.index() == other.value.index();
            }

            bool is_constant() const {
                if (auto bool_value = as_boolean()) {
                    return bool_value->is_constant();
                }
                if (auto int_value = as_integer()) {
                    return int_value->is_constant();
                }
                if (auto field_value = as_field()) {
                    return field_value->is_constant();
                }
                return false;
            }

            std::string to_string() const {
                if (auto bool_value = as_boolean()) {
                    return bool_value->to_string();
                }
                if (auto int_value = as_integer()) {
                    return int_value->to_string();
                }
                if (auto field_value = as_field()) {
                    return field_value->to_string();
                }
                if (auto function = as_function()) {
                    return "function " + function->definition->name;
                }
                std::string result = "(";
                const auto &values = std::get<returns_type>(value).values;
                for (std::size_t i = 0; i < values.size(); ++i) {
                    if (i != 0) {
                        result += ", ";
                    }
                    result += values[i].to_string();
                }
                return result + ")";
            }

        private:
            variant_type value;
        };

    }    // namespace circuitgen
}    // namespace nil

#endif    // CIRCUITGEN_INCLUDE_NIL_CIRCUITGEN_VALUE_HPP_
