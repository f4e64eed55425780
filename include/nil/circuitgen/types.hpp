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
// @file This file defines static types of main function parameters and the
// literal input values supplied for them.
//---------------------------------------------------------------------------//

#ifndef CIRCUITGEN_INCLUDE_NIL_CIRCUITGEN_TYPES_HPP_
#define CIRCUITGEN_INCLUDE_NIL_CIRCUITGEN_TYPES_HPP_

#include <llvm/ADT/APInt.h>
#include <llvm/ADT/SmallString.h>

#include <nil/circuitgen/errors.hpp>

#include <cstdint>
#include <string>
#include <utility>
#include <variant>

namespace nil {
    namespace circuitgen {

        /// @brief Fixed-width unsigned integer types of the language.
        enum class integer_type {
            u8,
            u16,
            u32,
            u64,
            u128,
        };

        inline unsigned bit_width(integer_type type) {
            switch (type) {
                case integer_type::u8:
                    return 8;
                case integer_type::u16:
                    return 16;
                case integer_type::u32:
                    return 32;
                case integer_type::u64:
                    return 64;
                case integer_type::u128:
                    return 128;
            }
            CIRCUITGEN_UNREACHABLE("invalid `integer_type` value");
        }

        inline std::string to_string(integer_type type) {
            return "u" + std::to_string(bit_width(type));
        }

        /// @brief Decimal rendering of an unsigned fixed-width value.
        inline std::string to_string(const llvm::APInt &value) {
            llvm::SmallString<40> str;
            value.toString(str, 10, false);
            return std::string(str.str());
        }

        class type {
        public:
            enum class kind {
                integer,
                field_element,
                boolean,
            };

            static type integer(integer_type int_type) {
                return type(kind::integer, int_type);
            }

            static type field_element() {
                return type(kind::field_element, integer_type::u8);
            }

            static type boolean() {
                return type(kind::boolean, integer_type::u8);
            }

            kind get_kind() const {
                return type_kind;
            }

            bool is_integer() const {
                return type_kind == kind::integer;
            }

            integer_type get_integer_type() const {
                CIRCUITGEN_ASSERT_MSG(is_integer(), "not an integer type");
                return int_type;
            }

            std::string to_string() const {
                switch (type_kind) {
                    case kind::integer:
                        return circuitgen::to_string(int_type);
                    case kind::field_element:
                        return "field";
                    case kind::boolean:
                        return "bool";
                }
                CIRCUITGEN_UNREACHABLE("invalid `type::kind` value");
            }

            bool operator==(const type &other) const {
                if (type_kind != other.type_kind) {
                    return false;
                }
                return type_kind != kind::integer || int_type == other.int_type;
            }

            bool operator!=(const type &other) const {
                return !(*this == other);
            }

        private:
            type(kind type_kind, integer_type int_type) : type_kind(type_kind), int_type(int_type) {
            }

            kind type_kind;
            integer_type int_type;
        };

        /// @brief `value` as an integer of `type`; values that do not fit are `invalid_integer`.
        inline llvm::Expected<llvm::APInt> integer_bits(integer_type type, std::uint64_t value) {
            unsigned bitness = bit_width(type);
            if (bitness < 64 && value >> bitness != 0) {
                return llvm::make_error<integer_error>(integer_error_kind::invalid_integer,
                                                       std::to_string(value) + " does not fit into " +
                                                           std::to_string(bitness) + " bits");
            }
            return llvm::APInt(bitness, value);
        }

        /// @brief Integer literal. The bit width of `value` always matches `type`.
        struct integer_literal {
            integer_type type;
            llvm::APInt value;
        };

        /// @brief Field literal as a decimal string; range is checked when it is allocated.
        struct field_literal {
            std::string value;
        };

        struct boolean_literal {
            bool value;
        };

        /// @brief Caller-supplied value for one parameter of the main function.
        class input_value {
        public:
            static llvm::Expected<input_value> integer(integer_type type, std::uint64_t value) {
                auto bits = integer_bits(type, value);
                if (!bits) {
                    return bits.takeError();
                }
                return input_value(integer_literal {type, std::move(*bits)});
            }

            static input_value integer(integer_type type, const llvm::APInt &value) {
                CIRCUITGEN_ASSERT(value.getBitWidth() == bit_width(type));
                return input_value(integer_literal {type, value});
            }

            static input_value field(std::string decimal) {
                return input_value(field_literal {std::move(decimal)});
            }

            static input_value boolean(bool value) {
                return input_value(boolean_literal {value});
            }

            const integer_literal *as_integer() const {
                return std::get_if<integer_literal>(&value);
            }

            const field_literal *as_field() const {
                return std::get_if<field_literal>(&value);
            }

            const boolean_literal *as_boolean() const {
                return std::get_if<boolean_literal>(&value);
            }

            std::string to_string() const {
                if (auto integer = as_integer()) {
                    return circuitgen::to_string(integer->value) + circuitgen::to_string(integer->type);
                }
                if (auto field = as_field()) {
                    return field->value + "field";
                }
                return std::get<boolean_literal>(value).value ? "true" : "false";
            }

        private:
            using literal_type = std::variant<integer_literal, field_literal, boolean_literal>;

            explicit input_value(literal_type literal) : value(std::move(literal)) {
            }

            literal_type value;
        };

        /// @brief Declared parameter of the main function.
        struct input_model {
            std::string name;
            type parameter_type;
            bool is_private = true;

            std::string to_string() const {
                return name + ": " + parameter_type.to_string();
            }
        };

    }    // namespace circuitgen
}    // namespace nil

#endif    // CIRCUITGEN_INCLUDE_NIL_CIRCUITGEN_TYPES_HPP_
