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
// @file This file defines typed errors reported by constraint generation and
// the macros used for internal invariant violations.
//---------------------------------------------------------------------------//

#ifndef CIRCUITGEN_INCLUDE_NIL_CIRCUITGEN_ERRORS_HPP_
#define CIRCUITGEN_INCLUDE_NIL_CIRCUITGEN_ERRORS_HPP_

#include <llvm/Support/Error.h>
#include <llvm/Support/raw_ostream.h>

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>

#define CIRCUITGEN_UNREACHABLE(msg) ::nil::circuitgen::unreachable((msg), __FILE__, __LINE__)

#define CIRCUITGEN_ASSERT(expr) ::nil::circuitgen::assert_check((expr), #expr, __FILE__, __LINE__)

#define CIRCUITGEN_ASSERT_MSG(expr, msg) ::nil::circuitgen::assert_check((expr), #expr, __FILE__, __LINE__, (msg))

namespace nil {
    namespace circuitgen {

        [[noreturn]] inline void abort_process() {
            std::abort();
        }

        [[noreturn]] inline void unreachable(const char *msg, const char *filename, unsigned line) {
            std::cerr << "UNREACHABLE at " << filename << ":" << line << std::endl;
            std::cerr << '\t' << msg << std::endl;
            abort_process();
        }

        inline void assert_check(bool expr, const char *expr_str, const char *filename, unsigned line,
                                 const char *msg = "") {
            if (!expr) {
                std::cerr << "Assertion failed at " << filename << ":" << line << ":" << std::endl;
                std::cerr << '\t' << expr_str;
                if (std::strlen(msg) != 0) {
                    std::cerr << " -> " << msg;
                }
                std::cerr << std::endl;
                abort_process();
            }
        }

        enum class integer_error_kind {
            invalid_type,
            invalid_integer,
            cannot_evaluate,
            cannot_enforce,
        };

        enum class boolean_error_kind {
            invalid_type,
            invalid_boolean,
            cannot_evaluate,
            cannot_enforce,
        };

        enum class field_element_error_kind {
            invalid_type,
            invalid_field,
            cannot_evaluate,
            cannot_enforce,
        };

        enum class gadget_error_kind {
            division_by_zero,
            assertion_failed,
        };

        enum class expression_error_kind {
            undefined_identifier,
            incompatible_types,
            not_a_function,
        };

        enum class statement_error_kind {
            type_mismatch,
            undefined_variable,
            immutable_assign,
            assertion_type_mismatch,
            condition_not_boolean,
            condition_not_constant,
            invalid_loop_bounds,
        };

        enum class function_error_kind {
            arguments_length,
            invalid_argument_type,
            return_length,
            return_type,
            recursion_limit,
        };

        enum class import_error_kind {
            unknown_symbol,
            cyclic_import,
        };

        enum class compiler_error_kind {
            no_main,
            no_main_function,
            unsatisfied,
        };

        inline const char *describe(integer_error_kind kind) {
            switch (kind) {
                case integer_error_kind::invalid_type:
                    return "expected integer parameter type";
                case integer_error_kind::invalid_integer:
                    return "expected integer parameter";
                case integer_error_kind::cannot_evaluate:
                    return "cannot evaluate";
                case integer_error_kind::cannot_enforce:
                    return "cannot enforce";
            }
            CIRCUITGEN_UNREACHABLE("invalid `integer_error_kind` value");
        }

        inline const char *describe(boolean_error_kind kind) {
            switch (kind) {
                case boolean_error_kind::invalid_type:
                    return "expected boolean parameter type";
                case boolean_error_kind::invalid_boolean:
                    return "expected boolean parameter";
                case boolean_error_kind::cannot_evaluate:
                    return "cannot evaluate";
                case boolean_error_kind::cannot_enforce:
                    return "cannot enforce";
            }
            CIRCUITGEN_UNREACHABLE("invalid `boolean_error_kind` value");
        }

        inline const char *describe(field_element_error_kind kind) {
            switch (kind) {
                case field_element_error_kind::invalid_type:
                    return "expected field element parameter type";
                case field_element_error_kind::invalid_field:
                    return "expected field element";
                case field_element_error_kind::cannot_evaluate:
                    return "cannot evaluate";
                case field_element_error_kind::cannot_enforce:
                    return "cannot enforce";
            }
            CIRCUITGEN_UNREACHABLE("invalid `field_element_error_kind` value");
        }

        inline const char *describe(gadget_error_kind kind) {
            switch (kind) {
                case gadget_error_kind::division_by_zero:
                    return "division by zero";
                case gadget_error_kind::assertion_failed:
                    return "assertion failed";
            }
            CIRCUITGEN_UNREACHABLE("invalid `gadget_error_kind` value");
        }

        inline const char *describe(expression_error_kind kind) {
            switch (kind) {
                case expression_error_kind::undefined_identifier:
                    return "undefined identifier";
                case expression_error_kind::incompatible_types:
                    return "incompatible types";
                case expression_error_kind::not_a_function:
                    return "not a function";
            }
            CIRCUITGEN_UNREACHABLE("invalid `expression_error_kind` value");
        }

        inline const char *describe(statement_error_kind kind) {
            switch (kind) {
                case statement_error_kind::type_mismatch:
                    return "type mismatch";
                case statement_error_kind::undefined_variable:
                    return "undefined variable";
                case statement_error_kind::immutable_assign:
                    return "cannot assign to immutable variable";
                case statement_error_kind::assertion_type_mismatch:
                    return "assertion operands have different types";
                case statement_error_kind::condition_not_boolean:
                    return "condition is not a boolean";
                case statement_error_kind::condition_not_constant:
                    return "condition must be a constant";
                case statement_error_kind::invalid_loop_bounds:
                    return "invalid loop bounds";
            }
            CIRCUITGEN_UNREACHABLE("invalid `statement_error_kind` value");
        }

        inline const char *describe(function_error_kind kind) {
            switch (kind) {
                case function_error_kind::arguments_length:
                    return "wrong number of arguments";
                case function_error_kind::invalid_argument_type:
                    return "invalid argument type";
                case function_error_kind::return_length:
                    return "wrong number of return values";
                case function_error_kind::return_type:
                    return "invalid return type";
                case function_error_kind::recursion_limit:
                    return "call depth limit exceeded";
            }
            CIRCUITGEN_UNREACHABLE("invalid `function_error_kind` value");
        }

        inline const char *describe(import_error_kind kind) {
            switch (kind) {
                case import_error_kind::unknown_symbol:
                    return "unknown imported symbol";
                case import_error_kind::cyclic_import:
                    return "cyclic import";
            }
            CIRCUITGEN_UNREACHABLE("invalid `import_error_kind` value");
        }

        inline const char *describe(compiler_error_kind kind) {
            switch (kind) {
                case compiler_error_kind::no_main:
                    return "program has no main function";
                case compiler_error_kind::no_main_function:
                    return "main must be a function";
                case compiler_error_kind::unsatisfied:
                    return "constraint system is not satisfied";
            }
            CIRCUITGEN_UNREACHABLE("invalid `compiler_error_kind` value");
        }

        namespace detail {
            /**
             * @brief Common payload of all generation errors: a kind from the category enum
             * and a rendering of the offending values.
             */
            template<typename ErrorType, typename KindType>
            class kinded_error : public llvm::ErrorInfo<ErrorType> {
            public:
                using kind_type = KindType;

                kinded_error(KindType kind, std::string message) : error_kind(kind), text(std::move(message)) {
                }

                KindType kind() const {
                    return error_kind;
                }

                const std::string &details() const {
                    return text;
                }

                void log(llvm::raw_ostream &os) const override {
                    os << ErrorType::category << " error: " << describe(error_kind);
                    if (!text.empty()) {
                        os << ": " << text;
                    }
                }

                std::error_code convertToErrorCode() const override {
                    return llvm::inconvertibleErrorCode();
                }

            private:
                KindType error_kind;
                std::string text;
            };
        }    // namespace detail

        class integer_error : public detail::kinded_error<integer_error, integer_error_kind> {
        public:
            using kinded_error::kinded_error;
            static constexpr const char *category = "integer";
            inline static char ID = 0;
        };

        class boolean_error : public detail::kinded_error<boolean_error, boolean_error_kind> {
        public:
            using kinded_error::kinded_error;
            static constexpr const char *category = "boolean";
            inline static char ID = 0;
        };

        class field_element_error : public detail::kinded_error<field_element_error, field_element_error_kind> {
        public:
            using kinded_error::kinded_error;
            static constexpr const char *category = "field element";
            inline static char ID = 0;
        };

        class gadget_error : public detail::kinded_error<gadget_error, gadget_error_kind> {
        public:
            using kinded_error::kinded_error;
            static constexpr const char *category = "gadget";
            inline static char ID = 0;
        };

        class expression_error : public detail::kinded_error<expression_error, expression_error_kind> {
        public:
            using kinded_error::kinded_error;
            static constexpr const char *category = "expression";
            inline static char ID = 0;
        };

        class statement_error : public detail::kinded_error<statement_error, statement_error_kind> {
        public:
            using kinded_error::kinded_error;
            static constexpr const char *category = "statement";
            inline static char ID = 0;
        };

        class function_error : public detail::kinded_error<function_error, function_error_kind> {
        public:
            using kinded_error::kinded_error;
            static constexpr const char *category = "function";
            inline static char ID = 0;
        };

        class import_error : public detail::kinded_error<import_error, import_error_kind> {
        public:
            using kinded_error::kinded_error;
            static constexpr const char *category = "import";
            inline static char ID = 0;
        };

        class compiler_error : public detail::kinded_error<compiler_error, compiler_error_kind> {
        public:
            using kinded_error::kinded_error;
            static constexpr const char *category = "compiler";
            inline static char ID = 0;
        };

        /**
         * @brief Consume `err` and return its kind if it carries an `ErrorType` payload.
         *
         * Any other payload is consumed as well and yields an empty result.
         */
        template<typename ErrorType>
        std::optional<typename ErrorType::kind_type> error_kind(llvm::Error err) {
            std::optional<typename ErrorType::kind_type> kind;
            llvm::consumeError(llvm::handleErrors(std::move(err), [&kind](const ErrorType &payload) {
                kind = payload.kind();
            }));
            return kind;
        }

    }    // namespace circuitgen
}    // namespace nil

#endif    // CIRCUITGEN_INCLUDE_NIL_CIRCUITGEN_ERRORS_HPP_
