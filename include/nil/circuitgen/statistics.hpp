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
#ifndef CIRCUITGEN_INCLUDE_NIL_CIRCUITGEN_STATISTICS_HPP_
#define CIRCUITGEN_INCLUDE_NIL_CIRCUITGEN_STATISTICS_HPP_

#include <cstddef>
#include <iostream>
#include <map>
#include <ostream>
#include <string>

namespace nil {
    namespace circuitgen {

        struct operation_statistics {
            std::size_t calls = 0;
            std::size_t constraints = 0;
            std::size_t variables = 0;
        };

        /// @brief Per-operation usage of the constraint system, keyed by names like "u8 +".
        struct constraint_statistics {

            std::map<std::string, operation_statistics> operations;

            void add_record(const std::string &name, std::size_t constraints, std::size_t variables) {
                operation_statistics &record = operations[name];
                record.calls++;
                record.constraints += constraints;
                record.variables += variables;
            }

            std::size_t total_constraints() const {
                std::size_t total = 0;
                for (const auto &[name, operation] : operations) {
                    total += operation.constraints;
                }
                return total;
            }

            void print(std::ostream &os = std::cout) const {
                os << "================\n";
                os << "statistics:\n";
                os << "total constraints amount estimation: " << total_constraints() << "\n";
                os << "________________\n";

                for (const auto &[name, operation] : operations) {
                    os << "operation: " << name << "\n";
                    os << "operation was used " << operation.calls << " times\n";
                    os << "constraints amount: " << operation.constraints << "\n";
                    os << "variables amount:   " << operation.variables << "\n";
                    os << "________________\n";
                }
                os << std::endl;
            }
        };
    }    // namespace circuitgen
}    // namespace nil

#endif    // CIRCUITGEN_INCLUDE_NIL_CIRCUITGEN_STATISTICS_HPP_
