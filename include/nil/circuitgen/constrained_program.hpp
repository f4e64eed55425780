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
// @file This file defines the scoped name table of one constraint generation.
//---------------------------------------------------------------------------//

#ifndef CIRCUITGEN_INCLUDE_NIL_CIRCUITGEN_CONSTRAINED_PROGRAM_HPP_
#define CIRCUITGEN_INCLUDE_NIL_CIRCUITGEN_CONSTRAINED_PROGRAM_HPP_

#include <llvm/ADT/MapVector.h>

#include <nil/circuitgen/value.hpp>

#include <map>
#include <set>
#include <string>
#include <utility>

namespace nil {
    namespace circuitgen {

        inline std::string new_scope(const std::string &outer, const std::string &inner) {
            return outer + "::" + inner;
        }

        /**
         * @brief Mapping from scope-qualified names to values, iterated in insertion order.
         *
         * Names are never removed; storing an existing name replaces its value in place.
         */
        template<typename FieldT>
        class constrained_program {
        public:
            using value_type = constrained_value<FieldT>;
            using table_type =
                llvm::MapVector<std::string, value_type, std::map<std::string, unsigned>>;

            void store(const std::string &name, value_type value) {
                auto it = identifiers.find(name);
                if (it != identifiers.end()) {
                    it->second = std::move(value);
                    return;
                }
                identifiers.insert(std::make_pair(name, std::move(value)));
            }

            const value_type *get(const std::string &name) const {
                auto it = identifiers.find(name);
                if (it == identifiers.end()) {
                    return nullptr;
                }
                return &it->second;
            }

            bool contains(const std::string &name) const {
                return identifiers.count(name) != 0;
            }

            void set_mutable(const std::string &name, bool is_mutable) {
                if (is_mutable) {
                    mutables.insert(name);
                } else {
                    mutables.erase(name);
                }
            }

            bool is_mutable(const std::string &name) const {
                return mutables.count(name) != 0;
            }

            std::size_t size() const {
                return identifiers.size();
            }

            typename table_type::const_iterator begin() const {
                return identifiers.begin();
            }

            typename table_type::const_iterator end() const {
                return identifiers.end();
            }

        private:
            table_type identifiers;
            std::set<std::string> mutables;
        };

    }    // namespace circuitgen
}    // namespace nil

#endif    // CIRCUITGEN_INCLUDE_NIL_CIRCUITGEN_CONSTRAINED_PROGRAM_HPP_
