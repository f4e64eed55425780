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
#ifndef CIRCUITGEN_INCLUDE_NIL_CIRCUITGEN_LOGGER_HPP_
#define CIRCUITGEN_INCLUDE_NIL_CIRCUITGEN_LOGGER_HPP_

#include <boost/format.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>

#include <nil/circuitgen/ast.hpp>

#include <string>
#include <string_view>

namespace nil {
    namespace circuitgen {
        class logger {
            std::string current_scope;
        public:

            logger(boost::log::trivial::severity_level lvl = boost::log::trivial::info) {
                boost::log::core::get()->set_filter(boost::log::trivial::severity >= lvl);
            }

            void set_level(boost::log::trivial::severity_level lvl) {
                boost::log::core::get()->set_filter(boost::log::trivial::severity >= lvl);
            }

            void debug(boost::basic_format<char> formated_debug_message) {
                BOOST_LOG_TRIVIAL(debug) << boost::str(formated_debug_message);
            }

            void debug(std::string_view debug_message) {
                BOOST_LOG_TRIVIAL(debug) << debug_message;
            }

            void log_statement(const std::string &scope, const ast::statement &stmt) {
                if (scope != current_scope) {
                    current_scope = scope;
                    BOOST_LOG_TRIVIAL(debug) << current_scope;
                }
                BOOST_LOG_TRIVIAL(debug) << "\t" << ast::to_string(stmt);
            }
        };
    }    // namespace circuitgen
}    // namespace nil

#endif    // CIRCUITGEN_INCLUDE_NIL_CIRCUITGEN_LOGGER_HPP_
