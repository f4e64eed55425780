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
#ifndef CIRCUITGEN_INCLUDE_NIL_CIRCUITGEN_SIGNATURE_PARSER_HPP_
#define CIRCUITGEN_INCLUDE_NIL_CIRCUITGEN_SIGNATURE_PARSER_HPP_

#include <nil/circuitgen/errors.hpp>
#include <nil/circuitgen/types.hpp>

#include <boost/spirit/include/qi.hpp>
#include <boost/phoenix/core.hpp>
#include <boost/phoenix/operator.hpp>
#include <boost/phoenix/object.hpp>

#include <optional>
#include <ostream>
#include <sstream>
#include <string>

namespace nil {
    namespace circuitgen {
        namespace phoenix = boost::phoenix;
        namespace qi = boost::spirit::qi;
        namespace ascii = boost::spirit::ascii;

        /// @brief Kind of element in signature AST.
        enum class json_elem {
            UNDEFINED,
            U8,
            U16,
            U32,
            U64,
            U128,
            FIELD,
            BOOL,
        };

        inline std::ostream &operator<<(std::ostream &os, const json_elem &elem) {
            switch (elem) {
                case json_elem::UNDEFINED:
                    return os << "undefined";
                case json_elem::U8:
                    return os << "u8";
                case json_elem::U16:
                    return os << "u16";
                case json_elem::U32:
                    return os << "u32";
                case json_elem::U64:
                    return os << "u64";
                case json_elem::U128:
                    return os << "u128";
                case json_elem::FIELD:
                    return os << "field";
                case json_elem::BOOL:
                    return os << "bool";
            }
            CIRCUITGEN_UNREACHABLE("invalid `json_elem` value");
        }

        /// @brief Signature AST node.
        struct signature_node {
            /// @brief Kind of node.
            json_elem elem = json_elem::UNDEFINED;

            signature_node() = default;

            signature_node(json_elem elem_) : elem(elem_) {
            }

            /// @brief Parameter type named by the signature, empty for `UNDEFINED`.
            std::optional<type> to_type() const {
                switch (elem) {
                    case json_elem::U8:
                        return type::integer(integer_type::u8);
                    case json_elem::U16:
                        return type::integer(integer_type::u16);
                    case json_elem::U32:
                        return type::integer(integer_type::u32);
                    case json_elem::U64:
                        return type::integer(integer_type::u64);
                    case json_elem::U128:
                        return type::integer(integer_type::u128);
                    case json_elem::FIELD:
                        return type::field_element();
                    case json_elem::BOOL:
                        return type::boolean();
                    case json_elem::UNDEFINED:
                        return std::nullopt;
                }
                CIRCUITGEN_UNREACHABLE("invalid `json_elem` value");
            }
        };

        inline std::ostream &operator<<(std::ostream &os, const signature_node &s) {
            return os << s.elem;
        }

        /// @brief Grammar describing signature syntax.
        template<typename Iterator>
        struct signature_grammar : qi::grammar<Iterator, signature_node(), ascii::space_type> {
            signature_grammar() : signature_grammar::base_type(root, "signature") {
                using qi::_val;
                using qi::lit;

                integer = lit("u128")[_val = signature_node(json_elem::U128)] |
                          lit("u16")[_val = signature_node(json_elem::U16)] |
                          lit("u32")[_val = signature_node(json_elem::U32)] |
                          lit("u64")[_val = signature_node(json_elem::U64)] |
                          lit("u8")[_val = signature_node(json_elem::U8)];

                field = lit("field")[_val = signature_node(json_elem::FIELD)];

                boolean = lit("bool")[_val = signature_node(json_elem::BOOL)];

                type = integer | field | boolean;
                root = type;

                integer.name("integer");
                field.name("field");
                boolean.name("bool");
                type.name("type");
                root.name("root");
            }

            qi::rule<Iterator, signature_node(), ascii::space_type> integer;
            qi::rule<Iterator, signature_node(), ascii::space_type> field;
            qi::rule<Iterator, signature_node(), ascii::space_type> boolean;
            qi::rule<Iterator, signature_node(), ascii::space_type> type;
            qi::rule<Iterator, signature_node(), ascii::space_type> root;
        };

        /// @brief Parser of signature string.
        class signature_parser {
        public:
            /// @brief Parse input string into AST. Return `true` on success.
            bool parse(const std::string &str) {
                error.str("");
                tree = signature_node();
                std::string::const_iterator it = str.begin();
                bool matched = phrase_parse(it, str.end(), grammar, ascii::space, tree);
                if (!matched || it != str.end()) {
                    error << "Unknown signature \"" << str << "\"";
                    return false;
                }
                return true;
            }

            /// @brief Signature AST.
            const signature_node &get_tree() const {
                return tree;
            }

            std::string get_error() const {
                return error.str();
            }

        private:
            signature_grammar<std::string::const_iterator> grammar;
            signature_node tree;
            std::ostringstream error;
        };
    }    // namespace circuitgen
}    // namespace nil

#endif    // CIRCUITGEN_INCLUDE_NIL_CIRCUITGEN_SIGNATURE_PARSER_HPP_
