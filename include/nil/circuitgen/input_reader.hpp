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
#ifndef CIRCUITGEN_INCLUDE_NIL_CIRCUITGEN_INPUT_READER_HPP_
#define CIRCUITGEN_INCLUDE_NIL_CIRCUITGEN_INPUT_READER_HPP_

#include <llvm/ADT/APInt.h>
#include <llvm/ADT/StringRef.h>

#include <nil/circuitgen/ast.hpp>
#include <nil/circuitgen/logger.hpp>
#include <nil/circuitgen/signature_parser.hpp>
#include <nil/circuitgen/types.hpp>

#include <boost/json/src.hpp>

#include <algorithm>
#include <cctype>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace nil {
    namespace circuitgen {

        /**
         * @brief Reader of the positional input of a main function.
         *
         * The input is a JSON array with one element per parameter: `null` for a free witness or
         * a one-key object `{"<signature>": <value>}`. Missing trailing elements are free witnesses.
         */
        class input_reader {
        public:
            input_reader() {
                reset();
            }

            void reset() {
                parameters.clear();
                error.str("");
            }

            bool fill_parameters(const ast::function &function, const boost::json::array &input, logger &log) {
                reset();
                if (input.size() > function.inputs.size()) {
                    log.debug(boost::format("input size: %1%") % input.size());
                    log.debug(boost::format("function.inputs.size(): %1%") % function.inputs.size());
                    error << "Too many values in the input, got " << input.size() << " values for "
                          << function.inputs.size() << " parameters";
                    return false;
                }

                for (std::size_t i = 0; i < input.size(); ++i) {
                    const input_model &model = function.inputs[i];
                    const boost::json::value &input_elem = input[i];
                    if (input_elem.is_null()) {
                        parameters.emplace_back(std::nullopt);
                        continue;
                    }
                    if (!input_elem.is_object()) {
                        error << "Expected JSON object as a part of an input array, got \"" << input_elem << "\"";
                        return false;
                    }
                    const boost::json::object &arg_obj = input_elem.as_object();
                    if (arg_obj.size() != 1) {
                        error << "Input object size must be 1, got \"" << arg_obj << "\"";
                        return false;
                    }
                    std::string signature = std::string(arg_obj.begin()->key());
                    signature_parser sp;
                    if (!sp.parse(signature)) {
                        error << sp.get_error();
                        return false;
                    }
                    if (sp.get_tree().to_type() != model.parameter_type) {
                        error << "Expected " << model.parameter_type.to_string() << " argument for \"" << model.name
                              << "\", got \"" << sp.get_tree() << "\"";
                        return false;
                    }

                    std::optional<input_value> value =
                        process_value(arg_obj.begin()->value(), model.parameter_type);
                    if (!value) {
                        return false;
                    }
                    parameters.emplace_back(std::move(value));
                }
                return true;
            }

            const std::vector<std::optional<input_value>> &get_parameters() const {
                return parameters;
            }

            std::string get_error() const {
                return error.str();
            }

        private:
            std::optional<input_value> process_value(const boost::json::value &value, const type &parameter_type) {
                switch (parameter_type.get_kind()) {
                    case type::kind::integer:
                        return process_int(value, parameter_type.get_integer_type());
                    case type::kind::field_element:
                        return process_field(value);
                    case type::kind::boolean:
                        return process_bool(value);
                }
                CIRCUITGEN_UNREACHABLE("invalid `type::kind` value");
            }

            std::optional<input_value> process_int(const boost::json::value &value, integer_type int_type) {
                unsigned bitness = bit_width(int_type);

                switch (value.kind()) {
                    case boost::json::kind::int64:
                        if (value.as_int64() < 0 || (bitness < 64 && value.as_int64() >> bitness > 0)) {
                            error << "int value " << value.as_int64() << " does not fit into " << bitness << " bits";
                            return std::nullopt;
                        }
                        return input_value::integer(int_type, llvm::APInt(bitness, value.as_int64()));
                    case boost::json::kind::uint64:
                        if (bitness < 64 && value.as_uint64() >> bitness > 0) {
                            error << "uint value " << value.as_uint64() << " does not fit into " << bitness
                                  << " bits";
                            return std::nullopt;
                        }
                        return input_value::integer(int_type, llvm::APInt(bitness, value.as_uint64()));
                    case boost::json::kind::double_:
                        error << "got double value for int argument. Probably the value is too big to be "
                                 "represented as integer. You can put it in \"\" to avoid JSON parser restrictions.";
                        return std::nullopt;
                    case boost::json::kind::string: {
                        std::string decimal(value.as_string());
                        if (!is_decimal(decimal)) {
                            error << "Expected decimal string as an int argument, got \"" << decimal << "\"";
                            return std::nullopt;
                        }
                        unsigned needed = llvm::APInt::getBitsNeeded(decimal, 10);
                        llvm::APInt number(std::max(needed, bitness), decimal, 10);
                        if (number.getActiveBits() > bitness) {
                            error << "value " << decimal << " does not fit into " << bitness
                                  << " bits, try to use other type";
                            return std::nullopt;
                        }
                        return input_value::integer(int_type, number.trunc(bitness));
                    }
                    default:
                        error << "Expected int or string as an int argument, got \"" << value << "\"";
                        return std::nullopt;
                }
            }

            std::optional<input_value> process_field(const boost::json::value &value) {
                switch (value.kind()) {
                    case boost::json::kind::int64:
                        if (value.as_int64() < 0) {
                            error << "field value " << value.as_int64() << " is negative";
                            return std::nullopt;
                        }
                        return input_value::field(std::to_string(value.as_int64()));
                    case boost::json::kind::uint64:
                        return input_value::field(std::to_string(value.as_uint64()));
                    case boost::json::kind::double_:
                        error << "got double value for field argument. Probably the value is too big to be "
                                 "represented as integer. You can put it in \"\" to avoid JSON parser restrictions.";
                        return std::nullopt;
                    case boost::json::kind::string: {
                        std::string decimal(value.as_string());
                        if (!is_decimal(decimal)) {
                            error << "Expected decimal string as a field value, got \"" << decimal << "\"";
                            return std::nullopt;
                        }
                        return input_value::field(decimal);
                    }
                    default:
                        error << "Expected int or string as a field value, got \"" << value << "\"";
                        return std::nullopt;
                }
            }

            std::optional<input_value> process_bool(const boost::json::value &value) {
                if (!value.is_bool()) {
                    error << "Expected true or false as a bool value, got \"" << value << "\"";
                    return std::nullopt;
                }
                return input_value::boolean(value.as_bool());
            }

            static bool is_decimal(const std::string &str) {
                const std::size_t buflen = 256;
                return !str.empty() && str.size() < buflen &&
                       std::all_of(str.begin(), str.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
            }

            std::vector<std::optional<input_value>> parameters;
            std::ostringstream error;
        };
    }    // namespace circuitgen
}    // namespace nil

#endif    // CIRCUITGEN_INCLUDE_NIL_CIRCUITGEN_INPUT_READER_HPP_
