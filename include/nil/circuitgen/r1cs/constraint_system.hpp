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
// @file This file adapts the libsnark protoboard to the generator: it keeps
// track of which variables carry a known assignment and of the annotation of
// every constraint range.
//---------------------------------------------------------------------------//

#ifndef CIRCUITGEN_INCLUDE_NIL_CIRCUITGEN_R1CS_CONSTRAINT_SYSTEM_HPP_
#define CIRCUITGEN_INCLUDE_NIL_CIRCUITGEN_R1CS_CONSTRAINT_SYSTEM_HPP_

#include <libsnark/gadgetlib1/protoboard.hpp>
#include <libsnark/relations/constraint_satisfaction_problems/r1cs/r1cs.hpp>

#include <nil/circuitgen/errors.hpp>

#include <cstddef>
#include <iterator>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace nil {
    namespace circuitgen {
        namespace r1cs {

            template<typename FieldT>
            using variable = libsnark::pb_variable<FieldT>;

            template<typename FieldT>
            using linear_combination = libsnark::linear_combination<FieldT>;

            template<typename FieldT>
            linear_combination<FieldT> constant(const FieldT &value) {
                return linear_combination<FieldT>(value);
            }

            template<typename FieldT>
            linear_combination<FieldT> one() {
                return linear_combination<FieldT>(FieldT::one());
            }

            /// @brief Whether every term with a non-zero coefficient is the constant one.
            template<typename FieldT>
            bool is_constant(const linear_combination<FieldT> &lc) {
                for (const auto &term : lc.terms) {
                    if (term.index != 0 && !term.coeff.is_zero()) {
                        return false;
                    }
                }
                return true;
            }

            template<typename FieldT>
            bool is_zero(const linear_combination<FieldT> &lc) {
                for (const auto &term : lc.terms) {
                    if (!term.coeff.is_zero()) {
                        return false;
                    }
                }
                return true;
            }

            template<typename FieldT>
            FieldT constant_term(const linear_combination<FieldT> &lc) {
                FieldT result = FieldT::zero();
                for (const auto &term : lc.terms) {
                    if (term.index == 0) {
                        result += term.coeff;
                    }
                }
                return result;
            }

            enum class variable_kind {
                constant,
                input,
                witness,
            };

            /**
             * @brief Protoboard together with the assignment state of its variables.
             *
             * libsnark keeps a value for every variable and starts them at zero. Variables
             * whose value is not determined by the program inputs (free witnesses and
             * everything computed from them) are tracked as unassigned, so witness values are
             * only reported for fully assigned systems.
             *
             * Primary inputs must be allocated before any other variable.
             */
            template<typename FieldT>
            class constraint_system {
            public:
                using value_type = FieldT;
                using variable_type = variable<FieldT>;
                using lc_type = linear_combination<FieldT>;
                using protoboard_type = libsnark::protoboard<FieldT>;

                constraint_system() : assigned {true} {
                }

                constraint_system(const constraint_system &) = delete;
                constraint_system &operator=(const constraint_system &) = delete;

                /// @brief Allocate a primary (public) input variable.
                variable_type allocate_input(const std::optional<value_type> &value, const std::string &annotation) {
                    CIRCUITGEN_ASSERT(pb.num_variables() == pb.num_inputs());
                    variable_type var = allocate(value, annotation);
                    pb.set_input_sizes(pb.num_inputs() + 1);
                    return var;
                }

                /// @brief Allocate an auxiliary (private) witness variable.
                variable_type allocate_witness(const std::optional<value_type> &value, const std::string &annotation) {
                    return allocate(value, annotation);
                }

                void enforce(const lc_type &a, const lc_type &b, const lc_type &c, const std::string &annotation) {
                    regions[pb.num_constraints()] = annotation;
                    pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(a, b, c), annotation);
                }

                /**
                 * @brief Run a libsnark gadget against the underlying protoboard.
                 *
                 * Constraints added by `build` are reported under `annotation`. Variables it
                 * allocates count as assigned iff `known`.
                 */
                template<typename Build>
                void apply(const std::string &annotation, bool known, Build &&build) {
                    regions[pb.num_constraints()] = annotation;
                    build(pb);
                    assigned.resize(pb.num_variables() + 1, known);
                }

                const protoboard_type &protoboard() const {
                    return pb;
                }

                libsnark::r1cs_constraint_system<FieldT> get_constraint_system() const {
                    return pb.get_constraint_system();
                }

                std::size_t num_variables() const {
                    return pb.num_variables();
                }

                std::size_t num_inputs() const {
                    return pb.num_inputs();
                }

                std::size_t num_witnesses() const {
                    return num_variables() - num_inputs();
                }

                std::size_t num_constraints() const {
                    return pb.num_constraints();
                }

                variable_kind kind(const variable_type &var) const {
                    CIRCUITGEN_ASSERT(var.index <= pb.num_variables());
                    if (var.index == 0) {
                        return variable_kind::constant;
                    }
                    return var.index <= pb.num_inputs() ? variable_kind::input : variable_kind::witness;
                }

                std::optional<value_type> value(const variable_type &var) const {
                    CIRCUITGEN_ASSERT(var.index < assigned.size());
                    if (var.index == 0) {
                        return value_type::one();
                    }
                    if (!assigned[var.index]) {
                        return std::nullopt;
                    }
                    return pb.val(var);
                }

                /// @brief Overwrite the assignment of an already allocated variable.
                void assign(const variable_type &var, const value_type &value) {
                    CIRCUITGEN_ASSERT(var.index != 0 && var.index < assigned.size());
                    pb.val(var) = value;
                    assigned[var.index] = true;
                }

                /// @brief Value of `lc`, or nothing if it references an unassigned variable.
                std::optional<value_type> evaluate(const lc_type &lc) const {
                    value_type result = value_type::zero();
                    for (const auto &term : lc.terms) {
                        if (term.coeff.is_zero()) {
                            continue;
                        }
                        if (term.index == 0) {
                            result += term.coeff;
                            continue;
                        }
                        CIRCUITGEN_ASSERT(term.index < assigned.size());
                        if (!assigned[term.index]) {
                            return std::nullopt;
                        }
                        result += term.coeff * pb.val(variable_type(term.index));
                    }
                    return result;
                }

                bool is_fully_assigned() const {
                    for (bool flag : assigned) {
                        if (!flag) {
                            return false;
                        }
                    }
                    return true;
                }

                /**
                 * @brief Find the first constraint which does not hold under the current assignment.
                 *
                 * A constraint referencing an unassigned variable counts as violated.
                 * Returns the annotation of its range, or nothing if every constraint holds.
                 */
                std::optional<std::string> first_unsatisfied() const {
                    const auto constraints = pb.get_constraint_system().constraints;
                    for (std::size_t i = 0; i < constraints.size(); ++i) {
                        auto a = evaluate(constraints[i].a);
                        auto b = evaluate(constraints[i].b);
                        auto c = evaluate(constraints[i].c);
                        if (!a || !b || !c || *a * *b != *c) {
                            auto region = regions.upper_bound(i);
                            CIRCUITGEN_ASSERT(region != regions.begin());
                            return std::prev(region)->second;
                        }
                    }
                    return std::nullopt;
                }

                bool is_satisfied() const {
                    return !first_unsatisfied();
                }

                /// @brief Compare input sizes and constraints, ignoring assignments.
                bool operator==(const constraint_system &other) const {
                    return pb.get_constraint_system() == other.pb.get_constraint_system();
                }

                bool operator!=(const constraint_system &other) const {
                    return !(*this == other);
                }

            private:
                variable_type allocate(const std::optional<value_type> &value, const std::string &annotation) {
                    variable_type var;
                    var.allocate(pb, annotation);
                    assigned.push_back(value.has_value());
                    if (value) {
                        pb.val(var) = *value;
                    }
                    return var;
                }

                protoboard_type pb;
                std::vector<bool> assigned;
                std::map<std::size_t, std::string> regions;
            };

        }    // namespace r1cs
    }        // namespace circuitgen
}    // namespace nil

#endif    // CIRCUITGEN_INCLUDE_NIL_CIRCUITGEN_R1CS_CONSTRAINT_SYSTEM_HPP_
