#define BOOST_TEST_MODULE value_test

#include <boost/test/unit_test.hpp>

#include <libff/algebra/curves/alt_bn128/alt_bn128_pp.hpp>

#include <nil/circuitgen/ast.hpp>
#include <nil/circuitgen/boolean.hpp>
#include <nil/circuitgen/constrained_program.hpp>
#include <nil/circuitgen/field_element.hpp>
#include <nil/circuitgen/statistics.hpp>
#include <nil/circuitgen/value.hpp>

#include <sstream>

using namespace nil::circuitgen;
using FieldT = libff::Fr<libff::alt_bn128_pp>;
using cs_type = r1cs::constraint_system<FieldT>;
using value_type = constrained_value<FieldT>;
using boolean_type = gadgets::boolean<FieldT>;
using field_type = gadgets::field_element<FieldT>;
using field_value_type = FieldT;

namespace {
    struct field_parameters {
        field_parameters() {
            libff::alt_bn128_pp::init_public_params();
        }
    };

    value_type take(llvm::Expected<value_type> value) {
        if (!value) {
            BOOST_FAIL(llvm::toString(value.takeError()));
        }
        return std::move(*value);
    }

    template<typename ErrorType>
    std::optional<typename ErrorType::kind_type> failure_kind(llvm::Expected<value_type> value) {
        if (value) {
            return std::nullopt;
        }
        return error_kind<ErrorType>(value.takeError());
    }

    value_type u8_constant(std::uint64_t value) {
        return integer<FieldT>::constant(integer_type::u8, llvm::APInt(8, value));
    }
}    // namespace

BOOST_TEST_GLOBAL_FIXTURE(field_parameters);

BOOST_AUTO_TEST_SUITE(constrained_value_suite)

BOOST_AUTO_TEST_CASE(constrained_value_kinds) {
    value_type flag = boolean_type::constant(true);
    value_type number = u8_constant(7);
    value_type element = field_type::constant(field_value_type(11));

    BOOST_TEST((flag.as_boolean() != nullptr));
    BOOST_TEST((flag.as_integer() == nullptr));
    BOOST_TEST((number.as_integer() != nullptr));
    BOOST_TEST((element.as_field() != nullptr));

    BOOST_TEST((flag.get_type() == type::boolean()));
    BOOST_TEST((number.get_type() == type::integer(integer_type::u8)));
    BOOST_TEST((element.get_type() == type::field_element()));

    BOOST_TEST(!flag.same_kind(number));
    BOOST_TEST(number.same_kind(u8_constant(1)));
    BOOST_TEST(number.is_constant());
}

BOOST_AUTO_TEST_CASE(constrained_value_rendering) {
    cs_type cs;
    BOOST_TEST(u8_constant(7).to_string() == "7u8");
    BOOST_TEST(value_type(boolean_type::constant(false)).to_string() == "false");
    BOOST_TEST(value_type(field_type::constant(field_value_type(11))).to_string() == "11field");
    BOOST_TEST(value_type(field_type::alloc(cs, std::nullopt, "x")).to_string() == "[allocated field]");

    auto definition = std::make_shared<const ast::function>(
        ast::function {"square", {}, {type::integer(integer_type::u8)}, {}});
    value_type callable = function_value {definition, "main"};
    BOOST_TEST(callable.to_string() == "function square");
    BOOST_TEST(!callable.get_type().has_value());

    value_type tuple = returns_value<FieldT> {{u8_constant(1), value_type(boolean_type::constant(true))}};
    BOOST_TEST(tuple.to_string() == "(1u8, true)");
    BOOST_TEST(tuple.as_returns()->values.size() == 2);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(boolean_subsystem_suite)

BOOST_AUTO_TEST_CASE(boolean_logic) {
    cs_type cs;
    value_type a = boolean_type::alloc(cs, true, "a");
    value_type b = boolean_type::alloc(cs, false, "b");
    BOOST_TEST(!*take(enforce_and(cs, a, b)).as_boolean()->get_value());
    BOOST_TEST(*take(enforce_or(cs, a, b)).as_boolean()->get_value());
    BOOST_TEST(*take(evaluate_not(b)).as_boolean()->get_value());
    BOOST_TEST(cs.is_satisfied());
}

BOOST_AUTO_TEST_CASE(boolean_logic_rejects_other_kinds) {
    cs_type cs;
    value_type a = boolean_type::constant(true);
    BOOST_TEST((failure_kind<boolean_error>(enforce_and(cs, a, u8_constant(1))) == boolean_error_kind::cannot_enforce));
    BOOST_TEST((failure_kind<boolean_error>(enforce_or(cs, u8_constant(1), a)) == boolean_error_kind::cannot_enforce));
    BOOST_TEST((failure_kind<boolean_error>(evaluate_not(u8_constant(1))) == boolean_error_kind::cannot_evaluate));
}

BOOST_AUTO_TEST_CASE(boolean_equality) {
    cs_type cs;
    boolean_type a = boolean_type::alloc(cs, true, "a");
    boolean_type b = boolean_type::alloc(cs, true, "b");
    BOOST_TEST(*take(enforce_boolean_is_equal(cs, a, b)).as_boolean()->get_value());
    BOOST_TEST((failure_kind<boolean_error>(evaluate_boolean_eq(a, b)) == boolean_error_kind::cannot_evaluate));
    BOOST_TEST(*take(evaluate_boolean_eq(boolean_type::constant(true), boolean_type::constant(true)))
                    .as_boolean()
                    ->get_value());
    BOOST_TEST(!enforce_boolean_eq(cs, a, b));
    BOOST_TEST(cs.is_satisfied());
}

BOOST_AUTO_TEST_CASE(boolean_parameter) {
    cs_type cs;
    input_model model {"flag", type::boolean()};
    BOOST_TEST((failure_kind<boolean_error>(boolean_from_parameter(cs, model, input_value::field("1"))) ==
                boolean_error_kind::invalid_boolean));
    BOOST_TEST((failure_kind<boolean_error>(boolean_from_parameter(
                    cs, input_model {"x", type::field_element()}, std::nullopt)) == boolean_error_kind::invalid_type));

    value_type free = take(boolean_from_parameter(cs, model, std::nullopt));
    BOOST_TEST(free.to_string() == "[allocated bool]");
    BOOST_TEST(cs.num_constraints() == 1);

    value_type bound = take(boolean_from_parameter(cs, model, input_value::boolean(true)));
    BOOST_TEST(bound.to_string() == "true");
    BOOST_TEST(cs.num_constraints() == 3);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(field_element_subsystem_suite)

BOOST_AUTO_TEST_CASE(field_literals) {
    BOOST_TEST(take(field_element_from_literal<FieldT>("12345")).to_string() == "12345field");
    BOOST_TEST((failure_kind<field_element_error>(field_element_from_literal<FieldT>("12a")) ==
                field_element_error_kind::invalid_field));
    BOOST_TEST((failure_kind<field_element_error>(field_element_from_literal<FieldT>("")) ==
                field_element_error_kind::invalid_field));
    // the scalar field modulus itself is out of range, one below it is the largest element
    BOOST_TEST((failure_kind<field_element_error>(field_element_from_literal<FieldT>(
                    "21888242871839275222246405745257275088548364400416034343698204186575808495617")) ==
                field_element_error_kind::invalid_field));
    BOOST_TEST(take(field_element_from_literal<FieldT>(
                        "21888242871839275222246405745257275088548364400416034343698204186575808495616"))
                   .to_string() ==
               "21888242871839275222246405745257275088548364400416034343698204186575808495616field");
}

BOOST_AUTO_TEST_CASE(field_arithmetic_and_equality) {
    cs_type cs;
    field_type a = field_type::alloc(cs, field_value_type(8), "a");
    field_type b = field_type::alloc(cs, field_value_type(2), "b");
    BOOST_TEST(take(enforce_field_add(a, b)).to_string() == "10field");
    BOOST_TEST(take(enforce_field_mul(cs, a, b)).to_string() == "16field");
    BOOST_TEST(take(enforce_field_div(cs, a, b)).to_string() == "4field");
    BOOST_TEST(!*take(enforce_field_is_equal(cs, a, b)).as_boolean()->get_value());
    BOOST_TEST((failure_kind<field_element_error>(evaluate_field_eq(a, b)) ==
                field_element_error_kind::cannot_evaluate));
    BOOST_TEST(cs.is_satisfied());
}

BOOST_AUTO_TEST_CASE(field_parameter) {
    cs_type cs;
    input_model model {"x", type::field_element()};
    BOOST_TEST((failure_kind<field_element_error>(field_element_from_parameter(cs, model, input_value::boolean(true))) ==
                field_element_error_kind::invalid_field));
    value_type x = take(field_element_from_parameter(cs, model, input_value::field("99")));
    BOOST_TEST(x.to_string() == "99field");
    BOOST_TEST(cs.num_variables() == 1);
    BOOST_TEST(cs.num_constraints() == 1);
    BOOST_TEST(cs.is_satisfied());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(constrained_program_suite)

BOOST_AUTO_TEST_CASE(constrained_program_store_and_get) {
    constrained_program<FieldT> program;
    BOOST_TEST(new_scope("main", "x") == "main::x");
    BOOST_TEST((program.get("main::x") == nullptr));

    program.store("main::x", u8_constant(1));
    program.store("main::y", u8_constant(2));
    program.store("main::x", u8_constant(3));
    BOOST_TEST(program.size() == 2);
    BOOST_TEST(program.contains("main::y"));
    BOOST_TEST(program.get("main::x")->to_string() == "3u8");

    // replacing a value keeps its original position
    auto it = program.begin();
    BOOST_TEST(it->first == "main::x");
    ++it;
    BOOST_TEST(it->first == "main::y");
}

BOOST_AUTO_TEST_CASE(constrained_program_mutability) {
    constrained_program<FieldT> program;
    program.store("main::x", u8_constant(1));
    BOOST_TEST(!program.is_mutable("main::x"));
    program.set_mutable("main::x", true);
    BOOST_TEST(program.is_mutable("main::x"));
    program.set_mutable("main::x", false);
    BOOST_TEST(!program.is_mutable("main::x"));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(statistics_suite)

BOOST_AUTO_TEST_CASE(statistics_records) {
    constraint_statistics statistics;
    statistics.add_record("u8 +", 9, 9);
    statistics.add_record("u8 +", 9, 9);
    statistics.add_record("field *", 1, 1);
    BOOST_TEST(statistics.operations.at("u8 +").calls == 2);
    BOOST_TEST(statistics.operations.at("u8 +").constraints == 18);
    BOOST_TEST(statistics.total_constraints() == 19);

    std::ostringstream os;
    statistics.print(os);
    BOOST_TEST(os.str().find("total constraints amount estimation: 19") != std::string::npos);
    BOOST_TEST(os.str().find("operation: field *") != std::string::npos);
}

BOOST_AUTO_TEST_SUITE_END()
