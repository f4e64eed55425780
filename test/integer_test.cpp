#define BOOST_TEST_MODULE integer_test

#include <boost/test/unit_test.hpp>

#include <libff/algebra/curves/alt_bn128/alt_bn128_pp.hpp>

#include <nil/circuitgen/ast.hpp>
#include <nil/circuitgen/integer.hpp>

#include <cstdint>
#include <limits>

using namespace nil::circuitgen;
using FieldT = libff::Fr<libff::alt_bn128_pp>;
using cs_type = r1cs::constraint_system<FieldT>;
using integer_value = integer<FieldT>;
using value_type = constrained_value<FieldT>;

namespace {
    struct field_parameters {
        field_parameters() {
            libff::alt_bn128_pp::init_public_params();
        }
    };

    integer_value alloc_integer(cs_type &cs, integer_type type, std::uint64_t value, const std::string &name) {
        return integer_value::from_input(cs, type, llvm::APInt(bit_width(type), value), name, true);
    }

    value_type take(llvm::Expected<value_type> value) {
        if (!value) {
            BOOST_FAIL(llvm::toString(value.takeError()));
        }
        return std::move(*value);
    }

    std::uint64_t integer_result(llvm::Expected<value_type> value) {
        value_type result = take(std::move(value));
        BOOST_TEST_REQUIRE((result.as_integer() != nullptr));
        BOOST_TEST_REQUIRE(result.as_integer()->get_value().has_value());
        return result.as_integer()->get_value()->getZExtValue();
    }

    bool boolean_result(llvm::Expected<value_type> value) {
        value_type result = take(std::move(value));
        BOOST_TEST_REQUIRE((result.as_boolean() != nullptr));
        BOOST_TEST_REQUIRE(result.as_boolean()->get_value().has_value());
        return *result.as_boolean()->get_value();
    }

    template<typename ErrorType, typename T>
    std::optional<typename ErrorType::kind_type> failure_kind(llvm::Expected<T> value) {
        if (value) {
            return std::nullopt;
        }
        return error_kind<ErrorType>(value.takeError());
    }
}    // namespace

BOOST_TEST_GLOBAL_FIXTURE(field_parameters);

BOOST_AUTO_TEST_SUITE(integer_arithmetic_suite)

BOOST_AUTO_TEST_CASE(integer_same_width_arithmetic) {
    cs_type cs;
    integer_value a = alloc_integer(cs, integer_type::u8, 250, "a");
    integer_value b = alloc_integer(cs, integer_type::u8, 10, "b");

    BOOST_TEST(integer_result(enforce_integer_add(cs, a, b)) == 4);
    BOOST_TEST(integer_result(enforce_integer_sub(cs, b, a)) == 16);
    BOOST_TEST(integer_result(enforce_integer_mul(cs, a, b)) == (2500 % 256));
    BOOST_TEST(integer_result(enforce_integer_div(cs, a, b)) == 25);
    BOOST_TEST(integer_result(enforce_integer_pow(cs, b, alloc_integer(cs, integer_type::u8, 2, "e"))) == 100);
    BOOST_TEST(cs.is_satisfied());
}

BOOST_AUTO_TEST_CASE(integer_wide_arithmetic) {
    cs_type cs;
    integer_value a = alloc_integer(cs, integer_type::u64, 0xFFFFFFFFFFFFFFFFull, "a");
    integer_value b = alloc_integer(cs, integer_type::u64, 2, "b");
    BOOST_TEST(integer_result(enforce_integer_add(cs, a, b)) == 1);
    BOOST_TEST(integer_result(enforce_integer_mul(cs, a, b)) == 0xFFFFFFFFFFFFFFFEull);
    BOOST_TEST(cs.is_satisfied());
}

BOOST_AUTO_TEST_CASE(integer_constant_folding) {
    cs_type cs;
    integer_value a = integer_value::constant(integer_type::u16, llvm::APInt(16, 300));
    integer_value b = integer_value::constant(integer_type::u16, llvm::APInt(16, 7));
    BOOST_TEST(integer_result(enforce_integer_add(cs, a, b)) == 307);
    BOOST_TEST(integer_result(enforce_integer_div(cs, a, b)) == 42);
    BOOST_TEST(boolean_result(enforce_integer_lt(cs, b, a)));
    BOOST_TEST(cs.num_constraints() == 0);
    BOOST_TEST(cs.num_variables() == 0);
}

BOOST_AUTO_TEST_CASE(integer_division_by_zero) {
    cs_type cs;
    integer_value a = alloc_integer(cs, integer_type::u32, 9, "a");
    integer_value zero = integer_value::constant(integer_type::u32, llvm::APInt(32, 0));
    BOOST_TEST((failure_kind<gadget_error>(enforce_integer_div(cs, a, zero)) == gadget_error_kind::division_by_zero));
}

BOOST_AUTO_TEST_CASE(integer_width_mismatch_adds_nothing) {
    cs_type cs;
    integer_value a = alloc_integer(cs, integer_type::u8, 1, "a");
    integer_value b = alloc_integer(cs, integer_type::u16, 1, "b");
    std::size_t constraints = cs.num_constraints();
    std::size_t variables = cs.num_variables();

    BOOST_TEST((failure_kind<integer_error>(enforce_integer_add(cs, a, b)) == integer_error_kind::cannot_enforce));
    BOOST_TEST((failure_kind<integer_error>(enforce_integer_sub(cs, a, b)) == integer_error_kind::cannot_enforce));
    BOOST_TEST((failure_kind<integer_error>(enforce_integer_mul(cs, a, b)) == integer_error_kind::cannot_enforce));
    BOOST_TEST((failure_kind<integer_error>(enforce_integer_div(cs, a, b)) == integer_error_kind::cannot_enforce));
    BOOST_TEST((failure_kind<integer_error>(enforce_integer_pow(cs, a, b)) == integer_error_kind::cannot_enforce));
    BOOST_TEST((failure_kind<integer_error>(enforce_integer_lt(cs, a, b)) == integer_error_kind::cannot_enforce));
    BOOST_TEST((error_kind<integer_error>(enforce_integer_eq(cs, a, b)) == integer_error_kind::cannot_enforce));
    BOOST_TEST((failure_kind<integer_error>(evaluate_integer_eq(a, b)) == integer_error_kind::cannot_evaluate));

    BOOST_TEST(cs.num_constraints() == constraints);
    BOOST_TEST(cs.num_variables() == variables);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(integer_equality_suite)

BOOST_AUTO_TEST_CASE(integer_evaluate_eq) {
    integer_value a = integer_value::constant(integer_type::u8, llvm::APInt(8, 5));
    integer_value b = integer_value::constant(integer_type::u8, llvm::APInt(8, 6));
    BOOST_TEST(boolean_result(evaluate_integer_eq(a, a)));
    BOOST_TEST(!boolean_result(evaluate_integer_eq(a, b)));
}

BOOST_AUTO_TEST_CASE(integer_enforce_eq) {
    cs_type cs;
    integer_value a = alloc_integer(cs, integer_type::u8, 5, "a");
    integer_value b = alloc_integer(cs, integer_type::u8, 6, "b");
    std::size_t constraints = cs.num_constraints();

    BOOST_TEST(!enforce_integer_eq(cs, a, a));
    BOOST_TEST(cs.num_constraints() == constraints + 1);
    BOOST_TEST(cs.is_satisfied());

    BOOST_TEST(!enforce_integer_eq(cs, a, b));
    BOOST_TEST(!cs.is_satisfied());
}

BOOST_AUTO_TEST_CASE(integer_enforce_eq_constants) {
    cs_type cs;
    integer_value a = integer_value::constant(integer_type::u8, llvm::APInt(8, 5));
    integer_value b = integer_value::constant(integer_type::u8, llvm::APInt(8, 6));
    BOOST_TEST((error_kind<gadget_error>(enforce_integer_eq(cs, a, b)) == gadget_error_kind::assertion_failed));
    BOOST_TEST(cs.num_constraints() == 0);
}

BOOST_AUTO_TEST_CASE(integer_comparisons) {
    cs_type cs;
    integer_value a = alloc_integer(cs, integer_type::u32, 70000, "a");
    integer_value b = alloc_integer(cs, integer_type::u32, 70001, "b");
    BOOST_TEST(boolean_result(enforce_integer_lt(cs, a, b)));
    BOOST_TEST(boolean_result(enforce_integer_le(cs, a, a)));
    BOOST_TEST(!boolean_result(enforce_integer_gt(cs, a, b)));
    BOOST_TEST(boolean_result(enforce_integer_ge(cs, b, a)));
    BOOST_TEST(!boolean_result(enforce_integer_is_equal(cs, a, b)));
    BOOST_TEST(boolean_result(enforce_integer_is_equal(cs, b, b)));
    BOOST_TEST(cs.is_satisfied());
}

BOOST_AUTO_TEST_CASE(integer_select) {
    cs_type cs;
    integer_value a = alloc_integer(cs, integer_type::u8, 1, "a");
    integer_value b = alloc_integer(cs, integer_type::u8, 2, "b");
    auto cond = gadgets::boolean<FieldT>::alloc(cs, true, "cond");
    BOOST_TEST(integer_result(conditionally_select_integer(cs, cond, a, b)) == 1);
    BOOST_TEST(cs.is_satisfied());

    integer_value wide = alloc_integer(cs, integer_type::u16, 2, "wide");
    BOOST_TEST((failure_kind<integer_error>(conditionally_select_integer(cs, cond, a, wide)) ==
                integer_error_kind::cannot_enforce));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(integer_parameter_suite)

BOOST_AUTO_TEST_CASE(integer_parameter_invalid_type) {
    cs_type cs;
    input_model model {"x", type::boolean()};
    BOOST_TEST((failure_kind<integer_error>(integer_from_parameter(cs, model, std::nullopt)) ==
                integer_error_kind::invalid_type));
    BOOST_TEST(cs.num_variables() == 0);
}

BOOST_AUTO_TEST_CASE(integer_parameter_invalid_integer) {
    cs_type cs;
    input_model model {"x", type::integer(integer_type::u8)};
    BOOST_TEST((failure_kind<integer_error>(integer_from_parameter(cs, model, input_value::field("3"))) ==
                integer_error_kind::invalid_integer));
    BOOST_TEST((failure_kind<integer_error>(integer_from_parameter(
                    cs, model, llvm::cantFail(input_value::integer(integer_type::u16, 3)))) ==
                integer_error_kind::invalid_integer));
    BOOST_TEST(cs.num_variables() == 0);
}

BOOST_AUTO_TEST_CASE(integer_parameter_free_witness) {
    cs_type cs;
    input_model model {"x", type::integer(integer_type::u16)};
    value_type x = take(integer_from_parameter(cs, model, std::nullopt));
    BOOST_TEST_REQUIRE((x.as_integer() != nullptr));
    BOOST_TEST(!x.as_integer()->get_value().has_value());
    BOOST_TEST(x.to_string() == "[allocated u16]");
    BOOST_TEST(cs.num_variables() == 16);
    // booleanity only, no literal binding
    BOOST_TEST(cs.num_constraints() == 16);
}

BOOST_AUTO_TEST_CASE(integer_parameter_literal) {
    cs_type cs;
    input_model model {"x", type::integer(integer_type::u16), false};
    value_type x =
        take(integer_from_parameter(cs, model, llvm::cantFail(input_value::integer(integer_type::u16, 513))));
    BOOST_TEST(x.to_string() == "513u16");
    BOOST_TEST(cs.num_inputs() == 16);
    BOOST_TEST(cs.num_constraints() == 17);
    BOOST_TEST(cs.is_satisfied());
}

BOOST_AUTO_TEST_CASE(integer_literal_out_of_range) {
    auto too_wide = ast::integer_value(integer_type::u8, 256);
    BOOST_TEST((!too_wide && error_kind<integer_error>(too_wide.takeError()) == integer_error_kind::invalid_integer));
    auto wrapped = input_value::integer(integer_type::u8, 300);
    BOOST_TEST((!wrapped && error_kind<integer_error>(wrapped.takeError()) == integer_error_kind::invalid_integer));
    auto u16_max = input_value::integer(integer_type::u16, 65535);
    BOOST_TEST((u16_max && u16_max->to_string() == "65535u16"));
    auto u64_max = input_value::integer(integer_type::u64, std::numeric_limits<std::uint64_t>::max());
    BOOST_TEST((u64_max && u64_max->to_string() == "18446744073709551615u64"));
}

BOOST_AUTO_TEST_SUITE_END()
