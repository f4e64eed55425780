#define BOOST_TEST_MODULE constraint_system_test

#include <boost/test/unit_test.hpp>

#include <libff/algebra/curves/alt_bn128/alt_bn128_pp.hpp>
#include <libsnark/gadgetlib1/gadgets/basic_gadgets.hpp>

#include <nil/circuitgen/r1cs/constraint_system.hpp>

using namespace nil::circuitgen;
using FieldT = libff::Fr<libff::alt_bn128_pp>;
using value_type = FieldT;
using cs_type = r1cs::constraint_system<FieldT>;
using variable_type = r1cs::variable<FieldT>;
using lc_type = r1cs::linear_combination<FieldT>;

struct field_parameters {
    field_parameters() {
        libff::alt_bn128_pp::init_public_params();
    }
};

BOOST_TEST_GLOBAL_FIXTURE(field_parameters);

BOOST_AUTO_TEST_SUITE(linear_combination_suite)

BOOST_AUTO_TEST_CASE(linear_combination_constant) {
    lc_type zero = r1cs::constant(value_type::zero());
    BOOST_TEST(r1cs::is_zero(zero));
    BOOST_TEST(r1cs::is_constant(zero));
    BOOST_TEST(r1cs::is_zero(lc_type()));

    lc_type five = r1cs::constant(value_type(5));
    BOOST_TEST(r1cs::is_constant(five));
    BOOST_TEST(!r1cs::is_zero(five));
    BOOST_TEST((r1cs::constant_term(five) == value_type(5)));
    BOOST_TEST((r1cs::constant_term(r1cs::one<FieldT>()) == value_type::one()));
}

BOOST_AUTO_TEST_CASE(linear_combination_cancellation) {
    variable_type x(1);
    variable_type y(2);
    lc_type sum = lc_type(x) + lc_type(y) + lc_type(x);
    BOOST_TEST(!r1cs::is_constant(sum));

    // cancelled terms keep a zero coefficient but no longer count
    lc_type cancelled = sum - lc_type(x) * value_type(2) - lc_type(y);
    BOOST_TEST(r1cs::is_zero(cancelled));
    BOOST_TEST(r1cs::is_constant(cancelled + r1cs::constant(value_type(3))));
    BOOST_TEST((r1cs::constant_term(cancelled + r1cs::constant(value_type(3))) == value_type(3)));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(constraint_system_suite)

BOOST_AUTO_TEST_CASE(constraint_system_empty) {
    cs_type cs;
    BOOST_TEST(cs.num_variables() == 0);
    BOOST_TEST(cs.num_constraints() == 0);
    BOOST_TEST(cs.is_fully_assigned());
    BOOST_TEST(cs.is_satisfied());
    BOOST_TEST((cs.kind(variable_type(0)) == r1cs::variable_kind::constant));
    BOOST_TEST((*cs.value(variable_type(0)) == value_type::one()));
}

BOOST_AUTO_TEST_CASE(constraint_system_allocation) {
    cs_type cs;
    variable_type x = cs.allocate_input(value_type(3), "x");
    variable_type w = cs.allocate_witness(std::nullopt, "w");

    BOOST_TEST(cs.num_variables() == 2);
    BOOST_TEST(cs.num_inputs() == 1);
    BOOST_TEST(cs.num_witnesses() == 1);
    BOOST_TEST((cs.kind(x) == r1cs::variable_kind::input));
    BOOST_TEST((cs.kind(w) == r1cs::variable_kind::witness));
    BOOST_TEST((*cs.value(x) == value_type(3)));
    BOOST_TEST(!cs.value(w).has_value());
    BOOST_TEST(!cs.is_fully_assigned());

    cs.assign(w, value_type(9));
    BOOST_TEST(cs.is_fully_assigned());
    BOOST_TEST((*cs.value(w) == value_type(9)));
}

BOOST_AUTO_TEST_CASE(constraint_system_evaluate) {
    cs_type cs;
    variable_type x = cs.allocate_witness(value_type(3), "x");
    variable_type y = cs.allocate_witness(std::nullopt, "y");
    lc_type lc = lc_type(x) * value_type(4) + r1cs::constant(value_type(2));
    BOOST_TEST(cs.evaluate(lc).has_value());
    BOOST_TEST((*cs.evaluate(lc) == value_type(14)));

    BOOST_TEST(!cs.evaluate(lc + lc_type(y)).has_value());
    // an unassigned variable with a cancelled coefficient does not matter
    BOOST_TEST(cs.evaluate(lc + lc_type(y) - lc_type(y)).has_value());
}

BOOST_AUTO_TEST_CASE(constraint_system_satisfiability) {
    cs_type cs;
    variable_type x = cs.allocate_input(value_type(3), "x");
    variable_type y = cs.allocate_witness(value_type(9), "y");
    cs.enforce(x, x, y, "square");

    BOOST_TEST(cs.num_constraints() == 1);
    BOOST_TEST(cs.is_satisfied());
    BOOST_TEST(cs.protoboard().is_satisfied());

    cs.assign(y, value_type(10));
    BOOST_TEST(!cs.is_satisfied());
    BOOST_TEST(!cs.protoboard().is_satisfied());
    BOOST_TEST(cs.first_unsatisfied().has_value());
    BOOST_TEST(*cs.first_unsatisfied() == "square");
}

BOOST_AUTO_TEST_CASE(constraint_system_unassigned_is_unsatisfied) {
    cs_type cs;
    variable_type x = cs.allocate_witness(std::nullopt, "x");
    cs.enforce(x, r1cs::one<FieldT>(), r1cs::constant(value_type(1)), "x == 1");
    BOOST_TEST(!cs.is_satisfied());
}

BOOST_AUTO_TEST_CASE(constraint_system_gadget_ranges) {
    cs_type cs;
    variable_type x = cs.allocate_witness(value_type(1), "x");
    cs.apply("x is boolean", true, [&x](auto &pb) {
        libsnark::generate_boolean_r1cs_constraint<FieldT>(pb, x, "x is boolean");
    });
    cs.enforce(x, r1cs::one<FieldT>(), r1cs::one<FieldT>(), "x == 1");
    BOOST_TEST(cs.num_constraints() == 2);
    BOOST_TEST(cs.is_satisfied());

    cs.assign(x, value_type(2));
    BOOST_TEST(*cs.first_unsatisfied() == "x is boolean");
}

BOOST_AUTO_TEST_CASE(constraint_system_gadget_allocations) {
    cs_type cs;
    libsnark::pb_variable_array<FieldT> inputs;
    inputs.emplace_back(cs.allocate_witness(std::nullopt, "x"));
    variable_type output = cs.allocate_witness(std::nullopt, "x != 0");
    cs.apply("x != 0", false, [&](auto &pb) {
        libsnark::disjunction_gadget<FieldT> disjunction(pb, inputs, output, "x != 0");
        disjunction.generate_r1cs_constraints();
    });
    // the disjunction allocates an inverse of its own
    BOOST_TEST(cs.num_variables() == 3);
    BOOST_TEST(!cs.value(variable_type(3)).has_value());
    BOOST_TEST(!cs.is_fully_assigned());
}

BOOST_AUTO_TEST_CASE(constraint_system_exports_layout) {
    cs_type cs;
    variable_type x = cs.allocate_input(value_type(3), "x");
    variable_type y = cs.allocate_input(value_type(4), "y");
    variable_type product = cs.allocate_witness(value_type(12), "x * y");
    cs.enforce(x, y, product, "x * y");

    libsnark::r1cs_constraint_system<FieldT> constraints = cs.get_constraint_system();
    BOOST_TEST(constraints.num_inputs() == 2);
    BOOST_TEST(constraints.num_variables() == 3);
    BOOST_TEST(constraints.num_constraints() == 1);
    BOOST_TEST(constraints.is_satisfied(cs.protoboard().primary_input(), cs.protoboard().auxiliary_input()));
}

BOOST_AUTO_TEST_CASE(constraint_system_equality_ignores_values) {
    cs_type first;
    cs_type second;
    for (auto *cs : {&first, &second}) {
        variable_type x = cs->allocate_witness(std::nullopt, "x");
        cs->enforce(x, x, x, "boolean");
    }
    BOOST_TEST((first == second));

    first.assign(variable_type(1), value_type::one());
    BOOST_TEST((first == second));

    second.enforce(variable_type(1), r1cs::one<FieldT>(), lc_type(), "zero");
    BOOST_TEST((first != second));
}

BOOST_AUTO_TEST_SUITE_END()
