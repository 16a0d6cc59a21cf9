/*
 * Copyright (c) 2022, Trail of Bits, Inc.
 * All rights reserved.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <doctest/doctest.h>

#include <graphsat/algo/verify.hpp>
#include <graphsat/pattern/rule_set.hpp>

#include <support/egraph.hpp>

#include <vector>

namespace graphsat::test {

    static saturation_config budget(std::size_t iterations) {
        saturation_config config;
        config.iteration_limit = iterations;
        return config;
    }

    static rewrite_rules add_axioms() {
        rule_sets sets = {
            { "add", {
                rewrite_rule("commutativity", "(add ?x ?y)", "(add ?y ?x)"),
                rewrite_rule("associativity", "(add (add ?x ?y) ?z)", "(add ?x (add ?y ?z))", true)
            } }
        };
        return active_rules(sets);
    }

    TEST_SUITE("graphsat::verification") {

    TEST_CASE("generalized patterns") {
        auto pattern = make_match_pattern("(add ?x (mul 2 ?y))");
        CHECK_EQ(to_string(generalize(pattern)), "(add ?x (mul 2 ?y))");
        CHECK(is_ground(generalize(pattern)));

        auto atom = std::get< atom_t >(generalize(make_match_pattern("?x")));
        CHECK(std::holds_alternative< symbol_t >(atom));
    }

    TEST_CASE("commutativity proves itself") {
        rewrite_rules axioms = {
            rewrite_rule("commutativity", "(add ?x ?y)", "(add ?y ?x)")
        };

        rewrite_rules candidates = {
            rewrite_rule("swap", "(add ?x ?y)", "(add ?y ?x)")
        };

        auto result = verify(axioms, candidates, test_graph{}, budget(10));
        REQUIRE_EQ(result.verdicts.size(), 1);
        CHECK_EQ(result.verdicts[0].rule, "swap");
        CHECK_EQ(result.verdicts[0].status, verdict::verified);
        CHECK_EQ(result.reason, stop_reason::goal_reached);
        CHECK_EQ(result.rounds, 1);
        CHECK(result.conclusive);
    }

    TEST_CASE("associativity with commutativity") {
        rewrite_rules candidates = {
            rewrite_rule("rotate", "(add (add ?x ?y) ?z)", "(add (add ?z ?y) ?x)")
        };

        auto result = verify(add_axioms(), candidates, test_graph{}, budget(10));
        CHECK_EQ(result.num_of_verified(), 1);
        CHECK_EQ(result.reason, stop_reason::goal_reached);
        CHECK_LE(result.rounds, 3);
    }

    TEST_CASE("underivable rules stay unverified") {
        rewrite_rules candidates = {
            rewrite_rule("add is mul", "(add ?x ?y)", "(mul ?x ?y)")
        };

        auto result = verify(add_axioms(), candidates, test_graph{}, budget(100));
        CHECK_EQ(result.verdicts[0].status, verdict::unverified);
        CHECK_EQ(result.reason, stop_reason::saturated);
        CHECK(result.conclusive);
    }

    TEST_CASE("verdicts do not depend on other candidates") {
        auto swap   = rewrite_rule("swap", "(add ?x ?y)", "(add ?y ?x)");
        auto rotate = rewrite_rule("rotate", "(add (add ?x ?y) ?z)", "(add (add ?z ?y) ?x)");
        auto wrong  = rewrite_rule("add is mul", "(add ?x ?y)", "(mul ?x ?y)");

        rewrite_rules together = { swap, rotate, wrong };
        auto shared = verify(add_axioms(), together, test_graph{}, budget(100));
        REQUIRE_EQ(shared.verdicts.size(), 3);

        for (std::size_t i = 0; i < together.size(); ++i) {
            rewrite_rules alone = { together[i] };
            auto single = verify(add_axioms(), alone, test_graph{}, budget(100));
            REQUIRE_EQ(single.verdicts.size(), 1);
            CHECK_EQ(single.verdicts[0].rule, shared.verdicts[i].rule);
            CHECK_EQ(single.verdicts[0].status, shared.verdicts[i].status);
        }

        CHECK_EQ(shared.num_of_verified(), 2);
    }

    TEST_CASE("candidates never rewrite") {
        rewrite_rules axioms = {
            rewrite_rule("commutativity", "(add ?x ?y)", "(add ?y ?x)")
        };

        // the first candidate would prove the second one if it rewrote
        rewrite_rules candidates = {
            rewrite_rule("collapse", "(mul ?x ?y)", "?x"),
            rewrite_rule("collapse twice", "(mul (mul ?a ?b) ?c)", "?a")
        };

        auto result = verify(axioms, candidates, test_graph{}, budget(100));
        CHECK_EQ(result.num_of_verified(), 0);
    }

    TEST_CASE("exhausted budget is inconclusive") {
        rewrite_rules candidates = {
            rewrite_rule("rotate", "(add (add ?x ?y) ?z)", "(add (add ?z ?y) ?x)")
        };

        auto result = verify(add_axioms(), candidates, test_graph{}, budget(0));
        CHECK_EQ(result.reason, stop_reason::iteration_limit);
        CHECK_EQ(result.rounds, 0);
        CHECK_EQ(result.verdicts[0].status, verdict::unverified);
        CHECK(!result.conclusive);
    }

    TEST_CASE("observer sees the saturated graph") {
        rewrite_rules axioms = {
            rewrite_rule("commutativity", "(add ?x ?y)", "(add ?y ?x)")
        };

        std::size_t classes = 0;
        auto observe = [&] (const saturable_egraph< test_graph > &g) {
            classes = g.num_of_eclasses();
        };

        verify(axioms, {}, test_graph{}, budget(10), observe);

        // ?x, ?y and the merged additions
        CHECK_EQ(classes, 3);
    }

    TEST_CASE("ill-formed sides") {
        rewrite_rules candidates = {
            rewrite_rule("broken", "(bad ?x)", "?x")
        };

        CHECK_THROWS_AS(verify({}, candidates, constant_graph{}, budget(10)), rule_error);
    }

    TEST_CASE("unknown guards") {
        auto axiom = rewrite_rule("guarded", "(add ?x ?y)", "(add ?y ?x)");
        axiom.when("(is_positive ?x)");
        rewrite_rules axioms = { axiom };

        CHECK_THROWS_AS(verify(axioms, {}, constant_graph{}, budget(10)), rule_error);
    }

    } // test suite: graphsat::verification

} // namespace graphsat::test
