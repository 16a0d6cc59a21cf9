/*
 * Copyright (c) 2022, Trail of Bits, Inc.
 * All rights reserved.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <doctest/doctest.h>

#include <graphsat/pattern/rewrite_rule.hpp>
#include <graphsat/algo/saturation.hpp>
#include <graphsat/algo/ematch.hpp>

#include <support/egraph.hpp>

#include <vector>

namespace graphsat::test {

    #pragma GCC diagnostic push
    #pragma GCC diagnostic ignored "-Wunused-variable"
    auto count_matches(auto &&matches) {
        std::size_t count = 0;
        for (auto _ : matches) {
            count++;
        }
        return count;
    }
    #pragma GCC diagnostic pop

    auto collect_matches(auto &&matches) {
        std::vector< match_result > result;
        for (auto m : matches) {
            result.push_back(std::move(m));
        }
        return result;
    }

    TEST_SUITE("graphsat::pattern-matching") {
    TEST_CASE("basic") {
        test_graph egraph;

        auto idx = make_node(egraph, "x");
        auto idy = make_node(egraph, "1");
        make_node(egraph, "mul", {idx, idy});

        SUBCASE("multiplication identity") {
            auto rule = rewrite_rule("multiplication identity", "(mul ?x 1)", "?x");
            CHECK(count_matches(match(rule, egraph)) == 1);
        }

        SUBCASE("zero multiplication") {
            auto rule = rewrite_rule("zero multiplication", "(mul ?x 0)", "0");
            CHECK(count_matches(match(rule, egraph)) == 0);
        }

        SUBCASE("commutativity multiplication") {
            auto rule = rewrite_rule("commutativity multiplication", "(mul ?x ?y)", "(mul ?y ?x)");
            CHECK(count_matches(match(rule, egraph)) == 1);
        }

        SUBCASE("symbol operand") {
            CHECK(count_matches(match(make_match_pattern("(mul x 1)"), egraph)) == 1);
            CHECK(count_matches(match(make_match_pattern("(mul z 1)"), egraph)) == 0);
        }

        SUBCASE("arity mismatch") {
            CHECK(count_matches(match(make_match_pattern("(mul ?x)"), egraph)) == 0);
            CHECK(count_matches(match(make_match_pattern("(mul ?x ?y ?z)"), egraph)) == 0);
        }

        SUBCASE("sole place") {
            // a place binds every eclass exactly once
            CHECK(count_matches(match(make_match_pattern("?x"), egraph)) == 3);
        }

        SUBCASE("bindings") {
            auto matches = collect_matches(match(make_match_pattern("(mul ?x ?y)"), egraph));
            REQUIRE(matches.size() == 1);
            CHECK(matches[0].bound(0) == idx);
            CHECK(matches[0].bound(1) == idy);
        }
    }

    TEST_CASE("addition") {
        test_graph egraph;

        auto idx  = make_node(egraph, "x");
        auto idy  = make_node(egraph, "y");
        auto add1 = make_node(egraph, "add", {idx, idy});

        auto idu  = make_node(egraph, "u");
        auto idv  = make_node(egraph, "v");
        auto add2 = make_node(egraph, "add", {idu, idv});

        auto rule = rewrite_rule("commutativity", "(add ?x ?y)", "(add ?y ?x)");
        CHECK(count_matches(match(rule, egraph)) == 2);

        auto saturable = saturable_egraph(std::move(egraph));

        saturable.merge(add1, add2);
        saturable.rebuild();

        // both enodes of the merged eclass are alternatives
        auto matches = collect_matches(match(rule, saturable));
        REQUIRE(matches.size() == 2);
        CHECK(matches[0].root == matches[1].root);
        CHECK(matches[0].bound(0) == idx);
        CHECK(matches[1].bound(0) == idu);
    }

    TEST_CASE("nested additions") {
        test_graph egraph;

        auto ida  = make_node(egraph, "a");
        auto idb  = make_node(egraph, "b");
        auto idz  = make_node(egraph, "0");
        auto add1 = make_node(egraph, "add", {idz, ida});
        auto add2 = make_node(egraph, "add", {idb, add1});

        auto rule = rewrite_rule("addition", "(add ?x (add 0 ?y))", "(add ?x ?y)");
        auto matches = collect_matches(match(rule, egraph));
        REQUIRE(matches.size() == 1);
        CHECK(matches[0].root == add2);
        CHECK(matches[0].bound(0) == idb);
        CHECK(matches[0].bound(1) == ida);
    }

    TEST_CASE("same arguments") {
        test_graph egraph;
        auto ida  = make_node(egraph, "a");
        auto idb  = make_node(egraph, "b");
        make_node(egraph, "add", {ida, idb});

        auto rule = rewrite_rule("twice", "(add ?x ?x)", "(mul 2 ?x)");
        CHECK(count_matches(match(rule, egraph)) == 0);

        auto saturable = saturable_egraph(std::move(egraph));

        saturable.merge(ida, idb);
        saturable.rebuild();

        CHECK(count_matches(match(rule, saturable)) == 1);
    }

    TEST_CASE("nested same arguments") {
        test_graph egraph;
        auto ida  = make_node(egraph, "a");
        auto idb  = make_node(egraph, "b");
        auto idc  = make_node(egraph, "c");
        auto add1 = make_node(egraph, "add", {ida, idb});
        make_node(egraph, "add", {idc, add1});

        auto rule = rewrite_rule("twice", "(add ?x ?x)", "(mul 2 ?x)");
        CHECK(count_matches(match(rule, egraph)) == 0);

        auto saturable = saturable_egraph(std::move(egraph));

        saturable.merge(ida, idb);
        saturable.merge(idc, add1);
        saturable.rebuild();

        CHECK(count_matches(match(rule, saturable)) == 2);
    }

    TEST_CASE("deterministic order") {
        test_graph egraph;
        auto idx = make_node(egraph, "x");
        auto idy = make_node(egraph, "y");
        auto f1 = make_node(egraph, "f", {idx});
        auto f2 = make_node(egraph, "f", {idy});
        auto f3 = make_node(egraph, "f", {f1});

        auto pattern = make_match_pattern("(f ?x)");
        auto first  = collect_matches(match(pattern, egraph));
        auto second = collect_matches(match(pattern, egraph));

        REQUIRE(first.size() == 3);
        REQUIRE(second.size() == 3);

        // ascending order of matched eclasses
        CHECK(first[0].root == f1);
        CHECK(first[1].root == f2);
        CHECK(first[2].root == f3);

        for (std::size_t i = 0; i < first.size(); ++i) {
            CHECK(first[i].root == second[i].root);
            CHECK(first[i].bound(0) == second[i].bound(0));
        }
    }

    } // test suite: graphsat::pattern-matching

} // namespace graphsat::test
