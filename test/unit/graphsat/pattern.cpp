/*
 * Copyright (c) 2022, Trail of Bits, Inc.
 * All rights reserved.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <doctest/doctest.h>
#include <graphsat/pattern/pattern.hpp>
#include <graphsat/pattern/rewrite_rule.hpp>
#include <graphsat/pattern/rule_set.hpp>

namespace graphsat::test {

    atom_t operation(std::string name) { return { operation_t{ std::move(name) } }; }

    atom_t constant(std::int64_t value) { return { constant_t{ value } }; }

    atom_t place(std::string name) { return { place_t{ std::move(name) } }; }

    atom_t symbol(std::string name) { return { symbol_t{ std::move(name) } }; }

    TEST_SUITE("graphsat::pattern-parser") {

    TEST_CASE("Expr Parser") {
        CHECK(parse_simple_expr("(add ?x ?y)"));
        CHECK(parse_simple_expr("(add ?x (mul 2 ?y))"));

        {
            auto expr = parse_simple_expr("(add ?x (mul 2 ?y))");
            CHECK(expr);
            CHECK_EQ(root(expr.value()), operation("add"));
        }

        {
            auto expr = parse_simple_expr("(add (mul 1 ?x) 3)");
            CHECK(expr);
            CHECK_EQ(root(expr.value()), operation("add"));
            auto ch = children(expr.value());
            CHECK_EQ(std::get< atom_t >(ch[1]), constant(3));

            auto subexpr = ch[0];
            CHECK_EQ(root(subexpr), operation("mul"));
            auto subch = children(subexpr);
            CHECK_EQ(std::get< atom_t >(subch[0]), constant(1));
            CHECK_EQ(std::get< atom_t >(subch[1]), place("x"));

            CHECK_EQ(gather_places(expr.value()).size(), 1);
        }

        CHECK(!parse_simple_expr("(add ?x (mul 2 ?y)"));
        CHECK(!parse_simple_expr("(2 ?x)"));
    }

    TEST_CASE("Atoms") {
        CHECK_EQ(parse_atom("x@64_32").value(), symbol("x@64_32"));
        CHECK_EQ(parse_atom("?x").value(), place("x"));
        CHECK_EQ(parse_atom("42").value(), constant(42));
        CHECK_EQ(parse_constant("7").value(), constant_t(7));
        CHECK(!parse_atom("?"));
    }

    TEST_CASE("Whitespace and singleton lists") {
        auto expr = parse_simple_expr("  (ewadd\n ?x\t(relu  ?y) )  ");
        REQUIRE(expr);
        CHECK_EQ(to_string(*expr), "(ewadd ?x (relu ?y))");

        // singleton list denotes its element
        auto single = parse_simple_expr("(?x)");
        REQUIRE(single);
        REQUIRE(std::holds_alternative< atom_t >(*single));
        CHECK_EQ(std::get< atom_t >(*single), place("x"));

        auto leaf = parse_simple_expr("x");
        REQUIRE(leaf);
        CHECK_EQ(std::get< atom_t >(*leaf), symbol("x"));
    }

    TEST_CASE("Pattern Places") {
        auto count_places = [](std::string_view in) {
            return gather_places(parse_simple_expr(in).value()).size();
        };

        CHECK_EQ(count_places("(?x)"), 1);
        CHECK_EQ(count_places("(mul ?x ?y)"), 2);
        CHECK_EQ(count_places("(mul ?x ?x)"), 1);
        CHECK_EQ(count_places("(add (mul 1 ?x) ?y)"), 2);
        CHECK_EQ(count_places("(add (mul 1 ?x) ?x)"), 1);

        auto ordered = gather_places(parse_simple_expr("(add ?b (mul ?a ?b))").value());
        REQUIRE(ordered.size() == 2);
        CHECK(ordered[0].ref() == "b");
        CHECK(ordered[1].ref() == "a");

        CHECK(is_ground(parse_simple_expr("(add x 1)").value()));
        CHECK(!is_ground(parse_simple_expr("(add ?x 1)").value()));
    }

    TEST_CASE("Guards") {
        auto guard = parse_guard("(has_rank ?a 2)");
        REQUIRE(guard);
        CHECK_EQ(guard->predicate, "has_rank");
        REQUIRE(guard->arguments.size() == 2);
        CHECK_EQ(guard->arguments[0], place("a"));
        CHECK_EQ(guard->arguments[1], constant(2));

        CHECK(parse_guard("(same_shape ?a ?b)"));
        CHECK(!parse_guard("(same_shape ?a (relu ?b))"));
        CHECK(!parse_guard("(is_tensor x)"));
        CHECK(!parse_guard("?a"));
    }
    } // test suite: graphsat::pattern-parser

    TEST_SUITE("graphsat::rewrite-rules") {

    TEST_CASE("Rule construction") {
        auto rule = rewrite_rule("commute", "(ewadd ?x ?y)", "(ewadd ?y ?x)");
        CHECK_EQ(rule.name, "commute");
        CHECK_EQ(rule.places.size(), 2);
        CHECK(!rule.bidirectional);
        CHECK(rule.guards.empty());

        rule.when("(same_shape ?x ?y)");
        CHECK_EQ(rule.guards.size(), 1);

        CHECK_THROWS_AS(rewrite_rule("broken", "(ewadd ?x", "?x"), parse_error);
        CHECK_THROWS_AS(rule.when("same_shape"), parse_error);
    }

    TEST_CASE("Rule validation") {
        // right-hand side may only use places bound on the left-hand side
        CHECK_THROWS_AS(rewrite_rule("unbound", "(relu ?x)", "(ewadd ?x ?y)"), rule_error);

        // sole place would match everything
        CHECK_THROWS_AS(rewrite_rule("place", "?x", "(relu ?x)"), rule_error);

        // reversed rule has to bind all places
        CHECK_THROWS_AS(rewrite_rule("drop", "(ewmul ?x ?y)", "(relu ?x)", true), rule_error);
        CHECK_THROWS_AS(rewrite_rule("identity", "(relu ?x)", "?x", true), rule_error);

        auto rule = rewrite_rule("guarded", "(relu ?x)", "?x");
        CHECK_THROWS_AS(rule.when("(is_tensor ?y)"), rule_error);

        try {
            rewrite_rule("named", "(relu ?x)", "?y");
            FAIL("expected rule error");
        } catch (const rule_error &err) {
            CHECK_EQ(err.rule, "named");
        }
    }

    TEST_CASE("Reversed rules") {
        auto rule = rewrite_rule("assoc", "(ewadd ?x (ewadd ?y ?z))", "(ewadd (ewadd ?x ?y) ?z)", true);
        rule.when("(is_tensor ?x)");

        auto rev = rule.reversed();
        CHECK_EQ(rev.name, "assoc-rev");
        CHECK_EQ(to_string(rev.lhs), to_string(rule.rhs));
        CHECK_EQ(to_string(rev.rhs), to_string(rule.lhs));
        CHECK_EQ(rev.guards.size(), 1);
        CHECK(!rev.bidirectional);

        rule_sets sets = {
            { "algebra", { rule, rewrite_rule("relu", "(relu (relu ?x))", "(relu ?x)") } }
        };

        auto active = active_rules(sets);
        REQUIRE(active.size() == 3);
        CHECK_EQ(active[0].name, "assoc");
        CHECK_EQ(active[1].name, "assoc-rev");
        CHECK_EQ(active[2].name, "relu");

        CHECK_EQ(all_rules(sets).size(), 2);
    }
    } // test suite: graphsat::rewrite-rules

} // namespace graphsat::test
