/*
 * Copyright (c) 2022, Trail of Bits, Inc.
 * All rights reserved.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <doctest/doctest.h>

#include <graphsat/algo/print.hpp>
#include <graphsat/pattern/parser.hpp>

#include <support/egraph.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace graphsat::test {

    static constexpr const char *tensor_rules = R"(
# rules of elementwise operations
[set ewadd]
commutativity:
  - (ewadd ?x ?y)
  - (ewadd ?y ?x)

associativity <=>:
  - (ewadd ?x (ewadd ?y ?z))
  - (ewadd (ewadd ?x ?y) ?z)

[activation]
relu idempotence:   # trailing comment
  - (relu (relu ?x))
  - (relu ?x)

matmul of sums:
  - (ewadd (matmul ?a ?x ?y) (matmul ?a ?x ?z))
  - (matmul ?a ?x (ewadd ?y ?z))
  - when (same_shape ?y ?z)
  - when (has_rank ?x 2)
)";

    TEST_SUITE("graphsat::rule-files") {

    TEST_CASE("sets of rules") {
        auto sets = parse_rules_string(tensor_rules);
        REQUIRE_EQ(sets.size(), 2);

        CHECK_EQ(sets[0].name, "ewadd");
        REQUIRE_EQ(sets[0].rules.size(), 2);
        CHECK_EQ(sets[0].rules[0].name, "commutativity");
        CHECK(!sets[0].rules[0].bidirectional);
        CHECK_EQ(sets[0].rules[1].name, "associativity");
        CHECK(sets[0].rules[1].bidirectional);

        CHECK_EQ(sets[1].name, "activation");
        REQUIRE_EQ(sets[1].rules.size(), 2);
        CHECK_EQ(sets[1].rules[0].name, "relu idempotence");
        CHECK_EQ(to_string(sets[1].rules[0].lhs), "(relu (relu ?x))");

        const auto &guarded = sets[1].rules[1];
        REQUIRE_EQ(guarded.guards.size(), 2);
        CHECK_EQ(guarded.guards[0].predicate, "same_shape");
        CHECK_EQ(guarded.guards[1].predicate, "has_rank");

        CHECK_EQ(active_rules(sets).size(), 5);
        CHECK_EQ(all_rules(sets).size(), 4);
    }

    TEST_CASE("default set") {
        auto sets = parse_rules_string(
            "identity:\n"
            "  - (mul ?x 1)\n"
            "  - ?x\n"
            "[set later]\n"
        );

        REQUIRE_EQ(sets.size(), 2);
        CHECK_EQ(sets[0].name, "default");
        CHECK_EQ(sets[0].rules.size(), 1);
        CHECK_EQ(sets[1].name, "later");
        CHECK(sets[1].rules.empty());

        CHECK(parse_rules_string("# nothing here\n\n").empty());
    }

    TEST_CASE("malformed rule files") {
        // missing right-hand side
        CHECK_THROWS_AS(parse_rules_string("r:\n  - (relu ?x)\n"), parse_error);

        // pattern without a rule
        CHECK_THROWS_AS(parse_rules_string("  - (relu ?x)\n"), parse_error);

        CHECK_THROWS_AS(parse_rules_string("[set broken\n"), parse_error);
        CHECK_THROWS_AS(parse_rules_string("r:\n  - (relu ?x\n  - ?x\n"), parse_error);
        CHECK_THROWS_AS(parse_rules_string(":\n  - (relu ?x)\n  - ?x\n"), parse_error);
        CHECK_THROWS_AS(parse_rules_string("r:\n  - (relu ?x)\n  - ?x\n  - when relu\n"), parse_error);

        try {
            parse_rules_string("[set a]\n\nr:\n  - (relu ?x)\n  relu\n");
            FAIL("expected parse error");
        } catch (const parse_error &err) {
            CHECK(std::string(err.what()).starts_with("line 5:"));
        }

        // well-formed rule that binds nothing on its right-hand side
        CHECK_THROWS_AS(parse_rules_string("r:\n  - (relu ?x)\n  - ?y\n"), rule_error);

        CHECK_THROWS_AS(parse_rules(std::string("/nonexistent/rules.txt")), parse_error);
    }

    TEST_CASE("terms") {
        std::istringstream multiline(
            "# input of the network\n"
            "(relu\n"
            "  (input x@2_2))  # activation\n"
        );
        CHECK_EQ(read_term(multiline), "(relu (input x@2_2))");

        std::istringstream empty("# only comments\n\n");
        CHECK_THROWS_AS(read_term(empty), parse_error);

        CHECK_THROWS_AS(read_term(std::string("/nonexistent/term.txt")), parse_error);
    }

    } // test suite: graphsat::rule-files

    TEST_SUITE("graphsat::printing") {

    TEST_CASE("dot output") {
        test_graph egraph;
        auto idx = make_node(egraph, "x");
        auto idy = make_node(egraph, "y");
        make_node(egraph, "add", {idx, idy});

        auto path = std::filesystem::temp_directory_path() / "graphsat-unit-dot-output.dot";
        to_dot(egraph, path.string());

        std::ifstream file(path);
        std::stringstream contents;
        contents << file.rdbuf();
        auto dot = contents.str();

        CHECK(dot.starts_with("digraph egraph {"));
        CHECK_NE(dot.find("label=\"add\""), std::string::npos);
        CHECK_NE(dot.find("->"), std::string::npos);
        CHECK(dot.ends_with("}\n"));

        std::filesystem::remove(path);
    }

    TEST_CASE("unwritable dot output") {
        test_graph egraph;
        make_node(egraph, "x");

        CHECK_THROWS_AS(to_dot(egraph, "/nonexistent-graphsat-dir/egraph.dot"), std::system_error);
    }

    } // test suite: graphsat::printing

} // namespace graphsat::test
