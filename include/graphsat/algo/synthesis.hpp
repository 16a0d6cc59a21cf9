/*
 * Copyright (c) 2022-Present Trail of Bits, Inc.
 */

#pragma once

#include <graphsat/algo/ematch.hpp>
#include <graphsat/core/egraph.hpp>
#include <graphsat/pattern/pattern.hpp>

#include <span>

namespace graphsat {

    using graph::node_handle;

    //
    // Instantiates a pattern in the graph, places are substituted by the
    // eclasses bound by a match.
    //
    template< gap::graph::graph_like egraph >
    struct synthesizer {

        auto synthesize_atom(const constant_t &constant) -> node_handle {
            return graph.insert(constant);
        }

        auto synthesize_atom(const symbol_t &symbol) -> node_handle {
            return graph.insert(symbol);
        }

        auto synthesize_operation(const operation_t &operation, std::span< const node_handle > children)
            -> node_handle
        {
            return graph.insert(operation, children);
        }

        auto synthesize_atom(const operation_t &operation) -> node_handle {
            return synthesize_operation(operation, {});
        }

        auto synthesize_atom(const place_t &place) -> node_handle {
            auto idx = std::uint32_t(place_index(place, places));
            if (auto it = match.matched_places.find(idx); it != match.matched_places.end()) {
                return graph.find(it->second.handle());
            }
            throw rule_error(rule, "place ?" + place.ref() + " is not bound");
        }

        auto synthesize(const atom_t &atom) -> node_handle {
            const atom_base &base = atom;
            return std::visit([&] (const auto &a) { return synthesize_atom(a); }, base);
        }

        auto synthesize(const expr_list &list) -> node_handle {
            graph::children_t children;
            for (const auto &child : std::span(list).subspan(1)) {
                children.push_back(synthesize(child));
            }

            auto op = std::get< operation_t >(std::get< atom_t >(list.front()));
            return synthesize_operation(op, children);
        }

        auto synthesize(const simple_expr &expr) -> node_handle {
            const simple_expr_base &base = expr;
            return std::visit([&] (const auto &e) { return synthesize(e); }, base);
        }

        synthesizer(
              std::string_view rule
            , const places_t &plc
            , const match_result &m
            , egraph &g
        )
            : rule(rule), places(plc), match(m), graph(g)
        {}

        std::string rule;
        const places_t &places;
        const match_result &match;
        egraph &graph;
    };

    template< gap::graph::graph_like egraph >
    auto synthesize(
        const apply_pattern &pattern,
        const rewrite_rule &rule,
        const match_result &match,
        egraph &graph
    ) -> node_handle {
        return synthesizer(rule.name, rule.places, match, graph).synthesize(pattern);
    }

    //
    // Inserts a ground pattern, e.g., an input term, into the graph.
    //
    template< gap::graph::graph_like egraph >
    auto synthesize(const simple_expr &expr, egraph &graph) -> node_handle {
        if (!is_ground(expr)) {
            throw parse_error("term contains pattern variables: " + to_string(expr));
        }

        places_t none;
        match_result empty{ node_handle(0), {} };
        return synthesizer("<term>", none, empty, graph).synthesize(expr);
    }

} // namespace graphsat
