/*
 * Copyright (c) 2022-Present Trail of Bits, Inc.
 */

#pragma once

#include <graphsat/algo/ematch.hpp>
#include <graphsat/algo/apply.hpp>
#include <graphsat/algo/saturation_graph.hpp>

#include <graphsat/core/egraph.hpp>

#include <graphsat/pattern/rule_set.hpp>
#include <graphsat/pattern/rewrite_rule.hpp>

#include <chrono>
#include <functional>
#include <span>
#include <string>
#include <type_traits>
#include <vector>

#include <spdlog/spdlog.h>

namespace graphsat
{
    using graph::node_handle;

    namespace action {

        struct rebuild {};

        struct match_and_apply {
            rewrite_rule rule;
        };

    } // namespace action

    template< gap::graph::graph_like egraph >
    void match_and_apply(saturable_egraph< egraph > &graph, const rewrite_rule &rule) {
        std::vector< match_result > results;
        for (auto &&m : match(rule, graph)) {
            results.push_back(std::move(m));
        }

        apply_matches(rule, results, graph);
    }

    template< gap::graph::graph_like egraph >
    saturable_egraph< egraph > apply_action(saturable_egraph< egraph > &&graph, action::rebuild) {
        graph.rebuild();
        return std::move(graph);
    }

    template< gap::graph::graph_like egraph >
    saturable_egraph< egraph > apply_action(
        saturable_egraph< egraph > &&graph, const action::match_and_apply &act
    ) {
        match_and_apply(graph, act.rule);
        return std::move(graph);
    }

    template< gap::graph::graph_like egraph, typename action_t >
    auto operator|(saturable_egraph< egraph > &&graph, action_t &&act) {
        return apply_action(std::move(graph), std::forward< action_t >(act));
    }

    // return value of equality saturation
    enum class stop_reason
    {
        saturated, goal_reached, iteration_limit, node_limit, time_limit, none
    };

    std::string to_string(stop_reason reason);

    // budget exhaustion leaves the result inconclusive
    static inline bool is_budget_exhausted(stop_reason reason) {
        return reason == stop_reason::iteration_limit
            || reason == stop_reason::node_limit
            || reason == stop_reason::time_limit;
    }

    struct saturation_config {
        std::size_t iteration_limit = 30;
        std::size_t node_limit = 100000;
        std::chrono::milliseconds time_limit = std::chrono::seconds(10);
    };

    struct round_stats {
        std::size_t index = 0;
        std::size_t matches = 0;
        std::size_t applications = 0;
        std::size_t unions = 0;
        std::size_t eclasses = 0;
        std::size_t nodes = 0;
    };

    template< gap::graph::graph_like egraph >
    struct saturation_result {
        saturable_egraph< egraph > graph;
        stop_reason reason;
        std::size_t rounds;
    };

    template< gap::graph::graph_like egraph >
    using saturation_goal = std::function< bool(const saturable_egraph< egraph > &) >;

    // observer of the graph after saturation, e.g., to print it
    template< gap::graph::graph_like egraph >
    using saturation_observer = std::function< void(const saturable_egraph< egraph > &) >;

    // Rules are checked against the analysis before the graph is touched.
    template< typename analysis_t >
    void validate_rules(std::span< const rewrite_rule > rules, const analysis_t &analysis) {
        for (const auto &rule : rules) {
            for (const auto &guard : rule.guards) {
                if (!analysis.knows_guard(guard.predicate)) {
                    throw rule_error(rule.name, "unknown guard predicate " + guard.predicate);
                }
            }
        }
    }

    //
    // step of equality saturation
    //
    // All rules are matched on the graph as it was at the beginning of the
    // step, matches are applied afterwards and the graph is rebuilt once.
    //
    template< gap::graph::graph_like egraph >
    round_stats make_step(saturable_egraph< egraph > &graph, std::span< const rewrite_rule > rules) {
        round_stats stats;

        std::vector< std::vector< match_result > > matches;
        matches.reserve(rules.size());
        for (const auto &rule : rules) {
            auto &results = matches.emplace_back();
            for (auto &&m : match(rule, graph)) {
                results.push_back(std::move(m));
            }
            stats.matches += results.size();
        }

        auto unions = graph.num_of_unions();
        for (std::size_t i = 0; i < rules.size(); ++i) {
            stats.applications += apply_matches(rules[i], matches[i], graph);
        }

        graph.rebuild();

        stats.unions   = graph.num_of_unions() - unions;
        stats.eclasses = graph.num_of_eclasses();
        stats.nodes    = graph.num_of_nodes();
        return stats;
    }

    //
    // generic saturation algorithm
    //
    template< gap::graph::graph_like egraph >
    saturation_result< egraph > saturate(
        saturable_egraph< egraph > &&graph,
        std::span< const rewrite_rule > rules,
        const saturation_config &config,
        const std::type_identity_t< saturation_goal< egraph > > &goal = {}
    ) {
        spdlog::debug("[graphsat] saturate start with {} rules", rules.size());
        validate_rules(rules, graph.analysis());

        using clock = std::chrono::steady_clock;
        auto start = clock::now();

        graph.rebuild();

        auto reached = [&] { return goal && goal(graph); };

        stop_reason status = stop_reason::none;
        std::size_t rounds = 0;

        if (reached()) {
            status = stop_reason::goal_reached;
        } else if (config.iteration_limit == 0) {
            status = stop_reason::iteration_limit;
        }

        while (status == stop_reason::none) {
            auto nodes = graph.num_of_nodes();
            auto stats = make_step(graph, rules);
            stats.index = ++rounds;

            spdlog::debug(
                "[graphsat] round {}: {} matches, {} applications, {} unions, {} eclasses, {} nodes",
                stats.index, stats.matches, stats.applications, stats.unions,
                stats.eclasses, stats.nodes
            );

            if (reached()) {
                status = stop_reason::goal_reached;
            } else if (stats.unions == 0 && stats.nodes == nodes) {
                status = stop_reason::saturated;
            } else if (rounds >= config.iteration_limit) {
                status = stop_reason::iteration_limit;
            } else if (graph.num_of_nodes() > config.node_limit) {
                status = stop_reason::node_limit;
            } else if (clock::now() - start >= config.time_limit) {
                status = stop_reason::time_limit;
            }
        }

        spdlog::debug("[graphsat] saturate stop {} after {} rounds", to_string(status), rounds);
        return { std::move(graph), status, rounds };
    }

    template< gap::graph::graph_like egraph >
    saturation_result< egraph > saturate(
        saturable_egraph< egraph > &&graph,
        std::span< const rule_set > sets,
        const saturation_config &config
    ) {
        auto rules = active_rules({ sets.begin(), sets.end() });
        return saturate(std::move(graph), std::span< const rewrite_rule >(rules), config);
    }

} // namespace graphsat
