/*
 * Copyright (c) 2022-Present Trail of Bits, Inc.
 */

#pragma once

#include <graphsat/pattern/rewrite_rule.hpp>
#include <graphsat/algo/ematch.hpp>
#include <graphsat/algo/saturation_graph.hpp>
#include <graphsat/algo/synthesis.hpp>
#include <graphsat/core/egraph.hpp>
#include <graphsat/core/error.hpp>

#include <spdlog/spdlog.h>

namespace graphsat {

    template< gap::graph::graph_like egraph >
    struct applier {
        using data_type = typename egraph::data_type;

        bool check(const guard_expr &guard) const {
            graph::guard_arguments< data_type > args;
            for (const auto &arg : guard.arguments) {
                if (auto place = std::get_if< place_t >(&arg)) {
                    auto idx = std::uint32_t(place_index(*place, rule.places));
                    args.emplace_back(&graph.data(where.bound(idx)));
                } else {
                    args.emplace_back(std::get< constant_t >(arg).ref());
                }
            }
            return graph.analysis().check_guard(guard.predicate, args);
        }

        bool guarded() const {
            for (const auto &guard : rule.guards) {
                if (!check(guard)) {
                    return false;
                }
            }
            return true;
        }

        // returns true if the application unified two distinct eclasses
        bool apply() {
            if (!guarded()) {
                spdlog::debug("[graphsat] guard of {} rejected {}", rule.name, to_string(where));
                return false;
            }

            auto root = graph.find(where.root);

            node_handle patch = root;
            try {
                patch = synthesize(rule.rhs, rule, where, graph);
            } catch (const analysis_error &err) {
                spdlog::debug("[graphsat] skipping {} at {}: {}", rule.name, root.id, err.what());
                return false;
            }

            if (graph.find(patch) == root) {
                return false;
            }

            try {
                graph.merge(root, patch);
            } catch (const merge_conflict &) {
                spdlog::error("[graphsat] rule {} merged incompatible eclasses", rule.name);
                throw;
            }

            return true;
        }

        applier(const rewrite_rule &rule, const match_result &where, saturable_egraph< egraph > &graph)
            : rule(rule), where(where), graph(graph)
        {}

        const rewrite_rule &rule;
        const match_result &where;
        saturable_egraph< egraph > &graph;
    };

    template< gap::graph::graph_like egraph >
    bool apply(
        const rewrite_rule &rule,
        const match_result &where,
        saturable_egraph< egraph > &graph
    ) {
        spdlog::debug("[graphsat] applying rule {} at {}", rule.name, to_string(where));
        return applier< egraph >(rule, where, graph).apply();
    }

    //
    // Applies all matches of a rule, returns the number of applications
    // that unified two eclasses.
    //
    template< gap::graph::graph_like egraph >
    std::size_t apply_matches(
        const rewrite_rule &rule,
        const std::vector< match_result > &matches,
        saturable_egraph< egraph > &graph
    ) {
        std::size_t applied = 0;
        for (const auto &m : matches) {
            if (apply(rule, m, graph)) {
                ++applied;
            }
        }
        return applied;
    }

} // namespace graphsat
