/*
 * Copyright (c) 2022-Present Trail of Bits, Inc.
 */

#pragma once

#include <graphsat/algo/saturation.hpp>
#include <graphsat/algo/synthesis.hpp>
#include <graphsat/core/cost_graph.hpp>
#include <graphsat/core/term.hpp>

#include <span>
#include <type_traits>

#include <spdlog/spdlog.h>

namespace graphsat {

    template< typename storage, typename data_type >
    struct optimization_result {
        term< storage > root;
        cost_t cost;
        cost_t original_cost;
        data_type data;
        stop_reason reason;
        std::size_t rounds;
    };

    //
    // Saturates the graph of the input term by the axioms and extracts
    // the cheapest equivalent term.
    //
    template< typename egraph, typename oracle_t >
    auto optimize(
        const simple_expr &input,
        std::span< const rewrite_rule > axioms,
        const oracle_t &oracle,
        egraph &&graph,
        const saturation_config &config,
        const std::type_identity_t< saturation_observer< egraph > > &observe = {}
    ) {
        using storage_type = typename egraph::storage_type;
        using data_type    = typename oracle_t::data_type;
        using result_type  = optimization_result< storage_type, data_type >;

        auto root = synthesize(input, graph);
        auto original = extract(graph, root, oracle);
        spdlog::debug("[graphsat] input term costs {}", original.cost);

        auto [result, reason, rounds] = saturate(
            saturable_egraph< egraph >(std::move(graph)), axioms, config
        );

        if (observe) {
            observe(result);
        }

        auto best = extract(result, root, oracle);
        spdlog::info("[graphsat] optimized cost {} -> {}, {} after {} rounds",
            original.cost, best.cost, to_string(reason), rounds
        );

        return result_type{
            std::move(best.root), best.cost, original.cost, std::move(best.data), reason, rounds
        };
    }

} // namespace graphsat
