/*
 * Copyright (c) 2022-present Trail of Bits, Inc.
 */

#pragma once

#include <graphsat/core/common.hpp>
#include <graphsat/core/egraph.hpp>
#include <graphsat/core/error.hpp>
#include <graphsat/core/term.hpp>

#include <gap/core/graph.hpp>
#include <gap/core/memoize.hpp>

#include <deque>
#include <map>
#include <vector>

#include <spdlog/spdlog.h>

namespace graphsat {

    // result of a cost oracle for a single operator application
    template< typename data_type >
    struct evaluation {
        cost_t cost;
        data_type data;
    };

    template< typename storage, typename data_type >
    struct extraction_result {
        term< storage > root;
        cost_t cost;
        data_type data;
    };

    //
    // Greedy extraction, every eclass picks the enode with the minimal sum
    // of its own cost and the costs of the chosen children. The cost of an
    // enode is given by the oracle evaluated on the data of the chosen
    // children. Ties are resolved by the creation order of enodes.
    //
    // `oracle_t` provides `evaluate(storage, std::vector< const data_type * >)`
    // returning `evaluation< data_type >`, or throwing `analysis_error` if
    // the operation is not applicable to the children.
    //
    template< gap::graph::graph_like base_graph, typename oracle_t >
    struct cost_graph {

        using node_type    = typename base_graph::node_type;
        using storage_type = typename base_graph::storage_type;
        using node_pointer = typename base_graph::node_pointer;

        using data_type = typename oracle_t::data_type;

        using term_type   = term< storage_type >;
        using result_type = extraction_result< storage_type, data_type >;

        // Evaluated enode together with the evaluations of its children.
        // Records are never modified, a record only refers to records
        // created before it.
        struct cost_node {
            cost_t cost;
            node_pointer node;
            data_type data;
            std::vector< const cost_node * > children;
        };

        using cost_node_pointer = const cost_node *;
        using children_costs    = std::vector< cost_node_pointer >;

        // nullptr if the oracle rejects the enode
        struct evaluator {
            cost_node_pointer operator()(node_pointer node, children_costs children) const {
                cost_t children_cost = 0;
                std::vector< const data_type * > args;
                for (auto child : children) {
                    children_cost += child->cost;
                    args.push_back(&child->data);
                }

                try {
                    auto eval = oracle->evaluate(node->data, args);
                    return &records->emplace_back(cost_node{
                        eval.cost + children_cost, node, std::move(eval.data), std::move(children)
                    });
                } catch (const analysis_error &err) {
                    spdlog::debug("[graphsat] oracle rejected {}: {}", node_name(node->data), err.what());
                    return nullptr;
                }
            }

            const oracle_t *oracle;
            std::deque< cost_node > *records;
        };

        using memoized_cost_function = decltype(
            gap::memoize(std::declval< evaluator >())
        );

        cost_graph(const base_graph &graph, const oracle_t &oracle)
            : graph(graph)
            , cost_function(gap::memoize(evaluator{ &oracle, &records }))
        {
            // fixpoint is reached at the latest after each enode was chosen once
            auto limit = graph.num_of_nodes() + 1;
            std::size_t passes = 0;
            while (update() && ++passes <= limit) {}

            spdlog::debug("[graphsat] extraction resolved {} of {} eclasses after {} passes"
                , optimal_nodes.size(), graph.num_of_eclasses(), passes
            );
        }

        cost_graph(const cost_graph &) = delete;
        cost_graph &operator=(const cost_graph &) = delete;

        cost_node_pointer minimal_cost(graph::node_handle handle) const {
            if (auto it = optimal_nodes.find(graph.find(handle)); it != optimal_nodes.end())
                return it->second;
            return nullptr;
        }

        result_type extract(graph::node_handle handle) const {
            auto root = graph.find(handle);
            auto best = minimal_cost(root);
            if (!best) {
                throw extraction_error(root.id, "no enode of the eclass is resolvable");
            }

            return { extract_term(best), best->cost, best->data };
        }

      private:

        cost_node_pointer evaluate(graph::node_handle handle, node_pointer node) {
            children_costs children;
            for (auto child : node->arguments()) {
                child = graph.find(child);
                // enode that depends on its own eclass never improves it
                if (child == handle) {
                    return nullptr;
                }

                auto it = optimal_nodes.find(child);
                if (it == optimal_nodes.end()) {
                    return nullptr;
                }

                children.push_back(it->second);
            }

            return cost_function(node, std::move(children));
        }

        bool better(cost_node_pointer lhs, cost_node_pointer rhs) const {
            if (lhs->cost != rhs->cost)
                return lhs->cost < rhs->cost;
            return graph.origin(lhs->node) < graph.origin(rhs->node);
        }

        bool update() {
            bool changed = false;
            for (const auto &[handle, eclass] : graph.eclasses()) {
                for (auto node : eclass.nodes) {
                    auto candidate = evaluate(handle, node);
                    if (!candidate) {
                        continue;
                    }

                    auto [it, inserted] = optimal_nodes.try_emplace(handle, candidate);
                    if (inserted) {
                        changed = true;
                        continue;
                    }

                    // the chosen enode is replaced by its evaluation on
                    // cheaper children
                    auto current = it->second;
                    if (current != candidate && (current->node == candidate->node || better(candidate, current))) {
                        it->second = candidate;
                        changed = true;
                    }
                }
            }
            return changed;
        }

        static term_type extract_term(cost_node_pointer best) {
            term_type result{ best->node->data, {} };
            for (auto child : best->children) {
                result.children.push_back(extract_term(child));
            }
            return result;
        }

        const base_graph &graph;

        std::deque< cost_node > records;
        memoized_cost_function cost_function;

        std::map< graph::node_handle, cost_node_pointer > optimal_nodes;
    };

    template< gap::graph::graph_like base_graph, typename oracle_t >
    auto extract(const base_graph &graph, graph::node_handle root, const oracle_t &oracle) {
        cost_graph< base_graph, oracle_t > costs(graph, oracle);
        auto result = costs.extract(root);
        spdlog::debug("[graphsat] extracted term with cost {}", result.cost);
        return result;
    }

} // namespace graphsat
