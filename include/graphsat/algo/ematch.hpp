/*
 * Copyright (c) 2022 Trail of Bits, Inc.
 */

#pragma once

#include <graphsat/pattern/rewrite_rule.hpp>
#include <graphsat/core/egraph.hpp>

#include <gap/core/dense_map.hpp>
#include <gap/core/overloads.hpp>
#include <gap/core/recursive_generator.hpp>

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <span>
#include <string>

namespace graphsat
{
    using graph::node_handle;

    struct maybe_node_handle {
        explicit maybe_node_handle() : _handle(0) {}
        explicit maybe_node_handle(node_handle handle)
            : _handle(handle.id + 1)
        {}

        node_handle handle() const { return node_handle(id()); }
        node_id_t id() const { return node_id_t( _handle - 1 ); }

        constexpr auto operator<=>(const maybe_node_handle& other) const = default;

    private:
        node_id_t _handle;
    };

    //
    // match result, places are indexed by their position in the pattern
    //
    using matched_places_t = gap::dense_map< std::uint32_t, maybe_node_handle >;

    struct match_result {
        // eclass matched by the root of the pattern
        node_handle root;
        matched_places_t matched_places;

        node_handle bound(std::uint32_t idx) const {
            return matched_places.at(idx).handle();
        }
    };

    static inline std::string to_string(const matched_places_t& places) {
        std::string result;
        for (const auto &[idx, handle] : places) {
            result += fmt::format(" {} -> {}", idx, handle.id());
        }
        return result;
    }

    static inline std::string to_string(const match_result& m) {
        return fmt::format("match: {} [{} ]", m.root.id, to_string(m.matched_places));
    }

    using match_generator = gap::recursive_generator< match_result >;

    //
    // Matches a pattern against eclasses of a graph. A place binds a whole
    // eclass, the other atoms match if some enode of the eclass does.
    // Results are produced in the ascending order of root eclasses, the
    // graph must not change while a generator is alive.
    //
    template< gap::graph::graph_like egraph >
    struct matcher {
        using node_type = typename egraph::node_type;

        using patterns_t = std::span< const simple_expr >;
        using handles_t  = std::span< const node_handle >;

        match_generator match(constant_t c, node_handle eclass, matched_places_t matched) {
            for (auto node : graph.eclass(eclass).nodes) {
                if (auto con = extract_constant(node->data); con && con.value() == c.ref()) {
                    co_yield { eclass, std::move(matched) };
                    co_return;
                }
            }
        }

        match_generator match(symbol_t s, node_handle eclass, matched_places_t matched) {
            for (auto node : graph.eclass(eclass).nodes) {
                if (auto sym = extract_symbol(node->data); sym && sym.value() == s.ref()) {
                    co_yield { eclass, std::move(matched) };
                    co_return;
                }
            }
        }

        // nullary operation
        match_generator match(operation_t o, node_handle eclass, matched_places_t matched) {
            for (auto node : graph.eclass(eclass).nodes) {
                if (node->num_of_children() == 0 && node_name(node->data) == o.ref()) {
                    co_yield { eclass, std::move(matched) };
                    co_return;
                }
            }
        }

        match_generator match(place_t p, node_handle eclass, matched_places_t matched) {
            auto id = std::uint32_t(place_index(p, places));
            if (auto it = matched.find(id); it != matched.end()) {
                // repeated place has to bind the same eclass
                if (it->second.handle() == eclass) {
                    co_yield { eclass, std::move(matched) };
                }
                co_return;
            }

            matched.emplace(id, maybe_node_handle(eclass));
            co_yield { eclass, std::move(matched) };
        }

        match_generator match(const atom_t &a, node_handle eclass, matched_places_t matched) {
            const atom_base &base = a;
            co_yield std::visit([&] (const auto &atom) -> match_generator {
                co_yield match(atom, eclass, std::move(matched));
            }, base);
        }

        match_generator match_children(
            patterns_t pattern_children, handles_t node_children, matched_places_t matched
        ) {
            auto front = match(pattern_children.front(), node_children.front(), std::move(matched));

            if (pattern_children.size() == 1) {
                co_yield front;
            } else {
                for (auto m : front) {
                    co_yield match_children(
                        pattern_children.subspan(1), node_children.subspan(1),
                        std::move(m.matched_places)
                    );
                }
            }
        }

        //
        // match list piecewise, each enode of the eclass is an alternative
        //
        match_generator match(const expr_list &list, node_handle eclass, matched_places_t matched) {
            const auto &op = std::get< operation_t >(std::get< atom_t >(list.front())).ref();
            auto pattern_children = patterns_t(list).subspan(1);

            // nodes are copied since the generator outlives the eclass reference
            auto nodes = graph.eclass(eclass).nodes;
            for (auto node : nodes) {
                if (node_name(node->data) != op) {
                    continue;
                }

                if (pattern_children.size() != node->num_of_children()) {
                    continue;
                }

                const auto &node_children = node->arguments();
                for (auto m : match_children(pattern_children, node_children, matched)) {
                    co_yield { eclass, std::move(m.matched_places) };
                }
            }
        }

        match_generator match(const simple_expr &e, node_handle eclass, matched_places_t matched) {
            const simple_expr_base &base = e;
            co_yield std::visit([&] (const auto &a) -> match_generator {
                co_yield match(a, eclass, std::move(matched));
            }, base);
        }

        //
        // generate matches of the pattern for whole egraph
        //
        match_generator match() {
            for (const auto &[handle, _] : graph.eclasses()) {
                for (auto m : match(pattern, handle, matched_places_t{})) {
                    if (m.matched_places.size() == places.size()) {
                        spdlog::debug("[graphsat] {}", to_string(m));
                        co_yield std::move(m);
                    }
                }
            }
        }

        matcher(const match_pattern &pattern, const egraph &graph)
            : pattern(pattern), graph(graph), places(gather_places(pattern))
        {}

        matcher(const rewrite_rule &rule, const egraph &graph)
            : matcher(rule.lhs, graph)
        {}

        const match_pattern &pattern;
        const egraph &graph;
        places_t places;
    };

    template< gap::graph::graph_like egraph >
    match_generator match(const match_pattern &pattern, const egraph &graph) {
        matcher< egraph > m(pattern, graph);
        co_yield m.match();
    }

    template< gap::graph::graph_like egraph >
    match_generator match(const rewrite_rule &rule, const egraph &graph) {
        spdlog::debug("[graphsat] match rule {}", rule.name);
        co_yield match(rule.lhs, graph);
    }

} // namespace graphsat
