/*
 * Copyright (c) 2022 Trail of Bits, Inc.
 */

#pragma once

#include <graphsat/core/egraph.hpp>

#include <gap/core/graph.hpp>

#include <spdlog/spdlog.h>

#include <fmt/format.h>
#include <fmt/os.h>

#include <cstdint>
#include <string>

namespace graphsat
{
    namespace detail {

        //
        // graph formatter
        //
        template< typename node_format, typename edge_format >
        struct graph_printer {
            graph_printer(const std::string &path, node_format &format_node, edge_format &format_edge)
                : out(fmt::output_file(path))
                , format_node(format_node)
                , format_edge(format_edge)
            {
                out.print("digraph egraph {{\n  compound=true\n  clusterrank=local\n");
            }

            ~graph_printer() { out.print("}}\n"); }

            void print_node(const gap::graph::node_like auto &node) {
                format_node(out, node);
            }

            void print_edge(const gap::graph::edge_like auto &edge) {
                format_edge(out, edge);
            }

            template< typename... args_t >
            void print(fmt::format_string< args_t... > fmt, args_t &&... args) {
                out.print(fmt, std::forward< args_t >(args)...);
            }

            fmt::ostream out;

            node_format &format_node;
            edge_format &format_edge;
        };

        //
        // eclass formatter
        //
        template< typename printer, typename eclass >
        struct print_eclass {
            print_eclass(printer &out, const eclass &pair)
                : out(out)
            {
                const auto &[handle, cls] = pair;
                out.print("  subgraph cluster_{} {{\n  style=dotted\n  label=\"{}\"\n", handle.id, handle.id);

                for (auto node : cls.nodes) {
                    out.print_node(*node);
                }
            }

            ~print_eclass() { out.print("  }}\n"); }

            printer &out;
        };

    } // namespace detail

    // Writes eclasses as clusters of their enodes, edges lead from an enode
    // to the first enode of the child eclass.
    void to_dot(const gap::graph::graph_like auto &egraph, const std::string &path) {
        spdlog::info("[graphsat] printing to dot {}", path);

        auto node_identifier = [&] (const gap::graph::node_like auto &node) {
            return fmt::format("n{}_{}"
                , egraph.find(&node).id
                , egraph.origin(&node).id
            );
        };

        auto class_identifier = [&] (graph::node_handle handle) {
            return node_identifier(*egraph.eclass(handle).nodes.front());
        };

        auto format_node = [&] (fmt::ostream &out, const gap::graph::node_like auto &node) {
            out.print("    {} [label=\"{}\"]\n"
                , node_identifier(node)
                , node_name(node.data)
            );
        };

        auto format_edge = [&] (fmt::ostream &out, const gap::graph::edge_like auto &edge) {
            out.print("  {} -> {} [lhead=cluster_{}]\n"
                , node_identifier(*edge.source())
                , class_identifier(edge.target())
                , edge.target().id
            );
        };

        detail::graph_printer out(path, format_node, format_edge);

        for (const auto &cls : egraph.eclasses()) {
            detail::print_eclass(out, cls);
        }

        for (const auto &edge : egraph.edges()) {
            out.print_edge(edge);
        }
    }

} // namespace graphsat
