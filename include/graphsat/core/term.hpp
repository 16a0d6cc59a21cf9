/*
 * Copyright (c) 2022 Trail of Bits, Inc.
 */

#pragma once

#include <graphsat/core/egraph.hpp>

#include <string>
#include <vector>

namespace graphsat
{
    //
    // Tree of operator applications, a result of extraction.
    //
    template< typename storage >
    struct term {
        storage data;
        std::vector< term > children;

        bool operator==(const term &other) const = default;
    };

    template< typename storage >
    std::string to_string(const term< storage > &t) {
        auto name = node_name(t.data);
        if (t.children.empty()) {
            return name;
        }

        std::string result = "(" + name;
        for (const auto &child : t.children) {
            result += " " + to_string(child);
        }
        return result + ")";
    }

    template< typename storage >
    std::size_t size(const term< storage > &t) {
        std::size_t result = 1;
        for (const auto &child : t.children) {
            result += size(child);
        }
        return result;
    }

    // inserts children first, identical subterms share eclasses
    template< typename egraph, typename storage >
    graph::node_handle insert(egraph &graph, const term< storage > &t) {
        graph::children_t children;
        for (const auto &child : t.children) {
            children.push_back(insert(graph, child));
        }

        auto data = t.data;
        return graph.insert(std::move(data), children);
    }

} // namespace graphsat
