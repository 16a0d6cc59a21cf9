/*
 * Copyright (c) 2021 Trail of Bits, Inc.
 */

#pragma once

#include <graphsat/core/common.hpp>

#include <cstddef>
#include <vector>

namespace graphsat
{
    //
    // Disjoint sets over densely allocated ids. The caller decides which
    // root survives a merge, so the egraph can keep the class with more
    // parents canonical.
    //
    struct union_find {
        using id_t = node_id_t;

        id_t make_set() {
            auto id = id_t(_parents.size());
            _parents.push_back(id);
            return id;
        }

        id_t parent(id_t id) const { return _parents[id]; }

        id_t find(id_t id) const {
            while (id != _parents[id]) {
                id = _parents[id];
            }
            return id;
        }

        id_t find_compress(id_t id) {
            auto root = find(id);
            while (id != root) {
                auto next = _parents[id];
                _parents[id] = root;
                id = next;
            }
            return root;
        }

        // makes `root` the representative of both sets, both arguments
        // are expected to be roots
        id_t merge(id_t root, id_t child) {
            _parents[child] = root;
            return root;
        }

        std::size_t size() const { return _parents.size(); }

      private:
        std::vector< id_t > _parents;
    };

} // namespace graphsat
