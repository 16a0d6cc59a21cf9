/*
 * Copyright (c) 2022-Present Trail of Bits, Inc.
 */

#pragma once

#include <graphsat/core/egraph.hpp>
#include <graphsat/core/error.hpp>

#include <algorithm>
#include <set>
#include <unordered_set>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace graphsat {

    using graph::node_handle;

    //
    // Egraph that can be unified and rebuilt.
    //
    // Merges only record the modified classes, congruence and hash-consing
    // invariants are restored by a single `rebuild` for a whole batch of
    // merges.
    //
    template< gap::graph::graph_like egraph >
    struct saturable_egraph : egraph {

        using base = egraph;

        using node_type    = typename base::node_type;
        using node_pointer = typename base::node_pointer;
        using node_hash    = typename base::node_hash;
        using data_type    = typename base::data_type;

        saturable_egraph() = default;

        explicit saturable_egraph(egraph &&graph)
            : egraph(std::forward< egraph >(graph))
        {}

        using base::find;

        node_handle merge(node_handle lhs, node_handle rhs) {
            auto lid = find(lhs);
            auto rid = find(rhs);

            if (lid == rid) {
                return lid;
            }

            // the class with more parents stays canonical, so less parents
            // need to be repaired, ties keep the older class
            auto lparents = this->parents(lid).size();
            auto rparents = this->parents(rid).size();
            if (lparents < rparents || (lparents == rparents && rid < lid)) {
                std::swap(lid, rid);
            }

            auto data = merge_data(lid, rid);

            this->_unions.merge(lid.id, rid.id);
            merge_eclasses(lid, rid, std::move(data));

            _pending.push_back(lid);
            ++_num_of_unions;

            spdlog::trace("[graphsat] merged eclass {} into {}", rid.id, lid.id);
            return lid;
        }

        // Restores the egraph invariants, i.e, congruence equality and enode uniqueness
        void rebuild() {
            std::set< node_handle > touched;

            while (!_pending.empty()) {
                std::set< node_handle > todo;
                for (auto eclass : std::exchange(_pending, {})) {
                    todo.insert(find(eclass));
                }

                for (auto eclass : todo) {
                    repair(find(eclass), touched);
                }
            }

            for (auto eclass : touched) {
                deduplicate_nodes(find(eclass));
            }

            spdlog::trace("[graphsat] rebuilt egraph with {} eclasses", this->num_of_eclasses());
        }

        bool has_pending() const { return !_pending.empty(); }

        // number of successful unions since the graph was created
        std::size_t num_of_unions() const { return _num_of_unions; }

      private:

        data_type merge_data(node_handle lhs, node_handle rhs) const {
            try {
                return this->_analysis.merge(this->data(lhs), this->data(rhs));
            } catch (const analysis_error &err) {
                throw merge_conflict(
                    lhs.id, rhs.id, this->to_string(lhs), this->to_string(rhs), err.what()
                );
            }
        }

        void merge_eclasses(node_handle lhs, node_handle rhs, data_type &&data) {
            auto eclass = this->_classes.extract(rhs).mapped();
            auto &root  = this->_classes.at(lhs);

            auto middle = root.nodes.size();
            root.merge(std::move(eclass));
            root.data = std::move(data);

            // keep nodes in the order of their creation
            std::inplace_merge(
                root.nodes.begin(), std::next(root.nodes.begin(), middle), root.nodes.end(),
                [&] (auto a, auto b) { return this->origin(a) < this->origin(b); }
            );
        }

        void repair(node_handle handle, std::set< node_handle > &touched) {
            auto parents = this->eclass(handle).parents;

            for (auto parent : parents) {
                this->_memo.erase(*parent);
                this->canonicalize(*parent);
            }

            std::unordered_set< node_pointer > repaired;
            for (auto parent : parents) {
                auto parent_class = find(parent);
                touched.insert(parent_class);
                repaired.insert(parent);

                auto [it, inserted] = this->_memo.try_emplace(*parent, parent_class);
                if (!inserted && find(it->second) != parent_class) {
                    // congruent enodes live in different classes
                    it->second = merge(it->second, parent_class);
                }
            }

            // drop repaired parents that became identical, unrepaired ones
            // are still waiting in the pending list of a merged class
            auto &eclass = this->eclass(handle);
            std::unordered_set< node_type, node_hash > seen;
            std::vector< node_pointer > unique;
            for (auto parent : eclass.parents) {
                if (!repaired.count(parent) || seen.insert(*parent).second) {
                    unique.push_back(parent);
                }
            }
            eclass.parents = std::move(unique);
        }

        void deduplicate_nodes(node_handle handle) {
            auto &eclass = this->eclass(handle);

            std::unordered_set< node_type, node_hash > seen;
            std::vector< node_pointer > unique;
            for (auto node : eclass.nodes) {
                this->canonicalize(*node);
                if (seen.insert(*node).second) {
                    unique.push_back(node);
                }
            }
            eclass.nodes = std::move(unique);
        }

        // modified eclasses that needs to be rebuild
        std::vector< node_handle > _pending;

        std::size_t _num_of_unions = 0;
    };

} // namespace graphsat
