/*
 * Copyright (c) 2021 Trail of Bits, Inc.
 */

#pragma once

#include <graphsat/core/common.hpp>
#include <graphsat/core/error.hpp>
#include <graphsat/core/union_find.hpp>
#include <graphsat/pattern/pattern.hpp>

#include <gap/core/generator.hpp>
#include <gap/core/graph.hpp>
#include <gap/core/hash.hpp>

#include <algorithm>
#include <compare>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include <spdlog/spdlog.h>

namespace graphsat::graph
{
    struct node_handle {
        explicit node_handle(node_id_t id) : id(id) {}

        node_id_t id;

        constexpr bool operator==(const node_handle& other) const = default;
        constexpr auto operator<=>(const node_handle& other) const = default;
    };

    static inline gap::hash_code hash_value(gap::hash_code code, const node_handle& val) {
        return gap::hash_combine( code,
            gap::hash_code( std::hash< node_id_t >{}(val.id) )
        );
    }

    using children_t = std::vector< node_handle >;

    //
    // enode
    //
    struct base {
        using child_type = node_handle;

        gap::generator< node_handle > children() const {
            for (auto ch : _children)
                co_yield ch;
        }

        const children_t &arguments() const { return _children; }

        std::size_t num_of_children() const { return _children.size(); }

        template< typename Fn >
        void update_children(Fn &&fn) {
            std::transform(_children.begin(), _children.end(), _children.begin(), std::forward< Fn >(fn));
        }

        children_t _children;
    };

    static_assert(gap::graph::node_like< base >);

    template< typename storage >
    struct node : base {
        using node_pointer = node *;
        using const_node_pointer = node const*;
        using storage_type = storage;

        explicit node(storage &&data) : data(std::move(data)) {}

        node(storage &&data, children_t &&children)
            : data(std::move(data))
        {
            _children = std::move(children);
        }

        bool operator==(const node &other) const {
            return data == other.data && _children == other._children;
        }

        storage data;
    };

    template< typename storage >
    std::string node_name(const node< storage > &n) {
        return node_name(n.data);
    }

    template< typename storage >
    gap::hash_code hash_value(gap::hash_code code, const node< storage > &n) {
        code = gap::hash_combine( code,
            gap::hash_code( std::hash< std::string >{}(node_name(n.data)) )
        );

        for (auto ch : n._children) {
            code = hash_value(code, ch);
        }

        return code;
    }

    //
    // eclass
    //
    template< typename enode_pointer, typename data_type >
    struct eclass {
        void merge(eclass &&other) {
            std::move(other.nodes.begin(), other.nodes.end(), std::back_inserter(nodes));
            std::move(other.parents.begin(), other.parents.end(), std::back_inserter(parents));
        }

        std::size_t size() const { return nodes.size(); }

        bool operator==(const eclass&) const = default;

        std::vector< enode_pointer > nodes;
        std::vector< enode_pointer > parents;
        data_type data;
    };

    template< typename enode_pointer, typename data_type >
    static eclass< enode_pointer, data_type > singleton_eclass(enode_pointer node, data_type &&data) {
        return {{ node }, {}, std::move(data)};
    }

    // argument of a guard predicate, data of a bound eclass or a literal
    template< typename data_type >
    using guard_argument = std::variant< const data_type *, std::int64_t >;

    template< typename data_type >
    using guard_arguments = std::vector< guard_argument< data_type > >;

    //
    // Analysis that carries no information, every merge is compatible.
    //
    struct no_analysis {
        using data_type = std::monostate;

        template< typename storage >
        data_type make(const storage &, const std::vector< const data_type * > &) const {
            return {};
        }

        data_type merge(const data_type &, const data_type &) const { return {}; }

        bool knows_guard(std::string_view) const { return false; }

        bool check_guard(std::string_view, const guard_arguments< data_type > &) const {
            return true;
        }
    };

    //
    // egraph edge, from an enode to the eclass of its child
    //
    template< typename enode >
    struct edge {
        using node_type    = enode;
        using node_pointer = typename node_type::const_node_pointer;
        using source_type  = node_pointer;
        using target_type  = node_handle;

        source_type source() const { return src; }
        target_type target() const { return tgt; }

        node_pointer src;
        node_handle tgt;
    };

    //
    // egraph
    //
    // Nodes are owned by an arena and never deleted, eclasses are addressed
    // by their canonical handle. Enodes inserted through `insert` are
    // hash-consed, i.e., an enode with the same operation and the same
    // canonical children is never added twice.
    //
    template< typename enode, typename analysis_t = no_analysis >
    struct egraph {
        using node_type    = enode;
        using storage_type = typename node_type::storage_type;
        using node_pointer = typename node_type::node_pointer;
        using const_node_pointer = typename node_type::const_node_pointer;

        using analysis_type = analysis_t;
        using data_type     = typename analysis_t::data_type;

        using edge_type      = edge< node_type >;
        using eclass_type    = eclass< node_pointer, data_type >;
        using eclass_pointer = eclass_type *;

        using handle_hash  = gap::hash< node_handle >;
        using node_hash    = gap::hash< node_type >;
        using eclass_map   = std::map< node_handle, eclass_type >;

        egraph() = default;

        explicit egraph(analysis_t analysis) : _analysis(std::move(analysis)) {}

        egraph(egraph &&)            = default;
        egraph &operator=(egraph &&) = default;

        egraph(const egraph &)            = delete;
        egraph &operator=(const egraph &) = delete;

        gap::generator< const_node_pointer > nodes() const {
            for (const auto &node : _nodes)
                co_yield node.get();
        }

        gap::generator< edge_type > edges() const {
            for (const auto &node : _nodes) {
                if (!is_live(node.get()))
                    continue;
                for (auto ch : node->children()) {
                    co_yield edge_type{ node.get(), find(ch) };
                }
            }
        }

        using eclass_pair = typename eclass_map::value_type;

        // canonical eclasses ordered by their handles
        gap::generator< const eclass_pair & > eclasses() const {
            for (const auto &pair : _classes)
                co_yield pair;
        }

        std::size_t num_of_eclasses() const { return _classes.size(); }

        std::size_t num_of_nodes() const { return _nodes.size(); }

        node_handle find(const_node_pointer ptr) const {
            return find(_ids.at(ptr));
        }

        node_handle find(node_handle node) const {
            return node_handle( _unions.find_compress(node.id) );
        }

        // the handle of the eclass the node was created in, it also orders
        // nodes by their creation
        node_handle origin(const_node_pointer ptr) const { return _ids.at(ptr); }

        void canonicalize(node_type &node) const {
            node.update_children([&] (node_handle child) { return find(child); });
        }

        std::optional< node_handle > lookup(node_type node) const {
            canonicalize(node);
            if (auto it = _memo.find(node); it != _memo.end())
                return find(it->second);
            return std::nullopt;
        }

        node_handle insert(storage_type &&data, std::span< const node_handle > children) {
            node_type candidate(std::move(data), children_t(children.begin(), children.end()));
            canonicalize(candidate);

            if (auto it = _memo.find(candidate); it != _memo.end()) {
                return find(it->second);
            }

            return find(add_node(std::move(candidate)));
        }

        const eclass_type &eclass(node_handle handle) const { return _classes.at(find(handle)); }
        eclass_type &eclass(node_handle handle) { return _classes.at(find(handle)); }

        const data_type &data(node_handle handle) const { return eclass(handle).data; }

        const auto& parents(node_handle handle) const {
            return eclass(handle).parents;
        }

        const analysis_t &analysis() const { return _analysis; }

        // renders a representative term of the eclass, nested classes are
        // cut at `depth`
        std::string to_string(node_handle handle, std::size_t depth = 4) const {
            const auto &node = *eclass(handle).nodes.front();
            auto name = node_name(node.data);
            if (node.num_of_children() == 0) {
                return name;
            }

            if (depth == 0) {
                return "(" + name + " ...)";
            }

            std::string result = "(" + name;
            for (auto ch : node.arguments()) {
                result += " " + to_string(ch, depth - 1);
            }
            return result + ")";
        }

        // checks the hash-consing and canonicity invariants
        bool is_canonical() const {
            std::unordered_map< node_type, node_handle, node_hash > seen;
            for (const auto &[handle, cls] : _classes) {
                for (auto node : cls.nodes) {
                    node_type copy = *node;
                    canonicalize(copy);
                    if (!(copy == *node)) {
                        return false;
                    }

                    auto [it, inserted] = seen.try_emplace(std::move(copy), handle);
                    if (!inserted && it->second != handle) {
                        return false;
                    }
                }
            }
            return true;
        }

      protected:

        bool is_live(const_node_pointer node) const {
            const auto &nodes = eclass(find(node)).nodes;
            return std::find(nodes.begin(), nodes.end(), node) != nodes.end();
        }

        void add_parent(node_handle eclass, node_pointer parent) {
            auto &parents = _classes.at(find(eclass)).parents;
            if (parents.empty() || parents.back() != parent) {
                parents.push_back(parent);
            }
        }

        data_type make_data(const node_type &node) const {
            std::vector< const data_type * > args;
            for (auto ch : node.arguments()) {
                args.push_back(&eclass(ch).data);
            }
            return _analysis.make(node.data, args);
        }

        node_pointer add_node(node_type &&candidate) {
            // analysis may reject the node, nothing is modified until it succeeds
            auto data = make_data(candidate);

            auto node = _nodes.emplace_back(
                std::make_unique< node_type >(std::move(candidate))
            ).get();

            node_handle id{ _unions.make_set() };

            _classes.emplace(id, singleton_eclass(node, std::move(data)));
            _ids.emplace(node, id);
            _memo.emplace(*node, id);

            for (auto ch : node->arguments()) {
                add_parent(ch, node);
            }

            spdlog::trace("[graphsat] new eclass {} for {}", id.id, node_name(node->data));
            return node;
        }

        // stores heap allocated nodes of egraph
        std::vector< std::unique_ptr< node_type > > _nodes;

        // stores equivalence relation between equality classes
        mutable union_find _unions;

        // all equivalent ids map to the same class
        eclass_map _classes;

        // stores creation ids of enodes
        std::unordered_map< const_node_pointer, node_handle > _ids;

        // hash-consing of enodes, keys are canonical at rebuild boundaries
        std::unordered_map< node_type, node_handle, node_hash > _memo;

        analysis_t _analysis;
    };

    //
    // Adds insertion of pattern atoms, `builder` translates them into the
    // storage of the graph.
    //
    template< gap::graph::graph_like graph, template< typename > typename builder >
    struct egraph_pattern_buildable : graph {

        using builder_type = builder< egraph_pattern_buildable >;

        using graph::graph;
        using graph::insert;

        node_handle insert(const constant_t &con) {
            return insert(builder_type::make(con), {});
        }

        node_handle insert(const symbol_t &sym) {
            return insert(builder_type::make(sym), {});
        }

        node_handle insert(const operation_t &op, std::span< const node_handle > children) {
            return insert(builder_type::make(op), children);
        }
    };

} // namespace graphsat::graph
