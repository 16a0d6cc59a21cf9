/*
 * Copyright (c) 2022 Trail of Bits, Inc.
 */

#pragma once

#include <graphsat/core/egraph.hpp>
#include <graphsat/core/error.hpp>
#include <graphsat/pattern/pattern.hpp>
#include <graphsat/pattern/rewrite_rule.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace graphsat::tensor
{
    //
    // operator vocabulary of computation graphs
    //
    enum class op_kind : std::uint8_t
    {
        input, weight,
        ewadd, ewmul, smul,
        transpose, matmul, conv2d, enlarge,
        relu, tanh, sigmoid,
        poolavg, poolmax,
        concat, split, split_0, split_1,
        merge, reshape,
        number, symbol
    };

    // operator constants shared with the rules
    constexpr std::int64_t padding_same  = 0;
    constexpr std::int64_t padding_valid = 1;

    constexpr std::int64_t activation_none    = 0;
    constexpr std::int64_t activation_sigmoid = 1;
    constexpr std::int64_t activation_relu    = 2;
    constexpr std::int64_t activation_tanh    = 3;

    std::string_view op_name(op_kind kind);

    std::optional< op_kind > parse_op(std::string_view name);

    // number of operands, leaves have none
    std::size_t arity(op_kind kind);

    static inline bool is_leaf(op_kind kind) {
        return kind == op_kind::number || kind == op_kind::symbol;
    }

    //
    // storage of a tensor enode
    //
    struct tensor_op {
        op_kind kind;
        std::int64_t value = 0;
        std::string name;

        static tensor_op number(std::int64_t value) {
            return { op_kind::number, value, {} };
        }

        static tensor_op symbol(std::string name) {
            return { op_kind::symbol, 0, std::move(name) };
        }

        static tensor_op operation(op_kind kind) {
            return { kind, 0, {} };
        }

        bool operator==(const tensor_op &other) const = default;
    };

    std::string node_name(const tensor_op &op);

    std::optional< std::int64_t > extract_constant(const tensor_op &op);

    std::optional< std::string > extract_symbol(const tensor_op &op);

    using tensor_node = graph::node< tensor_op >;

    //
    // translation of pattern atoms to tensor operations
    //
    template< typename graph_t >
    struct tensor_builder {
        static tensor_op make(const constant_t &con) {
            return tensor_op::number(con.ref());
        }

        static tensor_op make(const symbol_t &sym) {
            return tensor_op::symbol(sym.ref());
        }

        static tensor_op make(const operation_t &op) {
            if (auto kind = parse_op(op.ref()); kind && !is_leaf(*kind)) {
                return tensor_op::operation(*kind);
            }
            throw parse_error("unknown operator: " + op.ref());
        }
    };

    // Checks that every operation of the pattern is known and applied to
    // the right number of operands.
    void check_pattern(const simple_expr &pattern);

    // throws `rule_error` naming the rule for ill-formed patterns
    void check_rule(const rewrite_rule &rule);

} // namespace graphsat::tensor
