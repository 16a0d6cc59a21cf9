/*
 * Copyright (c) 2022 Trail of Bits, Inc.
 */

#include <graphsat/tensor/language.hpp>

#include <gap/core/overloads.hpp>

#include <array>
#include <utility>

namespace graphsat::tensor
{
    namespace
    {
        struct op_info {
            op_kind kind;
            std::string_view name;
            std::size_t arity;
        };

        constexpr std::array< op_info, 22 > operators = {{
            { op_kind::input,     "input",     1 },
            { op_kind::weight,    "weight",    1 },
            { op_kind::ewadd,     "ewadd",     2 },
            { op_kind::ewmul,     "ewmul",     2 },
            { op_kind::smul,      "smul",      2 },
            { op_kind::transpose, "transpose", 1 },
            { op_kind::matmul,    "matmul",    3 },
            { op_kind::conv2d,    "conv2d",    6 },
            { op_kind::enlarge,   "enlarge",   2 },
            { op_kind::relu,      "relu",      1 },
            { op_kind::tanh,      "tanh",      1 },
            { op_kind::sigmoid,   "sigmoid",   1 },
            { op_kind::poolavg,   "poolavg",   7 },
            { op_kind::poolmax,   "poolmax",   7 },
            { op_kind::concat,    "concat",    4 },
            { op_kind::split,     "split",     2 },
            { op_kind::split_0,   "split_0",   1 },
            { op_kind::split_1,   "split_1",   1 },
            { op_kind::merge,     "merge",     2 },
            { op_kind::reshape,   "reshape",   2 },
            { op_kind::number,    "number",    0 },
            { op_kind::symbol,    "symbol",    0 },
        }};

        const op_info &info(op_kind kind) {
            return operators[static_cast< std::size_t >(kind)];
        }

    } // anonymous namespace

    std::string_view op_name(op_kind kind) { return info(kind).name; }

    std::size_t arity(op_kind kind) { return info(kind).arity; }

    std::optional< op_kind > parse_op(std::string_view name) {
        for (const auto &op : operators) {
            if (op.name == name) {
                return op.kind;
            }
        }
        return std::nullopt;
    }

    std::string node_name(const tensor_op &op) {
        switch (op.kind) {
            case op_kind::number: return std::to_string(op.value);
            case op_kind::symbol: return op.name;
            default: return std::string(op_name(op.kind));
        }
    }

    std::optional< std::int64_t > extract_constant(const tensor_op &op) {
        if (op.kind == op_kind::number)
            return op.value;
        return std::nullopt;
    }

    std::optional< std::string > extract_symbol(const tensor_op &op) {
        if (op.kind == op_kind::symbol)
            return op.name;
        return std::nullopt;
    }

    void check_pattern(const simple_expr &pattern) {
        const simple_expr_base &base = pattern;
        std::visit( gap::overloaded {
            [] (const atom_t &) {},
            [] (const expr_list &list) {
                auto op = atom_name(root(list));
                auto kind = parse_op(op);
                if (!kind || is_leaf(*kind)) {
                    throw parse_error("unknown operator " + op);
                }

                if (arity(*kind) != list.size() - 1) {
                    throw parse_error(
                        "operator " + op + " expects " + std::to_string(arity(*kind))
                        + " operands, got " + std::to_string(list.size() - 1)
                    );
                }

                for (const auto &child : children(list)) {
                    check_pattern(child);
                }
            }
        }, base);
    }

    void check_rule(const rewrite_rule &rule) {
        try {
            check_pattern(rule.lhs);
            check_pattern(rule.rhs);
        } catch (const parse_error &err) {
            throw rule_error(rule.name, err.what());
        }
    }

} // namespace graphsat::tensor
