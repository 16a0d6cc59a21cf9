/*
 * Copyright (c) 2022 Trail of Bits, Inc.
 */

#include <graphsat/tensor/analysis.hpp>

#include <graphsat/core/error.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <array>

namespace graphsat::tensor
{
    namespace
    {
        constexpr std::array< std::string_view, 4 > guards = {
            "same_shape", "is_tensor", "is_scalar", "has_rank"
        };

        using argument = graph::guard_argument< tensor_data >;

        const tensor_data &data_of(std::string_view predicate, const argument &arg) {
            if (auto data = std::get_if< const tensor_data * >(&arg)) {
                return **data;
            }
            throw rule_error(std::string(predicate), "expects a place operand");
        }

        std::int64_t literal_of(std::string_view predicate, const argument &arg) {
            if (auto value = std::get_if< std::int64_t >(&arg)) {
                return *value;
            }
            throw rule_error(std::string(predicate), "expects a literal operand");
        }

        void expect_arity(std::string_view predicate, std::size_t expected, std::size_t size) {
            if (expected != size) {
                throw rule_error(std::string(predicate), fmt::format(
                    "expects {} operands, got {}", expected, size
                ));
            }
        }

    } // anonymous namespace

    tensor_analysis::tensor_analysis()
        : _model(std::make_shared< analytic_cost_model >())
    {}

    tensor_analysis::tensor_analysis(std::shared_ptr< const cost_model > model)
        : _model(std::move(model))
    {}

    tensor_data tensor_analysis::make(const tensor_op &op, const std::vector< const tensor_data * > &args) const {
        return _model->evaluate(op, args).data;
    }

    tensor_data tensor_analysis::merge(const tensor_data &lhs, const tensor_data &rhs) const {
        return tensor::merge(lhs, rhs);
    }

    bool tensor_analysis::knows_guard(std::string_view predicate) const {
        return std::find(guards.begin(), guards.end(), predicate) != guards.end();
    }

    bool tensor_analysis::check_guard(
        std::string_view predicate, const graph::guard_arguments< tensor_data > &args
    ) const {
        if (predicate == "same_shape") {
            expect_arity(predicate, 2, args.size());
            const auto &a = data_of(predicate, args[0]);
            const auto &b = data_of(predicate, args[1]);
            if (a.kind == data_kind::name || b.kind == data_kind::name)
                return true;
            if (a.kind != data_kind::tensor || b.kind != data_kind::tensor)
                return false;
            return !a.shape || !b.shape || *a.shape == *b.shape;
        }

        if (predicate == "is_tensor") {
            expect_arity(predicate, 1, args.size());
            auto kind = data_of(predicate, args[0]).kind;
            return kind == data_kind::tensor || kind == data_kind::name;
        }

        if (predicate == "is_scalar") {
            expect_arity(predicate, 1, args.size());
            auto kind = data_of(predicate, args[0]).kind;
            return kind == data_kind::scalar || kind == data_kind::name;
        }

        if (predicate == "has_rank") {
            expect_arity(predicate, 2, args.size());
            const auto &a = data_of(predicate, args[0]);
            auto rank = literal_of(predicate, args[1]);
            if (a.kind == data_kind::name)
                return true;
            if (a.kind != data_kind::tensor)
                return false;
            return !a.shape || std::int64_t(a.shape->size()) == rank;
        }

        throw rule_error(std::string(predicate), "unknown guard predicate");
    }

    simple_expr parse_term(std::string_view str) {
        auto expr = parse_simple_expr(str);
        if (!expr) {
            throw parse_error("syntax error in term: " + std::string(str));
        }

        if (!is_ground(*expr)) {
            throw parse_error("term contains pattern variables: " + std::string(str));
        }

        check_pattern(*expr);
        return *expr;
    }

} // namespace graphsat::tensor
