/*
 * Copyright (c) 2022 Trail of Bits, Inc.
 */

#pragma once

#include <graphsat/core/cost_graph.hpp>
#include <graphsat/tensor/data.hpp>
#include <graphsat/tensor/language.hpp>

#include <vector>

namespace graphsat::tensor
{
    //
    // Cost and metadata oracle. For an operation and the metadata of its
    // operands it computes the cost of the operation and the metadata of
    // its result. Throws `analysis_error` if the operation is not
    // applicable to the operands.
    //
    struct cost_model {
        using data_type = tensor_data;
        using arguments = std::vector< const tensor_data * >;

        virtual ~cost_model() = default;

        virtual evaluation< tensor_data > evaluate(const tensor_op &op, const arguments &args) const = 0;
    };

    //
    // Cost model computing shapes of results in process. Costs are
    // element counts of results, multiply-accumulate counts of
    // contractions and window volumes of pooling.
    //
    struct analytic_cost_model final : cost_model {
        evaluation< tensor_data > evaluate(const tensor_op &op, const arguments &args) const override;
    };

} // namespace graphsat::tensor
