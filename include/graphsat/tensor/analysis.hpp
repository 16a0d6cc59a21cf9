/*
 * Copyright (c) 2022 Trail of Bits, Inc.
 */

#pragma once

#include <graphsat/core/egraph.hpp>
#include <graphsat/tensor/cost_model.hpp>
#include <graphsat/tensor/data.hpp>
#include <graphsat/tensor/language.hpp>

#include <memory>
#include <string_view>
#include <vector>

namespace graphsat::tensor
{
    //
    // Shape analysis of tensor graphs. Metadata of new enodes are computed
    // by the cost model, equal eclasses must agree on their metadata.
    //
    // Guard predicates:
    //   (same_shape ?a ?b)  tensors of the same shape
    //   (is_tensor ?a)      operand is a tensor
    //   (is_scalar ?a)      operand is a scalar
    //   (has_rank ?a N)     tensor of rank N
    // Unknown shapes and symbolic operands never reject a guard.
    //
    struct tensor_analysis {
        using data_type = tensor_data;

        tensor_analysis();

        explicit tensor_analysis(std::shared_ptr< const cost_model > model);

        data_type make(const tensor_op &op, const std::vector< const data_type * > &args) const;

        data_type merge(const data_type &lhs, const data_type &rhs) const;

        bool knows_guard(std::string_view predicate) const;

        bool check_guard(std::string_view predicate, const graph::guard_arguments< data_type > &args) const;

        const cost_model &model() const { return *_model; }

      private:
        std::shared_ptr< const cost_model > _model;
    };

    using tensor_base_graph = graph::egraph< tensor_node, tensor_analysis >;

    using tensor_graph = graph::egraph_pattern_buildable< tensor_base_graph, tensor_builder >;

    // parses a term, i.e., an s-expression without places
    simple_expr parse_term(std::string_view str);

} // namespace graphsat::tensor
