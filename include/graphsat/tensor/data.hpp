/*
 * Copyright (c) 2022 Trail of Bits, Inc.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace graphsat::tensor
{
    enum class data_kind { name, scalar, tensor, tensor_tuple };

    std::string to_string(data_kind kind);

    using shape_t = std::vector< std::int64_t >;

    std::string to_string(const shape_t &shape);

    // Throws `analysis_error` when the result does not fit into int64.
    std::int64_t product(std::int64_t lhs, std::int64_t rhs);

    // number of elements of a tensor of the shape, throws `analysis_error`
    // on overflow
    std::int64_t volume(const shape_t &shape);

    //
    // Metadata of an eclass. Shapes and values are optional, a symbolic
    // operand has an unknown shape or value.
    //
    struct tensor_data {
        data_kind kind = data_kind::name;

        // value of a scalar
        std::optional< std::int64_t > value;

        // name of a name
        std::string name;

        // shape of a tensor, or of the first tensor of a tuple
        std::optional< shape_t > shape;

        // shape of the second tensor of a tuple
        std::optional< shape_t > second;

        bool operator==(const tensor_data &other) const = default;

        static tensor_data make_name(std::string name) {
            return { data_kind::name, std::nullopt, std::move(name), std::nullopt, std::nullopt };
        }

        static tensor_data make_scalar(std::optional< std::int64_t > value) {
            return { data_kind::scalar, value, {}, std::nullopt, std::nullopt };
        }

        static tensor_data make_tensor(std::optional< shape_t > shape) {
            return { data_kind::tensor, std::nullopt, {}, std::move(shape), std::nullopt };
        }

        static tensor_data make_tuple(std::optional< shape_t > first, std::optional< shape_t > second) {
            return { data_kind::tensor_tuple, std::nullopt, {}, std::move(first), std::move(second) };
        }
    };

    std::string to_string(const tensor_data &data);

    // Shape encoded in a name `id@d1_d2_...`, names without `@` are
    // symbolic and have unknown shape. Throws `analysis_error` for
    // malformed dimensions.
    std::optional< shape_t > shape_from_name(const std::string &name);

    // Combines metadata of equal eclasses, known facts win over unknown
    // ones. Throws `analysis_error` on contradicting facts.
    tensor_data merge(const tensor_data &lhs, const tensor_data &rhs);

} // namespace graphsat::tensor
