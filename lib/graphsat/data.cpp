/*
 * Copyright (c) 2022 Trail of Bits, Inc.
 */

#include <graphsat/tensor/data.hpp>

#include <graphsat/core/error.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <charconv>
#include <string_view>

namespace graphsat::tensor
{
    std::string to_string(data_kind kind) {
        switch (kind) {
            case data_kind::name: return "name";
            case data_kind::scalar: return "scalar";
            case data_kind::tensor: return "tensor";
            case data_kind::tensor_tuple: return "tensor tuple";
        }
        return "unknown";
    }

    std::string to_string(const shape_t &shape) {
        return fmt::format("[{}]", fmt::join(shape, ", "));
    }

    std::int64_t product(std::int64_t lhs, std::int64_t rhs) {
        std::int64_t result = 0;
        if (__builtin_mul_overflow(lhs, rhs, &result)) {
            throw analysis_error(fmt::format("product {} * {} overflows", lhs, rhs));
        }
        return result;
    }

    std::int64_t volume(const shape_t &shape) {
        std::int64_t result = 1;
        for (auto dim : shape) {
            result = product(result, dim);
        }
        return result;
    }

    static std::string to_string(const std::optional< shape_t > &shape) {
        return shape ? to_string(*shape) : "[?]";
    }

    std::string to_string(const tensor_data &data) {
        switch (data.kind) {
            case data_kind::name:
                return fmt::format("name {}", data.name);
            case data_kind::scalar:
                return data.value ? fmt::format("scalar {}", *data.value) : "scalar ?";
            case data_kind::tensor:
                return fmt::format("tensor {}", to_string(data.shape));
            case data_kind::tensor_tuple:
                return fmt::format("tuple {} {}", to_string(data.shape), to_string(data.second));
        }
        return "unknown";
    }

    std::optional< shape_t > shape_from_name(const std::string &name) {
        auto at = name.find('@');
        if (at == std::string::npos) {
            return std::nullopt;
        }

        shape_t shape;
        std::string_view dims = std::string_view(name).substr(at + 1);
        while (true) {
            auto sep = dims.find('_');
            auto dim = dims.substr(0, sep);

            std::int64_t value = 0;
            auto [ptr, ec] = std::from_chars(dim.data(), dim.data() + dim.size(), value);
            if (ec != std::errc() || ptr != dim.data() + dim.size() || value <= 0) {
                throw analysis_error(fmt::format("malformed dimension '{}' in name {}", dim, name));
            }
            shape.push_back(value);

            if (sep == std::string_view::npos) {
                break;
            }
            dims = dims.substr(sep + 1);
        }

        // tensors with more elements than fit into an int64 are rejected
        volume(shape);
        return shape;
    }

    static std::optional< shape_t > merge_shape(
        const std::optional< shape_t > &lhs, const std::optional< shape_t > &rhs
    ) {
        if (lhs && rhs && *lhs != *rhs) {
            throw analysis_error(
                fmt::format("incompatible shapes {} and {}", to_string(*lhs), to_string(*rhs))
            );
        }
        return lhs ? lhs : rhs;
    }

    tensor_data merge(const tensor_data &lhs, const tensor_data &rhs) {
        // a name stands for an arbitrary operand
        if (lhs.kind == data_kind::name && rhs.kind != data_kind::name) {
            auto result = rhs;
            result.name = lhs.name;
            return result;
        }

        if (rhs.kind == data_kind::name && lhs.kind != data_kind::name) {
            auto result = lhs;
            result.name = rhs.name;
            return result;
        }

        if (lhs.kind != rhs.kind) {
            throw analysis_error(
                fmt::format("incompatible kinds {} and {}", to_string(lhs.kind), to_string(rhs.kind))
            );
        }

        auto result = lhs;
        if (lhs.value && rhs.value && *lhs.value != *rhs.value) {
            throw analysis_error(
                fmt::format("incompatible values {} and {}", *lhs.value, *rhs.value)
            );
        }
        result.value  = lhs.value ? lhs.value : rhs.value;
        result.shape  = merge_shape(lhs.shape, rhs.shape);
        result.second = merge_shape(lhs.second, rhs.second);
        if (result.name.empty()) {
            result.name = rhs.name;
        }
        return result;
    }

} // namespace graphsat::tensor
