/*
 * Copyright (c) 2022 Trail of Bits, Inc.
 */

#include <graphsat/tensor/cost_model.hpp>

#include <graphsat/core/error.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <optional>
#include <string>

namespace graphsat::tensor
{
    namespace
    {
        using arguments = cost_model::arguments;
        using shape_opt = std::optional< shape_t >;
        using value_opt = std::optional< std::int64_t >;

        using result_t = evaluation< tensor_data >;

        //
        // Evaluation of a single operation, operands that are names are
        // symbolic tensors or scalars.
        //
        struct evaluator {
            [[noreturn]] void fail(const std::string &msg) const {
                throw analysis_error(fmt::format("{}: {}", node_name(op), msg));
            }

            const tensor_data &arg(std::size_t idx) const { return *args[idx]; }

            shape_opt tensor(std::size_t idx) const {
                const auto &a = arg(idx);
                if (a.kind == data_kind::tensor)
                    return a.shape;
                if (a.kind == data_kind::name)
                    return std::nullopt;
                fail(fmt::format("operand {} is {}, expected tensor", idx, to_string(a.kind)));
            }

            value_opt scalar(std::size_t idx) const {
                const auto &a = arg(idx);
                if (a.kind == data_kind::scalar)
                    return a.value;
                if (a.kind == data_kind::name)
                    return std::nullopt;
                fail(fmt::format("operand {} is {}, expected scalar", idx, to_string(a.kind)));
            }

            value_opt positive(std::size_t idx) const {
                auto value = scalar(idx);
                if (value && *value <= 0)
                    fail(fmt::format("operand {} has to be positive, got {}", idx, *value));
                return value;
            }

            value_opt padding(std::size_t idx) const {
                auto value = scalar(idx);
                if (value && *value != padding_same && *value != padding_valid)
                    fail(fmt::format("unknown padding mode {}", *value));
                return value;
            }

            value_opt activation(std::size_t idx) const {
                auto value = scalar(idx);
                if (value && (*value < activation_none || *value > activation_tanh))
                    fail(fmt::format("unknown activation mode {}", *value));
                return value;
            }

            const std::string &name(std::size_t idx) const {
                const auto &a = arg(idx);
                if (a.kind != data_kind::name)
                    fail(fmt::format("operand {} is {}, expected name", idx, to_string(a.kind)));
                return a.name;
            }

            const shape_t &rank(const shape_t &shape, std::size_t rank) const {
                if (shape.size() != rank)
                    fail(fmt::format("expected tensor of rank {}, got {}", rank, to_string(shape)));
                return shape;
            }

            static result_t make_tensor(shape_opt shape, cost_t cost) {
                return { shape ? cost : 1.0, tensor_data::make_tensor(std::move(shape)) };
            }

            static cost_t elements(const shape_opt &shape) {
                return shape ? cost_t(volume(*shape)) : 1.0;
            }

            // size of the output dimension of a sliding window
            std::int64_t window(std::int64_t in, std::int64_t kernel, std::int64_t stride, std::int64_t pad) const {
                if (pad == padding_same)
                    return (in - 1) / stride + 1;
                if (in < kernel)
                    fail(fmt::format("window {} does not fit into dimension {}", kernel, in));
                return (in - kernel) / stride + 1;
            }

            result_t elementwise() const {
                auto a = tensor(0);
                auto b = tensor(1);
                if (a && b && *a != *b)
                    fail(fmt::format("incompatible shapes {} and {}", to_string(*a), to_string(*b)));
                auto shape = a ? a : b;
                return make_tensor(shape, elements(shape));
            }

            result_t unary() const {
                auto a = tensor(0);
                return make_tensor(a, elements(a));
            }

            result_t smul() const {
                auto a = tensor(0);
                scalar(1);
                return make_tensor(a, elements(a));
            }

            result_t transpose() const {
                auto a = tensor(0);
                if (a) {
                    if (a->size() < 2)
                        fail(fmt::format("can not transpose {}", to_string(*a)));
                    std::reverse(a->begin(), a->end());
                }
                return make_tensor(a, elements(a));
            }

            result_t matmul() const {
                activation(0);
                auto a = tensor(1);
                auto b = tensor(2);

                for (const auto &s : { a, b }) {
                    if (s && s->size() < 2)
                        fail(fmt::format("can not multiply {}", to_string(*s)));
                }

                if (!a || !b)
                    return make_tensor(std::nullopt, 1.0);

                auto r = a->size();
                if (b->size() != r
                    || !std::equal(a->begin(), a->end() - 2, b->begin())
                    || (*a)[r - 1] != (*b)[r - 2])
                {
                    fail(fmt::format("incompatible shapes {} and {}", to_string(*a), to_string(*b)));
                }

                shape_t out(a->begin(), a->end() - 1);
                out.push_back((*b)[r - 1]);
                auto macs = cost_t(volume(out)) * cost_t((*a)[r - 1]);
                return make_tensor(std::move(out), macs);
            }

            result_t conv2d() const {
                auto sh  = positive(0);
                auto sw  = positive(1);
                auto pad = padding(2);
                activation(3);
                auto in = tensor(4);
                auto w  = tensor(5);

                if (in) rank(*in, 4);
                if (w)  rank(*w, 4);

                if (!in || !w || !sh || !sw || !pad)
                    return make_tensor(std::nullopt, 1.0);

                auto groups_channels = (*w)[1];
                if ((*in)[1] % groups_channels != 0)
                    fail(fmt::format("input channels {} are not divisible by {}", (*in)[1], groups_channels));

                auto groups = (*in)[1] / groups_channels;
                if ((*w)[0] % groups != 0)
                    fail(fmt::format("output channels {} are not divisible into {} groups", (*w)[0], groups));

                shape_t out = {
                    (*in)[0], (*w)[0],
                    window((*in)[2], (*w)[2], *sh, *pad),
                    window((*in)[3], (*w)[3], *sw, *pad)
                };

                auto macs = cost_t(volume(out)) * cost_t(volume(shape_t(w->begin() + 1, w->end())));
                return make_tensor(std::move(out), macs);
            }

            result_t enlarge() const {
                auto a   = tensor(0);
                auto ref = tensor(1);

                if (a)   rank(*a, 4);
                if (ref) rank(*ref, 4);

                if (!a || !ref)
                    return make_tensor(std::nullopt, 1.0);

                if ((*a)[2] > (*ref)[2] || (*a)[3] > (*ref)[3])
                    fail(fmt::format("can not enlarge {} to {}", to_string(*a), to_string(*ref)));

                shape_t out = { (*a)[0], (*a)[1], (*ref)[2], (*ref)[3] };
                return make_tensor(out, elements(out));
            }

            result_t pool() const {
                auto in  = tensor(0);
                auto kh  = positive(1);
                auto kw  = positive(2);
                auto sh  = positive(3);
                auto sw  = positive(4);
                auto pad = padding(5);
                activation(6);

                if (in) rank(*in, 4);

                if (!in || !kh || !kw || !sh || !sw || !pad)
                    return make_tensor(std::nullopt, 1.0);

                shape_t out = {
                    (*in)[0], (*in)[1],
                    window((*in)[2], *kh, *sh, *pad),
                    window((*in)[3], *kw, *sw, *pad)
                };

                auto cost = cost_t(volume(out)) * cost_t(product(*kh, *kw));
                return make_tensor(std::move(out), cost);
            }

            result_t concat() const {
                auto axis = scalar(0);
                auto ndim = scalar(1);
                auto a = tensor(2);
                auto b = tensor(3);

                for (const auto &s : { a, b }) {
                    if (s && ndim && std::int64_t(s->size()) != *ndim)
                        fail(fmt::format("expected tensor of rank {}, got {}", *ndim, to_string(*s)));
                    if (s && axis && (*axis < 0 || *axis >= std::int64_t(s->size())))
                        fail(fmt::format("axis {} out of range of {}", *axis, to_string(*s)));
                }

                if (!a || !b || !axis)
                    return make_tensor(std::nullopt, 1.0);

                auto incompatible = a->size() != b->size();
                for (std::size_t i = 0; !incompatible && i < a->size(); ++i) {
                    incompatible = std::int64_t(i) != *axis && (*a)[i] != (*b)[i];
                }

                if (incompatible)
                    fail(fmt::format("can not concatenate {} and {}", to_string(*a), to_string(*b)));

                auto out = *a;
                auto &dim = out[std::size_t(*axis)];
                if (__builtin_add_overflow(dim, (*b)[std::size_t(*axis)], &dim))
                    fail(fmt::format("concatenation of {} and {} overflows", to_string(*a), to_string(*b)));
                return make_tensor(out, elements(out));
            }

            result_t split() const {
                auto axis = scalar(0);
                auto in = tensor(1);

                if (!in || !axis)
                    return { 1.0, tensor_data::make_tuple(std::nullopt, std::nullopt) };

                if (*axis < 0 || *axis >= std::int64_t(in->size()))
                    fail(fmt::format("axis {} out of range of {}", *axis, to_string(*in)));

                auto half = *in;
                auto &dim = half[std::size_t(*axis)];
                if (dim % 2 != 0)
                    fail(fmt::format("can not split odd dimension of {}", to_string(*in)));
                dim /= 2;

                return { elements(in), tensor_data::make_tuple(half, half) };
            }

            result_t split_part(bool first) const {
                const auto &a = arg(0);
                if (a.kind == data_kind::name)
                    return { 0.0, tensor_data::make_tensor(std::nullopt) };
                if (a.kind != data_kind::tensor_tuple)
                    fail(fmt::format("operand is {}, expected tensor tuple", to_string(a.kind)));
                return { 0.0, tensor_data::make_tensor(first ? a.shape : a.second) };
            }

            result_t merge() const {
                auto w = tensor(0);
                auto count = positive(1);

                if (w) rank(*w, 4);

                if (!w || !count)
                    return make_tensor(std::nullopt, 1.0);

                if ((*w)[0] % *count != 0)
                    fail(fmt::format("can not merge {} by {}", to_string(*w), *count));

                shape_t out = { (*w)[0], product((*w)[1], *count), (*w)[2], (*w)[3] };
                return make_tensor(out, elements(out));
            }

            result_t reshape() const {
                auto in = tensor(0);
                auto target = shape_from_name(name(1));

                if (in && target && volume(*in) != volume(*target))
                    fail(fmt::format("can not reshape {} to {}", to_string(*in), to_string(*target)));

                return make_tensor(target, elements(target));
            }

            result_t source() const {
                return { 0.0, tensor_data::make_tensor(shape_from_name(name(0))) };
            }

            result_t evaluate() const {
                if (args.size() != arity(op.kind))
                    fail(fmt::format("expected {} operands, got {}", arity(op.kind), args.size()));

                switch (op.kind) {
                    case op_kind::input:
                    case op_kind::weight:    return source();
                    case op_kind::ewadd:
                    case op_kind::ewmul:     return elementwise();
                    case op_kind::smul:      return smul();
                    case op_kind::transpose: return transpose();
                    case op_kind::matmul:    return matmul();
                    case op_kind::conv2d:    return conv2d();
                    case op_kind::enlarge:   return enlarge();
                    case op_kind::relu:
                    case op_kind::tanh:
                    case op_kind::sigmoid:   return unary();
                    case op_kind::poolavg:
                    case op_kind::poolmax:   return pool();
                    case op_kind::concat:    return concat();
                    case op_kind::split:     return split();
                    case op_kind::split_0:   return split_part(true);
                    case op_kind::split_1:   return split_part(false);
                    case op_kind::merge:     return merge();
                    case op_kind::reshape:   return reshape();
                    case op_kind::number:    return { 0.0, tensor_data::make_scalar(op.value) };
                    case op_kind::symbol:    return { 0.0, tensor_data::make_name(op.name) };
                }
                fail("unknown operation");
            }

            const tensor_op &op;
            const arguments &args;
        };

    } // anonymous namespace

    evaluation< tensor_data > analytic_cost_model::evaluate(const tensor_op &op, const arguments &args) const {
        return evaluator{ op, args }.evaluate();
    }

} // namespace graphsat::tensor
