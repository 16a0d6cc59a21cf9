/*
 * Copyright (c) 2022 Trail of Bits, Inc.
 */

#include <graphsat/pattern/pattern.hpp>

#include <gap/core/overloads.hpp>
#include <gap/core/parser.hpp>

#include <cctype>
#include <spdlog/spdlog.h>

namespace graphsat
{
    template< typename P, typename T >
    concept parser = gap::parser::parser< P, T >;

    using parse_input_t = gap::parser::parse_input_t;

    template< typename T >
    using parse_result_t = gap::parser::parse_result_t< T >;

    using gap::parser::parser_function;
    using gap::parser::parse_type;

    using gap::parser::rest;
    using gap::parser::result;

    using gap::parser::construct;

    using gap::parser::char_parser;
    using gap::parser::length_parser;
    using gap::parser::number_parser;

    using gap::parser::separated;
    using gap::parser::skip;

    parser< constant_t > auto constant_parser() {
        return construct< constant_t >(number_parser< std::int64_t >());
    }

    static int is_name_char(int c) {
        return std::isalnum(c) || c == '_' || c == '@' || c == '.';
    }

    constexpr parser< name_t > auto name_parser() {
        return [](parse_input_t in) -> parse_result_t< name_t > {
            if (auto prefix = length_parser(isalpha)(in); prefix && result(prefix) > 0) {
                if (auto suffix = length_parser(is_name_char)(rest(prefix))) {
                    auto length = result(prefix) + result(suffix);
                    return {
                        {std::string(in.substr(0, length)), in.substr(length)}
                    };
                }
            }

            return std::nullopt;
        };
    }

    constexpr parser< place_t > auto place_parser() {
        return construct< place_t >(char_parser('?') < name_parser());
    }

    constexpr parser< symbol_t > auto symbol_parser() {
        return construct< symbol_t >(name_parser());
    }

    parser< atom_t > auto atom_parser() {
        auto con = construct< atom_t >(constant_parser());
        auto plc = construct< atom_t >(place_parser());
        auto sym = construct< atom_t >(symbol_parser());
        return con | plc | sym;
    }

    simple_expr wrap(simple_expr e) {
        if (std::holds_alternative< atom_t >(e)) {
            std::vector< simple_expr > vec{};
            vec.push_back(std::move(e));
            return { vec };
        }
        return e;
    }

    struct expr_parser_impl {
        using expr_parser_result = parse_result_t< simple_expr >;
        using expr_parser_t      = auto (*)(parse_input_t) -> expr_parser_result;

        static auto expr_list_parser() {
            auto push = [](simple_expr a, simple_expr b) -> simple_expr {
                auto vec = std::get< expr_list >(wrap(a));
                vec.push_back(b);
                return { vec };
            };

            return parenthesized(
                separated(element_parser(), skip(isspace), simple_expr{ expr_list() }, push));
        }

        static auto element_parser() -> expr_parser_t {
            return [](parse_input_t in) -> expr_parser_result {
                auto atom = construct< simple_expr >(atom_parser());
                auto list = construct< simple_expr >(expr_list_parser());
                return (atom | list)(in);
            };
        }
    };

    parser< simple_expr > auto expr_parser() { return expr_parser_impl::element_parser(); }

    template< parser_function parser_t >
    auto make_parse(parser_t parser, std::string_view str)
        -> std::optional< parse_type< parser_t > >
    {
        if (auto value = parser(str); value && rest(value).empty()) {
            return result(value);
        }
        return std::nullopt;
    }

    // collapses whitespace so that lists are separated by exactly one space
    static std::string squeeze(std::string_view str) {
        std::string out;
        for (auto c : str) {
            if (std::isspace(static_cast< unsigned char >(c))) {
                if (!out.empty() && out.back() != ' ' && out.back() != '(')
                    out.push_back(' ');
            } else {
                if (c == ')' && !out.empty() && out.back() == ' ')
                    out.pop_back();
                out.push_back(c);
            }
        }

        if (!out.empty() && out.back() == ' ')
            out.pop_back();
        return out;
    }

    // Singleton lists `(?x)` denote their element and the head of a list is
    // an operation rather than a symbol.
    static simple_expr normalize(simple_expr expr) {
        if (std::holds_alternative< atom_t >(expr)) {
            return expr;
        }

        auto list = std::get< expr_list >(std::move(expr));
        if (list.size() == 1) {
            return normalize(std::move(list.front()));
        }

        expr_list out;
        for (auto &element : list) {
            out.push_back(normalize(std::move(element)));
        }

        if (auto atom = std::get_if< atom_t >(&out.front())) {
            if (auto sym = std::get_if< symbol_t >(atom)) {
                out.front() = atom_t(operation_t(sym->ref()));
            }
        }

        return { out };
    }

    std::optional< atom_t > parse_atom(std::string_view str) {
        return make_parse(atom_parser(), squeeze(str));
    }

    std::optional< constant_t > parse_constant(std::string_view str) {
        return make_parse(constant_parser(), squeeze(str));
    }

    std::optional< simple_expr > parse_simple_expr(std::string_view str) {
        auto input = squeeze(str);
        if (auto expr = make_parse(expr_parser(), input)) {
            auto normalized = normalize(std::move(*expr));
            if (auto list = std::get_if< expr_list >(&normalized)) {
                if (!std::holds_alternative< atom_t >(list->front())) {
                    spdlog::debug("[graphsat] list head is not an operation: {}", input);
                    return std::nullopt;
                }
                if (!std::holds_alternative< operation_t >(std::get< atom_t >(list->front()))) {
                    spdlog::debug("[graphsat] list head is not an operation: {}", input);
                    return std::nullopt;
                }
            }
            return normalized;
        }

        return std::nullopt;
    }

    std::optional< guard_expr > parse_guard(std::string_view str) {
        auto expr = parse_simple_expr(str);
        if (!expr) {
            return std::nullopt;
        }

        auto list = std::get_if< expr_list >(&expr.value());
        if (!list) {
            spdlog::debug("[graphsat] guard has to be a predicate application: {}", str);
            return std::nullopt;
        }

        guard_expr guard{ atom_name(root(*expr)), {} };
        for (const auto &arg : children(*expr)) {
            auto atom = std::get_if< atom_t >(&arg);
            if (!atom || !(is_place(*atom) || std::holds_alternative< constant_t >(*atom))) {
                spdlog::debug("[graphsat] guard arguments are places or constants: {}", str);
                return std::nullopt;
            }
            guard.arguments.push_back(*atom);
        }

        return guard;
    }

    const atom_t &root(const simple_expr &expr) {
        return std::visit( gap::overloaded {
            [] (const atom_t &atom) -> const atom_t& { return atom; },
            [] (const expr_list &list) -> const atom_t& { return std::get< atom_t >(list.front()); }
        }, expr);
    }

    expr_list children(const simple_expr &expr) {
        return std::visit( gap::overloaded {
            [] (const atom_t &) -> expr_list { return {}; },
            [] (const expr_list &vec) -> expr_list {
                return { std::next(vec.begin()), vec.end() };
            }
        }, expr);
    }

    places_generator places(const simple_expr &expr) {
        const simple_expr_base &base = expr;
        co_yield std::visit( gap::overloaded {
            [] (const atom_t &a) -> places_generator {
                if (auto p = std::get_if< place_t >(&a)) {
                    co_yield place_t(*p);
                }
            },
            [] (const expr_list &list) -> places_generator {
                for (const auto &elem : list) {
                    co_yield places(elem);
                }
            }
        }, base);
    }

    places_t gather_places(const simple_expr &expr) {
        places_t result;
        for (auto place : places(expr)) {
            if (std::find(result.begin(), result.end(), place) == result.end()) {
                result.push_back(place);
            }
        }
        return result;
    }

} // namespace graphsat
