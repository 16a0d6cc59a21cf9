/*
 * Copyright (c) 2021 Trail of Bits, Inc.
 */

#pragma once

#include <graphsat/core/common.hpp>

#include <gap/core/overloads.hpp>
#include <gap/core/recursive_generator.hpp>
#include <gap/core/strong_type.hpp>

#include <algorithm>
#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace graphsat
{
    using name_t = std::string;

    //
    // atom ::= constant | operation | symbol | place
    //
    struct constant_tag;
    using constant_t = gap::strong_type< std::int64_t, constant_tag >;

    // operation is the head of a list, e.g. `ewadd` in `(ewadd ?x ?y)`
    struct operation_tag;
    using operation_t = gap::strong_type< name_t, operation_tag >;

    // symbol is a named leaf, e.g. `x@64_32`
    struct symbol_tag;
    using symbol_t = gap::strong_type< name_t, symbol_tag >;

    // place has to be named with prefix '?'
    struct placeholder_tag;
    using place_t = gap::strong_type< name_t, placeholder_tag >;

    using atom_base = std::variant< constant_t, operation_t, symbol_t, place_t >;

    struct atom_t : atom_base {
        using base = atom_base;
        using base::base;
    };

    static inline std::string atom_name(const atom_t &atom) {
        const atom_base& base = atom;
        return std::visit( gap::overloaded{
            [&](const constant_t& c)  { return std::to_string(c.ref()); },
            [&](const operation_t& o) { return o.ref(); },
            [&](const symbol_t& s)    { return s.ref(); },
            [&](const place_t& p)     { return "?" + p.ref(); },
        }, base);
    }

    template< typename stream >
    stream& operator<<(stream& os, const atom_t& atom) {
        return os << atom_name(atom);
    }

    static inline std::string to_string(const atom_t &atom) { return atom_name(atom); }

    static inline bool is_place(const atom_t &atom) {
        return std::holds_alternative< place_t >(atom);
    }

    // expression is either atom or compound expression where the first
    // element of the list is an operation
    struct simple_expr;
    using expr_list = std::vector< simple_expr >;
    using simple_expr_base = std::variant< atom_t, expr_list >;

    struct simple_expr : simple_expr_base {
        using variant::variant;
    };

    template< typename stream >
    stream& operator<<(stream& os, const expr_list& list) {
        os << "(";
        bool first = true;
        for (const auto& element : list) {
            if (!first)
                os << ' ';
            os << element;
            first = false;
        }
        os << ')';
        return os;
    }

    template< typename stream >
    stream& operator<<(stream& os, const simple_expr& expr) {
        return std::visit([&](const auto& e) -> stream& { return os << e; }, expr);
    }

    static inline std::string to_string(const simple_expr &expr) {
        std::stringstream ss;
        ss << expr;
        return ss.str();
    }

    using match_pattern = simple_expr;
    using apply_pattern = simple_expr;

    //
    // guard ::= (predicate [place | constant])
    //
    // Guards restrict matches by the analysis data of matched places.
    //
    struct guard_expr {
        name_t predicate;
        std::vector< atom_t > arguments;
    };

    template< typename stream >
    stream& operator<<(stream& os, const guard_expr& guard) {
        os << "(" << guard.predicate;
        for (const auto &arg : guard.arguments) {
            os << ' ' << arg;
        }
        return os << ')';
    }

    using guards_t = std::vector< guard_expr >;

    std::optional< atom_t > parse_atom(std::string_view str);

    std::optional< constant_t > parse_constant(std::string_view str);

    std::optional< simple_expr > parse_simple_expr(std::string_view str);

    std::optional< guard_expr > parse_guard(std::string_view str);

    const atom_t& root(const simple_expr& expr);

    expr_list children(const simple_expr& expr);

    using places_t = std::vector< place_t >;

    static inline auto place_index(const place_t &place, const places_t &places) {
        return std::distance(places.begin(), std::find(places.begin(), places.end(), place));
    }

    using places_generator = gap::recursive_generator< place_t >;

    // yields places in the order of their occurrence, repeated places
    // are yielded repeatedly
    places_generator places(const simple_expr &expr);

    // distinct places in the order of their first occurrence
    places_t gather_places(const simple_expr &expr);

    static inline bool is_ground(const simple_expr &expr) {
        return gather_places(expr).empty();
    }

} // namespace graphsat
