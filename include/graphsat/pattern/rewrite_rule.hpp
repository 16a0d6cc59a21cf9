/*
 * Copyright (c) 2022-Present Trail of Bits, Inc.
 */

#pragma once

#include <graphsat/core/error.hpp>
#include <graphsat/pattern/pattern.hpp>

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

namespace graphsat {

    static inline match_pattern make_match_pattern(std::string_view pat) {
        if (auto res = parse_simple_expr(pat))
            return res.value();
        throw parse_error("syntax error in match pattern: " + std::string(pat));
    }

    static inline apply_pattern make_apply_pattern(std::string_view pat) {
        if (auto res = parse_simple_expr(pat))
            return res.value();
        throw parse_error("syntax error in apply pattern: " + std::string(pat));
    }

    static inline guard_expr make_guard(std::string_view pat) {
        if (auto res = parse_guard(pat))
            return res.value();
        throw parse_error("syntax error in guard: " + std::string(pat));
    }

    struct rewrite_rule {
        rewrite_rule(
            std::string_view name, std::string_view lhs, std::string_view rhs,
            bool bidirectional = false
        )
            : rewrite_rule(
                std::string(name), make_match_pattern(lhs), make_apply_pattern(rhs),
                guards_t{}, bidirectional
            )
        {}

        rewrite_rule(
            std::string name, match_pattern lhs, apply_pattern rhs,
            guards_t guards, bool bidirectional
        )
            : name(std::move(name))
            , lhs(std::move(lhs))
            , rhs(std::move(rhs))
            , guards(std::move(guards))
            , bidirectional(bidirectional)
            , places(gather_places(this->lhs))
        {
            validate();
        }

        rewrite_rule &when(std::string_view guard) {
            guards.push_back(make_guard(guard));
            validate();
            return *this;
        }

        // rule `rhs -> lhs` named `<name>-rev`
        rewrite_rule reversed() const {
            return rewrite_rule(name + "-rev", rhs, lhs, guards, false);
        }

        std::string name;

        // Rewrite rule 'lhs -> rhs' that allows to match
        // left-hand-side and replace it with right-hand-side
        match_pattern lhs;
        apply_pattern rhs;

        guards_t guards;

        bool bidirectional = false;

        // Places that occur in the left-hand side, in the order of their
        // first occurrence. Places of the right-hand side and of guards
        // have to be among them.
        places_t places;

      private:
        void validate() const {
            if (std::holds_alternative< atom_t >(lhs) && is_place(std::get< atom_t >(lhs))) {
                throw rule_error(name, "left-hand side can not be a sole place");
            }

            auto is_bound = [&] (const place_t &place) {
                return std::find(places.begin(), places.end(), place) != places.end();
            };

            for (auto place : graphsat::places(rhs)) {
                if (!is_bound(place)) {
                    throw rule_error(name, "unbound place ?" + place.ref() + " in right-hand side");
                }
            }

            if (bidirectional) {
                if (std::holds_alternative< atom_t >(rhs) && is_place(std::get< atom_t >(rhs))) {
                    throw rule_error(name, "reversed rule would match a sole place");
                }

                auto rhs_places = gather_places(rhs);
                for (const auto &place : places) {
                    if (std::find(rhs_places.begin(), rhs_places.end(), place) == rhs_places.end()) {
                        throw rule_error(name, "reversed rule does not bind place ?" + place.ref());
                    }
                }
            }

            for (const auto &guard : guards) {
                for (const auto &arg : guard.arguments) {
                    if (auto place = std::get_if< place_t >(&arg); place && !is_bound(*place)) {
                        throw rule_error(name, "unbound place ?" + place->ref() + " in guard");
                    }
                }
            }
        }
    };

    template< typename stream >
    stream& operator<<(stream& os, const rewrite_rule& rule) {
        os << rule.name << ": " << rule.lhs << (rule.bidirectional ? " <=> " : " => ") << rule.rhs;
        for (const auto &guard : rule.guards) {
            os << " when " << guard;
        }
        return os;
    }

    using rewrite_rules = std::vector< rewrite_rule >;

} // namespace graphsat
