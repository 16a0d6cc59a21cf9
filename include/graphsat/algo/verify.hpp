/*
 * Copyright (c) 2022-Present Trail of Bits, Inc.
 */

#pragma once

#include <graphsat/algo/saturation.hpp>
#include <graphsat/algo/synthesis.hpp>
#include <graphsat/core/error.hpp>
#include <graphsat/pattern/rewrite_rule.hpp>

#include <gap/core/overloads.hpp>

#include <span>
#include <string>
#include <type_traits>
#include <vector>

#include <spdlog/spdlog.h>

namespace graphsat {

    enum class verdict { verified, unverified };

    static inline std::string to_string(verdict v) {
        return v == verdict::verified ? "verified" : "unverified";
    }

    struct rule_verdict {
        std::string rule;
        verdict status;
    };

    struct verification_result {
        std::vector< rule_verdict > verdicts;
        stop_reason reason;
        std::size_t rounds;

        // Unverified rules of an inconclusive run may still be derivable,
        // the budget was exhausted before saturation.
        bool conclusive;

        std::size_t num_of_verified() const {
            std::size_t count = 0;
            for (const auto &v : verdicts) {
                if (v.status == verdict::verified)
                    ++count;
            }
            return count;
        }
    };

    // Pattern with places replaced by opaque symbols `?name`, a term that
    // stands for any instance of the pattern.
    static inline simple_expr generalize(const simple_expr &pattern) {
        const simple_expr_base &base = pattern;
        return std::visit( gap::overloaded {
            [] (const atom_t &atom) -> simple_expr {
                if (auto place = std::get_if< place_t >(&atom)) {
                    return atom_t(symbol_t("?" + place->ref()));
                }
                return atom;
            },
            [] (const expr_list &list) -> simple_expr {
                expr_list result;
                for (const auto &elem : list) {
                    result.push_back(generalize(elem));
                }
                return result;
            }
        }, base);
    }

    namespace detail {

        template< typename egraph >
        node_handle insert_side(egraph &graph, const rewrite_rule &rule, const simple_expr &side) {
            try {
                return synthesize(generalize(side), graph);
            } catch (const analysis_error &err) {
                throw rule_error(rule.name, std::string("ill-formed side: ") + err.what());
            }
        }

    } // namespace detail

    //
    // Proves candidate rules from axioms in a single shared egraph. Only
    // axioms rewrite, a candidate is verified once both of its sides end
    // up in the same eclass.
    //
    template< typename egraph >
    verification_result verify(
        std::span< const rewrite_rule > axioms,
        std::span< const rewrite_rule > candidates,
        egraph &&graph,
        const saturation_config &config,
        const std::type_identity_t< saturation_observer< egraph > > &observe = {}
    ) {
        saturable_egraph< egraph > sat(std::move(graph));

        validate_rules(axioms, sat.analysis());

        for (const auto &axiom : axioms) {
            detail::insert_side(sat, axiom, axiom.lhs);
            detail::insert_side(sat, axiom, axiom.rhs);
        }

        using goal_t = std::pair< node_handle, node_handle >;
        std::vector< goal_t > goals;
        for (const auto &candidate : candidates) {
            goals.emplace_back(
                detail::insert_side(sat, candidate, candidate.lhs),
                detail::insert_side(sat, candidate, candidate.rhs)
            );
        }

        auto proven = [&] (const goal_t &goal, const auto &g) {
            return g.find(goal.first) == g.find(goal.second);
        };

        auto all_proven = [&] (const saturable_egraph< egraph > &g) {
            for (const auto &goal : goals) {
                if (!proven(goal, g))
                    return false;
            }
            return true;
        };

        auto [result, reason, rounds] = saturate(std::move(sat), axioms, config, all_proven);
        if (observe) {
            observe(result);
        }

        verification_result out{ {}, reason, rounds, !is_budget_exhausted(reason) };
        for (std::size_t i = 0; i < candidates.size(); ++i) {
            auto status = proven(goals[i], result) ? verdict::verified : verdict::unverified;
            spdlog::debug("[graphsat] {}: {}", candidates[i].name, to_string(status));
            out.verdicts.push_back({ candidates[i].name, status });
        }

        spdlog::info("[graphsat] verified {} of {} rules, {} after {} rounds",
            out.num_of_verified(), candidates.size(), to_string(reason), rounds
        );

        if (!out.conclusive && out.num_of_verified() != candidates.size()) {
            spdlog::warn("[graphsat] budget exhausted, unverified rules are inconclusive");
        }

        return out;
    }

} // namespace graphsat
