/*
 * Copyright (c) 2022-Present Trail of Bits, Inc.
 */

#pragma once

#include <graphsat/core/common.hpp>

#include <stdexcept>
#include <string>

#include <fmt/format.h>

namespace graphsat
{
    // malformed pattern, rule file or term
    struct parse_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    // well-formed rule that cannot be used, e.g. unbound places on the
    // right-hand side or an unknown guard predicate
    struct rule_error : std::runtime_error {
        rule_error(const std::string &rule, const std::string &msg)
            : std::runtime_error(fmt::format("rule '{}': {}", rule, msg))
            , rule(rule)
        {}

        std::string rule;
    };

    // the metadata oracle rejected an operator application
    struct analysis_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    // two unified eclasses carry incompatible analysis data
    struct merge_conflict : std::runtime_error {
        merge_conflict(
            node_id_t lhs, node_id_t rhs,
            const std::string &lhs_term, const std::string &rhs_term,
            const std::string &reason
        )
            : std::runtime_error(fmt::format(
                "incompatible eclasses {} [{}] and {} [{}]: {}",
                lhs, lhs_term, rhs, rhs_term, reason
            ))
            , lhs(lhs), rhs(rhs)
            , lhs_term(lhs_term), rhs_term(rhs_term)
        {}

        node_id_t lhs, rhs;
        std::string lhs_term, rhs_term;
    };

    // extraction reached an eclass without any resolvable node
    struct extraction_error : std::runtime_error {
        extraction_error(node_id_t eclass, const std::string &msg)
            : std::runtime_error(fmt::format("eclass {}: {}", eclass, msg))
            , eclass(eclass)
        {}

        node_id_t eclass;
    };

} // namespace graphsat
