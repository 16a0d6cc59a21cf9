/*
 * Copyright (c) 2022-Present Trail of Bits, Inc.
 */

#pragma once

#include <graphsat/pattern/rewrite_rule.hpp>

#include <string>

namespace graphsat {

    struct rule_set {
        std::string name;
        rewrite_rules rules;
    };

    using rule_sets = std::vector< rule_set >;

    // rules of all sets, bidirectional rules are registered in both directions
    static inline rewrite_rules active_rules(const rule_sets &sets) {
        rewrite_rules result;
        for (const auto &set : sets) {
            for (const auto &rule : set.rules) {
                result.push_back(rule);
                if (rule.bidirectional) {
                    result.push_back(rule.reversed());
                }
            }
        }
        return result;
    }

    static inline rewrite_rules all_rules(const rule_sets &sets) {
        rewrite_rules result;
        for (const auto &set : sets) {
            result.insert(result.end(), set.rules.begin(), set.rules.end());
        }
        return result;
    }

} // namespace graphsat
