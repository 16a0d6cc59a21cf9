/*
 * Copyright (c) 2022-Present Trail of Bits, Inc.
 */

#pragma once

#include <graphsat/pattern/rule_set.hpp>

#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace graphsat
{
    //
    // Rule file:
    //
    //   # comment
    //   [set name]
    //   rule-name:            directional rule
    //   rule-name <=>:        bidirectional rule
    //     - lhs pattern
    //     - rhs pattern
    //     - when (predicate args...)
    //
    // Rules before the first set header belong to the set `default`.
    // Throws `parse_error` or `rule_error` for malformed input.
    //
    rule_sets parse_rules(std::istream &is);

    rule_sets parse_rules(const std::string &filename);

    rule_sets parse_rules_string(std::string_view str);

    // contents of a term file without comments, lines are joined by spaces
    std::string read_term(std::istream &is);

    std::string read_term(const std::string &filename);

} // namespace graphsat
