/*
 * Copyright (c) 2022-Present Trail of Bits, Inc.
 */

#include <graphsat/pattern/parser.hpp>

#include <graphsat/core/error.hpp>

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>
#include <fstream>
#include <optional>
#include <sstream>
#include <utility>

namespace graphsat
{
    using maybe_rule_set_name = std::optional< std::string_view >;

    static std::string_view ltrim(std::string_view line) {
        line.remove_prefix(std::min(line.find_first_not_of(" \n\r\t"), line.size()));
        return line;
    }

    static std::string_view rtrim(std::string_view line) {
        auto last = line.find_last_not_of(" \n\r\t");
        return last == std::string_view::npos ? std::string_view() : line.substr(0, last + 1);
    }

    static std::string_view trim(std::string_view line) { return rtrim(ltrim(line)); }

    // drops a trailing `# comment`
    static std::string_view uncomment(std::string_view line) {
        return line.substr(0, line.find('#'));
    }

    //
    // reads significant lines and remembers their position
    //
    struct line_reader {
        explicit line_reader(std::istream &is) : is(is) {}

        std::optional< std::string > next() {
            if (pending) {
                return std::exchange(pending, std::nullopt);
            }

            std::string line;
            while (std::getline(is, line)) {
                ++number;
                auto content = trim(uncomment(line));
                if (!content.empty()) {
                    return std::string(content);
                }
            }

            return std::nullopt;
        }

        void push_back(std::string line) { pending = std::move(line); }

        [[noreturn]] void error(std::string_view msg, std::string_view line) const {
            throw parse_error(fmt::format("line {}: {}: {}", number, msg, line));
        }

        std::istream &is;
        std::size_t number = 0;
        std::optional< std::string > pending;
    };

    static maybe_rule_set_name parse_ruleset_name(const line_reader &in, std::string_view line) {
        if (!line.starts_with('[')) {
            return std::nullopt;
        }
        if (!line.ends_with(']')) {
            in.error("missing closing bracket", line);
        }

        auto name = trim(line.substr(1, line.size() - 2));
        if (name.starts_with("set ")) {
            name = trim(name.substr(4));
        }
        return name;
    }

    struct rule_header {
        std::string name;
        bool bidirectional;
    };

    static rule_header parse_rule_name(const line_reader &in, std::string_view line) {
        if (!line.ends_with(':')) {
            in.error("expected rule name", line);
        }

        auto name = rtrim(line.substr(0, line.size() - 1));
        bool bidirectional = name.ends_with("<=>");
        if (bidirectional) {
            name = rtrim(name.substr(0, name.size() - 3));
        }

        if (name.empty()) {
            in.error("empty rule name", line);
        }

        return { std::string(name), bidirectional };
    }

    static std::optional< std::string > parse_pattern(std::string_view line) {
        if (line.starts_with('-'))
            return std::string(trim(line.substr(1)));
        return std::nullopt;
    }

    static rewrite_rule parse_rule(std::string_view name_line, line_reader &in) {
        auto header = parse_rule_name(in, name_line);
        spdlog::debug("[graphsat] rule: {}", header.name);

        auto pattern = [&] (std::string_view what) -> std::string {
            if (auto line = in.next()) {
                if (auto pat = parse_pattern(*line)) {
                    return *pat;
                }
                in.error(fmt::format("expected {} of rule {}", what, header.name), *line);
            }
            in.error(fmt::format("missing {} of rule {}", what, header.name), "end of input");
        };

        auto lhs = pattern("left-hand side");
        auto rhs = pattern("right-hand side");
        spdlog::debug("[graphsat] lhs: {}", lhs);
        spdlog::debug("[graphsat] rhs: {}", rhs);

        auto rule = rewrite_rule(header.name, lhs, rhs, header.bidirectional);

        while (auto line = in.next()) {
            auto guard = parse_pattern(*line);
            if (!guard || !guard->starts_with("when")) {
                in.push_back(std::move(*line));
                break;
            }

            rule.when(trim(std::string_view(*guard).substr(4)));
        }

        return rule;
    }

    rule_sets parse_rules(const std::string &filename) {
        spdlog::debug("[graphsat] parse rules from: {}", filename);
        std::ifstream file(filename, std::ios::in);
        if (!file) {
            throw parse_error("can not open rule file " + filename);
        }
        return parse_rules(file);
    }

    rule_sets parse_rules_string(std::string_view str) {
        std::istringstream is{ std::string(str) };
        return parse_rules(is);
    }

    rule_sets parse_rules(std::istream &is) {
        rule_sets rulesets;
        line_reader in(is);

        auto add_to_current_ruleset = [&](auto &&rule) {
            if (rulesets.empty()) {
                rulesets.push_back(rule_set{ "default", rewrite_rules{} });
            }
            rulesets.back().rules.push_back(std::forward< decltype(rule) >(rule));
        };

        while (auto line = in.next()) {
            if (auto name = parse_ruleset_name(in, *line)) {
                spdlog::debug("[graphsat] new set of rules: {}", *name);
                rulesets.push_back(rule_set{ std::string(*name), rewrite_rules{} });
            } else {
                add_to_current_ruleset(parse_rule(*line, in));
            }
        }

        return rulesets;
    }

    std::string read_term(const std::string &filename) {
        std::ifstream file(filename, std::ios::in);
        if (!file) {
            throw parse_error("can not open term file " + filename);
        }
        return read_term(file);
    }

    std::string read_term(std::istream &is) {
        std::string term;
        line_reader in(is);
        while (auto line = in.next()) {
            if (!term.empty())
                term += ' ';
            term += *line;
        }

        if (term.empty()) {
            throw parse_error("empty term");
        }
        return term;
    }

} // namespace graphsat
