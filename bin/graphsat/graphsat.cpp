/*
 * Copyright (c) 2022 Trail of Bits, Inc.
 */

#include <graphsat/algo/optimize.hpp>
#include <graphsat/algo/print.hpp>
#include <graphsat/algo/verify.hpp>
#include <graphsat/core/error.hpp>
#include <graphsat/pattern/parser.hpp>
#include <graphsat/tensor/analysis.hpp>
#include <graphsat/tensor/cost_model.hpp>

#include <gflags/gflags.h>

#include <spdlog/spdlog.h>
#include <spdlog/cfg/argv.h>
#include <spdlog/cfg/env.h>

#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

DEFINE_string(mode, "verify", "Mode of operation: verify | optimize");
DEFINE_string(axioms, "", "Rule file with axioms.");
DEFINE_string(rules, "", "Rule file with candidate rules to verify.");
DEFINE_string(graph, "", "Term file with the graph to optimize.");
DEFINE_uint64(iter_limit, 30, "Maximal number of saturation rounds.");
DEFINE_uint64(node_limit, 100000, "Maximal number of enodes.");
DEFINE_uint64(time_limit, 10, "Time limit of saturation in seconds.");
DEFINE_string(dot_out, "", "File to store the saturated egraph in dot format.");
DEFINE_string(log_level, "", "Log level: trace | debug | info | warn | error | off");

namespace
{
    using namespace graphsat;

    constexpr int exit_within_budget = 0;
    constexpr int exit_error         = 1;
    constexpr int exit_budget        = 2;

    saturation_config make_config() {
        saturation_config config;
        config.iteration_limit = FLAGS_iter_limit;
        config.node_limit      = FLAGS_node_limit;
        config.time_limit      = std::chrono::seconds(FLAGS_time_limit);
        return config;
    }

    rewrite_rules load_rules(const std::string &path, bool expand) {
        if (path.empty()) {
            throw parse_error("missing rule file");
        }

        auto sets = parse_rules(path);
        auto rules = expand ? active_rules(sets) : all_rules(sets);
        for (const auto &rule : rules) {
            tensor::check_rule(rule);
        }

        spdlog::info("[graphsat] loaded {} rules from {}", rules.size(), path);
        return rules;
    }

    template< typename graph_t >
    void write_dot(const graph_t &graph) {
        if (!FLAGS_dot_out.empty()) {
            to_dot(graph, FLAGS_dot_out);
        }
    }

    int exit_status(stop_reason reason) {
        return is_budget_exhausted(reason) ? exit_budget : exit_within_budget;
    }

    int run_verify() {
        auto axioms = load_rules(FLAGS_axioms, true);
        auto candidates = load_rules(FLAGS_rules, false);

        auto result = verify(
            axioms, candidates, tensor::tensor_graph{}, make_config(),
            write_dot< saturable_egraph< tensor::tensor_graph > >
        );

        for (const auto &v : result.verdicts) {
            std::cout << v.rule << ": " << to_string(v.status) << '\n';
        }

        std::cout << "stop: " << to_string(result.reason)
                  << ", rounds: " << result.rounds
                  << (result.conclusive ? "" : ", inconclusive") << '\n';

        return exit_status(result.reason);
    }

    int run_optimize() {
        auto axioms = load_rules(FLAGS_axioms, true);

        if (FLAGS_graph.empty()) {
            throw parse_error("missing term file");
        }

        auto input = tensor::parse_term(read_term(FLAGS_graph));

        auto model = std::make_shared< tensor::analytic_cost_model >();
        tensor::tensor_graph graph{ tensor::tensor_analysis(model) };

        auto result = optimize(
            input, axioms, *model, std::move(graph), make_config(),
            write_dot< saturable_egraph< tensor::tensor_graph > >
        );

        std::cout << to_string(result.root) << '\n';
        std::cout << "cost: " << result.cost
                  << ", original cost: " << result.original_cost
                  << ", stop: " << to_string(result.reason)
                  << ", rounds: " << result.rounds << '\n';

        return exit_status(result.reason);
    }

    int run() {
        if (FLAGS_mode == "verify")
            return run_verify();
        if (FLAGS_mode == "optimize")
            return run_optimize();

        spdlog::error("[graphsat] unknown mode {}", FLAGS_mode);
        return exit_error;
    }

} // anonymous namespace

int main(int argc, char *argv[])
{
    spdlog::cfg::load_env_levels();
    spdlog::cfg::load_argv_levels(argc, argv);

    google::SetUsageMessage("equality saturation of tensor graphs");
    google::ParseCommandLineFlags(&argc, &argv, true);

    if (!FLAGS_log_level.empty()) {
        spdlog::set_level(spdlog::level::from_str(FLAGS_log_level));
    }

    try {
        return run();
    } catch (const parse_error &err) {
        spdlog::error("[graphsat] input error: {}", err.what());
    } catch (const rule_error &err) {
        spdlog::error("[graphsat] {}", err.what());
    } catch (const analysis_error &err) {
        spdlog::error("[graphsat] ill-formed input: {}", err.what());
    } catch (const merge_conflict &err) {
        spdlog::error("[graphsat] unsound rules: {}", err.what());
    } catch (const extraction_error &err) {
        spdlog::error("[graphsat] extraction failed: {}", err.what());
    } catch (const std::exception &err) {
        // e.g. unwritable dot output
        spdlog::error("[graphsat] {}", err.what());
    }

    return exit_error;
}
