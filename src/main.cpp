/// @file src/main.cpp
/// @brief medsim CLI entry point.
///
/// Usage:
///   medsim --evaluate <scenario>                      Score the scenario's proposal
///   medsim --simulate <scenario> [--steps N] [--seed S]
///   medsim --explore  <scenario> [--runs N] [--steps N]
///   medsim --sensitivity <scenario> [--runs N] [--steps N]
///   medsim --help

#include "medsim/engine.hpp"
#include "medsim/errors.hpp"
#include "medsim/monte_carlo.hpp"
#include "medsim/scenario_loader.hpp"

#include <fmt/core.h>

#include <array>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace {

constexpr const char* SCENARIO_SPACE_ID = "scenario";

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  medsim --evaluate <file>                       Utility and acceptance per party\n"
        "  medsim --simulate <file> [--steps N] [--seed S] Field simulation of the agreement\n"
        "  medsim --explore <file> [--runs N] [--steps N]  Monte Carlo over seeds\n"
        "  medsim --sensitivity <file> [--runs N] [--steps N]\n"
        "  medsim --help                                  Show this help\n"
        "  add --verbose to any mode for per-step diagnostics on stderr\n"
        "\n"
        "Scenario format (one record per line, '#' starts a comment):\n"
        "  dimension,<id>,continuous,<min>,<max>[,<unit>]\n"
        "  dimension,<id>,boolean\n"
        "  dimension,<id>,categorical,<a>|<b>|...\n"
        "  party,<id>,<batna>,<risk_tolerance>\n"
        "  interest,<party>,<dimension>,<weight>,<ideal>,<minimum>\n"
        "  redline,<party>,<dimension>\n"
        "  proposal,<id>,<round>,<proposer>\n"
        "  term,<dimension>,<value>\n"
    );
}

struct Options {
    std::size_t                  steps = medsim::constants::DEFAULT_DURATION;
    std::size_t                  runs  = 16;
    std::optional<std::uint64_t> seed;
    bool                         verbose = false;
};

[[nodiscard]] std::optional<std::uint64_t> parse_unsigned(const std::string& s) {
    if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    try {
        return static_cast<std::uint64_t>(std::stoull(s));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

/// Parse the flags following the scenario path.  Returns nullopt (after
/// printing a message) on an unknown flag or a bad number.
[[nodiscard]] std::optional<Options> parse_options(int argc, char* argv[], int first) {
    Options opt;
    for (int i = first; i < argc; ++i) {
        const std::string flag(argv[i]);
        if (flag == "--verbose") {
            opt.verbose = true;
            continue;
        }
        if (flag != "--steps" && flag != "--seed" && flag != "--runs") {
            fmt::print(stderr, "Unknown option: {}\n", flag);
            return std::nullopt;
        }
        if (i + 1 >= argc) {
            fmt::print(stderr, "Error: {} requires a value\n", flag);
            return std::nullopt;
        }
        const auto value = parse_unsigned(argv[++i]);
        if (!value) {
            fmt::print(stderr, "Error: {} expects a non-negative integer, got '{}'\n",
                       flag, argv[i]);
            return std::nullopt;
        }
        if (flag == "--steps")     opt.steps = static_cast<std::size_t>(*value);
        else if (flag == "--runs") opt.runs  = static_cast<std::size_t>(*value);
        else                       opt.seed  = *value;
    }
    return opt;
}

[[nodiscard]] std::optional<medsim::core::Scenario> load(const std::string& filepath) {
    auto scenario = medsim::core::ScenarioLoader::load_file(filepath);
    if (!scenario) {
        fmt::print(stderr, "Error: cannot open file '{}'\n", filepath);
        return std::nullopt;
    }
    if (scenario->dimensions.empty() || scenario->parties.empty()) {
        fmt::print(stderr, "Error: '{}' declares no dimensions or no parties\n", filepath);
        return std::nullopt;
    }
    fmt::print("Loaded {} dimensions, {} parties, proposal '{}' from '{}'",
               scenario->dimensions.size(), scenario->parties.size(),
               scenario->proposal.id, filepath);
    if (scenario->skipped_rows > 0) {
        fmt::print(" ({} malformed rows skipped)", scenario->skipped_rows);
    }
    fmt::print("\n");
    return scenario;
}

[[nodiscard]] medsim::core::EngineConfig make_config(const Options& opt) {
    medsim::core::EngineConfig cfg;
    cfg.verbose = opt.verbose;
    return cfg;
}

int run_evaluate(const medsim::core::Scenario& sc, const Options& opt) {
    medsim::core::Engine engine(make_config(opt));
    engine.register_issue_space(sc.issue_space(SCENARIO_SPACE_ID));

    const auto eval = engine.evaluate_proposal(SCENARIO_SPACE_ID, sc.proposal, sc.parties);
    fmt::print("{}", eval.to_string());
    return 0;
}

int run_simulate(const medsim::core::Scenario& sc, const Options& opt) {
    medsim::core::Engine engine(make_config(opt));
    engine.register_issue_space(sc.issue_space(SCENARIO_SPACE_ID));

    const auto run = engine.simulate_agreement(SCENARIO_SPACE_ID, sc.proposal, sc.parties,
                                               opt.steps, opt.seed);
    fmt::print("Simulated '{}' for {} steps (seed {})\n",
               run.proposal.id, run.steps_completed, run.seed);
    fmt::print("{}", run.summary.to_string());
    return 0;
}

int run_explore(const medsim::core::Scenario& sc, const Options& opt) {
    if (opt.runs == 0) {
        fmt::print(stderr, "Error: --runs must be at least 1\n");
        return 1;
    }
    medsim::core::Engine engine(make_config(opt));
    engine.register_issue_space(sc.issue_space(SCENARIO_SPACE_ID));

    const std::uint64_t base = opt.seed ? *opt.seed : medsim::core::Engine::generate_seed();
    const auto seeds = medsim::analysis::MonteCarloExplorer::seed_sequence(base, opt.runs);
    const medsim::analysis::MonteCarloExplorer explorer(engine);

    const auto report = explorer.explore(SCENARIO_SPACE_ID, sc.proposal, sc.parties,
                                         opt.steps, seeds);
    fmt::print("Seeds {}..{}\n", base, base + opt.runs - 1);
    fmt::print("{}", report.to_string());
    return 0;
}

int run_sensitivity(const medsim::core::Scenario& sc, const Options& opt) {
    if (opt.runs == 0) {
        fmt::print(stderr, "Error: --runs must be at least 1\n");
        return 1;
    }
    using medsim::analysis::SimParameter;

    const auto space = sc.issue_space(SCENARIO_SPACE_ID);
    const medsim::analysis::SensitivityAnalyzer analyzer(make_config(opt));
    const std::uint64_t base = opt.seed ? *opt.seed : medsim::core::Engine::generate_seed();
    const auto seeds = medsim::analysis::MonteCarloExplorer::seed_sequence(base, opt.runs);

    struct Sweep {
        SimParameter          parameter;
        std::array<double, 4> values;
    };
    constexpr std::array<Sweep, 5> sweeps{{
        {SimParameter::CuesSuccess,         {0.6, 0.75, 0.9, 1.0}},
        {SimParameter::HotlineSuccess,      {0.6, 0.75, 0.85, 1.0}},
        {SimParameter::WeatherPerturbation, {0.0, 0.25, 0.5, 1.0}},
        {SimParameter::MemoryDecay,         {0.05, 0.1, 0.2, 0.4}},
        {SimParameter::InteractionRate,     {0.15, 0.25, 0.35, 0.5}},
    }};

    for (const auto& sweep : sweeps) {
        const auto result = analyzer.one_at_a_time(space, sc.proposal, sc.parties,
                                                   sweep.parameter, sweep.values,
                                                   opt.steps, seeds);
        fmt::print("{}", result.to_string());
    }
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string mode(argv[1]);

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    if (mode != "--evaluate" && mode != "--simulate"
        && mode != "--explore" && mode != "--sensitivity") {
        fmt::print(stderr, "Unknown option: {}\n", mode);
        print_usage();
        return 1;
    }
    if (argc < 3) {
        fmt::print(stderr, "Error: {} requires a scenario file path\n", mode);
        print_usage();
        return 1;
    }

    const auto opt = parse_options(argc, argv, 3);
    if (!opt) {
        print_usage();
        return 1;
    }
    const auto scenario = load(std::string(argv[2]));
    if (!scenario) {
        return 1;
    }

    try {
        if (mode == "--evaluate")  return run_evaluate(*scenario, *opt);
        if (mode == "--simulate")  return run_simulate(*scenario, *opt);
        if (mode == "--explore")   return run_explore(*scenario, *opt);
        return run_sensitivity(*scenario, *opt);
    } catch (const medsim::ValidationError& e) {
        fmt::print(stderr, "Invalid scenario: {}\n", e.what());
    } catch (const medsim::ConfigurationError& e) {
        fmt::print(stderr, "Bad configuration: {}\n", e.what());
    } catch (const medsim::SimulationError& e) {
        fmt::print(stderr, "Simulation failed: {}\n", e.what());
    } catch (const std::exception& e) {
        fmt::print(stderr, "Fatal error: {}\n", e.what());
    }
    return 1;
}
