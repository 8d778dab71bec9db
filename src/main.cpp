/// @file main.cpp
/// @brief gatesynth entry point — command-line front end for the circuit search
///
/// `gatesynth search` loads truth tables and a gate library, runs the
/// multi-output (or single-output) search and prints the cheapest circuits.
/// `gatesynth generate` turns an expression file into truth tables.

#include "io/csv_table.hpp"
#include "io/expression.hpp"
#include "io/gate_library_loader.hpp"
#include "io/report.hpp"
#include "io/search_log.hpp"
#include "simulation/netlist_builder.hpp"
#include "synthesis/input_set.hpp"
#include "synthesis/multi_output_search.hpp"
#include "synthesis/single_output_search.hpp"

#include <csignal>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr int EXIT_SOLVED = 0;
constexpr int EXIT_UNSOLVED = 1;
constexpr int EXIT_ERROR = 2;

volatile std::sig_atomic_t g_interrupted = 0;

void on_interrupt(int) {
    g_interrupted = 1;
}

/// Bad command line; reported together with the usage text
class UsageError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

struct SearchOptions {
    std::string inputs_path = "I-O/input.csv";
    std::string outputs_path = "I-O/output.csv";
    std::string gates_path = "I-O/gates_list.csv";
    std::string log_path = "log_output.log";
    int max_level = 10;
    int extra_levels = 2;
    std::optional<size_t> cap;
    bool pruning = true;
    bool verbose = false;
    bool single = false;
    bool netlist = false;
    double time_limit_seconds = 0.0;
};

void print_usage(std::FILE* out) {
    std::fprintf(out,
                 "usage: gatesynth search [options]\n"
                 "       gatesynth generate [circuit.txt] [outdir]\n"
                 "\n"
                 "search options:\n"
                 "  --inputs PATH        input truth table (default I-O/input.csv)\n"
                 "  --outputs PATH       target truth table (default I-O/output.csv)\n"
                 "  --gates PATH         gate library (default I-O/gates_list.csv)\n"
                 "  --log PATH           search log (default log_output.log)\n"
                 "  --max-level N        maximum number of levels (default 10)\n"
                 "  --extra-levels N     levels searched after all outputs are reachable (default 2)\n"
                 "  --cap N              keep at most N signals per level\n"
                 "  --time-limit SECONDS stop after this much wall-clock time\n"
                 "  --no-pruning         evaluate every gate application\n"
                 "  --single             single-output search (exactly one target)\n"
                 "  --netlist            also print the gate-level netlist\n"
                 "  --verbose            log every candidate\n");
}

long parse_integer(const std::string& flag, const std::string& text, long min_value) {
    size_t used = 0;
    long value = 0;
    try {
        value = std::stol(text, &used);
    } catch (const std::exception&) {
        throw UsageError(flag + " expects an integer, got '" + text + "'");
    }
    if (used != text.size() || value < min_value) {
        throw UsageError(flag + " expects an integer >= " + std::to_string(min_value) + ", got '" +
                         text + "'");
    }
    return value;
}

double parse_seconds(const std::string& flag, const std::string& text) {
    size_t used = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &used);
    } catch (const std::exception&) {
        throw UsageError(flag + " expects a number of seconds, got '" + text + "'");
    }
    if (used != text.size() || !(value > 0.0)) {
        throw UsageError(flag + " expects a positive number of seconds, got '" + text + "'");
    }
    return value;
}

SearchOptions parse_search_options(const std::vector<std::string>& args) {
    SearchOptions options;
    for (size_t i = 0; i < args.size(); i++) {
        const std::string& flag = args[i];
        auto value = [&]() -> const std::string& {
            if (i + 1 >= args.size()) {
                throw UsageError(flag + " needs a value");
            }
            return args[++i];
        };

        if (flag == "--inputs") {
            options.inputs_path = value();
        } else if (flag == "--outputs") {
            options.outputs_path = value();
        } else if (flag == "--gates") {
            options.gates_path = value();
        } else if (flag == "--log") {
            options.log_path = value();
        } else if (flag == "--max-level") {
            options.max_level = static_cast<int>(parse_integer(flag, value(), 0));
        } else if (flag == "--extra-levels") {
            options.extra_levels = static_cast<int>(parse_integer(flag, value(), 0));
        } else if (flag == "--cap") {
            options.cap = static_cast<size_t>(parse_integer(flag, value(), 1));
        } else if (flag == "--time-limit") {
            options.time_limit_seconds = parse_seconds(flag, value());
        } else if (flag == "--no-pruning") {
            options.pruning = false;
        } else if (flag == "--single") {
            options.single = true;
        } else if (flag == "--netlist") {
            options.netlist = true;
        } else if (flag == "--verbose") {
            options.verbose = true;
        } else {
            throw UsageError("unknown option '" + flag + "'");
        }
    }
    return options;
}

gatesynth::SearchConfig make_config(const SearchOptions& options) {
    gatesynth::SearchConfig config;
    config.max_complexity = options.max_level;
    config.continuation_levels_after_first_match = options.extra_levels;
    config.pool_cap_per_level = options.cap;
    config.enable_pruning = options.pruning;
    config.time_budget = gatesynth::time_budget_from_seconds(options.time_limit_seconds);
    config.stop_requested = []() { return g_interrupted != 0; };
    return config;
}

/// Rebuilds the found circuit as a netlist and checks it against the targets
std::unique_ptr<gatesynth::Circuit> materialize(const gatesynth::SignalPool& pool,
                                                const std::vector<gatesynth::NetlistOutput>& outputs,
                                                const std::vector<gatesynth::BitVector>& expected) {
    auto circuit = gatesynth::build_netlist(pool, outputs);
    std::vector<gatesynth::BitVector> simulated = circuit->simulate_columns(gatesynth::leaf_columns(pool));
    if (simulated != expected) {
        throw std::logic_error("Materialized netlist does not reproduce the target columns");
    }
    return circuit;
}

int run_single(const SearchOptions& options, const gatesynth::GateLibrary& library,
               gatesynth::InputSet inputs, const gatesynth::NamedColumn& target,
               gatesynth::SearchConfig config, gatesynth::SearchLog& log) {
    gatesynth::SingleOutputSearch search(library, std::move(inputs), std::move(config));
    gatesynth::SingleOutputResult result = search.run(target.bits);
    log.single_result(target.name, result, search.pool());

    if (!result.found()) {
        std::printf("No solution found (%s). Check %s for details.\n",
                    std::string(gatesynth::stop_reason_name(result.stop_reason)).c_str(),
                    options.log_path.c_str());
        return EXIT_UNSOLVED;
    }

    const gatesynth::SignalPool& pool = search.pool();
    std::printf("%s: %s\n", target.name.c_str(),
                gatesynth::render_expression(pool, *result.signal).c_str());
    std::printf("\nCost: %s\n", gatesynth::format_cost(result.cost).c_str());

    gatesynth::NetlistOutput output{target.name, pool[*result.signal].origin, result.signal};
    auto circuit = materialize(pool, {output}, {target.bits});
    if (options.netlist) {
        std::printf("\n%s%s\n", gatesynth::render_netlist(*circuit).c_str(),
                    gatesynth::netlist_summary(*circuit).c_str());
    }
    return EXIT_SOLVED;
}

int run_multi(const SearchOptions& options, const gatesynth::GateLibrary& library,
              gatesynth::InputSet inputs, const std::vector<gatesynth::NamedColumn>& targets,
              gatesynth::SearchConfig config, gatesynth::SearchLog& log) {
    gatesynth::MultiOutputSearch search(library, std::move(inputs), std::move(config));
    gatesynth::MultiOutputResult result = search.run(targets);
    const gatesynth::SignalPool& pool = search.pool();
    log.multi_result(result, pool);

    if (result.outputs.empty()) {
        std::printf("No solution found (%s). Check %s for details.\n",
                    std::string(gatesynth::stop_reason_name(result.stop_reason)).c_str(),
                    options.log_path.c_str());
        return EXIT_UNSOLVED;
    }

    std::vector<gatesynth::NetlistOutput> outputs;
    std::vector<gatesynth::BitVector> expected;
    for (const gatesynth::OutputRealization& output : result.outputs) {
        std::printf("%s: %s\n", output.name.c_str(),
                    gatesynth::render_expression(pool, output.derivation.origin).c_str());
        outputs.push_back({output.name, output.derivation.origin, output.derivation.signal});
        for (const gatesynth::NamedColumn& target : targets) {
            if (target.name == output.name) {
                expected.push_back(target.bits);
            }
        }
    }
    for (const std::string& name : result.missing) {
        std::printf("%s: not found\n", name.c_str());
    }
    std::printf("\nCombined cost: %s\n", gatesynth::format_cost(result.total_cost).c_str());

    auto circuit = materialize(pool, outputs, expected);
    if (options.netlist) {
        std::printf("\n%s%s\n", gatesynth::render_netlist(*circuit).c_str(),
                    gatesynth::netlist_summary(*circuit).c_str());
    }
    return result.complete() ? EXIT_SOLVED : EXIT_UNSOLVED;
}

int run_search(const std::vector<std::string>& args) {
    SearchOptions options = parse_search_options(args);

    std::unique_ptr<std::FILE, int (*)(std::FILE*)> log_file(std::fopen(options.log_path.c_str(), "w"),
                                                             &std::fclose);
    if (!log_file) {
        throw std::runtime_error("Cannot write log file " + options.log_path);
    }
    gatesynth::SearchLog log(log_file.get(), options.verbose);

    try {
        gatesynth::InputSet inputs(gatesynth::read_truth_table_csv(options.inputs_path));
        std::vector<gatesynth::NamedColumn> targets = gatesynth::read_truth_table_csv(options.outputs_path);
        gatesynth::GateLibrary library = gatesynth::load_gate_library_csv(options.gates_path);
        inputs.check_targets(targets);

        if (options.single && targets.size() != 1) {
            throw UsageError("--single needs exactly one target column, " + options.outputs_path +
                             " has " + std::to_string(targets.size()));
        }

        log.header(options.inputs_path, inputs, options.outputs_path, targets, options.gates_path,
                   library);

        gatesynth::SearchConfig config = make_config(options);
        log.attach(config);

        std::signal(SIGINT, on_interrupt);
        if (options.single) {
            return run_single(options, library, std::move(inputs), targets.front(), std::move(config), log);
        }
        return run_multi(options, library, std::move(inputs), targets, std::move(config), log);
    } catch (const std::exception& e) {
        log.error(e.what());
        throw;
    }
}

int run_generate(const std::vector<std::string>& args) {
    if (args.size() > 2) {
        throw UsageError("generate takes at most two arguments");
    }
    std::string circuit_path = args.size() > 0 ? args[0] : "circuit.txt";
    std::filesystem::path out_dir = args.size() > 1 ? args[1] : "I-O";

    gatesynth::CircuitFile file = gatesynth::load_circuit_file(circuit_path);
    gatesynth::GeneratedTables tables = gatesynth::generate_tables(file);

    std::filesystem::create_directories(out_dir);
    std::string inputs_path = (out_dir / "input.csv").string();
    gatesynth::write_truth_table_csv(inputs_path, tables.inputs.columns());
    std::printf("Wrote %s (%zu variables, %zu rows)\n", inputs_path.c_str(), tables.inputs.num_vars(),
                tables.inputs.num_rows());

    if (!file.inputs_only) {
        std::string outputs_path = (out_dir / "output.csv").string();
        gatesynth::write_truth_table_csv(outputs_path, tables.outputs);
        for (const gatesynth::CircuitFile::Output& output : file.outputs) {
            std::printf("  %s = %s\n", output.name.c_str(), gatesynth::to_string(output.expression).c_str());
        }
        std::printf("Wrote %s (%zu outputs)\n", outputs_path.c_str(), tables.outputs.size());
    }
    return EXIT_SOLVED;
}

} // namespace

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty() || args[0] == "--help" || args[0] == "-h") {
        print_usage(args.empty() ? stderr : stdout);
        return args.empty() ? EXIT_ERROR : EXIT_SOLVED;
    }

    std::string command = args[0];
    args.erase(args.begin());

    try {
        if (command == "search") {
            return run_search(args);
        }
        if (command == "generate") {
            return run_generate(args);
        }
        throw UsageError("unknown command '" + command + "'");
    } catch (const UsageError& e) {
        std::fprintf(stderr, "[gatesynth] %s\n\n", e.what());
        print_usage(stderr);
        return EXIT_ERROR;
    } catch (const std::exception& e) {
        std::fprintf(stderr, "[gatesynth] %s\n", e.what());
        return EXIT_ERROR;
    }
}
