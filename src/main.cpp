#include <cctype>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "analysis.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "simulation_config.hpp"
#include "io/config_reader.hpp"
#include "io/json_writer.hpp"

namespace {

struct CLIArgs {
    std::string config_path;
    std::string output_path;
    std::string log_file;
    std::string log_level = "INFO";
    bool log_text = false;
    bool help = false;
    bool common_random_numbers = false;
    std::optional<size_t> trials;
    std::optional<uint64_t> seed;
    std::optional<double> lambda;
    std::optional<uint64_t> policies;
    std::optional<double> claim_probability;
    std::optional<double> mu;
    std::optional<double> sigma;
    std::optional<double> mean;
    std::optional<double> std_dev;
    std::optional<double> retention;
    std::optional<double> limit;
    std::optional<xolcalc::LayerBasis> basis;
    std::optional<double> premium;
    std::optional<double> inflation;
    std::optional<int> threads;
};

xolcalc::CancellationToken g_cancel;

void handle_interrupt(int) {
    g_cancel.cancel();
}

// std::stoull accepts a sign and wraps "-1" to 2^64 - 1, so unsigned
// options must start with a digit and be consumed entirely
uint64_t parse_unsigned(const std::string& value) {
    if (value.empty() || !std::isdigit(static_cast<unsigned char>(value[0]))) {
        throw std::invalid_argument("expected a non-negative integer");
    }
    size_t consumed = 0;
    uint64_t result = std::stoull(value, &consumed);
    if (consumed != value.size()) {
        throw std::invalid_argument("expected a non-negative integer");
    }
    return result;
}

int parse_int(const std::string& value) {
    size_t consumed = 0;
    int result = std::stoi(value, &consumed);
    if (consumed != value.size()) {
        throw std::invalid_argument("expected an integer");
    }
    return result;
}

double parse_double(const std::string& value) {
    size_t consumed = 0;
    double result = std::stod(value, &consumed);
    if (consumed != value.size()) {
        throw std::invalid_argument("expected a number");
    }
    return result;
}

void print_usage(const char* program_name) {
    std::cerr << "XolCalc Engine v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " [options]\n\n";
    std::cerr << "Configuration:\n";
    std::cerr << "  --config <path>             JSON analysis configuration file\n";
    std::cerr << "                              (command-line options override file values)\n\n";
    std::cerr << "Simulation options:\n";
    std::cerr << "  --trials <count>            Monte Carlo trials per scenario (default: 100000)\n";
    std::cerr << "  --seed <value>              Random seed for reproducibility (default: 42)\n";
    std::cerr << "  --threads <n>               Worker threads, 0 = all cores (default: 0)\n";
    std::cerr << "  --crn                       Stressed run reuses the baseline random numbers\n\n";
    std::cerr << "Frequency options:\n";
    std::cerr << "  --lambda <value>            Poisson mean claim count per trial (default: 2)\n";
    std::cerr << "  --policies <n>              Binomial frequency: number of policies\n";
    std::cerr << "  --claim-prob <p>            Binomial frequency: claim probability per policy\n\n";
    std::cerr << "Severity options (lognormal):\n";
    std::cerr << "  --mu <value>                Mean of log claim size\n";
    std::cerr << "  --sigma <value>             Standard deviation of log claim size\n";
    std::cerr << "  --mean <value>              Mean claim size (with --std-dev, instead of --mu/--sigma)\n";
    std::cerr << "  --std-dev <value>           Claim size standard deviation\n\n";
    std::cerr << "Layer options:\n";
    std::cerr << "  --retention <amount>        Layer retention (default: 20000)\n";
    std::cerr << "  --limit <amount|unlimited>  Layer limit (default: 50000)\n";
    std::cerr << "  --basis <aggregate|per_risk>\n";
    std::cerr << "                              Apply the layer to each trial's total or to\n";
    std::cerr << "                              every claim (default: aggregate)\n";
    std::cerr << "  --premium <amount>          Reinsurance premium (default: 7500)\n";
    std::cerr << "  --inflation <rate>          Severity inflation for the stressed run (default: 0.08)\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --output <path>             JSON output file (default: stdout)\n";
    std::cerr << "  --log-level <level>         DEBUG, INFO, WARN or ERROR (default: INFO)\n";
    std::cerr << "  --log-file <path>           Also append log lines to this file\n";
    std::cerr << "  --log-text                  Plain-text log lines instead of JSON\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Examples:\n\n";
    std::cerr << "  " << program_name << " --lambda 2 --mean 10000 --std-dev 5000 \\\n";
    std::cerr << "      --retention 20000 --limit 50000 --premium 7500 \\\n";
    std::cerr << "      --trials 50000 --seed 42 --output results.json\n\n";
    std::cerr << "  " << program_name << " --config analysis.json --inflation 0.10\n";
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        try {
            if (arg == "--help" || arg == "-h") {
                args.help = true;
                return true;
            } else if (arg == "--crn") {
                args.common_random_numbers = true;
            } else if (arg == "--log-text") {
                args.log_text = true;
            } else if (arg == "--config" && i + 1 < argc) {
                args.config_path = argv[++i];
            } else if (arg == "--output" && i + 1 < argc) {
                args.output_path = argv[++i];
            } else if (arg == "--log-level" && i + 1 < argc) {
                args.log_level = argv[++i];
            } else if (arg == "--log-file" && i + 1 < argc) {
                args.log_file = argv[++i];
            } else if (arg == "--trials" && i + 1 < argc) {
                std::string value = argv[++i];
                if (!value.empty() && value[0] == '-') {
                    std::cerr << "Error: --trials must be greater than 0\n\n";
                    return false;
                }
                args.trials = static_cast<size_t>(parse_unsigned(value));
            } else if (arg == "--seed" && i + 1 < argc) {
                args.seed = parse_unsigned(argv[++i]);
            } else if (arg == "--threads" && i + 1 < argc) {
                args.threads = parse_int(argv[++i]);
            } else if (arg == "--lambda" && i + 1 < argc) {
                args.lambda = parse_double(argv[++i]);
            } else if (arg == "--policies" && i + 1 < argc) {
                args.policies = parse_unsigned(argv[++i]);
            } else if (arg == "--claim-prob" && i + 1 < argc) {
                args.claim_probability = parse_double(argv[++i]);
            } else if (arg == "--mu" && i + 1 < argc) {
                args.mu = parse_double(argv[++i]);
            } else if (arg == "--sigma" && i + 1 < argc) {
                args.sigma = parse_double(argv[++i]);
            } else if (arg == "--mean" && i + 1 < argc) {
                args.mean = parse_double(argv[++i]);
            } else if (arg == "--std-dev" && i + 1 < argc) {
                args.std_dev = parse_double(argv[++i]);
            } else if (arg == "--retention" && i + 1 < argc) {
                args.retention = parse_double(argv[++i]);
            } else if (arg == "--limit" && i + 1 < argc) {
                args.limit = xolcalc::io::parse_limit(argv[++i]);
            } else if (arg == "--basis" && i + 1 < argc) {
                args.basis = xolcalc::layer_basis_from_string(argv[++i]);
            } else if (arg == "--premium" && i + 1 < argc) {
                args.premium = parse_double(argv[++i]);
            } else if (arg == "--inflation" && i + 1 < argc) {
                args.inflation = parse_double(argv[++i]);
            } else {
                std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
                return false;
            }
        } catch (const std::exception& e) {
            std::cerr << "Error: Invalid value for " << arg << ": " << e.what() << "\n\n";
            return false;
        }
    }
    return true;
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;

    if (args.mu.has_value() != args.sigma.has_value()) {
        std::cerr << "Error: --mu and --sigma must be given together\n";
        valid = false;
    }
    if (args.mean.has_value() != args.std_dev.has_value()) {
        std::cerr << "Error: --mean and --std-dev must be given together\n";
        valid = false;
    }
    if (args.mu && args.mean) {
        std::cerr << "Error: use either --mu/--sigma or --mean/--std-dev, not both\n";
        valid = false;
    }
    if (args.policies.has_value() != args.claim_probability.has_value()) {
        std::cerr << "Error: --policies and --claim-prob must be given together\n";
        valid = false;
    }
    if (args.lambda && args.policies) {
        std::cerr << "Error: use either --lambda or --policies/--claim-prob, not both\n";
        valid = false;
    }
    if (!args.config_path.empty()) {
        std::ifstream f(args.config_path);
        if (!f.good()) {
            std::cerr << "Error: Config file not found: " << args.config_path << "\n";
            valid = false;
        }
    }

    return valid;
}

// Command-line values override the file (or default) configuration
void apply_overrides(const CLIArgs& args, xolcalc::SimulationConfig& config) {
    if (args.trials) config.trials = *args.trials;
    if (args.seed) config.seed = *args.seed;
    if (args.threads) config.num_threads = *args.threads;
    if (args.common_random_numbers) config.common_random_numbers = true;
    if (args.lambda) config.frequency = xolcalc::FrequencyParams::poisson(*args.lambda);
    if (args.policies) {
        config.frequency = xolcalc::FrequencyParams::binomial(*args.policies,
                                                              *args.claim_probability);
    }
    if (args.mu) config.severity = xolcalc::SeverityParams(*args.mu, *args.sigma);
    if (args.mean) {
        config.severity = xolcalc::SeverityParams::from_moments(*args.mean, *args.std_dev);
    }
    if (args.retention) config.retention = *args.retention;
    if (args.limit) config.limit = *args.limit;
    if (args.basis) config.layer_basis = *args.basis;
    if (args.premium) config.premium = *args.premium;
    if (args.inflation) config.inflation_rate = *args.inflation;
}

void print_metrics(const std::string& title, const xolcalc::RiskMetrics& m) {
    std::cerr << "\n" << title << ":\n";
    std::cerr << "  Expected Ceded Loss: " << m.expected_loss << "\n";
    std::cerr << "  Std Dev:             " << m.std_dev << "\n";
    std::cerr << "  VaR 99%:             " << m.var_99 << "\n";
    std::cerr << "  TVaR 99%:            " << m.tvar_99 << "\n";
    std::cerr << "  P(Reinsurer Pays):   " << m.trigger_probability << "\n";
    std::cerr << "  Value for Money:     " << m.value_for_money << "\n";
    if (m.claim_hit_ratio) {
        std::cerr << "  P(Claim Hits Layer): " << *m.claim_hit_ratio << "\n";
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 1;
    }

    if (args.help || argc == 1) {
        print_usage(argv[0]);
        return 0;
    }

    if (!validate_args(args)) {
        std::cerr << "\nUse --help for usage information.\n";
        return 1;
    }

    try {
        xolcalc::LoggerConfig log_config;
        log_config.min_level = xolcalc::string_to_level(args.log_level);
        log_config.enable_json = !args.log_text;
        if (!args.log_file.empty()) {
            log_config.enable_file = true;
            log_config.log_file_path = args.log_file;
        }
        xolcalc::Logger::get_instance().configure(log_config);

        xolcalc::io::AnalysisConfig analysis;
        if (!args.config_path.empty()) {
            analysis = xolcalc::io::parse_analysis_config_from_file(args.config_path);
        }
        apply_overrides(args, analysis.simulation);

        std::signal(SIGINT, handle_interrupt);

        xolcalc::AnalysisResult result = xolcalc::run_analysis(analysis.simulation, &g_cancel);

        std::vector<xolcalc::LayerComparison> comparisons;
        if (!analysis.layer_options.empty()) {
            comparisons = xolcalc::compare_layers(analysis.simulation,
                                                  analysis.layer_options, &g_cancel);
        }

        print_metrics("Baseline", result.baseline.metrics);
        print_metrics("Stressed (inflation " +
                      std::to_string(analysis.simulation.inflation_rate) + ")",
                      result.stressed.metrics);
        for (const auto& comparison : comparisons) {
            print_metrics("Layer option " + comparison.option.name + " (baseline)",
                          comparison.baseline);
            print_metrics("Layer option " + comparison.option.name + " (stressed)",
                          comparison.stressed);
        }

        if (args.output_path.empty()) {
            xolcalc::io::write_analysis_result_json(std::cout, result, comparisons);
        } else {
            xolcalc::io::write_analysis_result_json(args.output_path, result, comparisons);
            std::cerr << "\nOutput written to: " << args.output_path << "\n";
        }

        xolcalc::Logger::get_instance().flush();
        return 0;
    } catch (const xolcalc::ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    } catch (const xolcalc::ComputationError& e) {
        std::cerr << "Computation error: " << e.what() << "\n";
        return 2;
    } catch (const xolcalc::AnalysisCancelled& e) {
        std::cerr << "Cancelled: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
