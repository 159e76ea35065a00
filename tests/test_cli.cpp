#include <catch2/catch.hpp>
#include <nlohmann/json.hpp>
#include <sys/wait.h>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>

using json = nlohmann::json;

namespace {

// Helper to run CLI command and capture output
struct CommandResult {
    int exit_code;
    std::string stdout_output;
    std::string stderr_output;
};

std::string read_file(const std::string& path) {
    std::ifstream stream(path);
    std::ostringstream ss;
    if (stream) {
        ss << stream.rdbuf();
    }
    return ss.str();
}

CommandResult run_command(const std::string& cmd) {
    CommandResult result;

    std::string stdout_file = "/tmp/xolcalc_test_stdout.txt";
    std::string stderr_file = "/tmp/xolcalc_test_stderr.txt";

    std::string full_cmd = cmd + " >" + stdout_file + " 2>" + stderr_file;
    int status = std::system(full_cmd.c_str());

    result.stdout_output = read_file(stdout_file);
    result.stderr_output = read_file(stderr_file);

    // Normalize exit code (system() returns the raw wait status)
    result.exit_code = WEXITSTATUS(status);

    return result;
}

// Small, fast run shared by the happy-path cases
const std::string SMALL_RUN = "./xolcalc --trials 2000 --seed 42 --log-level ERROR";

} // anonymous namespace

// ============================================================================
// Usage and argument errors
// ============================================================================

TEST_CASE("CLI help shows usage", "[cli]") {
    auto result = run_command("./xolcalc --help");
    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stderr_output.find("Usage:") != std::string::npos);
    REQUIRE(result.stderr_output.find("--trials") != std::string::npos);
    REQUIRE(result.stderr_output.find("--retention") != std::string::npos);
    REQUIRE(result.stderr_output.find("--limit") != std::string::npos);
    REQUIRE(result.stderr_output.find("--inflation") != std::string::npos);
    REQUIRE(result.stderr_output.find("--config") != std::string::npos);
}

TEST_CASE("CLI no args shows usage", "[cli]") {
    auto result = run_command("./xolcalc");
    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stderr_output.find("Usage:") != std::string::npos);
}

TEST_CASE("CLI rejects bad arguments", "[cli][error]") {
    SECTION("Unknown option") {
        auto result = run_command("./xolcalc --frobnicate");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("Unknown option") != std::string::npos);
    }

    SECTION("Missing value") {
        auto result = run_command("./xolcalc --trials");
        REQUIRE(result.exit_code == 1);
    }

    SECTION("Non-numeric value") {
        auto result = run_command("./xolcalc --lambda lots");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("Invalid value for --lambda") != std::string::npos);
    }

    SECTION("Bad limit") {
        auto result = run_command("./xolcalc --limit -100");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("Invalid value for --limit") != std::string::npos);
    }

    SECTION("Negative trials") {
        auto result = run_command("./xolcalc --trials -5");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("--trials must be greater than 0") != std::string::npos);
    }

    SECTION("Negative seed is not wrapped") {
        auto result = run_command("./xolcalc --seed -1 --trials 10");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("Invalid value for --seed") != std::string::npos);
    }

    SECTION("Negative policies") {
        auto result = run_command("./xolcalc --policies -3 --claim-prob 0.2 --trials 1");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("Invalid value for --policies") != std::string::npos);
    }

    SECTION("Trailing characters") {
        auto result = run_command("./xolcalc --threads 2x");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("Invalid value for --threads") != std::string::npos);
    }

    SECTION("Unknown layer basis") {
        auto result = run_command("./xolcalc --basis per_event");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("Invalid value for --basis") != std::string::npos);
    }

    SECTION("Unpaired severity options") {
        auto result = run_command("./xolcalc --mean 10000");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("--mean and --std-dev") != std::string::npos);
    }

    SECTION("Missing config file") {
        auto result = run_command("./xolcalc --config no_such_config.json");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("Config file not found") != std::string::npos);
    }
}

TEST_CASE("CLI configuration errors exit 1", "[cli][error]") {
    SECTION("Zero trials") {
        auto result = run_command("./xolcalc --trials 0");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("Configuration error") != std::string::npos);
    }

    SECTION("Negative inflation") {
        auto result = run_command(SMALL_RUN + " --inflation -0.5");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("Configuration error") != std::string::npos);
    }

    SECTION("Zero premium") {
        auto result = run_command(SMALL_RUN + " --premium 0");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("Configuration error") != std::string::npos);
    }
}

// ============================================================================
// Successful runs
// ============================================================================

TEST_CASE("CLI writes JSON to stdout", "[cli]") {
    auto result = run_command(SMALL_RUN);
    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stderr_output.find("Expected Ceded Loss") != std::string::npos);

    json j = json::parse(result.stdout_output);
    REQUIRE(j["baseline"]["trials"].get<int>() == 2000);
    REQUIRE(j["baseline"]["scenario_id"].get<int>() == 0);
    REQUIRE(j["stressed"]["scenario_id"].get<int>() == 1);
    REQUIRE(j["baseline"]["var_99"].get<double>() <= 50000.0);
    REQUIRE(j["stressed"]["expected_loss"].get<double>() >
            j["baseline"]["expected_loss"].get<double>());
}

TEST_CASE("CLI output file and reproducibility", "[cli]") {
    const std::string first = "/tmp/xolcalc_cli_first.json";
    const std::string second = "/tmp/xolcalc_cli_second.json";

    auto run1 = run_command(SMALL_RUN + " --threads 1 --output " + first);
    auto run2 = run_command(SMALL_RUN + " --threads 2 --output " + second);
    REQUIRE(run1.exit_code == 0);
    REQUIRE(run2.exit_code == 0);
    REQUIRE(run1.stderr_output.find("Output written to:") != std::string::npos);

    json a = json::parse(read_file(first));
    json b = json::parse(read_file(second));
    REQUIRE(a["baseline"]["expected_loss"] == b["baseline"]["expected_loss"]);
    REQUIRE(a["baseline"]["var_99"] == b["baseline"]["var_99"]);
    REQUIRE(a["stressed"]["tvar_99"] == b["stressed"]["tvar_99"]);

    std::remove(first.c_str());
    std::remove(second.c_str());
}

TEST_CASE("CLI unlimited layer and binomial frequency", "[cli]") {
    auto result = run_command(SMALL_RUN +
                              " --policies 200 --claim-prob 0.2 --mean 9.07 --std-dev 10.132"
                              " --retention 25 --limit unlimited --premium 48.5");
    REQUIRE(result.exit_code == 0);

    json j = json::parse(result.stdout_output);
    REQUIRE(j["baseline"]["trigger_probability"].get<double>() > 0.0);
    REQUIRE(j["baseline"]["expected_loss"].get<double>() > 0.0);
}

TEST_CASE("CLI per-risk layer basis", "[cli]") {
    auto result = run_command(SMALL_RUN +
                              " --policies 200 --claim-prob 0.2 --mean 9.07 --std-dev 10.132"
                              " --retention 25 --limit unlimited --premium 48.5 --basis per_risk");
    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stderr_output.find("P(Claim Hits Layer)") != std::string::npos);

    json j = json::parse(result.stdout_output);
    REQUIRE(j["baseline"]["layer_basis"] == "per_risk");
    double hit_ratio = j["baseline"]["claim_hit_ratio"].get<double>();
    REQUIRE(hit_ratio > 0.0);
    REQUIRE(hit_ratio < 1.0);
    REQUIRE(j["stressed"].contains("claim_hit_ratio"));
}

TEST_CASE("CLI config file with layer options", "[cli]") {
    const std::string config_path = "/tmp/xolcalc_cli_config.json";
    {
        std::ofstream ofs(config_path);
        ofs << R"({
            "trials": 100000,
            "seed": 7,
            "frequency": {"lambda": 2},
            "severity": {"mean": 10000, "std_dev": 5000},
            "layer": {"retention": 20000, "limit": 50000},
            "premium": 7500,
            "layer_options": [
                {"name": "low", "retention": 15000, "limit": null, "premium": 9000},
                {"name": "high", "retention": 30000, "limit": 40000, "premium": 4000}
            ]
        })";
    }

    // Command line overrides the file's trial count
    auto result = run_command("./xolcalc --config " + config_path +
                              " --trials 1500 --log-level ERROR");
    REQUIRE(result.exit_code == 0);

    json j = json::parse(result.stdout_output);
    REQUIRE(j["baseline"]["trials"].get<int>() == 1500);
    REQUIRE(j["layer_options"].size() == 2);
    REQUIRE(j["layer_options"][0]["name"] == "low");
    REQUIRE(j["layer_options"][0]["limit"].is_null());
    REQUIRE(j["layer_options"][0]["baseline"]["expected_loss"].get<double>() >=
            j["layer_options"][1]["baseline"]["expected_loss"].get<double>());

    std::remove(config_path.c_str());
}

TEST_CASE("CLI malformed config file", "[cli][error]") {
    const std::string config_path = "/tmp/xolcalc_cli_bad_config.json";
    {
        std::ofstream ofs(config_path);
        ofs << "{\"trials\": 100,";
    }

    auto result = run_command("./xolcalc --config " + config_path);
    REQUIRE(result.exit_code == 1);
    REQUIRE(result.stderr_output.find("Configuration error") != std::string::npos);

    std::remove(config_path.c_str());
}
