#include <catch2/catch.hpp>
#include <nlohmann/json.hpp>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <sys/wait.h>

using json = nlohmann::json;

namespace {

// Helper to run CLI command and capture output
struct CommandResult {
    int exit_code;
    std::string stdout_output;
    std::string stderr_output;
};

std::string read_file(const std::string& path) {
    std::ifstream in(path);
    std::ostringstream ss;
    if (in) {
        ss << in.rdbuf();
    }
    return ss.str();
}

CommandResult run_command(const std::string& cmd) {
    CommandResult result;

    std::string stdout_file = "/tmp/litisim_test_stdout.txt";
    std::string stderr_file = "/tmp/litisim_test_stderr.txt";

    std::string full_cmd = cmd + " >" + stdout_file + " 2>" + stderr_file;
    int status = std::system(full_cmd.c_str());

    result.stdout_output = read_file(stdout_file);
    result.stderr_output = read_file(stderr_file);

    // Normalize exit code (system() returns a wait status)
    result.exit_code = WEXITSTATUS(status);
    return result;
}

const std::string BASE_CASE =
    "./litisim --conservative 30000 --recommended 50000 --aggressive 75000 --case-strength 8";

} // anonymous namespace

TEST_CASE("CLI help shows usage", "[cli]") {
    auto result = run_command("./litisim --help");
    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stderr_output.find("Usage:") != std::string::npos);
    REQUIRE(result.stderr_output.find("--conservative") != std::string::npos);
    REQUIRE(result.stderr_output.find("--recommended") != std::string::npos);
    REQUIRE(result.stderr_output.find("--aggressive") != std::string::npos);
    REQUIRE(result.stderr_output.find("--case-strength") != std::string::npos);
    REQUIRE(result.stderr_output.find("--settlement-rate") != std::string::npos);
    REQUIRE(result.stderr_output.find("--trials") != std::string::npos);
    REQUIRE(result.stderr_output.find("--seed") != std::string::npos);
    REQUIRE(result.stderr_output.find("--config") != std::string::npos);
    REQUIRE(result.stderr_output.find("--output") != std::string::npos);
}

TEST_CASE("CLI no args shows usage", "[cli]") {
    auto result = run_command("./litisim");
    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stderr_output.find("Usage:") != std::string::npos);
}

TEST_CASE("CLI unknown option fails", "[cli]") {
    auto result = run_command("./litisim --unknown-option");
    REQUIRE(result.exit_code == 1);
    REQUIRE(result.stderr_output.find("Unknown option") != std::string::npos);
}

TEST_CASE("CLI non-numeric value fails", "[cli]") {
    auto result = run_command("./litisim --trials lots");
    REQUIRE(result.exit_code == 1);
    REQUIRE(result.stderr_output.find("Invalid value for --trials") != std::string::npos);
}

TEST_CASE("CLI rejects partially numeric values", "[cli]") {
    SECTION("Fractional trial count") {
        auto result = run_command(BASE_CASE + " --trials 1.5");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("Invalid value for --trials") != std::string::npos);
    }

    SECTION("Negative seed") {
        auto result = run_command(BASE_CASE + " --seed -1");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("Invalid value for --seed") != std::string::npos);
    }

    SECTION("Trailing characters in an amount") {
        auto result = run_command(
            "./litisim --conservative 30k --recommended 50000 --aggressive 75000 --case-strength 8");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("Invalid value for --conservative") != std::string::npos);
    }

    SECTION("Fractional case strength") {
        auto result = run_command(
            "./litisim --conservative 1 --recommended 2 --aggressive 3 --case-strength 7.5");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("Invalid value for --case-strength") != std::string::npos);
    }
}

TEST_CASE("CLI missing case inputs fail", "[cli]") {
    SECTION("Missing case strength") {
        auto result = run_command("./litisim --conservative 1 --recommended 2 --aggressive 3");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("--case-strength is required") != std::string::npos);
    }

    SECTION("Missing damages") {
        auto result = run_command("./litisim --case-strength 5");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("--conservative is required") != std::string::npos);
        REQUIRE(result.stderr_output.find("--aggressive is required") != std::string::npos);
    }
}

TEST_CASE("CLI invalid inputs fail with an error", "[cli]") {
    SECTION("Zero trials") {
        auto result = run_command(BASE_CASE + " --trials 0");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("Error:") != std::string::npos);
    }

    SECTION("Settlement rate out of range") {
        auto result = run_command(BASE_CASE + " --settlement-rate 1.5");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("settlement rate") != std::string::npos);
    }

    SECTION("Damages out of order") {
        auto result = run_command(
            "./litisim --conservative 90000 --recommended 50000 --aggressive 75000 --case-strength 5");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("conservative <= recommended <= aggressive") != std::string::npos);
    }

    SECTION("Missing config file") {
        auto result = run_command(BASE_CASE + " --config no_such_config.json");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("Config file not found") != std::string::npos);
    }

    SECTION("Bad log level") {
        auto result = run_command(BASE_CASE + " --log-level LOUD");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("--log-level") != std::string::npos);
    }
}

TEST_CASE("CLI full analysis runs successfully", "[cli][integration]") {
    auto result = run_command(BASE_CASE + " --settlement-rate 0.9 --trials 2000 --seed 42");

    REQUIRE(result.exit_code == 0);

    // Progress and summary on stderr
    REQUIRE(result.stderr_output.find("Running analysis") != std::string::npos);
    REQUIRE(result.stderr_output.find("Recommendation:") != std::string::npos);
    REQUIRE(result.stderr_output.find("aggressive-litigation vs settle-quick") != std::string::npos);

    // JSON document on stdout
    json j = json::parse(result.stdout_output);
    REQUIRE(j.contains("recommendation"));
    REQUIRE(j["recommendation"]["opponent_strategy"] == "settle-quick");
    REQUIRE(j["simulation"]["trials"] == 2000);
    REQUIRE_FALSE(j.contains("decision_tree"));
}

TEST_CASE("CLI seeded runs are reproducible", "[cli][integration]") {
    std::string cmd = BASE_CASE + " --trials 3000 --seed 7 --compact";
    auto first = run_command(cmd);
    auto second = run_command(cmd);

    REQUIRE(first.exit_code == 0);
    REQUIRE(second.exit_code == 0);

    json a = json::parse(first.stdout_output);
    json b = json::parse(second.stdout_output);
    REQUIRE(a["recommendation"] == b["recommendation"]);
    REQUIRE(a["simulation"]["statistics"] == b["simulation"]["statistics"]);
}

TEST_CASE("CLI tree flag adds the decision tree", "[cli][integration]") {
    auto result = run_command(BASE_CASE + " --trials 500 --seed 1 --tree");
    REQUIRE(result.exit_code == 0);

    json j = json::parse(result.stdout_output);
    REQUIRE(j["decision_tree"]["action"] == "File Complaint");
}

TEST_CASE("CLI writes output to file", "[cli][integration]") {
    const std::string output = "/tmp/litisim_test_output.json";
    std::remove(output.c_str());

    auto result = run_command(BASE_CASE + " --trials 500 --seed 1 --output " + output);
    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stderr_output.find("Output written to") != std::string::npos);

    json j = json::parse(read_file(output));
    REQUIRE(j.contains("recommendation"));
    std::remove(output.c_str());
}

TEST_CASE("CLI reads case and simulation from config", "[cli][integration]") {
    const std::string config_path = "/tmp/litisim_test_config.json";
    {
        std::ofstream out(config_path);
        out << R"({
            "case": {
                "damages": {"conservative": 10000, "recommended": 20000, "aggressive": 30000},
                "case_strength": 4,
                "opponent_settlement_rate": 0.1
            },
            "simulation": {"trials": 800, "seed": 5},
            "logging": {"level": "ERROR"}
        })";
    }

    SECTION("Config alone") {
        auto result = run_command("./litisim --config " + config_path);
        REQUIRE(result.exit_code == 0);

        json j = json::parse(result.stdout_output);
        REQUIRE(j["inputs"]["case_strength"] == 4);
        REQUIRE(j["simulation"]["trials"] == 800);
        REQUIRE(j["recommendation"]["opponent_strategy"] == "fight-to-trial");
    }

    SECTION("Flags override config") {
        auto result = run_command("./litisim --config " + config_path +
                                  " --case-strength 9 --trials 600");
        REQUIRE(result.exit_code == 0);

        json j = json::parse(result.stdout_output);
        REQUIRE(j["inputs"]["case_strength"] == 9);
        REQUIRE(j["simulation"]["trials"] == 600);
    }

    std::remove(config_path.c_str());
}

TEST_CASE("CLI clamps case strength with a warning", "[cli][integration]") {
    auto result = run_command(
        "./litisim --conservative 1000 --recommended 2000 --aggressive 3000 "
        "--case-strength 12 --trials 200 --seed 3");
    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stderr_output.find("clamped to 10") != std::string::npos);

    json j = json::parse(result.stdout_output);
    REQUIRE(j["inputs"]["case_strength"] == 10);
}
