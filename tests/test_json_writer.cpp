#include <catch2/catch.hpp>
#include <nlohmann/json.hpp>
#include <cstdio>
#include <fstream>
#include <limits>
#include <sstream>
#include "io/json_writer.hpp"
#include "logger.hpp"

using namespace litisim;
using json = nlohmann::json;
using Catch::Matchers::WithinAbs;

namespace {

Analysis sample_analysis(bool store_trials = false) {
    LoggerConfig quiet;
    quiet.enable_console = false;
    Logger::get_instance().configure(quiet);

    AnalysisRequest request(DamagesRange(30000, 50000, 75000), 8);
    request.opponent_settlement_rate = 0.9;
    request.trials = 500;
    request.seed = 42;
    request.store_trials = store_trials;
    return run_analysis(request);
}

json render(const Analysis& analysis, const io::JsonOutputOptions& options = io::JsonOutputOptions()) {
    std::ostringstream oss;
    io::write_analysis_json(oss, analysis, options);
    return json::parse(oss.str());
}

} // anonymous namespace

TEST_CASE("Recommendation JSON is well-formed", "[json_writer]") {
    Analysis analysis = sample_analysis();
    std::ostringstream oss;
    io::write_recommendation_json(oss, analysis.recommendation);

    json j = json::parse(oss.str());
    const Recommendation& rec = analysis.recommendation;
    REQUIRE(j["primary_strategy"] == rec.primary_strategy);
    REQUIRE(j["claimant_strategy"] == "aggressive-litigation");
    REQUIRE(j["opponent_strategy"] == "settle-quick");
    REQUIRE_THAT(j["demand_anchor"].get<double>(), WithinAbs(rec.demand_anchor, 1e-6));
    REQUIRE_THAT(j["acceptance_floor"].get<double>(), WithinAbs(rec.acceptance_floor, 1e-6));
    REQUIRE(j["tactics"].size() == 5);
    REQUIRE(j["risk"]["volatility"] == volatility_to_string(rec.risk.volatility));
    REQUIRE(j["timing"]["optimal_settlement"] == rec.timing.optimal_settlement);
    REQUIRE(j["bottom_line"] == rec.bottom_line);
}

TEST_CASE("Compact output is a single line", "[json_writer]") {
    Analysis analysis = sample_analysis();
    std::ostringstream oss;
    io::write_recommendation_json(oss, analysis.recommendation, false);

    std::string out = oss.str();
    REQUIRE(out.find('\n') == std::string::npos);
    REQUIRE_NOTHROW(json::parse(out));
}

TEST_CASE("Non-finite numbers are written as null", "[json_writer]") {
    Analysis analysis = sample_analysis();
    Recommendation rec = analysis.recommendation;
    rec.expected_value = std::numeric_limits<double>::infinity();

    std::ostringstream oss;
    io::write_recommendation_json(oss, rec);
    json j = json::parse(oss.str());
    REQUIRE(j["expected_value"].is_null());
}

TEST_CASE("Strings are escaped", "[json_writer]") {
    Analysis analysis = sample_analysis();
    Recommendation rec = analysis.recommendation;
    rec.bottom_line = "He said \"settle\"\n\tthen left";

    std::ostringstream oss;
    io::write_recommendation_json(oss, rec);
    json j = json::parse(oss.str());
    REQUIRE(j["bottom_line"] == rec.bottom_line);
}

TEST_CASE("Control characters are escaped the same way as in the log", "[json_writer]") {
    Analysis analysis = sample_analysis();
    Recommendation rec = analysis.recommendation;
    rec.strategy_reasoning = std::string("bell\x07 and unit\x1f");

    std::ostringstream oss;
    io::write_recommendation_json(oss, rec, false);
    REQUIRE(oss.str().find(escape_json_string(rec.strategy_reasoning)) != std::string::npos);
    REQUIRE(json::parse(oss.str())["strategy_reasoning"] == rec.strategy_reasoning);
}

TEST_CASE("Analysis JSON sections", "[json_writer]") {
    Analysis analysis = sample_analysis();
    json j = render(analysis);

    REQUIRE(j["inputs"]["damages"]["aggressive"].get<double>() == 75000.0);
    REQUIRE(j["inputs"]["case_strength"] == 8);
    REQUIRE_THAT(j["inputs"]["opponent_settlement_rate"].get<double>(), WithinAbs(0.9, 1e-9));

    REQUIRE(j["expected_values"]["ranked"].size() == SCENARIO_TYPE_COUNT);
    REQUIRE(j["expected_values"]["ranked"][0]["name"] == analysis.expected_values.optimal().scenario.name);
    REQUIRE(j["expected_values"]["summary"]["optimal"] == analysis.expected_values.optimal().scenario.name);

    REQUIRE(j["best_response"]["claimant_strategy"] == "aggressive-litigation");
    REQUIRE(j["best_response"]["payoff_matrix"].size() == 3);
    REQUIRE(j["best_response"]["payoff_matrix"]["aggressive-litigation"]["settle-quick"].get<double>() ==
            analysis.response.payoff);

    REQUIRE(j["simulation"]["trials"] == 500);
    REQUIRE(j["simulation"]["outcomes"].size() == SCENARIO_TYPE_COUNT);
    REQUIRE(j["simulation"]["statistics"]["percentiles"].contains("p75"));

    REQUIRE(j["recommendation"]["primary_strategy"] == analysis.recommendation.primary_strategy);

    // Optional sections are off by default
    REQUIRE_FALSE(j.contains("decision_tree"));
    REQUIRE_FALSE(j["simulation"].contains("trial_records"));
}

TEST_CASE("Outcome counts in JSON sum to the trial count", "[json_writer]") {
    json j = render(sample_analysis());
    size_t total = 0;
    for (const auto& [key, value] : j["simulation"]["outcomes"].items()) {
        total += value.get<size_t>();
    }
    REQUIRE(total == 500);
}

TEST_CASE("Decision tree is included on request", "[json_writer]") {
    io::JsonOutputOptions options;
    options.include_tree = true;
    json j = render(sample_analysis(), options);

    const json& tree = j["decision_tree"];
    REQUIRE(tree["action"] == "File Complaint");
    REQUIRE(tree["value"].is_null());
    REQUIRE(tree["children"].size() == 2);
    REQUIRE(tree["children"][1]["action"] == "Defendant Defaults");
    REQUIRE(tree["children"][1]["value"].get<double>() == 75000.0);
    REQUIRE_FALSE(tree["children"][1].contains("children"));
}

TEST_CASE("Raw trials are included when retained and requested", "[json_writer]") {
    io::JsonOutputOptions options;
    options.include_trials = true;

    SECTION("Retained") {
        json j = render(sample_analysis(true), options);
        REQUIRE(j["simulation"].contains("trial_records"));
        REQUIRE(j["simulation"]["trial_records"].size() == 500);
    }

    SECTION("Not retained") {
        json j = render(sample_analysis(false), options);
        REQUIRE_FALSE(j["simulation"].contains("trial_records"));
    }
}

TEST_CASE("Analysis JSON written to file", "[json_writer]") {
    const std::string path = "test_analysis_output.json";
    io::write_analysis_json(path, sample_analysis());

    std::ifstream in(path);
    json j = json::parse(in);
    REQUIRE(j.contains("recommendation"));
    std::remove(path.c_str());
}

TEST_CASE("Unwritable output path throws", "[json_writer][error]") {
    REQUIRE_THROWS_AS(io::write_analysis_json("/nonexistent_dir/out.json", sample_analysis()),
                      std::runtime_error);
}
