#include "json_writer.hpp"
#include "../logger.hpp"
#include <cmath>
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <vector>

namespace litisim {
namespace io {

namespace {

// Minimal streaming emitter: tracks nesting and comma placement so the
// writers below read top-down like the document they produce
class JsonEmitter {
public:
    JsonEmitter(std::ostream& os, bool pretty)
        : os_(os),
          indent_(pretty ? "  " : ""),
          newline_(pretty ? "\n" : ""),
          space_(pretty ? " " : "") {
        os_ << std::fixed << std::setprecision(6);
    }

    void begin_object(const std::string& key = "") { open(key, '{'); }
    void end_object() { close('}'); }
    void begin_array(const std::string& key = "") { open(key, '['); }
    void end_array() { close(']'); }

    void field(const std::string& key, double value) {
        prefix(key);
        write_number(value);
    }

    void field(const std::string& key, int value) {
        prefix(key);
        os_ << value;
    }

    void field(const std::string& key, size_t value) {
        prefix(key);
        os_ << value;
    }

    void field(const std::string& key, bool value) {
        prefix(key);
        os_ << (value ? "true" : "false");
    }

    void field(const std::string& key, const std::string& value) {
        prefix(key);
        write_string(value);
    }

    void field(const std::string& key, const char* value) {
        field(key, std::string(value));
    }

    void null_field(const std::string& key) {
        prefix(key);
        os_ << "null";
    }

    void finish() { os_ << newline_; }

private:
    std::ostream& os_;
    std::string indent_;
    std::string newline_;
    std::string space_;
    std::vector<bool> has_items_;

    void write_indent() {
        for (size_t i = 0; i < has_items_.size(); ++i) {
            os_ << indent_;
        }
    }

    void prefix(const std::string& key) {
        if (!has_items_.empty()) {
            if (has_items_.back()) {
                os_ << ",";
            }
            has_items_.back() = true;
            os_ << newline_;
            write_indent();
        }
        if (!key.empty()) {
            write_string(key);
            os_ << ":" << space_;
        }
    }

    void open(const std::string& key, char bracket) {
        prefix(key);
        os_ << bracket;
        has_items_.push_back(false);
    }

    void close(char bracket) {
        bool had_items = has_items_.back();
        has_items_.pop_back();
        if (had_items) {
            os_ << newline_;
            write_indent();
        }
        os_ << bracket;
    }

    void write_number(double value) {
        if (std::isfinite(value)) {
            os_ << value;
        } else {
            os_ << "null";
        }
    }

    void write_string(const std::string& str) {
        os_ << '"' << escape_json_string(str) << '"';
    }
};

void emit_recommendation(JsonEmitter& out, const Recommendation& rec, const std::string& key) {
    out.begin_object(key);
    out.field("primary_strategy", rec.primary_strategy);
    out.field("claimant_strategy", strategy_to_string(rec.claimant_strategy));
    out.field("opponent_strategy", strategy_to_string(rec.opponent_strategy));
    out.field("strategy_reasoning", rec.strategy_reasoning);
    out.field("expected_value", rec.expected_value);
    out.field("win_probability", rec.win_probability);
    out.field("demand_anchor", rec.demand_anchor);
    out.field("target_settlement", rec.target_settlement);
    out.field("acceptance_floor", rec.acceptance_floor);

    out.begin_object("timing");
    out.field("optimal_settlement", rec.timing.optimal_settlement);
    out.field("estimated_duration_days", rec.timing.estimated_duration_days);
    out.field("estimated_cost", rec.timing.estimated_cost);
    out.end_object();

    out.begin_object("risk");
    out.field("best_case", rec.risk.best_case);
    out.field("most_likely", rec.risk.most_likely);
    out.field("worst_case", rec.risk.worst_case);
    out.field("volatility", volatility_to_string(rec.risk.volatility));
    out.end_object();

    out.begin_array("tactics");
    for (const std::string& tactic : rec.tactics) {
        out.field("", tactic);
    }
    out.end_array();

    out.field("bottom_line", rec.bottom_line);
    out.end_object();
}

void emit_tree_node(JsonEmitter& out, const TreeNode& node, const std::string& key) {
    out.begin_object(key);
    out.field("action", node.action);
    out.field("probability", node.probability);
    out.field("cost", node.cost);
    out.field("time_days", node.time_days);
    if (node.value) {
        out.field("value", *node.value);
    } else {
        out.null_field("value");
    }
    if (!node.children.empty()) {
        out.begin_array("children");
        for (const TreeNode& child : node.children) {
            emit_tree_node(out, child, "");
        }
        out.end_array();
    }
    out.end_object();
}

void emit_scenarios(JsonEmitter& out, const ExpectedValueReport& report) {
    out.begin_object("expected_values");
    out.begin_array("ranked");
    for (const ScenarioEvaluation& eval : report.ranked()) {
        out.begin_object();
        out.field("type", scenario_key(eval.scenario.type));
        out.field("name", eval.scenario.name);
        out.field("description", eval.scenario.description);
        out.field("probability", eval.scenario.base_probability);
        out.field("value", eval.scenario.value);
        out.field("cost", eval.scenario.cost);
        out.field("duration_days", eval.scenario.duration_days);
        out.field("net_value", eval.net_value);
        out.field("expected_value", eval.expected_value);
        out.field("roi", eval.roi);
        out.field("value_per_day", eval.value_per_day);
        out.end_object();
    }
    out.end_array();

    const ExpectedValueSummary& summary = report.summary();
    out.begin_object("summary");
    out.field("optimal", report.optimal().scenario.name);
    out.field("total_expected_value", summary.total_expected_value);
    out.field("avg_time_days", summary.avg_time_days);
    out.field("best_roi", summary.best_roi);
    out.field("best_value_per_day", summary.best_value_per_day);
    out.end_object();
    out.end_object();
}

void emit_best_response(JsonEmitter& out, const BestResponse& response) {
    out.begin_object("best_response");
    out.field("claimant_strategy", strategy_to_string(response.claimant_strategy));
    out.field("opponent_strategy", strategy_to_string(response.opponent_strategy));
    out.field("payoff", response.payoff);
    out.field("reasoning", response.reasoning);
    out.begin_object("payoff_matrix");
    for (ClaimantStrategy ours : ALL_CLAIMANT_STRATEGIES) {
        out.begin_object(strategy_to_string(ours));
        for (OpponentStrategy theirs : ALL_OPPONENT_STRATEGIES) {
            out.field(strategy_to_string(theirs), response.matrix.payoff(ours, theirs));
        }
        out.end_object();
    }
    out.end_object();
    out.end_object();
}

void emit_simulation(JsonEmitter& out, const SimulationResult& sim, bool include_trials) {
    const SimulationStatistics& s = sim.statistics;
    out.begin_object("simulation");
    out.field("trials", sim.trial_count);

    out.begin_object("statistics");
    out.field("mean", s.mean);
    out.field("median", s.median);
    out.field("std_dev", s.std_dev);
    out.field("min", s.min);
    out.field("max", s.max);
    out.field("win_rate", s.win_rate);
    out.begin_object("percentiles");
    out.field("p10", s.p10());
    out.field("p25", s.p25());
    out.field("p50", s.p50());
    out.field("p75", s.p75());
    out.field("p90", s.p90());
    out.end_object();
    out.field("avg_time_days", s.avg_time_days);
    out.field("avg_cost", s.avg_cost);
    out.end_object();

    out.begin_object("outcomes");
    for (ScenarioType type : ALL_SCENARIO_TYPES) {
        out.field(scenario_key(type), sim.count(type));
    }
    out.end_object();

    if (include_trials && !sim.trials.empty()) {
        out.begin_array("trial_records");
        for (const SimulationTrial& t : sim.trials) {
            out.begin_object();
            out.field("type", scenario_key(t.type));
            out.field("value", t.value);
            out.field("time_days", t.time_days);
            out.field("cost", t.cost);
            out.end_object();
        }
        out.end_array();
    }

    out.field("execution_time_ms", sim.execution_time_ms);
    out.end_object();
}

} // anonymous namespace

void write_recommendation_json(std::ostream& os, const Recommendation& recommendation,
                               bool pretty_print) {
    JsonEmitter out(os, pretty_print);
    emit_recommendation(out, recommendation, "");
    out.finish();
}

void write_analysis_json(std::ostream& os, const Analysis& analysis,
                         const JsonOutputOptions& options) {
    JsonEmitter out(os, options.pretty_print);
    out.begin_object();

    out.begin_object("inputs");
    out.begin_object("damages");
    out.field("conservative", analysis.damages.conservative());
    out.field("recommended", analysis.damages.recommended());
    out.field("aggressive", analysis.damages.aggressive());
    out.end_object();
    out.field("case_strength", analysis.strength.value());
    out.field("opponent_settlement_rate", analysis.opponent_settlement_rate);
    out.end_object();

    emit_recommendation(out, analysis.recommendation, "recommendation");
    emit_scenarios(out, analysis.expected_values);
    emit_best_response(out, analysis.response);
    emit_simulation(out, analysis.simulation, options.include_trials);

    if (options.include_tree) {
        emit_tree_node(out, analysis.tree.root(), "decision_tree");
    }

    out.end_object();
    out.finish();
}

void write_analysis_json(const std::string& filepath, const Analysis& analysis,
                         const JsonOutputOptions& options) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_analysis_json(file, analysis, options);
}

} // namespace io
} // namespace litisim
