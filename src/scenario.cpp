#include "scenario.hpp"
#include <stdexcept>
#include <utility>

namespace litisim {

namespace {

using ValueFn = double (*)(const DamagesRange&);

struct ScenarioDefinition {
    ScenarioType type;
    const char* key;
    const char* name;
    const char* description;
    ValueFn value_fn;
    double cost;
    int duration_days;
};

double full_damages(const DamagesRange& d) { return d.aggressive(); }
double early_offer(const DamagesRange& d) { return d.conservative() * 0.65; }
double post_discovery_offer(const DamagesRange& d) { return d.recommended() * 0.85; }
double pre_trial_offer(const DamagesRange& d) { return d.recommended() * 0.90; }
double nothing(const DamagesRange&) { return 0.0; }

// Indexed by scenario_index()
const std::array<ScenarioDefinition, SCENARIO_TYPE_COUNT> DEFINITIONS = {{
    {ScenarioType::DefaultJudgment, "default", "Default Judgment",
     "Defendant fails to respond - automatic win", full_damages, 1000.0, 60},
    {ScenarioType::EarlySettlement, "early-settlement", "Early Settlement",
     "Settle before discovery - quick but cheap", early_offer, 2500.0, 90},
    {ScenarioType::MidSettlement, "mid-settlement", "Post-Discovery Settlement",
     "Settle after discovery - good value", post_discovery_offer, 8000.0, 240},
    {ScenarioType::LateSettlement, "late-settlement", "Pre-Trial Settlement",
     "Settle week before trial - near full value", pre_trial_offer, 12000.0, 330},
    {ScenarioType::TrialWin, "trial-win", "Trial Victory",
     "Win at trial - full damages + fees", full_damages, 15000.0, 365},
    {ScenarioType::TrialLoss, "trial-loss", "Trial Loss",
     "Lose at trial - nothing recovered", nothing, 15000.0, 365},
    {ScenarioType::SummaryJudgmentWin, "summary-judgment", "Summary Judgment Win",
     "Win on MSJ - quick full victory", full_damages, 5000.0, 180},
}};

const ScenarioDefinition& definition(ScenarioType type) {
    return DEFINITIONS[scenario_index(type)];
}

double base_probability(ScenarioType type, const CaseStrength& strength, double bonus) {
    switch (type) {
        case ScenarioType::DefaultJudgment: return 0.15;
        case ScenarioType::EarlySettlement: return 0.25 + bonus;
        case ScenarioType::MidSettlement: return 0.35 + bonus;
        case ScenarioType::LateSettlement: return 0.30 + bonus;
        case ScenarioType::TrialWin: return strength.fraction() * 0.65;
        case ScenarioType::TrialLoss: return (1.0 - strength.fraction()) * 0.35;
        case ScenarioType::SummaryJudgmentWin:
            return strength.value() > STRONG_CASE_THRESHOLD ? 0.30 : 0.10;
    }
    return 0.0;
}

} // anonymous namespace

std::string scenario_key(ScenarioType type) {
    return definition(type).key;
}

std::optional<ScenarioType> scenario_type_from_key(const std::string& key) {
    for (const ScenarioDefinition& def : DEFINITIONS) {
        if (key == def.key) {
            return def.type;
        }
    }
    return std::nullopt;
}

std::string scenario_name(ScenarioType type) {
    return definition(type).name;
}

bool is_settlement(ScenarioType type) {
    return type == ScenarioType::EarlySettlement ||
           type == ScenarioType::MidSettlement ||
           type == ScenarioType::LateSettlement;
}

double scenario_value(ScenarioType type, const DamagesRange& damages) {
    return definition(type).value_fn(damages);
}

// ============================================================================
// ScenarioCatalog Implementation
// ============================================================================

ScenarioCatalog::ScenarioCatalog(const DamagesRange& damages, const CaseStrength& strength)
    : damages_(damages), strength_(strength), settlement_bonus_(0.0) {}

ScenarioCatalog ScenarioCatalog::build(const DamagesRange& damages,
                                       const CaseStrength& strength,
                                       const std::optional<double>& opponent_settlement_rate) {
    ScenarioCatalog catalog(damages, strength);
    if (opponent_settlement_rate && *opponent_settlement_rate > SETTLEMENT_BONUS_THRESHOLD) {
        catalog.settlement_bonus_ = SETTLEMENT_BONUS;
    }

    catalog.scenarios_.reserve(SCENARIO_TYPE_COUNT);
    for (const ScenarioDefinition& def : DEFINITIONS) {
        Scenario scenario;
        scenario.type = def.type;
        scenario.name = def.name;
        scenario.description = def.description;
        scenario.base_probability = base_probability(def.type, strength, catalog.settlement_bonus_);
        scenario.value = def.value_fn(damages);
        scenario.cost = def.cost;
        scenario.duration_days = def.duration_days;
        catalog.scenarios_.push_back(std::move(scenario));
    }
    return catalog;
}

const Scenario& ScenarioCatalog::get(ScenarioType type) const {
    size_t index = scenario_index(type);
    if (index >= scenarios_.size()) {
        throw std::out_of_range("Scenario type not present in catalog");
    }
    return scenarios_[index];
}

} // namespace litisim
