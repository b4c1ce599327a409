#include "decision_tree.hpp"
#include "scenario.hpp"
#include <algorithm>
#include <utility>

namespace litisim {

namespace {

TreeNode make_node(const std::string& action, double probability, double cost, int time_days,
                   std::optional<double> value = std::nullopt,
                   std::vector<TreeNode> children = {}) {
    TreeNode node;
    node.action = action;
    node.probability = probability;
    node.cost = cost;
    node.time_days = time_days;
    node.value = value;
    node.children = std::move(children);
    return node;
}

size_t subtree_depth(const TreeNode& node) {
    size_t deepest = 0;
    for (const TreeNode& child : node.children) {
        deepest = std::max(deepest, 1 + subtree_depth(child));
    }
    return deepest;
}

void walk(const TreeNode& node, size_t depth,
          const std::function<void(const TreeNode&, size_t)>& fn) {
    fn(node, depth);
    for (const TreeNode& child : node.children) {
        walk(child, depth + 1, fn);
    }
}

const TreeNode* find_in(const TreeNode& node, const std::string& action) {
    if (node.action == action) {
        return &node;
    }
    for (const TreeNode& child : node.children) {
        if (const TreeNode* hit = find_in(child, action)) {
            return hit;
        }
    }
    return nullptr;
}

} // anonymous namespace

DecisionTree DecisionTree::build(const DamagesRange& damages, const CaseStrength& strength) {
    const double s = strength.fraction();
    const bool strong = strength.value() > STRONG_CASE_THRESHOLD;

    TreeNode msj_denied = make_node(
        "MSJ Denied", strong ? 0.5 : 0.8, 5000, 180, std::nullopt, {
            make_node("Settlement (Pre-Trial)", 0.6, 8000, 270, damages.recommended() * 0.80),
            make_node("Go to Trial", 0.4, 15000, 365),
        });

    TreeNode msj = make_node(
        "Motion for Summary Judgment (Us)", strong ? 0.6 : 0.3, 5000, 180, std::nullopt, {
            make_node("MSJ Granted", strong ? 0.5 : 0.2, 5000, 180, damages.aggressive()),
            std::move(msj_denied),
        });

    // Trial win uses the 0.75 ceiling, not the catalog's 0.65
    TreeNode trial_prep = make_node(
        "Trial Preparation", 0.30, 15000, 365, std::nullopt, {
            make_node("Trial Win", s * 0.75, 15000, 365, damages.aggressive()),
            make_node("Trial Loss", (1.0 - s) * 0.25, 15000, 365, 0.0),
            make_node("Last-Minute Settlement", 0.30, 12000, 330, damages.recommended() * 0.90),
        });

    TreeNode discovery = make_node(
        "Discovery Phase", 1.0, 2000, 120, std::nullopt, {
            make_node("Early Settlement (Pre-Discovery)", 0.25, 2500, 90,
                      damages.conservative() * 0.65),
            std::move(msj),
            make_node("Settlement (Post-Discovery)", 0.45, 8000, 240,
                      damages.recommended() * 0.85),
            std::move(trial_prep),
        });

    TreeNode root = make_node(
        "File Complaint", 1.0, 500, 0, std::nullopt, {
            make_node("Defendant Answers", 0.85, 0, 30, std::nullopt, {std::move(discovery)}),
            make_node("Defendant Defaults", 0.15, 1000, 60, damages.aggressive()),
        });

    return DecisionTree(std::move(root));
}

size_t DecisionTree::depth() const {
    return subtree_depth(root_);
}

size_t DecisionTree::node_count() const {
    size_t count = 0;
    visit([&count](const TreeNode&, size_t) { ++count; });
    return count;
}

size_t DecisionTree::leaf_count() const {
    size_t count = 0;
    visit([&count](const TreeNode& node, size_t) {
        if (node.is_leaf()) ++count;
    });
    return count;
}

const TreeNode* DecisionTree::find(const std::string& action) const {
    return find_in(root_, action);
}

void DecisionTree::visit(const std::function<void(const TreeNode&, size_t depth)>& fn) const {
    walk(root_, 0, fn);
}

} // namespace litisim
