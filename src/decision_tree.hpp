#ifndef LITISIM_DECISION_TREE_HPP
#define LITISIM_DECISION_TREE_HPP

#include "case_inputs.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace litisim {

// One procedural stage in the case. Leaves with a value are terminal outcomes.
struct TreeNode {
    std::string action;
    double probability;             // Conditional branch rate given the parent was reached
    double cost;
    int time_days;
    std::optional<double> value;    // Terminal recovery, if any
    std::vector<TreeNode> children;

    bool is_leaf() const { return children.empty(); }
};

// Sequential-stage tree: file complaint -> response -> discovery ->
// (settlement | dispositive motion | trial preparation) -> ...
//
// Explanation only. Branch rates here are hand-specified illustrations and
// intentionally differ from the ScenarioCatalog probabilities, which are
// the ones the expected value and Monte Carlo paths use.
class DecisionTree {
public:
    // Deterministic: identical inputs produce a structurally identical tree
    static DecisionTree build(const DamagesRange& damages, const CaseStrength& strength);

    const TreeNode& root() const { return root_; }

    // Longest root-to-leaf path, in edges
    size_t depth() const;
    size_t node_count() const;
    size_t leaf_count() const;

    // First node (pre-order) whose action matches exactly, or nullptr
    const TreeNode* find(const std::string& action) const;

    // Pre-order walk; depth is 0 at the root
    void visit(const std::function<void(const TreeNode&, size_t depth)>& fn) const;

private:
    explicit DecisionTree(TreeNode root) : root_(std::move(root)) {}

    TreeNode root_;
};

} // namespace litisim

#endif // LITISIM_DECISION_TREE_HPP
