#pragma once

#include "attack/attack_config.hpp"
#include "cache/lru_cache.hpp"
#include "goals/goal_function_result.hpp"

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace advtext {

/// Model wrapper callback: one row of class scores per input text.
/// Rows that do not sum to 1 are treated as logits and softmaxed.
using ModelFn = std::function<std::vector<std::vector<double>>(const std::vector<std::string>&)>;

/// Base class for all goal functions.
/// Scores texts with the victim model, decides whether the attack goal is
/// met and counts model queries against a per-example budget.
class GoalFunction {
public:
    GoalFunction(ModelFn model, GoalFunctionConfig config = {});
    virtual ~GoalFunction() = default;

    GoalFunction(const GoalFunction&) = delete;
    GoalFunction& operator=(const GoalFunction&) = delete;

    /// Human-readable name of this goal function.
    virtual std::string name() const = 0;

    /// Score the initial text of an example and remember its ground truth
    /// for later getResults() calls. The bool is true when the query budget
    /// is exhausted. Throws std::runtime_error if the budget left no query.
    std::pair<GoalFunctionResult, bool> getResult(const AttackedText& text, int ground_truth_output);

    /// Score a batch of candidates against the remembered ground truth.
    /// Texts beyond the remaining budget are dropped; the bool reports
    /// whether the budget is now exhausted.
    std::pair<std::vector<GoalFunctionResult>, bool> getResults(const std::vector<AttackedText>& texts);

    int numQueries() const { return num_queries_; }
    void setNumQueries(int num_queries) { num_queries_ = num_queries; }
    int queryBudget() const { return config_.query_budget; }

    std::string str() const;

    /// Index of the highest class score; the first one on ties.
    static int predictedClass(const std::vector<double>& output);

protected:
    virtual bool isGoalComplete(const std::vector<double>& output, int ground_truth) const = 0;
    virtual double getScore(const std::vector<double>& output, int ground_truth) const = 0;
    virtual std::string extraRepr() const { return ""; }

private:
    std::vector<std::vector<double>> callModel(const std::vector<AttackedText>& texts);

    ModelFn model_;
    GoalFunctionConfig config_;
    int num_queries_ = 0;
    std::optional<int> ground_truth_;
    LruCache<std::string, std::vector<double>> model_cache_;
};

} // namespace advtext
