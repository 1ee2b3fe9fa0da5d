#pragma once

#include "goals/goal_function_result.hpp"

#include <string>
#include <utility>

namespace advtext {

/// Outcome of attacking one dataset example.
class AttackResult {
public:
    enum class Kind { Successful, Failed, Skipped };

    virtual ~AttackResult() = default;

    virtual Kind kind() const = 0;

    const GoalFunctionResult& originalResult() const { return original_result_; }
    const GoalFunctionResult& perturbedResult() const { return perturbed_result_; }

    /// Goal function query count when the attack finished.
    int numQueries() const { return num_queries_; }

    /// One-line summary: "[KIND] original -> perturbed (n queries)".
    std::string str() const;

protected:
    AttackResult(GoalFunctionResult original_result, GoalFunctionResult perturbed_result,
                 int num_queries)
        : original_result_(std::move(original_result)),
          perturbed_result_(std::move(perturbed_result)),
          num_queries_(num_queries) {}

private:
    GoalFunctionResult original_result_;
    GoalFunctionResult perturbed_result_;
    int num_queries_;
};

const char* toString(AttackResult::Kind kind);

class SuccessfulAttackResult : public AttackResult {
public:
    SuccessfulAttackResult(GoalFunctionResult original_result,
                           GoalFunctionResult perturbed_result, int num_queries)
        : AttackResult(std::move(original_result), std::move(perturbed_result), num_queries) {}

    Kind kind() const override { return Kind::Successful; }
};

class FailedAttackResult : public AttackResult {
public:
    FailedAttackResult(GoalFunctionResult original_result,
                       GoalFunctionResult perturbed_result, int num_queries)
        : AttackResult(std::move(original_result), std::move(perturbed_result), num_queries) {}

    Kind kind() const override { return Kind::Failed; }
};

/// The initial text already met the goal; no search was run.
/// Original and perturbed results are the same initial result.
class SkippedAttackResult : public AttackResult {
public:
    explicit SkippedAttackResult(const GoalFunctionResult& goal_result)
        : AttackResult(goal_result, goal_result, goal_result.num_queries) {}

    Kind kind() const override { return Kind::Skipped; }
};

} // namespace advtext
