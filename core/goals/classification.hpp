#pragma once

#include "goals/goal_function.hpp"

namespace advtext {

/// Succeeds once the predicted class differs from the ground truth.
/// score = 1 - p(ground truth)
class UntargetedClassification : public GoalFunction {
public:
    using GoalFunction::GoalFunction;

    std::string name() const override;

protected:
    bool isGoalComplete(const std::vector<double>& output, int ground_truth) const override;
    double getScore(const std::vector<double>& output, int ground_truth) const override;
};

/// Succeeds once the predicted class equals `target_class`.
/// score = p(target class)
class TargetedClassification : public GoalFunction {
public:
    TargetedClassification(ModelFn model, int target_class, GoalFunctionConfig config = {});

    std::string name() const override;
    int targetClass() const { return target_class_; }

protected:
    bool isGoalComplete(const std::vector<double>& output, int ground_truth) const override;
    double getScore(const std::vector<double>& output, int ground_truth) const override;
    std::string extraRepr() const override;

private:
    int target_class_;
};

} // namespace advtext
