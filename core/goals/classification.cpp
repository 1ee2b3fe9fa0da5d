#include "goals/classification.hpp"
#include "util/errors.hpp"

#include <fmt/format.h>

namespace advtext {

// ─── Untargeted ────────────────────────────────────────────────

std::string UntargetedClassification::name() const { return "UntargetedClassification"; }

bool UntargetedClassification::isGoalComplete(const std::vector<double>& output,
                                              int ground_truth) const {
    return predictedClass(output) != ground_truth;
}

double UntargetedClassification::getScore(const std::vector<double>& output,
                                          int ground_truth) const {
    return 1.0 - output.at(static_cast<size_t>(ground_truth));
}

// ─── Targeted ──────────────────────────────────────────────────

TargetedClassification::TargetedClassification(ModelFn model, int target_class,
                                               GoalFunctionConfig config)
    : GoalFunction(std::move(model), config), target_class_(target_class) {
    if (target_class_ < 0) {
        throw ConfigurationError(fmt::format("Target class must be non-negative, got {}", target_class_));
    }
}

std::string TargetedClassification::name() const { return "TargetedClassification"; }

bool TargetedClassification::isGoalComplete(const std::vector<double>& output,
                                            int /*ground_truth*/) const {
    return predictedClass(output) == target_class_;
}

double TargetedClassification::getScore(const std::vector<double>& output,
                                        int /*ground_truth*/) const {
    return output.at(static_cast<size_t>(target_class_));
}

std::string TargetedClassification::extraRepr() const {
    return fmt::format("target_class={}", target_class_);
}

} // namespace advtext
