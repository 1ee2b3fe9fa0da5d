#pragma once

#include "goals/goal_function_result.hpp"
#include "text/attacked_text.hpp"
#include "transforms/transformation_base.hpp"

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace advtext {

// ─── Search Callbacks ──────────────────────────────────────────
// Services the attack engine binds into a search method. The search
// method treats them as black-box oracles.

struct SearchCallbacks {
    /// Transform `current_text` and filter the candidates through every
    /// constraint. Result is sorted by rendered text.
    std::function<std::vector<AttackedText>(const AttackedText& current_text,
                                            const AttackedText* original_text,
                                            const TransformationOptions& options)>
        get_transformations;

    /// Score candidates with the goal function. The bool is true once the
    /// query budget is exhausted.
    std::function<std::pair<std::vector<GoalFunctionResult>, bool>(const std::vector<AttackedText>&)>
        get_goal_results;

    /// Filter externally produced candidates through the constraints.
    std::function<std::vector<AttackedText>(const std::vector<AttackedText>& candidates,
                                            const AttackedText& current_text,
                                            const AttackedText* original_text)>
        filter_transformations;
};

/// Base class for all search methods.
/// A search method explores perturbations of the initial text and returns
/// exactly one terminal result: the first success or the best result found
/// when its options or the query budget run out.
class SearchMethod {
public:
    virtual ~SearchMethod() = default;

    /// Human-readable name of this search method.
    virtual std::string name() const = 0;

    /// Whether this search method can work with `transformation`.
    virtual bool checkTransformationCompatibility(const Transformation& /*transformation*/) const {
        return true;
    }

    void bind(SearchCallbacks callbacks) { callbacks_ = std::move(callbacks); }
    bool isBound() const;

    /// Run the search. Throws std::runtime_error if no callbacks are bound.
    GoalFunctionResult operator()(const GoalFunctionResult& initial_result);

    virtual std::string extraRepr() const { return ""; }
    std::string str() const;

protected:
    virtual GoalFunctionResult perturb(const GoalFunctionResult& initial_result) = 0;

    SearchCallbacks callbacks_;
};

} // namespace advtext
