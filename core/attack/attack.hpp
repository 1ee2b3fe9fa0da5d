#pragma once

#include "attack/attack_config.hpp"
#include "attack/attack_result.hpp"
#include "constraints/constraint_base.hpp"
#include "constraints/constraint_cache.hpp"
#include "dataset/dataset.hpp"
#include "goals/goal_function.hpp"
#include "search/search_method.hpp"
#include "transforms/transformation_base.hpp"

#include <cstddef>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace advtext {

class Attack;

// ─── Attack Iterator ───────────────────────────────────────────
// Pull-based stream of outcomes over a dataset. Not re-entrant and not
// resumable after an exception: restarting means asking the attack for
// a fresh iterator. Borrows the attack and the dataset, which must
// outlive it.

class AttackIterator {
public:
    AttackIterator(Attack& attack, const Dataset& dataset, std::deque<size_t> indices)
        : attack_(attack), dataset_(dataset), indices_(std::move(indices)) {}

    /// Attack the next queued example. nullptr marks the end of the stream.
    /// Throws DatasetIndexError for an index outside the dataset.
    std::unique_ptr<AttackResult> next();

    bool done() const { return indices_.empty(); }
    size_t remaining() const { return indices_.size(); }

private:
    Attack& attack_;
    const Dataset& dataset_;
    std::deque<size_t> indices_;   // FIFO, so indices could be requeued
};

// ─── Attack ────────────────────────────────────────────────────
// Wires a goal function, a transformation, a search method and a list
// of constraints together. Owns every component. The search method is
// bound to this attack's services, so an Attack can be neither copied
// nor moved.

class Attack {
public:
    /// Throws ConfigurationError when a component is missing and
    /// CompatibilityError when the search method rejects the transformation.
    Attack(std::unique_ptr<GoalFunction> goal_function,
           std::unique_ptr<Transformation> transformation,
           std::unique_ptr<SearchMethod> search_method,
           std::vector<std::unique_ptr<Constraint>> constraints = {},
           AttackConfig config = {});

    Attack(const Attack&) = delete;
    Attack& operator=(const Attack&) = delete;

    /// Apply the transformation under the pre-transformation constraints,
    /// then filter through the post-transformation constraints. Sorted by
    /// rendered text.
    std::vector<AttackedText> getTransformations(const AttackedText& current_text,
                                                 const AttackedText* original_text = nullptr,
                                                 const TransformationOptions& options = {});

    /// Cache-first filtering. Returns the candidates that pass every
    /// post-transformation constraint, sorted by rendered text.
    std::vector<AttackedText> filterTransformations(const std::vector<AttackedText>& candidates,
                                                    const AttackedText& current_text,
                                                    const AttackedText* original_text = nullptr);

    /// Run the search method from `initial_result`.
    std::unique_ptr<AttackResult> attackOne(const GoalFunctionResult& initial_result);

    /// Outcomes for `indices`. Absent or empty = every index, in order.
    AttackIterator attackDataset(const Dataset& dataset,
                                 std::optional<std::vector<size_t>> indices = std::nullopt);

    /// The iterator borrows the dataset; a temporary would dangle.
    AttackIterator attackDataset(const Dataset&& dataset,
                                 std::optional<std::vector<size_t>> indices = std::nullopt) = delete;

    GoalFunction& goalFunction() { return *goal_function_; }
    const Transformation& transformation() const { return *transformation_; }
    SearchMethod& searchMethod() { return *search_method_; }

    const std::vector<const PreTransformationConstraint*>& preTransformationConstraints() const {
        return pre_transformation_constraints_;
    }
    const std::vector<const PostTransformationConstraint*>& constraints() const {
        return constraints_;
    }

    const ConstraintCache& constraintCache() const { return constraints_cache_; }

    /// True unless the transformation needs internal model access.
    /// Informational only.
    bool isBlackBox() const { return is_black_box_; }

    std::string str() const;

private:
    std::vector<AttackedText> filterTransformationsUncached(const std::vector<AttackedText>& candidates,
                                                            const AttackedText& current_text,
                                                            const AttackedText* original_text);

    std::unique_ptr<GoalFunction> goal_function_;
    std::unique_ptr<Transformation> transformation_;
    std::unique_ptr<SearchMethod> search_method_;

    std::vector<std::unique_ptr<Constraint>> owned_constraints_;
    std::vector<const PreTransformationConstraint*> pre_transformation_constraints_;
    std::vector<const PostTransformationConstraint*> constraints_;

    ConstraintCache constraints_cache_;
    bool is_black_box_ = true;
};

} // namespace advtext
