#include "attack/attack.hpp"
#include "util/errors.hpp"
#include "util/log.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <stdexcept>
#include <unordered_map>

namespace advtext {

// ─── Construction ──────────────────────────────────────────────

Attack::Attack(std::unique_ptr<GoalFunction> goal_function,
               std::unique_ptr<Transformation> transformation,
               std::unique_ptr<SearchMethod> search_method,
               std::vector<std::unique_ptr<Constraint>> constraints,
               AttackConfig config)
    : goal_function_(std::move(goal_function)),
      transformation_(std::move(transformation)),
      search_method_(std::move(search_method)),
      constraints_cache_(config.constraint_cache_size) {
    if (!goal_function_) {
        throw ConfigurationError("Cannot instantiate attack without a goal function for predictions");
    }
    if (!transformation_) {
        throw ConfigurationError("Cannot instantiate attack without a transformation");
    }
    if (!search_method_) {
        throw ConfigurationError("Cannot instantiate attack without a search method");
    }
    is_black_box_ = transformation_->isBlackBox();

    if (!search_method_->checkTransformationCompatibility(*transformation_)) {
        throw CompatibilityError(fmt::format("SearchMethod {} incompatible with transformation {}",
                                             search_method_->str(), transformation_->name()));
    }

    // Partition by the declared category, keeping relative order.
    for (auto& constraint : constraints) {
        if (!constraint) {
            throw ConfigurationError("Cannot instantiate attack with a null constraint");
        }
        if (constraint->isPreTransformation()) {
            pre_transformation_constraints_.push_back(
                static_cast<const PreTransformationConstraint*>(constraint.get()));
        } else {
            constraints_.push_back(
                static_cast<const PostTransformationConstraint*>(constraint.get()));
        }
        owned_constraints_.push_back(std::move(constraint));
    }

    // Give the search method access to transformation and evaluation services.
    SearchCallbacks callbacks;
    callbacks.get_transformations = [this](const AttackedText& current_text,
                                           const AttackedText* original_text,
                                           const TransformationOptions& options) {
        return getTransformations(current_text, original_text, options);
    };
    callbacks.get_goal_results = [this](const std::vector<AttackedText>& texts) {
        return goal_function_->getResults(texts);
    };
    callbacks.filter_transformations = [this](const std::vector<AttackedText>& candidates,
                                              const AttackedText& current_text,
                                              const AttackedText* original_text) {
        return filterTransformations(candidates, current_text, original_text);
    };
    search_method_->bind(std::move(callbacks));

    log::debug("Attack created: {} pre-transformation and {} post-transformation constraints, "
               "constraint cache size {}",
               pre_transformation_constraints_.size(), constraints_.size(),
               constraints_cache_.capacity());
}

// ─── Transformations ───────────────────────────────────────────

std::vector<AttackedText> Attack::getTransformations(const AttackedText& current_text,
                                                     const AttackedText* original_text,
                                                     const TransformationOptions& options) {
    if (!transformation_) {
        throw std::runtime_error("Cannot call getTransformations without a transformation");
    }
    std::vector<AttackedText> transformed =
        (*transformation_)(current_text, pre_transformation_constraints_, options);
    return filterTransformations(transformed, current_text, original_text);
}

std::vector<AttackedText> Attack::filterTransformationsUncached(
    const std::vector<AttackedText>& candidates,
    const AttackedText& current_text,
    const AttackedText* original_text
) {
    std::vector<AttackedText> filtered = candidates;
    for (const PostTransformationConstraint* constraint : constraints_) {
        if (filtered.empty()) break;
        filtered = constraint->callMany(filtered, current_text, original_text);
    }

    // Default to false for every input, then mark survivors true.
    for (const auto& candidate : candidates) {
        constraints_cache_.record(current_text, candidate, false);
    }
    for (const auto& survivor : filtered) {
        constraints_cache_.record(current_text, survivor, true);
    }
    return filtered;
}

std::vector<AttackedText> Attack::filterTransformations(const std::vector<AttackedText>& candidates,
                                                        const AttackedText& current_text,
                                                        const AttackedText* original_text) {
    // Decisions for this call, so entries evicted mid-call still resolve.
    std::unordered_map<std::string, bool> decisions;
    std::vector<AttackedText> uncached;
    for (const auto& candidate : candidates) {
        if (const bool* cached = constraints_cache_.lookup(current_text, candidate)) {
            decisions[candidate.text()] = *cached;
        } else {
            uncached.push_back(candidate);
        }
    }

    std::vector<AttackedText> survivors =
        filterTransformationsUncached(uncached, current_text, original_text);
    for (const auto& candidate : uncached) decisions[candidate.text()] = false;
    for (const auto& survivor : survivors) decisions[survivor.text()] = true;

    std::vector<AttackedText> filtered;
    for (const auto& candidate : candidates) {
        if (decisions[candidate.text()]) filtered.push_back(candidate);
    }

    // Sort so the order is reproducible between runs.
    std::stable_sort(filtered.begin(), filtered.end(),
        [](const AttackedText& a, const AttackedText& b) { return a.text() < b.text(); });
    return filtered;
}

// ─── Attacking ─────────────────────────────────────────────────

std::unique_ptr<AttackResult> Attack::attackOne(const GoalFunctionResult& initial_result) {
    GoalFunctionResult final_result = (*search_method_)(initial_result);
    int num_queries = goal_function_->numQueries();

    log::debug("Constraint cache: {} entries, {} hits, {} misses, {} evictions",
               constraints_cache_.size(), constraints_cache_.hits(),
               constraints_cache_.misses(), constraints_cache_.evictions());

    if (final_result.succeeded) {
        return std::make_unique<SuccessfulAttackResult>(initial_result, std::move(final_result),
                                                        num_queries);
    }
    return std::make_unique<FailedAttackResult>(initial_result, std::move(final_result),
                                                num_queries);
}

AttackIterator Attack::attackDataset(const Dataset& dataset,
                                     std::optional<std::vector<size_t>> indices) {
    std::deque<size_t> queue;
    // An empty list means the whole dataset, same as no list.
    if (indices && !indices->empty()) {
        queue.assign(indices->begin(), indices->end());
    } else {
        for (size_t i = 0; i < dataset.size(); i++) queue.push_back(i);
    }
    return AttackIterator(*this, dataset, std::move(queue));
}

std::unique_ptr<AttackResult> AttackIterator::next() {
    if (indices_.empty()) return nullptr;

    size_t index = indices_.front();
    indices_.pop_front();
    if (index >= dataset_.size()) {
        throw DatasetIndexError(index, dataset_.size());
    }

    Example example = dataset_.at(index);
    AttackAttrs attrs;
    attrs.label_names = dataset_.labelNames();
    AttackedText text(std::move(example.text), std::move(attrs));

    GoalFunction& goal_function = attack_.goalFunction();
    goal_function.setNumQueries(0);
    GoalFunctionResult initial = goal_function.getResult(text, example.ground_truth_output).first;

    std::unique_ptr<AttackResult> result;
    if (initial.succeeded) {
        // Report the true label, not the prediction that already "succeeded".
        initial.output = example.ground_truth_output;
        result = std::make_unique<SkippedAttackResult>(initial);
    } else {
        result = attack_.attackOne(initial);
    }

    log::info("Example {}: {}", index, result->str());
    return result;
}

// ─── Printing ──────────────────────────────────────────────────

std::string Attack::str() const {
    std::string out = "Attack(\n";
    out += fmt::format("  (search_method): {}\n", search_method_->str());
    out += fmt::format("  (goal_function):  {}\n", goal_function_->str());
    out += fmt::format("  (transformation):  {}\n", transformation_->name());

    std::vector<const Constraint*> all;
    all.insert(all.end(), constraints_.begin(), constraints_.end());
    all.insert(all.end(), pre_transformation_constraints_.begin(),
               pre_transformation_constraints_.end());
    if (all.empty()) {
        out += "  (constraints): None\n";
    } else {
        out += "  (constraints): \n";
        for (size_t i = 0; i < all.size(); i++) {
            out += fmt::format("    ({}): {}\n", i, all[i]->str());
        }
    }
    out += fmt::format("  (is_black_box):  {}\n", is_black_box_ ? "True" : "False");
    out += ")";
    return out;
}

} // namespace advtext
