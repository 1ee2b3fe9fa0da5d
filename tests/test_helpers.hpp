#pragma once

#include "constraints/constraint_base.hpp"
#include "goals/goal_function.hpp"
#include "search/search_method.hpp"
#include "transforms/transformation_base.hpp"

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace advtext {
namespace test_support {

// ─── Table model ───────────────────────────────────────────────
// Looks each text up in a table of probability rows; unknown texts get
// the default row. Counts model calls and scored texts.

struct ModelTable {
    std::unordered_map<std::string, std::vector<double>> rows;
    std::vector<double> default_row{0.9, 0.1};
    int calls = 0;
    int texts_scored = 0;
};

inline ModelFn makeTableModel(std::shared_ptr<ModelTable> table) {
    return [table](const std::vector<std::string>& texts) {
        table->calls++;
        std::vector<std::vector<double>> out;
        for (const auto& text : texts) {
            table->texts_scored++;
            auto it = table->rows.find(text);
            out.push_back(it != table->rows.end() ? it->second : table->default_row);
        }
        return out;
    };
}

// ─── Predicate constraint ──────────────────────────────────────
// Post-transformation constraint driven by a lambda, instrumented with
// invocation counters.

class PredicateConstraint : public PostTransformationConstraint {
public:
    using Predicate = std::function<bool(const AttackedText& candidate, const AttackedText& reference)>;

    PredicateConstraint(std::string name, Predicate predicate, bool compare_against_original = false)
        : PostTransformationConstraint(compare_against_original),
          name_(std::move(name)), predicate_(std::move(predicate)) {}

    std::string name() const override { return name_; }

    std::vector<AttackedText> callMany(const std::vector<AttackedText>& candidates,
                                       const AttackedText& current_text,
                                       const AttackedText* original_text) const override {
        calls_++;
        candidates_seen_ += candidates.size();
        return PostTransformationConstraint::callMany(candidates, current_text, original_text);
    }

    int calls() const { return calls_; }
    size_t candidatesSeen() const { return candidates_seen_; }

protected:
    bool checkConstraint(const AttackedText& candidate, const AttackedText& reference) const override {
        return predicate_(candidate, reference);
    }

private:
    std::string name_;
    Predicate predicate_;
    mutable int calls_ = 0;
    mutable size_t candidates_seen_ = 0;
};

inline std::unique_ptr<PredicateConstraint> acceptAll(const std::string& name = "AcceptAll") {
    return std::make_unique<PredicateConstraint>(
        name, [](const AttackedText&, const AttackedText&) { return true; });
}

inline std::unique_ptr<PredicateConstraint> rejectAll(const std::string& name = "RejectAll") {
    return std::make_unique<PredicateConstraint>(
        name, [](const AttackedText&, const AttackedText&) { return false; });
}

// ─── Fixed transformation ──────────────────────────────────────
// Returns the same candidate texts, in the same order, on every call.

class FixedTransformation : public Transformation {
public:
    explicit FixedTransformation(std::vector<std::string> outputs, bool black_box = true)
        : outputs_(std::move(outputs)), black_box_(black_box) {}

    std::string name() const override { return "FixedTransformation"; }
    bool isBlackBox() const override { return black_box_; }

    int calls() const { return calls_; }

protected:
    std::vector<AttackedText> getTransformations(const AttackedText& /*current_text*/,
                                                 const std::set<size_t>& /*indices*/) const override {
        calls_++;
        std::vector<AttackedText> out;
        for (const auto& s : outputs_) out.emplace_back(s);
        return out;
    }

private:
    std::vector<std::string> outputs_;
    bool black_box_;
    mutable int calls_ = 0;
};

// ─── Scripted search ───────────────────────────────────────────
// Search method whose whole behavior is a lambda over the bound services.

class ScriptedSearch : public SearchMethod {
public:
    using Script = std::function<GoalFunctionResult(const GoalFunctionResult&, const SearchCallbacks&)>;

    explicit ScriptedSearch(Script script, bool compatible = true)
        : script_(std::move(script)), compatible_(compatible) {}

    std::string name() const override { return "ScriptedSearch"; }

    bool checkTransformationCompatibility(const Transformation& /*transformation*/) const override {
        return compatible_;
    }

    int calls() const { return calls_; }
    const std::vector<GoalFunctionResult>& seen() const { return seen_; }

protected:
    GoalFunctionResult perturb(const GoalFunctionResult& initial_result) override {
        calls_++;
        seen_.push_back(initial_result);
        return script_(initial_result, callbacks_);
    }

private:
    Script script_;
    bool compatible_;
    int calls_ = 0;
    std::vector<GoalFunctionResult> seen_;
};

/// Search that gives up immediately.
inline std::unique_ptr<ScriptedSearch> giveUpSearch() {
    return std::make_unique<ScriptedSearch>(
        [](const GoalFunctionResult& initial, const SearchCallbacks&) { return initial; });
}

inline std::vector<std::string> textsOf(const std::vector<AttackedText>& texts) {
    std::vector<std::string> out;
    for (const auto& t : texts) out.push_back(t.text());
    return out;
}

inline std::vector<AttackedText> makeTexts(const std::vector<std::string>& strings) {
    std::vector<AttackedText> out;
    for (const auto& s : strings) out.emplace_back(s);
    return out;
}

} // namespace test_support
} // namespace advtext
