#pragma once

#include "constraints/constraint_base.hpp"

#include <string>
#include <unordered_set>

namespace advtext {

/// Forbids modifying a word that an earlier step already modified.
class RepeatModification : public PreTransformationConstraint {
public:
    std::string name() const override;
    std::set<size_t> modifiableIndices(const AttackedText& current_text) const override;
};

/// Forbids modifying stopwords. Matching is case-insensitive.
class StopwordModification : public PreTransformationConstraint {
public:
    /// Uses a built-in English stopword list.
    StopwordModification();
    explicit StopwordModification(std::unordered_set<std::string> stopwords);

    std::string name() const override;
    std::set<size_t> modifiableIndices(const AttackedText& current_text) const override;

    bool isStopword(const std::string& word) const;

private:
    std::unordered_set<std::string> stopwords_;
};

} // namespace advtext
