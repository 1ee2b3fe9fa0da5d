#pragma once

#include "transforms/transformation_base.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace advtext {

/// Swaps each modifiable word for every synonym listed in a dictionary.
/// Lookup is case-insensitive; a capitalized word yields capitalized
/// synonyms.
class WordSwapDictionary : public Transformation {
public:
    using SynonymMap = std::unordered_map<std::string, std::vector<std::string>>;

    explicit WordSwapDictionary(SynonymMap synonyms);

    std::string name() const override;
    bool consistsOfWordSwaps() const override { return true; }

    const SynonymMap& synonyms() const { return synonyms_; }

protected:
    std::vector<AttackedText> getTransformations(
        const AttackedText& current_text,
        const std::set<size_t>& indices_to_modify) const override;

private:
    SynonymMap synonyms_;
};

/// Deletes one modifiable word per candidate.
class WordDeletion : public Transformation {
public:
    std::string name() const override;

protected:
    std::vector<AttackedText> getTransformations(
        const AttackedText& current_text,
        const std::set<size_t>& indices_to_modify) const override;
};

} // namespace advtext
