#include "transforms/word_swap.hpp"

#include <algorithm>
#include <cctype>

namespace advtext {

namespace {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string matchCase(const std::string& original, std::string replacement) {
    if (!original.empty() && !replacement.empty() &&
        std::isupper(static_cast<unsigned char>(original[0]))) {
        replacement[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(replacement[0])));
    }
    return replacement;
}

} // namespace

// ─── Dictionary word swap ──────────────────────────────────────

WordSwapDictionary::WordSwapDictionary(SynonymMap synonyms) {
    for (auto& [word, list] : synonyms) {
        auto& target = synonyms_[lowercase(word)];
        for (auto& s : list) target.push_back(lowercase(s));
    }
}

std::string WordSwapDictionary::name() const { return "WordSwapDictionary"; }

std::vector<AttackedText> WordSwapDictionary::getTransformations(
    const AttackedText& current_text,
    const std::set<size_t>& indices_to_modify
) const {
    std::vector<AttackedText> result;
    for (size_t i : indices_to_modify) {
        const std::string& word = current_text.wordAt(i);
        auto it = synonyms_.find(lowercase(word));
        if (it == synonyms_.end()) continue;

        for (const auto& synonym : it->second) {
            std::string replacement = matchCase(word, synonym);
            if (replacement == word) continue;
            result.push_back(current_text.replaceWordAtIndex(i, replacement));
        }
    }
    return result;
}

// ─── Word deletion ─────────────────────────────────────────────

std::string WordDeletion::name() const { return "WordDeletion"; }

std::vector<AttackedText> WordDeletion::getTransformations(
    const AttackedText& current_text,
    const std::set<size_t>& indices_to_modify
) const {
    std::vector<AttackedText> result;
    // Never delete the last remaining word.
    if (current_text.numWords() <= 1) return result;
    for (size_t i : indices_to_modify) {
        result.push_back(current_text.deleteWordAtIndex(i));
    }
    return result;
}

} // namespace advtext
