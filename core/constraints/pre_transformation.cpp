#include "constraints/pre_transformation.hpp"

#include <algorithm>
#include <cctype>

namespace advtext {

namespace {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

const std::unordered_set<std::string>& defaultStopwords() {
    static const std::unordered_set<std::string> words = {
        "a", "about", "above", "after", "again", "against", "all", "am", "an", "and",
        "any", "are", "as", "at", "be", "because", "been", "before", "being", "below",
        "between", "both", "but", "by", "can", "did", "do", "does", "doing", "down",
        "during", "each", "few", "for", "from", "further", "had", "has", "have", "having",
        "he", "her", "here", "hers", "herself", "him", "himself", "his", "how", "i",
        "if", "in", "into", "is", "it", "its", "itself", "just", "me", "more",
        "most", "my", "myself", "no", "nor", "not", "now", "of", "off", "on",
        "once", "only", "or", "other", "our", "ours", "ourselves", "out", "over", "own",
        "same", "she", "should", "so", "some", "such", "than", "that", "the", "their",
        "theirs", "them", "themselves", "then", "there", "these", "they", "this", "those", "through",
        "to", "too", "under", "until", "up", "very", "was", "we", "were", "what",
        "when", "where", "which", "while", "who", "whom", "why", "will", "with", "you",
        "your", "yours", "yourself", "yourselves"
    };
    return words;
}

} // namespace

// ─── Repeat modification ───────────────────────────────────────

std::string RepeatModification::name() const { return "RepeatModification"; }

std::set<size_t> RepeatModification::modifiableIndices(const AttackedText& current_text) const {
    std::set<size_t> allowed;
    const auto& modified = current_text.attackAttrs().modified_indices;
    for (size_t i = 0; i < current_text.numWords(); i++) {
        if (!modified.count(i)) allowed.insert(i);
    }
    return allowed;
}

// ─── Stopword modification ─────────────────────────────────────

StopwordModification::StopwordModification() : stopwords_(defaultStopwords()) {}

StopwordModification::StopwordModification(std::unordered_set<std::string> stopwords) {
    for (const auto& w : stopwords) stopwords_.insert(lowercase(w));
}

std::string StopwordModification::name() const { return "StopwordModification"; }

bool StopwordModification::isStopword(const std::string& word) const {
    return stopwords_.count(lowercase(word)) > 0;
}

std::set<size_t> StopwordModification::modifiableIndices(const AttackedText& current_text) const {
    std::set<size_t> allowed;
    const auto& words = current_text.words();
    for (size_t i = 0; i < words.size(); i++) {
        if (!isStopword(words[i])) allowed.insert(i);
    }
    return allowed;
}

} // namespace advtext
