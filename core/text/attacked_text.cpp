#include "text/attacked_text.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <map>
#include <stdexcept>

namespace advtext {

namespace {

bool isWordChar(char c) {
    auto u = static_cast<unsigned char>(c);
    // Bytes >= 0x80 belong to multi-byte UTF-8 sequences; keep them in words.
    return std::isalnum(u) || u >= 0x80 || c == '\'' || c == '-' || c == '_';
}

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

} // namespace

AttackedText::AttackedText(std::string text, AttackAttrs attrs)
    : text_(std::move(text)), attrs_(std::move(attrs)) {
    tokenize();
}

void AttackedText::tokenize() {
    words_.clear();
    spans_.clear();
    size_t i = 0;
    while (i < text_.size()) {
        if (!isWordChar(text_[i])) {
            i++;
            continue;
        }
        size_t start = i;
        while (i < text_.size() && isWordChar(text_[i])) i++;
        spans_.push_back({start, i - start});
        words_.push_back(text_.substr(start, i - start));
    }
}

void AttackedText::checkIndex(size_t index) const {
    if (index >= words_.size()) {
        throw std::out_of_range(fmt::format(
            "Word index {} out of range for text with {} words", index, words_.size()));
    }
}

const std::string& AttackedText::wordAt(size_t index) const {
    checkIndex(index);
    return words_[index];
}

AttackedText AttackedText::replaceWordAtIndex(size_t index, const std::string& new_word) const {
    return replaceWordsAtIndices({index}, {new_word});
}

AttackedText AttackedText::replaceWordsAtIndices(const std::vector<size_t>& indices,
                                                 const std::vector<std::string>& new_words) const {
    if (indices.size() != new_words.size()) {
        throw std::invalid_argument(fmt::format(
            "Cannot replace {} words with {} replacements", indices.size(), new_words.size()));
    }

    std::map<size_t, std::string> replacements;
    for (size_t k = 0; k < indices.size(); k++) {
        checkIndex(indices[k]);
        if (new_words[k].empty()) {
            throw std::invalid_argument("Replacement word must be non-empty; use deleteWordAtIndex");
        }
        replacements[indices[k]] = new_words[k];
    }

    std::string out;
    out.reserve(text_.size());
    size_t cursor = 0;
    std::vector<size_t> changed;
    for (const auto& [index, word] : replacements) {
        const Span& span = spans_[index];
        out.append(text_, cursor, span.offset - cursor);
        out.append(word);
        cursor = span.offset + span.length;
        if (word != words_[index]) changed.push_back(index);
    }
    out.append(text_, cursor, std::string::npos);

    AttackAttrs attrs = attrs_;
    attrs.newly_modified_indices = changed;
    attrs.modified_indices.insert(changed.begin(), changed.end());
    attrs.last_transformation = nullptr;
    return AttackedText(std::move(out), std::move(attrs));
}

AttackedText AttackedText::deleteWordAtIndex(size_t index) const {
    checkIndex(index);
    const Span& span = spans_[index];

    size_t end = span.offset + span.length;
    while (end < text_.size() && isSpace(text_[end])) end++;

    std::string out = text_.substr(0, span.offset);
    if (end == text_.size()) {
        // Last word: drop the whitespace that separated it instead.
        while (!out.empty() && isSpace(out.back())) out.pop_back();
    }
    out.append(text_, end, std::string::npos);

    AttackAttrs attrs = attrs_;
    attrs.newly_modified_indices = std::vector<size_t>{};
    std::set<size_t> shifted;
    for (size_t i : attrs_.modified_indices) {
        if (i < index) shifted.insert(i);
        else if (i > index) shifted.insert(i - 1);
    }
    attrs.modified_indices = std::move(shifted);
    attrs.last_transformation = nullptr;
    return AttackedText(std::move(out), std::move(attrs));
}

std::vector<size_t> AttackedText::wordsDiff(const AttackedText& other) const {
    std::vector<size_t> diff;
    size_t n = std::max(words_.size(), other.words_.size());
    for (size_t i = 0; i < n; i++) {
        if (i >= words_.size() || i >= other.words_.size() || words_[i] != other.words_[i]) {
            diff.push_back(i);
        }
    }
    return diff;
}

} // namespace advtext
