#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace advtext {

class Transformation;

// ─── Attack Attributes ─────────────────────────────────────────
// Auxiliary data carried alongside a text during an attack.

struct AttackAttrs {
    /// Word indices changed by the edit that produced this text.
    /// Absent on texts that were not produced by an edit.
    std::optional<std::vector<size_t>> newly_modified_indices;

    /// Every word index changed since the original text.
    std::set<size_t> modified_indices;

    std::optional<std::vector<std::string>> label_names;

    /// Transformation that produced this text (non-owning).
    const Transformation* last_transformation = nullptr;
};

// ─── AttackedText ──────────────────────────────────────────────
// A tokenized text plus its attack attributes. Treated as an
// immutable value: edits return a new AttackedText. Equality,
// ordering and hashing look at the rendered text only.

class AttackedText {
public:
    AttackedText() = default;
    explicit AttackedText(std::string text, AttackAttrs attrs = {});

    const std::string& text() const { return text_; }
    const std::vector<std::string>& words() const { return words_; }
    size_t numWords() const { return words_.size(); }

    /// Throws std::out_of_range for an invalid index.
    const std::string& wordAt(size_t index) const;

    const AttackAttrs& attackAttrs() const { return attrs_; }
    AttackAttrs& attackAttrs() { return attrs_; }

    AttackedText replaceWordAtIndex(size_t index, const std::string& new_word) const;

    /// Replace several words at once. Indices and words must have equal
    /// length; replacement words must be non-empty.
    AttackedText replaceWordsAtIndices(const std::vector<size_t>& indices,
                                       const std::vector<std::string>& new_words) const;

    /// Remove one word together with the whitespace that follows it.
    AttackedText deleteWordAtIndex(size_t index) const;

    /// Word indices at which this text and `other` differ.
    std::vector<size_t> wordsDiff(const AttackedText& other) const;

    bool operator==(const AttackedText& other) const { return text_ == other.text_; }
    bool operator!=(const AttackedText& other) const { return text_ != other.text_; }
    bool operator<(const AttackedText& other) const { return text_ < other.text_; }

private:
    struct Span {
        size_t offset = 0;
        size_t length = 0;
    };

    void tokenize();
    void checkIndex(size_t index) const;

    std::string text_;
    std::vector<std::string> words_;
    std::vector<Span> spans_;
    AttackAttrs attrs_;
};

struct AttackedTextHash {
    size_t operator()(const AttackedText& t) const {
        return std::hash<std::string>{}(t.text());
    }
};

} // namespace advtext
