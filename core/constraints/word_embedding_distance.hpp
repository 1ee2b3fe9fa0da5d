#pragma once

#include "constraints/constraint_base.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace advtext {

// ─── Word Embedding ────────────────────────────────────────────
// In-memory vocabulary and vectors. Pairwise distances are memoized
// under the ordered (min id, max id) pair.

class WordEmbedding {
public:
    /// Throws std::invalid_argument when sizes or dimensions disagree.
    WordEmbedding(std::vector<std::string> vocabulary,
                  std::vector<std::vector<double>> vectors);

    std::optional<size_t> wordId(const std::string& word) const;

    double cosSim(size_t a, size_t b) const;

    /// Sum of squared component differences.
    double mseDist(size_t a, size_t b) const;

    size_t size() const { return vectors_.size(); }
    size_t dimension() const { return vectors_.empty() ? 0 : vectors_[0].size(); }

private:
    static uint64_t pairKey(size_t a, size_t b);

    std::unordered_map<std::string, size_t> word2index_;
    std::vector<std::vector<double>> vectors_;
    mutable std::unordered_map<uint64_t, double> cos_sim_cache_;
    mutable std::unordered_map<uint64_t, double> mse_dist_cache_;
};

struct WordEmbeddingDistanceOptions {
    /// Absent = no cosine check. Any present value, 0 included, is enforced.
    std::optional<double> min_cos_sim;
    /// Absent = no distance check. Any present value, 0 included, is enforced.
    std::optional<double> max_mse_dist;
    /// Whether a swap involving an out-of-vocabulary word passes.
    bool include_unknown_words = true;
    /// Whether the embedding vocabulary distinguishes case.
    bool cased = false;
    bool compare_against_original = false;
};

/// Requires every swapped word to stay close to the word it replaced in
/// embedding space. Only meaningful for word-swap transformations.
class WordEmbeddingDistance : public PostTransformationConstraint {
public:
    WordEmbeddingDistance(std::shared_ptr<const WordEmbedding> embedding,
                          WordEmbeddingDistanceOptions options);

    std::string name() const override;
    std::string extraRepr() const override;
    bool checkCompatibility(const Transformation& transformation) const override;

    const WordEmbeddingDistanceOptions& options() const { return options_; }

protected:
    bool checkConstraint(const AttackedText& candidate,
                         const AttackedText& reference) const override;

private:
    std::shared_ptr<const WordEmbedding> embedding_;
    WordEmbeddingDistanceOptions options_;
};

} // namespace advtext
