#include "constraints/word_embedding_distance.hpp"
#include "transforms/transformation_base.hpp"
#include "util/errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace advtext {

// ─── Word Embedding ────────────────────────────────────────────

WordEmbedding::WordEmbedding(std::vector<std::string> vocabulary,
                             std::vector<std::vector<double>> vectors)
    : vectors_(std::move(vectors)) {
    if (vocabulary.size() != vectors_.size()) {
        throw std::invalid_argument(fmt::format(
            "Embedding has {} words but {} vectors", vocabulary.size(), vectors_.size()));
    }
    for (size_t i = 0; i < vectors_.size(); i++) {
        if (vectors_[i].size() != vectors_[0].size()) {
            throw std::invalid_argument(fmt::format(
                "Embedding vector {} has dimension {}, expected {}",
                i, vectors_[i].size(), vectors_[0].size()));
        }
        word2index_[vocabulary[i]] = i;
    }
}

std::optional<size_t> WordEmbedding::wordId(const std::string& word) const {
    auto it = word2index_.find(word);
    if (it == word2index_.end()) return std::nullopt;
    return it->second;
}

uint64_t WordEmbedding::pairKey(size_t a, size_t b) {
    uint64_t lo = std::min(a, b);
    uint64_t hi = std::max(a, b);
    return (hi << 32) | lo;
}

double WordEmbedding::cosSim(size_t a, size_t b) const {
    uint64_t key = pairKey(a, b);
    auto it = cos_sim_cache_.find(key);
    if (it != cos_sim_cache_.end()) return it->second;

    const auto& e1 = vectors_.at(a);
    const auto& e2 = vectors_.at(b);
    double dot = 0.0, n1 = 0.0, n2 = 0.0;
    for (size_t i = 0; i < e1.size(); i++) {
        dot += e1[i] * e2[i];
        n1 += e1[i] * e1[i];
        n2 += e2[i] * e2[i];
    }
    double sim = (n1 > 0.0 && n2 > 0.0) ? dot / (std::sqrt(n1) * std::sqrt(n2)) : 0.0;
    cos_sim_cache_[key] = sim;
    return sim;
}

double WordEmbedding::mseDist(size_t a, size_t b) const {
    uint64_t key = pairKey(a, b);
    auto it = mse_dist_cache_.find(key);
    if (it != mse_dist_cache_.end()) return it->second;

    const auto& e1 = vectors_.at(a);
    const auto& e2 = vectors_.at(b);
    double dist = 0.0;
    for (size_t i = 0; i < e1.size(); i++) {
        double d = e1[i] - e2[i];
        dist += d * d;
    }
    mse_dist_cache_[key] = dist;
    return dist;
}

// ─── Word Embedding Distance ───────────────────────────────────

WordEmbeddingDistance::WordEmbeddingDistance(std::shared_ptr<const WordEmbedding> embedding,
                                             WordEmbeddingDistanceOptions options)
    : PostTransformationConstraint(options.compare_against_original),
      embedding_(std::move(embedding)), options_(options) {
    if (!embedding_) {
        throw ConfigurationError("WordEmbeddingDistance requires an embedding");
    }
    if (!options_.min_cos_sim && !options_.max_mse_dist) {
        throw ConfigurationError("WordEmbeddingDistance requires min_cos_sim or max_mse_dist");
    }
}

std::string WordEmbeddingDistance::name() const { return "WordEmbeddingDistance"; }

std::string WordEmbeddingDistance::extraRepr() const {
    std::string metric = options_.min_cos_sim
        ? fmt::format("min_cos_sim={}", *options_.min_cos_sim)
        : fmt::format("max_mse_dist={}", *options_.max_mse_dist);
    return fmt::format("{}, cased={}, include_unknown_words={}",
                       metric, options_.cased, options_.include_unknown_words);
}

bool WordEmbeddingDistance::checkCompatibility(const Transformation& transformation) const {
    return transformation.consistsOfWordSwaps();
}

bool WordEmbeddingDistance::checkConstraint(const AttackedText& candidate,
                                            const AttackedText& reference) const {
    const auto& indices = candidate.attackAttrs().newly_modified_indices;
    if (!indices) {
        throw MissingAttributeError("newly_modified_indices", name());
    }

    for (size_t i : *indices) {
        std::string ref_word = reference.wordAt(i);
        std::string cand_word = candidate.wordAt(i);
        if (!options_.cased) {
            auto lower = [](unsigned char c) { return static_cast<char>(std::tolower(c)); };
            std::transform(ref_word.begin(), ref_word.end(), ref_word.begin(), lower);
            std::transform(cand_word.begin(), cand_word.end(), cand_word.begin(), lower);
        }

        auto ref_id = embedding_->wordId(ref_word);
        auto cand_id = embedding_->wordId(cand_word);
        if (!ref_id || !cand_id) {
            if (options_.include_unknown_words) continue;
            return false;
        }

        if (options_.min_cos_sim &&
            embedding_->cosSim(*ref_id, *cand_id) < *options_.min_cos_sim) {
            return false;
        }
        if (options_.max_mse_dist &&
            embedding_->mseDist(*ref_id, *cand_id) > *options_.max_mse_dist) {
            return false;
        }
    }
    return true;
}

} // namespace advtext
