#pragma once

#include "attack/attack.hpp"
#include "constraints/word_embedding_distance.hpp"
#include "transforms/word_swap.hpp"

#include <memory>
#include <optional>

namespace advtext {

struct SynonymSwapRecipeConfig {
    AttackConfig attack;
    GoalFunctionConfig goal;
    SearchConfig search;
    double min_cos_sim = 0.5;               // used when an embedding is given
    std::optional<size_t> max_num_words;    // absent = no cap
};

/// Untargeted classification attack that swaps non-stopwords for dictionary
/// synonyms, never touches a word twice, keeps every swap close in
/// embedding space (when `embedding` is non-null) and explores with beam
/// search.
std::unique_ptr<Attack> makeSynonymSwapAttack(ModelFn model,
                                              WordSwapDictionary::SynonymMap synonyms,
                                              std::shared_ptr<const WordEmbedding> embedding,
                                              const SynonymSwapRecipeConfig& config = {});

} // namespace advtext
