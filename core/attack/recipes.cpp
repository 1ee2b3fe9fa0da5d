#include "attack/recipes.hpp"
#include "constraints/max_words_perturbed.hpp"
#include "constraints/pre_transformation.hpp"
#include "goals/classification.hpp"
#include "search/beam_search.hpp"

namespace advtext {

std::unique_ptr<Attack> makeSynonymSwapAttack(ModelFn model,
                                              WordSwapDictionary::SynonymMap synonyms,
                                              std::shared_ptr<const WordEmbedding> embedding,
                                              const SynonymSwapRecipeConfig& config) {
    auto goal_function = std::make_unique<UntargetedClassification>(std::move(model), config.goal);
    auto transformation = std::make_unique<WordSwapDictionary>(std::move(synonyms));
    auto search_method = std::make_unique<BeamSearch>(config.search.beam_width);

    std::vector<std::unique_ptr<Constraint>> constraints;
    constraints.push_back(std::make_unique<RepeatModification>());
    constraints.push_back(std::make_unique<StopwordModification>());
    if (embedding) {
        WordEmbeddingDistanceOptions options;
        options.min_cos_sim = config.min_cos_sim;
        constraints.push_back(std::make_unique<WordEmbeddingDistance>(std::move(embedding), options));
    }
    if (config.max_num_words) {
        constraints.push_back(std::make_unique<MaxWordsPerturbed>(config.max_num_words, std::nullopt));
    }

    return std::make_unique<Attack>(std::move(goal_function), std::move(transformation),
                                    std::move(search_method), std::move(constraints),
                                    config.attack);
}

} // namespace advtext
