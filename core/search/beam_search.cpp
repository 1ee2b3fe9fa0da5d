#include "search/beam_search.hpp"
#include "util/errors.hpp"
#include "util/log.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <numeric>

namespace advtext {

BeamSearch::BeamSearch(int beam_width) : beam_width_(beam_width) {
    if (beam_width_ < 1) {
        throw ConfigurationError(fmt::format("Beam width must be at least 1, got {}", beam_width_));
    }
}

std::string BeamSearch::name() const { return "BeamSearch"; }

std::string BeamSearch::extraRepr() const { return fmt::format("beam_width={}", beam_width_); }

GoalFunctionResult BeamSearch::perturb(const GoalFunctionResult& initial_result) {
    const AttackedText& original_text = initial_result.text;

    std::vector<AttackedText> beam{initial_result.text};
    GoalFunctionResult best = initial_result;
    int depth = 0;

    while (!best.succeeded) {
        std::vector<AttackedText> candidates;
        for (const auto& text : beam) {
            auto transformed = callbacks_.get_transformations(text, &original_text, {});
            candidates.insert(candidates.end(),
                              std::make_move_iterator(transformed.begin()),
                              std::make_move_iterator(transformed.end()));
        }

        if (candidates.empty()) break;  // No candidate survives the constraints

        auto [results, search_over] = callbacks_.get_goal_results(candidates);
        if (results.empty()) break;

        // Sort by score (descending), stable so ties keep text order
        std::vector<size_t> order(results.size());
        std::iota(order.begin(), order.end(), 0);
        std::stable_sort(order.begin(), order.end(),
            [&](size_t a, size_t b) { return results[a].score > results[b].score; });

        best = results[order.front()];
        depth++;
        log::debug("{} step {}: {} candidates, best score {:.4f}",
                   name(), depth, results.size(), best.score);

        if (search_over) break;

        beam.clear();
        size_t width = std::min(static_cast<size_t>(beam_width_), order.size());
        for (size_t i = 0; i < width; i++) {
            beam.push_back(results[order[i]].text);
        }
    }

    return best;
}

std::string GreedySearch::name() const { return "GreedySearch"; }

} // namespace advtext
