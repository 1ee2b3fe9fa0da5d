#pragma once

#include "attack/attack_config.hpp"
#include "search/search_method.hpp"

namespace advtext {

/// Beam Search: at each step, expands every text in the beam through the
/// engine's filtered transformations, scores all candidates, and keeps
/// the beam_width best. Stops on success, when no candidate survives the
/// constraints, or when the query budget runs out.
class BeamSearch : public SearchMethod {
public:
    explicit BeamSearch(int beam_width = SearchConfig{}.beam_width);

    std::string name() const override;
    std::string extraRepr() const override;

    int beamWidth() const { return beam_width_; }

protected:
    GoalFunctionResult perturb(const GoalFunctionResult& initial_result) override;

private:
    int beam_width_;
};

/// Beam search with a beam of one.
class GreedySearch : public BeamSearch {
public:
    GreedySearch() : BeamSearch(1) {}

    std::string name() const override;
    std::string extraRepr() const override { return ""; }
};

} // namespace advtext
