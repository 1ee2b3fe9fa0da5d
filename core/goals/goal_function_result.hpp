#pragma once

#include "text/attacked_text.hpp"

#include <vector>

namespace advtext {

/// Outcome of scoring one text against the attack goal.
/// Produced once per evaluation; treated as immutable afterwards, except
/// that dataset traversal overwrites `output` with the ground truth when
/// the example is skipped.
struct GoalFunctionResult {
    AttackedText text;
    int output = 0;                  // predicted class
    bool succeeded = false;
    double score = 0.0;              // higher = closer to the goal
    int num_queries = 0;             // goal function query count when produced
    std::vector<double> raw_output;  // class probabilities
};

} // namespace advtext
