#pragma once

#include <cstddef>
#include <limits>

namespace advtext {

/// Attack engine configuration.
struct AttackConfig {
    size_t constraint_cache_size = size_t{1} << 18;   // entries, must be > 0
};

/// Goal function configuration.
struct GoalFunctionConfig {
    int query_budget = std::numeric_limits<int>::max();  // model queries per example
    size_t model_cache_size = size_t{1} << 20;           // memoized model outputs
    size_t batch_size = 32;                              // texts per model call
};

/// Search configuration for the built-in search methods.
struct SearchConfig {
    int beam_width = 8;   // states kept per step; 1 = greedy
};

} // namespace advtext
