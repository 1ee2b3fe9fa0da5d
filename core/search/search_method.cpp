#include "search/search_method.hpp"

#include <stdexcept>

namespace advtext {

bool SearchMethod::isBound() const {
    return callbacks_.get_transformations && callbacks_.get_goal_results &&
           callbacks_.filter_transformations;
}

GoalFunctionResult SearchMethod::operator()(const GoalFunctionResult& initial_result) {
    if (!isBound()) {
        throw std::runtime_error("Search method " + name() + " has no attack services bound");
    }
    return perturb(initial_result);
}

std::string SearchMethod::str() const {
    std::string extra = extraRepr();
    if (extra.empty()) return name();
    return name() + "(" + extra + ")";
}

} // namespace advtext
