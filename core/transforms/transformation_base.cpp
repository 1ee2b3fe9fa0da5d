#include "transforms/transformation_base.hpp"
#include "constraints/constraint_base.hpp"

#include <algorithm>
#include <iterator>

namespace advtext {

std::vector<AttackedText> Transformation::operator()(
    const AttackedText& current_text,
    const std::vector<const PreTransformationConstraint*>& pre_transformation_constraints,
    const TransformationOptions& options
) const {
    std::set<size_t> indices;
    if (options.indices_to_modify) {
        for (size_t i : *options.indices_to_modify) {
            if (i < current_text.numWords()) indices.insert(i);
        }
    } else {
        for (size_t i = 0; i < current_text.numWords(); i++) indices.insert(i);
    }

    for (const PreTransformationConstraint* constraint : pre_transformation_constraints) {
        if (indices.empty()) break;
        std::set<size_t> allowed = constraint->modifiableIndices(current_text);
        std::set<size_t> narrowed;
        std::set_intersection(indices.begin(), indices.end(),
                              allowed.begin(), allowed.end(),
                              std::inserter(narrowed, narrowed.begin()));
        indices = std::move(narrowed);
    }

    if (indices.empty()) return {};

    std::vector<AttackedText> candidates = getTransformations(current_text, indices);
    for (auto& candidate : candidates) {
        candidate.attackAttrs().last_transformation = this;
    }
    return candidates;
}

} // namespace advtext
