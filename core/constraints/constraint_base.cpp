#include "constraints/constraint_base.hpp"

namespace advtext {

std::string Constraint::str() const {
    std::string extra = extraRepr();
    if (extra.empty()) return name();
    return name() + "(" + extra + ")";
}

std::vector<AttackedText> PostTransformationConstraint::callMany(
    const std::vector<AttackedText>& candidates,
    const AttackedText& current_text,
    const AttackedText* original_text
) const {
    const AttackedText& reference =
        (compare_against_original_ && original_text) ? *original_text : current_text;

    std::vector<AttackedText> kept;
    for (const auto& candidate : candidates) {
        const Transformation* source = candidate.attackAttrs().last_transformation;
        if (source && !checkCompatibility(*source)) {
            kept.push_back(candidate);
            continue;
        }
        if (checkConstraint(candidate, reference)) {
            kept.push_back(candidate);
        }
    }
    return kept;
}

} // namespace advtext
