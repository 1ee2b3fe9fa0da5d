#pragma once

#include "text/attacked_text.hpp"

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace advtext {

class PreTransformationConstraint;

/// Per-call options for a transformation.
struct TransformationOptions {
    /// Restrict the transformation to these word indices.
    /// Absent = every word of the current text.
    std::optional<std::set<size_t>> indices_to_modify;
};

/// Base class for all transformations.
/// T : x → {x'}
/// Each transformation proposes candidate texts derived from the current
/// text. Output order is whatever the transformation produces; it is
/// neither sorted nor deduplicated.
class Transformation {
public:
    virtual ~Transformation() = default;

    /// Human-readable name of this transformation.
    virtual std::string name() const = 0;

    /// False when the transformation needs internal model access
    /// (gradients, embeddings of the victim model).
    virtual bool isBlackBox() const { return true; }

    /// True when every candidate replaces words in place, one for one.
    virtual bool consistsOfWordSwaps() const { return false; }

    /// Apply the transformation at every index allowed by `options` and by
    /// all pre-transformation constraints. Every candidate is stamped with
    /// this transformation as its `last_transformation`.
    std::vector<AttackedText> operator()(
        const AttackedText& current_text,
        const std::vector<const PreTransformationConstraint*>& pre_transformation_constraints,
        const TransformationOptions& options = {}
    ) const;

protected:
    /// Produce candidates that modify only `indices_to_modify`.
    virtual std::vector<AttackedText> getTransformations(
        const AttackedText& current_text,
        const std::set<size_t>& indices_to_modify
    ) const = 0;
};

} // namespace advtext
