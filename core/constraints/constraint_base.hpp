#pragma once

#include "text/attacked_text.hpp"

#include <cstddef>
#include <set>
#include <string>
#include <vector>

namespace advtext {

class Transformation;

/// Base class for all linguistic constraints.
/// A constraint is either a pre-transformation constraint, which limits the
/// word indices a transformation may touch, or a post-transformation
/// constraint, which filters candidates after they exist. The category is
/// declared through isPreTransformation() and never inferred from the type.
/// Only the two category bases below may derive from Constraint directly,
/// so the flag always matches the dynamic type.
class Constraint {
public:
    virtual ~Constraint() = default;

    /// Human-readable name of this constraint.
    virtual std::string name() const = 0;

    virtual bool isPreTransformation() const = 0;

    /// Whether this constraint can judge texts produced by `transformation`.
    virtual bool checkCompatibility(const Transformation& /*transformation*/) const {
        return true;
    }

    /// Extra "key=value" settings shown when the attack is printed.
    virtual std::string extraRepr() const { return ""; }

    /// name(extraRepr) for printing.
    std::string str() const;

private:
    Constraint() = default;

    friend class PostTransformationConstraint;
    friend class PreTransformationConstraint;
};

// ─── Post-transformation constraints ──────────────────────────

class PostTransformationConstraint : public Constraint {
public:
    explicit PostTransformationConstraint(bool compare_against_original = false)
        : compare_against_original_(compare_against_original) {}

    bool isPreTransformation() const final { return false; }

    /// Return the candidates, in input order, that satisfy this constraint.
    /// Candidates produced by a transformation this constraint is not
    /// compatible with are passed through unchecked.
    virtual std::vector<AttackedText> callMany(const std::vector<AttackedText>& candidates,
                                               const AttackedText& current_text,
                                               const AttackedText* original_text) const;

    bool compareAgainstOriginal() const { return compare_against_original_; }

protected:
    /// Per-candidate predicate. `reference` is the original text when
    /// compare_against_original is set and an original exists, otherwise
    /// the current text.
    virtual bool checkConstraint(const AttackedText& candidate,
                                 const AttackedText& reference) const = 0;

private:
    bool compare_against_original_;
};

// ─── Pre-transformation constraints ───────────────────────────

class PreTransformationConstraint : public Constraint {
public:
    bool isPreTransformation() const final { return true; }

    /// Word indices of `current_text` a transformation may modify.
    virtual std::set<size_t> modifiableIndices(const AttackedText& current_text) const = 0;
};

} // namespace advtext
