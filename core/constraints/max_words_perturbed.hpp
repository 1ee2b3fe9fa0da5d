#pragma once

#include "constraints/constraint_base.hpp"

#include <optional>

namespace advtext {

/// Caps how many words of a text may be modified in total, as an absolute
/// count, as a fraction of the word count, or both.
class MaxWordsPerturbed : public PostTransformationConstraint {
public:
    MaxWordsPerturbed(std::optional<size_t> max_num_words,
                      std::optional<double> max_percent);

    std::string name() const override;
    std::string extraRepr() const override;

protected:
    bool checkConstraint(const AttackedText& candidate,
                         const AttackedText& reference) const override;

private:
    std::optional<size_t> max_num_words_;
    std::optional<double> max_percent_;
};

} // namespace advtext
