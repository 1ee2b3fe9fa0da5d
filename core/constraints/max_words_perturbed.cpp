#include "constraints/max_words_perturbed.hpp"
#include "util/errors.hpp"

#include <fmt/format.h>

namespace advtext {

MaxWordsPerturbed::MaxWordsPerturbed(std::optional<size_t> max_num_words,
                                     std::optional<double> max_percent)
    : max_num_words_(max_num_words), max_percent_(max_percent) {
    if (!max_num_words_ && !max_percent_) {
        throw ConfigurationError("MaxWordsPerturbed requires max_num_words or max_percent");
    }
    if (max_percent_ && (*max_percent_ < 0.0 || *max_percent_ > 1.0)) {
        throw ConfigurationError(fmt::format(
            "MaxWordsPerturbed max_percent must lie in [0, 1], got {}", *max_percent_));
    }
}

std::string MaxWordsPerturbed::name() const { return "MaxWordsPerturbed"; }

std::string MaxWordsPerturbed::extraRepr() const {
    if (max_num_words_ && max_percent_) {
        return fmt::format("max_num_words={}, max_percent={}", *max_num_words_, *max_percent_);
    }
    if (max_num_words_) return fmt::format("max_num_words={}", *max_num_words_);
    return fmt::format("max_percent={}", *max_percent_);
}

bool MaxWordsPerturbed::checkConstraint(const AttackedText& candidate,
                                        const AttackedText& /*reference*/) const {
    size_t num_modified = candidate.attackAttrs().modified_indices.size();
    if (max_num_words_ && num_modified > *max_num_words_) return false;
    if (max_percent_ && candidate.numWords() > 0) {
        double ratio = static_cast<double>(num_modified) / candidate.numWords();
        if (ratio > *max_percent_) return false;
    }
    return true;
}

} // namespace advtext
