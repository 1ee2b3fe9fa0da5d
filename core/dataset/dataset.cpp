#include "dataset/dataset.hpp"

#include <stdexcept>

namespace advtext {

void InMemoryDataset::add(std::string text, int ground_truth_output) {
    examples_.push_back({std::move(text), ground_truth_output});
}

Example InMemoryDataset::at(size_t index) const {
    if (index >= examples_.size()) {
        throw std::out_of_range("Example index " + std::to_string(index) +
                                " out of range for dataset of size " +
                                std::to_string(examples_.size()));
    }
    return examples_[index];
}

} // namespace advtext
