#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace advtext {

/// One (text, ground truth label) pair.
struct Example {
    std::string text;
    int ground_truth_output = 0;
};

/// Indexed, sized source of examples.
class Dataset {
public:
    virtual ~Dataset() = default;

    virtual size_t size() const = 0;

    /// Throws std::out_of_range for an invalid index.
    virtual Example at(size_t index) const = 0;

    /// Class names, when the dataset knows them.
    virtual std::optional<std::vector<std::string>> labelNames() const { return std::nullopt; }
};

class InMemoryDataset : public Dataset {
public:
    InMemoryDataset() = default;
    explicit InMemoryDataset(std::vector<Example> examples,
                             std::optional<std::vector<std::string>> label_names = std::nullopt)
        : examples_(std::move(examples)), label_names_(std::move(label_names)) {}

    void add(std::string text, int ground_truth_output);

    size_t size() const override { return examples_.size(); }
    Example at(size_t index) const override;
    std::optional<std::vector<std::string>> labelNames() const override { return label_names_; }

private:
    std::vector<Example> examples_;
    std::optional<std::vector<std::string>> label_names_;
};

} // namespace advtext
