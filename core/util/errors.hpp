#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace advtext {

/// A required component is missing or a configuration value is invalid.
/// Raised at construction time, before any attack runs.
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what)
        : std::invalid_argument(what) {}
};

/// The search method cannot drive the configured transformation.
class CompatibilityError : public std::invalid_argument {
public:
    explicit CompatibilityError(const std::string& what)
        : std::invalid_argument(what) {}
};

/// Dataset traversal asked for an index outside the dataset.
class DatasetIndexError : public std::out_of_range {
public:
    DatasetIndexError(size_t index, size_t size);

    size_t index() const { return index_; }
    size_t size() const { return size_; }

private:
    size_t index_;
    size_t size_;
};

/// A constraint needs an auxiliary text attribute the candidate does not carry.
class MissingAttributeError : public std::runtime_error {
public:
    MissingAttributeError(const std::string& attribute, const std::string& consumer);

    const std::string& attribute() const { return attribute_; }

private:
    std::string attribute_;
};

} // namespace advtext
