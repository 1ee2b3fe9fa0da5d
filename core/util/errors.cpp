#include "util/errors.hpp"

#include <fmt/format.h>

namespace advtext {

DatasetIndexError::DatasetIndexError(size_t index, size_t size)
    : std::out_of_range(fmt::format(
          "Out of bounds access of dataset. Size of data is {} but tried to access index {}",
          size, index)),
      index_(index), size_(size) {}

MissingAttributeError::MissingAttributeError(const std::string& attribute,
                                             const std::string& consumer)
    : std::runtime_error(fmt::format(
          "Cannot apply {} without `{}` attack attribute", consumer, attribute)),
      attribute_(attribute) {}

} // namespace advtext
