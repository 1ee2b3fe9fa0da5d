#include "attack/attack_result.hpp"

#include <fmt/format.h>

namespace advtext {

const char* toString(AttackResult::Kind kind) {
    switch (kind) {
        case AttackResult::Kind::Successful: return "SUCCEEDED";
        case AttackResult::Kind::Failed:     return "FAILED";
        case AttackResult::Kind::Skipped:    return "SKIPPED";
    }
    return "UNKNOWN";
}

std::string AttackResult::str() const {
    if (kind() == Kind::Skipped) {
        return fmt::format("[{}] ({}) \"{}\"", toString(kind()),
                           original_result_.output, original_result_.text.text());
    }
    return fmt::format("[{}] ({}) \"{}\" -> ({}) \"{}\" ({} queries)", toString(kind()),
                       original_result_.output, original_result_.text.text(),
                       perturbed_result_.output, perturbed_result_.text.text(), num_queries_);
}

} // namespace advtext
