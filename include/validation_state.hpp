/**
 * Validation States
 *
 * Fixed vocabulary of evidence tags attached to a variant, stored as a
 * small bit set and always listed in vocabulary order.
 */

#ifndef VALIDATION_STATE_HPP
#define VALIDATION_STATE_HPP

#include "varnote.hpp"
#include <array>
#include <bitset>
#include <optional>
#include <string>
#include <vector>

namespace varnote {

enum class ValidationState {
    CLUSTER,
    FREQ,
    SUBMITTER,
    DOUBLEHIT,
    HAPMAP,
    THOUSAND_GENOMES,
    FAILED,
    PRECIOUS
};

constexpr size_t VALIDATION_STATE_COUNT = 8;

/**
 * Vocabulary names, in order
 */
inline const std::array<std::string, VALIDATION_STATE_COUNT>& validation_state_names() {
    static const std::array<std::string, VALIDATION_STATE_COUNT> names = {
        "cluster", "freq", "submitter", "doublehit",
        "hapmap", "1000Genome", "failed", "precious"
    };
    return names;
}

inline std::string validation_state_to_string(ValidationState state) {
    return validation_state_names()[static_cast<size_t>(state)];
}

/**
 * Parse a state name (case-insensitive)
 */
inline std::optional<ValidationState> parse_validation_state(const std::string& name) {
    std::string upper = to_upper(name);
    const auto& names = validation_state_names();
    for (size_t i = 0; i < names.size(); ++i) {
        if (to_upper(names[i]) == upper) {
            return static_cast<ValidationState>(i);
        }
    }
    return std::nullopt;
}

class ValidationStateSet {
public:
    void add(ValidationState state) {
        bits_.set(static_cast<size_t>(state));
    }

    /**
     * Add a state by name
     * @return false (with a warning) if the name is not in the vocabulary
     */
    bool add(const std::string& name) {
        auto state = parse_validation_state(name);
        if (!state) {
            log(LogLevel::WARNING, "Unknown validation state '" + name + "' ignored");
            return false;
        }
        add(*state);
        return true;
    }

    bool contains(ValidationState state) const {
        return bits_.test(static_cast<size_t>(state));
    }

    bool empty() const { return bits_.none(); }
    size_t size() const { return bits_.count(); }

    std::vector<ValidationState> states() const {
        std::vector<ValidationState> result;
        for (size_t i = 0; i < VALIDATION_STATE_COUNT; ++i) {
            if (bits_.test(i)) result.push_back(static_cast<ValidationState>(i));
        }
        return result;
    }

    std::vector<std::string> names() const {
        std::vector<std::string> result;
        for (ValidationState state : states()) {
            result.push_back(validation_state_to_string(state));
        }
        return result;
    }

    /**
     * Comma-joined names, e.g. "cluster,hapmap"
     */
    std::string to_string() const {
        std::string result;
        for (const auto& name : names()) {
            if (!result.empty()) result += ",";
            result += name;
        }
        return result;
    }

private:
    std::bitset<VALIDATION_STATE_COUNT> bits_;
};

/**
 * Parse a comma-joined list of state names as given in variant input.
 * Empty entries and "." are skipped, unknown names are ignored with a warning.
 */
inline ValidationStateSet parse_validation_states(const std::string& code) {
    ValidationStateSet set;
    size_t start = 0;
    while (start <= code.size()) {
        size_t comma = code.find(',', start);
        if (comma == std::string::npos) comma = code.size();
        std::string name = code.substr(start, comma - start);
        if (!name.empty() && name != ".") {
            set.add(name);
        }
        start = comma + 1;
    }
    return set;
}

} // namespace varnote

#endif // VALIDATION_STATE_HPP
