#ifndef REASONER_TYPES_HPP
#define REASONER_TYPES_HPP

#include <cstddef>
#include <limits>
#include <functional>
#include <set>
#include <string>

namespace reasoner {

// Query variables and the concepts they bind to
using Variable = std::string;
using ConceptId = std::string;
using VariableSet = std::set<Variable>;

// Strong type for an index into the resolution state arena
struct StateIndex {
    std::size_t value;
    explicit constexpr StateIndex(std::size_t v = 0) : value(v) {}
    constexpr bool operator==(const StateIndex& other) const { return value == other.value; }
    constexpr bool operator!=(const StateIndex& other) const { return value != other.value; }
    constexpr bool operator<(const StateIndex& other) const { return value < other.value; }
};

// Parent of a top-level state, or "no state produced"
constexpr StateIndex NO_STATE{std::numeric_limits<std::size_t>::max()};

// Upper bound on fixpoint reiterations of a single resolution
constexpr std::size_t DEFAULT_MAX_ITERATIONS = 32;

} // namespace reasoner

namespace std {
    template<>
    struct hash<reasoner::StateIndex> {
        std::size_t operator()(const reasoner::StateIndex& index) const {
            return std::hash<std::size_t>{}(index.value);
        }
    };
}

#endif // REASONER_TYPES_HPP
