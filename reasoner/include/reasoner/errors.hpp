#ifndef REASONER_ERRORS_HPP
#define REASONER_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace reasoner {

/**
 * Hard failure of a resolution pass.
 * Raised for internal-logic faults only. An answer that does not exist is
 * reported as an empty substitution, never as an exception.
 */
class ResolutionError : public std::runtime_error {
public:
    explicit ResolutionError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * A derived fact was about to be written to the store a second time.
 */
class DuplicateMaterialisationError : public ResolutionError {
public:
    explicit DuplicateMaterialisationError(const std::string& message)
        : ResolutionError("Duplicate materialisation: " + message) {}
};

/**
 * The set of in-flight queries was left in an inconsistent state.
 */
class CycleGuardError : public ResolutionError {
public:
    explicit CycleGuardError(const std::string& message)
        : ResolutionError("Cycle guard: " + message) {}
};

/**
 * No variable mapping exists between two queries classified as equivalent.
 */
class UnifierError : public ResolutionError {
public:
    explicit UnifierError(const std::string& message)
        : ResolutionError("Unifier: " + message) {}
};

/**
 * A cache entry handle was used with a query outside its equivalence class.
 */
class CacheInvariantError : public ResolutionError {
public:
    explicit CacheInvariantError(const std::string& message)
        : ResolutionError("Cache: " + message) {}
};

} // namespace reasoner

#endif // REASONER_ERRORS_HPP
