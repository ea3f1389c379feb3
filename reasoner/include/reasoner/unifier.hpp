#ifndef REASONER_UNIFIER_HPP
#define REASONER_UNIFIER_HPP

#include <reasoner/substitution.hpp>
#include <reasoner/types.hpp>
#include <map>
#include <set>
#include <vector>
#include <string>
#include <initializer_list>

namespace reasoner {

/**
 * Variable renaming from one query's variable space into another's.
 *
 * A source variable may map to several target variables (a head {x, x}
 * unifying with a query {a, b}). Constant bindings pin a target variable to
 * a concept, used when the target side has a variable the source can only
 * answer with a fixed value. The default unifier is the identity.
 */
class Unifier {
private:
    std::map<Variable, std::set<Variable>> mapping_;
    std::map<Variable, ConceptId> constants_;

public:
    Unifier() = default;

    Unifier(std::initializer_list<std::pair<const Variable, Variable>> pairs) {
        for (const auto& [from, to] : pairs) {
            mapping_[from].insert(to);
        }
    }

    Unifier(std::map<Variable, std::set<Variable>> mapping,
            std::map<Variable, ConceptId> constants = {})
        : mapping_(std::move(mapping)), constants_(std::move(constants)) {}

    bool empty() const { return mapping_.empty() && constants_.empty(); }
    bool is_identity() const;

    const std::map<Variable, std::set<Variable>>& mapping() const { return mapping_; }
    const std::map<Variable, ConceptId>& constants() const { return constants_; }

    // Source variables with a mapping
    VariableSet keys() const;

    // Target variables of a source variable (empty if unmapped)
    std::set<Variable> targets(const Variable& var) const;

    /**
     * Rename the keys of a substitution into the target space.
     * Values landing on the same target must agree, otherwise the result is
     * empty. Unmapped variables are kept unless a mapped target already
     * took their name. Explanation is preserved.
     */
    Substitution apply(const Substitution& sub) const;

    /**
     * Reverse every mapping. Constant bindings have no source and are dropped.
     */
    Unifier inverse() const;

    /**
     * this followed by other: x -> y under this, y -> z under other gives x -> z.
     * Targets of this that other does not map are kept.
     */
    Unifier compose(const Unifier& other) const;

    bool operator==(const Unifier& other) const {
        return mapping_ == other.mapping_ && constants_ == other.constants_;
    }

    bool operator!=(const Unifier& other) const {
        return !(*this == other);
    }

    bool operator<(const Unifier& other) const {
        if (mapping_ != other.mapping_) return mapping_ < other.mapping_;
        return constants_ < other.constants_;
    }

    std::string to_string() const;
};

/**
 * All valid unifiers between the same pair of queries.
 */
class MultiUnifier {
private:
    std::vector<Unifier> unifiers_;  // Sorted, unique

public:
    // Holds no unifier: the queries do not unify
    MultiUnifier() = default;

    explicit MultiUnifier(std::vector<Unifier> unifiers);

    // Holds only the identity
    static MultiUnifier trivial() {
        return MultiUnifier(std::vector<Unifier>{Unifier()});
    }

    bool empty() const { return unifiers_.empty(); }
    std::size_t size() const { return unifiers_.size(); }

    auto begin() const { return unifiers_.begin(); }
    auto end() const { return unifiers_.end(); }

    const std::vector<Unifier>& unifiers() const { return unifiers_; }

    /**
     * The single unifier; throws UnifierError unless exactly one exists.
     */
    const Unifier& unifier() const;

    /**
     * Translate a substitution through every unifier, dropping failures.
     */
    std::vector<Substitution> apply(const Substitution& sub) const;

    MultiUnifier inverse() const;

    bool operator==(const MultiUnifier& other) const {
        return unifiers_ == other.unifiers_;
    }

    bool operator!=(const MultiUnifier& other) const {
        return !(*this == other);
    }

    std::string to_string() const;
};

} // namespace reasoner

#endif // REASONER_UNIFIER_HPP
