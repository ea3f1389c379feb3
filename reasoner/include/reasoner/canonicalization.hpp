#ifndef REASONER_CANONICALIZATION_HPP
#define REASONER_CANONICALIZATION_HPP

#include <reasoner/atom.hpp>
#include <reasoner/substitution.hpp>
#include <reasoner/types.hpp>
#include <map>
#include <string>
#include <vector>

namespace reasoner {

/**
 * Canonical representation of an atom under a substitution.
 * Two atomic queries with the same canonical form are equivalent: same
 * shape up to variable renaming, with bound variables standing for their
 * constants.
 *
 * Each player is the token triple {role, role term, player term}. A term is
 * "$n" for the n-th unbound variable by first appearance, "=value" for a
 * bound variable and "" when absent.
 */
struct CanonicalForm {
    std::string predicate;
    std::string relation;
    std::vector<std::vector<std::string>> players;
    std::size_t variable_count = 0;

    bool operator==(const CanonicalForm& other) const {
        return predicate == other.predicate && relation == other.relation &&
               variable_count == other.variable_count && players == other.players;
    }

    bool operator!=(const CanonicalForm& other) const {
        return !(*this == other);
    }

    // Also used as the equivalence class key
    std::string to_string() const;
};

/**
 * Variable numbering chosen by the canonical player order.
 * Bound variables are absent, they canonicalise to their constant.
 */
struct VariableMapping {
    std::map<Variable, std::size_t> original_to_canonical;
    std::vector<Variable> canonical_to_original;

    bool contains(const Variable& var) const {
        return original_to_canonical.count(var) > 0;
    }
};

struct CanonicalizationResult {
    CanonicalForm canonical_form;
    VariableMapping variable_mapping;

    static bool are_equivalent(const CanonicalizationResult& a, const CanonicalizationResult& b) {
        return a.canonical_form == b.canonical_form;
    }
};

/**
 * Canonicalization of relation atoms.
 *
 * 1. Try all orderings of the role players
 * 2. For each ordering, number unbound variables by first appearance
 *    (relation variable first)
 * 3. Keep the lexicographically smallest player sequence
 *
 * Factorial in the arity, which stays small for relation atoms.
 */
class Canonicalizer {
public:
    CanonicalizationResult canonicalize(const Atom& atom, const Substitution& sub) const;

    bool are_equivalent(const Atom& a, const Substitution& sub_a,
                        const Atom& b, const Substitution& sub_b) const {
        return canonicalize(a, sub_a).canonical_form == canonicalize(b, sub_b).canonical_form;
    }
};

} // namespace reasoner

#endif // REASONER_CANONICALIZATION_HPP
