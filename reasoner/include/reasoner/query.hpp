#ifndef REASONER_QUERY_HPP
#define REASONER_QUERY_HPP

#include <reasoner/atom.hpp>
#include <reasoner/substitution.hpp>
#include <reasoner/unifier.hpp>
#include <reasoner/types.hpp>
#include <string>

namespace reasoner {

/**
 * A single atom together with the bindings already known for its variables.
 *
 * Immutable. The substitution is always projected onto the atom's variables
 * and the equivalence key is computed once on construction.
 */
class AtomicQuery {
private:
    Atom atom_;
    Substitution substitution_;
    std::string key_;

public:
    explicit AtomicQuery(Atom atom, const Substitution& sub = Substitution());

    /**
     * Query q with sub applied. Bindings of q take precedence over sub
     * on shared variables.
     */
    static AtomicQuery atomic(const AtomicQuery& q, const Substitution& sub);

    const Atom& atom() const { return atom_; }
    const Substitution& substitution() const { return substitution_; }

    VariableSet variables() const { return atom_.variables(); }

    // Stable textual form, used in explanations
    std::string pattern() const;

    // Equal keys iff the queries are equivalent
    const std::string& equivalence_key() const { return key_; }

    bool is_equivalent(const AtomicQuery& other) const {
        return key_ == other.key_;
    }

    // Same atom, no bindings
    AtomicQuery general() const {
        return AtomicQuery(atom_);
    }

    /**
     * Every variable renaming mapping this query onto an equivalent one.
     * Bound variables must be bound to the same constant on both sides.
     * Empty when the queries are not equivalent.
     */
    MultiUnifier exact_unifiers(const AtomicQuery& other) const;

    /**
     * Role variables of players without a role label that the
     * substitution leaves unbound. Answers derived by rules bind these to
     * the most specific role only.
     */
    VariableSet role_expansion_variables() const;

    bool requires_role_expansion() const {
        return !role_expansion_variables().empty();
    }

    bool operator==(const AtomicQuery& other) const {
        return atom_ == other.atom_ && substitution_ == other.substitution_;
    }

    bool operator!=(const AtomicQuery& other) const {
        return !(*this == other);
    }

    std::string to_string() const { return pattern(); }
};

} // namespace reasoner

#endif // REASONER_QUERY_HPP
