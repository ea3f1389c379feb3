#ifndef REASONER_SUBSTITUTION_HPP
#define REASONER_SUBSTITUTION_HPP

#include <reasoner/types.hpp>
#include <map>
#include <optional>
#include <string>
#include <initializer_list>

namespace reasoner {

/**
 * Provenance of an answer.
 * LOOKUP answers were read from the store, RULE answers were derived by a
 * rule while resolving the recorded query pattern.
 */
struct Explanation {
    enum Kind { LOOKUP, RULE };

    Kind kind;
    std::string pattern;
    std::string rule_id;  // Empty for lookups

    static Explanation lookup(const std::string& query_pattern) {
        return Explanation{LOOKUP, query_pattern, ""};
    }

    static Explanation rule(const std::string& query_pattern, const std::string& id) {
        return Explanation{RULE, query_pattern, id};
    }

    bool is_rule_explanation() const { return kind == RULE; }

    bool operator==(const Explanation& other) const {
        return kind == other.kind && pattern == other.pattern && rule_id == other.rule_id;
    }

    bool operator!=(const Explanation& other) const {
        return !(*this == other);
    }

    std::string to_string() const;
};

/**
 * Immutable partial binding of query variables to concepts.
 *
 * The empty substitution doubles as "no valid binding": every operation that
 * fails (conflicting merge, conflicting unifier application) yields it.
 * Equality, ordering and hashing look at the bindings only.
 */
class Substitution {
private:
    std::map<Variable, ConceptId> bindings_;
    std::optional<Explanation> explanation_;

public:
    Substitution() = default;

    Substitution(std::initializer_list<std::pair<const Variable, ConceptId>> bindings)
        : bindings_(bindings) {}

    explicit Substitution(std::map<Variable, ConceptId> bindings,
                          std::optional<Explanation> explanation = std::nullopt)
        : bindings_(std::move(bindings)), explanation_(std::move(explanation)) {}

    bool empty() const { return bindings_.empty(); }
    std::size_t size() const { return bindings_.size(); }

    bool contains(const Variable& var) const {
        return bindings_.count(var) > 0;
    }

    std::optional<ConceptId> get(const Variable& var) const {
        auto it = bindings_.find(var);
        return (it != bindings_.end()) ? std::optional<ConceptId>(it->second) : std::nullopt;
    }

    const std::map<Variable, ConceptId>& bindings() const { return bindings_; }
    VariableSet variables() const;

    const std::optional<Explanation>& explanation() const { return explanation_; }

    /**
     * Copy carrying the given explanation.
     */
    Substitution explain(const Explanation& explanation) const {
        return Substitution(bindings_, explanation);
    }

    /**
     * Drop bindings of variables outside vars. Keeps the explanation.
     */
    Substitution project(const VariableSet& vars) const;

    /**
     * True if every binding of other is also a binding of this.
     */
    bool subsumes(const Substitution& other) const;

    bool operator==(const Substitution& other) const {
        return bindings_ == other.bindings_;
    }

    bool operator!=(const Substitution& other) const {
        return !(*this == other);
    }

    bool operator<(const Substitution& other) const {
        return bindings_ < other.bindings_;
    }

    std::size_t hash() const;

    std::string to_string() const;
};

/**
 * Merge two substitutions.
 *
 * The empty substitution is the identity. Shared variables must agree,
 * a conflicting binding fails the whole merge and yields the empty
 * substitution. The result carries a's explanation, else b's.
 */
Substitution merge(const Substitution& a, const Substitution& b);

} // namespace reasoner

namespace std {
    template<>
    struct hash<reasoner::Substitution> {
        std::size_t operator()(const reasoner::Substitution& sub) const {
            return sub.hash();
        }
    };
}

#endif // REASONER_SUBSTITUTION_HPP
