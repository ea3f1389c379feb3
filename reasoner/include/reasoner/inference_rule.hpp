#ifndef REASONER_INFERENCE_RULE_HPP
#define REASONER_INFERENCE_RULE_HPP

#include <reasoner/atom.hpp>
#include <reasoner/query.hpp>
#include <reasoner/unifier.hpp>
#include <reasoner/types.hpp>
#include <string>
#include <vector>

namespace reasoner {

class Schema;

/**
 * Horn rule: when every body atom holds, the head holds.
 *
 * Body atoms are resolved left to right. A head without a relation variable
 * gets a generated one so that a materialised fact can always be bound.
 */
class InferenceRule {
private:
    std::string id_;
    std::vector<Atom> body_;
    Atom head_;
    bool materialise_;
    bool declares_relation_var_;

public:
    InferenceRule(std::string id, std::vector<Atom> body, Atom head, bool materialise = false);

    const std::string& id() const { return id_; }
    const std::vector<Atom>& body() const { return body_; }
    const Atom& head() const { return head_; }
    bool is_materialising() const { return materialise_; }

    /**
     * True when applying this rule to the query atom must write a fact
     * instead of returning a virtual answer: the query or the head names a
     * relation variable, the head has players not bound by the body, or the
     * rule is flagged materialising.
     */
    bool requires_materialisation(const Atom& query_atom) const;

    // Head player variables absent from the body
    bool has_disconnected_head() const;

    AtomicQuery head_query() const { return AtomicQuery(head_); }

    // Head role variables bound to their role labels
    Substitution head_role_substitution() const { return head_.role_substitution(); }

    std::vector<AtomicQuery> body_queries() const;

    // Body and head variables
    VariableSet variables() const;

    /**
     * Ways of applying this rule to the query: unifiers from head variables
     * to query variables. Empty when the head cannot answer the query.
     */
    MultiUnifier unifiers(const AtomicQuery& query, const Schema& schema) const;

    std::string to_string() const;
};

} // namespace reasoner

#endif // REASONER_INFERENCE_RULE_HPP
