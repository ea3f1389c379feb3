#ifndef REASONER_RESOLUTION_TREE_HPP
#define REASONER_RESOLUTION_TREE_HPP

#include <reasoner/inference_rule.hpp>
#include <reasoner/knowledge_base.hpp>
#include <reasoner/query.hpp>
#include <reasoner/resolution_state.hpp>
#include <reasoner/semantic_cache.hpp>
#include <reasoner/types.hpp>
#include <deque>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace reasoner {

/**
 * Equivalence classes of the atomic queries currently applying rules.
 * A query is entered before its rules are expanded and left only once all
 * of its children are exhausted.
 */
class CycleGuard {
private:
    std::set<std::string> in_flight_;

public:
    // False if an equivalent query is already in flight
    bool enter(const AtomicQuery& query) {
        return in_flight_.insert(query.equivalence_key()).second;
    }

    // Throws CycleGuardError if the query is not in flight
    void leave(const AtomicQuery& query);

    bool contains(const AtomicQuery& query) const {
        return in_flight_.count(query.equivalence_key()) > 0;
    }

    std::size_t size() const { return in_flight_.size(); }
    bool empty() const { return in_flight_.empty(); }
};

/**
 * Collaborators shared by every state of a tree.
 */
struct ResolutionContext {
    KnowledgeBase& kb;
    SemanticCache& cache;
    const std::vector<InferenceRule>& rules;
    bool infer = true;
};

/**
 * Arena of resolution states for one resolution pass.
 *
 * States refer to their parent by index. The arena only grows, so indices
 * and references to states stay valid for the lifetime of the tree.
 * Not thread-safe; the cache and the store it talks to are.
 */
class ResolutionTree {
private:
    ResolutionContext context_;
    std::deque<ResolutionState> states_;
    CycleGuard guard_;

    StateIndex add(StateIndex parent, ResolutionState::Data data);

    // Child generation per state kind
    StateIndex next_atomic_child(StateIndex index);
    StateIndex next_role_expansion_child(StateIndex index);
    StateIndex next_rule_child(StateIndex index);
    StateIndex next_cumulative_child(StateIndex index);

    // Hand an answer state to the state it is addressed to
    StateIndex deliver(StateIndex answer_index);

    // Read lookups and collect rule applications on first expansion
    void start_atomic(AtomicState& state);

    Substitution rule_answer(const AtomicState& state, const AnswerState& candidate) const;
    Substitution materialised_answer(const AtomicState& state, const AnswerState& candidate);
    void record_answer(StateIndex index, const Substitution& answer);

    std::vector<Substitution> expand_roles(const Substitution& answer, const VariableSet& role_vars) const;

public:
    explicit ResolutionTree(ResolutionContext context)
        : context_(context) {}

    ResolutionTree(const ResolutionTree&) = delete;
    ResolutionTree& operator=(const ResolutionTree&) = delete;

    StateIndex add_answer_state(Substitution sub, Unifier unifier, const InferenceRule* rule, StateIndex parent);

    /**
     * Atomic state resolving query with sub applied.
     */
    StateIndex add_atomic_state(const AtomicQuery& query, const Substitution& sub,
                                Unifier unifier, StateIndex parent);

    StateIndex add_cumulative_state(std::vector<AtomicQuery> subqueries, Substitution sub,
                                    Unifier unifier, StateIndex parent);

    ResolutionState& state(StateIndex index) { return states_.at(index.value); }
    const ResolutionState& state(StateIndex index) const { return states_.at(index.value); }

    std::size_t size() const { return states_.size(); }

    CycleGuard& guard() { return guard_; }
    const ResolutionContext& context() const { return context_; }

    /**
     * Next child of the state, or NO_STATE once exhausted. For an answer
     * state the child is whatever its target produces from the answer.
     */
    StateIndex generate_child(StateIndex index);

    /**
     * Decide where a consumed answer of an atomic state goes.
     *
     * Empty answers go nowhere. Rule-derived answers of queries needing role
     * expansion go to a RoleExpansionState whose parent is the atomic state
     * itself, so the widened answers are consumed and cached there. All
     * other answers go to the atomic state's parent.
     */
    StateIndex propagate_answer(StateIndex atomic_index, const AnswerState& candidate);

    /**
     * Finalise a child answer for an atomic state: merge, derive or
     * materialise, then record it in the cache. Returns empty for a dead
     * branch, in which case nothing is recorded.
     */
    Substitution consume_answer(StateIndex atomic_index, const AnswerState& candidate);

    // Unifier into the query's cache class, computed once per state
    const MultiUnifier& cache_unifier(StateIndex atomic_index);
};

} // namespace reasoner

#endif // REASONER_RESOLUTION_TREE_HPP
