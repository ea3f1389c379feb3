#ifndef REASONER_RESOLUTION_STATE_HPP
#define REASONER_RESOLUTION_STATE_HPP

#include <reasoner/inference_rule.hpp>
#include <reasoner/query.hpp>
#include <reasoner/semantic_cache.hpp>
#include <reasoner/substitution.hpp>
#include <reasoner/unifier.hpp>
#include <reasoner/types.hpp>
#include <optional>
#include <utility>
#include <string>
#include <variant>
#include <vector>

namespace reasoner {

// Order matches the alternatives of ResolutionState::Data
enum class StateKind {
    ANSWER,
    ATOMIC,
    ROLE_EXPANSION,
    RULE,
    CUMULATIVE
};

/**
 * Terminal carrier of one answer, addressed to the parent of the state.
 * rule is set when the answer was derived by that rule.
 */
struct AnswerState {
    Substitution substitution;
    Unifier unifier;
    const InferenceRule* rule = nullptr;
};

/**
 * One way of applying a rule to an atomic query.
 */
struct RuleApplication {
    const InferenceRule* rule;
    Unifier unifier;       // Rule head -> query variables
    Substitution partial;  // Query bindings in rule variables
};

/**
 * Resolver of one atomic query.
 *
 * Children are generated lazily: lookup answers first, then one rule state
 * per applicable rule. cache_unifier is computed on first use and fixed
 * afterwards, as is cache_entry once the first answer is recorded.
 */
struct AtomicState {
    AtomicState(AtomicQuery q, Substitution sub, Unifier u)
        : query(std::move(q)), substitution(std::move(sub)), unifier(std::move(u)) {}

    AtomicQuery query;
    Substitution substitution;
    Unifier unifier;

    std::optional<MultiUnifier> cache_unifier;
    CacheEntryPtr cache_entry;

    bool started = false;
    bool guarded = false;  // Holds a cycle guard slot
    std::vector<Substitution> lookup_answers;
    std::size_t next_lookup = 0;
    std::vector<RuleApplication> rule_applications;
    std::size_t next_rule = 0;
};

/**
 * Widens a rule-derived answer over the super-roles of its role variables
 * and hands each widening back to the originating atomic state.
 */
struct RoleExpansionState {
    Substitution substitution;
    Unifier unifier;
    std::vector<Substitution> expansions;
    std::size_t next = 0;
};

struct RuleState {
    const InferenceRule* rule;
    Substitution substitution;  // Partial binding in rule variables
    Unifier unifier;            // Rule head -> parent query variables
    bool visited = false;
};

/**
 * Left-to-right conjunction. Answers of the first subquery are merged into
 * substitution and the rest is resolved by a new cumulative state.
 */
struct CumulativeState {
    std::vector<AtomicQuery> subqueries;
    Substitution substitution;
    Unifier unifier;
    bool visited = false;
};

/**
 * Node of a resolution tree.
 * The parent is an index into the owning tree's arena, NO_STATE for the
 * top state.
 */
class ResolutionState {
public:
    using Data = std::variant<AnswerState, AtomicState, RoleExpansionState, RuleState, CumulativeState>;

private:
    StateIndex parent_;
    Data data_;

public:
    ResolutionState(StateIndex parent, Data data)
        : parent_(parent), data_(std::move(data)) {}

    StateIndex parent() const { return parent_; }
    bool is_top_state() const { return parent_ == NO_STATE; }

    StateKind kind() const { return static_cast<StateKind>(data_.index()); }
    bool is_answer_state() const { return kind() == StateKind::ANSWER; }

    template<typename T>
    T& as() { return std::get<T>(data_); }

    template<typename T>
    const T& as() const { return std::get<T>(data_); }

    const Substitution& substitution() const {
        return std::visit([](const auto& state) -> const Substitution& { return state.substitution; }, data_);
    }

    const Unifier& unifier() const {
        return std::visit([](const auto& state) -> const Unifier& { return state.unifier; }, data_);
    }

    std::string to_string() const;
};

} // namespace reasoner

#endif // REASONER_RESOLUTION_STATE_HPP
