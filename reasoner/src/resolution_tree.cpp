#include <reasoner/resolution_tree.hpp>
#include <reasoner/debug_log.hpp>
#include <reasoner/errors.hpp>

namespace reasoner {

void CycleGuard::leave(const AtomicQuery& query) {
    if (in_flight_.erase(query.equivalence_key()) == 0) {
        throw CycleGuardError("query not in flight: " + query.pattern());
    }
}

namespace {

// Query bindings carried over into rule variables; nullopt on a conflict
std::optional<Substitution> rule_partial(const Unifier& unifier, const Substitution& query_sub) {
    std::map<Variable, ConceptId> partial;
    for (const auto& [head_var, query_vars] : unifier.mapping()) {
        for (const Variable& query_var : query_vars) {
            auto value = query_sub.get(query_var);
            if (!value) continue;
            auto [it, inserted] = partial.emplace(head_var, *value);
            if (!inserted && it->second != *value) {
                return std::nullopt;
            }
        }
    }
    for (const auto& [query_var, role] : unifier.constants()) {
        auto value = query_sub.get(query_var);
        if (value && *value != role) {
            return std::nullopt;
        }
    }
    return Substitution(std::move(partial));
}

} // namespace

StateIndex ResolutionTree::add(StateIndex parent, ResolutionState::Data data) {
    StateIndex index(states_.size());
    states_.emplace_back(parent, std::move(data));
    return index;
}

StateIndex ResolutionTree::add_answer_state(Substitution sub, Unifier unifier,
                                            const InferenceRule* rule, StateIndex parent) {
    return add(parent, AnswerState{std::move(sub), std::move(unifier), rule});
}

StateIndex ResolutionTree::add_atomic_state(const AtomicQuery& query, const Substitution& sub,
                                            Unifier unifier, StateIndex parent) {
    AtomicQuery subbed = AtomicQuery::atomic(query, sub);
    Substitution bindings = subbed.substitution();
    return add(parent, AtomicState{std::move(subbed), std::move(bindings), std::move(unifier)});
}

StateIndex ResolutionTree::add_cumulative_state(std::vector<AtomicQuery> subqueries, Substitution sub,
                                                Unifier unifier, StateIndex parent) {
    if (subqueries.empty()) {
        throw std::invalid_argument("Conjunction must have at least one atom");
    }
    return add(parent, CumulativeState{std::move(subqueries), std::move(sub), std::move(unifier), false});
}

StateIndex ResolutionTree::generate_child(StateIndex index) {
    switch (state(index).kind()) {
        case StateKind::ANSWER:
            return deliver(index);
        case StateKind::ATOMIC:
            return next_atomic_child(index);
        case StateKind::ROLE_EXPANSION:
            return next_role_expansion_child(index);
        case StateKind::RULE:
            return next_rule_child(index);
        case StateKind::CUMULATIVE:
            return next_cumulative_child(index);
    }
    return NO_STATE;
}

void ResolutionTree::start_atomic(AtomicState& atomic) {
    atomic.started = true;
    atomic.lookup_answers = context_.cache.get_answers(atomic.query);

    if (!context_.infer || context_.rules.empty()) return;
    if (context_.cache.is_complete(atomic.query)) {
        DEBUG_LOG("atomic %s: complete in cache", atomic.query.pattern().c_str());
        return;
    }
    if (!guard_.enter(atomic.query)) {
        DEBUG_LOG("atomic %s: already in flight, lookups only", atomic.query.pattern().c_str());
        return;
    }
    atomic.guarded = true;

    const Schema& schema = context_.kb.schema();
    for (const auto& rule : context_.rules) {
        for (const Unifier& u : rule.unifiers(atomic.query, schema)) {
            auto partial = rule_partial(u, atomic.query.substitution());
            if (!partial) continue;
            atomic.rule_applications.push_back(RuleApplication{&rule, u, std::move(*partial)});
        }
    }
}

StateIndex ResolutionTree::next_atomic_child(StateIndex index) {
    auto& atomic = state(index).as<AtomicState>();
    if (!atomic.started) {
        start_atomic(atomic);
    }

    if (atomic.next_lookup < atomic.lookup_answers.size()) {
        Substitution answer = atomic.lookup_answers[atomic.next_lookup++];
        return add_answer_state(std::move(answer), Unifier(), nullptr, index);
    }

    if (atomic.next_rule < atomic.rule_applications.size()) {
        const RuleApplication& app = atomic.rule_applications[atomic.next_rule++];
        return add(index, RuleState{app.rule, app.partial, app.unifier, false});
    }

    if (atomic.guarded) {
        guard_.leave(atomic.query);
        atomic.guarded = false;
    }
    return NO_STATE;
}

StateIndex ResolutionTree::next_role_expansion_child(StateIndex index) {
    auto& expansion = state(index).as<RoleExpansionState>();
    if (expansion.next >= expansion.expansions.size()) {
        return NO_STATE;
    }
    Substitution answer = expansion.expansions[expansion.next++];
    return add_answer_state(std::move(answer), expansion.unifier, nullptr, state(index).parent());
}

StateIndex ResolutionTree::next_rule_child(StateIndex index) {
    auto& rule_state = state(index).as<RuleState>();
    if (rule_state.visited) {
        return NO_STATE;
    }
    rule_state.visited = true;

    std::vector<AtomicQuery> body = rule_state.rule->body_queries();
    Substitution partial = rule_state.substitution;
    if (body.size() == 1) {
        return add_atomic_state(body.front(), partial, Unifier(), index);
    }
    return add_cumulative_state(std::move(body), std::move(partial), Unifier(), index);
}

StateIndex ResolutionTree::next_cumulative_child(StateIndex index) {
    auto& cumulative = state(index).as<CumulativeState>();
    if (cumulative.visited) {
        return NO_STATE;
    }
    cumulative.visited = true;
    AtomicQuery first = cumulative.subqueries.front();
    Substitution sub = cumulative.substitution;
    return add_atomic_state(first, sub, Unifier(), index);
}

StateIndex ResolutionTree::deliver(StateIndex answer_index) {
    const AnswerState answer = state(answer_index).as<AnswerState>();
    const StateIndex target = state(answer_index).parent();
    if (target == NO_STATE) {
        return NO_STATE;
    }

    switch (state(target).kind()) {
        case StateKind::ATOMIC: {
            Substitution consumed = consume_answer(target, answer);
            return propagate_answer(target, AnswerState{std::move(consumed), answer.unifier, answer.rule});
        }
        case StateKind::RULE: {
            const auto& rule_state = state(target).as<RuleState>();
            return add_answer_state(answer.substitution, rule_state.unifier, rule_state.rule,
                                    state(target).parent());
        }
        case StateKind::CUMULATIVE: {
            const auto& cumulative = state(target).as<CumulativeState>();
            Substitution merged = merge(cumulative.substitution, answer.substitution);
            if (merged.empty()) {
                return NO_STATE;
            }
            const StateIndex parent = state(target).parent();
            if (cumulative.subqueries.size() == 1) {
                return add_answer_state(std::move(merged), cumulative.unifier, nullptr, parent);
            }
            std::vector<AtomicQuery> rest(cumulative.subqueries.begin() + 1, cumulative.subqueries.end());
            Unifier unifier = cumulative.unifier;
            return add_cumulative_state(std::move(rest), std::move(merged), std::move(unifier), parent);
        }
        case StateKind::ANSWER:
        case StateKind::ROLE_EXPANSION:
            break;
    }
    throw ResolutionError("answer addressed to " + state(target).to_string());
}

std::vector<Substitution> ResolutionTree::expand_roles(const Substitution& answer,
                                                       const VariableSet& role_vars) const {
    std::vector<Substitution> expansions{answer};
    const Schema& schema = context_.kb.schema();

    for (const Variable& var : role_vars) {
        auto role = answer.get(var);
        if (!role) continue;

        std::vector<Substitution> widened;
        for (const auto& partial : expansions) {
            for (const auto& sup : schema.sups(*role)) {
                std::map<Variable, ConceptId> bindings = partial.bindings();
                bindings[var] = sup;
                widened.emplace_back(std::move(bindings), partial.explanation());
            }
        }
        expansions = std::move(widened);
    }
    return expansions;
}

StateIndex ResolutionTree::propagate_answer(StateIndex atomic_index, const AnswerState& candidate) {
    if (candidate.substitution.empty()) {
        return NO_STATE;
    }

    const auto& atomic = state(atomic_index).as<AtomicState>();
    if (candidate.rule != nullptr && atomic.query.requires_role_expansion()) {
        auto expansions = expand_roles(candidate.substitution, atomic.query.role_expansion_variables());
        Unifier unifier = atomic.unifier;
        return add(atomic_index, RoleExpansionState{candidate.substitution, std::move(unifier),
                                                    std::move(expansions), 0});
    }
    return add_answer_state(candidate.substitution, atomic.unifier, nullptr, state(atomic_index).parent());
}

Substitution ResolutionTree::rule_answer(const AtomicState& atomic, const AnswerState& candidate) const {
    const AtomicQuery& query = atomic.query;
    const InferenceRule& rule = *candidate.rule;

    Substitution answer = candidate.unifier.apply(merge(candidate.substitution, rule.head_role_substitution()));
    if (answer.empty()) return answer;

    answer = merge(answer, query.substitution()).project(query.variables());
    if (answer.empty()) return answer;
    return answer.explain(Explanation::rule(query.pattern(), rule.id()));
}

Substitution ResolutionTree::materialised_answer(const AtomicState& atomic, const AnswerState& candidate) {
    const AtomicQuery& query = atomic.query;
    const InferenceRule& rule = *candidate.rule;
    const Unifier& unifier = candidate.unifier;
    const Substitution& base = candidate.substitution;
    SemanticCache& cache = context_.cache;

    // Probe and write must not interleave with another writer of this head
    AtomicQuery rule_head = rule.head_query();
    auto lock = cache.lock_class(rule_head);

    AtomicQuery subbed = AtomicQuery::atomic(query, base);
    AtomicQuery head = AtomicQuery::atomic(rule_head, base);

    const VariableSet vars = query.variables().size() < head.variables().size()
        ? unifier.keys()
        : head.variables();

    const bool head_equivalent = subbed.is_equivalent(head);

    Substitution head_answer = unifier.apply(cache.find_answer(head, base).project(vars));
    Substitution query_answer = (head_answer.empty() && head_equivalent)
        ? cache.find_answer(query, unifier.apply(base))
        : Substitution();

    const Explanation explanation = Explanation::rule(query.pattern(), rule.id());
    Substitution answer;
    if (head_answer.empty() && query_answer.empty()) {
        auto materialised = context_.kb.materialise(head, base);
        if (materialised.empty()) {
            DEBUG_LOG("rule %s: materialisation of %s failed", rule.id().c_str(), head.pattern().c_str());
            return Substitution();
        }
        const Substitution& fact = materialised.front();
        if (!head_equivalent) {
            cache.record(head, fact.explain(explanation));
        }
        answer = unifier.apply(fact.project(vars));
    } else {
        DEBUG_LOG("rule %s: %s already known", rule.id().c_str(), head.pattern().c_str());
        answer = head_answer.empty() ? query_answer : head_answer;
    }

    if (answer.empty()) return answer;
    answer = merge(answer, query.substitution()).project(query.variables());
    if (answer.empty()) return answer;
    return answer.explain(explanation);
}

const MultiUnifier& ResolutionTree::cache_unifier(StateIndex atomic_index) {
    auto& atomic = state(atomic_index).as<AtomicState>();
    if (!atomic.cache_unifier) {
        atomic.cache_unifier = context_.cache.get_cache_unifier(atomic.query);
    }
    return *atomic.cache_unifier;
}

void ResolutionTree::record_answer(StateIndex index, const Substitution& answer) {
    auto& atomic = state(index).as<AtomicState>();
    if (!atomic.cache_entry) {
        atomic.cache_entry = context_.cache.record(atomic.query, answer);
        return;
    }
    const MultiUnifier& unifier = cache_unifier(index);
    context_.cache.record(atomic.query, answer, atomic.cache_entry, &unifier);
}

Substitution ResolutionTree::consume_answer(StateIndex atomic_index, const AnswerState& candidate) {
    const auto& atomic = state(atomic_index).as<AtomicState>();
    const Substitution& base = candidate.substitution;
    if (base.empty()) {
        return Substitution();
    }

    Substitution answer;
    if (candidate.rule == nullptr) {
        answer = merge(base, atomic.query.substitution()).project(atomic.query.variables());
    } else if (candidate.rule->requires_materialisation(atomic.query.atom())) {
        answer = materialised_answer(atomic, candidate);
    } else {
        answer = rule_answer(atomic, candidate);
    }

    if (answer.empty()) {
        return answer;
    }
    record_answer(atomic_index, answer);
    return answer;
}

} // namespace reasoner
