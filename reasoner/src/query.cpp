#include <reasoner/query.hpp>
#include <reasoner/canonicalization.hpp>
#include <map>
#include <vector>

namespace reasoner {

AtomicQuery::AtomicQuery(Atom atom, const Substitution& sub)
    : atom_(std::move(atom))
    , substitution_(sub.project(atom_.variables())) {
    key_ = Canonicalizer().canonicalize(atom_, substitution_).canonical_form.to_string();
}

AtomicQuery AtomicQuery::atomic(const AtomicQuery& q, const Substitution& sub) {
    if (sub.empty()) return q;

    std::map<Variable, ConceptId> bindings = q.substitution_.bindings();
    for (const auto& [var, value] : sub.bindings()) {
        bindings.emplace(var, value);
    }
    return AtomicQuery(q.atom_, Substitution(std::move(bindings)));
}

std::string AtomicQuery::pattern() const {
    if (substitution_.empty()) {
        return atom_.to_string();
    }
    return atom_.to_string() + "; " + substitution_.to_string();
}

VariableSet AtomicQuery::role_expansion_variables() const {
    VariableSet vars;
    for (const auto& rp : atom_.players()) {
        if (!rp.has_role() && rp.has_role_var() && !substitution_.contains(rp.role_var)) {
            vars.insert(rp.role_var);
        }
    }
    return vars;
}

namespace {

/**
 * Bijective variable assignment between two queries.
 */
struct VariableBijection {
    std::map<Variable, Variable> forward;
    std::map<Variable, Variable> backward;

    // Map from -> to, checking consistency in both directions
    bool assign(const Variable& from, const Variable& to) {
        auto f = forward.find(from);
        if (f != forward.end()) return f->second == to;
        auto b = backward.find(to);
        if (b != backward.end()) return b->second == from;
        forward.emplace(from, to);
        backward.emplace(to, from);
        return true;
    }
};

class ExactUnification {
private:
    const AtomicQuery& from_;
    const AtomicQuery& to_;
    std::vector<bool> used_;
    std::vector<Unifier> found_;

    // Absent on both sides, or both present with the same binding state
    bool term_matches(const Variable& a, const Variable& b, VariableBijection& assignment) const {
        if (a.empty() || b.empty()) return a.empty() && b.empty();
        if (from_.substitution().get(a) != to_.substitution().get(b)) return false;
        return assignment.assign(a, b);
    }

    bool player_matches(const RolePlayer& a, const RolePlayer& b, VariableBijection& assignment) const {
        if (a.role != b.role) return false;
        return term_matches(a.role_var, b.role_var, assignment) &&
               term_matches(a.player, b.player, assignment);
    }

    void search(std::size_t index, const VariableBijection& assignment) {
        const auto& players = from_.atom().players();
        if (index == players.size()) {
            std::map<Variable, std::set<Variable>> mapping;
            for (const auto& [from, to] : assignment.forward) {
                mapping[from].insert(to);
            }
            found_.emplace_back(std::move(mapping));
            return;
        }

        const auto& candidates = to_.atom().players();
        for (std::size_t i = 0; i < candidates.size(); ++i) {
            if (used_[i]) continue;
            VariableBijection extended = assignment;
            if (!player_matches(players[index], candidates[i], extended)) continue;
            used_[i] = true;
            search(index + 1, extended);
            used_[i] = false;
        }
    }

public:
    ExactUnification(const AtomicQuery& from, const AtomicQuery& to)
        : from_(from), to_(to), used_(to.atom().arity(), false) {}

    MultiUnifier run() {
        const Atom& a = from_.atom();
        const Atom& b = to_.atom();
        if (a.predicate() != b.predicate() || a.arity() != b.arity()) {
            return MultiUnifier();
        }

        VariableBijection initial;
        if (!term_matches(a.relation_var(), b.relation_var(), initial)) {
            return MultiUnifier();
        }
        search(0, initial);
        return MultiUnifier(std::move(found_));
    }
};

} // namespace

MultiUnifier AtomicQuery::exact_unifiers(const AtomicQuery& other) const {
    if (!is_equivalent(other)) {
        return MultiUnifier();
    }
    return ExactUnification(*this, other).run();
}

} // namespace reasoner
