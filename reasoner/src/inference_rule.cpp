#include <reasoner/inference_rule.hpp>
#include <reasoner/knowledge_base.hpp>
#include <sstream>
#include <stdexcept>

namespace reasoner {

InferenceRule::InferenceRule(std::string id, std::vector<Atom> body, Atom head, bool materialise)
    : id_(std::move(id))
    , body_(std::move(body))
    , head_(head.has_relation_var() ? head : head.with_relation_var(id_ + "_relation"))
    , materialise_(materialise)
    , declares_relation_var_(head.has_relation_var()) {
    if (body_.empty()) {
        throw std::invalid_argument("Rule " + id_ + " has an empty body");
    }
    for (const auto& rp : head_.players()) {
        if (!rp.has_role()) {
            throw std::invalid_argument("Rule " + id_ + " head player $" + rp.player + " has no role");
        }
    }
}

bool InferenceRule::requires_materialisation(const Atom& query_atom) const {
    return materialise_ || query_atom.has_relation_var() || declares_relation_var_ ||
           has_disconnected_head();
}

bool InferenceRule::has_disconnected_head() const {
    VariableSet body_vars;
    for (const auto& atom : body_) {
        auto vars = atom.variables();
        body_vars.insert(vars.begin(), vars.end());
    }
    for (const auto& var : head_.player_variables()) {
        if (body_vars.count(var) == 0) return true;
    }
    return false;
}

std::vector<AtomicQuery> InferenceRule::body_queries() const {
    std::vector<AtomicQuery> queries;
    queries.reserve(body_.size());
    for (const auto& atom : body_) {
        queries.emplace_back(atom);
    }
    return queries;
}

VariableSet InferenceRule::variables() const {
    VariableSet vars = head_.variables();
    for (const auto& atom : body_) {
        auto body_vars = atom.variables();
        vars.insert(body_vars.begin(), body_vars.end());
    }
    return vars;
}

namespace {

struct PartialUnifier {
    std::map<Variable, std::set<Variable>> mapping;
    std::map<Variable, ConceptId> constants;

    bool bind_constant(const Variable& var, const ConceptId& value) {
        auto [it, inserted] = constants.emplace(var, value);
        return inserted || it->second == value;
    }
};

// Assign query players to unused head players, one query player per level
void unify_players(const std::vector<RolePlayer>& head, const AtomicQuery& query, const Schema& schema,
                   std::size_t index, std::vector<bool>& used, const PartialUnifier& partial,
                   std::vector<Unifier>& out) {
    const auto& players = query.atom().players();
    if (index == players.size()) {
        out.emplace_back(partial.mapping, partial.constants);
        return;
    }

    const RolePlayer& qp = players[index];
    for (std::size_t j = 0; j < head.size(); ++j) {
        if (used[j]) continue;
        const RolePlayer& hp = head[j];
        if (qp.has_role() && !schema.is_subrole(hp.role, qp.role)) continue;

        PartialUnifier extended = partial;
        extended.mapping[hp.player].insert(qp.player);

        if (qp.has_role_var()) {
            auto bound = query.substitution().get(qp.role_var);
            if (bound) {
                if (!schema.is_subrole(hp.role, *bound)) continue;
            } else if (hp.has_role_var()) {
                extended.mapping[hp.role_var].insert(qp.role_var);
            } else if (!extended.bind_constant(qp.role_var, hp.role)) {
                continue;
            }
        }

        used[j] = true;
        unify_players(head, query, schema, index + 1, used, extended, out);
        used[j] = false;
    }
}

} // namespace

MultiUnifier InferenceRule::unifiers(const AtomicQuery& query, const Schema& schema) const {
    const Atom& atom = query.atom();
    if (atom.predicate() != head_.predicate() || atom.arity() > head_.arity()) {
        return MultiUnifier();
    }

    PartialUnifier initial;
    if (atom.has_relation_var()) {
        initial.mapping[head_.relation_var()].insert(atom.relation_var());
    }

    std::vector<bool> used(head_.arity(), false);
    std::vector<Unifier> found;
    unify_players(head_.players(), query, schema, 0, used, initial, found);
    return MultiUnifier(std::move(found));
}

std::string InferenceRule::to_string() const {
    std::ostringstream oss;
    oss << id_ << ": ";
    for (std::size_t i = 0; i < body_.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << body_[i].to_string();
    }
    oss << " -> " << head_.to_string();
    if (materialise_) oss << " [materialise]";
    return oss.str();
}

} // namespace reasoner
