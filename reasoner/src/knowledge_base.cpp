#include <reasoner/knowledge_base.hpp>
#include <reasoner/debug_log.hpp>
#include <reasoner/errors.hpp>
#include <algorithm>
#include <stdexcept>

namespace reasoner {

void Schema::add_role(const std::string& role, const std::string& parent) {
    if (role.empty()) {
        throw std::invalid_argument("Role label must not be empty");
    }
    if (!parent.empty()) {
        for (const auto& ancestor : sups(parent)) {
            if (ancestor == role) {
                throw std::invalid_argument("Role hierarchy cycle: " + role + " below " + parent);
            }
        }
        parent_.emplace(parent, "");
    }
    parent_[role] = parent;
}

std::vector<std::string> Schema::sups(const std::string& role) const {
    std::vector<std::string> result{role};
    auto it = parent_.find(role);
    while (it != parent_.end() && !it->second.empty()) {
        result.push_back(it->second);
        it = parent_.find(it->second);
    }
    return result;
}

bool Schema::is_subrole(const std::string& sub, const std::string& sup) const {
    auto ancestors = sups(sub);
    return std::find(ancestors.begin(), ancestors.end(), sup) != ancestors.end();
}

namespace {

bool bind(std::map<Variable, ConceptId>& bindings, const Variable& var, const ConceptId& value) {
    auto [it, inserted] = bindings.emplace(var, value);
    return inserted || it->second == value;
}

// Backtracking assignment of query players to unused fact players
void match_players(const Schema& schema, const Fact& fact, const std::vector<RolePlayer>& players,
                   std::size_t index, std::vector<bool>& used,
                   const std::map<Variable, ConceptId>& bindings,
                   std::vector<std::map<Variable, ConceptId>>& out) {
    if (index == players.size()) {
        out.push_back(bindings);
        return;
    }

    const RolePlayer& rp = players[index];
    for (std::size_t j = 0; j < fact.players.size(); ++j) {
        if (used[j]) continue;
        const auto& [role, concept_id] = fact.players[j];
        if (rp.has_role() && !schema.is_subrole(role, rp.role)) continue;

        auto with_player = bindings;
        if (!bind(with_player, rp.player, concept_id)) continue;

        used[j] = true;
        if (!rp.has_role_var()) {
            match_players(schema, fact, players, index + 1, used, with_player, out);
        } else if (rp.has_role()) {
            if (bind(with_player, rp.role_var, rp.role)) {
                match_players(schema, fact, players, index + 1, used, with_player, out);
            }
        } else {
            for (const auto& sup : schema.sups(role)) {
                auto with_role = with_player;
                if (bind(with_role, rp.role_var, sup)) {
                    match_players(schema, fact, players, index + 1, used, with_role, out);
                }
            }
        }
        used[j] = false;
    }
}

std::vector<RoleAssignment> sorted_players(std::vector<RoleAssignment> players) {
    std::sort(players.begin(), players.end());
    return players;
}

} // namespace

ConceptId KnowledgeBase::insert_locked(const std::string& predicate, std::vector<RoleAssignment> players,
                                       bool inferred) {
    if (predicate.empty() || players.empty()) {
        throw std::invalid_argument("Fact must have a predicate and at least one role player");
    }

    auto key = std::make_pair(predicate, sorted_players(players));
    bool fresh = fact_keys_.insert(key).second;
    if (inferred && !fresh) {
        std::string description = predicate + "(";
        for (std::size_t i = 0; i < players.size(); ++i) {
            if (i > 0) description += ", ";
            description += players[i].first + ": " + players[i].second;
        }
        throw DuplicateMaterialisationError(description + ")");
    }

    std::size_t index = facts_.size();
    ConceptId id = "fact:" + std::to_string(index);
    facts_.push_back(Fact{id, predicate, std::move(players), inferred});
    by_predicate_[predicate].push_back(index);
    by_id_.emplace(id, index);
    if (inferred) {
        ++num_inferred_;
    }
    return id;
}

ConceptId KnowledgeBase::insert(const std::string& predicate, std::vector<RoleAssignment> players) {
    std::lock_guard<std::mutex> lock(mutex_);
    return insert_locked(predicate, std::move(players), false);
}

ConceptId KnowledgeBase::insert_inferred(const std::string& predicate, std::vector<RoleAssignment> players) {
    std::lock_guard<std::mutex> lock(mutex_);
    return insert_locked(predicate, std::move(players), true);
}

void KnowledgeBase::match_fact(const AtomicQuery& query, const Fact& fact,
                               std::vector<Substitution>& results, std::set<Substitution>& seen) const {
    const Atom& atom = query.atom();
    if (atom.arity() > fact.players.size()) return;

    std::map<Variable, ConceptId> initial = query.substitution().bindings();
    if (atom.has_relation_var() && !bind(initial, atom.relation_var(), fact.id)) return;

    std::vector<bool> used(fact.players.size(), false);
    std::vector<std::map<Variable, ConceptId>> matches;
    match_players(schema_, fact, atom.players(), 0, used, initial, matches);

    for (auto& bindings : matches) {
        Substitution answer(std::move(bindings));
        if (seen.insert(answer).second) {
            results.push_back(std::move(answer));
        }
    }
}

std::vector<Substitution> KnowledgeBase::match(const AtomicQuery& query) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Substitution> results;
    std::set<Substitution> seen;

    auto it = by_predicate_.find(query.atom().predicate());
    if (it == by_predicate_.end()) return results;

    for (std::size_t index : it->second) {
        match_fact(query, facts_[index], results, seen);
    }
    return results;
}

std::vector<Substitution> KnowledgeBase::materialise(const AtomicQuery& head, const Substitution& sub) {
    AtomicQuery grounded = AtomicQuery::atomic(head, sub);
    const Substitution& bound = grounded.substitution();
    const Atom& atom = head.atom();

    if (atom.has_relation_var() && bound.contains(atom.relation_var())) {
        DEBUG_LOG("materialise %s: relation already bound", grounded.pattern().c_str());
        return {};
    }

    std::vector<RoleAssignment> players;
    for (const auto& rp : atom.players()) {
        if (!rp.has_role()) {
            throw std::invalid_argument("Cannot materialise a role player without a role: " + atom.to_string());
        }
        auto value = bound.get(rp.player);
        if (!value) {
            DEBUG_LOG("materialise %s: player $%s unbound", grounded.pattern().c_str(), rp.player.c_str());
            return {};
        }
        players.emplace_back(rp.role, *value);
    }

    ConceptId id = insert_inferred(atom.predicate(), std::move(players));
    DEBUG_LOG("materialised %s as %s", grounded.pattern().c_str(), id.c_str());

    std::map<Variable, ConceptId> result = bound.bindings();
    if (atom.has_relation_var()) {
        result[atom.relation_var()] = id;
    }
    const Substitution roles = atom.role_substitution();
    for (const auto& [var, role] : roles.bindings()) {
        result.emplace(var, role);
    }
    return {Substitution(std::move(result))};
}

std::optional<Fact> KnowledgeBase::get_fact(const ConceptId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = by_id_.find(id);
    if (it == by_id_.end()) return std::nullopt;
    return facts_[it->second];
}

std::vector<Fact> KnowledgeBase::facts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return facts_;
}

std::size_t KnowledgeBase::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return facts_.size();
}

std::size_t KnowledgeBase::num_inferred() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return num_inferred_;
}

} // namespace reasoner
