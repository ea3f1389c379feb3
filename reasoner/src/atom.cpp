#include <reasoner/atom.hpp>
#include <sstream>
#include <stdexcept>

namespace reasoner {

Atom::Atom(std::string predicate, std::vector<RolePlayer> players, Variable relation_var)
    : predicate_(std::move(predicate))
    , players_(std::move(players))
    , relation_var_(std::move(relation_var)) {
    if (predicate_.empty()) {
        throw std::invalid_argument("Atom must have a predicate");
    }
    if (players_.empty()) {
        throw std::invalid_argument("Atom must have at least one role player");
    }
    for (const auto& rp : players_) {
        if (rp.player.empty()) {
            throw std::invalid_argument("Role player of " + predicate_ + " has no variable");
        }
    }
}

Atom Atom::with_relation_var(const Variable& var) const {
    return Atom(predicate_, players_, var);
}

VariableSet Atom::variables() const {
    VariableSet vars = player_variables();
    if (has_relation_var()) {
        vars.insert(relation_var_);
    }
    for (const auto& rp : players_) {
        if (rp.has_role_var()) {
            vars.insert(rp.role_var);
        }
    }
    return vars;
}

VariableSet Atom::player_variables() const {
    VariableSet vars;
    for (const auto& rp : players_) {
        vars.insert(rp.player);
    }
    return vars;
}

Substitution Atom::role_substitution() const {
    std::map<Variable, ConceptId> roles;
    for (const auto& rp : players_) {
        if (rp.has_role_var() && rp.has_role()) {
            roles.emplace(rp.role_var, rp.role);
        }
    }
    return Substitution(std::move(roles));
}

std::string Atom::to_string() const {
    std::ostringstream oss;
    if (has_relation_var()) {
        oss << "$" << relation_var_ << " ";
    }
    oss << "(";
    for (std::size_t i = 0; i < players_.size(); ++i) {
        const auto& rp = players_[i];
        if (i > 0) oss << ", ";
        if (rp.has_role_var()) {
            oss << "$" << rp.role_var;
            if (rp.has_role()) oss << "/" << rp.role;
            oss << ": ";
        } else if (rp.has_role()) {
            oss << rp.role << ": ";
        }
        oss << "$" << rp.player;
    }
    oss << ") isa " << predicate_;
    return oss.str();
}

} // namespace reasoner
