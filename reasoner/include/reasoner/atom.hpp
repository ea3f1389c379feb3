#ifndef REASONER_ATOM_HPP
#define REASONER_ATOM_HPP

#include <reasoner/substitution.hpp>
#include <reasoner/types.hpp>
#include <string>
#include <vector>
#include <initializer_list>

namespace reasoner {

/**
 * One role player of a relation atom: "role: $player".
 * An empty role accepts any role. The optional role variable binds to the
 * role actually played.
 */
struct RolePlayer {
    std::string role;
    Variable player;
    Variable role_var;

    RolePlayer(std::string role_label, Variable player_var, Variable role_variable = "")
        : role(std::move(role_label)), player(std::move(player_var)), role_var(std::move(role_variable)) {}

    bool has_role() const { return !role.empty(); }
    bool has_role_var() const { return !role_var.empty(); }

    bool operator==(const RolePlayer& other) const {
        return role == other.role && player == other.player && role_var == other.role_var;
    }

    bool operator!=(const RolePlayer& other) const {
        return !(*this == other);
    }
};

/**
 * Relation atom: "$rel (role: $x, role: $y) isa predicate".
 * Role players are unordered. The relation variable is optional and binds
 * to the id of the matching fact.
 */
class Atom {
private:
    std::string predicate_;
    std::vector<RolePlayer> players_;
    Variable relation_var_;

public:
    Atom(std::string predicate, std::vector<RolePlayer> players, Variable relation_var = "");

    Atom(std::string predicate, std::initializer_list<RolePlayer> players, Variable relation_var = "")
        : Atom(std::move(predicate), std::vector<RolePlayer>(players), std::move(relation_var)) {}

    const std::string& predicate() const { return predicate_; }
    const std::vector<RolePlayer>& players() const { return players_; }
    std::size_t arity() const { return players_.size(); }

    const Variable& relation_var() const { return relation_var_; }
    bool has_relation_var() const { return !relation_var_.empty(); }

    // Same atom with a different relation variable
    Atom with_relation_var(const Variable& var) const;

    // Relation variable, player variables and role variables
    VariableSet variables() const;

    // Player variables only
    VariableSet player_variables() const;

    /**
     * Role variables of players with a concrete role, bound to that role.
     */
    Substitution role_substitution() const;

    bool operator==(const Atom& other) const {
        return predicate_ == other.predicate_ && relation_var_ == other.relation_var_ &&
               players_ == other.players_;
    }

    bool operator!=(const Atom& other) const {
        return !(*this == other);
    }

    std::string to_string() const;
};

} // namespace reasoner

#endif // REASONER_ATOM_HPP
