#ifndef REASONER_KNOWLEDGE_BASE_HPP
#define REASONER_KNOWLEDGE_BASE_HPP

#include <reasoner/query.hpp>
#include <reasoner/substitution.hpp>
#include <reasoner/types.hpp>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace reasoner {

/**
 * Role hierarchy. A role without a registered parent is a root.
 */
class Schema {
private:
    std::map<std::string, std::string> parent_;

public:
    /**
     * Register a role, optionally below a parent role.
     * Throws std::invalid_argument if the parent link would close a cycle.
     */
    void add_role(const std::string& role, const std::string& parent = "");

    bool has_role(const std::string& role) const {
        return parent_.count(role) > 0;
    }

    // The role itself first, then its ancestors up to the root
    std::vector<std::string> sups(const std::string& role) const;

    // Reflexive
    bool is_subrole(const std::string& sub, const std::string& sup) const;
};

using RoleAssignment = std::pair<std::string, ConceptId>;

struct Fact {
    ConceptId id;
    std::string predicate;
    std::vector<RoleAssignment> players;
    bool inferred = false;
};

/**
 * In-memory fact store: base facts plus facts written by materialising rules.
 *
 * Thread-safe. The schema is expected to be set up before resolution starts.
 */
class KnowledgeBase {
private:
    Schema schema_;
    std::vector<Fact> facts_;
    std::map<std::string, std::vector<std::size_t>> by_predicate_;
    std::map<ConceptId, std::size_t> by_id_;
    std::set<std::pair<std::string, std::vector<RoleAssignment>>> fact_keys_;
    std::size_t num_inferred_ = 0;
    mutable std::mutex mutex_;

    ConceptId insert_locked(const std::string& predicate, std::vector<RoleAssignment> players, bool inferred);

    void match_fact(const AtomicQuery& query, const Fact& fact,
                    std::vector<Substitution>& results, std::set<Substitution>& seen) const;

public:
    KnowledgeBase() = default;

    KnowledgeBase(const KnowledgeBase&) = delete;
    KnowledgeBase& operator=(const KnowledgeBase&) = delete;

    Schema& schema() { return schema_; }
    const Schema& schema() const { return schema_; }

    /**
     * Insert a base fact and return its id.
     */
    ConceptId insert(const std::string& predicate, std::vector<RoleAssignment> players);

    /**
     * Insert a derived fact. Throws DuplicateMaterialisationError if an
     * identical fact (same predicate, same role players) already exists.
     */
    ConceptId insert_inferred(const std::string& predicate, std::vector<RoleAssignment> players);

    /**
     * All bindings of the query's variables to stored facts.
     * Query players map injectively onto fact players whose role equals or
     * specialises the query role. Role variables of players without a role
     * label range over the played role and its super-roles.
     */
    std::vector<Substitution> match(const AtomicQuery& query) const;

    /**
     * Write the fact described by the head under sub and return its binding.
     * Empty when the head cannot be grounded (unbound player or relation
     * variable already bound).
     */
    std::vector<Substitution> materialise(const AtomicQuery& head, const Substitution& sub);

    std::optional<Fact> get_fact(const ConceptId& id) const;
    std::vector<Fact> facts() const;

    std::size_t size() const;
    std::size_t num_inferred() const;
};

} // namespace reasoner

#endif // REASONER_KNOWLEDGE_BASE_HPP
