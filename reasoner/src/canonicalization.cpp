#include <reasoner/canonicalization.hpp>
#include <reasoner/debug_log.hpp>
#include <algorithm>
#include <numeric>
#include <sstream>

namespace reasoner {

std::string CanonicalForm::to_string() const {
    std::ostringstream oss;
    oss << predicate << "[" << relation << "](";
    for (std::size_t i = 0; i < players.size(); ++i) {
        oss << "[";
        for (std::size_t j = 0; j < players[i].size(); ++j) {
            oss << players[i][j];
            if (j < players[i].size() - 1) oss << ",";
        }
        oss << "]";
        if (i < players.size() - 1) oss << ", ";
    }
    oss << ")";
    return oss.str();
}

namespace {

// Canonical terms for one player ordering, numbering unbound variables by
// first appearance
struct OrderedTerms {
    std::string relation;
    std::vector<std::vector<std::string>> players;
    VariableMapping mapping;
};

OrderedTerms number_terms(const Atom& atom, const Substitution& sub,
                          const std::vector<std::size_t>& order) {
    OrderedTerms result;
    auto& numbering = result.mapping.original_to_canonical;
    auto& alphabet = result.mapping.canonical_to_original;

    auto term = [&](const Variable& var) -> std::string {
        if (var.empty()) return "";
        if (auto value = sub.get(var)) return "=" + *value;
        auto [it, inserted] = numbering.emplace(var, alphabet.size());
        if (inserted) {
            alphabet.push_back(var);
        }
        return "$" + std::to_string(it->second);
    };

    result.relation = term(atom.relation_var());
    for (std::size_t idx : order) {
        const RolePlayer& rp = atom.players()[idx];
        std::string role_term = term(rp.role_var);
        std::string player_term = term(rp.player);
        result.players.push_back({rp.role, role_term, player_term});
    }
    return result;
}

} // namespace

CanonicalizationResult Canonicalizer::canonicalize(const Atom& atom, const Substitution& sub) const {
    std::vector<std::size_t> order(atom.arity());
    std::iota(order.begin(), order.end(), 0);

    OrderedTerms best = number_terms(atom, sub, order);
    while (std::next_permutation(order.begin(), order.end())) {
        OrderedTerms candidate = number_terms(atom, sub, order);
        if (candidate.players < best.players) {
            best = std::move(candidate);
        }
    }

    CanonicalizationResult result;
    result.canonical_form.predicate = atom.predicate();
    result.canonical_form.relation = std::move(best.relation);
    result.canonical_form.players = std::move(best.players);
    result.canonical_form.variable_count = best.mapping.canonical_to_original.size();
    result.variable_mapping = std::move(best.mapping);

    DEBUG_LOG("canonicalize %s -> %s", atom.to_string().c_str(),
              result.canonical_form.to_string().c_str());
    return result;
}

} // namespace reasoner
