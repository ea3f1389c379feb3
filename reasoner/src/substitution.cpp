#include <reasoner/substitution.hpp>
#include <sstream>

namespace reasoner {

std::string Explanation::to_string() const {
    std::ostringstream oss;
    if (kind == RULE) {
        oss << "Rule(" << rule_id << ", " << pattern << ")";
    } else {
        oss << "Lookup(" << pattern << ")";
    }
    return oss.str();
}

VariableSet Substitution::variables() const {
    VariableSet vars;
    for (const auto& [var, value] : bindings_) {
        vars.insert(var);
    }
    return vars;
}

Substitution Substitution::project(const VariableSet& vars) const {
    std::map<Variable, ConceptId> projected;
    for (const auto& [var, value] : bindings_) {
        if (vars.count(var) > 0) {
            projected.emplace(var, value);
        }
    }
    return Substitution(std::move(projected), explanation_);
}

bool Substitution::subsumes(const Substitution& other) const {
    for (const auto& [var, value] : other.bindings_) {
        auto it = bindings_.find(var);
        if (it == bindings_.end() || it->second != value) {
            return false;
        }
    }
    return true;
}

std::size_t Substitution::hash() const {
    // FNV-1a over the ordered bindings
    std::size_t h = 14695981039346656037ULL;
    std::hash<std::string> hasher;
    for (const auto& [var, value] : bindings_) {
        h ^= hasher(var);
        h *= 1099511628211ULL;
        h ^= hasher(value);
        h *= 1099511628211ULL;
    }
    return h;
}

std::string Substitution::to_string() const {
    std::ostringstream oss;
    oss << "{";
    bool first = true;
    for (const auto& [var, value] : bindings_) {
        if (!first) oss << ", ";
        oss << "$" << var << "=" << value;
        first = false;
    }
    oss << "}";
    return oss.str();
}

Substitution merge(const Substitution& a, const Substitution& b) {
    if (b.empty()) return a;
    if (a.empty()) return b;

    std::map<Variable, ConceptId> merged = a.bindings();
    for (const auto& [var, value] : b.bindings()) {
        auto [it, inserted] = merged.emplace(var, value);
        if (!inserted && it->second != value) {
            return Substitution();  // Inconsistent binding
        }
    }

    const auto& explanation = a.explanation() ? a.explanation() : b.explanation();
    return Substitution(std::move(merged), explanation);
}

} // namespace reasoner
