#include <reasoner/unifier.hpp>
#include <reasoner/errors.hpp>
#include <algorithm>
#include <sstream>

namespace reasoner {

bool Unifier::is_identity() const {
    if (!constants_.empty()) return false;
    for (const auto& [from, targets] : mapping_) {
        if (targets.size() != 1 || *targets.begin() != from) {
            return false;
        }
    }
    return true;
}

VariableSet Unifier::keys() const {
    VariableSet vars;
    for (const auto& [from, targets] : mapping_) {
        vars.insert(from);
    }
    return vars;
}

std::set<Variable> Unifier::targets(const Variable& var) const {
    auto it = mapping_.find(var);
    return (it != mapping_.end()) ? it->second : std::set<Variable>{};
}

Substitution Unifier::apply(const Substitution& sub) const {
    if (sub.empty() || empty()) return sub;

    std::map<Variable, ConceptId> unified;

    // Mapped variables first so that a renamed binding always wins over an
    // unmapped variable of the same name, independent of key order
    for (const auto& [var, value] : sub.bindings()) {
        auto it = mapping_.find(var);
        if (it == mapping_.end()) continue;
        for (const Variable& target : it->second) {
            auto [pos, inserted] = unified.emplace(target, value);
            if (!inserted && pos->second != value) {
                return Substitution();
            }
        }
    }

    for (const auto& [var, value] : sub.bindings()) {
        if (mapping_.count(var) > 0) continue;
        unified.emplace(var, value);
    }

    for (const auto& [var, value] : constants_) {
        auto [pos, inserted] = unified.emplace(var, value);
        if (!inserted && pos->second != value) {
            return Substitution();
        }
    }

    return Substitution(std::move(unified), sub.explanation());
}

Unifier Unifier::inverse() const {
    std::map<Variable, std::set<Variable>> inverted;
    for (const auto& [from, targets] : mapping_) {
        for (const Variable& target : targets) {
            inverted[target].insert(from);
        }
    }
    return Unifier(std::move(inverted));
}

Unifier Unifier::compose(const Unifier& other) const {
    std::map<Variable, std::set<Variable>> composed;
    for (const auto& [from, targets] : mapping_) {
        for (const Variable& target : targets) {
            auto next = other.targets(target);
            if (next.empty()) {
                composed[from].insert(target);
            } else {
                composed[from].insert(next.begin(), next.end());
            }
        }
    }

    std::map<Variable, ConceptId> constants = other.constants_;
    for (const auto& [var, value] : constants_) {
        auto next = other.targets(var);
        if (next.empty()) {
            constants.emplace(var, value);
        } else {
            for (const Variable& target : next) {
                constants.emplace(target, value);
            }
        }
    }

    return Unifier(std::move(composed), std::move(constants));
}

std::string Unifier::to_string() const {
    std::ostringstream oss;
    oss << "[";
    bool first = true;
    for (const auto& [from, targets] : mapping_) {
        for (const Variable& target : targets) {
            if (!first) oss << ", ";
            oss << "$" << from << "->$" << target;
            first = false;
        }
    }
    for (const auto& [var, value] : constants_) {
        if (!first) oss << ", ";
        oss << "$" << var << "=" << value;
        first = false;
    }
    oss << "]";
    return oss.str();
}

MultiUnifier::MultiUnifier(std::vector<Unifier> unifiers)
    : unifiers_(std::move(unifiers)) {
    std::sort(unifiers_.begin(), unifiers_.end());
    unifiers_.erase(std::unique(unifiers_.begin(), unifiers_.end()), unifiers_.end());
}

const Unifier& MultiUnifier::unifier() const {
    if (unifiers_.size() != 1) {
        throw UnifierError("expected a single unifier, found " + std::to_string(unifiers_.size()));
    }
    return unifiers_.front();
}

std::vector<Substitution> MultiUnifier::apply(const Substitution& sub) const {
    std::vector<Substitution> results;
    for (const auto& u : unifiers_) {
        Substitution translated = u.apply(sub);
        if (translated.empty()) continue;
        if (std::find(results.begin(), results.end(), translated) == results.end()) {
            results.push_back(std::move(translated));
        }
    }
    return results;
}

MultiUnifier MultiUnifier::inverse() const {
    std::vector<Unifier> inverted;
    inverted.reserve(unifiers_.size());
    for (const auto& u : unifiers_) {
        inverted.push_back(u.inverse());
    }
    return MultiUnifier(std::move(inverted));
}

std::string MultiUnifier::to_string() const {
    std::ostringstream oss;
    oss << "{";
    for (std::size_t i = 0; i < unifiers_.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << unifiers_[i].to_string();
    }
    oss << "}";
    return oss.str();
}

} // namespace reasoner
