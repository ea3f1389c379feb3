#include <reasoner/resolution_state.hpp>
#include <sstream>

namespace reasoner {

std::string ResolutionState::to_string() const {
    std::ostringstream oss;
    switch (kind()) {
        case StateKind::ANSWER: {
            const auto& state = as<AnswerState>();
            oss << "Answer" << state.substitution.to_string();
            if (state.rule) oss << " by " << state.rule->id();
            break;
        }
        case StateKind::ATOMIC:
            oss << "Atomic(" << as<AtomicState>().query.pattern() << ")";
            break;
        case StateKind::ROLE_EXPANSION:
            oss << "RoleExpansion" << substitution().to_string();
            break;
        case StateKind::RULE:
            oss << "Rule(" << as<RuleState>().rule->id() << ")";
            break;
        case StateKind::CUMULATIVE:
            oss << "Cumulative(" << as<CumulativeState>().subqueries.size() << " atoms)";
            break;
    }
    if (!is_top_state()) {
        oss << " -> " << parent_.value;
    }
    return oss.str();
}

} // namespace reasoner
