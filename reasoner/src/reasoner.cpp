#include <reasoner/reasoner.hpp>
#include <reasoner/debug_log.hpp>

namespace reasoner {

Reasoner::Reasoner(KnowledgeBase& kb, bool infer, std::size_t max_iterations)
    : kb_(kb)
    , cache_(kb)
    , infer_(infer)
    , max_iterations_(max_iterations) {}

void Reasoner::add_rule(InferenceRule rule) {
    DEBUG_LOG("rule %s", rule.to_string().c_str());
    rules_.push_back(std::move(rule));
    cache_.clear();
}

ResolutionIterator Reasoner::iterator(const AtomicQuery& goal) {
    return ResolutionIterator(context(), goal, max_iterations_);
}

ResolutionIterator Reasoner::iterator(const std::vector<Atom>& goal, const Substitution& sub) {
    std::vector<AtomicQuery> queries;
    queries.reserve(goal.size());
    for (const auto& atom : goal) {
        queries.emplace_back(atom, sub);
    }
    return ResolutionIterator(context(), std::move(queries), max_iterations_);
}

std::vector<Substitution> Reasoner::resolve(const AtomicQuery& goal) {
    return iterator(goal).collect();
}

std::vector<Substitution> Reasoner::resolve(const std::vector<Atom>& goal, const Substitution& sub) {
    return iterator(goal, sub).collect();
}

} // namespace reasoner
