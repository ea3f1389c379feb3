#ifndef REASONER_REASONER_HPP
#define REASONER_REASONER_HPP

#include <reasoner/atom.hpp>
#include <reasoner/inference_rule.hpp>
#include <reasoner/knowledge_base.hpp>
#include <reasoner/query.hpp>
#include <reasoner/resolution_iterator.hpp>
#include <reasoner/semantic_cache.hpp>
#include <reasoner/types.hpp>
#include <vector>

namespace reasoner {

/**
 * Entry point: rules and a semantic cache over one knowledge base.
 *
 * Rules must be added before resolution starts. Any number of threads may
 * resolve at once; each resolution owns its tree while the cache and the
 * store are shared.
 */
class Reasoner {
private:
    KnowledgeBase& kb_;
    SemanticCache cache_;
    std::vector<InferenceRule> rules_;
    bool infer_;
    std::size_t max_iterations_;

    ResolutionContext context() {
        return ResolutionContext{kb_, cache_, rules_, infer_};
    }

public:
    explicit Reasoner(KnowledgeBase& kb, bool infer = true,
                      std::size_t max_iterations = DEFAULT_MAX_ITERATIONS);

    /**
     * Add a rule. Cached answers may be incomplete under the new rule set,
     * so the cache is cleared.
     */
    void add_rule(InferenceRule rule);

    const std::vector<InferenceRule>& rules() const { return rules_; }

    void set_infer(bool infer) { infer_ = infer; }
    bool infer() const { return infer_; }

    void set_max_iterations(std::size_t max_iterations) { max_iterations_ = max_iterations; }
    std::size_t max_iterations() const { return max_iterations_; }

    SemanticCache& cache() { return cache_; }
    KnowledgeBase& knowledge_base() { return kb_; }

    ResolutionIterator iterator(const AtomicQuery& goal);
    ResolutionIterator iterator(const std::vector<Atom>& goal, const Substitution& sub = Substitution());

    std::vector<Substitution> resolve(const AtomicQuery& goal);
    std::vector<Substitution> resolve(const std::vector<Atom>& goal, const Substitution& sub = Substitution());

    void clear_cache() { cache_.clear(); }
};

} // namespace reasoner

#endif // REASONER_REASONER_HPP
