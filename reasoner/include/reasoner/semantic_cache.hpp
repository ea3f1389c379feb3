#ifndef REASONER_SEMANTIC_CACHE_HPP
#define REASONER_SEMANTIC_CACHE_HPP

#include <reasoner/concurrent_hash_map.hpp>
#include <reasoner/indexed_answer_set.hpp>
#include <reasoner/knowledge_base.hpp>
#include <reasoner/query.hpp>
#include <reasoner/substitution.hpp>
#include <reasoner/unifier.hpp>
#include <array>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace reasoner {

/**
 * Answers of one query equivalence class, stored in the variable space of
 * the query that created the class.
 */
class CacheEntry {
private:
    const AtomicQuery query_;
    IndexedAnswerSet answers_;
    bool complete_ = false;
    mutable std::mutex mutex_;

public:
    explicit CacheEntry(AtomicQuery query) : query_(std::move(query)) {}

    const AtomicQuery& query() const { return query_; }
    const std::string& key() const { return query_.equivalence_key(); }

    bool add(const Substitution& answer) {
        std::lock_guard<std::mutex> lock(mutex_);
        return answers_.add(answer);
    }

    std::vector<Substitution> get(const Substitution& partial) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return answers_.get(partial);
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return answers_.size();
    }

    bool is_complete() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return complete_;
    }

    void mark_complete() {
        std::lock_guard<std::mutex> lock(mutex_);
        complete_ = true;
    }
};

using CacheEntryPtr = std::shared_ptr<CacheEntry>;

/**
 * Answer cache keyed by query equivalence class.
 *
 * Shared by every resolution running against the same store. The class
 * index is lock-free, each entry guards its own answers, and striped class
 * locks let callers make a probe-then-materialise sequence atomic.
 */
class SemanticCache {
private:
    static constexpr std::size_t NUM_CLASS_LOCKS = 64;

    KnowledgeBase& kb_;
    ConcurrentHashMap<std::string, CacheEntryPtr> classes_;
    std::array<std::mutex, NUM_CLASS_LOCKS> class_locks_;

    // First answer of the entry consistent with sub, in query's space
    Substitution search_entry(const CacheEntry& entry, const AtomicQuery& query,
                              const Substitution& sub) const;

    // Every answer of the entry consistent with sub, in query's space
    void collect_entry(const CacheEntry& entry, const AtomicQuery& query, const Substitution& sub,
                       std::vector<Substitution>& results, std::set<Substitution>& seen) const;

    MultiUnifier unifiers_to(const AtomicQuery& query, const CacheEntry& entry) const;

public:
    explicit SemanticCache(KnowledgeBase& kb) : kb_(kb) {}

    SemanticCache(const SemanticCache&) = delete;
    SemanticCache& operator=(const SemanticCache&) = delete;

    KnowledgeBase& knowledge_base() { return kb_; }

    /**
     * Record an answer of query and return the entry of its class.
     *
     * Without an entry the class is found or created. A fresh class takes
     * the answer as is, an existing one receives it translated through the
     * exact unifiers into its representative's variables. A supplied entry
     * must belong to the query's class; the supplied unifier (computed when
     * null) translates the answer. Empty answers are never recorded.
     */
    CacheEntryPtr record(const AtomicQuery& query, const Substitution& answer,
                         CacheEntryPtr entry = nullptr, const MultiUnifier* unifier = nullptr);

    /**
     * An existing answer of query consistent with sub, or empty.
     * Searches the class of query under sub, the general class of query,
     * then the store. Never writes.
     */
    Substitution find_answer(const AtomicQuery& query, const Substitution& sub) const;

    /**
     * Unifiers from query into its class representative. Trivial when the
     * class is not cached; throws UnifierError when no mapping exists.
     */
    MultiUnifier get_cache_unifier(const AtomicQuery& query) const;

    /**
     * Known answers of query: its own class, its general class and the
     * store. Store answers are explained as lookups.
     */
    std::vector<Substitution> get_answers(const AtomicQuery& query) const;

    // Mark every answer of query as known
    void ack_completeness(const AtomicQuery& query);

    // True if the class of query or its general class is complete
    bool is_complete(const AtomicQuery& query) const;

    /**
     * Lock serialising probe-then-write sequences on the query's class.
     */
    std::unique_lock<std::mutex> lock_class(const AtomicQuery& query);

    CacheEntryPtr entry(const AtomicQuery& query) const;

    // Number of classes
    std::size_t size() const { return classes_.size(); }

    std::size_t total_answers() const;

    // Not safe while resolutions are running
    void clear() { classes_.clear(); }
};

} // namespace reasoner

#endif // REASONER_SEMANTIC_CACHE_HPP
