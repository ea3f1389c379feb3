#include <reasoner/semantic_cache.hpp>
#include <reasoner/debug_log.hpp>
#include <reasoner/errors.hpp>
#include <functional>

namespace reasoner {

MultiUnifier SemanticCache::unifiers_to(const AtomicQuery& query, const CacheEntry& entry) const {
    MultiUnifier unifiers = query.exact_unifiers(entry.query());
    if (unifiers.empty()) {
        throw UnifierError("no mapping from " + query.pattern() + " to class of " + entry.query().pattern());
    }
    return unifiers;
}

Substitution SemanticCache::search_entry(const CacheEntry& entry, const AtomicQuery& query,
                                         const Substitution& sub) const {
    const VariableSet vars = query.variables();
    const Substitution partial = sub.project(vars);

    for (const Unifier& u : unifiers_to(query, entry)) {
        Substitution index = u.apply(partial);
        if (!partial.empty() && index.empty()) continue;

        Unifier back = u.inverse();
        for (const auto& answer : entry.get(index)) {
            Substitution translated = back.apply(answer).project(vars);
            if (!translated.empty() && translated.subsumes(partial)) {
                return translated;
            }
        }
    }
    return Substitution();
}

void SemanticCache::collect_entry(const CacheEntry& entry, const AtomicQuery& query, const Substitution& sub,
                                  std::vector<Substitution>& results, std::set<Substitution>& seen) const {
    const VariableSet vars = query.variables();
    const Substitution partial = sub.project(vars);

    for (const Unifier& u : unifiers_to(query, entry)) {
        Substitution index = u.apply(partial);
        if (!partial.empty() && index.empty()) continue;

        Unifier back = u.inverse();
        for (const auto& answer : entry.get(index)) {
            Substitution translated = back.apply(answer).project(vars);
            if (translated.empty() || !translated.subsumes(partial)) continue;
            if (seen.insert(translated).second) {
                results.push_back(std::move(translated));
            }
        }
    }
}

CacheEntryPtr SemanticCache::record(const AtomicQuery& query, const Substitution& answer,
                                    CacheEntryPtr entry, const MultiUnifier* unifier) {
    if (answer.empty()) return entry;

    MultiUnifier translation = MultiUnifier::trivial();
    if (!entry) {
        auto [found, inserted] = classes_.insert_or_get(query.equivalence_key(), [&query]() {
            return std::make_shared<CacheEntry>(query);
        });
        entry = found;
        if (inserted) {
            DEBUG_LOG("cache: new class %s", entry->key().c_str());
        } else {
            translation = unifiers_to(query, *entry);
        }
    } else {
        if (entry->key() != query.equivalence_key()) {
            throw CacheInvariantError("entry of " + entry->query().pattern() + " used for " + query.pattern());
        }
        translation = unifier ? *unifier : unifiers_to(query, *entry);
    }

    const VariableSet class_vars = entry->query().variables();
    for (const auto& translated : translation.apply(answer)) {
        Substitution stored = translated.project(class_vars);
        if (stored.size() != class_vars.size()) continue;
        if (entry->add(stored)) {
            DEBUG_LOG("cache: %s += %s", entry->query().pattern().c_str(), stored.to_string().c_str());
        }
    }
    return entry;
}

Substitution SemanticCache::find_answer(const AtomicQuery& query, const Substitution& sub) const {
    if (sub.project(query.variables()).empty()) return Substitution();

    AtomicQuery subbed = AtomicQuery::atomic(query, sub);
    const Substitution& partial = subbed.substitution();

    if (auto own = classes_.find(subbed.equivalence_key())) {
        Substitution answer = search_entry(**own, subbed, partial);
        if (!answer.empty()) return answer;
    }

    AtomicQuery general = query.general();
    if (general.equivalence_key() != subbed.equivalence_key()) {
        if (auto parent = classes_.find(general.equivalence_key())) {
            Substitution answer = search_entry(**parent, general, partial);
            if (!answer.empty()) return answer;
        }
    }

    auto stored = kb_.match(subbed);
    if (!stored.empty()) {
        return stored.front().project(query.variables());
    }
    return Substitution();
}

MultiUnifier SemanticCache::get_cache_unifier(const AtomicQuery& query) const {
    auto found = classes_.find(query.equivalence_key());
    if (!found) return MultiUnifier::trivial();
    return unifiers_to(query, **found);
}

std::vector<Substitution> SemanticCache::get_answers(const AtomicQuery& query) const {
    std::vector<Substitution> results;
    std::set<Substitution> seen;

    if (auto own = classes_.find(query.equivalence_key())) {
        collect_entry(**own, query, query.substitution(), results, seen);
    }

    if (!query.substitution().empty()) {
        AtomicQuery general = query.general();
        if (auto parent = classes_.find(general.equivalence_key())) {
            collect_entry(**parent, general, query.substitution(), results, seen);
        }
    }

    const Explanation lookup = Explanation::lookup(query.pattern());
    for (const auto& answer : kb_.match(query)) {
        if (seen.insert(answer).second) {
            results.push_back(answer.explain(lookup));
        }
    }
    return results;
}

void SemanticCache::ack_completeness(const AtomicQuery& query) {
    auto found = classes_.insert_or_get(query.equivalence_key(), [&query]() {
        return std::make_shared<CacheEntry>(query);
    });
    found.first->mark_complete();
    DEBUG_LOG("cache: %s complete", query.pattern().c_str());
}

bool SemanticCache::is_complete(const AtomicQuery& query) const {
    auto own = classes_.find(query.equivalence_key());
    if (own && (*own)->is_complete()) return true;

    if (query.substitution().empty()) return false;
    auto parent = classes_.find(query.general().equivalence_key());
    return parent && (*parent)->is_complete();
}

std::unique_lock<std::mutex> SemanticCache::lock_class(const AtomicQuery& query) {
    std::size_t stripe = std::hash<std::string>{}(query.equivalence_key()) % NUM_CLASS_LOCKS;
    return std::unique_lock<std::mutex>(class_locks_[stripe]);
}

CacheEntryPtr SemanticCache::entry(const AtomicQuery& query) const {
    auto found = classes_.find(query.equivalence_key());
    return found ? *found : CacheEntryPtr();
}

std::size_t SemanticCache::total_answers() const {
    std::size_t total = 0;
    classes_.for_each([&total](const std::string&, const CacheEntryPtr& entry) {
        total += entry->size();
    });
    return total;
}

} // namespace reasoner
