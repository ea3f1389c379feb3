#ifndef REASONER_CONCURRENT_HASH_MAP_HPP
#define REASONER_CONCURRENT_HASH_MAP_HPP

#include <atomic>
#include <cstddef>
#include <functional>
#include <optional>
#include <utility>
#include <vector>

namespace reasoner {

/**
 * Insert-only lock-free hash map.
 *
 * Each bucket is a singly linked list grown by CAS at the head. Entries are
 * never removed individually, so readers walk the lists without hazard
 * tracking. clear() frees every node and must not run concurrently with
 * other operations.
 */
template<typename Key, typename Value, typename Hash = std::hash<Key>>
class ConcurrentHashMap {
private:
    struct Node {
        Node* next = nullptr;
        const Key key;
        const Value value;

        Node(const Key& k, Value v) : key(k), value(std::move(v)) {}
    };

    static constexpr std::size_t DEFAULT_BUCKET_COUNT = 256;

    std::vector<std::atomic<Node*>> buckets_;
    std::atomic<std::size_t> size_{0};
    Hash hasher_;

    std::atomic<Node*>& bucket_for(const Key& key) {
        return buckets_[hasher_(key) % buckets_.size()];
    }

    const std::atomic<Node*>& bucket_for(const Key& key) const {
        return buckets_[hasher_(key) % buckets_.size()];
    }

    static const Node* find_in(const Node* current, const Key& key) {
        for (; current != nullptr; current = current->next) {
            if (current->key == key) return current;
        }
        return nullptr;
    }

public:
    explicit ConcurrentHashMap(std::size_t bucket_count = DEFAULT_BUCKET_COUNT)
        : buckets_(bucket_count == 0 ? 1 : bucket_count) {
        for (auto& bucket : buckets_) {
            bucket.store(nullptr, std::memory_order_relaxed);
        }
    }

    ConcurrentHashMap(const ConcurrentHashMap&) = delete;
    ConcurrentHashMap& operator=(const ConcurrentHashMap&) = delete;

    ~ConcurrentHashMap() {
        clear();
    }

    /**
     * Value stored under key, creating it with make() if absent.
     * Returns (value, inserted). Linearizable: for any key exactly one
     * caller observes inserted == true and every caller gets that value.
     * make() runs at most once per call, possibly for a losing attempt.
     */
    template<typename Factory>
    std::pair<Value, bool> insert_or_get(const Key& key, Factory&& make) {
        std::atomic<Node*>& bucket = bucket_for(key);
        Node* fresh = nullptr;

        Node* head = bucket.load(std::memory_order_acquire);
        while (true) {
            if (const Node* existing = find_in(head, key)) {
                delete fresh;
                return {existing->value, false};
            }

            if (!fresh) {
                fresh = new Node(key, make());
            }
            fresh->next = head;

            // On failure head is reloaded and the new prefix is searched again
            if (bucket.compare_exchange_weak(head, fresh,
                                             std::memory_order_release,
                                             std::memory_order_acquire)) {
                size_.fetch_add(1, std::memory_order_relaxed);
                return {fresh->value, true};
            }
        }
    }

    std::optional<Value> find(const Key& key) const {
        const Node* node = find_in(bucket_for(key).load(std::memory_order_acquire), key);
        if (!node) return std::nullopt;
        return node->value;
    }

    bool contains(const Key& key) const {
        return find(key).has_value();
    }

    std::size_t size() const {
        return size_.load(std::memory_order_relaxed);
    }

    bool empty() const {
        return size() == 0;
    }

    void clear() {
        for (auto& bucket : buckets_) {
            Node* head = bucket.exchange(nullptr, std::memory_order_acq_rel);
            while (head != nullptr) {
                Node* next = head->next;
                delete head;
                head = next;
            }
        }
        size_.store(0, std::memory_order_relaxed);
    }

    template<typename Func>
    void for_each(Func&& func) const {
        for (const auto& bucket : buckets_) {
            for (const Node* node = bucket.load(std::memory_order_acquire); node != nullptr; node = node->next) {
                func(node->key, node->value);
            }
        }
    }
};

} // namespace reasoner

#endif // REASONER_CONCURRENT_HASH_MAP_HPP
