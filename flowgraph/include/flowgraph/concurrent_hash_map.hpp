#ifndef FLOWGRAPH_CONCURRENT_HASH_MAP_HPP
#define FLOWGRAPH_CONCURRENT_HASH_MAP_HPP

#include <atomic>
#include <vector>
#include <functional>
#include <optional>
#include <utility>
#include <cstddef>

namespace flowgraph {

/**
 * Lock-free concurrent hash map for derived-fact caches.
 * Writers prepend to a bucket list with CAS; superseded entries are only
 * marked, never unlinked, so readers can walk a bucket without locking.
 * Memory for marked entries is reclaimed by clear() or the destructor.
 */
template<typename Key, typename Value, typename Hash = std::hash<Key>>
class ConcurrentHashMap {
private:
    struct Node {
        std::atomic<Node*> next{nullptr};
        Key key;
        Value value;
        std::atomic<bool> marked{false};  // Superseded by a newer entry

        Node(const Key& k, const Value& v) : key(k), value(v) {}
    };

    struct Bucket {
        std::atomic<Node*> head{nullptr};
    };

    std::vector<Bucket> buckets_;
    std::atomic<std::size_t> size_{0};
    Hash hasher_;

    std::size_t get_bucket_index(const Key& key) const {
        return hasher_(key) % buckets_.size();
    }

    Node* find_live(Node* current, const Key& key) const {
        while (current != nullptr) {
            if (!current->marked.load(std::memory_order_acquire) && current->key == key) {
                return current;
            }
            current = current->next.load(std::memory_order_acquire);
        }
        return nullptr;
    }

public:
    static constexpr std::size_t DEFAULT_BUCKET_COUNT = 1024;

    explicit ConcurrentHashMap(std::size_t bucket_count = DEFAULT_BUCKET_COUNT)
        : buckets_(bucket_count == 0 ? 1 : bucket_count) {}

    ~ConcurrentHashMap() {
        clear();
    }

    ConcurrentHashMap(const ConcurrentHashMap&) = delete;
    ConcurrentHashMap& operator=(const ConcurrentHashMap&) = delete;

    /**
     * Insert if the key is absent.
     * Returns true if inserted, false if a live entry already existed.
     */
    bool insert(const Key& key, const Value& value) {
        return insert_or_get(key, value).second;
    }

    /**
     * Insert if not exists, or get existing value
     * Returns pair of (value, was_inserted)
     */
    std::pair<Value, bool> insert_or_get(const Key& key, const Value& value) {
        std::size_t bucket_idx = get_bucket_index(key);
        Node* new_node = nullptr;

        while (true) {
            Node* head = buckets_[bucket_idx].head.load(std::memory_order_acquire);

            if (Node* existing = find_live(head, key)) {
                delete new_node;
                return {existing->value, false};
            }

            if (!new_node) {
                new_node = new Node(key, value);
            }

            new_node->next.store(head, std::memory_order_release);
            if (buckets_[bucket_idx].head.compare_exchange_weak(
                    head, new_node,
                    std::memory_order_release,
                    std::memory_order_acquire)) {
                size_.fetch_add(1, std::memory_order_relaxed);
                return {value, true};
            }
            // CAS failed; the new head might contain our key now
        }
    }

    /**
     * Publish a value for the key, replacing any previous one.
     * The new entry is linked at the head before older entries are marked,
     * so a concurrent find() sees either the old or the new value.
     */
    void insert_or_assign(const Key& key, const Value& value) {
        std::size_t bucket_idx = get_bucket_index(key);
        Node* new_node = new Node(key, value);

        Node* head = buckets_[bucket_idx].head.load(std::memory_order_acquire);
        do {
            new_node->next.store(head, std::memory_order_release);
        } while (!buckets_[bucket_idx].head.compare_exchange_weak(
                     head, new_node,
                     std::memory_order_release,
                     std::memory_order_acquire));
        size_.fetch_add(1, std::memory_order_relaxed);

        Node* current = new_node->next.load(std::memory_order_acquire);
        while (current != nullptr) {
            if (current->key == key &&
                !current->marked.exchange(true, std::memory_order_acq_rel)) {
                size_.fetch_sub(1, std::memory_order_relaxed);
            }
            current = current->next.load(std::memory_order_acquire);
        }
    }

    std::optional<Value> find(const Key& key) const {
        std::size_t bucket_idx = get_bucket_index(key);
        Node* node = find_live(buckets_[bucket_idx].head.load(std::memory_order_acquire), key);
        if (node) {
            return node->value;
        }
        return std::nullopt;
    }

    bool contains(const Key& key) const {
        return find(key).has_value();
    }

    /**
     * Number of live entries
     */
    std::size_t size() const {
        return size_.load(std::memory_order_relaxed);
    }

    bool empty() const {
        return size() == 0;
    }

    /**
     * Clear all entries. Not safe against concurrent readers.
     */
    void clear() {
        for (auto& bucket : buckets_) {
            Node* head = bucket.head.exchange(nullptr, std::memory_order_acq_rel);
            while (head != nullptr) {
                Node* next = head->next.load(std::memory_order_relaxed);
                delete head;
                head = next;
            }
        }
        size_.store(0, std::memory_order_relaxed);
    }

    template<typename Func>
    void for_each(Func&& func) const {
        for (const auto& bucket : buckets_) {
            Node* current = bucket.head.load(std::memory_order_acquire);
            while (current != nullptr) {
                if (!current->marked.load(std::memory_order_acquire)) {
                    func(current->key, current->value);
                }
                current = current->next.load(std::memory_order_acquire);
            }
        }
    }
};

} // namespace flowgraph

#endif // FLOWGRAPH_CONCURRENT_HASH_MAP_HPP
