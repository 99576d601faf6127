#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <ostream>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "errors.hpp"
#include "hash_trie_node.hpp"

namespace rpds {

// Inputs at least this large are built bottom-up instead of by repeated assoc
constexpr size_t BULK_BUILD_THRESHOLD = 1000;

/**
 * ProjectedIterator - adapts MapIterator to yield keys, values or items
 *
 * Backs the KeysView / ValuesView / ItemsView returned by HashTrieMap.
 */
template <typename Iterator, typename Projection>
class ProjectedIterator {
private:
    Iterator iter_;

public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = std::decay_t<decltype(Projection{}(*std::declval<Iterator>()))>;
    using difference_type = std::ptrdiff_t;
    using pointer = void;
    using reference = decltype(Projection{}(*std::declval<Iterator>()));

    ProjectedIterator() = default;
    explicit ProjectedIterator(Iterator iter) : iter_(std::move(iter)) {}

    bool hasNext() const { return iter_.hasNext(); }

    reference next() { return Projection{}(iter_.next()); }

    reference operator*() const { return Projection{}(*iter_); }

    ProjectedIterator& operator++() {
        ++iter_;
        return *this;
    }

    bool operator==(const ProjectedIterator& other) const { return iter_ == other.iter_; }
    bool operator!=(const ProjectedIterator& other) const { return iter_ != other.iter_; }
};

// Lazy, restartable views over a map. Each holds the map it was taken
// from, so it stays valid independently of the original handle.
template <typename Map>
class KeysView {
private:
    Map map_;

public:
    using iterator = typename Map::KeyIterator;

    explicit KeysView(const Map& map) : map_(map) {}
    iterator begin() const { return iterator(map_.begin()); }
    iterator end() const { return iterator(map_.end()); }
    size_t size() const { return map_.size(); }
    bool contains(const typename Map::key_type& key) const { return map_.contains(key); }
};

template <typename Map>
class ValuesView {
private:
    Map map_;

public:
    using iterator = typename Map::ValueIterator;

    explicit ValuesView(const Map& map) : map_(map) {}
    iterator begin() const { return iterator(map_.begin()); }
    iterator end() const { return iterator(map_.end()); }
    size_t size() const { return map_.size(); }

    // Linear scan: values are not indexed
    bool contains(const typename Map::mapped_type& value) const {
        typename Map::value_equal equal;
        for (const auto& entry : map_) {
            if (equal(entry.value, value)) {
                return true;
            }
        }
        return false;
    }
};

template <typename Map>
class ItemsView {
private:
    Map map_;

public:
    using iterator = typename Map::ItemIterator;

    explicit ItemsView(const Map& map) : map_(map) {}
    iterator begin() const { return iterator(map_.begin()); }
    iterator end() const { return iterator(map_.end()); }
    size_t size() const { return map_.size(); }

    bool contains(const typename Map::key_type& key, const typename Map::mapped_type& value) const {
        const auto* found = map_.find(key);
        return found != nullptr && typename Map::value_equal{}(*found, value);
    }
};

/**
 * HashTrieMap - persistent hash map backed by a hash array mapped trie
 *
 * Every "modifying" operation returns a new map; the receiver is never
 * changed. New maps share every subtree the operation did not touch, so
 * insert / remove copy O(log32 n) nodes.
 *
 * Keys need a hash (Hash) consistent with equality (KeyEqual). ValueEqual
 * is used for map equality and to recognise inserts that change nothing.
 * All three are default-constructed functors.
 */
template <typename K, typename V,
          typename Hash = std::hash<K>,
          typename KeyEqual = std::equal_to<K>,
          typename ValueEqual = std::equal_to<V>>
class HashTrieMap {
public:
    using NodeType = NodeBase<K, V, KeyEqual>;
    using Branch = BitmapNode<K, V, KeyEqual>;
    using Collision = CollisionNode<K, V, KeyEqual>;
    using EntryType = typename NodeType::EntryType;
    using EntryPtr = typename NodeType::EntryPtr;
    using Ref = typename NodeType::Ref;
    using Slot = typename NodeType::Slot;
    using Removal = typename NodeType::Removal;

    using key_type = K;
    using mapped_type = V;
    using size_type = size_t;
    using hasher = Hash;
    using key_equal = KeyEqual;
    using value_equal = ValueEqual;
    using const_iterator = MapIterator<K, V, KeyEqual>;
    using iterator = const_iterator;

    struct KeyProjection {
        const K& operator()(const EntryType& entry) const { return entry.key; }
    };
    struct ValueProjection {
        const V& operator()(const EntryType& entry) const { return entry.value; }
    };
    struct ItemProjection {
        std::pair<const K&, const V&> operator()(const EntryType& entry) const {
            return {entry.key, entry.value};
        }
    };

    using KeyIterator = ProjectedIterator<const_iterator, KeyProjection>;
    using ValueIterator = ProjectedIterator<const_iterator, ValueProjection>;
    using ItemIterator = ProjectedIterator<const_iterator, ItemProjection>;

private:
    Ref root_;
    size_t count_;

    HashTrieMap(Ref root, size_t count) : root_(std::move(root)), count_(count) {}

    static EntryPtr makeEntry(size_t hash, const K& key, const V& val) {
        return std::make_shared<const EntryType>(hash, key, val);
    }

    // The root is always a branch, even when it holds a single leaf or a
    // single collision bucket
    static Ref asRoot(const Slot& slot) {
        if (const EntryPtr* entry = std::get_if<EntryPtr>(&slot)) {
            std::vector<Slot> array;
            array.emplace_back(*entry);
            return Ref(new Branch(bitPosition((*entry)->hash, 0), std::move(array)));
        }
        const Ref& node = std::get<Ref>(slot);
        if (node->isCollision()) {
            size_t hash = static_cast<const Collision*>(node.get())->getHash();
            std::vector<Slot> array;
            array.emplace_back(node);
            return Ref(new Branch(bitPosition(hash, 0), std::move(array)));
        }
        return node;
    }

    const V* findHashed(size_t hash, const K& key) const {
        if (!root_) {
            return nullptr;
        }
        return root_->find(0, hash, key);
    }

    HashTrieMap assocEntry(const EntryPtr& entry) const {
        if (!root_) {
            return HashTrieMap(asRoot(entry), 1);
        }

        const V* existing = root_->find(0, entry->hash, entry->key);
        if (existing != nullptr && ValueEqual{}(*existing, entry->value)) {
            // Value unchanged, share the whole trie
            return *this;
        }

        Ref newRoot = root_->assoc(0, entry);
        return HashTrieMap(std::move(newRoot), existing != nullptr ? count_ : count_ + 1);
    }

    // Bottom-up tree construction for bulk operations. Groups entries by
    // their chunk at each level; equal keys resolve rightmost-wins. Adds
    // the number of distinct keys placed to `count`.
    static Slot buildTreeBulk(std::vector<EntryPtr>&& entries, uint32_t shift, size_t& count) {
        if (entries.size() == 1) {
            ++count;
            return entries.front();
        }

        // Check if all entries have the same hash (collision case)
        size_t firstHash = entries.front()->hash;
        bool allSameHash = std::all_of(entries.begin(), entries.end(),
                                       [&](const EntryPtr& e) { return e->hash == firstHash; });

        if (allSameHash) {
            std::vector<EntryPtr> bucket;
            for (const auto& entry : entries) {
                auto existing = std::find_if(bucket.begin(), bucket.end(), [&](const EntryPtr& e) {
                    return KeyEqual{}(e->key, entry->key);
                });
                if (existing != bucket.end()) {
                    *existing = entry;
                } else {
                    bucket.push_back(entry);
                }
            }
            count += bucket.size();
            if (bucket.size() == 1) {
                return bucket.front();
            }
            return Ref(new Collision(firstHash, std::move(bucket)));
        }

        // Buckets[i] holds entries whose chunk at this level is i
        std::array<std::vector<EntryPtr>, MAX_BITMAP_SIZE> buckets;
        for (auto& entry : entries) {
            buckets[hashChunk(entry->hash, shift)].push_back(std::move(entry));
        }

        uint32_t bitmap = 0;
        std::vector<Slot> array;
        for (uint32_t idx = 0; idx < MAX_BITMAP_SIZE; ++idx) {
            if (buckets[idx].empty()) {
                continue;
            }
            bitmap |= (1u << idx);
            array.push_back(buildTreeBulk(std::move(buckets[idx]), shift + HASH_BITS, count));
        }

        if (shift > 0 && array.size() == 1 && NodeType::isLiftable(array.front())) {
            return array.front();
        }
        return Ref(new Branch(bitmap, std::move(array)));
    }

    template <typename Source>
    HashTrieMap updateOne(const Source& source) const {
        HashTrieMap result = *this;
        for (const auto& item : source) {
            result = result.insert(item.first, item.second);
        }
        return result;
    }

    HashTrieMap updateOne(const HashTrieMap& other) const {
        if (!root_) {
            return other;
        }
        HashTrieMap result = *this;
        for (auto it = other.begin(); it != other.end(); ++it) {
            result = result.assocEntry(it.entryPtr());
        }
        return result;
    }

public:
    // Constructors
    HashTrieMap() : root_(), count_(0) {}

    HashTrieMap(std::initializer_list<std::pair<K, V>> init)
        : HashTrieMap(fromRange(init.begin(), init.end())) {}

    template <typename InputIt>
    HashTrieMap(InputIt first, InputIt last) : HashTrieMap(fromRange(first, last)) {}

    // Factory: build from any range of pairs, later duplicates win
    template <typename InputIt>
    static HashTrieMap fromRange(InputIt first, InputIt last) {
        Hash hasher;
        std::vector<EntryPtr> entries;
        for (; first != last; ++first) {
            const auto& item = *first;
            entries.push_back(makeEntry(hasher(item.first), item.first, item.second));
        }

        if (entries.empty()) {
            return HashTrieMap();
        }

        // Small maps: repeated assoc
        if (entries.size() < BULK_BUILD_THRESHOLD) {
            HashTrieMap m;
            for (const auto& entry : entries) {
                m = m.assocEntry(entry);
            }
            return m;
        }

        size_t count = 0;
        Slot root = buildTreeBulk(std::move(entries), 0, count);
        return HashTrieMap(asRoot(root), count);
    }

    // Core operations (functional style)
    HashTrieMap insert(const K& key, const V& val) const {
        return assocEntry(makeEntry(Hash{}(key), key, val));
    }

    HashTrieMap discard(const K& key) const {
        if (!root_) {
            return *this;
        }

        Removal removed = root_->dissoc(0, Hash{}(key), key);
        if (std::holds_alternative<std::monostate>(removed)) {
            return HashTrieMap();
        }
        if (const EntryPtr* entry = std::get_if<EntryPtr>(&removed)) {
            return HashTrieMap(asRoot(*entry), count_ - 1);
        }

        const Ref& newRoot = std::get<Ref>(removed);
        if (newRoot == root_) {
            // Key not found
            return *this;
        }
        return HashTrieMap(newRoot, count_ - 1);
    }

    HashTrieMap remove(const K& key) const {
        HashTrieMap result = discard(key);
        if (result.count_ == count_) {
            throw KeyNotFound<K>(key);
        }
        return result;
    }

    // Merge sources left to right; on conflicts the rightmost source wins.
    // A source is another HashTrieMap or any range of pairs.
    template <typename... Sources>
    HashTrieMap update(const Sources&... sources) const {
        HashTrieMap result = *this;
        ((result = result.updateOne(sources)), ...);
        return result;
    }

    const V* find(const K& key) const {
        return findHashed(Hash{}(key), key);
    }

    const V& at(const K& key) const {
        const V* found = find(key);
        if (found == nullptr) {
            throw KeyNotFound<K>(key);
        }
        return *found;
    }

    const V& operator[](const K& key) const { return at(key); }

    V get(const K& key, const V& defaultVal) const {
        const V* found = find(key);
        return found != nullptr ? *found : defaultVal;
    }

    bool contains(const K& key) const { return find(key) != nullptr; }

    // Size
    size_t size() const { return count_; }
    bool empty() const { return count_ == 0; }

    // Iteration (O(log n) memory, not O(n)); order is unspecified
    const_iterator begin() const { return const_iterator(root_); }
    const_iterator end() const { return const_iterator(); }

    KeysView<HashTrieMap> keys() const { return KeysView<HashTrieMap>(*this); }
    ValuesView<HashTrieMap> values() const { return ValuesView<HashTrieMap>(*this); }
    ItemsView<HashTrieMap> items() const { return ItemsView<HashTrieMap>(*this); }

    // Equality: same keys mapped to equal values, whatever the trie history
    bool operator==(const HashTrieMap& other) const {
        if (count_ != other.count_) {
            return false;
        }
        if (root_ == other.root_) {
            return true;
        }
        for (const auto& entry : *this) {
            const V* otherVal = other.findHashed(entry.hash, entry.key);
            if (otherVal == nullptr || !ValueEqual{}(entry.value, *otherVal)) {
                return false;
            }
        }
        return true;
    }

    bool operator!=(const HashTrieMap& other) const { return !(*this == other); }

    // Whether two maps share the same root node (cheap identity check)
    bool sharesRootWith(const HashTrieMap& other) const { return root_ == other.root_; }
};

// String representation: HashTrieMap({k: v, ...}) in iteration order
template <typename K, typename V, typename Hash, typename KeyEqual, typename ValueEqual>
std::ostream& operator<<(std::ostream& out, const HashTrieMap<K, V, Hash, KeyEqual, ValueEqual>& map) {
    out << "HashTrieMap({";
    bool first = true;
    for (const auto& entry : map) {
        if (!first) {
            out << ", ";
        }
        first = false;
        out << entry.key << ": " << entry.value;
    }
    return out << "})";
}

}  // namespace rpds
