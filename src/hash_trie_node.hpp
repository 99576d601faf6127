#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <utility>
#include <variant>
#include <vector>

#include "hash_utils.hpp"

namespace rpds {

// Constants for HAMT structure
constexpr uint32_t HASH_BITS = 5;
constexpr uint32_t HASH_MASK = (1 << HASH_BITS) - 1;  // 0b11111
constexpr uint32_t MAX_BITMAP_SIZE = 1 << HASH_BITS;  // 32

// Index of the slot a hash selects at the level addressed by `shift`
inline uint32_t hashChunk(size_t hash, uint32_t shift) {
    return static_cast<uint32_t>(hash >> shift) & HASH_MASK;
}

inline uint32_t bitPosition(size_t hash, uint32_t shift) {
    return 1u << hashChunk(hash, shift);
}

// Forward declarations
template <typename K, typename V, typename KeyEqual> class BitmapNode;
template <typename K, typename V, typename KeyEqual> class CollisionNode;

// Entry structure for key-value pairs. The full key hash is kept so that
// splitting or merging nodes never has to hash a key twice.
template <typename K, typename V>
struct Entry {
    size_t hash;
    K key;
    V value;

    Entry(size_t h, const K& k, const V& v) : hash(h), key(k), value(v) {}
};

/**
 * NodeRef - owning handle to an intrusively reference counted node
 *
 * Copying adds a reference, destruction releases one. Nodes are immutable
 * once published, so a handle only ever exposes a const node.
 */
template <typename Node>
class NodeRef {
private:
    const Node* node_;

public:
    NodeRef() : node_(nullptr) {}

    explicit NodeRef(const Node* node) : node_(node) {
        if (node_) node_->addRef();
    }

    NodeRef(const NodeRef& other) : node_(other.node_) {
        if (node_) node_->addRef();
    }

    NodeRef(NodeRef&& other) noexcept : node_(other.node_) {
        other.node_ = nullptr;
    }

    ~NodeRef() {
        if (node_) node_->release();
    }

    NodeRef& operator=(const NodeRef& other) {
        if (this != &other) {
            if (other.node_) other.node_->addRef();
            if (node_) node_->release();
            node_ = other.node_;
        }
        return *this;
    }

    NodeRef& operator=(NodeRef&& other) noexcept {
        if (this != &other) {
            if (node_) node_->release();
            node_ = other.node_;
            other.node_ = nullptr;
        }
        return *this;
    }

    const Node* get() const { return node_; }
    const Node* operator->() const { return node_; }
    const Node& operator*() const { return *node_; }
    explicit operator bool() const { return node_ != nullptr; }

    bool operator==(const NodeRef& other) const { return node_ == other.node_; }
    bool operator!=(const NodeRef& other) const { return node_ != other.node_; }
};

// Abstract base class for all node types with intrusive reference counting
template <typename K, typename V, typename KeyEqual>
class NodeBase {
public:
    using EntryType = Entry<K, V>;
    using EntryPtr = std::shared_ptr<const EntryType>;
    using Ref = NodeRef<NodeBase>;

    // A branch slot holds either a leaf entry or a child node
    using Slot = std::variant<EntryPtr, Ref>;

    // Outcome of dissoc(): nothing left, a lone entry for the parent to
    // inline, or a (possibly unchanged) node
    using Removal = std::variant<std::monostate, EntryPtr, Ref>;

protected:
    mutable std::atomic<uint32_t> refcount_;

public:
    NodeBase() : refcount_(0) {}
    NodeBase(const NodeBase&) = delete;
    NodeBase& operator=(const NodeBase&) = delete;
    virtual ~NodeBase() = default;

    // Reference counting
    void addRef() const {
        refcount_.fetch_add(1, std::memory_order_relaxed);
    }

    void release() const {
        if (refcount_.fetch_sub(1, std::memory_order_release) == 1) {
            std::atomic_thread_fence(std::memory_order_acquire);
            delete this;
        }
    }

    // Pure virtual methods that all nodes must implement
    virtual const V* find(uint32_t shift, size_t hash, const K& key) const = 0;

    virtual Ref assoc(uint32_t shift, const EntryPtr& entry) const = 0;

    virtual Removal dissoc(uint32_t shift, size_t hash, const K& key) const = 0;

    virtual bool isCollision() const = 0;

    // True when a slot may move up a level unchanged: a leaf entry or a
    // collision bucket, neither of which depends on its depth
    static bool isLiftable(const Slot& slot) {
        if (std::holds_alternative<EntryPtr>(slot)) {
            return true;
        }
        return std::get<Ref>(slot)->isCollision();
    }

    static Removal toRemoval(const Slot& slot) {
        if (std::holds_alternative<EntryPtr>(slot)) {
            return std::get<EntryPtr>(slot);
        }
        return std::get<Ref>(slot);
    }
};

// BitmapNode: Main HAMT node using bitmap indexing
template <typename K, typename V, typename KeyEqual>
class BitmapNode : public NodeBase<K, V, KeyEqual> {
public:
    using Base = NodeBase<K, V, KeyEqual>;
    using typename Base::EntryPtr;
    using typename Base::Ref;
    using typename Base::Slot;
    using typename Base::Removal;
    using Collision = CollisionNode<K, V, KeyEqual>;

private:
    uint32_t bitmap_;
    std::vector<Slot> array_;

    uint32_t index(uint32_t bit) const {
        return popcount(bitmap_ & (bit - 1));
    }

    // Copy-on-write: same bitmap, one slot replaced
    std::vector<Slot> replaced(uint32_t idx, Slot slot) const {
        std::vector<Slot> newArray = array_;
        newArray[idx] = std::move(slot);
        return newArray;
    }

    // Finish a removal: a non-root branch reduced to one liftable slot
    // hands that slot to its parent instead of keeping a chain of nodes
    static Removal compact(uint32_t shift, uint32_t bitmap, std::vector<Slot>&& array) {
        if (shift > 0 && array.size() == 1 && Base::isLiftable(array.front())) {
            return Base::toRemoval(array.front());
        }
        return Ref(new BitmapNode(bitmap, std::move(array)));
    }

    Removal withoutSlot(uint32_t shift, uint32_t bit, uint32_t idx) const {
        if (array_.size() == 1) {
            return std::monostate{};
        }
        std::vector<Slot> newArray;
        newArray.reserve(array_.size() - 1);
        for (size_t i = 0; i < array_.size(); ++i) {
            if (i != idx) {
                newArray.push_back(array_[i]);
            }
        }
        return compact(shift, bitmap_ & ~bit, std::move(newArray));
    }

public:
    BitmapNode(uint32_t bitmap, std::vector<Slot>&& array)
        : bitmap_(bitmap), array_(std::move(array)) {}

    // Helper to create the smallest subtree holding two entries whose
    // hashes agree on every chunk consumed before `shift`
    static Ref createNode(uint32_t shift, const EntryPtr& entry1, const EntryPtr& entry2) {
        if (entry1->hash == entry2->hash) {
            return Ref(new Collision(entry1->hash, std::vector<EntryPtr>{entry1, entry2}));
        }

        uint32_t idx1 = hashChunk(entry1->hash, shift);
        uint32_t idx2 = hashChunk(entry2->hash, shift);

        std::vector<Slot> array;
        if (idx1 == idx2) {
            // Same index at this level, recurse deeper
            array.emplace_back(createNode(shift + HASH_BITS, entry1, entry2));
            return Ref(new BitmapNode(1u << idx1, std::move(array)));
        }

        array.reserve(2);
        if (idx1 < idx2) {
            array.emplace_back(entry1);
            array.emplace_back(entry2);
        } else {
            array.emplace_back(entry2);
            array.emplace_back(entry1);
        }
        return Ref(new BitmapNode((1u << idx1) | (1u << idx2), std::move(array)));
    }

    const V* find(uint32_t shift, size_t hash, const K& key) const override {
        uint32_t bit = bitPosition(hash, shift);

        // Check if this slot is occupied
        if ((bitmap_ & bit) == 0) {
            return nullptr;
        }

        const Slot& slot = array_[index(bit)];
        if (const EntryPtr* entry = std::get_if<EntryPtr>(&slot)) {
            if ((*entry)->hash == hash && KeyEqual{}((*entry)->key, key)) {
                return &(*entry)->value;
            }
            return nullptr;
        }
        return std::get<Ref>(slot)->find(shift + HASH_BITS, hash, key);
    }

    Ref assoc(uint32_t shift, const EntryPtr& entry) const override {
        uint32_t bit = bitPosition(entry->hash, shift);
        uint32_t idx = index(bit);

        if ((bitmap_ & bit) == 0) {
            // Slot is empty, insert new entry
            std::vector<Slot> newArray;
            newArray.reserve(array_.size() + 1);
            newArray.insert(newArray.end(), array_.begin(), array_.begin() + idx);
            newArray.emplace_back(entry);
            newArray.insert(newArray.end(), array_.begin() + idx, array_.end());
            return Ref(new BitmapNode(bitmap_ | bit, std::move(newArray)));
        }

        const Slot& slot = array_[idx];
        if (const EntryPtr* existing = std::get_if<EntryPtr>(&slot)) {
            if ((*existing)->hash == entry->hash && KeyEqual{}((*existing)->key, entry->key)) {
                // Same key, update value
                return Ref(new BitmapNode(bitmap_, replaced(idx, entry)));
            }
            // Different key, same hash slot - create a sub-node
            Ref child = createNode(shift + HASH_BITS, *existing, entry);
            return Ref(new BitmapNode(bitmap_, replaced(idx, std::move(child))));
        }

        // It's a child node, recurse
        const Ref& child = std::get<Ref>(slot);
        Ref newChild = child->assoc(shift + HASH_BITS, entry);
        if (newChild == child) {
            return Ref(this);
        }
        return Ref(new BitmapNode(bitmap_, replaced(idx, std::move(newChild))));
    }

    Removal dissoc(uint32_t shift, size_t hash, const K& key) const override {
        uint32_t bit = bitPosition(hash, shift);

        if ((bitmap_ & bit) == 0) {
            // Key not in this node
            return Ref(this);
        }

        uint32_t idx = index(bit);
        const Slot& slot = array_[idx];

        if (const EntryPtr* entry = std::get_if<EntryPtr>(&slot)) {
            if ((*entry)->hash != hash || !KeyEqual{}((*entry)->key, key)) {
                return Ref(this);
            }
            return withoutSlot(shift, bit, idx);
        }

        const Ref& child = std::get<Ref>(slot);
        Removal removed = child->dissoc(shift + HASH_BITS, hash, key);

        if (std::holds_alternative<std::monostate>(removed)) {
            // Child is empty, remove this slot
            return withoutSlot(shift, bit, idx);
        }
        if (const EntryPtr* lifted = std::get_if<EntryPtr>(&removed)) {
            return compact(shift, bitmap_, replaced(idx, *lifted));
        }

        const Ref& newChild = std::get<Ref>(removed);
        if (newChild == child) {
            return Ref(this);
        }
        return compact(shift, bitmap_, replaced(idx, newChild));
    }

    bool isCollision() const override { return false; }

    const std::vector<Slot>& getArray() const { return array_; }
};

// CollisionNode: Handles hash collisions when multiple keys have the same hash
template <typename K, typename V, typename KeyEqual>
class CollisionNode : public NodeBase<K, V, KeyEqual> {
public:
    using Base = NodeBase<K, V, KeyEqual>;
    using typename Base::EntryPtr;
    using typename Base::Ref;
    using typename Base::Slot;
    using typename Base::Removal;
    using Branch = BitmapNode<K, V, KeyEqual>;

private:
    size_t hash_;
    std::vector<EntryPtr> entries_;

    size_t indexOf(const K& key) const {
        for (size_t i = 0; i < entries_.size(); ++i) {
            if (KeyEqual{}(entries_[i]->key, key)) {
                return i;
            }
        }
        return entries_.size();
    }

public:
    CollisionNode(size_t hash, std::vector<EntryPtr>&& entries)
        : hash_(hash), entries_(std::move(entries)) {}

    const V* find(uint32_t, size_t hash, const K& key) const override {
        if (hash != hash_) {
            return nullptr;
        }
        size_t i = indexOf(key);
        return i < entries_.size() ? &entries_[i]->value : nullptr;
    }

    Ref assoc(uint32_t shift, const EntryPtr& entry) const override {
        if (entry->hash != hash_) {
            // Push this bucket one level down into a branch that can also
            // hold the new key
            std::vector<Slot> array;
            array.emplace_back(Ref(this));
            Ref branch(new Branch(bitPosition(hash_, shift), std::move(array)));
            return branch->assoc(shift, entry);
        }

        // Copy-on-write: copy the bucket and replace or append
        std::vector<EntryPtr> newEntries = entries_;
        size_t i = indexOf(entry->key);
        if (i < newEntries.size()) {
            newEntries[i] = entry;
        } else {
            newEntries.push_back(entry);
        }
        return Ref(new CollisionNode(hash_, std::move(newEntries)));
    }

    Removal dissoc(uint32_t, size_t hash, const K& key) const override {
        if (hash != hash_) {
            return Ref(this);
        }

        size_t i = indexOf(key);
        if (i == entries_.size()) {
            // Key not found
            return Ref(this);
        }

        if (entries_.size() == 2) {
            // Only one entry left, it becomes a plain leaf
            return entries_[1 - i];
        }

        std::vector<EntryPtr> newEntries;
        newEntries.reserve(entries_.size() - 1);
        for (size_t j = 0; j < entries_.size(); ++j) {
            if (j != i) {
                newEntries.push_back(entries_[j]);
            }
        }
        return Ref(new CollisionNode(hash_, std::move(newEntries)));
    }

    bool isCollision() const override { return true; }

    size_t getHash() const { return hash_; }
    const std::vector<EntryPtr>& getEntries() const { return entries_; }
};

/**
 * MapIterator - depth-first walk over a trie
 *
 * Uses an explicit stack of (node, next slot) frames, so memory is
 * O(depth) rather than O(n). Holds a reference to the root, which keeps
 * every entry it hands out alive for the iterator's lifetime.
 */
template <typename K, typename V, typename KeyEqual>
class MapIterator {
public:
    using Base = NodeBase<K, V, KeyEqual>;
    using EntryType = typename Base::EntryType;
    using EntryPtr = typename Base::EntryPtr;
    using Ref = typename Base::Ref;
    using Slot = typename Base::Slot;

    using iterator_category = std::forward_iterator_tag;
    using value_type = EntryType;
    using difference_type = std::ptrdiff_t;
    using pointer = const EntryType*;
    using reference = const EntryType&;

private:
    struct StackFrame {
        const Base* node;
        size_t index;
    };

    std::vector<StackFrame> stack_;
    Ref root_;
    const EntryPtr* current_;

    void advance() {
        current_ = nullptr;
        while (!stack_.empty()) {
            const Base* node = stack_.back().node;
            size_t idx = stack_.back().index;

            if (auto* bitmapNode = dynamic_cast<const BitmapNode<K, V, KeyEqual>*>(node)) {
                const auto& array = bitmapNode->getArray();
                if (idx >= array.size()) {
                    stack_.pop_back();
                    continue;
                }
                stack_.back().index = idx + 1;
                const Slot& slot = array[idx];
                if (const EntryPtr* entry = std::get_if<EntryPtr>(&slot)) {
                    current_ = entry;
                    return;
                }
                stack_.push_back({std::get<Ref>(slot).get(), 0});
            } else {
                const auto& entries =
                    static_cast<const CollisionNode<K, V, KeyEqual>*>(node)->getEntries();
                if (idx >= entries.size()) {
                    stack_.pop_back();
                    continue;
                }
                stack_.back().index = idx + 1;
                current_ = &entries[idx];
                return;
            }
        }
    }

public:
    MapIterator() : current_(nullptr) {}

    explicit MapIterator(Ref root) : root_(std::move(root)), current_(nullptr) {
        if (root_) {
            stack_.push_back({root_.get(), 0});
            advance();
        }
    }

    bool hasNext() const { return current_ != nullptr; }

    const EntryType& next() {
        if (current_ == nullptr) {
            throw std::out_of_range("Iterator exhausted");
        }
        const EntryPtr* entry = current_;
        advance();
        return **entry;
    }

    const EntryType& operator*() const { return **current_; }
    const EntryType* operator->() const { return current_->get(); }

    // Shared handle to the current entry, reusable without rehashing
    const EntryPtr& entryPtr() const { return *current_; }

    MapIterator& operator++() {
        advance();
        return *this;
    }

    MapIterator operator++(int) {
        MapIterator previous = *this;
        advance();
        return previous;
    }

    bool operator==(const MapIterator& other) const { return current_ == other.current_; }
    bool operator!=(const MapIterator& other) const { return current_ != other.current_; }
};

}  // namespace rpds
