#pragma once

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <ostream>
#include <utility>
#include <variant>

#include "errors.hpp"
#include "hash_trie_map.hpp"

namespace rpds {

/**
 * HashTrieSet - Immutable set implementation
 *
 * A persistent (immutable) hash set implemented as a wrapper around
 * HashTrieMap, where keys are set elements and every value is the same
 * empty std::monostate.
 *
 * Inherits all performance characteristics from HashTrieMap:
 * - O(log32 n) insert, remove, contains
 * - Structural sharing for memory efficiency
 * - Copy-on-write semantics
 */
template <typename T, typename Hash = std::hash<T>, typename Equal = std::equal_to<T>>
class HashTrieSet {
public:
    using MapType = HashTrieMap<T, std::monostate, Hash, Equal>;
    using value_type = T;
    using size_type = size_t;
    using const_iterator = typename MapType::KeyIterator;
    using iterator = const_iterator;

private:
    MapType map_;  // Keys are set elements

    explicit HashTrieSet(const MapType& map) : map_(map) {}

public:
    // Constructors
    HashTrieSet() : map_() {}

    HashTrieSet(std::initializer_list<T> init) : HashTrieSet(init.begin(), init.end()) {}

    template <typename InputIt>
    HashTrieSet(InputIt first, InputIt last) {
        for (; first != last; ++first) {
            map_ = map_.insert(*first, std::monostate{});
        }
    }

    // Core operations (functional style)
    HashTrieSet insert(const T& elem) const {
        return HashTrieSet(map_.insert(elem, std::monostate{}));
    }

    HashTrieSet remove(const T& elem) const {
        return HashTrieSet(map_.remove(elem));
    }

    HashTrieSet discard(const T& elem) const {
        return HashTrieSet(map_.discard(elem));
    }

    bool contains(const T& elem) const { return map_.contains(elem); }

    // Set operations
    HashTrieSet union_(const HashTrieSet& other) const {
        // Grow the larger set with the elements of the smaller
        if (size() < other.size()) {
            return other.union_(*this);
        }
        HashTrieSet result = *this;
        for (const auto& elem : other) {
            result = result.insert(elem);
        }
        return result;
    }

    HashTrieSet intersection(const HashTrieSet& other) const {
        // Iterate smaller set, check containment in larger
        const HashTrieSet& smaller = (size() <= other.size()) ? *this : other;
        const HashTrieSet& larger = (size() <= other.size()) ? other : *this;

        HashTrieSet result;
        for (const auto& elem : smaller) {
            if (larger.contains(elem)) {
                result = result.insert(elem);
            }
        }
        return result;
    }

    HashTrieSet difference(const HashTrieSet& other) const {
        HashTrieSet result = *this;
        for (const auto& elem : other) {
            result = result.discard(elem);
        }
        return result;
    }

    HashTrieSet symmetricDifference(const HashTrieSet& other) const {
        // (A - B) ∪ (B - A)
        return difference(other).union_(other.difference(*this));
    }

    // Set predicates
    bool isSubset(const HashTrieSet& other) const {
        if (size() > other.size()) return false;
        for (const auto& elem : *this) {
            if (!other.contains(elem)) {
                return false;
            }
        }
        return true;
    }

    bool isSuperset(const HashTrieSet& other) const { return other.isSubset(*this); }

    bool isDisjoint(const HashTrieSet& other) const {
        const HashTrieSet& smaller = (size() <= other.size()) ? *this : other;
        const HashTrieSet& larger = (size() <= other.size()) ? other : *this;
        for (const auto& elem : smaller) {
            if (larger.contains(elem)) {
                return false;
            }
        }
        return true;
    }

    // Size
    size_t size() const { return map_.size(); }
    bool empty() const { return map_.empty(); }

    // Iteration
    const_iterator begin() const { return const_iterator(map_.begin()); }
    const_iterator end() const { return const_iterator(map_.end()); }

    // Equality
    bool operator==(const HashTrieSet& other) const { return map_ == other.map_; }
    bool operator!=(const HashTrieSet& other) const { return !(*this == other); }
};

// String representation: HashTrieSet({a, b, ...}) in iteration order
template <typename T, typename Hash, typename Equal>
std::ostream& operator<<(std::ostream& out, const HashTrieSet<T, Hash, Equal>& set) {
    out << "HashTrieSet({";
    bool first = true;
    for (const auto& elem : set) {
        if (!first) {
            out << ", ";
        }
        first = false;
        out << elem;
    }
    return out << "})";
}

}  // namespace rpds
