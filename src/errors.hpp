#pragma once

#include <stdexcept>
#include <utility>

namespace rpds {

/**
 * KeyNotFound - thrown by indexed lookup and remove() on an absent key
 *
 * Carries a copy of the offending key so callers (and the Python bindings,
 * which turn it into KeyError(key)) can report exactly what was missing.
 */
template <typename K>
class KeyNotFound : public std::out_of_range {
private:
    K key_;

public:
    explicit KeyNotFound(K key)
        : std::out_of_range("key not found"), key_(std::move(key)) {}

    const K& key() const { return key_; }
};

}  // namespace rpds
