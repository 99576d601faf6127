#pragma once

#include <pybind11/pybind11.h>

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "hash_trie_map.hpp"
#include "hash_trie_set.hpp"
#include "stack.hpp"

namespace py = pybind11;

// Python utility functions
namespace pyutils {

// Hash hook: Python's hash(), raising TypeError for unhashable objects
struct PyHash {
    size_t operator()(const py::object& key) const;
};

// Equality hook: identity first, then Python's ==
struct PyEqual {
    bool operator()(const py::object& a, const py::object& b) const;
};

std::string repr(const py::handle& obj);

// Collect (key, value) pairs from a mapping (anything with items()) or
// from an iterable of 2-item sequences
std::vector<std::pair<py::object, py::object>> pairsOf(const py::handle& source);

}  // namespace pyutils

// The persistent collections as seen from Python
using PyHashTrieMap = rpds::HashTrieMap<py::object, py::object,
                                        pyutils::PyHash, pyutils::PyEqual, pyutils::PyEqual>;
using PyHashTrieSet = rpds::HashTrieSet<py::object, pyutils::PyHash, pyutils::PyEqual>;
using PyStack = rpds::Stack<py::object, pyutils::PyHash, pyutils::PyEqual>;
