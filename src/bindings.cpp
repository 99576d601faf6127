#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <exception>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "py_object_traits.hpp"

namespace py = pybind11;

namespace {

using MapKeyIterator = PyHashTrieMap::KeyIterator;
using MapValueIterator = PyHashTrieMap::ValueIterator;
using MapItemIterator = PyHashTrieMap::ItemIterator;
using SetIterator = PyHashTrieSet::const_iterator;

// Python iterator over a stack; owns a copy of the stack so the cells it
// walks stay alive
struct StackIterator {
    PyStack stack;
    PyStack::const_iterator iter;

    explicit StackIterator(const PyStack& s) : stack(s), iter(stack.begin()) {}

    py::object next() {
        if (iter == stack.end()) {
            throw py::stop_iteration();
        }
        return *iter++;
    }
};

PyHashTrieMap mapFrom(const py::handle& source) {
    if (py::isinstance<PyHashTrieMap>(source)) {
        return source.cast<const PyHashTrieMap&>();
    }
    auto pairs = pyutils::pairsOf(source);
    return PyHashTrieMap::fromRange(pairs.begin(), pairs.end());
}

PyHashTrieSet setFrom(const py::handle& source) {
    if (py::isinstance<PyHashTrieSet>(source)) {
        return source.cast<const PyHashTrieSet&>();
    }
    std::vector<py::object> elements;
    for (auto elem : source) {
        elements.push_back(py::reinterpret_borrow<py::object>(elem));
    }
    return PyHashTrieSet(elements.begin(), elements.end());
}

std::string mapRepr(const PyHashTrieMap& m) {
    std::ostringstream oss;
    oss << "HashTrieMap({";
    bool first = true;
    for (const auto& entry : m) {
        if (!first) {
            oss << ", ";
        }
        first = false;
        oss << pyutils::repr(entry.key) << ": " << pyutils::repr(entry.value);
    }
    oss << "})";
    return oss.str();
}

std::string setRepr(const PyHashTrieSet& s) {
    std::ostringstream oss;
    oss << "HashTrieSet({";
    bool first = true;
    for (const auto& elem : s) {
        if (!first) {
            oss << ", ";
        }
        first = false;
        oss << pyutils::repr(elem);
    }
    oss << "})";
    return oss.str();
}

std::string stackRepr(const PyStack& s) {
    std::ostringstream oss;
    oss << "Stack([";
    bool first = true;
    for (const auto& elem : s.toVector()) {
        if (!first) {
            oss << ", ";
        }
        first = false;
        oss << pyutils::repr(elem);
    }
    oss << "])";
    return oss.str();
}

py::list itemsList(const PyHashTrieMap& m) {
    py::list result;
    for (const auto& entry : m) {
        result.append(py::make_tuple(entry.key, entry.value));
    }
    return result;
}

// Pickled state must be a list or tuple; anything else was not produced by
// __getstate__
py::sequence checkedState(const py::object& state, const char* typeName) {
    if (!py::isinstance<py::list>(state) && !py::isinstance<py::tuple>(state)) {
        std::ostringstream oss;
        oss << "malformed " << typeName << " state: " << pyutils::repr(state);
        throw std::invalid_argument(oss.str());
    }
    return py::reinterpret_borrow<py::sequence>(state);
}

// Ordering comparisons between sets; any other operand is left to Python
// by returning NotImplemented
template <typename Compare>
py::object compareSets(const PyHashTrieSet& self, const py::object& other, Compare compare) {
    if (!py::isinstance<PyHashTrieSet>(other)) {
        return py::reinterpret_borrow<py::object>(Py_NotImplemented);
    }
    return py::bool_(compare(self, other.cast<const PyHashTrieSet&>()));
}

}  // namespace

PYBIND11_MODULE(rpds, m) {
    m.doc() = "Persistent data structures: HashTrieMap, HashTrieSet and Stack";

    // Missing keys surface as KeyError carrying the key itself
    py::register_exception_translator([](std::exception_ptr p) {
        try {
            if (p) std::rethrow_exception(p);
        } catch (const rpds::KeyNotFound<py::object>& e) {
            // Wrap the key so a tuple key is not unpacked into the exception's args
            PyErr_SetObject(PyExc_KeyError, py::make_tuple(e.key()).ptr());
        }
    });

    // Expose iterators as Python iterators
    py::class_<MapKeyIterator>(m, "KeyIterator")
        .def("__iter__", [](MapKeyIterator& it) -> MapKeyIterator& { return it; })
        .def("__next__", [](MapKeyIterator& it) -> py::object {
            if (!it.hasNext()) throw py::stop_iteration();
            return it.next();
        });

    py::class_<MapValueIterator>(m, "ValueIterator")
        .def("__iter__", [](MapValueIterator& it) -> MapValueIterator& { return it; })
        .def("__next__", [](MapValueIterator& it) -> py::object {
            if (!it.hasNext()) throw py::stop_iteration();
            return it.next();
        });

    py::class_<MapItemIterator>(m, "ItemIterator")
        .def("__iter__", [](MapItemIterator& it) -> MapItemIterator& { return it; })
        .def("__next__", [](MapItemIterator& it) -> py::tuple {
            if (!it.hasNext()) throw py::stop_iteration();
            auto item = it.next();
            return py::make_tuple(item.first, item.second);
        });

    py::class_<SetIterator>(m, "SetIterator")
        .def("__iter__", [](SetIterator& it) -> SetIterator& { return it; })
        .def("__next__", [](SetIterator& it) -> py::object {
            if (!it.hasNext()) throw py::stop_iteration();
            return it.next();
        });

    py::class_<StackIterator>(m, "StackIterator")
        .def("__iter__", [](StackIterator& it) -> StackIterator& { return it; })
        .def("__next__", &StackIterator::next);

    // Views over a map
    py::class_<rpds::KeysView<PyHashTrieMap>>(m, "KeysView")
        .def("__iter__", [](const rpds::KeysView<PyHashTrieMap>& v) { return v.begin(); })
        .def("__len__", &rpds::KeysView<PyHashTrieMap>::size)
        .def("__contains__", &rpds::KeysView<PyHashTrieMap>::contains, py::arg("key"));

    py::class_<rpds::ValuesView<PyHashTrieMap>>(m, "ValuesView")
        .def("__iter__", [](const rpds::ValuesView<PyHashTrieMap>& v) { return v.begin(); })
        .def("__len__", &rpds::ValuesView<PyHashTrieMap>::size)
        .def("__contains__", &rpds::ValuesView<PyHashTrieMap>::contains, py::arg("value"));

    py::class_<rpds::ItemsView<PyHashTrieMap>>(m, "ItemsView")
        .def("__iter__", [](const rpds::ItemsView<PyHashTrieMap>& v) { return v.begin(); })
        .def("__len__", &rpds::ItemsView<PyHashTrieMap>::size)
        .def("__contains__",
             [](const rpds::ItemsView<PyHashTrieMap>& v, const py::object& item) -> bool {
                 if (!py::isinstance<py::tuple>(item) || py::len(item) != 2) {
                     return false;
                 }
                 py::tuple kv = py::reinterpret_borrow<py::tuple>(item);
                 return v.contains(kv[0], kv[1]);
             },
             py::arg("item"));

    py::class_<PyHashTrieMap> hashTrieMap(m, "HashTrieMap");
    hashTrieMap
        .def(py::init([](const py::object& value, const py::kwargs& kwargs) {
                 std::vector<std::pair<py::object, py::object>> pairs;
                 if (!value.is_none()) {
                     pairs = pyutils::pairsOf(value);
                 }
                 for (auto item : kwargs) {
                     pairs.emplace_back(py::reinterpret_borrow<py::object>(item.first),
                                        py::reinterpret_borrow<py::object>(item.second));
                 }
                 return PyHashTrieMap::fromRange(pairs.begin(), pairs.end());
             }),
             py::arg("value") = py::none(),
             "Create a HashTrieMap from a mapping, an iterable of pairs and/or keyword arguments")

        // Core methods
        .def("insert", &PyHashTrieMap::insert,
             py::arg("key"), py::arg("value"),
             "Associate key with value, returning new map.\n\n"
             "Args:\n"
             "    key: The key (must be hashable)\n"
             "    value: The value\n\n"
             "Returns:\n"
             "    A new HashTrieMap with the association added")

        .def("remove", &PyHashTrieMap::remove,
             py::arg("key"),
             "Remove key, returning new map. Raises KeyError if key is absent.\n\n"
             "Args:\n"
             "    key: The key to remove\n\n"
             "Returns:\n"
             "    A new HashTrieMap with the key removed")

        .def("discard", &PyHashTrieMap::discard,
             py::arg("key"),
             "Remove key if present, returning new map.\n\n"
             "Args:\n"
             "    key: The key to remove\n\n"
             "Returns:\n"
             "    A new HashTrieMap without the key (self if it was absent)")

        .def("get", &PyHashTrieMap::get,
             py::arg("key"), py::arg("default") = py::none(),
             "Get value for key, or default if not found.\n\n"
             "Args:\n"
             "    key: The key to look up\n"
             "    default: Value to return if key not found (default: None)\n\n"
             "Returns:\n"
             "    The value associated with key, or default")

        .def("update",
             [](const PyHashTrieMap& self, const py::args& sources) -> PyHashTrieMap {
                 PyHashTrieMap result = self;
                 for (auto source : sources) {
                     result = result.update(mapFrom(source));
                 }
                 return result;
             },
             "Merge mappings left to right, returning new map.\n\n"
             "Args:\n"
             "    *sources: HashTrieMaps, dicts, mappings or iterables of pairs\n\n"
             "Returns:\n"
             "    A new HashTrieMap; the rightmost source wins on conflicts")

        .def("keys", &PyHashTrieMap::keys,
             "Return a view of the keys.")

        .def("values", &PyHashTrieMap::values,
             "Return a view of the values.")

        .def("items", &PyHashTrieMap::items,
             "Return a view of the (key, value) pairs.")

        .def_static("convert",
                    [](const py::object& value) -> py::object {
                        if (py::isinstance<PyHashTrieMap>(value)) {
                            return value;
                        }
                        return py::cast(mapFrom(value));
                    },
                    py::arg("value"),
                    "Return value unchanged if it is already a HashTrieMap,\n"
                    "otherwise a new HashTrieMap built from its items.")

        // Python protocols
        .def("__getitem__", &PyHashTrieMap::at,
             py::arg("key"),
             "Get item using bracket notation. Raises KeyError if not found.")

        .def("__contains__", &PyHashTrieMap::contains,
             py::arg("key"),
             "Check if key is in map.")

        .def("__len__", &PyHashTrieMap::size,
             "Return number of entries in the map.")

        .def("__iter__",
             [](const PyHashTrieMap& self) { return MapKeyIterator(self.begin()); },
             "Iterate over keys in the map.")

        .def("__eq__",
             [](const PyHashTrieMap& self, const py::object& other) -> bool {
                 if (!py::isinstance<PyHashTrieMap>(other)) {
                     return false;
                 }
                 return self == other.cast<const PyHashTrieMap&>();
             },
             py::arg("other"),
             "Check equality with another map. Never equal to other mapping types.")

        .def("__ne__",
             [](const PyHashTrieMap& self, const py::object& other) -> bool {
                 if (!py::isinstance<PyHashTrieMap>(other)) {
                     return true;
                 }
                 return self != other.cast<const PyHashTrieMap&>();
             },
             py::arg("other"),
             "Check inequality with another map.")

        .def("__repr__", &mapRepr,
             "String representation of the map.")

        // Pickle support
        .def(py::pickle(
            [](const PyHashTrieMap& self) {  // __getstate__
                return itemsList(self);
            },
            [](const py::object& state) {  // __setstate__
                auto pairs = pyutils::pairsOf(checkedState(state, "HashTrieMap"));
                return PyHashTrieMap::fromRange(pairs.begin(), pairs.end());
            }));

    // Hashing a map is not supported
    hashTrieMap.attr("__hash__") = py::none();
    py::module_::import("collections.abc").attr("Mapping").attr("register")(hashTrieMap);

    py::class_<PyHashTrieSet> hashTrieSet(m, "HashTrieSet");
    hashTrieSet
        .def(py::init([](const py::object& value) {
                 if (value.is_none()) {
                     return PyHashTrieSet();
                 }
                 return setFrom(value);
             }),
             py::arg("value") = py::none(),
             "Create a HashTrieSet from an iterable")

        .def("insert", &PyHashTrieSet::insert,
             py::arg("value"),
             "Add element, returning new set.")

        .def("remove", &PyHashTrieSet::remove,
             py::arg("value"),
             "Remove element, returning new set. Raises KeyError if absent.")

        .def("discard", &PyHashTrieSet::discard,
             py::arg("value"),
             "Remove element if present, returning new set.")

        .def("update",
             [](const PyHashTrieSet& self, const py::args& iterables) -> PyHashTrieSet {
                 PyHashTrieSet result = self;
                 for (auto iterable : iterables) {
                     result = result.union_(setFrom(iterable));
                 }
                 return result;
             },
             "Add all elements of the given iterables, returning new set.")

        .def("__contains__", &PyHashTrieSet::contains,
             py::arg("value"),
             "Check if element is in set.")

        .def("__len__", &PyHashTrieSet::size,
             "Return number of elements in the set.")

        .def("__iter__",
             [](const PyHashTrieSet& self) { return self.begin(); },
             "Iterate over elements in the set.")

        // Set operators
        .def("__or__", &PyHashTrieSet::union_, py::arg("other"),
             "Union using | operator.")
        .def("union", &PyHashTrieSet::union_, py::arg("other"),
             "Return the union of two sets.")

        .def("__and__", &PyHashTrieSet::intersection, py::arg("other"),
             "Intersection using & operator.")
        .def("intersection", &PyHashTrieSet::intersection, py::arg("other"),
             "Return the elements present in both sets.")

        .def("__sub__", &PyHashTrieSet::difference, py::arg("other"),
             "Difference using - operator.")
        .def("difference", &PyHashTrieSet::difference, py::arg("other"),
             "Return the elements of this set that are not in other.")

        .def("__xor__", &PyHashTrieSet::symmetricDifference, py::arg("other"),
             "Symmetric difference using ^ operator.")
        .def("symmetric_difference", &PyHashTrieSet::symmetricDifference, py::arg("other"),
             "Return the elements in exactly one of the two sets.")

        .def("__le__",
             [](const PyHashTrieSet& self, const py::object& other) -> py::object {
                 return compareSets(self, other, [](const PyHashTrieSet& a, const PyHashTrieSet& b) {
                     return a.isSubset(b);
                 });
             },
             py::arg("other"),
             "Subset test using <= operator.")
        .def("issubset", &PyHashTrieSet::isSubset, py::arg("other"))

        .def("__ge__",
             [](const PyHashTrieSet& self, const py::object& other) -> py::object {
                 return compareSets(self, other, [](const PyHashTrieSet& a, const PyHashTrieSet& b) {
                     return a.isSuperset(b);
                 });
             },
             py::arg("other"),
             "Superset test using >= operator.")
        .def("issuperset", &PyHashTrieSet::isSuperset, py::arg("other"))

        .def("isdisjoint", &PyHashTrieSet::isDisjoint, py::arg("other"))

        .def("__lt__",
             [](const PyHashTrieSet& self, const py::object& other) -> py::object {
                 return compareSets(self, other, [](const PyHashTrieSet& a, const PyHashTrieSet& b) {
                     return a.size() < b.size() && a.isSubset(b);
                 });
             },
             py::arg("other"),
             "Proper subset test using < operator.")

        .def("__gt__",
             [](const PyHashTrieSet& self, const py::object& other) -> py::object {
                 return compareSets(self, other, [](const PyHashTrieSet& a, const PyHashTrieSet& b) {
                     return a.size() > b.size() && a.isSuperset(b);
                 });
             },
             py::arg("other"),
             "Proper superset test using > operator.")

        .def("__eq__",
             [](const PyHashTrieSet& self, const py::object& other) -> bool {
                 if (!py::isinstance<PyHashTrieSet>(other)) {
                     return false;
                 }
                 return self == other.cast<const PyHashTrieSet&>();
             },
             py::arg("other"),
             "Check equality with another set.")

        .def("__ne__",
             [](const PyHashTrieSet& self, const py::object& other) -> bool {
                 if (!py::isinstance<PyHashTrieSet>(other)) {
                     return true;
                 }
                 return self != other.cast<const PyHashTrieSet&>();
             },
             py::arg("other"),
             "Check inequality with another set.")

        .def("__repr__", &setRepr,
             "String representation of the set.")

        // Pickle support
        .def(py::pickle(
            [](const PyHashTrieSet& self) {  // __getstate__
                py::list elements;
                for (const auto& elem : self) {
                    elements.append(elem);
                }
                return elements;
            },
            [](const py::object& state) {  // __setstate__
                return setFrom(checkedState(state, "HashTrieSet"));
            }));

    hashTrieSet.attr("__hash__") = py::none();

    py::class_<PyStack>(m, "Stack")
        .def(py::init([](const py::args& elements) {
                 // Stack(iterable) or Stack(*elements)
                 py::object source = elements;
                 if (elements.size() == 1 && py::isinstance<py::iterable>(elements[0])) {
                     source = elements[0];
                 }
                 std::vector<py::object> values;
                 for (auto elem : source) {
                     values.push_back(py::reinterpret_borrow<py::object>(elem));
                 }
                 return PyStack(values.begin(), values.end());
             }),
             "Create a Stack from an iterable or from the given elements; the last one ends on top")

        .def("push", &PyStack::push,
             py::arg("value"),
             "Push value on top, returning new stack.")

        .def("pop", &PyStack::pop,
             "Remove the top element, returning new stack. Raises IndexError if empty.")

        .def("peek",
             [](const PyStack& self) -> py::object { return self.peek(); },
             "Return the top element. Raises IndexError if empty.")

        .def("__len__", &PyStack::size,
             "Return number of elements on the stack.")

        .def("__bool__", [](const PyStack& self) { return !self.empty(); },
             "True unless the stack is empty.")

        .def("__iter__",
             [](const PyStack& self) { return StackIterator(self); },
             "Iterate from the top of the stack down.")

        .def("__eq__",
             [](const PyStack& self, const py::object& other) -> bool {
                 if (!py::isinstance<PyStack>(other)) {
                     return false;
                 }
                 return self == other.cast<const PyStack&>();
             },
             py::arg("other"))

        .def("__ne__",
             [](const PyStack& self, const py::object& other) -> bool {
                 if (!py::isinstance<PyStack>(other)) {
                     return true;
                 }
                 return self != other.cast<const PyStack&>();
             },
             py::arg("other"))

        .def("__hash__", &PyStack::hash,
             "Order-sensitive hash of the elements.")

        .def("__repr__", &stackRepr,
             "String representation, bottom of the stack first.")

        // Pickle support: elements bottom first, so rebuilding pushes in order
        .def(py::pickle(
            [](const PyStack& self) {  // __getstate__
                py::list elements;
                for (const auto& elem : self.toVector()) {
                    elements.append(elem);
                }
                return elements;
            },
            [](const py::object& state) {  // __setstate__
                std::vector<py::object> values;
                for (auto elem : checkedState(state, "Stack")) {
                    values.push_back(py::reinterpret_borrow<py::object>(elem));
                }
                return PyStack(values.begin(), values.end());
            }));
}
