#include "py_object_traits.hpp"

#include <sstream>
#include <stdexcept>

namespace pyutils {

size_t PyHash::operator()(const py::object& key) const {
    Py_hash_t h = PyObject_Hash(key.ptr());
    if (h == -1 && PyErr_Occurred()) {
        throw py::error_already_set();
    }
    return static_cast<size_t>(h);
}

bool PyEqual::operator()(const py::object& a, const py::object& b) const {
    // Fast path: same object
    if (a.is(b)) return true;

    // Use Python's rich comparison
    int result = PyObject_RichCompareBool(a.ptr(), b.ptr(), Py_EQ);
    if (result == -1) {
        throw py::error_already_set();
    }
    return result == 1;
}

std::string repr(const py::handle& obj) {
    return py::str(py::repr(obj)).cast<std::string>();
}

std::vector<std::pair<py::object, py::object>> pairsOf(const py::handle& source) {
    std::vector<std::pair<py::object, py::object>> pairs;

    if (py::hasattr(source, "items")) {
        for (auto item : source.attr("items")()) {
            py::sequence kv = py::reinterpret_borrow<py::sequence>(item);
            pairs.emplace_back(kv[0], kv[1]);
        }
        return pairs;
    }

    if (!py::isinstance<py::iterable>(source)) {
        throw py::type_error("expected a mapping or an iterable of key/value pairs, got " +
                             py::str(py::type::of(source).attr("__name__")).cast<std::string>());
    }

    for (auto item : source) {
        if (!py::isinstance<py::sequence>(item) || py::len(item) != 2) {
            std::ostringstream oss;
            oss << "expected a key/value pair, got " << repr(item);
            throw std::invalid_argument(oss.str());
        }
        py::sequence kv = py::reinterpret_borrow<py::sequence>(item);
        pairs.emplace_back(kv[0], kv[1]);
    }
    return pairs;
}

}  // namespace pyutils
