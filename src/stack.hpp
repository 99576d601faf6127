#pragma once

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <utility>
#include <vector>

#include "hash_utils.hpp"

namespace rpds {

/**
 * Stack - persistent LIFO list
 *
 * A singly linked list of immutable cons cells. push() and pop() are O(1)
 * and every stack derived from a common tail shares that tail's cells.
 * Iteration runs from the top of the stack (most recently pushed) down.
 *
 * Equality and hashing are order sensitive: two stacks are equal when they
 * hold pairwise-equal elements in the same positions.
 */
template <typename T, typename Hash = std::hash<T>, typename Equal = std::equal_to<T>>
class Stack {
private:
    struct Cons {
        T value;
        std::shared_ptr<const Cons> rest;

        Cons(const T& v, std::shared_ptr<const Cons> r) : value(v), rest(std::move(r)) {}
    };
    using ConsPtr = std::shared_ptr<const Cons>;

    ConsPtr head_;
    size_t count_;

    Stack(ConsPtr head, size_t count) : head_(std::move(head)), count_(count) {}

    // Unlink uniquely owned cells one at a time; letting shared_ptr tear
    // down a long chain would recurse once per cell
    void unlink() {
        while (head_ && head_.use_count() == 1) {
            ConsPtr rest = head_->rest;
            head_ = std::move(rest);
        }
        head_.reset();
    }

public:
    using value_type = T;
    using size_type = size_t;

    class const_iterator {
    private:
        const Cons* cell_;

    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = const T*;
        using reference = const T&;

        const_iterator() : cell_(nullptr) {}
        explicit const_iterator(const Cons* cell) : cell_(cell) {}

        const T& operator*() const { return cell_->value; }
        const T* operator->() const { return &cell_->value; }

        const_iterator& operator++() {
            cell_ = cell_->rest.get();
            return *this;
        }

        const_iterator operator++(int) {
            const_iterator previous = *this;
            cell_ = cell_->rest.get();
            return previous;
        }

        bool operator==(const const_iterator& other) const { return cell_ == other.cell_; }
        bool operator!=(const const_iterator& other) const { return cell_ != other.cell_; }
    };
    using iterator = const_iterator;

    // Constructors
    Stack() : head_(), count_(0) {}

    Stack(std::initializer_list<T> init) : Stack(init.begin(), init.end()) {}

    // Push every element of [first, last) in order; the last one ends on top
    template <typename InputIt>
    Stack(InputIt first, InputIt last) : head_(), count_(0) {
        for (; first != last; ++first) {
            head_ = std::make_shared<const Cons>(*first, std::move(head_));
            ++count_;
        }
    }

    Stack(const Stack& other) = default;
    Stack(Stack&& other) noexcept : head_(std::move(other.head_)), count_(other.count_) {
        other.count_ = 0;
    }

    ~Stack() { unlink(); }

    Stack& operator=(const Stack& other) {
        if (this != &other) {
            unlink();
            head_ = other.head_;
            count_ = other.count_;
        }
        return *this;
    }

    Stack& operator=(Stack&& other) noexcept {
        if (this != &other) {
            unlink();
            head_ = std::move(other.head_);
            count_ = other.count_;
            other.count_ = 0;
        }
        return *this;
    }

    // Core operations (functional style)
    Stack push(const T& value) const {
        return Stack(std::make_shared<const Cons>(value, head_), count_ + 1);
    }

    Stack pop() const {
        if (!head_) {
            throw std::out_of_range("pop from empty stack");
        }
        return Stack(head_->rest, count_ - 1);
    }

    const T& peek() const {
        if (!head_) {
            throw std::out_of_range("peek at empty stack");
        }
        return head_->value;
    }

    // Size
    size_t size() const { return count_; }
    bool empty() const { return count_ == 0; }
    explicit operator bool() const { return count_ != 0; }

    // Iteration, top first
    const_iterator begin() const { return const_iterator(head_.get()); }
    const_iterator end() const { return const_iterator(); }

    // Elements in push order, bottom of the stack first
    std::vector<T> toVector() const {
        std::vector<T> elements(begin(), end());
        return std::vector<T>(elements.rbegin(), elements.rend());
    }

    // Equality
    bool operator==(const Stack& other) const {
        if (count_ != other.count_) {
            return false;
        }
        Equal equal;
        const Cons* left = head_.get();
        const Cons* right = other.head_.get();
        // Shared tails are equal without looking further
        while (left != right) {
            if (!equal(left->value, right->value)) {
                return false;
            }
            left = left->rest.get();
            right = right->rest.get();
        }
        return true;
    }

    bool operator!=(const Stack& other) const { return !(*this == other); }

    size_t hash() const { return hashSequence<Hash>(begin(), end()); }
};

// String representation: Stack([bottom, ..., top]), the order elements were pushed
template <typename T, typename Hash, typename Equal>
std::ostream& operator<<(std::ostream& out, const Stack<T, Hash, Equal>& stack) {
    out << "Stack([";
    bool first = true;
    for (const auto& value : stack.toVector()) {
        if (!first) {
            out << ", ";
        }
        first = false;
        out << value;
    }
    return out << "])";
}

}  // namespace rpds
