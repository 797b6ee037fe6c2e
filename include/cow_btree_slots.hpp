// cow_btree_slots.hpp
// Node-local ordered sequences used by CowBTree: the item run and the child run of a node.
//
// NodeSlots<U> is a thin positional wrapper over std::vector. Removing slots destroys the
// removed values immediately, so a node parked in the pool never keeps items or subtrees alive.
// find_slot() is the binary search over a sorted item run.

#ifndef COW_BTREE_SLOTS_HPP
#define COW_BTREE_SLOTS_HPP

#include <algorithm>
#include <cstddef>
#include <utility>
#include <vector>

template <typename U>
class NodeSlots {
public:
    using value_type     = U;
    using size_type      = std::size_t;
    using iterator       = typename std::vector<U>::iterator;
    using const_iterator = typename std::vector<U>::const_iterator;

    size_type size() const noexcept { return slots_.size(); }
    bool empty() const noexcept { return slots_.empty(); }
    size_type capacity() const noexcept { return slots_.capacity(); }

    U& operator[](size_type i) { return slots_[i]; }
    const U& operator[](size_type i) const { return slots_[i]; }
    U& front() { return slots_.front(); }
    const U& front() const { return slots_.front(); }
    U& back() { return slots_.back(); }
    const U& back() const { return slots_.back(); }

    iterator begin() noexcept { return slots_.begin(); }
    iterator end() noexcept { return slots_.end(); }
    const_iterator begin() const noexcept { return slots_.begin(); }
    const_iterator end() const noexcept { return slots_.end(); }

    void push_back(U value) { slots_.push_back(std::move(value)); }

    template <typename It>
    void append(It first, It last) { slots_.insert(slots_.end(), first, last); }

    // Replace the contents with a copy of other's slots, keeping our own storage.
    void assign(const NodeSlots& other) { slots_.assign(other.slots_.begin(), other.slots_.end()); }

    // insert value at index, shifting later slots right
    void insert_at(size_type index, U value) {
        slots_.insert(slots_.begin() + static_cast<std::ptrdiff_t>(index), std::move(value));
    }

    // remove and return the slot at index, shifting later slots left
    U remove_at(size_type index) {
        U out = std::move(slots_[index]);
        slots_.erase(slots_.begin() + static_cast<std::ptrdiff_t>(index));
        return out;
    }

    U pop() {
        U out = std::move(slots_.back());
        slots_.pop_back();
        return out;
    }

    // drop every slot from index onward
    void truncate(size_type index) {
        slots_.erase(slots_.begin() + static_cast<std::ptrdiff_t>(index), slots_.end());
    }

private:
    std::vector<U> slots_;
};

// find_slot:
// Returns the index at which item belongs in the sorted run, and whether an equal item is
// already there. When found, the index is the position of the equal item.
template <typename T, typename Compare>
std::pair<std::size_t, bool> find_slot(const NodeSlots<T>& items, const T& item, const Compare& less) {
    // first slot n with item < items[n]
    auto it = std::upper_bound(items.begin(), items.end(), item, less);
    std::size_t n = static_cast<std::size_t>(it - items.begin());
    if (n > 0 && !less(items[n - 1], item)) {
        return { n - 1, true };
    }
    return { n, false };
}

#endif // COW_BTREE_SLOTS_HPP
