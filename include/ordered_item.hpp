// ordered_item.hpp
// Polymorphic element contract for CowBTree.
//
// A stored item only has to answer "am I strictly less than that one". Two items are equal
// when neither is less than the other. OrderedItemLess plugs the contract into CowBTree as
// its Compare for any pointer-like handle (shared_ptr, raw pointer).
//
// Usage:
//   OrderedItemTree t(4);
//   t.insert_or_replace(std::make_shared<IntItem>(7));

#ifndef COW_BTREE_ORDERED_ITEM_HPP
#define COW_BTREE_ORDERED_ITEM_HPP

#include <memory>
#include <ostream>
#include <typeinfo>

#include "cow_btree.hpp"

class OrderedItem {
public:
    virtual ~OrderedItem() = default;

    // Items compared against each other must be of the same kind; a mismatch throws
    // std::bad_cast.
    virtual bool less(const OrderedItem& than) const = 0;

    // Used by tree dumps and invariant reports.
    virtual void print(std::ostream& os) const = 0;
};

inline std::ostream& operator<<(std::ostream& os, const OrderedItem& item) {
    item.print(os);
    return os;
}

struct OrderedItemLess {
    template <typename Handle>
    bool operator()(const Handle& a, const Handle& b) const {
        return a->less(*b);
    }
};

// Integer item, handy for tests and examples.
class IntItem : public OrderedItem {
public:
    explicit IntItem(int v) noexcept : value_(v) {}

    bool less(const OrderedItem& than) const override {
        return value_ < dynamic_cast<const IntItem&>(than).value_;
    }

    void print(std::ostream& os) const override { os << value_; }

    int value() const noexcept { return value_; }

private:
    int value_;
};

using OrderedItemPtr = std::shared_ptr<const OrderedItem>;
using OrderedItemTree = CowBTree<OrderedItemPtr, OrderedItemLess>;

#endif // COW_BTREE_ORDERED_ITEM_HPP
