// cow_btree_errors.hpp
// Exceptions raised by CowBTree for programmer errors.
//
// Lookups and removals of absent items are not errors; they return an empty std::optional.

#ifndef COW_BTREE_ERRORS_HPP
#define COW_BTREE_ERRORS_HPP

#include <stdexcept>
#include <string>

class BTreeError : public std::logic_error {
public:
    explicit BTreeError(const std::string& what) : std::logic_error(what) {}
};

// degree <= 1 passed to a tree constructor
class BTreeBadDegree : public BTreeError {
public:
    explicit BTreeBadDegree(int degree)
        : BTreeError("bad degree " + std::to_string(degree) + ": must be greater than 1"),
          degree_(degree) {}

    int degree() const noexcept { return degree_; }

private:
    int degree_;
};

// null handle passed to insert_or_replace
class BTreeNullItem : public BTreeError {
public:
    BTreeNullItem() : BTreeError("null item being added to CowBTree") {}
};

#endif // COW_BTREE_ERRORS_HPP
