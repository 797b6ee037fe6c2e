// cow_btree_node_pool.hpp
// Bounded pool of retired CowBTree node storage.
//
// - acquire() hands out the most recently released node, or a freshly allocated one.
// - release() parks an already-cleared node if the pool is below capacity.
// - next_generation() issues the write-epoch ids trees stamp on the nodes they own.
//
// One pool may be shared by any number of trees (clones always share their pool). Every
// member function is serialized by an internal mutex.

#ifndef COW_BTREE_NODE_POOL_HPP
#define COW_BTREE_NODE_POOL_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

constexpr std::size_t btree_default_pool_capacity = 32;

template <typename NodeT>
class BTreeNodePool {
public:
    using node_type    = NodeT;
    using node_pointer = std::shared_ptr<NodeT>;
    using size_type    = std::size_t;

    explicit BTreeNodePool(size_type capacity = btree_default_pool_capacity)
        : capacity_(capacity)
    {
        free_.reserve(capacity_);
    }

    BTreeNodePool(const BTreeNodePool&) = delete;
    BTreeNodePool& operator=(const BTreeNodePool&) = delete;

    node_pointer acquire() {
        {
            std::lock_guard<std::mutex> lock(mu_);
            if (!free_.empty()) {
                node_pointer n = std::move(free_.back());
                free_.pop_back();
                return n;
            }
        }
        return std::make_shared<NodeT>();
    }

    // Returns true if the node was kept for reuse. A rejected node is simply dropped.
    bool release(node_pointer n) {
        std::lock_guard<std::mutex> lock(mu_);
        if (free_.size() < capacity_) {
            free_.push_back(std::move(n));
            return true;
        }
        return false;
    }

    std::uint64_t next_generation() {
        std::lock_guard<std::mutex> lock(mu_);
        return ++generation_;
    }

    size_type size() const {
        std::lock_guard<std::mutex> lock(mu_);
        return free_.size();
    }

    size_type capacity() const noexcept { return capacity_; }

private:
    mutable std::mutex mu_;
    std::vector<node_pointer> free_;
    const size_type capacity_;
    std::uint64_t generation_ = 0; // 0 is never issued; it marks retired nodes
};

#endif // COW_BTREE_NODE_POOL_HPP
