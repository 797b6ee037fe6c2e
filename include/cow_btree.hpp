// cow_btree.hpp
// In-memory B-tree set with O(1) copy-on-write clones and a bounded node pool.
//
// - C++17 header-only.
// - Features:
//     * insert_or_replace / remove / remove_min / remove_max / get / has / min / max
//         - Not-found is reported as an empty std::optional, never as an exception.
//     * ascend / descend and their bounded variants
//         - Callback driven; returning false from the callback stops the scan.
//     * clone()
//         - O(1). Both handles keep sharing every existing node; whichever writes first copies
//           the nodes on its write path (see "Ownership" below).
//     * clear(bool return_nodes_to_pool)
//     * validate_invariants_json(std::string& out_json) const
//         - Checks ordering, node occupancy, child arity, separator bounds, leaf depth and size.
//     * tree_dump(std::ostream& os, bool show_generation = false) const
//     * split/merge/steal/copy counters for instrumentation.
//
// Ownership:
// - Every node carries the generation id of the tree handle that created it. A handle may only
//   modify in place nodes that carry its own generation; any other node is possibly shared with
//   another handle and is copied (mutable_for) before the first write. clone() gives both
//   handles fresh generations, so after a clone every existing node is foreign to both.
// - Nodes are held through std::shared_ptr, so a subtree lives as long as any handle reaches it.
// - Retired nodes are cleared and handed back to the BTreeNodePool shared by the clone family.
//
// Thread safety:
// - A single handle is not safe for concurrent writes. Distinct handles of one clone family may
//   be used from different threads; the only state they share for writing is the pool, which
//   locks internally.
//
// Usage:
//   CowBTree<int> t(3);
//   t.insert_or_replace(5);
//   auto snapshot = t.clone();
//   t.remove(5);                      // snapshot still has 5
//   snapshot.ascend([](int v) { std::cout << v << "\n"; return true; });
//   std::string diag;
//   ASSERT_TRUE(t.validate_invariants(&diag)) << diag;

#ifndef COW_BTREE_HPP
#define COW_BTREE_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include "cow_btree_errors.hpp"
#include "cow_btree_node_pool.hpp"
#include "cow_btree_slots.hpp"

namespace cow_btree_detail {

// true for raw pointers and smart pointers (std::string compares with nullptr too, so a
// plain "== nullptr" probe is not enough)
template <typename U, typename = void>
struct is_nullable : std::is_pointer<U> {};

template <typename U>
struct is_nullable<U, std::void_t<typename U::element_type, decltype(std::declval<const U&>() == nullptr)>>
    : std::true_type {};

template <typename U, typename = void>
struct is_streamable : std::false_type {};

template <typename U>
struct is_streamable<U, std::void_t<decltype(std::declval<std::ostream&>() << std::declval<const U&>())>>
    : std::true_type {};

// true for handles whose pointee streams; C strings stream as themselves
template <typename U, typename = void>
struct is_pointee_streamable : std::false_type {};

template <typename U>
struct is_pointee_streamable<U, std::void_t<decltype(std::declval<std::ostream&>() << *std::declval<const U&>())>>
    : std::bool_constant<is_nullable<U>::value
                         && !std::is_same<std::decay_t<decltype(*std::declval<const U&>())>, char>::value> {};

} // namespace cow_btree_detail

template <
    typename T,
    typename Compare = std::less<T>
>
class CowBTree {
public:
    using value_type  = T;
    using key_compare = Compare;
    using size_type   = std::size_t;

private:
    // Internal node structure. A leaf has no children; an internal node has items.size() + 1.
    struct Node {
        NodeSlots<T> items;
        NodeSlots<std::shared_ptr<Node>> children;
        std::uint64_t generation = 0;

        bool leaf() const noexcept { return children.empty(); }
    };

    using NodePtr = std::shared_ptr<Node>;

public:
    using pool_type = BTreeNodePool<Node>;

    explicit CowBTree(int degree, const key_compare& comp = key_compare())
        : CowBTree(degree, std::make_shared<pool_type>(btree_default_pool_capacity), comp) {}

    CowBTree(int degree, std::shared_ptr<pool_type> pool, const key_compare& comp = key_compare())
        : degree_(checked_degree(degree)), length_(0), less_(comp)
    {
        if (!pool) pool = std::make_shared<pool_type>(btree_default_pool_capacity);
        cow_.generation = pool->next_generation();
        cow_.pool = std::move(pool);
    }

    // Copies must go through clone(), which has to re-stamp this handle as well.
    CowBTree(const CowBTree&) = delete;
    CowBTree& operator=(const CowBTree&) = delete;

    // A moved-from tree reports zero size and counters; it may only be destroyed or assigned to.
    CowBTree(CowBTree&& other) noexcept
        : degree_(other.degree_), length_(other.length_), root_(std::move(other.root_)),
          cow_(std::move(other.cow_)), less_(std::move(other.less_)), counters_(other.counters_)
    {
        other.length_ = 0;
        other.cow_.generation = 0;
        other.counters_ = Counters();
    }

    CowBTree& operator=(CowBTree&& other) noexcept {
        if (this == &other) return *this;
        degree_ = other.degree_;
        length_ = other.length_;
        root_ = std::move(other.root_);
        cow_ = std::move(other.cow_);
        less_ = std::move(other.less_);
        counters_ = other.counters_;
        other.length_ = 0;
        other.cow_.generation = 0;
        other.counters_ = Counters();
        return *this;
    }

    ~CowBTree() = default;

    // clone:
    // Returns a second handle on the same contents in O(1). Must not race with writes to this
    // handle; once it returns, both handles are independent.
    CowBTree clone() {
        CowBTree out(degree_, cow_.pool, less_);
        out.root_ = root_;
        out.length_ = length_;
        out.counters_ = counters_;
        cow_.generation = cow_.pool->next_generation();
        return out;
    }

    // capacity
    bool empty() const noexcept { return length_ == 0; }
    size_type size() const noexcept { return length_; }
    int degree() const noexcept { return degree_; }
    size_type max_items() const noexcept { return static_cast<size_type>(degree_) * 2 - 1; }
    size_type min_items() const noexcept { return static_cast<size_type>(degree_) - 1; }

    const std::shared_ptr<pool_type>& pool() const noexcept { return cow_.pool; }

    // insert_or_replace:
    // Adds item. If an equal item was present it is replaced and returned.
    std::optional<T> insert_or_replace(T item) {
        if constexpr (cow_btree_detail::is_nullable<T>::value) {
            if (item == nullptr) throw BTreeNullItem();
        }
        if (!root_) {
            root_ = new_node();
            root_->items.push_back(std::move(item));
            ++length_;
            return std::nullopt;
        }
        root_ = mutable_for(root_);
        if (root_->items.size() >= max_items()) {
            auto halves = split(*root_, max_items() / 2);
            NodePtr old_root = std::move(root_);
            root_ = new_node();
            root_->items.push_back(std::move(halves.first));
            root_->children.push_back(std::move(old_root));
            root_->children.push_back(std::move(halves.second));
        }
        std::optional<T> out = insert(*root_, std::move(item), max_items());
        if (!out) ++length_;
        return out;
    }

    // remove:
    // Removes and returns the item equal to item. An absent item leaves the tree untouched; the
    // descent would otherwise rebalance (and copy shared nodes) on its way down. A present item
    // is therefore looked up twice.
    std::optional<T> remove(const T& item) {
        if (!has(item)) return std::nullopt;
        return remove_item(&item, RemoveKind::item);
    }
    std::optional<T> remove_min() { return remove_item(nullptr, RemoveKind::min); }
    std::optional<T> remove_max() { return remove_item(nullptr, RemoveKind::max); }

    // lookup
    std::optional<T> get(const T& key) const {
        const Node* n = root_.get();
        while (n) {
            size_type i;
            bool found;
            std::tie(i, found) = find_slot(n->items, key, less_);
            if (found) return n->items[i];
            if (n->leaf()) break;
            n = n->children[i].get();
        }
        return std::nullopt;
    }

    bool has(const T& key) const { return get(key).has_value(); }

    std::optional<T> min() const {
        const Node* n = root_.get();
        if (!n) return std::nullopt;
        while (!n->leaf()) n = n->children.front().get();
        if (n->items.empty()) return std::nullopt;
        return n->items.front();
    }

    std::optional<T> max() const {
        const Node* n = root_.get();
        if (!n) return std::nullopt;
        while (!n->leaf()) n = n->children.back().get();
        if (n->items.empty()) return std::nullopt;
        return n->items.back();
    }

    // Range scans. Every callback has the signature bool(const T&); returning false stops the scan.

    // [first, last]
    template <typename Fn>
    void ascend(Fn&& fn) const { scan(Direction::ascend, nullptr, nullptr, false, fn); }

    // [greater_or_equal, less_than)
    template <typename Fn>
    void ascend_range(const T& greater_or_equal, const T& less_than, Fn&& fn) const {
        scan(Direction::ascend, &greater_or_equal, &less_than, true, fn);
    }

    // [first, pivot)
    template <typename Fn>
    void ascend_less_than(const T& pivot, Fn&& fn) const {
        scan(Direction::ascend, nullptr, &pivot, false, fn);
    }

    // [pivot, last]
    template <typename Fn>
    void ascend_greater_or_equal(const T& pivot, Fn&& fn) const {
        scan(Direction::ascend, &pivot, nullptr, true, fn);
    }

    // [last, first]
    template <typename Fn>
    void descend(Fn&& fn) const { scan(Direction::descend, nullptr, nullptr, false, fn); }

    // [less_or_equal, greater_than)
    template <typename Fn>
    void descend_range(const T& less_or_equal, const T& greater_than, Fn&& fn) const {
        scan(Direction::descend, &less_or_equal, &greater_than, true, fn);
    }

    // [pivot, first]
    template <typename Fn>
    void descend_less_or_equal(const T& pivot, Fn&& fn) const {
        scan(Direction::descend, &pivot, nullptr, true, fn);
    }

    // [last, pivot)
    template <typename Fn>
    void descend_greater_than(const T& pivot, Fn&& fn) const {
        scan(Direction::descend, nullptr, &pivot, false, fn);
    }

    // clear:
    // Removes every item. With return_nodes_to_pool the nodes owned by this handle are cleared and
    // parked in the pool until it is full; the walk stops at the first rejection. Otherwise the
    // root is just dropped, which is O(1) when the nodes are shared with a clone.
    void clear(bool return_nodes_to_pool) {
        if (root_ && return_nodes_to_pool) {
            reset(std::move(root_));
        }
        root_.reset();
        length_ = 0;
    }

    // Instrumentation accessors
    size_t split_count() const noexcept { return counters_.splits; }
    size_t merge_count() const noexcept { return counters_.merges; }
    size_t steal_count() const noexcept { return counters_.steals; }
    size_t copy_count() const noexcept { return counters_.copies; }
    void reset_counters() noexcept { counters_ = Counters(); }

    // validate_invariants_json:
    // Produces structured JSON diagnostics in out_json.
    // Returns true if invariants hold, false otherwise.
    //
    // JSON structure:
    // {
    //   "valid": true|false,
    //   "size_reported": n,
    //   "size_actual": n2,
    //   "height": h,
    //   "node_count": c,
    //   "shared_nodes": s,
    //   "splits": .., "merges": .., "steals": .., "copies": ..,
    //   "issues": [ "...", ... ],
    //   "nodes": [ { "depth": d, "items": "[...]", "children": k, "generation": g, "owned": true|false }, ... ]
    // }
    bool validate_invariants_json(std::string& out_json) const {
        std::vector<std::string> issues;
        std::vector<std::string> node_jsons;
        size_t counted = 0;
        size_t node_count = 0;
        size_t shared_nodes = 0;
        int leaf_depth = -1;

        std::function<void(const Node*, int, const T*, const T*)> validate_node;
        validate_node = [&](const Node* node, int depth, const T* lower, const T* upper) {
            ++node_count;
            counted += node->items.size();
            bool owned = node->generation == cow_.generation;
            if (!owned) ++shared_nodes;

            std::ostringstream nj;
            nj << "{\"depth\":" << depth
               << ",\"items\":" << json_escape_and_quote(items_to_string(*node))
               << ",\"children\":" << node->children.size()
               << ",\"generation\":" << node->generation
               << ",\"owned\":" << (owned ? "true" : "false") << "}";
            node_jsons.push_back(nj.str());

            const std::string where = "node " + items_to_string(*node) + " at depth " + std::to_string(depth);

            if (node->items.size() > max_items()) {
                issues.push_back("Overfull " + where + ": " + std::to_string(node->items.size())
                                 + " items > " + std::to_string(max_items()));
            }
            if (depth == 0) {
                if (node->items.empty()) issues.push_back("Root has no items");
            } else if (node->items.size() < min_items()) {
                issues.push_back("Underfull " + where + ": " + std::to_string(node->items.size())
                                 + " items < " + std::to_string(min_items()));
            }

            for (size_t i = 0; i < node->items.size(); ++i) {
                const T& item = node->items[i];
                if (i > 0 && !less_(node->items[i - 1], item)) {
                    issues.push_back("Items not strictly increasing in " + where);
                }
                if (lower && !less_(*lower, item)) {
                    issues.push_back("Item " + key_to_string(item) + " not above separator "
                                     + key_to_string(*lower) + " in " + where);
                }
                if (upper && !less_(item, *upper)) {
                    issues.push_back("Item " + key_to_string(item) + " not below separator "
                                     + key_to_string(*upper) + " in " + where);
                }
            }

            if (node->leaf()) {
                if (leaf_depth < 0) leaf_depth = depth;
                else if (leaf_depth != depth) {
                    issues.push_back("Leaf depth mismatch: " + where + " expected depth "
                                     + std::to_string(leaf_depth));
                }
                return;
            }
            if (node->children.size() != node->items.size() + 1) {
                issues.push_back("Child count mismatch in " + where + ": "
                                 + std::to_string(node->children.size()) + " children");
                return;
            }
            for (size_t i = 0; i < node->children.size(); ++i) {
                const Node* child = node->children[i].get();
                if (!child) {
                    issues.push_back("Null child " + std::to_string(i) + " in " + where);
                    continue;
                }
                const T* lo = i > 0 ? &node->items[i - 1] : lower;
                const T* hi = i < node->items.size() ? &node->items[i] : upper;
                validate_node(child, depth + 1, lo, hi);
            }
        };

        if (root_) validate_node(root_.get(), 0, nullptr, nullptr);

        if (counted != length_) {
            std::ostringstream oss;
            oss << "Size mismatch: length=" << length_ << " actual=" << counted;
            issues.push_back(oss.str());
        }

        bool valid = issues.empty();

        // Compose final JSON
        std::ostringstream out;
        out << "{";
        out << "\"valid\":" << (valid ? "true" : "false") << ",";
        out << "\"size_reported\":" << length_ << ",";
        out << "\"size_actual\":" << counted << ",";
        out << "\"height\":" << (leaf_depth + 1) << ",";
        out << "\"node_count\":" << node_count << ",";
        out << "\"shared_nodes\":" << shared_nodes << ",";
        out << "\"splits\":" << counters_.splits << ",";
        out << "\"merges\":" << counters_.merges << ",";
        out << "\"steals\":" << counters_.steals << ",";
        out << "\"copies\":" << counters_.copies << ",";
        out << "\"issues\":[";
        for (size_t i = 0; i < issues.size(); ++i) {
            out << json_escape_and_quote(issues[i]);
            if (i + 1 < issues.size()) out << ",";
        }
        out << "],";
        out << "\"nodes\":[";
        for (size_t i = 0; i < node_jsons.size(); ++i) {
            out << node_jsons[i];
            if (i + 1 < node_jsons.size()) out << ",";
        }
        out << "]";
        out << "}";
        out_json = out.str();
        return valid;
    }

    // Human-readable wrapper: if out is non-null it receives the JSON diagnostics and a tree dump.
    bool validate_invariants(std::string* out = nullptr) const {
        std::string json;
        bool ok = validate_invariants_json(json);
        if (!out) return ok;
        std::ostringstream oss;
        oss << "validate_invariants: valid=" << (ok ? "true" : "false") << "\n";
        oss << "JSON diagnostics:\n" << json << "\n";
        oss << "Tree dump:\n" << tree_dump_to_string(true);
        *out = oss.str();
        return ok;
    }

    // Pretty-print tree with one line per node, indented by depth.
    void tree_dump(std::ostream& os, bool show_generation = false) const {
        os << tree_dump_to_string(show_generation);
    }

    std::string tree_dump_to_string(bool show_generation = false) const {
        std::ostringstream oss;
        if (!root_) {
            oss << "<empty tree>\n";
            return oss.str();
        }
        std::function<void(const Node*, int)> print_node = [&](const Node* n, int level) {
            oss << std::string(static_cast<size_t>(level), ' ') << "NODE:" << items_to_string(*n);
            if (show_generation) {
                oss << " gen=" << n->generation;
                if (n->generation != cow_.generation) oss << " (shared)";
            }
            oss << "\n";
            for (const auto& child : n->children) print_node(child.get(), level + 1);
        };
        print_node(root_.get(), 0);
        return oss.str();
    }

private:
    enum class RemoveKind { item, min, max };
    enum class Direction { descend = -1, ascend = +1 };
    enum class FreeResult { pool_full, stored, not_owned };

    // Write epoch of this handle plus the pool its nodes come from.
    struct CowContext {
        std::shared_ptr<pool_type> pool;
        std::uint64_t generation = 0;
    };

    struct Counters {
        size_t splits = 0;
        size_t merges = 0;
        size_t steals = 0;
        size_t copies = 0;
    };

    int degree_;
    size_type length_;
    NodePtr root_;
    CowContext cow_;
    key_compare less_;
    Counters counters_;

    static int checked_degree(int degree) {
        if (degree <= 1) throw BTreeBadDegree(degree);
        return degree;
    }

    // node allocation helpers
    NodePtr new_node() {
        NodePtr n = cow_.pool->acquire();
        n->generation = cow_.generation;
        return n;
    }

    // Clears n and offers it to the pool, unless another generation owns it.
    FreeResult free_node(NodePtr n) {
        if (n->generation != cow_.generation) return FreeResult::not_owned;
        n->items.truncate(0);
        n->children.truncate(0);
        n->generation = 0;
        return cow_.pool->release(std::move(n)) ? FreeResult::stored : FreeResult::pool_full;
    }

    // mutable_for:
    // Returns n itself if this handle owns it, else a shallow copy stamped with our generation.
    // Children of the copy still point at the shared subtrees.
    NodePtr mutable_for(const NodePtr& n) {
        if (n->generation == cow_.generation) return n;
        NodePtr out = new_node();
        out->items.assign(n->items);
        out->children.assign(n->children);
        ++counters_.copies;
        return out;
    }

    Node* mutable_child(Node& n, size_type i) {
        n.children[i] = mutable_for(n.children[i]);
        return n.children[i].get();
    }

    // split:
    // Removes item i from n and returns it together with a new node holding everything after it.
    std::pair<T, NodePtr> split(Node& n, size_type i) {
        T item = std::move(n.items[i]);
        NodePtr next = new_node();
        next->items.append(std::make_move_iterator(n.items.begin() + static_cast<std::ptrdiff_t>(i) + 1),
                           std::make_move_iterator(n.items.end()));
        n.items.truncate(i);
        if (!n.leaf()) {
            next->children.append(std::make_move_iterator(n.children.begin() + static_cast<std::ptrdiff_t>(i) + 1),
                                  std::make_move_iterator(n.children.end()));
            n.children.truncate(i + 1);
        }
        ++counters_.splits;
        return { std::move(item), std::move(next) };
    }

    // Splits child i if it is full, moving its median up into n.
    bool maybe_split_child(Node& n, size_type i, size_type max) {
        if (n.children[i]->items.size() < max) return false;
        Node* first = mutable_child(n, i);
        auto halves = split(*first, max / 2);
        n.items.insert_at(i, std::move(halves.first));
        n.children.insert_at(i + 1, std::move(halves.second));
        return true;
    }

    // insert:
    // Inserts item into the subtree rooted at n, which this handle owns and which is not full.
    // Full children are split before descending so no node ever exceeds max items.
    std::optional<T> insert(Node& n, T item, size_type max) {
        size_type i;
        bool found;
        std::tie(i, found) = find_slot(n.items, item, less_);
        if (found) {
            std::optional<T> out(std::move(n.items[i]));
            n.items[i] = std::move(item);
            return out;
        }
        if (n.leaf()) {
            n.items.insert_at(i, std::move(item));
            return std::nullopt;
        }
        if (maybe_split_child(n, i, max)) {
            const T& in_tree = n.items[i];
            if (less_(item, in_tree)) {
                // stay left of the promoted item
            } else if (less_(in_tree, item)) {
                ++i;
            } else {
                std::optional<T> out(std::move(n.items[i]));
                n.items[i] = std::move(item);
                return out;
            }
        }
        return insert(*mutable_child(n, i), std::move(item), max);
    }

    std::optional<T> remove_item(const T* item, RemoveKind kind) {
        if (!root_ || root_->items.empty()) return std::nullopt;
        root_ = mutable_for(root_);
        std::optional<T> out = remove(*root_, item, min_items(), kind);
        if (root_->items.empty()) {
            NodePtr old_root = std::move(root_);
            if (!old_root->leaf()) root_ = old_root->children.front();
            free_node(std::move(old_root));
        }
        if (out) --length_;
        return out;
    }

    // remove:
    // Removes an item from the subtree rooted at n, which this handle owns. A child about to be
    // descended into is first grown above min items so the removal never leaves it underfull.
    std::optional<T> remove(Node& n, const T* item, size_type min, RemoveKind kind) {
        size_type i = 0;
        bool found = false;
        switch (kind) {
        case RemoveKind::max:
            if (n.leaf()) return n.items.pop();
            i = n.items.size();
            break;
        case RemoveKind::min:
            if (n.leaf()) return n.items.remove_at(0);
            i = 0;
            break;
        case RemoveKind::item:
            std::tie(i, found) = find_slot(n.items, *item, less_);
            if (n.leaf()) {
                if (found) return n.items.remove_at(i);
                return std::nullopt;
            }
            break;
        }

        if (n.children[i]->items.size() <= min) {
            return grow_child_and_remove(n, i, item, min, kind);
        }
        Node* child = mutable_child(n, i);
        if (found) {
            // Child i has spare items, so its maximum can replace item i.
            std::optional<T> out(std::move(n.items[i]));
            n.items[i] = *remove(*child, nullptr, min, RemoveKind::max);
            return out;
        }
        return remove(*child, item, min, kind);
    }

    // grow_child_and_remove:
    // Gives child i one more item, by stealing from the left sibling, else from the right sibling,
    // else by merging with a neighbour, then retries the removal at n.
    std::optional<T> grow_child_and_remove(Node& n, size_type i, const T* item, size_type min, RemoveKind kind) {
        if (i > 0 && n.children[i - 1]->items.size() > min) {
            Node* child = mutable_child(n, i);
            Node* steal_from = mutable_child(n, i - 1);
            T stolen = steal_from->items.pop();
            child->items.insert_at(0, std::move(n.items[i - 1]));
            n.items[i - 1] = std::move(stolen);
            if (!steal_from->leaf()) {
                child->children.insert_at(0, steal_from->children.pop());
            }
            ++counters_.steals;
        } else if (i < n.items.size() && n.children[i + 1]->items.size() > min) {
            Node* child = mutable_child(n, i);
            Node* steal_from = mutable_child(n, i + 1);
            T stolen = steal_from->items.remove_at(0);
            child->items.push_back(std::move(n.items[i]));
            n.items[i] = std::move(stolen);
            if (!steal_from->leaf()) {
                child->children.push_back(steal_from->children.remove_at(0));
            }
            ++counters_.steals;
        } else {
            if (i >= n.items.size()) --i;
            Node* child = mutable_child(n, i);
            T merge_item = n.items.remove_at(i);
            NodePtr merge_child = n.children.remove_at(i + 1);
            child->items.push_back(std::move(merge_item));
            child->items.append(merge_child->items.begin(), merge_child->items.end());
            child->children.append(merge_child->children.begin(), merge_child->children.end());
            free_node(std::move(merge_child));
            ++counters_.merges;
        }
        return remove(n, item, min, kind);
    }

    // reset:
    // Returns the subtree's owned nodes to the pool. False means the pool is full and the caller
    // should stop. Foreign nodes are skipped with their subtrees; they can only reach foreign nodes.
    bool reset(NodePtr n) {
        if (n->generation != cow_.generation) return true;
        for (auto& child : n->children) {
            if (!reset(std::move(child))) return false;
        }
        return free_node(std::move(n)) != FreeResult::pool_full;
    }

    template <typename Fn>
    void scan(Direction dir, const T* start, const T* stop, bool include_start, Fn& fn) const {
        if (!root_) return;
        bool hit = false;
        iterate(*root_, dir, start, stop, include_start, hit, fn);
    }

    // iterate:
    // Visits the subtree at n in dir order. Ascending, start must not be above stop; descending,
    // start must not be below stop. hit records whether the start bound has been passed, which
    // include_start needs. Returns false once the scan must end.
    template <typename Fn>
    bool iterate(const Node& n, Direction dir, const T* start, const T* stop, bool include_start,
                 bool& hit, Fn& fn) const {
        if (dir == Direction::ascend) {
            size_type index = 0;
            if (start) index = find_slot(n.items, *start, less_).first;
            for (size_type i = index; i < n.items.size(); ++i) {
                if (!n.leaf()) {
                    if (!iterate(*n.children[i], dir, start, stop, include_start, hit, fn)) return false;
                }
                if (!include_start && !hit && start && !less_(*start, n.items[i])) {
                    hit = true;
                    continue;
                }
                hit = true;
                if (stop && !less_(n.items[i], *stop)) return false;
                if (!fn(n.items[i])) return false;
            }
            if (!n.leaf()) {
                if (!iterate(*n.children.back(), dir, start, stop, include_start, hit, fn)) return false;
            }
            return true;
        }

        std::ptrdiff_t index;
        if (start) {
            size_type pos;
            bool found;
            std::tie(pos, found) = find_slot(n.items, *start, less_);
            index = static_cast<std::ptrdiff_t>(pos);
            if (!found) --index;
        } else {
            index = static_cast<std::ptrdiff_t>(n.items.size()) - 1;
        }
        for (std::ptrdiff_t i = index; i >= 0; --i) {
            const T& item = n.items[static_cast<size_type>(i)];
            if (start && !less_(item, *start)) {
                if (!include_start || hit || less_(*start, item)) continue;
            }
            if (!n.leaf()) {
                if (!iterate(*n.children[static_cast<size_type>(i) + 1], dir, start, stop, include_start, hit, fn)) {
                    return false;
                }
            }
            if (stop && !less_(*stop, item)) return false;
            hit = true;
            if (!fn(item)) return false;
        }
        if (!n.leaf()) {
            if (!iterate(*n.children.front(), dir, start, stop, include_start, hit, fn)) return false;
        }
        return true;
    }

    // utility: escape string for JSON and wrap in quotes
    static std::string json_escape_and_quote(const std::string& s) {
        std::ostringstream o;
        o << "\"";
        for (char c : s) {
            switch (c) {
                case '\"': o << "\\\""; break;
                case '\\': o << "\\\\"; break;
                case '\b': o << "\\b"; break;
                case '\f': o << "\\f"; break;
                case '\n': o << "\\n"; break;
                case '\r': o << "\\r"; break;
                case '\t': o << "\\t"; break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        o << "\\u00" << std::hex << (static_cast<int>(c) >> 4) << (static_cast<int>(c) & 0xf) << std::dec;
                    } else {
                        o << c;
                    }
            }
        }
        o << "\"";
        return o.str();
    }

    // helper: stream an item into a string; handles print their pointee, null handles "nil",
    // items without operator<< "?"
    static std::string key_to_string(const T& k) {
        if constexpr (cow_btree_detail::is_pointee_streamable<T>::value) {
            if (k == nullptr) return "nil";
            std::ostringstream oss;
            oss << *k;
            return oss.str();
        } else if constexpr (cow_btree_detail::is_streamable<T>::value) {
            std::ostringstream oss;
            oss << k;
            return oss.str();
        } else {
            return "?";
        }
    }

    static std::string items_to_string(const Node& n) {
        std::string s = "[";
        for (size_t i = 0; i < n.items.size(); ++i) {
            if (i > 0) s += ' ';
            s += key_to_string(n.items[i]);
        }
        s += "]";
        return s;
    }
};

#endif // COW_BTREE_HPP
