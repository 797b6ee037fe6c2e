// Unit tests for the node-local slot runs and the node pool, using GoogleTest
#include <gtest/gtest.h>
#include <atomic>
#include <functional>
#include <memory>
#include <set>
#include <thread>
#include <vector>

#include "cow_btree_node_pool.hpp"
#include "cow_btree_slots.hpp"

// Stand-in for tree nodes; the pool only needs default construction.
struct DemoNode {
    int tag = 0;
};

using DemoPool = BTreeNodePool<DemoNode>;

template <typename U>
std::vector<U> to_vector(const NodeSlots<U>& slots) {
    return std::vector<U>(slots.begin(), slots.end());
}

TEST(NodeSlots, FindSlotReportsIndexAndPresence) {
    NodeSlots<int> items;
    for (int v : {1, 3, 5}) items.push_back(v);
    std::less<int> less;

    EXPECT_EQ(find_slot(items, 0, less), std::make_pair(std::size_t{0}, false));
    EXPECT_EQ(find_slot(items, 1, less), std::make_pair(std::size_t{0}, true));
    EXPECT_EQ(find_slot(items, 2, less), std::make_pair(std::size_t{1}, false));
    EXPECT_EQ(find_slot(items, 3, less), std::make_pair(std::size_t{1}, true));
    EXPECT_EQ(find_slot(items, 5, less), std::make_pair(std::size_t{2}, true));
    EXPECT_EQ(find_slot(items, 6, less), std::make_pair(std::size_t{3}, false));

    NodeSlots<int> empty;
    EXPECT_EQ(find_slot(empty, 4, less), std::make_pair(std::size_t{0}, false));
}

TEST(NodeSlots, FindSlotUsesSuppliedOrder) {
    NodeSlots<int> items;
    for (int v : {9, 6, 2}) items.push_back(v);
    std::greater<int> greater;

    EXPECT_EQ(find_slot(items, 6, greater), std::make_pair(std::size_t{1}, true));
    EXPECT_EQ(find_slot(items, 7, greater), std::make_pair(std::size_t{1}, false));
    EXPECT_EQ(find_slot(items, 1, greater), std::make_pair(std::size_t{3}, false));
}

TEST(NodeSlots, PositionalEdits) {
    NodeSlots<int> s;
    s.insert_at(0, 2);
    s.insert_at(0, 0);
    s.insert_at(1, 1);
    s.insert_at(3, 3);
    EXPECT_EQ(to_vector(s), (std::vector<int>{0, 1, 2, 3}));

    EXPECT_EQ(s.remove_at(1), 1);
    EXPECT_EQ(to_vector(s), (std::vector<int>{0, 2, 3}));

    EXPECT_EQ(s.pop(), 3);
    EXPECT_EQ(to_vector(s), (std::vector<int>{0, 2}));

    std::vector<int> more{4, 5, 6};
    s.append(more.begin(), more.end());
    EXPECT_EQ(to_vector(s), (std::vector<int>{0, 2, 4, 5, 6}));

    s.truncate(2);
    EXPECT_EQ(to_vector(s), (std::vector<int>{0, 2}));
    s.truncate(2);
    EXPECT_EQ(s.size(), 2u);
    s.truncate(0);
    EXPECT_TRUE(s.empty());
}

TEST(NodeSlots, RemovedSlotsReleaseReferences) {
    auto a = std::make_shared<int>(1);
    auto b = std::make_shared<int>(2);
    auto c = std::make_shared<int>(3);

    NodeSlots<std::shared_ptr<int>> s;
    s.push_back(a);
    s.push_back(b);
    s.push_back(c);
    EXPECT_EQ(a.use_count(), 2);

    s.truncate(1);
    EXPECT_EQ(a.use_count(), 2);
    EXPECT_EQ(b.use_count(), 1);
    EXPECT_EQ(c.use_count(), 1);

    auto popped = s.pop();
    EXPECT_EQ(a.use_count(), 2); // held by popped only
    popped.reset();
    EXPECT_EQ(a.use_count(), 1);

    // storage is kept for reuse after truncation
    NodeSlots<std::shared_ptr<int>> t;
    for (int i = 0; i < 10; ++i) t.push_back(a);
    size_t cap = t.capacity();
    t.truncate(0);
    EXPECT_EQ(a.use_count(), 1);
    EXPECT_EQ(t.capacity(), cap);
}

TEST(NodeSlots, AssignCopiesWithoutAliasing) {
    NodeSlots<int> src;
    for (int v : {1, 2, 3}) src.push_back(v);
    NodeSlots<int> dst;
    dst.push_back(9);
    dst.assign(src);
    EXPECT_EQ(to_vector(dst), (std::vector<int>{1, 2, 3}));

    dst.remove_at(0);
    EXPECT_EQ(to_vector(src), (std::vector<int>{1, 2, 3}));
}

TEST(NodePool, ReleaseStopsAtCapacity) {
    DemoPool pool(3);
    EXPECT_EQ(pool.capacity(), 3u);
    EXPECT_EQ(pool.size(), 0u);

    std::vector<bool> accepted;
    for (int i = 0; i < 5; ++i) accepted.push_back(pool.release(std::make_shared<DemoNode>()));
    EXPECT_EQ(accepted, (std::vector<bool>{true, true, true, false, false}));
    EXPECT_EQ(pool.size(), 3u);
}

TEST(NodePool, AcquireReusesMostRecentlyReleased) {
    DemoPool pool(4);
    auto first = std::make_shared<DemoNode>();
    auto second = std::make_shared<DemoNode>();
    first->tag = 1;
    second->tag = 2;
    DemoNode* second_addr = second.get();
    DemoNode* first_addr = first.get();

    ASSERT_TRUE(pool.release(std::move(first)));
    ASSERT_TRUE(pool.release(std::move(second)));

    auto a = pool.acquire();
    auto b = pool.acquire();
    EXPECT_EQ(a.get(), second_addr);
    EXPECT_EQ(b.get(), first_addr);
    EXPECT_EQ(pool.size(), 0u);

    // empty pool allocates
    auto c = pool.acquire();
    ASSERT_NE(c, nullptr);
    EXPECT_EQ(c->tag, 0);
}

TEST(NodePool, ZeroCapacityNeverStores) {
    DemoPool pool(0);
    EXPECT_FALSE(pool.release(std::make_shared<DemoNode>()));
    EXPECT_EQ(pool.size(), 0u);
    EXPECT_NE(pool.acquire(), nullptr);
}

TEST(NodePool, DefaultCapacity) {
    DemoPool pool;
    EXPECT_EQ(pool.capacity(), btree_default_pool_capacity);
    EXPECT_EQ(btree_default_pool_capacity, 32u);
}

TEST(NodePool, GenerationsAreUniqueAndNonZero) {
    DemoPool pool;
    std::set<std::uint64_t> seen;
    for (int i = 0; i < 100; ++i) {
        auto g = pool.next_generation();
        EXPECT_NE(g, 0u);
        EXPECT_TRUE(seen.insert(g).second);
    }
}

TEST(NodePool, ConcurrentUseKeepsBound) {
    DemoPool pool(16);
    std::atomic<int> accepted{0};
    std::vector<std::thread> threads;
    std::vector<std::vector<std::uint64_t>> generations(4);

    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&pool, &accepted, &generations, t] {
            std::vector<std::shared_ptr<DemoNode>> held;
            for (int i = 0; i < 2000; ++i) {
                held.push_back(pool.acquire());
                if (held.size() > 8) {
                    if (pool.release(std::move(held.front()))) ++accepted;
                    held.erase(held.begin());
                }
                if (i % 100 == 0) generations[t].push_back(pool.next_generation());
                EXPECT_LE(pool.size(), pool.capacity());
            }
            for (auto& n : held) {
                if (pool.release(std::move(n))) ++accepted;
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_LE(pool.size(), 16u);
    EXPECT_GT(accepted.load(), 0);

    std::set<std::uint64_t> all;
    for (const auto& g : generations) all.insert(g.begin(), g.end());
    EXPECT_EQ(all.size(), 4u * 20u);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
