// -----------------------------
// Examples (compile-time guard)
// -----------------------------
// Define COW_BTREE_EXAMPLE_MAIN to compile and run examples demonstrating clone behavior.
//
// Example 1: clone a tree, write to both handles, and show that each keeps its own contents
//            while untouched nodes stay shared.
// Example 2: polymorphic items through OrderedItem, and a pool shared by two unrelated trees.
// The CMake target cow_btree_example defines the macro.

#ifdef COW_BTREE_EXAMPLE_MAIN
#include <iostream>
#include <memory>
#include <string>

#include "cow_btree.hpp"
#include "ordered_item.hpp"

int main() {
    {
        std::cout << "Example 1: clone and diverge\n";
        CowBTree<int> a(2);
        for (int v : {5, 3, 8, 1, 9, 2, 7}) a.insert_or_replace(v);

        CowBTree<int> b = a.clone();
        b.insert_or_replace(4);
        a.remove(8);

        std::cout << "a:";
        a.ascend([](int v) { std::cout << ' ' << v; return true; });
        std::cout << "\nb:";
        b.ascend([](int v) { std::cout << ' ' << v; return true; });
        std::cout << "\n";

        std::cout << "a after writes (nodes still shared with b are marked):\n";
        a.tree_dump(std::cout, true);
        std::cout << "copy-on-write copies in a: " << a.copy_count()
                  << ", in b: " << b.copy_count() << "\n";

        std::string diag;
        if (!a.validate_invariants(&diag)) {
            std::cout << diag;
            return 1;
        }
    }

    {
        std::cout << "\nExample 2: OrderedItem values and a shared pool\n";
        auto pool = std::make_shared<OrderedItemTree::pool_type>(8);
        OrderedItemTree first(3, pool);
        OrderedItemTree second(3, pool);

        for (int i = 0; i < 50; ++i) first.insert_or_replace(std::make_shared<IntItem>(i));
        first.clear(true);
        std::cout << "pool holds " << pool->size() << " of " << pool->capacity()
                  << " nodes after clearing first\n";

        for (int i = 0; i < 10; ++i) second.insert_or_replace(std::make_shared<IntItem>(i * i));
        std::cout << "pool holds " << pool->size() << " nodes after filling second\n";

        second.descend_less_or_equal(std::make_shared<IntItem>(30), [](const OrderedItemPtr& item) {
            std::cout << ' ' << static_cast<const IntItem&>(*item).value();
            return true;
        });
        std::cout << "\n";
    }

    return 0;
}

#endif // COW_BTREE_EXAMPLE_MAIN
