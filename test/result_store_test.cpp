#include <cassert>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include "math_utils/result_store.hpp"

namespace {
    void expect_sync_error(const std::function<void()> &f) {
        bool thrown = false;
        try {
            f();
        } catch (const math_utils::InternalSynchronizationError &) {
            thrown = true;
        }
        assert(thrown);
    }
}

int result_store_test(int, char *[]) {
    // 5 rows of 2 cols split as 2, 2, 1.
    std::vector<std::uint64_t> boundaries{0, 2, 4, 5};

    {
        math_utils::ResultStore<int> store(boundaries, 2);
        assert(store.num_workers() == 3);
        store.put(2, {9, 10});
        assert(!store.complete());
        store.put(0, {1, 2, 3, 4});
        store.put(1, {5, 6, 7, 8});
        assert(store.complete());

        auto m = store.assemble();
        assert(m.rows() == 5);
        assert(m.cols() == 2);
        assert((m.data() == std::vector<int>{1, 2, 3, 4, 5, 6, 7, 8, 9, 10}));
    }

    {
        math_utils::ResultStore<int> store(boundaries, 2);
        store.put(1, {5, 6, 7, 8});
        expect_sync_error([&] { store.put(1, {5, 6, 7, 8}); });
        expect_sync_error([&] { store.put(3, {1, 2}); });
        expect_sync_error([&] { store.put(0, {1, 2, 3}); });
        expect_sync_error([&] { store.assemble(); });
    }

    {
        // assembling names the first worker still missing.
        math_utils::ResultStore<int> store(boundaries, 2);
        store.put(0, {1, 2, 3, 4});
        store.put(1, {5, 6, 7, 8});
        assert(!store.complete());
        std::string message;
        try {
            store.assemble();
        } catch (const math_utils::InternalSynchronizationError &e) {
            message = e.what();
        }
        assert(message.find("worker 2 never reported") != std::string::npos);

        store.put(2, {9, 10});
        assert(store.complete());
        assert(store.assemble().data().size() == 10);
    }

    expect_sync_error([] { math_utils::ResultStore<int> store({}, 2); });
    return 0;
}
