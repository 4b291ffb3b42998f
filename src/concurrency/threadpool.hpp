#pragma once

#include <thread>
#include <vector>
#include <string>
#include <stdexcept>
#include <functional>
#include <memory>
#include "channel.hpp"
#include "safelatch.h"
#include "globals.h"

namespace concurrency {
    struct Task {
        std::function<void()> f;
        std::shared_ptr<safelatch> wg;
        std::string name;
    };

    /**
     * Raised by the threadpool constructor when the OS refuses to start one of its threads.
     * The threads started before the failure are already joined when this is thrown.
     */
    class SpawnError : public std::runtime_error {
    public:
        SpawnError(std::uint64_t thread_index, const std::string &cause);

        [[nodiscard]] std::uint64_t thread_index() const noexcept { return index; }

    private:
        std::uint64_t index;
    };


    /**
     * A fixed set of threads consuming tasks from a channel.
     * The pool lives as long as the object: the destructor closes the channel, lets the threads drain the
     * remaining tasks and joins them.
     */
    class threadpool {
    public:
        explicit threadpool();

        explicit threadpool(uint64_t n_threads);

        ~threadpool();

        threadpool(const threadpool &) = delete;

        threadpool &operator=(const threadpool &) = delete;

        inline void submit(Task &&task) { chan.write(std::move(task)); }

        [[nodiscard]] inline std::uint64_t size() const { return threads.size(); }

    private:
        void work_loop();

        void shutdown();

        std::vector<std::thread> threads;
        Channel<Task> chan;
    };


}
