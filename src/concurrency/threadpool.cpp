#include <iostream>
#include <system_error>
#include "threadpool.hpp"
#include "globals.h"

namespace concurrency {
    std::uint64_t num_cpus = std::thread::hardware_concurrency();

    SpawnError::SpawnError(std::uint64_t thread_index, const std::string &cause) :
            std::runtime_error("threadpool: failed to start thread " + std::to_string(thread_index) + ": " + cause),
            index(thread_index) {}


    threadpool::threadpool(uint64_t n_threads) : chan() {
#ifdef PARMUL_DEBUG
        std::cout << "creating threadpool with " << n_threads << " threads" << std::endl;
#endif
        threads.reserve(n_threads);
        for (uint64_t i = 0; i < n_threads; ++i) {
            try {
                threads.emplace_back([this]() { work_loop(); });
            } catch (const std::system_error &e) {
                shutdown();
                throw SpawnError(i, e.what());
            }
        }
    }

    threadpool::threadpool() : threadpool(num_cpus) {}

    threadpool::~threadpool() {
        shutdown();
#ifdef PARMUL_DEBUG
        std::cout << "threadpool joined" << std::endl;
#endif
    }

    void threadpool::work_loop() {
        while (true) {
            auto task = chan.read();
            if (!task.ok) {
                return; // closed channel.
            }

            try {
                task.answer.f();
            } catch (std::exception &e) {
                std::cerr << "threadpool exception::" << task.answer.name << ":" << e.what() << std::endl;
            }

            if (task.answer.wg == nullptr) {
                continue;
            }
            try {
                task.answer.wg->count_down();
            } catch (std::logic_error &e) {
                std::cerr << "threadpool latch::" << task.answer.name << ":" << e.what() << std::endl;
            }
        }
    }

    void threadpool::shutdown() {
        chan.close();
        for (auto &t: threads) {
            if (t.joinable()) {
                t.join();
            }
        }
    }
}
