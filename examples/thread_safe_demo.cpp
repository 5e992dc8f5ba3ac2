// thread_safe_demo: one store, many threads
//
// Demonstrates: an InMemoryStore built with make_lock(true) serializes
// every operation, so writers and readers share it without any locking
// of their own. The same store built with make_lock(false) is only for
// single-threaded use.
//
// Build: cmake --build build
// Run:   ./build/examples/thread_safe_demo

#include <docstore-cpp/docstore.hpp>

#include <atomic>
#include <cstddef>
#include <cstdio>
#include <string>
#include <thread>
#include <vector>

namespace ds = docstore_cpp;

int main() {
    std::printf("Hardware threads: %u\n", std::thread::hardware_concurrency());

    auto db = ds::InMemoryStore{"db", ds::make_lock(true)};

    // =========================================================================
    // Scenario 1: Concurrent inserts
    // =========================================================================
    std::printf("\n=== Scenario 1: 32 concurrent writers ===\n");

    {
        auto writers = std::vector<std::jthread>{};
        for (int t = 0; t < 32; ++t) {
            writers.emplace_back([&db, t] {
                for (int i = 0; i < 50; ++i) {
                    db.create("jobs", ds::Value{ds::Object{
                        {"_id", "t" + std::to_string(t) + "_" + std::to_string(i)},
                        {"worker", t},
                        {"state", "queued"},
                    }});
                }
            });
        }
    }
    std::printf("32 threads x 50 inserts = %zu records\n", db.count("jobs"));

    // =========================================================================
    // Scenario 2: Readers + updaters simultaneously
    // =========================================================================
    std::printf("\n=== Scenario 2: Readers + updaters ===\n");

    auto done = std::atomic<bool>{false};
    auto reads = std::atomic<int>{0};

    {
        auto readers = std::vector<std::jthread>{};
        for (int r = 0; r < 8; ++r) {
            readers.emplace_back([&] {
                while (!done.load(std::memory_order_relaxed)) {
                    (void)db.count("jobs", {{"state", "done"}});
                    reads.fetch_add(1, std::memory_order_relaxed);
                }
            });
        }

        auto updaters = std::vector<std::jthread>{};
        for (int t = 0; t < 32; ++t) {
            updaters.emplace_back([&db, t] {
                auto options = ds::UpdateOptions{};
                options.push = {{"log", "finished"}};
                db.set_list("jobs", {{"worker", t}}, {{"state", "done"}}, options);
            });
        }
        updaters.clear();
        done.store(true, std::memory_order_relaxed);
    }

    std::printf("Done: %zu of %zu, %d concurrent reads\n",
                db.count("jobs", {{"state", "done"}}), db.count("jobs"), reads.load());

    // =========================================================================
    // Scenario 3: Concurrent deletes never remove a record twice
    // =========================================================================
    std::printf("\n=== Scenario 3: Competing deleters ===\n");

    auto deleted = std::atomic<std::size_t>{0};
    {
        auto deleters = std::vector<std::jthread>{};
        for (int d = 0; d < 16; ++d) {
            deleters.emplace_back([&] {
                while (auto result = db.del_one("jobs", {}, false)) {
                    deleted.fetch_add(result->deleted, std::memory_order_relaxed);
                }
            });
        }
    }
    std::printf("Deleted %zu records, %zu left\n", deleted.load(), db.count("jobs"));

    return 0;
}
