#include <docstore-cpp/lock.hpp>

#include <docstore-cpp/memory_store.hpp>

#include <gtest/gtest.h>

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace ds = docstore_cpp;

// -- Lockable -----------------------------------------------------------------

TEST(Lock, make_lock_picks_the_implementation) {
    auto safe = ds::make_lock(true);
    auto unsafe = ds::make_lock(false);
    EXPECT_NE(dynamic_cast<ds::MutexLock*>(safe.get()), nullptr);
    EXPECT_NE(dynamic_cast<ds::NoopLock*>(unsafe.get()), nullptr);
}

TEST(Lock, noop_lock_can_be_taken_twice) {
    auto lock = ds::NoopLock{};
    auto outer = std::lock_guard{lock};
    auto inner = std::lock_guard{lock};
    SUCCEED();
}

TEST(Lock, mutex_lock_works_with_scoped_lock) {
    auto lock = ds::MutexLock{};
    auto counter = 0;
    auto threads = std::vector<std::thread>{};
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 1000; ++i) {
                auto guard = std::scoped_lock{lock};
                ++counter;
            }
        });
    }
    for (auto& th : threads) th.join();
    EXPECT_EQ(counter, 4000);
}

// -- Shared store -------------------------------------------------------------

TEST(Lock, concurrent_inserts_into_a_shared_store) {
    auto db = ds::InMemoryStore{"db", ds::make_lock(true)};
    constexpr int thread_count = 8;
    constexpr int per_thread = 100;

    auto threads = std::vector<std::thread>{};
    for (int t = 0; t < thread_count; ++t) {
        threads.emplace_back([&db, t] {
            for (int i = 0; i < per_thread; ++i) {
                db.create("items", ds::Value{ds::Object{{"owner", t}, {"n", i}}});
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(db.count("items"), static_cast<std::size_t>(thread_count * per_thread));
    EXPECT_EQ(db.count("items", {{"owner", 3}}), static_cast<std::size_t>(per_thread));
}

TEST(Lock, concurrent_updates_are_not_lost) {
    auto db = ds::InMemoryStore{"db", ds::make_lock(true)};
    db.create("counters", ds::Value{ds::Object{{"_id", "c"}, {"hits", ds::Array{}}}});

    auto threads = std::vector<std::thread>{};
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&db, t] {
            for (int i = 0; i < 50; ++i) {
                auto options = ds::UpdateOptions{};
                options.push = {{"hits", t * 100 + i}};
                db.set_one("counters", {{"_id", "c"}}, {}, options);
            }
        });
    }
    for (auto& th : threads) th.join();

    const auto record = db.get_one("counters", {{"_id", "c"}});
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->find(ds::Key{"hits"})->size(), 200u);
}

TEST(Lock, reconnect_while_other_threads_operate) {
    auto db = ds::InMemoryStore{"db_reconnect_a", ds::make_lock(true)};
    auto threads = std::vector<std::thread>{};
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&db, t] {
            for (int i = 0; i < 100; ++i) {
                db.create("items", ds::Value{ds::Object{{"owner", t}, {"n", i}}});
                (void)db.count("items", {{"owner", t}});
            }
        });
    }
    threads.emplace_back([&db] {
        for (int i = 0; i < 50; ++i) {
            auto config = ds::Config{};
            config.logger_name = i % 2 ? "db_reconnect_a" : "db_reconnect_b";
            db.connect(config);
            (void)db.logger();
            db.disconnect();
        }
    });
    for (auto& th : threads) th.join();

    EXPECT_EQ(db.count("items"), 400u);
    EXPECT_EQ(db.logger()->name(), "db_reconnect_a");
}
