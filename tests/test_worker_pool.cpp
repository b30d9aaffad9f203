#include <catch2/catch_test_macros.hpp>
#include "server/worker_pool.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>

using namespace sqlmcp;

TEST_CASE("WorkerPool: runs submitted tasks", "[worker_pool]") {
    WorkerPool pool(2, 8);
    std::atomic<int> ran{0};
    for (int i = 0; i < 5; ++i) {
        REQUIRE(pool.try_submit([&] { ran.fetch_add(1); }));
    }
    pool.shutdown();
    CHECK(ran.load() == 5);
}

TEST_CASE("WorkerPool: refuses work when the queue is full", "[worker_pool]") {
    WorkerPool pool(1, 2);
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    std::promise<void> started;

    // Occupy the single worker
    REQUIRE(pool.try_submit([&, gate] {
        started.set_value();
        gate.wait();
    }));
    started.get_future().wait();

    CHECK(pool.try_submit([] {}));
    CHECK(pool.try_submit([] {}));
    CHECK(pool.queued() == 2);
    CHECK_FALSE(pool.try_submit([] {}));

    release.set_value();
    pool.shutdown();
    CHECK(pool.queued() == 0);
}

TEST_CASE("WorkerPool: shutdown without running pending drops the queue", "[worker_pool]") {
    WorkerPool pool(1, 4);
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    std::promise<void> started;
    std::atomic<int> ran{0};

    REQUIRE(pool.try_submit([&, gate] {
        started.set_value();
        gate.wait();
    }));
    started.get_future().wait();
    REQUIRE(pool.try_submit([&] { ran.fetch_add(1); }));
    REQUIRE(pool.try_submit([&] { ran.fetch_add(1); }));

    std::thread stopper([&] { pool.shutdown(false); });
    while (pool.queued() != 0) {
        std::this_thread::yield();
    }
    release.set_value();
    stopper.join();

    CHECK(ran.load() == 0);
}

TEST_CASE("WorkerPool: refuses work after shutdown", "[worker_pool]") {
    WorkerPool pool(2, 4);
    pool.shutdown();
    CHECK_FALSE(pool.try_submit([] {}));
    pool.shutdown();  // idempotent
}

TEST_CASE("WorkerPool: a throwing task does not kill the worker", "[worker_pool]") {
    WorkerPool pool(1, 4);
    std::atomic<bool> ran_after{false};
    REQUIRE(pool.try_submit([] { throw std::runtime_error("boom"); }));
    REQUIRE(pool.try_submit([&] { ran_after = true; }));
    pool.shutdown();
    CHECK(ran_after.load());
}

TEST_CASE("WorkerPool: tasks run concurrently across workers", "[worker_pool]") {
    WorkerPool pool(3, 8);
    CHECK(pool.worker_count() == 3);

    std::atomic<int> active{0};
    std::atomic<int> peak{0};
    for (int i = 0; i < 3; ++i) {
        REQUIRE(pool.try_submit([&] {
            const int now = active.fetch_add(1) + 1;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            active.fetch_sub(1);
        }));
    }
    pool.shutdown();
    CHECK(peak.load() >= 2);
}
