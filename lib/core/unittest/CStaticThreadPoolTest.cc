/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <core/CStaticThreadPool.h>
#include <core/CStopWatch.h>
#include <core/Concurrency.h>

#include <boost/test/unit_test.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

BOOST_AUTO_TEST_SUITE(CStaticThreadPoolTest)

BOOST_AUTO_TEST_CASE(testScheduleAndDrain) {
    std::atomic<int> count{0};
    {
        rca::core::CStaticThreadPool pool{4};
        BOOST_REQUIRE_EQUAL(4, pool.size());
        for (int i = 0; i < 200; ++i) {
            pool.schedule([&count] {
                std::this_thread::sleep_for(std::chrono::microseconds(50));
                ++count;
            });
        }
    }
    // Destruction runs every task queued before shutdown
    BOOST_REQUIRE_EQUAL(200, count.load());
}

BOOST_AUTO_TEST_CASE(testTaskExceptions) {
    std::atomic<int> count{0};
    {
        rca::core::CStaticThreadPool pool{2};
        pool.schedule([] { throw std::runtime_error("task failed"); });
        for (int i = 0; i < 10; ++i) {
            pool.schedule([&count] { ++count; });
        }
    }
    BOOST_REQUIRE_EQUAL(10, count.load());
}

BOOST_AUTO_TEST_CASE(testBusy) {
    rca::core::CStaticThreadPool pool{1};
    BOOST_TEST_REQUIRE(pool.busy() == false);
    pool.busy(true);
    BOOST_TEST_REQUIRE(pool.busy());
    pool.busy(false);
    BOOST_TEST_REQUIRE(pool.busy() == false);
}

BOOST_AUTO_TEST_CASE(testAsync) {
    auto immediate = rca::core::makeExecutor(0);
    BOOST_REQUIRE_EQUAL(1, immediate->concurrency());

    std::thread::id caller{std::this_thread::get_id()};
    auto sameThread = rca::core::async(*immediate, [caller] {
        return std::this_thread::get_id() == caller;
    });
    BOOST_TEST_REQUIRE(sameThread.get());

    auto pooled = rca::core::makeExecutor(3);
    BOOST_REQUIRE_EQUAL(3, pooled->concurrency());

    std::vector<std::future<int>> results;
    for (int i = 0; i < 20; ++i) {
        results.push_back(rca::core::async(*pooled, [i] { return i * i; }));
    }
    rca::core::waitForAll(results);
    int sum{0};
    for (auto& result : results) {
        sum += result.get();
    }
    BOOST_REQUIRE_EQUAL(2470, sum);

    auto failed = rca::core::async(*pooled, []() -> int {
        throw std::runtime_error("bad");
    });
    BOOST_REQUIRE_THROW(failed.get(), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(testStopWatch) {
    rca::core::CStopWatch watch;
    BOOST_TEST_REQUIRE(watch.isRunning() == false);
    BOOST_REQUIRE_EQUAL(0, watch.lap());

    watch.start();
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    std::uint64_t elapsed{watch.stop()};
    BOOST_TEST_REQUIRE(elapsed >= 19);
    BOOST_TEST_REQUIRE(watch.isRunning() == false);

    // Readings accumulate over restarts
    watch.start();
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    BOOST_TEST_REQUIRE(watch.lap() >= elapsed);

    watch.reset();
    BOOST_REQUIRE_EQUAL(0, watch.lap());
}

BOOST_AUTO_TEST_SUITE_END()
