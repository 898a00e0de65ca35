// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#include <bstl/thread_runner.hpp>
#include <doctest/doctest.h>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <atomic>
#include <mutex>
#include <set>

namespace net = boost::asio;

TEST_CASE("thread_runner drain") {
    net::io_context ctx;
    std::atomic_int sum = 0;
    std::mutex mutex;
    std::set<std::thread::id> ids;

    for (int i = 1; i <= 100; ++i) {
        post(ctx, [&, i] {
            sum += i;
            std::lock_guard l(mutex);
            ids.insert(std::this_thread::get_id());
        });
    }

    bstl::thread_runner runner(ctx, 3);
    CHECK(runner.num_threads() == 3);
    CHECK_FALSE(runner.empty());

    runner.join();
    CHECK(runner.empty());
    CHECK(sum == 5050);
    CHECK(ids.size() >= 1);
    CHECK(ids.size() <= 3);
    CHECK(ids.count(std::this_thread::get_id()) == 0);
}

TEST_CASE("thread_runner guard") {
    net::io_context ctx;
    auto guard = net::make_work_guard(ctx);

    std::atomic_int count = 0;
    bstl::thread_runner runner;
    CHECK(runner.empty());
    runner.start(ctx, 2);
    runner.start(ctx, 5); // no-op while running
    CHECK(runner.num_threads() == 2);

    for (int i = 0; i < 10; ++i) {
        post(ctx, [&] { ++count; });
    }

    post(ctx, [&] { guard.reset(); });
    runner.join();
    CHECK(count == 10);
}

TEST_CASE("thread_runner destructor") {
    net::io_context ctx;
    std::atomic_int count = 0;
    post(ctx, [&] { ++count; });
    {
        bstl::thread_runner runner(ctx, 1);
    }
    CHECK(count == 1);
}
