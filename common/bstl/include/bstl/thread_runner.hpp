// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#pragma once
#include <thread>
#include <vector>
#include <cstddef>

namespace bstl {

// runs ctx.run() on n threads
// join() (or the destructor) waits for all of them
// if ctx has no work guard the threads exit as soon as the posted work is done
class thread_runner {
    std::vector<std::thread> m_threads; // would use jthread, but apple clang still doesn't support them
public:
    thread_runner() = default;

    template <typename Ctx>
    thread_runner(Ctx& ctx, size_t n) {
        start(ctx, n);
    }

    thread_runner(const thread_runner&) = delete;
    thread_runner& operator=(const thread_runner&) = delete;

    ~thread_runner() {
        join();
    }

    template <typename Ctx>
    void start(Ctx& ctx, size_t n) {
        if (!m_threads.empty()) return; // already running
        m_threads.reserve(n);
        for (size_t i = 0; i < n; ++i) {
            m_threads.push_back(std::thread([&ctx]() {
                ctx.run();
            }));
        }
    }

    void join() {
        for (auto& t : m_threads) {
            t.join();
        }
        m_threads.clear();
    }

    size_t num_threads() const noexcept {
        return m_threads.size();
    }

    bool empty() const noexcept {
        return m_threads.empty();
    }
};

} // namespace bstl
