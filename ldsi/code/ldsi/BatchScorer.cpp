// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#include "BatchScorer.hpp"
#include "Logging.hpp"
#include <bstl/thread_runner.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <algorithm>
#include <thread>

namespace asio = boost::asio;

namespace ldsi {

BatchScorer::BatchScorer(size_t numThreads, ScoringConfig config)
    : m_numThreads(numThreads ? numThreads : std::max(1u, std::thread::hardware_concurrency()))
    , m_config(config)
{
    validate(m_config);
}

std::vector<BatchScorer::ItemResult> BatchScorer::score(std::span<const Item> items) const {
    std::vector<ItemResult> results;
    results.reserve(items.size());
    for (size_t i = 0; i < items.size(); ++i) {
        results.emplace_back(itlib::unexpected(std::string("not scored")));
    }

    if (items.empty()) return results;

    asio::io_context ctx;
    for (size_t i = 0; i < items.size(); ++i) {
        // each task only touches its own slot
        post(ctx, [this, &item = items[i], &slot = results[i], i] {
            slot = scoreItem(item, m_config);
            if (!slot) {
                LDSI_LOG(Warning, "batch: item ", i, " failed: ", slot.error());
            }
        });
    }

    // no work guard: the threads exit when the queue is drained
    bstl::thread_runner runner(ctx, std::min(m_numThreads, items.size()));
    runner.join();

    return results;
}

BatchScorer::ItemResult BatchScorer::scoreItem(const Item& item, const ScoringConfig& config) {
    try {
        return ItemResult(computeLdsi(item.textA, item.textB, config));
    }
    catch (std::exception& e) {
        return ItemResult(itlib::unexpected(std::string(e.what())));
    }
}

} // namespace ldsi
