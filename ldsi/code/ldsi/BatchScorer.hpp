// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#pragma once
#include "api.h"
#include "Ldsi.hpp"
#include <itlib/expected.hpp>
#include <span>
#include <string>
#include <vector>

namespace ldsi {

// scores independent (a, b) pairs concurrently
// a failing item yields an error in its own slot and never affects the others
class LDSI_API BatchScorer {
public:
    struct Item {
        std::string textA;
        std::string textB;
    };

    using ItemResult = itlib::expected<LdsiResult, std::string>;

    // numThreads = 0 means std::thread::hardware_concurrency
    // throws std::invalid_argument if config is invalid
    explicit BatchScorer(size_t numThreads, ScoringConfig config = {});

    size_t numThreads() const noexcept { return m_numThreads; }
    const ScoringConfig& config() const noexcept { return m_config; }

    // results are in the order of items
    std::vector<ItemResult> score(std::span<const Item> items) const;

    // score a single item with an already validated config
    // failures are returned as the error of the result
    static ItemResult scoreItem(const Item& item, const ScoringConfig& config);

private:
    size_t m_numThreads;
    ScoringConfig m_config;
};

} // namespace ldsi
