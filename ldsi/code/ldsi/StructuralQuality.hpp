// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#pragma once
#include "api.h"
#include <optional>
#include <string_view>

namespace ldsi {
struct TopologyMetrics;

// gaussian density score: peaks at the density of well structured prose
inline constexpr double Sq_TargetDensity = 0.35;
inline constexpr double Sq_DensityWidth = 0.15;

// small-world penalty: none up to the knee, then linear, reaching 0 at 1.3
inline constexpr double Sq_SmallWorldKnee = 0.8;
inline constexpr double Sq_SmallWorldSlope = 2.0;

// exp(-((density - 0.35) / 0.15)^2)
LDSI_API double densityScore(double density) noexcept;

// 1 up to 0.8, then max(0, 1 - (index - 0.8) * 2)
LDSI_API double smallWorldPenalty(double smallWorldIndex) noexcept;

// absolute, reference free quality of a co-occurrence graph in [0, 1]
// densityScore * smallWorldPenalty, 0 for graphs with fewer than Topology_MinNodes nodes
//
// near-verbatim repetition and incoherent text both produce graphs with a high
// small-world index and an off-center density (the "horseshoe"), so a monotonic
// threshold can't separate them from structured divergence, while this symmetric
// score penalizes both ends
LDSI_API double structuralQuality(const TopologyMetrics& topology) noexcept;

// legacy reference-relative structure delta of b against a
// 0.5 * (lcc_b - lcc_a) + 0.3 * (clustering_b - clustering_a) + 0.5,
// minus 0.2 if b has more than twice as many components as a
LDSI_API double topologyDelta(const TopologyMetrics& a, const TopologyMetrics& b) noexcept;

// how the topology signal entering lambda is obtained
// the value is the version of the scoring behavior
enum class TopologyStrategy {
    ReferenceDelta = 1,
    AbsoluteQuality = 2,
};

LDSI_API std::string_view toString(TopologyStrategy strategy) noexcept;
LDSI_API std::optional<TopologyStrategy> topologyStrategyFromString(std::string_view str) noexcept;

class LDSI_API TopologyScorer {
public:
    virtual ~TopologyScorer() = default;
    virtual TopologyStrategy strategy() const noexcept = 0;
    virtual double score(const TopologyMetrics& reference, const TopologyMetrics& test) const noexcept = 0;

    // shared stateless instances
    static const TopologyScorer& get(TopologyStrategy strategy) noexcept;
};

} // namespace ldsi
