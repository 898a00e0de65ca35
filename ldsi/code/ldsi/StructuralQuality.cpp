// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#include "StructuralQuality.hpp"
#include "Topology.hpp"
#include <algorithm>
#include <cmath>

namespace ldsi {

double densityScore(double density) noexcept {
    const double z = (density - Sq_TargetDensity) / Sq_DensityWidth;
    return std::exp(-(z * z));
}

double smallWorldPenalty(double smallWorldIndex) noexcept {
    if (smallWorldIndex <= Sq_SmallWorldKnee) return 1.0;
    return std::max(0.0, 1.0 - (smallWorldIndex - Sq_SmallWorldKnee) * Sq_SmallWorldSlope);
}

double structuralQuality(const TopologyMetrics& topology) noexcept {
    if (topology.nodeCount < Topology_MinNodes) return 0.0;
    const double sq = densityScore(topology.density) * smallWorldPenalty(topology.smallWorldIndex);
    return std::clamp(sq, 0.0, 1.0);
}

double topologyDelta(const TopologyMetrics& a, const TopologyMetrics& b) noexcept {
    const double lccScore = b.lccRatio - a.lccRatio;
    const double clusteringScore = b.clustering - a.clustering;
    const double fragmentationPenalty = b.components > a.components * 2 ? -0.2 : 0.0;
    return lccScore * 0.5 + clusteringScore * 0.3 + fragmentationPenalty + 0.5;
}

std::string_view toString(TopologyStrategy strategy) noexcept {
    switch (strategy) {
    case TopologyStrategy::ReferenceDelta: return "delta-v1";
    case TopologyStrategy::AbsoluteQuality: return "absolute-v2";
    }
    return "unknown";
}

std::optional<TopologyStrategy> topologyStrategyFromString(std::string_view str) noexcept {
    if (str == "delta-v1" || str == "delta") return TopologyStrategy::ReferenceDelta;
    if (str == "absolute-v2" || str == "absolute") return TopologyStrategy::AbsoluteQuality;
    return std::nullopt;
}

namespace {
class ReferenceDeltaScorer final : public TopologyScorer {
public:
    virtual TopologyStrategy strategy() const noexcept override {
        return TopologyStrategy::ReferenceDelta;
    }
    virtual double score(const TopologyMetrics& reference, const TopologyMetrics& test) const noexcept override {
        return topologyDelta(reference, test);
    }
};

class AbsoluteQualityScorer final : public TopologyScorer {
public:
    virtual TopologyStrategy strategy() const noexcept override {
        return TopologyStrategy::AbsoluteQuality;
    }
    virtual double score(const TopologyMetrics&, const TopologyMetrics& test) const noexcept override {
        return structuralQuality(test);
    }
};
} // namespace

const TopologyScorer& TopologyScorer::get(TopologyStrategy strategy) noexcept {
    static const ReferenceDeltaScorer referenceDelta;
    static const AbsoluteQualityScorer absoluteQuality;
    switch (strategy) {
    case TopologyStrategy::ReferenceDelta: return referenceDelta;
    case TopologyStrategy::AbsoluteQuality: return absoluteQuality;
    }
    return absoluteQuality;
}

} // namespace ldsi
