// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#include <doctest/doctest.h>

#include <ldsi/StructuralQuality.hpp>
#include <ldsi/Topology.hpp>

#include <cmath>

using namespace ldsi;

TEST_CASE("density score") {
    CHECK(densityScore(0.35) == 1);
    CHECK(densityScore(0.5) == doctest::Approx(std::exp(-1.0)));
    CHECK(densityScore(0.2) == doctest::Approx(std::exp(-1.0)));
    CHECK(densityScore(0.0) < 0.01);
    CHECK(densityScore(1.0) < 0.01);
}

TEST_CASE("small world penalty") {
    CHECK(smallWorldPenalty(0) == 1);
    CHECK(smallWorldPenalty(0.8) == 1);
    CHECK(smallWorldPenalty(0.95) == doctest::Approx(0.7));
    CHECK(smallWorldPenalty(1.0) == doctest::Approx(0.6));
    CHECK(smallWorldPenalty(1.3) == doctest::Approx(0).epsilon(1e-9));
    CHECK(smallWorldPenalty(5) == 0);
}

TEST_CASE("structural quality") {
    // optimal density, moderate small world
    TopologyMetrics t = {.nodeCount = 10, .density = 0.35, .smallWorldIndex = 0.5};
    CHECK(structuralQuality(t) == doctest::Approx(1.0));

    // optimal density, over-connected
    t.smallWorldIndex = 0.95;
    CHECK(structuralQuality(t) == doctest::Approx(0.7));

    // degenerate graphs never score
    t = {.nodeCount = 2, .density = 0.35, .smallWorldIndex = 0.5};
    CHECK(structuralQuality(t) == 0);
    t.nodeCount = 0;
    CHECK(structuralQuality(t) == 0);

    // both ends of the horseshoe score low
    TopologyMetrics repetitive = {.nodeCount = 8, .density = 0.9, .smallWorldIndex = 1.0};
    TopologyMetrics incoherent = {.nodeCount = 30, .density = 0.05, .smallWorldIndex = 0.9};
    TopologyMetrics structured = {.nodeCount = 30, .density = 0.3, .smallWorldIndex = 0.4};
    CHECK(structuralQuality(repetitive) < 0.01);
    CHECK(structuralQuality(incoherent) < 0.05);
    CHECK(structuralQuality(structured) > 0.8);

    for (double d = 0; d <= 1.0; d += 0.05) {
        for (double sw = 0; sw <= 2.0; sw += 0.1) {
            TopologyMetrics m = {.nodeCount = 5, .density = d, .smallWorldIndex = sw};
            auto sq = structuralQuality(m);
            CHECK(sq >= 0);
            CHECK(sq <= 1);
        }
    }
}

TEST_CASE("topology delta") {
    TopologyMetrics a = {.components = 1, .lccRatio = 1, .clustering = 0.5};
    CHECK(topologyDelta(a, a) == doctest::Approx(0.5));

    TopologyMetrics b = {.components = 3, .lccRatio = 0.5, .clustering = 0.2};
    // 0.5 * -0.5 + 0.3 * -0.3 - 0.2 + 0.5
    CHECK(topologyDelta(a, b) == doctest::Approx(-0.25 - 0.09 - 0.2 + 0.5));

    b.components = 2;
    CHECK(topologyDelta(a, b) == doctest::Approx(-0.25 - 0.09 + 0.5));
}

TEST_CASE("topology strategy") {
    CHECK(toString(TopologyStrategy::AbsoluteQuality) == "absolute-v2");
    CHECK(toString(TopologyStrategy::ReferenceDelta) == "delta-v1");
    CHECK(topologyStrategyFromString("absolute") == TopologyStrategy::AbsoluteQuality);
    CHECK(topologyStrategyFromString("absolute-v2") == TopologyStrategy::AbsoluteQuality);
    CHECK(topologyStrategyFromString("delta") == TopologyStrategy::ReferenceDelta);
    CHECK(topologyStrategyFromString("delta-v1") == TopologyStrategy::ReferenceDelta);
    CHECK_FALSE(topologyStrategyFromString("relative"));

    TopologyMetrics a = {.nodeCount = 10, .components = 1, .density = 0.35, .lccRatio = 1, .clustering = 0.5, .smallWorldIndex = 0.5};
    TopologyMetrics b = {.nodeCount = 10, .components = 1, .density = 0.5, .lccRatio = 1, .clustering = 0.5, .smallWorldIndex = 0.5};

    auto& absolute = TopologyScorer::get(TopologyStrategy::AbsoluteQuality);
    CHECK(absolute.strategy() == TopologyStrategy::AbsoluteQuality);
    CHECK(absolute.score(a, b) == structuralQuality(b));
    CHECK(absolute.score(b, b) == structuralQuality(b));

    auto& delta = TopologyScorer::get(TopologyStrategy::ReferenceDelta);
    CHECK(delta.strategy() == TopologyStrategy::ReferenceDelta);
    CHECK(delta.score(a, b) == topologyDelta(a, b));
}
