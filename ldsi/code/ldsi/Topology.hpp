// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#pragma once
#include "api.h"
#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace ldsi {
class CooccurrenceGraph;

// graphs with fewer nodes have all ratio metrics (and structural quality) defined as 0
inline constexpr size_t Topology_MinNodes = 3;

struct TopologyMetrics {
    size_t nodeCount = 0;
    size_t edgeCount = 0; // distinct directed edges
    size_t components = 0; // connected components of the undirected view
    size_t lccSize = 0; // nodes in the largest connected component

    double density = 0; // edgeCount / (n * (n - 1))
    double lccRatio = 0; // lccSize / n
    double clustering = 0; // mean local transitivity over nodes of degree >= 2
    double avgPathLength = 0; // mean hop count over reachable pairs of the lcc
    double smallWorldIndex = 0; // clustering / avgPathLength
    double avgDegree = 0; // undirected

    double structuralQuality = 0; // in [0, 1], see StructuralQuality.hpp
};

LDSI_API TopologyMetrics computeTopology(const CooccurrenceGraph& graph);

// build the co-occurrence graph of tokens and compute its metrics
LDSI_API TopologyMetrics analyzeTopology(std::span<const std::string> tokens);

// tokenizes with ldsi::tokenize
LDSI_API TopologyMetrics analyzeTopology(std::string_view text);

} // namespace ldsi
