// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#include "Topology.hpp"
#include "CooccurrenceGraph.hpp"
#include "StructuralQuality.hpp"
#include "Tokenizer.hpp"
#include "Logging.hpp"
#include <algorithm>
#include <deque>
#include <limits>
#include <vector>

namespace ldsi {

namespace {
using NodeId = CooccurrenceGraph::NodeId;
using Adjacency = std::vector<std::vector<NodeId>>;

constexpr uint32_t Unvisited = std::numeric_limits<uint32_t>::max();

struct Components {
    std::vector<uint32_t> label; // component index per node
    std::vector<size_t> sizes;
    uint32_t largest = 0; // first component (lowest node id) of maximal size
};

Components labelComponents(const Adjacency& adj) {
    Components c;
    c.label.assign(adj.size(), Unvisited);

    std::deque<NodeId> queue;
    for (NodeId start = 0; start < NodeId(adj.size()); ++start) {
        if (c.label[start] != Unvisited) continue;

        const auto index = uint32_t(c.sizes.size());
        size_t size = 0;
        c.label[start] = index;
        queue.push_back(start);
        while (!queue.empty()) {
            auto cur = queue.front();
            queue.pop_front();
            ++size;
            for (auto n : adj[cur]) {
                if (c.label[n] == Unvisited) {
                    c.label[n] = index;
                    queue.push_back(n);
                }
            }
        }

        c.sizes.push_back(size);
        if (size > c.sizes[c.largest]) {
            c.largest = index;
        }
    }

    return c;
}

double averageClustering(const Adjacency& adj) {
    double total = 0;
    size_t counted = 0;

    for (auto& neighbors : adj) {
        const size_t k = neighbors.size();
        if (k < 2) continue;

        size_t links = 0;
        for (size_t i = 0; i < k; ++i) {
            auto& ni = adj[neighbors[i]];
            for (size_t j = i + 1; j < k; ++j) {
                if (std::binary_search(ni.begin(), ni.end(), neighbors[j])) {
                    ++links;
                }
            }
        }

        total += double(links) / (double(k) * double(k - 1) / 2.0);
        ++counted;
    }

    return counted > 0 ? total / double(counted) : 0.0;
}

// all-pairs bfs restricted to one component
double averagePathLength(const Adjacency& adj, const Components& comps, uint32_t component) {
    size_t totalHops = 0;
    size_t pairs = 0;

    std::vector<uint32_t> dist(adj.size());
    std::deque<NodeId> queue;

    for (NodeId source = 0; source < NodeId(adj.size()); ++source) {
        if (comps.label[source] != component) continue;

        std::fill(dist.begin(), dist.end(), Unvisited);
        dist[source] = 0;
        queue.push_back(source);
        while (!queue.empty()) {
            auto cur = queue.front();
            queue.pop_front();
            for (auto n : adj[cur]) {
                if (dist[n] == Unvisited) {
                    dist[n] = dist[cur] + 1;
                    totalHops += dist[n];
                    ++pairs;
                    queue.push_back(n);
                }
            }
        }
    }

    return pairs > 0 ? double(totalHops) / double(pairs) : 0.0;
}
} // namespace

TopologyMetrics computeTopology(const CooccurrenceGraph& graph) {
    TopologyMetrics m;
    m.nodeCount = graph.nodeCount();
    m.edgeCount = graph.edgeCount();

    if (m.nodeCount == 0) {
        return m;
    }

    const auto adj = graph.undirectedAdjacency();
    const auto comps = labelComponents(adj);
    m.components = comps.sizes.size();
    m.lccSize = comps.sizes[comps.largest];

    if (m.nodeCount < Topology_MinNodes) {
        // degenerate graph: every ratio metric stays 0
        return m;
    }

    const double n = double(m.nodeCount);

    size_t degreeSum = 0;
    for (auto& neighbors : adj) {
        degreeSum += neighbors.size();
    }

    m.density = double(m.edgeCount) / (n * (n - 1));
    m.lccRatio = double(m.lccSize) / n;
    m.clustering = averageClustering(adj);
    m.avgPathLength = averagePathLength(adj, comps, comps.largest);
    m.smallWorldIndex = m.avgPathLength > 0 ? m.clustering / m.avgPathLength : 0.0;
    m.avgDegree = double(degreeSum) / n;
    m.structuralQuality = structuralQuality(m);

    LDSI_LOG(Debug, "topology: nodes = ", m.nodeCount, ", edges = ", m.edgeCount, ", density = ", m.density,
        ", lcc = ", m.lccRatio, ", clustering = ", m.clustering, ", path = ", m.avgPathLength,
        ", small world = ", m.smallWorldIndex, ", sq = ", m.structuralQuality);

    return m;
}

TopologyMetrics analyzeTopology(std::span<const std::string> tokens) {
    CooccurrenceGraph graph(tokens);
    return computeTopology(graph);
}

TopologyMetrics analyzeTopology(std::string_view text) {
    auto tokens = tokenize(text);
    return analyzeTopology(tokens);
}

} // namespace ldsi
