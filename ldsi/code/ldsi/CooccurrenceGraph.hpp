// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#pragma once
#include "api.h"
#include <itlib/flat_map.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace ldsi {

// weighted co-occurrence graph of a token sequence
//
// nodes are the unique tokens, in order of first appearance
// every token is linked to each of the following W tokens, W = min(MaxWindow, tokens remaining)
// with weight 1 / (distance + 1); weights of repeated pairs accumulate
// edges are directed from the earlier to the later token, and a token never links to itself
//
// the topology metrics only use the undirected view (see undirectedAdjacency)
class LDSI_API CooccurrenceGraph {
public:
    using NodeId = uint32_t;
    using EdgeMap = itlib::flat_map<NodeId, double>;

    static constexpr size_t MaxWindow = 15;

    static double decay(size_t distance) noexcept {
        return 1.0 / (double(distance) + 1.0);
    }

    CooccurrenceGraph() = default;
    explicit CooccurrenceGraph(std::span<const std::string> tokens);

    size_t nodeCount() const noexcept { return m_labels.size(); }

    // number of distinct directed edges
    size_t edgeCount() const noexcept { return m_edgeCount; }

    const std::string& label(NodeId id) const { return m_labels[id]; }
    std::optional<NodeId> find(const std::string& token) const;

    // outgoing edges of a node, sorted by target
    const EdgeMap& outEdges(NodeId id) const { return m_out[id]; }

    // accumulated weight of the directed edge from -> to (0 if there is none)
    double weight(NodeId from, NodeId to) const;

    // sorted neighbour lists of the undirected view
    std::vector<std::vector<NodeId>> undirectedAdjacency() const;

private:
    std::vector<std::string> m_labels;
    std::unordered_map<std::string, NodeId> m_ids;
    std::vector<EdgeMap> m_out;
    size_t m_edgeCount = 0;
};

} // namespace ldsi
