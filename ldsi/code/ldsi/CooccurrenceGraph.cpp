// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#include "CooccurrenceGraph.hpp"
#include <algorithm>

namespace ldsi {

CooccurrenceGraph::CooccurrenceGraph(std::span<const std::string> tokens) {
    std::vector<NodeId> seq;
    seq.reserve(tokens.size());
    for (auto& t : tokens) {
        auto [it, inserted] = m_ids.try_emplace(t, NodeId(m_labels.size()));
        if (inserted) {
            m_labels.push_back(t);
            m_out.emplace_back();
        }
        seq.push_back(it->second);
    }

    for (size_t i = 0; i < seq.size(); ++i) {
        const size_t window = std::min(MaxWindow, seq.size() - i - 1);
        for (size_t d = 1; d <= window; ++d) {
            const auto from = seq[i];
            const auto to = seq[i + d];
            if (from == to) continue;

            auto& edges = m_out[from];
            const auto before = edges.size();
            edges[to] += decay(d);
            if (edges.size() != before) {
                ++m_edgeCount;
            }
        }
    }
}

std::optional<CooccurrenceGraph::NodeId> CooccurrenceGraph::find(const std::string& token) const {
    auto it = m_ids.find(token);
    if (it == m_ids.end()) return std::nullopt;
    return it->second;
}

double CooccurrenceGraph::weight(NodeId from, NodeId to) const {
    auto& edges = m_out[from];
    auto it = edges.find(to);
    return it == edges.end() ? 0.0 : it->second;
}

std::vector<std::vector<CooccurrenceGraph::NodeId>> CooccurrenceGraph::undirectedAdjacency() const {
    std::vector<std::vector<NodeId>> adj(m_labels.size());
    for (NodeId from = 0; from < NodeId(m_out.size()); ++from) {
        for (auto& [to, _] : m_out[from]) {
            adj[from].push_back(to);
            adj[to].push_back(from);
        }
    }

    // a -> b and b -> a collapse into one undirected edge
    for (auto& n : adj) {
        std::sort(n.begin(), n.end());
        n.erase(std::unique(n.begin(), n.end()), n.end());
    }
    return adj;
}

} // namespace ldsi
