// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#include <doctest/doctest.h>

#include <ldsi/CooccurrenceGraph.hpp>
#include <ldsi/Topology.hpp>
#include <ldsi/Tokenizer.hpp>

#include <string>
#include <vector>

using namespace ldsi;

TEST_CASE("graph construction") {
    std::vector<std::string> tokens = {"aa", "bb", "cc", "aa", "bb"};
    CooccurrenceGraph g(tokens);

    CHECK(g.nodeCount() == 3);
    REQUIRE(g.find("aa"));
    REQUIRE(g.find("bb"));
    REQUIRE(g.find("cc"));
    CHECK_FALSE(g.find("dd"));

    auto a = *g.find("aa");
    auto b = *g.find("bb");
    auto c = *g.find("cc");
    CHECK(a == 0);
    CHECK(g.label(c) == "cc");

    // aa->bb at distance 1 twice, and at distance 4 once
    CHECK(g.weight(a, b) == doctest::Approx(1.0 / 2 + 1.0 / 2 + 1.0 / 5));
    // bb->cc d1, cc->aa d1, cc->bb d2, bb->aa d2, aa->cc d2
    CHECK(g.weight(b, c) == doctest::Approx(0.5));
    CHECK(g.weight(c, b) == doctest::Approx(1.0 / 3));
    CHECK(g.weight(b, a) == doctest::Approx(1.0 / 3));

    // self pairs don't create edges
    CHECK(g.weight(a, a) == 0);
    CHECK(g.weight(b, b) == 0);

    // all 6 directed edges exist
    CHECK(g.edgeCount() == 6);

    auto adj = g.undirectedAdjacency();
    CHECK(adj[a] == std::vector<CooccurrenceGraph::NodeId>{b, c});
}

TEST_CASE("graph window") {
    std::vector<std::string> tokens;
    for (int i = 0; i < 20; ++i) {
        tokens.push_back("w" + std::string(1, char('a' + i)));
    }
    CooccurrenceGraph g(tokens);
    CHECK(g.nodeCount() == 20);

    // the window spans 15 tokens
    CHECK(g.weight(0, 15) == doctest::Approx(1.0 / 16));
    CHECK(g.weight(0, 16) == 0);
    CHECK(g.outEdges(0).size() == 15);
    CHECK(g.outEdges(19).empty());
    CHECK(g.outEdges(18).size() == 1);
}

TEST_CASE("topology - degenerate") {
    auto t = analyzeTopology("");
    CHECK(t.nodeCount == 0);
    CHECK(t.density == 0);
    CHECK(t.structuralQuality == 0);

    t = analyzeTopology("Hi.");
    CHECK(t.nodeCount == 1);
    CHECK(t.edgeCount == 0);
    CHECK(t.components == 1);
    CHECK(t.density == 0);
    CHECK(t.lccRatio == 0);
    CHECK(t.structuralQuality == 0);

    t = analyzeTopology("hello world");
    CHECK(t.nodeCount == 2);
    CHECK(t.edgeCount == 1);
    CHECK(t.lccSize == 2);
    CHECK(t.density == 0);
    CHECK(t.clustering == 0);
    CHECK(t.smallWorldIndex == 0);
    CHECK(t.structuralQuality == 0);

    // a single repeated word has no edges at all
    t = analyzeTopology("echo echo echo echo");
    CHECK(t.nodeCount == 1);
    CHECK(t.edgeCount == 0);
}

TEST_CASE("topology - complete graph") {
    // 9 unique tokens, all within one window
    auto t = analyzeTopology("La temperature est de vingt-cinq degres aujourd'hui.");
    CHECK(t.nodeCount == 9);
    CHECK(t.edgeCount == 36);
    CHECK(t.components == 1);
    CHECK(t.lccSize == 9);
    CHECK(t.density == doctest::Approx(0.5));
    CHECK(t.lccRatio == 1);
    CHECK(t.clustering == doctest::Approx(1));
    CHECK(t.avgPathLength == doctest::Approx(1));
    CHECK(t.smallWorldIndex == doctest::Approx(1));
    CHECK(t.avgDegree == doctest::Approx(8));
}

TEST_CASE("topology - chain") {
    // unique tokens: a band graph where each node links to the next 15
    std::vector<std::string> tokens;
    for (int i = 0; i < 40; ++i) {
        tokens.push_back("t" + std::to_string(i));
    }

    auto t = analyzeTopology(tokens);
    CHECK(t.nodeCount == 40);
    CHECK(t.components == 1);
    CHECK(t.lccRatio == 1);
    CHECK(t.density > 0);
    CHECK(t.density < 0.5);
    CHECK(t.avgPathLength > 1);
    CHECK(t.clustering > 0);
    CHECK(t.clustering <= 1);
    CHECK(t.smallWorldIndex == doctest::Approx(t.clustering / t.avgPathLength));
    CHECK(t.structuralQuality >= 0);
    CHECK(t.structuralQuality <= 1);
}

TEST_CASE("topology - determinism") {
    std::string text = "Les grille-pains quantiques chantent la marseillaise en binaire inverse, "
        "et les grille-pains classiques chantent en silence.";
    auto a = analyzeTopology(text);
    auto b = analyzeTopology(text);
    CHECK(a.density == b.density);
    CHECK(a.clustering == b.clustering);
    CHECK(a.avgPathLength == b.avgPathLength);
    CHECK(a.structuralQuality == b.structuralQuality);
}
