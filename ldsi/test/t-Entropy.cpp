// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#include <doctest/doctest.h>

#include <ldsi/Entropy.hpp>

#include <cmath>
#include <string>
#include <vector>

using namespace ldsi;

TEST_CASE("entropy - degenerate") {
    auto e = computeEntropy("");
    CHECK(e.shannon == 0);
    CHECK(e.ttr == 0);
    CHECK(e.hapaxRatio == 0);
    CHECK(e.totalTokens == 0);

    // only single byte tokens
    e = computeEntropy("a b c !");
    CHECK(e.totalTokens == 0);
    CHECK(e.shannon == 0);

    e = computeEntropy("Bonjour.");
    CHECK(e.shannon == 0);
    CHECK(e.ttr == 1);
    CHECK(e.hapaxRatio == 1);
    CHECK(e.totalTokens == 1);

    e = computeEntropy("echo echo echo echo");
    CHECK(e.shannon == 0);
    CHECK(e.ttr == doctest::Approx(0.25));
    CHECK(e.hapaxRatio == 0);
}

TEST_CASE("entropy - values") {
    auto e = computeEntropy("chat chat chien");
    CHECK(e.totalTokens == 3);
    CHECK(e.uniqueTokens == 2);
    CHECK(e.hapaxCount == 1);
    CHECK(e.ttr == doctest::Approx(2.0 / 3));
    CHECK(e.hapaxRatio == doctest::Approx(0.5));
    CHECK(e.shannon == doctest::Approx(-(2.0 / 3 * std::log2(2.0 / 3) + 1.0 / 3 * std::log2(1.0 / 3))));

    // all unique: log2(n)
    e = computeEntropy("La temperature est de vingt-cinq degres aujourd'hui.");
    CHECK(e.totalTokens == 9);
    CHECK(e.shannon == doctest::Approx(std::log2(9.0)));
    CHECK(e.ttr == 1);

    // case insensitive
    CHECK(computeEntropy("Chat CHAT chat").shannon == 0);

    std::vector<std::string> tokens = {"un", "deux", "un", "trois"};
    e = computeEntropy(tokens);
    CHECK(e.shannon == doctest::Approx(1.5));
    CHECK(e.hapaxCount == 2);
}

TEST_CASE("entropy - ngram") {
    std::vector<std::string> tokens = {"aa", "bb", "aa", "bb", "aa"};
    CHECK(computeNgramEntropy(tokens, 0) == 0);
    CHECK(computeNgramEntropy(tokens, 6) == 0);
    CHECK(computeNgramEntropy(tokens, 5) == 0);
    CHECK(computeNgramEntropy(tokens, 1) == doctest::Approx(computeEntropy(tokens).shannon));

    // aa bb, bb aa, aa bb, bb aa: two equiprobable bigrams
    CHECK(computeNgramEntropy(tokens, 2) == doctest::Approx(1.0));
}

TEST_CASE("entropy ratio") {
    CHECK(entropyRatio(2, 3) == doctest::Approx(1.5));
    CHECK(entropyRatio(2, 0) == 0);
    CHECK(entropyRatio(0, 0) == 1);
    CHECK(entropyRatio(0, 1.2) == EntropyRatio_ZeroReference);

    CHECK(entropyTerm(1) == 0);
    CHECK(entropyTerm(entropyRatio(2.5, 2.5)) == 0);
    CHECK(entropyTerm(0) == -1);
    CHECK(entropyTerm(1.5) == doctest::Approx(0.5));
    CHECK(entropyTerm(10) == 2);
    CHECK(entropyTerm(EntropyRatio_ZeroReference) == 1);
}
