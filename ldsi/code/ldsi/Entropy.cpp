// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#include "Entropy.hpp"
#include "Tokenizer.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <vector>

namespace ldsi {

namespace {
// frequencies are summed in key order so the result doesn't depend on hashing
template <typename Key>
double shannonEntropy(const std::map<Key, size_t>& frequencies, size_t total) {
    if (total == 0) return 0.0;

    double h = 0.0;
    const double dtotal = double(total);
    for (auto& [_, count] : frequencies) {
        const double p = double(count) / dtotal;
        h -= p * std::log2(p);
    }

    // a single symbol gives -1 * log2(1) = -0.0
    return h > 0 ? h : 0.0;
}
} // namespace

EntropyMeasurement computeEntropy(std::span<const std::string> tokens) {
    EntropyMeasurement m;
    m.totalTokens = tokens.size();

    std::map<std::string_view, size_t> frequencies;
    for (auto& t : tokens) {
        ++frequencies[t];
    }

    m.uniqueTokens = frequencies.size();
    m.hapaxCount = size_t(std::count_if(frequencies.begin(), frequencies.end(), [](auto& f) {
        return f.second == 1;
    }));

    m.shannon = shannonEntropy(frequencies, m.totalTokens);

    if (m.totalTokens > 0) {
        m.ttr = double(m.uniqueTokens) / double(m.totalTokens);
        m.hapaxRatio = double(m.hapaxCount) / double(m.uniqueTokens);
    }

    return m;
}

EntropyMeasurement computeEntropy(std::string_view text) {
    auto tokens = tokenize(text);
    return computeEntropy(tokens);
}

double computeNgramEntropy(std::span<const std::string> tokens, size_t n) {
    if (n == 0 || tokens.size() < n) return 0.0;

    std::map<std::vector<std::string_view>, size_t> frequencies;
    const size_t total = tokens.size() - n + 1;
    for (size_t i = 0; i < total; ++i) {
        std::vector<std::string_view> gram(tokens.begin() + i, tokens.begin() + i + n);
        ++frequencies[std::move(gram)];
    }

    return shannonEntropy(frequencies, total);
}

double entropyRatio(double hA, double hB) noexcept {
    if (hA > 0) return hB / hA;
    if (hB > 0) return EntropyRatio_ZeroReference;
    return 1.0;
}

double entropyTerm(double ratio) noexcept {
    return std::clamp(ratio - 1.0, EntropyTerm_Min, EntropyTerm_Max);
}

} // namespace ldsi
