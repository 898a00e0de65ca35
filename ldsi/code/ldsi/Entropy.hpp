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

struct EntropyMeasurement {
    double shannon = 0; // bits
    double ttr = 0; // type-token ratio: unique / total
    double hapaxRatio = 0; // tokens seen exactly once / unique

    size_t totalTokens = 0;
    size_t uniqueTokens = 0;
    size_t hapaxCount = 0;
};

// ratio reported when the reference has zero entropy but the test text doesn't
inline constexpr double EntropyRatio_ZeroReference = 2.0;

// bounds of the entropy term entering lambda
inline constexpr double EntropyTerm_Min = -1.0;
inline constexpr double EntropyTerm_Max = 2.0;

// lexical diversity of a token sequence
// empty input yields all zeros, a single token yields shannon = 0 and ttr = 1
LDSI_API EntropyMeasurement computeEntropy(std::span<const std::string> tokens);

// tokenizes with ldsi::tokenize
LDSI_API EntropyMeasurement computeEntropy(std::string_view text);

// shannon entropy over the n-grams of tokens (0 if there are fewer than n tokens)
// more sensitive to structural patterns than the entropy of single words
LDSI_API double computeNgramEntropy(std::span<const std::string> tokens, size_t n);

// H(B) / H(A), total over its input domain:
// - hA == 0 and hB == 0 -> 1
// - hA == 0 and hB > 0 -> EntropyRatio_ZeroReference
LDSI_API double entropyRatio(double hA, double hB) noexcept;

// clamp(ratio - 1, EntropyTerm_Min, EntropyTerm_Max)
LDSI_API double entropyTerm(double ratio) noexcept;

} // namespace ldsi
