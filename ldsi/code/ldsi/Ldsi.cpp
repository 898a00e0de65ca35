// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#include "Ldsi.hpp"
#include "TextSample.hpp"
#include "Logging.hpp"
#include <string>

namespace ldsi {

LdsiSignals LdsiResult::signals() const noexcept {
    return {
        .ncd = ncd.corrected,
        .entropyTerm = entropyTerm,
        .topologyScore = topologyStrategy == TopologyStrategy::ReferenceDelta ? topologyDelta : structuralQuality,
    };
}

double composeLambda(const LdsiSignals& signals, const Coefficients& coefficients) noexcept {
    const double ncdPart = coefficients.alpha * signals.ncd;
    const double entropyPart = coefficients.beta * signals.entropyTerm;
    const double topologyPart = coefficients.gamma * signals.topologyScore;
    double lambda = (ncdPart + entropyPart) + topologyPart;

    // also catches nan
    if (!(lambda > 0)) lambda = 0;
    return lambda;
}

LdsiResult computeLdsi(const TextSample& a, const TextSample& b, const ScoringConfig& config) {
    validate(config);

    LdsiResult res;
    res.coefficients = config.coefficients;
    res.topologyStrategy = config.topologyStrategy;

    res.ncd = computeNcd(a.bytes(), b.bytes());

    res.entropyA = computeEntropy(a.tokens());
    res.entropyB = computeEntropy(b.tokens());
    res.entropyRatio = entropyRatio(res.entropyA.shannon, res.entropyB.shannon);
    res.entropyTerm = entropyTerm(res.entropyRatio);

    res.topologyA = analyzeTopology(a.tokens());
    res.topologyB = analyzeTopology(b.tokens());
    res.structuralQuality = structuralQuality(res.topologyB);
    res.topologyDelta = topologyDelta(res.topologyA, res.topologyB);

    auto& scorer = TopologyScorer::get(config.topologyStrategy);
    LdsiSignals sig = {
        .ncd = res.ncd.corrected,
        .entropyTerm = res.entropyTerm,
        .topologyScore = scorer.score(res.topologyA, res.topologyB),
    };

    res.lambda = composeLambda(sig, config.coefficients);
    res.verdict = verdictFromLambda(res.lambda, config.thresholds);

    LDSI_LOG(Debug, "ldsi: ncd = ", sig.ncd, ", entropy term = ", sig.entropyTerm,
        ", topology (", std::string(toString(scorer.strategy())), ") = ", sig.topologyScore,
        " -> lambda = ", res.lambda, " ", std::string(verdictName(res.verdict)));

    return res;
}

LdsiResult computeLdsi(std::string_view a, std::string_view b, const ScoringConfig& config) {
    return computeLdsi(TextSample(std::string(a)), TextSample(std::string(b)), config);
}

} // namespace ldsi
