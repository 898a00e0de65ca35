// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#pragma once
#include "api.h"
#include "Ncd.hpp"
#include "Entropy.hpp"
#include "Topology.hpp"
#include "StructuralQuality.hpp"
#include "ScoringConfig.hpp"
#include "Verdict.hpp"
#include <string_view>

namespace ldsi {
class TextSample;

// the three precomputed signals which enter the composite formula
struct LdsiSignals {
    double ncd = 0; // corrected (damped) ncd
    double entropyTerm = 0;
    double topologyScore = 0; // as selected by the topology strategy
};

struct LDSI_API LdsiResult {
    double lambda = 0; // >= 0
    Verdict verdict = Verdict::Zombie;

    NcdMeasurement ncd;

    EntropyMeasurement entropyA;
    EntropyMeasurement entropyB;
    double entropyRatio = 1;
    double entropyTerm = 0;

    TopologyMetrics topologyA;
    TopologyMetrics topologyB;

    // both are always computed, topologyStrategy selects which one entered lambda
    double structuralQuality = 0;
    double topologyDelta = 0;
    TopologyStrategy topologyStrategy = TopologyStrategy::AbsoluteQuality;

    Coefficients coefficients;

    LdsiSignals signals() const noexcept;
};

// max(0, ((alpha * ncd) + (beta * entropyTerm)) + (gamma * topologyScore))
// the evaluation order is fixed so that identical signals give bit-identical lambdas
LDSI_API double composeLambda(const LdsiSignals& signals, const Coefficients& coefficients) noexcept;

// score test sample b against reference sample a
// throws std::invalid_argument if config is invalid
LDSI_API LdsiResult computeLdsi(const TextSample& a, const TextSample& b, const ScoringConfig& config = {});

// builds TextSamples with the default tokenizer
// throws std::invalid_argument if either text is not valid utf-8
LDSI_API LdsiResult computeLdsi(std::string_view a, std::string_view b, const ScoringConfig& config = {});

} // namespace ldsi
