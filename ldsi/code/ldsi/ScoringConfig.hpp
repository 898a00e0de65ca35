// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#pragma once
#include "api.h"
#include "StructuralQuality.hpp"

namespace ldsi {

// weights of the composite formula
// lambda = alpha * ncd + beta * entropy_term + gamma * topology_score
//
// the member initializers are the one and only default: cli, server and calibration
// all start from a value-initialized Coefficients/ScoringConfig
struct Coefficients {
    double alpha = 0.50; // ncd: main divergence signal
    double beta = 0.30; // entropy: lexical richness guard
    double gamma = 0.20; // topology: structural arbiter

    bool operator==(const Coefficients& other) const noexcept = default;
};

// upper (exclusive) bounds of the verdict bands
// [0, zombie) ZOMBIE, [zombie, rebel) REBEL, [rebel, architect) ARCHITECT, [architect, inf) FOOL
struct VerdictThresholds {
    double zombie = 0.3;
    double rebel = 0.7;
    double architect = 1.2;

    bool operator==(const VerdictThresholds& other) const noexcept = default;
};

struct ScoringConfig {
    Coefficients coefficients;
    VerdictThresholds thresholds;
    TopologyStrategy topologyStrategy = TopologyStrategy::AbsoluteQuality;

    bool operator==(const ScoringConfig& other) const noexcept = default;
};

// throws std::invalid_argument on non-finite coefficients or
// thresholds which are not finite, positive and strictly ascending
LDSI_API void validate(const ScoringConfig& config);

} // namespace ldsi
