// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#include "ScoringConfig.hpp"
#include <bstl/throw_stdex.hpp>
#include <cmath>

namespace ldsi {

void validate(const ScoringConfig& config) {
    auto& c = config.coefficients;
    if (!std::isfinite(c.alpha) || !std::isfinite(c.beta) || !std::isfinite(c.gamma)) {
        throw_invalid{} << "Coefficients must be finite. Got alpha = " << c.alpha
            << ", beta = " << c.beta << ", gamma = " << c.gamma;
    }

    auto& t = config.thresholds;
    if (!std::isfinite(t.zombie) || !std::isfinite(t.rebel) || !std::isfinite(t.architect)) {
        throw_invalid{} << "Verdict thresholds must be finite";
    }
    if (!(0 < t.zombie && t.zombie < t.rebel && t.rebel < t.architect)) {
        throw_invalid{} << "Verdict thresholds must be positive and ascending. Got "
            << t.zombie << ", " << t.rebel << ", " << t.architect;
    }

    if (config.topologyStrategy != TopologyStrategy::ReferenceDelta
        && config.topologyStrategy != TopologyStrategy::AbsoluteQuality) {
        throw_invalid{} << "Unknown topology strategy " << int(config.topologyStrategy);
    }
}

} // namespace ldsi
