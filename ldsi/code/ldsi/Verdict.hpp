// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#pragma once
#include "api.h"
#include "ScoringConfig.hpp"
#include <optional>
#include <string_view>

namespace ldsi {

enum class Verdict {
    Zombie, // the model recites, total smoothing
    Rebel, // notable divergence, lexical enrichment
    Architect, // optimal zone: strong divergence, structure preserved
    Fool, // chaos: maximal entropy, structure collapsed
};

LDSI_API Verdict verdictFromLambda(double lambda, const VerdictThresholds& thresholds = {}) noexcept;

// "ZOMBIE", "REBEL", "ARCHITECT", "FOOL"
LDSI_API std::string_view verdictName(Verdict verdict) noexcept;
LDSI_API std::optional<Verdict> verdictFromName(std::string_view name) noexcept;

// one line human readable description
LDSI_API std::string_view verdictDescription(Verdict verdict) noexcept;

} // namespace ldsi
