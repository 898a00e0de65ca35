// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#include "Verdict.hpp"

namespace ldsi {

Verdict verdictFromLambda(double lambda, const VerdictThresholds& thresholds) noexcept {
    if (lambda < thresholds.zombie) return Verdict::Zombie;
    if (lambda < thresholds.rebel) return Verdict::Rebel;
    if (lambda < thresholds.architect) return Verdict::Architect;
    return Verdict::Fool;
}

std::string_view verdictName(Verdict verdict) noexcept {
    switch (verdict) {
    case Verdict::Zombie: return "ZOMBIE";
    case Verdict::Rebel: return "REBEL";
    case Verdict::Architect: return "ARCHITECT";
    case Verdict::Fool: return "FOOL";
    }
    return "UNKNOWN";
}

std::optional<Verdict> verdictFromName(std::string_view name) noexcept {
    for (auto v : {Verdict::Zombie, Verdict::Rebel, Verdict::Architect, Verdict::Fool}) {
        if (verdictName(v) == name) return v;
    }
    return std::nullopt;
}

std::string_view verdictDescription(Verdict verdict) noexcept {
    switch (verdict) {
    case Verdict::Zombie: return "ZOMBIE - the model recites, total smoothing";
    case Verdict::Rebel: return "REBEL - notable divergence, lexical enrichment";
    case Verdict::Architect: return "ARCHITECT - optimal zone, structure preserved";
    case Verdict::Fool: return "FOOL - maximal chaos, structure collapsed";
    }
    return "UNKNOWN";
}

} // namespace ldsi
