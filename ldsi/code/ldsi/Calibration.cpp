// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#include "Calibration.hpp"
#include "Ldsi.hpp"
#include "Logging.hpp"
#include <bstl/throw_stdex.hpp>
#include <cmath>
#include <limits>

namespace ldsi {

Calibrator::Calibrator()
    : m_params{}
{}

Calibrator::Calibrator(Params params)
    : m_params(params)
{}

void Calibrator::addCase(Case c) {
    m_cases.push_back(std::move(c));
}

Calibrator::Fit Calibrator::run(ImprovementCb cb) const {
    auto& p = m_params;
    if (!std::isfinite(p.min) || !std::isfinite(p.max) || !std::isfinite(p.step) || p.step <= 0 || p.max < p.min) {
        throw_invalid{} << "Invalid calibration grid: [" << p.min << ", " << p.max << "] step " << p.step;
    }

    // checked as a double, a tiny step overflows size_t
    const double span = std::floor((p.max - p.min) / p.step + 1e-9);
    if (!(span <= double(MaxStepsPerAxis))) {
        throw_invalid{} << "Calibration grid too fine: " << span << " steps per coefficient, max " << MaxStepsPerAxis;
    }

    struct Expected {
        LdsiSignals signals;
        double lambda;
    };
    std::vector<Expected> scored;
    scored.reserve(m_cases.size());

    ScoringConfig config;
    config.topologyStrategy = p.topologyStrategy;

    for (size_t i = 0; i < m_cases.size(); ++i) {
        auto& c = m_cases[i];
        try {
            auto res = computeLdsi(c.textA, c.textB, config);
            scored.push_back({res.signals(), c.expectedLambda});
        }
        catch (std::exception& e) {
            LDSI_LOG(Warning, "calibration: skipping case ", i, ": ", e.what());
        }
    }

    if (scored.empty()) {
        throw_ex{} << "No calibration case could be scored";
    }

    // integer indices so that the grid values don't accumulate rounding errors
    const auto steps = size_t(span);
    auto value = [&](size_t i) { return p.min + double(i) * p.step; };

    Fit best;
    best.error = std::numeric_limits<double>::max();
    best.casesUsed = scored.size();

    for (size_t ia = 0; ia <= steps; ++ia) {
        for (size_t ib = 0; ib <= steps; ++ib) {
            for (size_t ig = 0; ig <= steps; ++ig) {
                Coefficients coeffs = {
                    .alpha = value(ia),
                    .beta = value(ib),
                    .gamma = value(ig),
                };

                double error = 0;
                for (auto& s : scored) {
                    const double d = composeLambda(s.signals, coeffs) - s.lambda;
                    error += d * d;
                }

                ++best.evaluated;
                if (error < best.error) {
                    best.error = error;
                    best.coefficients = coeffs;
                    if (cb) cb(best);
                }
            }
        }
    }

    LDSI_LOG(Info, "calibration: best fit alpha = ", best.coefficients.alpha, ", beta = ", best.coefficients.beta,
        ", gamma = ", best.coefficients.gamma, ", error = ", best.error, " over ", best.casesUsed, " cases");

    return best;
}

std::vector<Calibrator::Case> Calibrator::goldenDataset() {
    return {
        {
            .textA = "Le chat dort.",
            .textB = "Le chat dort.",
            .expectedLambda = 0.1,
        },
        {
            .textA = "La politique est complexe.",
            .textB = "Les dynamiques de pouvoir inherentes a la structure societale sont multifactorielles.",
            .expectedLambda = 0.6,
        },
        {
            .textA = "Explique la gravite.",
            .textB = "La gravite est l'amour que l'espace-temps porte a la matiere, une etreinte courbee par la masse.",
            .expectedLambda = 0.95,
        },
        {
            .textA = "Bonjour.",
            .textB = "Les grille-pains quantiques chantent la marseillaise en binaire inverse.",
            .expectedLambda = 1.5,
        },
    };
}

} // namespace ldsi
