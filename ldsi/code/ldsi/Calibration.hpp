// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#pragma once
#include "api.h"
#include "ScoringConfig.hpp"
#include <itlib/ufunction.hpp>
#include <string>
#include <vector>

namespace ldsi {

// grid search of the composite coefficients against a golden dataset of
// (text a, text b, expected lambda) cases, minimizing the total squared error
//
// the signals of each case are independent of the coefficients, so every case is
// scored once and the grid is evaluated with composeLambda
class LDSI_API Calibrator {
public:
    struct Case {
        std::string textA;
        std::string textB;
        double expectedLambda = 0;
    };

    // grids with more steps than this per coefficient are rejected
    // (the search is cubic in the number of steps)
    static constexpr size_t MaxStepsPerAxis = 1000;

    struct Params {
        // each of alpha, beta, gamma takes the values min + i * step in [min, max]
        double min = 0;
        double max = 1;
        double step = 0.05;

        TopologyStrategy topologyStrategy = TopologyStrategy::AbsoluteQuality;
    };

    struct Fit {
        Coefficients coefficients;
        double error = 0; // total squared error over the used cases
        size_t casesUsed = 0;
        size_t evaluated = 0; // grid points evaluated so far
    };

    // called every time a strictly better fit is found
    using ImprovementCb = itlib::ufunction<void(const Fit&)>;

    Calibrator();
    explicit Calibrator(Params params);

    const Params& params() const noexcept { return m_params; }

    void addCase(Case c);
    const std::vector<Case>& cases() const noexcept { return m_cases; }

    // cases which fail to score are logged and skipped
    // throws std::invalid_argument on bad grid params or more than MaxStepsPerAxis steps
    // throws std::runtime_error if no case could be scored
    Fit run(ImprovementCb cb = {}) const;

    // four hand-labeled cases: recitation, paraphrase, creative divergence, nonsense
    static std::vector<Case> goldenDataset();

private:
    Params m_params;
    std::vector<Case> m_cases;
};

} // namespace ldsi
