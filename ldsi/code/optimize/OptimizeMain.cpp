// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//

// coefficient calibration against the golden dataset
// usage: ldsi-optimize [cases.json]
// cases.json: [{"text_a": "...", "text_b": "...", "expected_lambda": 0.5}, ...]

#include <ldsi/Init.hpp>
#include <ldsi/Calibration.hpp>
#include <ldsi/ResultJson.hpp>

// logging
#include <jalog/Instance.hpp>
#include <jalog/sinks/DefaultSink.hpp>

#include <nlohmann/json.hpp>

#include <fstream>
#include <iomanip>
#include <iostream>

std::vector<ldsi::Calibrator::Case> loadCases(const char* path) {
    std::ifstream fin(path);
    if (!fin) {
        throw std::runtime_error(std::string("Can't open ") + path);
    }

    auto json = nlohmann::json::parse(fin);
    std::vector<ldsi::Calibrator::Case> cases;
    for (auto& jc : json) {
        cases.push_back({
            .textA = jc.at("text_a").get<std::string>(),
            .textB = jc.at("text_b").get<std::string>(),
            .expectedLambda = jc.at("expected_lambda").get<double>(),
        });
    }
    return cases;
}

int main(int argc, char* argv[]) try {
    jalog::Instance jl;
    jl.setup().add<jalog::sinks::DefaultSink>();

    ldsi::initLibrary();

    ldsi::Calibrator calibrator;
    auto cases = argc > 1 ? loadCases(argv[1]) : ldsi::Calibrator::goldenDataset();
    for (auto& c : cases) {
        calibrator.addCase(std::move(c));
    }

    std::cout << "Calibrating on " << calibrator.cases().size() << " cases\n";
    std::cout << std::fixed;

    auto fit = calibrator.run([](const ldsi::Calibrator::Fit& f) {
        std::cout << std::setprecision(4) << "New best: error = " << f.error
            << std::setprecision(2)
            << " | alpha = " << f.coefficients.alpha
            << " beta = " << f.coefficients.beta
            << " gamma = " << f.coefficients.gamma << '\n';
    });

    ldsi::Coefficients defaults;

    std::cout << "\n=== Best fit ===\n";
    std::cout << std::setprecision(2);
    std::cout << "alpha (ncd)     : " << fit.coefficients.alpha << '\n';
    std::cout << "beta (entropy)  : " << fit.coefficients.beta << '\n';
    std::cout << "gamma (topology): " << fit.coefficients.gamma << '\n';
    std::cout << std::setprecision(4);
    std::cout << "error           : " << fit.error << " over " << fit.casesUsed << " cases, "
        << fit.evaluated << " grid points\n";
    std::cout << std::setprecision(2);
    std::cout << "\ndefaults        : " << defaults.alpha << " / " << defaults.beta << " / " << defaults.gamma << '\n';
    std::cout << "coefficient sum : " << fit.coefficients.alpha + fit.coefficients.beta + fit.coefficients.gamma << '\n';

    std::cout << "\nconfig:\n" << nlohmann::json({{"coefficients", ldsi::toJson(fit.coefficients)}}).dump(2) << '\n';

    return 0;
}
catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
}
