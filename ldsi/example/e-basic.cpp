// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//

// trivial example of scoring two texts

#include <ldsi/Init.hpp>
#include <ldsi/Ldsi.hpp>

// logging
#include <jalog/Instance.hpp>
#include <jalog/sinks/DefaultSink.hpp>

#include <iostream>
#include <string>

int main() try {
    jalog::Instance jl;
    jl.setup().add<jalog::sinks::DefaultSink>();

    // initialize the library
    ldsi::initLibrary();

    std::string a = "La temperature est de vingt-cinq degres aujourd'hui.";
    std::string b = "La temperature est de 25 degres ce jour.";

    std::cout << "A: " << a << "\n";
    std::cout << "B: " << b << "\n";

    for (auto strategy : {ldsi::TopologyStrategy::AbsoluteQuality, ldsi::TopologyStrategy::ReferenceDelta}) {
        ldsi::ScoringConfig config;
        config.topologyStrategy = strategy;

        auto res = ldsi::computeLdsi(a, b, config);

        std::cout << "\n" << ldsi::toString(strategy) << ":\n";
        std::cout << "  ncd: " << res.ncd.raw << " * " << res.ncd.dampingFactor << " = " << res.ncd.corrected << "\n";
        std::cout << "  entropy: " << res.entropyA.shannon << " -> " << res.entropyB.shannon
                  << " (term " << res.entropyTerm << ")\n";
        std::cout << "  structural quality: " << res.structuralQuality << ", delta: " << res.topologyDelta << "\n";
        std::cout << "  lambda: " << res.lambda << " " << ldsi::verdictName(res.verdict) << "\n";
    }

    return 0;
}
catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
}
