// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//

// scoring several pairs concurrently

#include <ldsi/Init.hpp>
#include <ldsi/BatchScorer.hpp>

// logging
#include <jalog/Instance.hpp>
#include <jalog/sinks/DefaultSink.hpp>

#include <iostream>

int main() try {
    jalog::Instance jl;
    jl.setup().async().add<jalog::sinks::DefaultSink>();

    ldsi::initLibrary();

    std::vector<ldsi::BatchScorer::Item> items = {
        {"Le chat dort.", "Le chat dort."},
        {"La politique est complexe.", "Les dynamiques de pouvoir inherentes a la structure societale sont multifactorielles."},
        {"Explique la gravite.", "La gravite est l'amour que l'espace-temps porte a la matiere, une etreinte courbee par la masse."},
        {"Bonjour.", "Les grille-pains quantiques chantent la marseillaise en binaire inverse."},
        {"valid", "\xC3\x28 invalid utf-8"},
    };

    ldsi::BatchScorer scorer(4);
    auto results = scorer.score(items);

    for (size_t i = 0; i < results.size(); ++i) {
        auto& r = results[i];
        std::cout << i << ": ";
        if (r) {
            std::cout << r->lambda << " " << ldsi::verdictName(r->verdict) << "\n";
        }
        else {
            std::cout << "error: " << r.error() << "\n";
        }
    }

    return 0;
}
catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
}
