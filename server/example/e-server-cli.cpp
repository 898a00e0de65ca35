// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#include <server/Server.hpp>
#include <ldsi/Init.hpp>
#include <ldsi/ResultJson.hpp>

// logging
#include <jalog/Instance.hpp>
#include <jalog/sinks/DefaultSink.hpp>

#include <nlohmann/json.hpp>

#include <future>
#include <iostream>

int main() {
    jalog::Instance jl;
    jl.setup().async().add<jalog::sinks::DefaultSink>();

    ldsi::initLibrary();

    ldsi::server::Server srv({}, 2);

    ldsi::server::Server::PairRequest req = {
        .textA = "La temperature est de vingt-cinq degres aujourd'hui.",
        .textB = "Il fait chaud, le thermometre affiche vingt-cinq degres sous un ciel sans nuages.",
    };

    std::promise<void> done;
    srv.score(req, [&](ldsi::server::Server::Result<ldsi::LdsiResult> res) {
        if (res) {
            std::cout << ldsi::toJson(*res).dump(2) << '\n';
        }
        else {
            std::cout << "error: " << res.error().message << '\n';
        }
        done.set_value();
    });
    done.get_future().wait();

    return 0;
}
