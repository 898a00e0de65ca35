// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#pragma once
#include "api.h"
#include <ldsi/Ldsi.hpp>
#include <ldsi/BatchScorer.hpp>
#include <itlib/expected.hpp>
#include <itlib/ufunction.hpp>
#include <memory>
#include <string>
#include <vector>

namespace ldsi::server {

// scoring front-end: requests are executed on an owned worker pool and the
// results are delivered through callbacks (on a worker thread)
class LDSI_SERVER_API Server {
public:
    // numThreads = 0 means std::thread::hardware_concurrency
    // throws std::invalid_argument if config is invalid
    Server(ScoringConfig config, size_t numThreads);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    const ScoringConfig& config() const noexcept;
    size_t numThreads() const noexcept;

    struct Error {
        enum class Kind {
            InvalidInput,
            Internal,
        };
        Kind kind = Kind::Internal;
        std::string message;
    };

    template <typename T>
    using Result = itlib::expected<T, Error>;

    template <typename T>
    using Cb = itlib::ufunction<void(Result<T>)>;

    struct PairRequest {
        std::string textA;
        std::string textB;
        ScoringConfig config;
        bool clean = false; // tokenize with the default TextCleaner instead of the plain tokenizer
    };

    struct TextRequest {
        std::string text;
        bool clean = false;
    };

    struct BatchRequest {
        std::vector<BatchScorer::Item> items;
        ScoringConfig config;
    };

    void score(PairRequest req, Cb<LdsiResult> cb);
    void ncd(PairRequest req, Cb<NcdMeasurement> cb);
    void entropy(TextRequest req, Cb<EntropyMeasurement> cb);
    void topology(TextRequest req, Cb<TopologyMetrics> cb);
    void batch(BatchRequest req, Cb<std::vector<BatchScorer::ItemResult>> cb);

private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace ldsi::server
