// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#include "Server.hpp"

#include <ldsi/TextSample.hpp>
#include <ldsi/TextCleaner.hpp>
#include <ldsi/Tokenizer.hpp>
#include <ldsi/Logging.hpp>

#include <bstl/thread_runner.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/post.hpp>

#include <algorithm>
#include <atomic>
#include <memory>
#include <stdexcept>
#include <thread>

namespace asio = boost::asio;

namespace ldsi::server {

namespace {
TextSample makeSample(std::string text, bool clean) {
    if (!clean) return TextSample(std::move(text));
    auto tokens = TextCleaner().cleanTokens(text);
    return TextSample(std::move(text), std::move(tokens));
}

// run func and pack its result or its exception into a Result
template <typename T, typename F>
Server::Result<T> capture(const char* what, F&& func) {
    try {
        return Server::Result<T>(func());
    }
    catch (std::invalid_argument& e) {
        return itlib::unexpected(Server::Error{Server::Error::Kind::InvalidInput, e.what()});
    }
    catch (std::exception& e) {
        LDSI_LOG(Error, what, " failed: ", e.what());
        return itlib::unexpected(Server::Error{Server::Error::Kind::Internal, e.what()});
    }
}
using BatchResult = std::vector<BatchScorer::ItemResult>;

// a batch in flight on the server pool
// each item task fills its own slot and the last one to finish delivers the results
struct BatchState {
    Server::BatchRequest req;
    BatchResult results;
    std::atomic_size_t remaining;
    Server::Cb<BatchResult> cb;

    BatchState(Server::BatchRequest r, Server::Cb<BatchResult> c)
        : req(std::move(r))
        , results(req.items.size(), BatchScorer::ItemResult(itlib::unexpected(std::string("not scored"))))
        , remaining(req.items.size())
        , cb(std::move(c))
    {}

    void scoreItem(size_t i) {
        auto& slot = results[i];
        slot = BatchScorer::scoreItem(req.items[i], req.config);
        if (!slot) {
            LDSI_LOG(Warning, "batch: item ", i, " failed: ", slot.error());
        }
        if (remaining.fetch_sub(1, std::memory_order_acq_rel) == 1) {
            cb(Server::Result<BatchResult>(std::move(results)));
        }
    }
};
} // namespace

struct Server::Impl {
    ScoringConfig m_config;
    size_t m_numThreads;

    asio::io_context m_ioctx;
    asio::executor_work_guard<asio::io_context::executor_type> m_wg;

    bstl::thread_runner m_runner;

    Impl(ScoringConfig config, size_t numThreads)
        : m_config(config)
        , m_numThreads(numThreads ? numThreads : std::max(1u, std::thread::hardware_concurrency()))
        , m_wg(make_work_guard(m_ioctx))
        , m_runner(m_ioctx, m_numThreads)
    {}

    ~Impl() {
        m_wg.reset();
        m_runner.join();
    }

    void score(PairRequest req, Cb<LdsiResult> cb) {
        post(m_ioctx, [req = std::move(req), cb = std::move(cb)]() mutable {
            cb(capture<LdsiResult>("score", [&] {
                auto a = makeSample(std::move(req.textA), req.clean);
                auto b = makeSample(std::move(req.textB), req.clean);
                return computeLdsi(a, b, req.config);
            }));
        });
    }

    void ncd(PairRequest req, Cb<NcdMeasurement> cb) {
        post(m_ioctx, [req = std::move(req), cb = std::move(cb)]() mutable {
            cb(capture<NcdMeasurement>("ncd", [&] {
                // validates the encoding
                TextSample a(std::move(req.textA), {});
                TextSample b(std::move(req.textB), {});
                return computeNcd(a.bytes(), b.bytes());
            }));
        });
    }

    void entropy(TextRequest req, Cb<EntropyMeasurement> cb) {
        post(m_ioctx, [req = std::move(req), cb = std::move(cb)]() mutable {
            cb(capture<EntropyMeasurement>("entropy", [&] {
                auto s = makeSample(std::move(req.text), req.clean);
                return computeEntropy(s.tokens());
            }));
        });
    }

    void topology(TextRequest req, Cb<TopologyMetrics> cb) {
        post(m_ioctx, [req = std::move(req), cb = std::move(cb)]() mutable {
            cb(capture<TopologyMetrics>("topology", [&] {
                auto s = makeSample(std::move(req.text), req.clean);
                return analyzeTopology(s.tokens());
            }));
        });
    }

    // the items are scheduled on the server pool like any other request
    // so concurrent batches share the threads instead of starting their own
    void batch(BatchRequest req, Cb<BatchResult> cb) {
        post(m_ioctx, [this, req = std::move(req), cb = std::move(cb)]() mutable {
            auto checked = capture<bool>("batch", [&] {
                validate(req.config);
                return true;
            });
            if (!checked) {
                Error err = std::move(checked.error());
                cb(itlib::unexpected(std::move(err)));
                return;
            }
            if (req.items.empty()) {
                cb(Result<BatchResult>(BatchResult{}));
                return;
            }

            auto state = std::make_shared<BatchState>(std::move(req), std::move(cb));
            for (size_t i = 0; i < state->req.items.size(); ++i) {
                post(m_ioctx, [state, i] {
                    state->scoreItem(i);
                });
            }
        });
    }
};

Server::Server(ScoringConfig config, size_t numThreads) {
    validate(config);
    m_impl = std::make_unique<Impl>(config, numThreads);
}

Server::~Server() = default;

const ScoringConfig& Server::config() const noexcept {
    return m_impl->m_config;
}

size_t Server::numThreads() const noexcept {
    return m_impl->m_numThreads;
}

void Server::score(PairRequest req, Cb<LdsiResult> cb) {
    m_impl->score(std::move(req), std::move(cb));
}

void Server::ncd(PairRequest req, Cb<NcdMeasurement> cb) {
    m_impl->ncd(std::move(req), std::move(cb));
}

void Server::entropy(TextRequest req, Cb<EntropyMeasurement> cb) {
    m_impl->entropy(std::move(req), std::move(cb));
}

void Server::topology(TextRequest req, Cb<TopologyMetrics> cb) {
    m_impl->topology(std::move(req), std::move(cb));
}

void Server::batch(BatchRequest req, Cb<BatchResult> cb) {
    m_impl->batch(std::move(req), std::move(cb));
}

} // namespace ldsi::server
