// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#include <ldsi/Init.hpp>
#include <ldsi/Ldsi.hpp>
#include <ldsi/ResultJson.hpp>

#include <server/Server.hpp>

#include <jalog/Instance.hpp>
#include <jalog/sinks/DefaultSink.hpp>
#include <jalog/Log.hpp>

#include <bstl/thread_runner.hpp>

#include <boost/asio.hpp>
#include <boost/beast.hpp>

#include <nlohmann/json.hpp>

#include <cstring>
#include <iostream>
#include <limits>
#include <optional>

namespace net = boost::asio;
using tcp = net::ip::tcp;
namespace beast = boost::beast;
namespace http = beast::http;

using ldsi::server::Server;

nlohmann::json toJson(const std::vector<ldsi::BatchScorer::ItemResult>& results) {
    auto jsonResults = nlohmann::json::array();
    for (auto& r : results) {
        if (r) {
            jsonResults.push_back(ldsi::toJson(*r));
        }
        else {
            jsonResults.push_back({{"error", r.error()}});
        }
    }
    return {{"results", std::move(jsonResults)}};
}

const std::string& getText(nlohmann::json& json, std::string_view key) {
    auto it = json.find(key);
    if (it == json.end() || !it->is_string()) {
        throw std::invalid_argument("Missing string field \"" + std::string(key) + "\"");
    }
    return it->get_ref<std::string&>();
}

template <typename T>
void opt_get(nlohmann::json& dict, std::string_view key, T& value) {
    auto it = dict.find(key);
    if (it != dict.end()) {
        value = it->get<T>();
    }
}

Server::PairRequest toPairRequest(nlohmann::json& json, const ldsi::ScoringConfig& base) {
    Server::PairRequest req;
    req.textA = getText(json, "text_a");
    req.textB = getText(json, "text_b");
    req.config = ldsi::configFromJson(json, base);
    opt_get(json, "clean", req.clean);
    return req;
}

Server::TextRequest toTextRequest(nlohmann::json& json) {
    Server::TextRequest req;
    req.text = getText(json, "text");
    opt_get(json, "clean", req.clean);
    return req;
}

Server::BatchRequest toBatchRequest(nlohmann::json& json, const ldsi::ScoringConfig& base) {
    Server::BatchRequest req;
    auto it = json.find("items");
    if (it == json.end() || !it->is_array()) {
        throw std::invalid_argument("Missing array field \"items\"");
    }
    req.items.reserve(it->size());
    for (auto& ji : *it) {
        auto& item = req.items.emplace_back();
        item.textA = getText(ji, "text_a");
        item.textB = getText(ji, "text_b");
    }
    req.config = ldsi::configFromJson(json, base);
    return req;
}

class HttpServer {
    Server m_server;

    struct Reply {
        http::status status = http::status::ok;
        nlohmann::json body;
    };

    static Reply errorReply(http::status status, std::string_view message) {
        return {status, {{"error", std::string(message)}}};
    }

    template <typename T>
    static Reply toReply(Server::Result<T>& res) {
        if (res) {
            if constexpr (std::same_as<T, std::vector<ldsi::BatchScorer::ItemResult>>) {
                return {http::status::ok, toJson(*res)};
            }
            else {
                return {http::status::ok, ldsi::toJson(*res)};
            }
        }
        auto status = res.error().kind == Server::Error::Kind::InvalidInput
            ? http::status::bad_request
            : http::status::internal_server_error;
        return errorReply(status, res.error().message);
    }

    template <typename T>
    struct AsyncScoreOp {
        net::any_io_executor ex;
        itlib::ufunction<void(Server::Cb<T>)> initiate;

        template <typename Self>
        void operator()(Self& self) {
            auto takeInitiate = std::move(initiate);
            takeInitiate([ex = std::move(ex), self = std::move(self)](Server::Result<T> res) mutable {
                post(ex, [self = std::move(self), res = std::move(res)]() mutable {
                    self.complete(std::move(res));
                });
            });
        }
    };

    // bridge a callback based Server call to the coroutine executor
    template <typename T>
    decltype(auto) asyncScore(net::any_io_executor ex, itlib::ufunction<void(Server::Cb<T>)> initiate) {
        return net::async_compose<const net::use_awaitable_t<>, void(Server::Result<T>)>(
            AsyncScoreOp<T>{.ex = ex, .initiate = std::move(initiate)}, net::use_awaitable, ex
        );
    }

    template <typename T>
    net::awaitable<Reply> dispatch(net::any_io_executor ex, const std::string& body,
        itlib::ufunction<itlib::ufunction<void(Server::Cb<T>)>(nlohmann::json&)> parse)
    {
        itlib::ufunction<void(Server::Cb<T>)> initiate;
        std::optional<Reply> parseError;
        try {
            auto json = nlohmann::json::parse(body);
            if (!json.is_object()) {
                throw std::invalid_argument("Request body must be a json object");
            }
            initiate = parse(json);
        }
        catch (std::exception& e) {
            parseError = errorReply(http::status::bad_request, e.what());
        }

        if (parseError) {
            co_return std::move(*parseError);
        }

        auto res = co_await asyncScore<T>(ex, std::move(initiate));
        co_return toReply(res);
    }

    net::awaitable<Reply> route(net::any_io_executor ex, const http::request<http::string_body>& req) {
        if (req.method() != http::verb::post) {
            co_return errorReply(http::status::bad_request, "Only POST requests are supported");
        }

        auto target = req.target();
        auto& base = m_server.config();

        if (target == "/ldsi") {
            co_return co_await dispatch<ldsi::LdsiResult>(ex, req.body(), [&](nlohmann::json& json) {
                return [this, r = toPairRequest(json, base)](Server::Cb<ldsi::LdsiResult> cb) mutable {
                    m_server.score(std::move(r), std::move(cb));
                };
            });
        }
        if (target == "/ncd") {
            co_return co_await dispatch<ldsi::NcdMeasurement>(ex, req.body(), [&](nlohmann::json& json) {
                return [this, r = toPairRequest(json, base)](Server::Cb<ldsi::NcdMeasurement> cb) mutable {
                    m_server.ncd(std::move(r), std::move(cb));
                };
            });
        }
        if (target == "/entropy") {
            co_return co_await dispatch<ldsi::EntropyMeasurement>(ex, req.body(), [&](nlohmann::json& json) {
                return [this, r = toTextRequest(json)](Server::Cb<ldsi::EntropyMeasurement> cb) mutable {
                    m_server.entropy(std::move(r), std::move(cb));
                };
            });
        }
        if (target == "/topology") {
            co_return co_await dispatch<ldsi::TopologyMetrics>(ex, req.body(), [&](nlohmann::json& json) {
                return [this, r = toTextRequest(json)](Server::Cb<ldsi::TopologyMetrics> cb) mutable {
                    m_server.topology(std::move(r), std::move(cb));
                };
            });
        }
        if (target == "/batch") {
            using BatchResult = std::vector<ldsi::BatchScorer::ItemResult>;
            co_return co_await dispatch<BatchResult>(ex, req.body(), [&](nlohmann::json& json) {
                return [this, r = toBatchRequest(json, base)](Server::Cb<BatchResult> cb) mutable {
                    m_server.batch(std::move(r), std::move(cb));
                };
            });
        }

        co_return errorReply(http::status::not_found, "Unknown target");
    }

public:
    HttpServer(ldsi::ScoringConfig config, size_t numThreads)
        : m_server(config, numThreads)
    {}

    net::awaitable<void> handleRequest(beast::tcp_stream stream) {
        beast::flat_buffer buffer;
        http::request<http::string_body> req;

        auto ex = co_await net::this_coro::executor;

        co_await http::async_read(stream, buffer, req, net::use_awaitable);

        auto reply = co_await route(ex, req);

        JALOG(Debug, std::string(req.method_string()), " ", std::string(req.target()), " -> ", int(reply.status));

        http::response<http::string_body> res(reply.status, req.version());
        res.set(http::field::server, "ldsi");
        res.set(http::field::content_type, "application/json");
        res.set(http::field::access_control_allow_origin, "*");
        res.keep_alive(req.keep_alive());
        res.body() = reply.body.dump();
        res.prepare_payload();

        co_await http::async_write(stream, res, net::use_awaitable);

        // Close the stream
        stream.socket().shutdown(tcp::socket::shutdown_send);
    }

    net::awaitable<void> listen(const boost::asio::ip::address &addr, net::ip::port_type port) {
        auto ex = co_await net::this_coro::executor;
        tcp::acceptor acc(ex, tcp::endpoint(addr, port));

        while (true) {
            auto sock = co_await acc.async_accept(net::use_awaitable);
            net::co_spawn(ex, handleRequest(beast::tcp_stream(std::move(sock))), net::detached);
        }
    }
};

unsigned long parseUnsigned(const char* env, const char* name, unsigned long max) {
    size_t idx = 0;
    unsigned long value = std::stoul(env, &idx, 10);

    if (idx != std::strlen(env)) {
        throw std::invalid_argument(std::string("Extra characters after ") + name + " number");
    }

    if (value > max) {
        throw std::out_of_range(std::string(name) + " value is too big");
    }

    return value;
}

int main() try {
    jalog::Instance jl;
    jl.setup().async().add<jalog::sinks::DefaultSink>();

    ldsi::initLibrary();

    // Default values
    boost::asio::ip::address host = boost::asio::ip::make_address("0.0.0.0");
    net::ip::port_type port = 7332;
    size_t numThreads = 4;
    ldsi::ScoringConfig config;

    const char* host_env = std::getenv("LDSI_HOST");
    if (host_env) {
        boost::system::error_code ec;
        host = boost::asio::ip::make_address(host_env, ec);
        if (ec) {
            throw std::invalid_argument("Invalid LDSI_HOST: " + ec.message());
        }
    }

    const char* port_env = std::getenv("LDSI_PORT");
    if (port_env) {
        port = static_cast<net::ip::port_type>(parseUnsigned(port_env, "LDSI_PORT", std::numeric_limits<net::ip::port_type>::max()));
    }

    const char* threads_env = std::getenv("LDSI_THREADS");
    if (threads_env) {
        numThreads = parseUnsigned(threads_env, "LDSI_THREADS", 1024);
    }

    const char* config_env = std::getenv("LDSI_CONFIG");
    if (config_env && *config_env) {
        JALOG(Info, "Loading config ", config_env);
        config = ldsi::loadConfig(config_env);
    }

    JALOG(Info, "Scoring with alpha = ", config.coefficients.alpha, ", beta = ", config.coefficients.beta,
        ", gamma = ", config.coefficients.gamma, ", strategy ", std::string(ldsi::toString(config.topologyStrategy)));
    JALOG(Info, "Listening on ", host.to_string(), ":", port);

    HttpServer server(config, numThreads);

    net::io_context ioctx;
    auto guard = net::make_work_guard(ioctx);

    bstl::thread_runner runner(ioctx, 4);

    net::co_spawn(ioctx, server.listen(host, port), net::detached);
}
catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
}
