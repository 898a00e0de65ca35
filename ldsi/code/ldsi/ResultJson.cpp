// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#include "ResultJson.hpp"
#include "Ldsi.hpp"
#include <bstl/throw_stdex.hpp>
#include <nlohmann/json.hpp>
#include <fstream>

namespace ldsi {

namespace {
template <typename T>
void opt_get(const nlohmann::json& dict, std::string_view key, T& value) {
    auto it = dict.find(key);
    if (it != dict.end()) {
        value = it->get<T>();
    }
}

template <typename T>
void req_get(const nlohmann::json& dict, std::string_view key, T& value) {
    auto it = dict.find(key);
    if (it == dict.end()) {
        throw_invalid{} << "Missing field \"" << key << "\"";
    }
    value = it->get<T>();
}

const nlohmann::json& req_obj(const nlohmann::json& dict, std::string_view key) {
    auto it = dict.find(key);
    if (it == dict.end() || !it->is_object()) {
        throw_invalid{} << "Missing object \"" << key << "\"";
    }
    return *it;
}

TopologyMetrics topologyFromJson(const nlohmann::json& j) {
    TopologyMetrics t;
    req_get(j, "node_count", t.nodeCount);
    req_get(j, "edge_count", t.edgeCount);
    req_get(j, "components", t.components);
    req_get(j, "lcc_size", t.lccSize);
    req_get(j, "density", t.density);
    req_get(j, "lcc_ratio", t.lccRatio);
    req_get(j, "clustering", t.clustering);
    req_get(j, "avg_path_length", t.avgPathLength);
    req_get(j, "small_world_index", t.smallWorldIndex);
    req_get(j, "avg_degree", t.avgDegree);
    req_get(j, "structural_quality", t.structuralQuality);
    return t;
}
} // namespace

nlohmann::json toJson(const NcdMeasurement& ncd) {
    return {
        {"raw", ncd.raw},
        {"damping_factor", ncd.dampingFactor},
        {"corrected", ncd.corrected},
        {"size_a", ncd.sizeA},
        {"size_b", ncd.sizeB},
        {"size_combined", ncd.sizeCombined},
        {"raw_size_a", ncd.rawSizeA},
        {"raw_size_b", ncd.rawSizeB},
    };
}

nlohmann::json toJson(const EntropyMeasurement& entropy) {
    return {
        {"shannon", entropy.shannon},
        {"ttr", entropy.ttr},
        {"hapax_ratio", entropy.hapaxRatio},
        {"total_tokens", entropy.totalTokens},
        {"unique_tokens", entropy.uniqueTokens},
        {"hapax_count", entropy.hapaxCount},
    };
}

nlohmann::json toJson(const TopologyMetrics& topology) {
    return {
        {"node_count", topology.nodeCount},
        {"edge_count", topology.edgeCount},
        {"components", topology.components},
        {"lcc_size", topology.lccSize},
        {"density", topology.density},
        {"lcc_ratio", topology.lccRatio},
        {"clustering", topology.clustering},
        {"avg_path_length", topology.avgPathLength},
        {"small_world_index", topology.smallWorldIndex},
        {"avg_degree", topology.avgDegree},
        {"structural_quality", topology.structuralQuality},
    };
}

nlohmann::json toJson(const Coefficients& coefficients) {
    return {
        {"alpha", coefficients.alpha},
        {"beta", coefficients.beta},
        {"gamma", coefficients.gamma},
    };
}

nlohmann::json toJson(const VerdictThresholds& thresholds) {
    return {
        {"zombie", thresholds.zombie},
        {"rebel", thresholds.rebel},
        {"architect", thresholds.architect},
    };
}

nlohmann::json toJson(const ScoringConfig& config) {
    return {
        {"coefficients", toJson(config.coefficients)},
        {"thresholds", toJson(config.thresholds)},
        {"strategy", std::string(toString(config.topologyStrategy))},
    };
}

nlohmann::json toJson(const LdsiResult& result) {
    nlohmann::json j;
    j["schema"] = std::string(Result_Schema);
    j["lambda"] = result.lambda;
    j["verdict"] = std::string(verdictName(result.verdict));
    j["ncd"] = toJson(result.ncd);

    j["entropy"] = {
        {"shannon_a", result.entropyA.shannon},
        {"shannon_b", result.entropyB.shannon},
        {"ratio", result.entropyRatio},
        {"term", result.entropyTerm},
        {"ttr_a", result.entropyA.ttr},
        {"ttr_b", result.entropyB.ttr},
        {"hapax_ratio_a", result.entropyA.hapaxRatio},
        {"hapax_ratio_b", result.entropyB.hapaxRatio},
        {"a", toJson(result.entropyA)},
        {"b", toJson(result.entropyB)},
    };

    j["topology"] = {
        {"strategy", std::string(toString(result.topologyStrategy))},
        {"structural_quality", result.structuralQuality},
        {"delta", result.topologyDelta},
        {"a", toJson(result.topologyA)},
        {"b", toJson(result.topologyB)},
    };

    j["coefficients"] = toJson(result.coefficients);
    return j;
}

LdsiResult resultFromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw_invalid{} << "Result json must be an object";
    }

    std::string schema;
    req_get(json, "schema", schema);
    if (schema != Result_Schema) {
        throw_invalid{} << "Unsupported result schema \"" << schema << "\", expected \"" << Result_Schema << "\"";
    }

    try {
        LdsiResult res;
        req_get(json, "lambda", res.lambda);

        std::string verdict;
        req_get(json, "verdict", verdict);
        auto v = verdictFromName(verdict);
        if (!v) {
            throw_invalid{} << "Unknown verdict \"" << verdict << "\"";
        }
        res.verdict = *v;

        auto& jn = req_obj(json, "ncd");
        req_get(jn, "raw", res.ncd.raw);
        req_get(jn, "damping_factor", res.ncd.dampingFactor);
        req_get(jn, "corrected", res.ncd.corrected);
        req_get(jn, "size_a", res.ncd.sizeA);
        req_get(jn, "size_b", res.ncd.sizeB);
        req_get(jn, "size_combined", res.ncd.sizeCombined);
        req_get(jn, "raw_size_a", res.ncd.rawSizeA);
        req_get(jn, "raw_size_b", res.ncd.rawSizeB);

        auto& je = req_obj(json, "entropy");
        req_get(je, "ratio", res.entropyRatio);
        req_get(je, "term", res.entropyTerm);
        req_get(je, "shannon_a", res.entropyA.shannon);
        req_get(je, "shannon_b", res.entropyB.shannon);
        req_get(je, "ttr_a", res.entropyA.ttr);
        req_get(je, "ttr_b", res.entropyB.ttr);
        req_get(je, "hapax_ratio_a", res.entropyA.hapaxRatio);
        req_get(je, "hapax_ratio_b", res.entropyB.hapaxRatio);
        // the counts are optional
        if (auto it = je.find("a"); it != je.end()) {
            opt_get(*it, "total_tokens", res.entropyA.totalTokens);
            opt_get(*it, "unique_tokens", res.entropyA.uniqueTokens);
            opt_get(*it, "hapax_count", res.entropyA.hapaxCount);
        }
        if (auto it = je.find("b"); it != je.end()) {
            opt_get(*it, "total_tokens", res.entropyB.totalTokens);
            opt_get(*it, "unique_tokens", res.entropyB.uniqueTokens);
            opt_get(*it, "hapax_count", res.entropyB.hapaxCount);
        }

        auto& jt = req_obj(json, "topology");
        std::string strategy;
        req_get(jt, "strategy", strategy);
        auto s = topologyStrategyFromString(strategy);
        if (!s) {
            throw_invalid{} << "Unknown topology strategy \"" << strategy << "\"";
        }
        res.topologyStrategy = *s;
        req_get(jt, "structural_quality", res.structuralQuality);
        req_get(jt, "delta", res.topologyDelta);
        res.topologyA = topologyFromJson(req_obj(jt, "a"));
        res.topologyB = topologyFromJson(req_obj(jt, "b"));

        auto& jc = req_obj(json, "coefficients");
        req_get(jc, "alpha", res.coefficients.alpha);
        req_get(jc, "beta", res.coefficients.beta);
        req_get(jc, "gamma", res.coefficients.gamma);

        return res;
    }
    catch (nlohmann::json::exception& e) {
        throw_invalid{} << "Malformed result json: " << e.what();
    }
}

ScoringConfig configFromJson(const nlohmann::json& json, const ScoringConfig& base) {
    if (!json.is_object()) {
        throw_invalid{} << "Config json must be an object";
    }

    ScoringConfig cfg = base;
    try {
        if (auto it = json.find("coefficients"); it != json.end()) {
            opt_get(*it, "alpha", cfg.coefficients.alpha);
            opt_get(*it, "beta", cfg.coefficients.beta);
            opt_get(*it, "gamma", cfg.coefficients.gamma);
        }
        if (auto it = json.find("thresholds"); it != json.end()) {
            opt_get(*it, "zombie", cfg.thresholds.zombie);
            opt_get(*it, "rebel", cfg.thresholds.rebel);
            opt_get(*it, "architect", cfg.thresholds.architect);
        }
        if (auto it = json.find("strategy"); it != json.end()) {
            auto& str = it->get_ref<const std::string&>();
            auto s = topologyStrategyFromString(str);
            if (!s) {
                throw_invalid{} << "Unknown topology strategy \"" << str << "\"";
            }
            cfg.topologyStrategy = *s;
        }
    }
    catch (nlohmann::json::exception& e) {
        throw_invalid{} << "Malformed config json: " << e.what();
    }

    validate(cfg);
    return cfg;
}

ScoringConfig loadConfig(const std::string& path) {
    std::ifstream fin(path);
    if (!fin) {
        throw_ex{} << "Can't open config file " << path;
    }

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(fin);
    }
    catch (nlohmann::json::parse_error& e) {
        throw_invalid{} << "Can't parse config file " << path << ": " << e.what();
    }

    return configFromJson(json, {});
}

} // namespace ldsi
