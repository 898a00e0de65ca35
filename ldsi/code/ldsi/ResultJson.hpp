// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#pragma once
#include "api.h"
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <string_view>

namespace ldsi {

struct NcdMeasurement;
struct EntropyMeasurement;
struct TopologyMetrics;
struct Coefficients;
struct VerdictThresholds;
struct ScoringConfig;
struct LdsiResult;

// value of the "schema" field of serialized results
inline constexpr std::string_view Result_Schema = "ldsi-result/2";

LDSI_API nlohmann::json toJson(const NcdMeasurement& ncd);
LDSI_API nlohmann::json toJson(const EntropyMeasurement& entropy);
LDSI_API nlohmann::json toJson(const TopologyMetrics& topology);
LDSI_API nlohmann::json toJson(const Coefficients& coefficients);
LDSI_API nlohmann::json toJson(const VerdictThresholds& thresholds);
LDSI_API nlohmann::json toJson(const ScoringConfig& config);
LDSI_API nlohmann::json toJson(const LdsiResult& result);

// parse a result previously produced by toJson
// throws std::invalid_argument on a schema mismatch or missing fields
LDSI_API LdsiResult resultFromJson(const nlohmann::json& json);

// overlay the keys present in json over base, missing keys keep the values of base
// {"coefficients": {"alpha", "beta", "gamma"}, "thresholds": {"zombie", "rebel", "architect"}, "strategy"}
// throws std::invalid_argument if the values are of the wrong type or the result is invalid
LDSI_API ScoringConfig configFromJson(const nlohmann::json& json, const ScoringConfig& base);

// load a json config file over the library defaults
// throws std::runtime_error if the file can't be read and std::invalid_argument if it's malformed
LDSI_API ScoringConfig loadConfig(const std::string& path);

} // namespace ldsi
