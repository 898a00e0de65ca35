// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#include "Audit.hpp"
#include "ResultJson.hpp"
#include "Init.hpp"
#include "Logging.hpp"
#include <bstl/throw_stdex.hpp>
#include <nlohmann/json.hpp>
#include <zlib.h>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <random>
#include <mutex>
#include <algorithm>

namespace ldsi {

namespace {
std::tm utcNow() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm = {};
#if defined(_WIN32)
    gmtime_s(&tm, &now);
#else
    gmtime_r(&now, &tm);
#endif
    return tm;
}

std::string formatTime(const std::tm& tm, const char* fmt) {
    char buf[64];
    auto len = std::strftime(buf, sizeof(buf), fmt, &tm);
    return std::string(buf, len);
}
} // namespace

AuditLogger::AuditLogger(std::string path)
    : m_path(std::move(path))
{}

std::string AuditLogger::generateTestId() {
    static std::mutex mutex;
    static std::mt19937 rng(std::random_device{}());

    uint32_t suffix;
    {
        std::lock_guard lock(mutex);
        suffix = uint32_t(rng());
    }

    char hex[9];
    std::snprintf(hex, sizeof(hex), "%08X", suffix);
    return "LDSI_" + formatTime(utcNow(), "%Y%m%d_%H%M%S") + "_" + hex;
}

std::string AuditLogger::hashText(std::string_view text) {
    uLong crc = crc32(0L, Z_NULL, 0);
    // crc32 takes uInt lengths
    while (!text.empty()) {
        auto chunk = std::min(text.size(), size_t(1) << 30);
        crc = crc32(crc, reinterpret_cast<const Bytef*>(text.data()), uInt(chunk));
        text.remove_prefix(chunk);
    }

    char hex[9];
    std::snprintf(hex, sizeof(hex), "%08lX", static_cast<unsigned long>(crc & 0xFFFFFFFFul));
    return hex;
}

AuditEntry AuditLogger::createEntry(
    std::string_view model,
    std::string_view promptA,
    std::string_view promptB,
    std::string_view responseA,
    std::string_view responseB,
    LdsiResult result,
    uint64_t durationMs
) {
    return {
        .timestamp = formatTime(utcNow(), "%Y-%m-%dT%H:%M:%SZ"),
        .testId = generateTestId(),
        .modelTarget = std::string(model),
        .promptA = std::string(promptA),
        .promptB = std::string(promptB),
        .responseA = std::string(responseA),
        .responseB = std::string(responseB),
        .result = std::move(result),
        .metadata = {
            .ldsiVersion = std::string(version()),
            .durationMs = durationMs,
            .hashResponseA = hashText(responseA),
            .hashResponseB = hashText(responseB),
        },
    };
}

void AuditLogger::log(AuditEntry entry) {
    m_entries.push_back(std::move(entry));
}

void AuditLogger::flush() const {
    auto arr = nlohmann::json::array();
    for (auto& e : m_entries) {
        arr.push_back(toJson(e));
    }

    std::ofstream fout(m_path, std::ios::trunc);
    if (!fout) {
        throw_ex{} << "Can't open audit file " << m_path << " for writing";
    }
    fout << arr.dump(2) << '\n';
    if (!fout) {
        throw_ex{} << "Error writing audit file " << m_path;
    }

    LDSI_LOG(Debug, "audit: wrote ", m_entries.size(), " entries to ", m_path);
}

void AuditLogger::writeSingle(const AuditEntry& entry, const std::string& path) {
    std::ofstream fout(path, std::ios::app);
    if (!fout) {
        throw_ex{} << "Can't open audit file " << path << " for appending";
    }
    fout << toJson(entry).dump(2) << '\n';
    if (!fout) {
        throw_ex{} << "Error writing audit file " << path;
    }
}

std::vector<AuditEntry> AuditLogger::loadEntries(const std::string& path) {
    std::ifstream fin(path);
    if (!fin) {
        throw_ex{} << "Can't open audit file " << path;
    }

    // flush writes one array, writeSingle appends one object per call
    // so the file is a sequence of arrays and objects
    std::vector<AuditEntry> ret;
    while (!(fin >> std::ws).eof()) {
        nlohmann::json json;
        try {
            fin >> json;
        }
        catch (nlohmann::json::parse_error& e) {
            throw_invalid{} << "Can't parse audit file " << path << ": " << e.what();
        }

        if (json.is_array()) {
            for (auto& je : json) {
                ret.push_back(auditEntryFromJson(je));
            }
        }
        else if (json.is_object()) {
            ret.push_back(auditEntryFromJson(json));
        }
        else {
            throw_invalid{} << "Audit file " << path << " must contain entry objects or arrays of them";
        }
    }
    return ret;
}

nlohmann::json toJson(const AuditEntry& entry) {
    return {
        {"timestamp", entry.timestamp},
        {"test_id", entry.testId},
        {"model_target", entry.modelTarget},
        {"prompt_a", entry.promptA},
        {"prompt_b", entry.promptB},
        {"response_a", entry.responseA},
        {"response_b", entry.responseB},
        {"ldsi_result", toJson(entry.result)},
        {"metadata", {
            {"ldsi_version", entry.metadata.ldsiVersion},
            {"duration_ms", entry.metadata.durationMs},
            {"hash_response_a", entry.metadata.hashResponseA},
            {"hash_response_b", entry.metadata.hashResponseB},
        }},
    };
}

AuditEntry auditEntryFromJson(const nlohmann::json& json) {
    try {
        AuditEntry e;
        e.timestamp = json.at("timestamp").get<std::string>();
        e.testId = json.at("test_id").get<std::string>();
        e.modelTarget = json.at("model_target").get<std::string>();
        e.promptA = json.at("prompt_a").get<std::string>();
        e.promptB = json.at("prompt_b").get<std::string>();
        e.responseA = json.at("response_a").get<std::string>();
        e.responseB = json.at("response_b").get<std::string>();
        e.result = resultFromJson(json.at("ldsi_result"));

        auto& jm = json.at("metadata");
        e.metadata.ldsiVersion = jm.at("ldsi_version").get<std::string>();
        e.metadata.durationMs = jm.at("duration_ms").get<uint64_t>();
        e.metadata.hashResponseA = jm.at("hash_response_a").get<std::string>();
        e.metadata.hashResponseB = jm.at("hash_response_b").get<std::string>();
        return e;
    }
    catch (nlohmann::json::exception& ex) {
        throw_invalid{} << "Malformed audit entry: " << ex.what();
    }
}

} // namespace ldsi
