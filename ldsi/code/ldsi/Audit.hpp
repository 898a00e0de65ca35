// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#pragma once
#include "api.h"
#include "Ldsi.hpp"
#include <nlohmann/json_fwd.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace ldsi {

struct AuditMetadata {
    std::string ldsiVersion;
    uint64_t durationMs = 0;

    // crc-32 of the responses as 8 uppercase hex digits
    // for integrity checks of stored entries, not a cryptographic hash
    std::string hashResponseA;
    std::string hashResponseB;
};

struct AuditEntry {
    std::string timestamp; // iso 8601, utc
    std::string testId; // LDSI_YYYYmmdd_HHMMSS_XXXXXXXX
    std::string modelTarget;
    std::string promptA;
    std::string promptB;
    std::string responseA;
    std::string responseB;
    LdsiResult result;
    AuditMetadata metadata;
};

LDSI_API nlohmann::json toJson(const AuditEntry& entry);

// throws std::invalid_argument on malformed entries
LDSI_API AuditEntry auditEntryFromJson(const nlohmann::json& json);

// buffers audit entries and persists them as a json array
class LDSI_API AuditLogger {
public:
    explicit AuditLogger(std::string path);

    static std::string generateTestId();

    static std::string hashText(std::string_view text);

    static AuditEntry createEntry(
        std::string_view model,
        std::string_view promptA,
        std::string_view promptB,
        std::string_view responseA,
        std::string_view responseB,
        LdsiResult result,
        uint64_t durationMs
    );

    void log(AuditEntry entry);

    // (over)write the file with all buffered entries
    // throws std::runtime_error on io errors
    void flush() const;

    // append a single pretty-printed entry to path
    // throws std::runtime_error on io errors
    static void writeSingle(const AuditEntry& entry, const std::string& path);

    // load a file produced by flush, writeSingle or both
    // entries are returned in file order
    // throws std::runtime_error if it can't be read and std::invalid_argument if it's malformed
    static std::vector<AuditEntry> loadEntries(const std::string& path);

    const std::vector<AuditEntry>& entries() const noexcept { return m_entries; }
    const std::string& path() const noexcept { return m_path; }

private:
    std::string m_path;
    std::vector<AuditEntry> m_entries;
};

} // namespace ldsi
