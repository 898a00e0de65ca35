// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#include <doctest/doctest.h>

#include <ldsi/Audit.hpp>
#include <ldsi/Init.hpp>

#include <nlohmann/json.hpp>

#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

using namespace ldsi;

namespace {
std::string tempPath(const char* name) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove(path);
    return path.string();
}
}

TEST_CASE("test id") {
    auto id = AuditLogger::generateTestId();
    // LDSI_YYYYmmdd_HHMMSS_XXXXXXXX
    REQUIRE(id.size() == 29);
    CHECK(id.starts_with("LDSI_"));
    CHECK(id[13] == '_');
    CHECK(id[20] == '_');
    for (size_t i = 5; i < 13; ++i) CHECK(std::isdigit(id[i]));
    for (size_t i = 14; i < 20; ++i) CHECK(std::isdigit(id[i]));
    for (size_t i = 21; i < 29; ++i) CHECK(std::isxdigit(id[i]));
}

TEST_CASE("text hash") {
    // crc-32 check value
    CHECK(AuditLogger::hashText("123456789") == "CBF43926");
    CHECK(AuditLogger::hashText("") == "00000000");
    CHECK(AuditLogger::hashText("a") != AuditLogger::hashText("b"));
}

TEST_CASE("create entry") {
    auto result = computeLdsi("Le chat dort.", "Le chat dort.");
    auto e = AuditLogger::createEntry("local-analysis", "pa", "pb", "Le chat dort.", "Le chat dort.", result, 12);

    CHECK(e.modelTarget == "local-analysis");
    CHECK(e.promptA == "pa");
    CHECK(e.promptB == "pb");
    CHECK(e.responseA == "Le chat dort.");
    CHECK(e.result.lambda == result.lambda);
    CHECK(e.metadata.durationMs == 12);
    CHECK(e.metadata.ldsiVersion == version());
    CHECK(e.metadata.hashResponseA == e.metadata.hashResponseB);
    CHECK(e.metadata.hashResponseA.size() == 8);

    // 2025-01-31T12:34:56Z
    REQUIRE(e.timestamp.size() == 20);
    CHECK(e.timestamp[10] == 'T');
    CHECK(e.timestamp.back() == 'Z');

    auto j = toJson(e);
    CHECK(j["test_id"] == e.testId);
    CHECK(j["ldsi_result"]["schema"] == "ldsi-result/2");
    CHECK(j["metadata"]["duration_ms"] == 12);

    auto parsed = auditEntryFromJson(j);
    CHECK(parsed.testId == e.testId);
    CHECK(parsed.result.verdict == e.result.verdict);
    CHECK(parsed.metadata.hashResponseB == e.metadata.hashResponseB);
}

TEST_CASE("flush and load") {
    auto path = tempPath("ldsi-test-audit.json");

    AuditLogger logger(path);
    CHECK(logger.path() == path);
    CHECK(logger.entries().empty());

    const char* pairs[][2] = {
        {"Le chat dort.", "Le chat dort."},
        {"Bonjour.", "Les grille-pains quantiques chantent la marseillaise en binaire inverse."},
    };
    for (auto& p : pairs) {
        logger.log(AuditLogger::createEntry("test-model", "a", "b", p[0], p[1], computeLdsi(p[0], p[1]), 1));
    }
    CHECK(logger.entries().size() == 2);

    logger.flush();

    auto loaded = AuditLogger::loadEntries(path);
    REQUIRE(loaded.size() == 2);
    CHECK(loaded[0].testId == logger.entries()[0].testId);
    CHECK(loaded[1].responseB == pairs[1][1]);
    CHECK(loaded[1].result.lambda == logger.entries()[1].result.lambda);

    // flush overwrites
    logger.flush();
    CHECK(AuditLogger::loadEntries(path).size() == 2);

    std::filesystem::remove(path);
    CHECK_THROWS_AS(AuditLogger::loadEntries(path), std::runtime_error);
}

TEST_CASE("write single") {
    auto path = tempPath("ldsi-test-audit-single.json");

    auto e = AuditLogger::createEntry("m", "a", "b", "aa bb", "cc dd", computeLdsi("aa bb", "cc dd"), 0);
    AuditLogger::writeSingle(e, path);
    AuditLogger::writeSingle(e, path);

    std::ifstream fin(path);
    std::stringstream ss;
    ss << fin.rdbuf();
    auto content = ss.str();

    // two appended pretty-printed objects
    auto first = content.find("\"test_id\"");
    REQUIRE(first != std::string::npos);
    CHECK(content.find("\"test_id\"", first + 1) != std::string::npos);

    fin.close();

    auto loaded = AuditLogger::loadEntries(path);
    REQUIRE(loaded.size() == 2);
    CHECK(loaded[0].testId == e.testId);
    CHECK(loaded[1].responseB == "cc dd");

    std::filesystem::remove(path);
}

TEST_CASE("load mixed audit file") {
    auto path = tempPath("ldsi-test-audit-mixed.json");

    AuditLogger logger(path);
    logger.log(AuditLogger::createEntry("m", "a", "b", "Le chat dort.", "Le chat dort.", computeLdsi("Le chat dort.", "Le chat dort."), 0));
    logger.log(AuditLogger::createEntry("m", "a", "b", "aa bb", "cc dd", computeLdsi("aa bb", "cc dd"), 0));
    logger.flush();

    auto single = AuditLogger::createEntry("m", "a", "b", "ee ff", "gg hh", computeLdsi("ee ff", "gg hh"), 0);
    AuditLogger::writeSingle(single, path);

    auto loaded = AuditLogger::loadEntries(path);
    REQUIRE(loaded.size() == 3);
    CHECK(loaded[0].testId == logger.entries()[0].testId);
    CHECK(loaded[1].testId == logger.entries()[1].testId);
    CHECK(loaded[2].testId == single.testId);

    std::filesystem::remove(path);
}

TEST_CASE("load malformed audit file") {
    auto path = tempPath("ldsi-test-audit-bad.json");
    auto write = [&](const char* content) {
        std::ofstream fout(path, std::ios::trunc);
        fout << content;
    };

    write("");
    CHECK(AuditLogger::loadEntries(path).empty());

    write("  \n[]\n");
    CHECK(AuditLogger::loadEntries(path).empty());

    write("42");
    CHECK_THROWS_AS(AuditLogger::loadEntries(path), std::invalid_argument);

    write("[]\n{\"test_id\": ");
    CHECK_THROWS_AS(AuditLogger::loadEntries(path), std::invalid_argument);

    write("[] garbage");
    CHECK_THROWS_AS(AuditLogger::loadEntries(path), std::invalid_argument);

    std::filesystem::remove(path);
}
