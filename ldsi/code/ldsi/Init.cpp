// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#include "Init.hpp"
#include "Logging.hpp"
#include "Ncd.hpp"
#include <bstl/throw_stdex.hpp>
#include <zstd.h>
#include <string>

#if !defined(LDSI_VERSION)
#   define LDSI_VERSION "0.0.0-dev"
#endif

namespace ldsi {

void initLibrary() {
    // a different major zstd could produce different frames and thus different scores
    const unsigned runtimeVersion = ZSTD_versionNumber();
    if (runtimeVersion / 10000 != unsigned(ZSTD_VERSION_MAJOR)) {
        throw_ex{} << "zstd version mismatch. Built with " << ZSTD_VERSION_STRING << ", running " << ZSTD_versionString();
    }

    LDSI_LOG(Info, "ldsi ", std::string(version()), ", zstd ", ZSTD_versionString(),
        ", level ", Zstd_Level, ", window log ", Zstd_MinWindowLog, "..", Zstd_MaxWindowLog);
}

std::string_view version() noexcept {
    return LDSI_VERSION;
}

} // namespace ldsi
