// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#pragma once
#include "api.h"
#include <string_view>

namespace ldsi {

// checks that the runtime compressor matches the one the library was built against
// and logs the pinned compression configuration
// scoring works without calling it, but executables should call it once at startup
LDSI_API void initLibrary();

LDSI_API std::string_view version() noexcept;

} // namespace ldsi
