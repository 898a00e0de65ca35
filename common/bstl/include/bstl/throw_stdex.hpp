// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#pragma once
#include <itlib/throw_ex.hpp>
#include <stdexcept>

namespace ldsi {
// runtime failures (compression, io)
using throw_ex = itlib::throw_ex<std::runtime_error>;

// structurally invalid input (bad encoding, non-finite coefficients, malformed config)
using throw_invalid = itlib::throw_ex<std::invalid_argument>;
}
