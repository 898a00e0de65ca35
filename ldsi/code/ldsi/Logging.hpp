// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#pragma once
#include "api.h"
#include <jalog/Scope.hpp>
#include <jalog/Log.hpp>

namespace ldsi::log {
extern jalog::Scope scope;
}

#define LDSI_LOG(lvl, ...) JALOG_SCOPE(::ldsi::log::scope, lvl, __VA_ARGS__)
