// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#pragma once
#include <splat/symbol_export.h>

#if LDSI_SERVER_SHARED
#   if BUILDING_LDSI_SERVER
#       define LDSI_SERVER_API SYMBOL_EXPORT
#   else
#       define LDSI_SERVER_API SYMBOL_IMPORT
#   endif
#else
#   define LDSI_SERVER_API
#endif
