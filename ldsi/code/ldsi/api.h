// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#pragma once
#include <splat/symbol_export.h>

#if LDSI_SHARED
#   if BUILDING_LDSI
#       define LDSI_API SYMBOL_EXPORT
#   else
#       define LDSI_API SYMBOL_IMPORT
#   endif
#else
#   define LDSI_API
#endif
