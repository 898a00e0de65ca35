// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#pragma once
#include "api.h"
#include <string>
#include <string_view>
#include <vector>

namespace ldsi {

// tokens shorter than this (in bytes) are dropped
inline constexpr size_t Token_MinBytes = 2;

// split text into lowercase words
// a word is a maximal run of alphabetic code points: digits, punctuation, symbols
// and whitespace all act as separators (so "aujourd'hui" yields "aujourd" and "hui")
// no stemming or lemmatization
LDSI_API std::vector<std::string> tokenize(std::string_view text);

} // namespace ldsi
