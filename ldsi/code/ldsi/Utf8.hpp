// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#pragma once
#include "api.h"
#include <cstddef>
#include <string>
#include <string_view>

// minimal utf-8 and character-class helpers used by the tokenizer and the cleaner
// the character classes approximate the unicode properties for latin, greek,
// cyrillic and cjk text, which is what model responses are scored on
namespace ldsi::utf8 {

inline constexpr char32_t Invalid = 0xFFFFFFFF;

// decode the code point at pos and advance pos past it
// on malformed input returns Invalid and advances pos by one byte
LDSI_API char32_t decode(std::string_view str, size_t& pos) noexcept;

LDSI_API void append(std::string& out, char32_t cp);

LDSI_API bool isValid(std::string_view str) noexcept;

LDSI_API bool isAlphabetic(char32_t cp) noexcept;
LDSI_API bool isDigit(char32_t cp) noexcept;
LDSI_API bool isWhitespace(char32_t cp) noexcept;

// simple (1:1) lowercase mapping
LDSI_API char32_t toLower(char32_t cp) noexcept;

LDSI_API std::string toLower(std::string_view str);

} // namespace ldsi::utf8
