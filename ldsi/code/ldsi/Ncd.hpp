// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#pragma once
#include "api.h"
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace ldsi {

// pinned compressor configuration: zstd level 3, no checksum
// every compression of one measurement uses the window log of the combined input
// changing any of these changes every compressed size and thus every score
inline constexpr int Zstd_Level = 3;
inline constexpr int Zstd_MinWindowLog = 10; // 1 KiB
inline constexpr int Zstd_MaxWindowLog = 31;

// combined length at which short-text damping stops
inline constexpr size_t Ncd_DampingLength = 1024;

// upper bound of the raw (undamped) ncd kept for audit
// the compressor can produce C(ab) slightly above C(a) + C(b) on incompressible input
inline constexpr double Ncd_RawMax = 1.5;

struct NcdMeasurement {
    size_t sizeA = 0; // compressed size of a
    size_t sizeB = 0; // compressed size of b
    size_t sizeCombined = 0; // compressed size of a||b

    size_t rawSizeA = 0;
    size_t rawSizeB = 0;

    double raw = 0; // (C(ab) - min(C(a),C(b))) / max(C(a),C(b)), in [0, Ncd_RawMax]
    double dampingFactor = 0; // in [0, 1]
    double corrected = 0; // raw * dampingFactor, in [0, 1]
};

// clamp(bit_width(length), Zstd_MinWindowLog, Zstd_MaxWindowLog)
// so that the window covers the whole input
LDSI_API int windowLogFor(size_t length) noexcept;

// compressed size of data with the pinned configuration and the given window log
// (limited to what the zstd build supports)
// throws std::runtime_error if the compressor fails
LDSI_API size_t compressedSize(std::span<const uint8_t> data, int windowLog);

// compressedSize(data, windowLogFor(data.size()))
LDSI_API size_t compressedSize(std::span<const uint8_t> data);

// short-text correction:
// 0 for length < 2, ln(length) / ln(1024) below 1024, 1 from there on
LDSI_API double dampingFactor(size_t combinedLength) noexcept;

// normalized compression distance with short-text damping
// identical inputs have a distance of exactly 0
LDSI_API NcdMeasurement computeNcd(std::span<const uint8_t> a, std::span<const uint8_t> b);
LDSI_API NcdMeasurement computeNcd(std::string_view a, std::string_view b);

} // namespace ldsi
