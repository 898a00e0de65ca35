// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#include "Ncd.hpp"
#include "Logging.hpp"
#include <bstl/throw_stdex.hpp>
#include <bstl/mem_ext.hpp>
#include <zstd.h>
#include <algorithm>
#include <bit>
#include <cmath>
#include <vector>

namespace ldsi {

namespace {
using CompressionContext = bstl::c_unique_ptr<ZSTD_CCtx>;

void checkZstd(size_t code, const char* what) {
    if (ZSTD_isError(code)) {
        throw_ex{} << "zstd " << what << " failed: " << ZSTD_getErrorName(code);
    }
}

CompressionContext makeContext(int windowLog) {
    CompressionContext cctx(ZSTD_createCCtx(), [](ZSTD_CCtx* c) { ZSTD_freeCCtx(c); });
    if (!cctx) {
        throw_ex{} << "Failed to create zstd compression context";
    }

    const auto bounds = ZSTD_cParam_getBounds(ZSTD_c_windowLog);
    checkZstd(bounds.error, "window log bounds");
    windowLog = std::clamp(windowLog, bounds.lowerBound, bounds.upperBound);

    checkZstd(ZSTD_CCtx_setParameter(cctx.get(), ZSTD_c_compressionLevel, Zstd_Level), "set level");
    checkZstd(ZSTD_CCtx_setParameter(cctx.get(), ZSTD_c_windowLog, windowLog), "set window log");
    checkZstd(ZSTD_CCtx_setParameter(cctx.get(), ZSTD_c_checksumFlag, 0), "set checksum flag");
    return cctx;
}

// parameters stick to the context, each call compresses one full frame
size_t compressedSize(ZSTD_CCtx* cctx, std::span<const uint8_t> data) {
    std::vector<uint8_t> out(ZSTD_compressBound(data.size()));
    const size_t res = ZSTD_compress2(cctx, out.data(), out.size(), data.data(), data.size());
    checkZstd(res, "compression");
    return res;
}

std::span<const uint8_t> asBytes(std::string_view str) noexcept {
    return {reinterpret_cast<const uint8_t*>(str.data()), str.size()};
}
} // namespace

int windowLogFor(size_t length) noexcept {
    return std::clamp(int(std::bit_width(length)), Zstd_MinWindowLog, Zstd_MaxWindowLog);
}

size_t compressedSize(std::span<const uint8_t> data, int windowLog) {
    auto cctx = makeContext(windowLog);
    return compressedSize(cctx.get(), data);
}

size_t compressedSize(std::span<const uint8_t> data) {
    return compressedSize(data, windowLogFor(data.size()));
}

double dampingFactor(size_t combinedLength) noexcept {
    if (combinedLength < 2) {
        // ln(0) is undefined and ln(1) = 0
        return 0.0;
    }
    if (combinedLength >= Ncd_DampingLength) {
        return 1.0;
    }
    return std::log(double(combinedLength)) / std::log(double(Ncd_DampingLength));
}

NcdMeasurement computeNcd(std::span<const uint8_t> a, std::span<const uint8_t> b) {
    NcdMeasurement m;
    m.rawSizeA = a.size();
    m.rawSizeB = b.size();

    std::vector<uint8_t> combined;
    combined.reserve(a.size() + b.size());
    combined.insert(combined.end(), a.begin(), a.end());
    combined.insert(combined.end(), b.begin(), b.end());

    const bool identical = std::ranges::equal(a, b);

    // one window for all three so that C(a) and C(b) are measured like C(ab)
    auto cctx = makeContext(windowLogFor(combined.size()));
    m.sizeA = compressedSize(cctx.get(), a);
    m.sizeB = identical ? m.sizeA : compressedSize(cctx.get(), b);
    m.sizeCombined = compressedSize(cctx.get(), combined);

    if (identical) {
        m.raw = 0.0;
    }
    else {
        const double minC = double(std::min(m.sizeA, m.sizeB));
        const double maxC = double(std::max(m.sizeA, m.sizeB));
        m.raw = maxC > 0 ? std::clamp((double(m.sizeCombined) - minC) / maxC, 0.0, Ncd_RawMax) : 0.0;
    }

    m.dampingFactor = dampingFactor(combined.size());
    m.corrected = std::clamp(m.raw * m.dampingFactor, 0.0, 1.0);

    LDSI_LOG(Debug, "ncd: C(a) = ", m.sizeA, ", C(b) = ", m.sizeB, ", C(ab) = ", m.sizeCombined,
        ", raw = ", m.raw, ", damping = ", m.dampingFactor, ", corrected = ", m.corrected);

    return m;
}

NcdMeasurement computeNcd(std::string_view a, std::string_view b) {
    return computeNcd(asBytes(a), asBytes(b));
}

} // namespace ldsi
