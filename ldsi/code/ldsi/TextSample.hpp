// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#pragma once
#include "api.h"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ldsi {

// immutable scoring input: the raw text (compressed as is by the ncd engine)
// and the token sequence fed to the entropy engine and the topology analyzer
class LDSI_API TextSample {
public:
    // tokenizes with ldsi::tokenize
    // throws std::invalid_argument if text is not valid utf-8
    explicit TextSample(std::string text);

    // tokens produced externally (for example by TextCleaner)
    // throws std::invalid_argument if text is not valid utf-8
    TextSample(std::string text, std::vector<std::string> tokens);

    const std::string& text() const noexcept { return m_text; }

    std::span<const uint8_t> bytes() const noexcept {
        return {reinterpret_cast<const uint8_t*>(m_text.data()), m_text.size()};
    }

    const std::vector<std::string>& tokens() const noexcept { return m_tokens; }

    bool empty() const noexcept { return m_text.empty(); }

private:
    std::string m_text;
    std::vector<std::string> m_tokens;
};

} // namespace ldsi
