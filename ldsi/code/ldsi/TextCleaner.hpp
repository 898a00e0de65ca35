// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#pragma once
#include "api.h"
#include <string>
#include <string_view>
#include <vector>

namespace ldsi {

// deterministic text preparation before scoring
// strips noise (case, numbers, punctuation, stopwords) while keeping the content words
class LDSI_API TextCleaner {
public:
    enum class Language {
        French,
        English,
        Both,
    };

    struct Params {
        bool removeStopwords = true;
        bool lowercase = true;
        bool removePunctuation = true;
        bool removeNumbers = true;

        Language language = Language::Both; // of the static stopword lists

        size_t minWordLength = 2; // in bytes

        // additionally drop words so frequent in this very text that they carry
        // no signal (zipf head): count >= max(3, ceil(total * dynamicStopwordsThreshold))
        bool dynamicStopwords = false;
        double dynamicStopwordsThreshold = 0.01;
    };

    TextCleaner();
    explicit TextCleaner(Params params);

    const Params& params() const noexcept { return m_params; }

    // cleaned words joined with single spaces
    std::string clean(std::string_view text) const;

    std::vector<std::string> cleanTokens(std::string_view text) const;

    // content words only: default params with a minimum length of 4
    static std::string extractSemanticCore(std::string_view text);

    static bool isStopword(std::string_view word, Language language) noexcept;

private:
    Params m_params;
};

} // namespace ldsi
