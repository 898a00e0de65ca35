// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#include "TextCleaner.hpp"
#include "Utf8.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <map>

namespace ldsi {

namespace {
// sorted for binary search
template <size_t N>
constexpr std::array<std::string_view, N> sorted(std::array<std::string_view, N> words) {
    std::sort(words.begin(), words.end());
    return words;
}

constexpr auto French_Stopwords = sorted(std::to_array<std::string_view>({
    "le", "la", "les", "un", "une", "des", "du", "de", "d", "l", "et", "ou", "mais", "donc", "or",
    "ni", "car", "je", "tu", "il", "elle", "on", "nous", "vous", "ils", "elles", "me", "te", "se",
    "lui", "leur", "y", "en", "ce", "cet", "cette", "ces", "mon", "ton", "son", "ma", "ta", "sa",
    "mes", "tes", "ses", "notre", "votre", "nos", "vos", "leurs", "qui", "que", "quoi", "dont",
    "où", "lequel", "laquelle", "au", "aux", "avec", "sans", "sous", "sur", "dans", "par", "pour",
    "en", "vers", "chez", "entre", "contre", "depuis", "pendant", "être", "avoir", "faire", "dire",
    "aller", "voir", "pouvoir", "vouloir", "est", "sont", "suis", "es", "sommes", "êtes", "était",
    "été", "a", "ont", "avait", "eu", "fait", "dit", "va", "vont", "peut", "veut", "ne", "pas",
    "plus", "moins", "très", "bien", "mal", "tout", "tous", "toute", "toutes", "autre", "autres",
    "même", "aussi", "comme", "si", "quand", "alors", "ainsi", "c", "n", "s", "j", "qu", "m", "t",
}));

constexpr auto English_Stopwords = sorted(std::to_array<std::string_view>({
    "the", "a", "an", "and", "or", "but", "if", "then", "else", "when", "at", "from", "by", "for",
    "with", "about", "against", "between", "into", "through", "during", "before", "after", "above",
    "below", "to", "of", "in", "on", "off", "over", "under", "is", "are", "was", "were", "be",
    "been", "being", "have", "has", "had", "do", "does", "did", "will", "would", "could", "should",
    "may", "might", "must", "shall", "i", "me", "my", "myself", "we", "our", "ours", "ourselves",
    "you", "your", "yours", "yourself", "yourselves", "he", "him", "his", "himself", "she", "her",
    "hers", "herself", "it", "its", "itself", "they", "them", "their", "theirs", "what", "which",
    "who", "whom", "this", "that", "these", "those", "am", "been", "being", "because", "as",
    "until", "while", "not", "no", "nor", "only", "own", "same", "so", "than", "too", "very",
    "just", "can", "now", "all", "each", "every", "both", "few", "more", "most", "other", "some",
    "such", "any",
}));

template <size_t N>
bool contains(const std::array<std::string_view, N>& words, std::string_view word) noexcept {
    return std::binary_search(words.begin(), words.end(), word);
}

// split on unicode whitespace
std::vector<std::string_view> splitWords(std::string_view text) {
    std::vector<std::string_view> words;
    size_t begin = std::string_view::npos;
    size_t pos = 0;
    while (pos < text.size()) {
        const size_t cur = pos;
        auto cp = utf8::decode(text, pos);
        if (utf8::isWhitespace(cp)) {
            if (begin != std::string_view::npos) {
                words.push_back(text.substr(begin, cur - begin));
                begin = std::string_view::npos;
            }
        }
        else if (begin == std::string_view::npos) {
            begin = cur;
        }
    }
    if (begin != std::string_view::npos) {
        words.push_back(text.substr(begin));
    }
    return words;
}
} // namespace

TextCleaner::TextCleaner()
    : m_params{}
{}

TextCleaner::TextCleaner(Params params)
    : m_params(params)
{}

bool TextCleaner::isStopword(std::string_view word, Language language) noexcept {
    switch (language) {
    case Language::French: return contains(French_Stopwords, word);
    case Language::English: return contains(English_Stopwords, word);
    case Language::Both: return contains(French_Stopwords, word) || contains(English_Stopwords, word);
    }
    return false;
}

std::vector<std::string> TextCleaner::cleanTokens(std::string_view text) const {
    std::string norm;
    norm.reserve(text.size());

    size_t pos = 0;
    bool inNumber = false;
    while (pos < text.size()) {
        auto cp = utf8::decode(text, pos);
        if (cp == utf8::Invalid) {
            norm.push_back(' ');
            continue;
        }

        if (m_params.removeNumbers && utf8::isDigit(cp)) {
            // a run of digits becomes a single space
            if (!inNumber) norm.push_back(' ');
            inNumber = true;
            continue;
        }
        inNumber = false;

        if (m_params.removePunctuation && !utf8::isAlphabetic(cp) && !utf8::isWhitespace(cp)) {
            norm.push_back(' ');
            continue;
        }

        utf8::append(norm, m_params.lowercase ? utf8::toLower(cp) : cp);
    }

    auto words = splitWords(norm);
    auto longEnough = [&](std::string_view w) { return w.size() >= m_params.minWordLength; };

    std::map<std::string_view, size_t> dynamicStops;
    if (m_params.dynamicStopwords) {
        size_t total = 0;
        for (auto w : words) {
            if (!longEnough(w)) continue;
            ++dynamicStops[w];
            ++total;
        }
        const auto minCount = std::max(size_t(3), size_t(std::ceil(double(total) * m_params.dynamicStopwordsThreshold)));
        std::erase_if(dynamicStops, [&](const auto& e) { return e.second < minCount; });
    }

    std::vector<std::string> ret;
    for (auto w : words) {
        if (!longEnough(w)) continue;
        if (m_params.removeStopwords && isStopword(w, m_params.language)) continue;
        if (dynamicStops.contains(w)) continue;
        ret.emplace_back(w);
    }
    return ret;
}

std::string TextCleaner::clean(std::string_view text) const {
    std::string ret;
    for (auto& w : cleanTokens(text)) {
        if (!ret.empty()) ret.push_back(' ');
        ret += w;
    }
    return ret;
}

std::string TextCleaner::extractSemanticCore(std::string_view text) {
    return TextCleaner(Params{.minWordLength = 4}).clean(text);
}

} // namespace ldsi
