// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#include "TextSample.hpp"
#include "Tokenizer.hpp"
#include "Utf8.hpp"
#include <bstl/throw_stdex.hpp>

namespace ldsi {

namespace {
std::string validated(std::string text) {
    if (!utf8::isValid(text)) {
        throw_invalid{} << "Text sample is not valid UTF-8 (" << text.size() << " bytes)";
    }
    return text;
}
} // namespace

TextSample::TextSample(std::string text)
    : m_text(validated(std::move(text)))
    , m_tokens(tokenize(m_text))
{}

TextSample::TextSample(std::string text, std::vector<std::string> tokens)
    : m_text(validated(std::move(text)))
    , m_tokens(std::move(tokens))
{}

} // namespace ldsi
