// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#include "Tokenizer.hpp"
#include "Utf8.hpp"

namespace ldsi {

std::vector<std::string> tokenize(std::string_view text) {
    std::vector<std::string> tokens;
    std::string cur;

    auto flush = [&] {
        if (cur.size() >= Token_MinBytes) {
            tokens.push_back(std::move(cur));
        }
        cur.clear();
    };

    size_t pos = 0;
    while (pos < text.size()) {
        auto cp = utf8::decode(text, pos);
        if (utf8::isAlphabetic(cp)) {
            utf8::append(cur, utf8::toLower(cp));
        }
        else {
            flush();
        }
    }
    flush();

    return tokens;
}

} // namespace ldsi
