// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#include <doctest/doctest.h>

#include <ldsi/Utf8.hpp>
#include <ldsi/Tokenizer.hpp>
#include <ldsi/TextSample.hpp>

#include <stdexcept>

using namespace ldsi;

TEST_CASE("utf8 decode") {
    std::string_view str = "a\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80";
    size_t pos = 0;
    CHECK(utf8::decode(str, pos) == U'a');
    CHECK(pos == 1);
    CHECK(utf8::decode(str, pos) == U'é');
    CHECK(pos == 3);
    CHECK(utf8::decode(str, pos) == U'€');
    CHECK(pos == 6);
    CHECK(utf8::decode(str, pos) == U'\U0001F600');
    CHECK(pos == 10);

    CHECK(utf8::isValid(str));
    CHECK(utf8::isValid(""));

    CHECK_FALSE(utf8::isValid("\xC3\x28")); // bad continuation
    CHECK_FALSE(utf8::isValid("\xC0\xAF")); // overlong
    CHECK_FALSE(utf8::isValid("\xED\xA0\x80")); // surrogate
    CHECK_FALSE(utf8::isValid("\xE2\x82")); // truncated
    CHECK_FALSE(utf8::isValid("\xFF"));

    std::string out;
    utf8::append(out, U'é');
    utf8::append(out, U'\U0001F600');
    CHECK(out == "\xC3\xA9\xF0\x9F\x98\x80");
}

TEST_CASE("utf8 classes") {
    CHECK(utf8::isAlphabetic(U'a'));
    CHECK(utf8::isAlphabetic(U'é'));
    CHECK(utf8::isAlphabetic(U'α')); // alpha
    CHECK(utf8::isAlphabetic(U'ж')); // zhe
    CHECK(utf8::isAlphabetic(U'中'));
    CHECK_FALSE(utf8::isAlphabetic(U'1'));
    CHECK_FALSE(utf8::isAlphabetic(U'\''));
    CHECK_FALSE(utf8::isAlphabetic(U'«')); // guillemet
    CHECK_FALSE(utf8::isAlphabetic(U'×'));
    CHECK_FALSE(utf8::isAlphabetic(U'’')); // right single quote
    CHECK_FALSE(utf8::isAlphabetic(U'。')); // ideographic full stop
    CHECK_FALSE(utf8::isAlphabetic(U'\U0001F600'));

    CHECK(utf8::isDigit(U'7'));
    CHECK(utf8::isWhitespace(U' '));

    CHECK(utf8::toLower("\xC3\x89T\xC3\x89 \xC3\x80 BIENT\xC3\x94T") == "\xC3\xA9t\xC3\xA9 \xC3\xA0 bient\xC3\xB4t");
    CHECK(utf8::toLower(U'Ж') == U'ж');
    CHECK(utf8::toLower(U'Α') == U'α');
    CHECK(utf8::toLower(U'ß') == U'ß');
}

TEST_CASE("tokenize") {
    CHECK(tokenize("").empty());
    CHECK(tokenize("  ... 123 !").empty());

    auto t = tokenize("La temperature est de vingt-cinq degres aujourd'hui.");
    CHECK(t == std::vector<std::string>{"la", "temperature", "est", "de", "vingt", "cinq", "degres", "aujourd", "hui"});

    // single byte tokens are dropped, digits separate
    t = tokenize("a b2c d4ef Hi.");
    CHECK(t == std::vector<std::string>{"ef", "hi"});

    // multibyte letters
    t = tokenize("\xC3\x89t\xC3\xA9 \xC3\x80 bient\xC3\xB4t!");
    CHECK(t == std::vector<std::string>{"\xC3\xA9t\xC3\xA9", "\xC3\xA0", "bient\xC3\xB4t"});
}

TEST_CASE("text sample") {
    TextSample s("Le chat dort.");
    CHECK(s.text() == "Le chat dort.");
    CHECK(s.bytes().size() == 13);
    CHECK(s.tokens() == std::vector<std::string>{"le", "chat", "dort"});
    CHECK_FALSE(s.empty());

    TextSample e("");
    CHECK(e.empty());
    CHECK(e.tokens().empty());

    TextSample c("Le chat dort.", {"chat", "dort"});
    CHECK(c.tokens().size() == 2);

    CHECK_THROWS_AS(TextSample("abc \xC3\x28"), std::invalid_argument);
    CHECK_THROWS_AS(TextSample("\xFF", {}), std::invalid_argument);
}
