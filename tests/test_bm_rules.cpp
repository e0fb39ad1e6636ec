/********************************************************************
 * test_bm_rules.cpp  –  Beider-Morse rule parsing and matching.
 ********************************************************************
Copyright (C) <2025> <Khumnath Cg/nath.khum@gmail.com>

This program is free software: you can redistribute it and/or modify
it under the terms of the GNU General Public License as published by
the Free Software Foundation, either version 3 of the License, or
(at your option) any later version.

This program is distributed in in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
GNU General Public License for more details.

You should have received a copy of the GNU General Public License
along with this program. If not, see <https://www.gnu.org/licenses/>
 *******************************************************************/
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "bm_internal.h"

namespace fs = std::filesystem;
using namespace phonetika;
using namespace phonetika::bm;

namespace {

icu::UnicodeString u(const char* s) {
    return icu::UnicodeString::fromUTF8(s);
}

std::string text(const PhonemeList& list, size_t i) {
    return list.at(i).text();
}

} // namespace

// =============================================================================//
// Phoneme expressions
// =============================================================================//

TEST(PhonemeExprTest, SinglePhoneme) {
    PhonemeList list = parsePhonemeExpr("ts");
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(text(list, 0), "ts");
    EXPECT_EQ(list[0].languages(), LanguageSet::any());
}

TEST(PhonemeExprTest, AlternativesWithLanguages) {
    PhonemeList list = parsePhonemeExpr("(a|o[english+german])");
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(text(list, 0), "a");
    EXPECT_EQ(text(list, 1), "o");
    EXPECT_EQ(list[1].languages(), LanguageSet::from({"english", "german"}));
}

TEST(PhonemeExprTest, EmptyAlternative) {
    PhonemeList list = parsePhonemeExpr("(e|)");
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(text(list, 0), "e");
    EXPECT_EQ(text(list, 1), "");
}

TEST(PhonemeExprTest, Malformed) {
    try {
        parsePhonemeExpr("a[english");
        FAIL() << "Expected PhonetikaError";
    } catch (const PhonetikaError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::WrongPhoneme);
    }
    EXPECT_THROW(parsePhonemeExpr("(a|b"), PhonetikaError);
}

// =============================================================================//
// Context matchers
// =============================================================================//

TEST(ContextMatcherTest, AnchorsAlone) {
    EXPECT_TRUE(ContextMatcher("^").isMatch(u("abc")));
    EXPECT_TRUE(ContextMatcher("$").isMatch(u("")));

    ContextMatcher empty("^$");
    EXPECT_TRUE(empty.isMatch(u("")));
    EXPECT_FALSE(empty.isMatch(u("a")));
}

TEST(ContextMatcherTest, Literals) {
    ContextMatcher starts("^ab");
    EXPECT_TRUE(starts.isMatch(u("abc")));
    EXPECT_FALSE(starts.isMatch(u("xab")));

    ContextMatcher ends("ab$");
    EXPECT_TRUE(ends.isMatch(u("xab")));
    EXPECT_FALSE(ends.isMatch(u("abx")));

    ContextMatcher equals("^ab$");
    EXPECT_TRUE(equals.isMatch(u("ab")));
    EXPECT_FALSE(equals.isMatch(u("abc")));
}

TEST(ContextMatcherTest, AnchoredGroupIsComparedLiterally) {
    ContextMatcher group("^(a|b)");
    EXPECT_TRUE(group.isMatch(u("(a|b)x")));
    EXPECT_FALSE(group.isMatch(u("a")));
}

TEST(ContextMatcherTest, CharacterClasses) {
    ContextMatcher vowelFirst("^[aeiou]");
    EXPECT_TRUE(vowelFirst.isMatch(u("echo")));
    EXPECT_FALSE(vowelFirst.isMatch(u("x")));
    EXPECT_FALSE(vowelFirst.isMatch(u("")));

    ContextMatcher consonantLast("[^aeiou]$");
    EXPECT_TRUE(consonantLast.isMatch(u("ab")));
    EXPECT_FALSE(consonantLast.isMatch(u("ba")));

    ContextMatcher single("^[ab]$");
    EXPECT_TRUE(single.isMatch(u("a")));
    EXPECT_FALSE(single.isMatch(u("ab")));

    ContextMatcher accented("^[éè]");
    EXPECT_TRUE(accented.isMatch(u("été")));
}

TEST(ContextMatcherTest, Regex) {
    EXPECT_TRUE(ContextMatcher("[aeiou]x").isMatch(u("bex")));
    EXPECT_FALSE(ContextMatcher("[aeiou]x").isMatch(u("bx")));
    EXPECT_TRUE(ContextMatcher("a.c").isMatch(u("xabcx")));

    try {
        ContextMatcher broken("[a");
        FAIL() << "Expected PhonetikaError";
    } catch (const PhonetikaError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::BadContextRegex);
    }
}

TEST(RuleTest, PatternAndContexts) {
    Rule rule{u("b"), ContextMatcher("a$"), ContextMatcher("^c"), parsePhonemeExpr("p"), "test", 1};
    EXPECT_TRUE(rule.patternAndContextMatches(u("abc"), 1));
    EXPECT_FALSE(rule.patternAndContextMatches(u("xbc"), 1));
    EXPECT_FALSE(rule.patternAndContextMatches(u("abx"), 1));
    EXPECT_FALSE(rule.patternAndContextMatches(u("abc"), 0));
    EXPECT_FALSE(rule.patternAndContextMatches(u("ab"), 1));
}

// =============================================================================//
// Rule files
// =============================================================================//

class RuleFileTest : public ::testing::Test {
protected:
    fs::path dir_;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() / (std::string("phonetika_rules_") + info->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    void TearDown() override {
        fs::remove_all(dir_);
    }

    void write(const std::string& name, const std::string& content) {
        std::ofstream out(dir_ / (name + ".txt"));
        out << content;
    }

    ErrorKind parseError(const std::string& name) {
        try {
            parseRules(dir_, name);
        } catch (const PhonetikaError& e) {
            return e.kind();
        }
        ADD_FAILURE() << "Expected PhonetikaError for " << name;
        return ErrorKind::ParseConfiguration;
    }
};

TEST_F(RuleFileTest, CommentsAreIgnored) {
    write("commented",
          "// leading comment\n"
          "\"a\" \"\" \"\" \"x\"\n"
          "/*\n"
          "\"b\" \"\" \"\" \"y\"\n"
          "*/\n"
          "\"b\" \"\" \"\" \"z\"   // trailing\n"
          "/* single line */\n"
          "\n"
          "\"ab\" \"\" \"\" \"w\"\n");
    write("plain",
          "\"a\" \"\" \"\" \"x\"\n"
          "\"b\" \"\" \"\" \"z\"\n"
          "\"ab\" \"\" \"\" \"w\"\n");

    RuleMap commented = parseRules(dir_, "commented");
    RuleMap plain = parseRules(dir_, "plain");
    ASSERT_EQ(commented.size(), plain.size());
    for (const auto& bucket : plain) {
        const auto& other = commented.at(bucket.first);
        ASSERT_EQ(other.size(), bucket.second.size());
        for (size_t i = 0; i < other.size(); ++i) {
            EXPECT_EQ(other[i].pattern, bucket.second[i].pattern);
            EXPECT_EQ(other[i].phonemes.front().text(), bucket.second[i].phonemes.front().text());
        }
    }
}

TEST_F(RuleFileTest, LongestPatternFirst) {
    write("rules",
          "\"a\" \"\" \"\" \"x\"\n"
          "\"a\" \"\" \"\" \"second\"\n"
          "\"ab\" \"\" \"\" \"y\"\n");
    RuleMap rules = parseRules(dir_, "rules");
    const auto& bucket = rules.at('a');
    ASSERT_EQ(bucket.size(), 3u);
    EXPECT_EQ(bucket[0].pattern, u("ab"));
    // Equal lengths keep their file order.
    EXPECT_EQ(bucket[1].phonemes.front().text(), "x");
    EXPECT_EQ(bucket[2].phonemes.front().text(), "second");
}

TEST_F(RuleFileTest, IncludeAppendsRules) {
    write("main",
          "\"a\" \"\" \"\" \"x\"\n"
          "#include extra   // more rules\n"
          "\"c\" \"\" \"\" \"z\"\n");
    write("extra", "// included\n\"b\" \"\" \"\" \"y\"\n");

    RuleMap rules = parseRules(dir_, "main");
    ASSERT_EQ(rules.count('b'), 1u);
    EXPECT_EQ(rules.at('b').front().location, "extra");
    EXPECT_EQ(rules.at('b').front().line, 2);
    EXPECT_EQ(rules.at('a').front().location, "main");
    EXPECT_EQ(rules.at('c').front().line, 3);
}

TEST_F(RuleFileTest, ContextsAreAnchored) {
    write("rules", "\"d\" \"\" \"$\" \"t\"\n");
    RuleMap rules = parseRules(dir_, "rules");
    ASSERT_EQ(rules.count('d'), 1u);
    const Rule& rule = rules.at('d').front();
    EXPECT_TRUE(rule.patternAndContextMatches(u("bad"), 2));
    EXPECT_FALSE(rule.patternAndContextMatches(u("bade"), 2));
}

TEST_F(RuleFileTest, Errors) {
    EXPECT_EQ(parseError("missing"), ErrorKind::WrongFilename);

    write("self", "#include self\n");
    EXPECT_EQ(parseError("self"), ErrorKind::BadRule);

    write("dangling", "#include nothere\n");
    EXPECT_EQ(parseError("dangling"), ErrorKind::WrongFilename);

    write("short", "\"a\" \"b\"\n");
    EXPECT_EQ(parseError("short"), ErrorKind::BadRule);

    write("badphoneme", "\"a\" \"\" \"\" \"(x|y\"\n");
    EXPECT_EQ(parseError("badphoneme"), ErrorKind::WrongPhoneme);
}

TEST_F(RuleFileTest, MalformedLineIsEchoed) {
    write("short", "\"a\" \"\" \"\" \"x\"\nnot a rule\n");
    try {
        parseRules(dir_, "short");
        FAIL() << "Expected PhonetikaError";
    } catch (const PhonetikaError& e) {
        std::string message = e.what();
        EXPECT_NE(message.find("short.txt:2"), std::string::npos);
        EXPECT_NE(message.find("not a rule"), std::string::npos);
    }
}

// =============================================================================//
// Language lists and guessing rules
// =============================================================================//

TEST(LangParserTest, Languages) {
    std::set<std::string> languages = parseLanguages("// list\nany\n\nenglish // spoken\n", "test");
    EXPECT_EQ(languages, (std::set<std::string>{"any", "english"}));
    EXPECT_THROW(parseLanguages("two words\n", "test"), PhonetikaError);
}

TEST(LangParserTest, GuessingRules) {
    std::set<std::string> languages{"english", "german", "polish"};
    Lang lang = parseLang("sch german+polish true\n"
                          "w english false\n"
                          "/* block\n"
                          "*/\n"
                          "cz polish true // czech too\n",
                          "test", languages);
    EXPECT_EQ(lang.ruleCount(), 3u);
    EXPECT_EQ(lang.guessLanguages("Schwab"), LanguageSet::from({"german", "polish"}));
    EXPECT_EQ(lang.guessLanguages("Schczyk"), LanguageSet::from({"polish"}));
    EXPECT_EQ(lang.guessLanguages("Smith"), LanguageSet::from(languages));
    EXPECT_EQ(lang.guessLanguages("Waltz"), LanguageSet::from({"german", "polish"}));
    EXPECT_EQ(lang.guessLanguages("Czwart"), LanguageSet::from({"polish"}));

    // Nothing left is reported as Any.
    Lang strict = parseLang("x english true\nx english false\n", "test", languages);
    EXPECT_EQ(strict.guessLanguages("xavier"), LanguageSet::any());
}

TEST(LangParserTest, Errors) {
    std::set<std::string> languages{"english"};
    try {
        parseLang("sch german maybe\n", "test", languages);
        FAIL() << "Expected PhonetikaError";
    } catch (const PhonetikaError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NotABoolean);
    }
    try {
        parseLang("sch german\n", "test", languages);
        FAIL() << "Expected PhonetikaError";
    } catch (const PhonetikaError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::BadRule);
    }
    try {
        parseLang("[a german true\n", "test", languages);
        FAIL() << "Expected PhonetikaError";
    } catch (const PhonetikaError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::BadContextRegex);
    }
}

// =============================================================================//
// PhonemeBuilder
// =============================================================================//

TEST(PhonemeBuilderTest, ApplyBranchesAndFilters) {
    PhonemeBuilder builder = PhonemeBuilder::empty(LanguageSet::from({"english", "german"}));
    builder.apply(parsePhonemeExpr("(a|o[german]|u[polish])"), 20);
    EXPECT_EQ(builder.makeString(), "a|o");

    builder.append("n");
    EXPECT_EQ(builder.makeString(), "an|on");
    for (const auto& phoneme : builder.phonemes()) {
        if (phoneme.text() == "on") {
            EXPECT_EQ(phoneme.languages(), LanguageSet::from({"german"}));
        }
    }
}

TEST(PhonemeBuilderTest, CapStopsGeneration) {
    PhonemeBuilder builder = PhonemeBuilder::empty(LanguageSet::any());
    PhonemeList vw = parsePhonemeExpr("(v|w)");
    for (int i = 0; i < 4; ++i) {
        builder.apply(vw, 3);
    }
    EXPECT_EQ(builder.makeString(), "vvvv|vvvw|vvwv");
}
