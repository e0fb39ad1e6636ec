/********************************************************************
 * test_bm_engine.cpp  –  Beider-Morse engine over fixture rules.
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

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <thread>
#include <vector>

#include "libphonetika/beider_morse.h"

namespace fs = std::filesystem;
using namespace phonetika;

// Fixture tables: generic names know "any", "english" and "german";
// Ashkenazi and Sephardic names only "any".
class BeiderMorseTest : public ::testing::Test {
protected:
    static std::unique_ptr<ConfigFiles> config_;

    static void SetUpTestSuite() {
        config_ = std::make_unique<ConfigFiles>(PHONETIKA_SRC_DIR "/tests/data/bm");
    }

    static void TearDownTestSuite() {
        config_.reset();
    }

    std::string encode(const std::string& name, NameType nameType = NameType::Generic,
                       RuleType ruleType = RuleType::Approx, bool concat = true,
                       int maxPhonemes = PhoneticEngine::DEFAULT_MAX_PHONEMES) {
        PhoneticEngine engine(*config_, nameType, ruleType, concat, maxPhonemes);
        return engine.encode(name);
    }
};

std::unique_ptr<ConfigFiles> BeiderMorseTest::config_;

// =============================================================================//
// ConfigFiles
// =============================================================================//

TEST_F(BeiderMorseTest, LoadsEveryNameType) {
    EXPECT_EQ(config_->languages(NameType::Ashkenazi), (std::set<std::string>{"any"}));
    EXPECT_EQ(config_->languages(NameType::Generic),
              (std::set<std::string>{"any", "english", "german"}));
    EXPECT_EQ(config_->languages(NameType::Sephardic), (std::set<std::string>{"any"}));
}

TEST_F(BeiderMorseTest, GuessesLanguages) {
    EXPECT_EQ(config_->guessLanguages(NameType::Generic, "Schmidt"), LanguageSet::from({"german"}));
    EXPECT_EQ(config_->guessLanguages(NameType::Generic, "Smith"), LanguageSet::from({"english"}));
    EXPECT_EQ(config_->guessLanguages(NameType::Generic, "Anna"),
              LanguageSet::from({"any", "english", "german"}));
    EXPECT_EQ(config_->guessLanguages(NameType::Generic, "Schzz"), LanguageSet::any());
}

TEST_F(BeiderMorseTest, NamePrefixesLongestFirst) {
    const auto& prefixes = config_->namePrefixes(NameType::Generic);
    ASSERT_FALSE(prefixes.empty());
    EXPECT_EQ(prefixes.front(), "de la");
    EXPECT_NE(std::find(prefixes.begin(), prefixes.end(), "van"), prefixes.end());

    const auto& ashkenazi = config_->namePrefixes(NameType::Ashkenazi);
    EXPECT_NE(std::find(ashkenazi.begin(), ashkenazi.end(), "ben"), ashkenazi.end());
}

TEST(ConfigFilesTest, MissingDirectory) {
    try {
        ConfigFiles config("/nonexistent/phonetika/bm");
        FAIL() << "Expected PhonetikaError";
    } catch (const PhonetikaError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ParseConfiguration);
    }
}

TEST(ConfigFilesTest, MissingNameTypeFailsToLoad) {
    fs::path dir = fs::temp_directory_path() / "phonetika_bm_generic_only";
    fs::remove_all(dir);
    fs::create_directories(dir);
    auto write = [&](const std::string& name, const std::string& content) {
        std::ofstream out(dir / name);
        out << content;
    };
    write("gen_languages.txt", "any\n");
    write("gen_lang.txt", "");
    write("gen_rules_any.txt", "\"a\" \"\" \"\" \"o\"\n");
    for (const char* name : {"gen_approx_any.txt", "gen_approx_common.txt",
                             "gen_exact_any.txt", "gen_exact_common.txt"}) {
        write(name, "// empty\n");
    }

    // Generic tables alone are not a usable configuration.
    try {
        ConfigFiles config(dir.string());
        FAIL() << "Expected PhonetikaError";
    } catch (const PhonetikaError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UnknownNameType);
        EXPECT_NE(std::string(e.what()).find("ash_languages.txt"), std::string::npos);
    }
    fs::remove_all(dir);
}

// =============================================================================//
// Encoding
// =============================================================================//

TEST_F(BeiderMorseTest, EngineSettings) {
    PhoneticEngine engine(*config_, NameType::Sephardic, RuleType::Exact, false, 7);
    EXPECT_EQ(engine.nameType(), NameType::Sephardic);
    EXPECT_EQ(engine.ruleType(), RuleType::Exact);
    EXPECT_FALSE(engine.isConcat());
    EXPECT_EQ(engine.maxPhonemes(), 7);
}

TEST_F(BeiderMorseTest, LanguageSpecificRules) {
    EXPECT_EQ(encode("Schwarz"), "svars|svarts");
    EXPECT_EQ(encode("Schwarz", NameType::Generic, RuleType::Exact), "Svarts");
    EXPECT_EQ(encode("Smith"), "smit");
    EXPECT_EQ(encode("Smith", NameType::Generic, RuleType::Exact), "smiT");
}

TEST_F(BeiderMorseTest, UnknownLanguageBranches) {
    EXPECT_EQ(encode("Wanda"), "vanda|wanda");
    EXPECT_EQ(encode("Anna"), "anna");
}

TEST_F(BeiderMorseTest, PhonemeLanguagesFilterAlternatives) {
    EXPECT_EQ(encode("Yves"), "ives|jves");

    PhoneticEngine engine(*config_, NameType::Generic, RuleType::Approx);
    EXPECT_EQ(engine.encode("yves", LanguageSet::from({"english", "german"})), "ives|jves");
    EXPECT_EQ(engine.encode("yves", LanguageSet::from({"any", "english"})), "ives");
}

TEST_F(BeiderMorseTest, MaxPhonemesCapsOutput) {
    EXPECT_EQ(encode("wwww", NameType::Generic, RuleType::Approx, true, 3), "vvvv|vvvw|vvwv");

    std::string all = encode("wwww");
    EXPECT_EQ(std::count(all.begin(), all.end(), '|'), 15);
}

TEST_F(BeiderMorseTest, GenericParticlesAreSplit) {
    EXPECT_EQ(encode("van Wanda"), "(vanda|wanda)-(vanvanda|vanwanda)");
    EXPECT_EQ(encode("d'Anna"), "(anna)-(danna)");
}

TEST_F(BeiderMorseTest, MultipleWords) {
    EXPECT_EQ(encode("Anna Wanda"), "annavanda|annawanda");
    EXPECT_EQ(encode("Anna-Wanda"), "annavanda|annawanda");
    EXPECT_EQ(encode("Anna Wanda", NameType::Generic, RuleType::Approx, false), "anna-vanda|wanda");
    EXPECT_EQ(encode("  Wanda  ", NameType::Generic, RuleType::Approx, false), "vanda|wanda");
}

TEST_F(BeiderMorseTest, AshkenaziDropsParticles) {
    EXPECT_EQ(encode("ben Wanda", NameType::Ashkenazi), "vanda");
    EXPECT_EQ(encode("Wanda", NameType::Ashkenazi), "vanda");
}

TEST_F(BeiderMorseTest, SephardicDropsParticlesAndElisions) {
    EXPECT_EQ(encode("de Wanda", NameType::Sephardic), "banda|vanda");
    EXPECT_EQ(encode("d'Wanda", NameType::Sephardic), "banda|vanda");
}

TEST_F(BeiderMorseTest, EncoderAdaptor) {
    BeiderMorseEncoder encoder(*config_);
    EXPECT_EQ(encoder.encode("Wanda"), "vanda|wanda");
    EXPECT_TRUE(encoder.isEncodedEquals("Wanda", "wanda"));
    EXPECT_EQ(encoder.engine().nameType(), NameType::Generic);
}

TEST_F(BeiderMorseTest, SharedAcrossThreads) {
    PhoneticEngine engine(*config_, NameType::Generic, RuleType::Approx);
    const std::string expected = engine.encode("Schwarz Wanda");

    std::vector<std::string> results(4);
    std::vector<std::thread> workers;
    for (size_t i = 0; i < results.size(); ++i) {
        workers.emplace_back([&, i] { results[i] = engine.encode("Schwarz Wanda"); });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    for (const auto& result : results) {
        EXPECT_EQ(result, expected);
    }
}

// =============================================================================//
// Final rule passes
// =============================================================================//

// Every name type gets comment-only tables for "any", "english" and
// "german"; a test then fills in the generic tables it needs.
class FinalRulesTest : public ::testing::Test {
protected:
    fs::path dir_;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() / (std::string("phonetika_bm_") + info->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_);

        for (const char* nameType : {"ash", "gen", "sep"}) {
            std::string prefix = nameType;
            write(prefix + "_languages.txt", "any\nenglish\ngerman\n");
            write(prefix + "_lang.txt", "");
            for (const char* phase : {"rules", "approx", "exact"}) {
                for (const char* language : {"any", "english", "german", "common"}) {
                    write(prefix + "_" + phase + "_" + language + ".txt", "// empty\n");
                }
            }
        }
    }

    void TearDown() override {
        fs::remove_all(dir_);
    }

    void write(const std::string& name, const std::string& content) {
        std::ofstream out(dir_ / name);
        out << content;
    }

    std::string encode(const std::string& name, int maxPhonemes) {
        ConfigFiles config(dir_.string());
        PhoneticEngine engine(config, NameType::Generic, RuleType::Approx, true, maxPhonemes);
        return engine.encode(name);
    }
};

TEST_F(FinalRulesTest, EqualSpellingsPoolTheirLanguages) {
    write("gen_rules_any.txt", "\"y\" \"\" \"\" \"(i[english]|j[german])\"\n");
    write("gen_approx_common.txt", "\"j\" \"\" \"\" \"i\"\n");
    write("gen_approx_any.txt", "\"i\" \"\" \"\" \"(x[english]|z[german])\"\n");

    // "i" (english) and "j" -> "i" (german) merge into one "i" valid for
    // both, so the language pass can still branch both ways.
    EXPECT_EQ(encode("y", 20), "x|z");
    EXPECT_EQ(encode("y", 1), "x");
}

TEST_F(FinalRulesTest, MergeStopsAtMaxPhonemes) {
    write("gen_rules_any.txt",
          "\"w\" \"\" \"\" \"(a|b)\"\n"
          "\"o\" \"\" \"\" \"o\"\n");
    write("gen_approx_any.txt", "\"o\" \"\" \"\" \"(p|q)\"\n");

    EXPECT_EQ(encode("wo", 20), "ap|aq|bp|bq");
    // "ao" alone fills the result; "bo" adds nothing.
    EXPECT_EQ(encode("wo", 2), "ap|aq");
    EXPECT_EQ(encode("oo", 3), "pp|pq|qp");
}

// =============================================================================//
// Installed rule tables
// =============================================================================//

TEST(BeiderMorseRulesTest, FullRuleSet) {
    const char* dir = std::getenv("PHONETIKA_BM_RULES_DIR");
    if (dir == nullptr) {
        GTEST_SKIP() << "PHONETIKA_BM_RULES_DIR is not set";
    }
    ConfigFiles config(dir);
    PhoneticEngine engine(config, NameType::Generic, RuleType::Approx);
    EXPECT_EQ(engine.encode("Renault"), "rinD|rinDlt|rina|rinalt|rino|rinolt|rinu|rinult");

    PhoneticEngine single(config, NameType::Ashkenazi, RuleType::Approx, true, 1);
    EXPECT_EQ(single.encode("Renault"), "rinDlt");

    PhoneticEngine exact(config, NameType::Generic, RuleType::Exact, true, 10);
    EXPECT_EQ(exact.encode("d'ortley"), "(ortlaj|ortlej)-(dortlaj|dortlej)");
    EXPECT_EQ(exact.encode("SntJohn-Smith"), "sntjonsmit");
}
