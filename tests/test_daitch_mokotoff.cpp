/********************************************************************
 * test_daitch_mokotoff.cpp  –  Daitch-Mokotoff Soundex.
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
#include <memory>

#include "libphonetika/encoders.h"

namespace fs = std::filesystem;
using namespace phonetika;

class DaitchMokotoffTest : public ::testing::Test {
protected:
    static std::unique_ptr<DaitchMokotoffSoundex> dm_;

    static void SetUpTestSuite() {
        dm_ = std::make_unique<DaitchMokotoffSoundex>(PHONETIKA_SRC_DIR "/core/data/dm");
    }

    static void TearDownTestSuite() {
        dm_.reset();
    }
};

std::unique_ptr<DaitchMokotoffSoundex> DaitchMokotoffTest::dm_;

TEST_F(DaitchMokotoffTest, SingleBranch) {
    EXPECT_EQ(dm_->soundex("GOLDEN"), "583600");
    EXPECT_EQ(dm_->soundex("Alpert"), "087930");
    EXPECT_EQ(dm_->soundex("Breuer"), "791900");
    EXPECT_EQ(dm_->soundex("Haber"), "579000");
    EXPECT_EQ(dm_->soundex("Mannheim"), "665600");
    EXPECT_EQ(dm_->soundex("Mintz"), "664000");
    EXPECT_EQ(dm_->soundex("Topf"), "370000");
    EXPECT_EQ(dm_->soundex("Kleinmann"), "586660");
    EXPECT_EQ(dm_->soundex("AKSSOL"), "054800");
}

TEST_F(DaitchMokotoffTest, Branches) {
    EXPECT_EQ(dm_->soundex("AUERBACH"), "097400|097500");
    EXPECT_EQ(dm_->soundex("LIPPSZYC"), "874400|874500");
    EXPECT_EQ(dm_->soundex("Peters"), "734000|739400");
    EXPECT_EQ(dm_->soundex("Peterson"), "734600|739460");
    EXPECT_EQ(dm_->soundex("Przemysl"), "746480|794648");
    EXPECT_EQ(dm_->soundex("Ceniow"), "467000|567000");
    EXPECT_EQ(dm_->soundex("GERSCHFELD"), "547830|545783|594783|594578");
    EXPECT_EQ(dm_->soundex("Rosochowaciec"),
              "944744|944745|944754|944755|945744|945745|945754|945755");
}

TEST_F(DaitchMokotoffTest, EncodeTakesFirstBranch) {
    EXPECT_EQ(dm_->encode("AUERBACH"), "097400");
    EXPECT_EQ(dm_->encode("Washington"), "746536");
    EXPECT_EQ(dm_->encode(""), "000000");
    EXPECT_TRUE(dm_->isEncodedEquals("Peters", "PETERS"));
    EXPECT_FALSE(dm_->isEncodedEquals("Peters", "Peterson"));
}

TEST_F(DaitchMokotoffTest, WhitespaceAndCase) {
    EXPECT_EQ(dm_->soundex("Ben Aron"), "769600");
    EXPECT_EQ(dm_->soundex("ben\taron"), dm_->soundex("BENARON"));
}

TEST_F(DaitchMokotoffTest, AccentedLetters) {
    EXPECT_TRUE(dm_->isAsciiFolding());
    EXPECT_EQ(dm_->soundex("Straßburg"), "294795");
    EXPECT_EQ(dm_->soundex("Éregon"), "095600");
    EXPECT_EQ(dm_->soundex("țamas"), "364000|464000");
}

// =============================================================================//
// Custom rule files
// =============================================================================//

class DaitchMokotoffRulesTest : public ::testing::Test {
protected:
    fs::path dir_;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() / (std::string("phonetika_dm_") + info->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    void TearDown() override {
        fs::remove_all(dir_);
    }

    void writeRules(const std::string& content) {
        std::ofstream out(dir_ / "dmrules.txt");
        out << content;
    }

    ErrorKind loadError() {
        try {
            DaitchMokotoffSoundex dm(dir_.string());
        } catch (const PhonetikaError& e) {
            return e.kind();
        }
        ADD_FAILURE() << "Expected PhonetikaError";
        return ErrorKind::ParseConfiguration;
    }
};

TEST_F(DaitchMokotoffRulesTest, CustomRulesAndFolding) {
    writeRules("/* test rules\n"
               " */\n"
               "\"sh\" \"0\" \"\" \"0|1\"   // branches after the first letter\n"
               "\"s\" \"4\" \"4\" \"4\"\n"
               "\"a\" \"0\" \"\" \"\"\n"
               "à=a\n");
    DaitchMokotoffSoundex dm(dir_.string());
    EXPECT_EQ(dm.soundex("àsh"), "000000|010000");
    EXPECT_EQ(dm.soundex("sha"), "000000");

    // Without folding 'à' has no rule and "sh" starts the name.
    dm.setAsciiFolding(false);
    EXPECT_FALSE(dm.isAsciiFolding());
    EXPECT_EQ(dm.soundex("àsh"), "000000");
}

TEST_F(DaitchMokotoffRulesTest, MalformedRule) {
    writeRules("\"a\" \"0\" \"\" \"\"\nThis is wrong.\n");
    EXPECT_EQ(loadError(), ErrorKind::BadRule);

    writeRules("\"a\" \"0\" \"\"\n");
    EXPECT_EQ(loadError(), ErrorKind::BadRule);
}

TEST_F(DaitchMokotoffRulesTest, MalformedFolding) {
    writeRules("ab=c\n");
    EXPECT_EQ(loadError(), ErrorKind::BadRule);

    writeRules("a=b=c\n");
    EXPECT_EQ(loadError(), ErrorKind::BadRule);
}

TEST_F(DaitchMokotoffRulesTest, MissingFile) {
    EXPECT_EQ(loadError(), ErrorKind::WrongFilename);
}
