/********************************************************************
 * encoders.h  –  Soundex family, Metaphone family and other encoders
 ********************************************************************
Copyright (C) <2025> <Khumnath Cg/nath.khum@gmail.com>

This program is free software: you can redistribute it and/or modify
it under the terms of the GNU General Public License as published by
the Free Software Foundation, either version 3 of the License, or
(at your option) any later version.

This program is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
GNU General Public License for more details.

You should have received a copy of the GNU General Public License
along with this program. If not, see <https://www.gnu.org/licenses/>
 *******************************************************************/
#pragma once
#include <memory>
#include <string>
#include <vector>

#include "libphonetika/phonetika_core.h"

namespace phonetika {

// =============================================================================//
// Soundex Family
// =============================================================================//

/**
 * @brief American Soundex.
 *
 * The mapping holds one code per letter A to Z. A '-' marks a silent
 * letter, skipped without resetting the previous code.
 */
class Soundex : public Encoder {
public:
    static const std::string US_ENGLISH_MAPPING;
    /// Genealogy variant: vowels, H, W and Y are silent.
    static const std::string US_ENGLISH_GENEALOGY_MAPPING;

    Soundex();

    /**
     * @brief Builds a Soundex with a custom mapping.
     *
     * H and W are special-cased unless the mapping has silent letters.
     * @throws std::invalid_argument if @p mapping is not 26 characters long.
     */
    explicit Soundex(const std::string& mapping);
    Soundex(const std::string& mapping, bool specialCaseHW);

    std::string encode(const std::string& value) const override;

    /// Number of equal characters at equal positions, 0 to 4.
    int difference(const std::string& first, const std::string& second) const;

    bool isSpecialCaseHW() const { return specialCaseHW_; }

private:
    char mappingCode(char letter) const;

    std::string mapping_;
    bool specialCaseHW_;
};

/// Refined Soundex: one code per letter, unbounded length.
class RefinedSoundex : public Encoder {
public:
    static const std::string US_ENGLISH_MAPPING;

    RefinedSoundex();
    /// @throws std::invalid_argument if @p mapping is not 26 characters long.
    explicit RefinedSoundex(const std::string& mapping);

    std::string encode(const std::string& value) const override;
    int difference(const std::string& first, const std::string& second) const;

private:
    std::string mapping_;
};

/// Phonex, a Soundex and Phonix hybrid.
class Phonex : public Encoder {
public:
    explicit Phonex(int maxCodeLength = 4);

    std::string encode(const std::string& value) const override;

    int maxCodeLength() const { return maxCodeLength_; }

private:
    int maxCodeLength_;
};

// =============================================================================//
// Rewrite-based Encoders
// =============================================================================//

/// Kölner Phonetik. Returns a string of digits.
class Cologne : public Encoder {
public:
    std::string encode(const std::string& value) const override;
};

/// Caverphone 1.0, padded to 6 characters.
class Caverphone1 : public Encoder {
public:
    std::string encode(const std::string& value) const override;
};

/// Caverphone 2.0, padded to 10 characters.
class Caverphone2 : public Encoder {
public:
    std::string encode(const std::string& value) const override;
};

/**
 * @brief New York State Identification and Intelligence System code.
 *
 * In strict mode codes are cut to 6 characters.
 */
class Nysiis : public Encoder {
public:
    explicit Nysiis(bool strict = true);

    std::string encode(const std::string& value) const override;

    bool isStrict() const { return strict_; }
    void setStrict(bool strict) { strict_ = strict; }

private:
    bool strict_;
};

/**
 * @brief Match Rating Approach (Western Airlines, 1977).
 *
 * isEncodedEquals() is the real comparison: it grades the two codes
 * against a minimum rating derived from their combined length.
 */
class MatchRatingApproach : public Encoder {
public:
    std::string encode(const std::string& value) const override;
    bool isEncodedEquals(const std::string& first, const std::string& second) const override;
};

// =============================================================================//
// Metaphone Family
// =============================================================================//

class Metaphone : public Encoder {
public:
    explicit Metaphone(int maxCodeLength = 4);

    std::string encode(const std::string& value) const override;

    int maxCodeLength() const { return maxCodeLength_; }
    void setMaxCodeLength(int maxCodeLength) { maxCodeLength_ = maxCodeLength; }

private:
    int maxCodeLength_;
};

/**
 * @brief Lawrence Philips' Double Metaphone.
 *
 * Every input has a primary and an alternate code. encode() returns the
 * primary one.
 */
class DoubleMetaphone : public Encoder {
public:
    explicit DoubleMetaphone(int maxCodeLength = 4);

    std::string encode(const std::string& value) const override;
    std::string encodeAlternate(const std::string& value) const;

    /// Compares the primary codes, or the alternate ones when @p alternate is set.
    bool isDoubleMetaphoneEqual(const std::string& first, const std::string& second,
                                bool alternate = false) const;

    int maxCodeLength() const { return maxCodeLength_; }
    void setMaxCodeLength(int maxCodeLength) { maxCodeLength_ = maxCodeLength; }

private:
    std::string doubleMetaphone(const std::string& value, bool alternate) const;

    int maxCodeLength_;
};

// =============================================================================//
// Daitch-Mokotoff Soundex
// =============================================================================//

/**
 * @brief Daitch-Mokotoff Soundex driven by a rule file.
 *
 * Rules are read from dmrules.txt in the resolved "dm" data directory.
 * A name can sound several ways, so soundex() returns every 6-digit
 * branch joined with '|'; encode() returns the first one.
 */
class DaitchMokotoffSoundex : public Encoder {
public:
    /**
     * @brief Loads the rule file.
     * @param dataDir Directory holding dmrules.txt. Empty selects the
     *        installed rules.
     * @param asciiFolding Fold accented letters before matching.
     * @throws PhonetikaError if the file is missing or malformed.
     */
    explicit DaitchMokotoffSoundex(const std::string& dataDir = "", bool asciiFolding = true);
    ~DaitchMokotoffSoundex();

    std::string encode(const std::string& value) const override;

    /// All branches of @p value, '|'-joined in discovery order.
    std::string soundex(const std::string& value) const;

    bool isAsciiFolding() const;
    void setAsciiFolding(bool asciiFolding);

private:
    std::vector<std::string> branches(const std::string& value, bool branching) const;

    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace phonetika
