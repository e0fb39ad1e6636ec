/********************************************************************
 * beider_morse.h  –  Beider-Morse phonetic matching
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
#include <set>
#include <string>
#include <vector>

#include "libphonetika/phonetika_core.h"

namespace phonetika {

namespace bm {
struct Repository;
}

// =============================================================================//
// Name and Rule Types
// =============================================================================//

/// Rule profile applied to a name.
enum class NameType { Ashkenazi, Generic, Sephardic };

/// Final rule flavour. Approx yields more alternatives than Exact.
enum class RuleType { Approx, Exact };

/** @brief Returns the file token of a name type ("ash", "gen" or "sep"). */
std::string toString(NameType nameType);

/** @brief Returns the file token of a rule type ("approx" or "exact"). */
std::string toString(RuleType ruleType);

/**
 * @brief Parses a name type token.
 * @param token "ash", "gen" or "sep".
 * @throws PhonetikaError with ErrorKind::UnknownNameType for any other token.
 */
NameType parseNameType(const std::string& token);

// =============================================================================//
// LanguageSet
// =============================================================================//
/**
 * @brief A set of languages with two distinguished values.
 *
 * Any is the unconstrained set and NoLanguages the empty one. A concrete
 * set is never empty: building one from nothing yields NoLanguages.
 */
class LanguageSet {
public:
    enum class Kind { Any, NoLanguages, SomeLanguages };

    static LanguageSet any();
    static LanguageSet noLanguages();

    /**
     * @brief Builds a concrete set.
     * @return NoLanguages when @p languages is empty.
     */
    static LanguageSet from(std::set<std::string> languages);

    Kind kind() const { return kind_; }

    /** @brief True for NoLanguages. */
    bool isEmpty() const;
    /** @brief True for a concrete set of exactly one language. */
    bool isSingleton() const;
    /** @brief Any contains every language, NoLanguages none. */
    bool contains(const std::string& language) const;

    /**
     * @brief First language of a concrete set.
     * @return An empty string for Any and NoLanguages.
     */
    std::string anyLanguage() const;

    /** @brief Members of a concrete set; empty for Any and NoLanguages. */
    const std::set<std::string>& languages() const { return languages_; }

    /**
     * @brief Intersection. Any is the identity and NoLanguages absorbs.
     */
    LanguageSet restrictTo(const LanguageSet& other) const;

    /**
     * @brief Union. NoLanguages is the identity and Any absorbs.
     */
    LanguageSet merge(const LanguageSet& other) const;

    /** @brief "ANY_LANGUAGE", "NO_LANGUAGES" or the comma-joined members. */
    std::string toString() const;

    bool operator==(const LanguageSet& other) const;
    bool operator!=(const LanguageSet& other) const { return !(*this == other); }

private:
    LanguageSet(Kind kind, std::set<std::string> languages);

    Kind kind_;
    std::set<std::string> languages_;
};

// =============================================================================//
// ConfigFiles Class
// =============================================================================//
/**
 * @brief Immutable bundle of Beider-Morse rule tables.
 *
 * Built once from a directory holding, for each of the three name types,
 * <nt>_languages.txt, <nt>_lang.txt and the <nt>_<rt>_<lang>.txt tables.
 * Engines borrow it by reference, so it must outlive them. It can be
 * shared by engines running in different threads.
 */
class ConfigFiles {
public:
    /**
     * @brief Loads every rule resource of a directory.
     * @param dataDir Optional rules directory. If empty, default system
     * paths are searched.
     * @throws PhonetikaError on the first missing or malformed resource.
     * A name type without a language list is ErrorKind::UnknownNameType.
     */
    explicit ConfigFiles(const std::string& dataDir = "");

    ~ConfigFiles();

    /** @brief The languages known for a name type. */
    const std::set<std::string>& languages(NameType nameType) const;

    /**
     * @brief Guesses the languages of a name with the name type's rules.
     * @return Any when no language survives the rules.
     */
    LanguageSet guessLanguages(NameType nameType, const std::string& input) const;

    /** @brief Particles such as "van" or "de la" recognised for a name type. */
    const std::vector<std::string>& namePrefixes(NameType nameType) const;

private:
    friend class PhoneticEngine;
    const bm::Repository& repository() const;

    class Impl;
    std::unique_ptr<Impl> pImpl;
};

// =============================================================================//
// PhoneticEngine Class
// =============================================================================//
/**
 * @brief Converts names into the set of their plausible phonetic spellings.
 *
 * The result is a '|'-joined, sorted list of spellings. Multi-word names
 * encoded word by word are joined with '-', and names starting with a
 * particle are rendered as "(bare)-(fused)".
 */
class PhoneticEngine {
public:
    static constexpr int DEFAULT_MAX_PHONEMES = 20;

    /**
     * @brief Creates an engine.
     * @param config Rule tables; must outlive the engine.
     * @param nameType Rule profile to use.
     * @param ruleType Final rule flavour.
     * @param concat If true, the words of a name are encoded as a single unit.
     * @param maxPhonemes Upper bound on the number of alternatives.
     */
    PhoneticEngine(const ConfigFiles& config, NameType nameType, RuleType ruleType,
                   bool concat = true, int maxPhonemes = DEFAULT_MAX_PHONEMES);

    ~PhoneticEngine();

    /**
     * @brief Encodes a name, guessing its languages first.
     * @param input The UTF-8 name.
     * @return The alternatives, e.g. "rinD|rinDlt|rina".
     */
    std::string encode(const std::string& input) const;

    /**
     * @brief Encodes a name within the given languages.
     */
    std::string encode(const std::string& input, const LanguageSet& languages) const;

    NameType nameType() const;
    RuleType ruleType() const;
    bool isConcat() const;
    int maxPhonemes() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

/**
 * @brief Encoder adaptor over a PhoneticEngine.
 */
class BeiderMorseEncoder : public Encoder {
public:
    explicit BeiderMorseEncoder(const ConfigFiles& config, NameType nameType = NameType::Generic,
                                RuleType ruleType = RuleType::Approx, bool concat = true,
                                int maxPhonemes = PhoneticEngine::DEFAULT_MAX_PHONEMES);

    std::string encode(const std::string& value) const override;

    const PhoneticEngine& engine() const { return engine_; }

private:
    PhoneticEngine engine_;
};

} // namespace phonetika
