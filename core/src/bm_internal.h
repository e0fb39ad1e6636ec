/********************************************************************
 * bm_internal.h  –  Beider-Morse rule tables and phoneme builder
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
#include <filesystem>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <tuple>
#include <vector>

#include <unicode/regex.h>
#include <unicode/unistr.h>

#include "libphonetika/beider_morse.h"

namespace phonetika {
namespace bm {

/// RuleType plus the main transformation pass.
enum class RulePhase { Approx, Exact, Rules };

std::string toString(RulePhase phase);
RulePhase toPhase(RuleType ruleType);

// =============================================================================//
// Regex helpers
// =============================================================================//

/// Compiles an ICU regex. Throws PhonetikaError(BadContextRegex) naming @p where.
std::shared_ptr<const icu::RegexPattern> compileRegex(const std::string& regex, const std::string& where);

/// True if @p pattern matches anywhere in @p input.
bool regexFind(const icu::RegexPattern& pattern, const icu::UnicodeString& input);

// =============================================================================//
// Phoneme
// =============================================================================//
/**
 * A spelling together with the languages it is still plausible for.
 * Ordering and equality only look at the text.
 */
class Phoneme {
public:
    Phoneme(std::string text, LanguageSet languages);

    /// Concatenates the two texts under @p languages.
    static Phoneme join(const Phoneme& left, const Phoneme& right, LanguageSet languages);

    Phoneme append(const std::string& value) const;

    const std::string& text() const { return text_; }
    const LanguageSet& languages() const { return languages_; }

    bool operator<(const Phoneme& other) const { return text_ < other.text_; }
    bool operator==(const Phoneme& other) const { return text_ == other.text_; }

private:
    std::string text_;
    LanguageSet languages_;
};

/// Ordered replacement alternatives of a rule.
using PhonemeList = std::vector<Phoneme>;

/**
 * Parses "text", "text[l1+l2]" or "(a|b[l1]|c)".
 * Throws PhonetikaError(WrongPhoneme) on unbalanced brackets.
 */
PhonemeList parsePhonemeExpr(const std::string& expression);

// =============================================================================//
// Rules
// =============================================================================//

/**
 * Left or right context of a rule. Anchored literals and single character
 * classes are tested directly; other shapes go through an ICU regex search.
 * An anchored context without a character class is always compared literally.
 */
class ContextMatcher {
public:
    explicit ContextMatcher(const std::string& regex);

    bool isMatch(const icu::UnicodeString& input) const;

private:
    enum class Kind {
        AllStrings,
        IsEmpty,
        Equals,
        StartsWith,
        EndsWith,
        EqualsChar,
        StartsWithChar,
        EndsWithChar,
        Regex
    };

    bool inClass(UChar32 c) const;

    Kind kind_ = Kind::Regex;
    icu::UnicodeString content_;
    bool shouldMatch_ = true;
    std::shared_ptr<const icu::RegexPattern> pattern_;
};

struct Rule {
    icu::UnicodeString pattern;
    ContextMatcher leftContext;
    ContextMatcher rightContext;
    PhonemeList phonemes;
    std::string location;
    int line;

    /// True if the pattern sits at @p index and both contexts accept their side.
    bool patternAndContextMatches(const icu::UnicodeString& input, int32_t index) const;
};

/// Rules keyed by the first code point of their pattern, longest pattern first.
using RuleMap = std::map<UChar32, std::vector<Rule>>;

/**
 * Parses @p dir/@p name.txt, following #include lines.
 * Throws PhonetikaError on a missing file or a malformed line.
 */
RuleMap parseRules(const std::filesystem::path& dir, const std::string& name);

// =============================================================================//
// Languages and language guessing
// =============================================================================//

struct LangRule {
    std::shared_ptr<const icu::RegexPattern> pattern;
    std::set<std::string> languages;
    bool acceptOnMatch;
};

class Lang {
public:
    Lang(std::set<std::string> languages, std::vector<LangRule> rules);

    /// Narrows the language list with every matching rule; Any if none is left.
    LanguageSet guessLanguages(const std::string& input) const;

    size_t ruleCount() const { return rules_.size(); }

private:
    std::set<std::string> languages_;
    std::vector<LangRule> rules_;
};

/// One language token per content line.
std::set<std::string> parseLanguages(const std::string& content, const std::string& location);

/// Lines of "<regex> <lang1>+<lang2> <true|false>".
Lang parseLang(const std::string& content, const std::string& location,
               const std::set<std::string>& languages);

// =============================================================================//
// Repository
// =============================================================================//

using RuleKey = std::tuple<NameType, RulePhase, std::string>;

/// Everything ConfigFiles loads. Read-only once built.
struct Repository {
    std::map<NameType, std::set<std::string>> languages;
    std::map<NameType, Lang> langs;
    std::map<RuleKey, RuleMap> rules;
    std::map<NameType, std::vector<std::string>> prefixes;

    /// The rule group for a key, or an empty group when it was not loaded.
    const RuleMap& ruleMap(NameType nameType, RulePhase phase, const std::string& language) const;
};

/// Built-in particle table of a name type.
std::vector<std::string> defaultNamePrefixes(NameType nameType);

// =============================================================================//
// PhonemeBuilder
// =============================================================================//
/**
 * Frontier of the spellings built so far, kept sorted by text.
 */
class PhonemeBuilder {
public:
    explicit PhonemeBuilder(std::set<Phoneme> phonemes);

    static PhonemeBuilder empty(const LanguageSet& languages);

    void append(const std::string& text);

    /**
     * Replaces every phoneme with its joins to @p alternatives. Joins whose
     * language intersection is empty are dropped, and generation stops as
     * soon as @p maxPhonemes phonemes exist.
     */
    void apply(const PhonemeList& alternatives, int maxPhonemes);

    const std::set<Phoneme>& phonemes() const { return phonemes_; }

    std::string makeString() const;

private:
    std::set<Phoneme> phonemes_;
};

} // namespace bm
} // namespace phonetika
