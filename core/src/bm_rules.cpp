/********************************************************************
 * bm_rules.cpp  –  Beider-Morse rule parsing and matching.
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
#include "bm_internal.h"
#include "text_utils.h"

#include <algorithm>
#include <filesystem>

#include <unicode/utypes.h>

namespace fs = std::filesystem;

namespace phonetika {
namespace bm {

using detail::endsWith;
using detail::startsWith;

// =============================================================================//
// Regex helpers
// =============================================================================//

std::shared_ptr<const icu::RegexPattern> compileRegex(const std::string& regex, const std::string& where) {
    UParseError parseError;
    UErrorCode status = U_ZERO_ERROR;
    std::unique_ptr<icu::RegexPattern> pattern(
        icu::RegexPattern::compile(detail::toUnicode(regex), 0, parseError, status));
    if (U_FAILURE(status)) {
        throw PhonetikaError(ErrorKind::BadContextRegex,
                             "Invalid regex \"" + regex + "\" in " + where + ": " + u_errorName(status));
    }
    return std::shared_ptr<const icu::RegexPattern>(pattern.release());
}

bool regexFind(const icu::RegexPattern& pattern, const icu::UnicodeString& input) {
    UErrorCode status = U_ZERO_ERROR;
    std::unique_ptr<icu::RegexMatcher> matcher(pattern.matcher(input, status));
    if (U_FAILURE(status)) {
        detail::logger()->trace("Regex matcher creation failed: {}", u_errorName(status));
        return false;
    }
    return matcher->find();
}

// Matches a whole line and returns its capture groups, group 0 first.
static bool matchLine(const icu::RegexPattern& pattern, const std::string& line,
                      std::vector<std::string>& groups) {
    UErrorCode status = U_ZERO_ERROR;
    icu::UnicodeString input = detail::toUnicode(line);
    std::unique_ptr<icu::RegexMatcher> matcher(pattern.matcher(input, status));
    if (U_FAILURE(status) || !matcher->matches(status) || U_FAILURE(status)) {
        return false;
    }
    groups.clear();
    for (int32_t i = 0; i <= matcher->groupCount(); ++i) {
        groups.push_back(detail::toUtf8(matcher->group(i, status)));
    }
    return U_SUCCESS(status);
}

// =============================================================================//
// Phoneme Implementation
// =============================================================================//

Phoneme::Phoneme(std::string text, LanguageSet languages)
    : text_(std::move(text)), languages_(std::move(languages)) {}

Phoneme Phoneme::join(const Phoneme& left, const Phoneme& right, LanguageSet languages) {
    return Phoneme(left.text_ + right.text_, std::move(languages));
}

Phoneme Phoneme::append(const std::string& value) const {
    return Phoneme(text_ + value, languages_);
}

static Phoneme parsePhoneme(const std::string& phoneme) {
    size_t open = phoneme.find('[');
    if (open == std::string::npos) {
        return Phoneme(phoneme, LanguageSet::any());
    }
    if (!endsWith(phoneme, "]")) {
        throw PhonetikaError(ErrorKind::WrongPhoneme,
                             "Phoneme expression " + phoneme + " has a '[' but doesn't end with a ']'");
    }
    std::string text = phoneme.substr(0, open);
    std::string languages = phoneme.substr(open + 1, phoneme.size() - open - 2);
    std::vector<std::string> parts = detail::split(languages, '+');
    return Phoneme(text, LanguageSet::from(std::set<std::string>(parts.begin(), parts.end())));
}

PhonemeList parsePhonemeExpr(const std::string& expression) {
    if (!startsWith(expression, "(")) {
        return {parsePhoneme(expression)};
    }
    if (expression.size() < 2 || !endsWith(expression, ")")) {
        throw PhonetikaError(ErrorKind::WrongPhoneme, "Wrong phoneme rule " + expression);
    }
    std::string body = expression.substr(1, expression.size() - 2);
    PhonemeList alternatives;
    // Empty parts are kept: "(a|)" means "a" or nothing.
    for (const auto& part : detail::split(body, '|')) {
        alternatives.push_back(parsePhoneme(part));
    }
    return alternatives;
}

// =============================================================================//
// ContextMatcher Implementation
// =============================================================================//

ContextMatcher::ContextMatcher(const std::string& regex) {
    bool anchoredStart = startsWith(regex, "^");
    bool anchoredEnd = endsWith(regex, "$");
    size_t begin = anchoredStart ? 1 : 0;
    size_t end = anchoredEnd ? regex.size() - 1 : regex.size();
    std::string content = end > begin ? regex.substr(begin, end - begin) : "";

    if (content.find('[') == std::string::npos) {
        if (anchoredStart && anchoredEnd) {
            kind_ = content.empty() ? Kind::IsEmpty : Kind::Equals;
            content_ = detail::toUnicode(content);
            return;
        }
        if ((anchoredStart || anchoredEnd) && content.empty()) {
            kind_ = Kind::AllStrings;
            return;
        }
        if (anchoredStart) {
            kind_ = Kind::StartsWith;
            content_ = detail::toUnicode(content);
            return;
        }
        if (anchoredEnd) {
            kind_ = Kind::EndsWith;
            content_ = detail::toUnicode(content);
            return;
        }
    } else if (startsWith(content, "[") && endsWith(content, "]")) {
        std::string box = content.substr(1, content.size() - 2);
        if (box.find('[') == std::string::npos) {
            bool negate = startsWith(box, "^");
            if (negate) {
                box = box.substr(1);
            }
            shouldMatch_ = !negate;
            content_ = detail::toUnicode(box);
            if (anchoredStart && anchoredEnd) {
                kind_ = Kind::EqualsChar;
                return;
            }
            if (anchoredStart) {
                kind_ = Kind::StartsWithChar;
                return;
            }
            if (anchoredEnd) {
                kind_ = Kind::EndsWithChar;
                return;
            }
        }
    }

    kind_ = Kind::Regex;
    pattern_ = compileRegex(regex, "context");
}

bool ContextMatcher::inClass(UChar32 c) const {
    return content_.indexOf(c) >= 0;
}

bool ContextMatcher::isMatch(const icu::UnicodeString& input) const {
    switch (kind_) {
        case Kind::AllStrings:
            return true;
        case Kind::IsEmpty:
            return input.isEmpty();
        case Kind::Equals:
            return input == content_;
        case Kind::StartsWith:
            return input.startsWith(content_);
        case Kind::EndsWith:
            return input.endsWith(content_);
        case Kind::EqualsChar:
            return input.countChar32() == 1 && inClass(input.char32At(0)) == shouldMatch_;
        case Kind::StartsWithChar:
            return !input.isEmpty() && inClass(input.char32At(0)) == shouldMatch_;
        case Kind::EndsWithChar:
            return !input.isEmpty() && inClass(input.char32At(input.length() - 1)) == shouldMatch_;
        case Kind::Regex:
            return regexFind(*pattern_, input);
    }
    return false;
}

// =============================================================================//
// Rule Implementation
// =============================================================================//

bool Rule::patternAndContextMatches(const icu::UnicodeString& input, int32_t index) const {
    int32_t patternLength = pattern.length();
    int32_t end = index + patternLength;
    if (end > input.length()) {
        return false;
    }
    if (input.compare(index, patternLength, pattern) != 0) {
        return false;
    }
    if (!rightContext.isMatch(input.tempSubString(end))) {
        return false;
    }
    return leftContext.isMatch(input.tempSubString(0, index));
}

// ----------------- Rule files -----------------

static void parseRuleFile(const fs::path& dir, const std::string& name, RuleMap& result,
                          std::vector<std::string>& includeStack) {
    static const auto includeLine =
        compileRegex("^\\s*#include\\s+([a-z_]+?)\\s*(//.*){0,1}$", "include line");
    static const auto ruleLine =
        compileRegex("\\s*\"(.+?)\"\\s+\"(.*?)\"\\s+\"(.*?)\"\\s+\"(.*?)\"\\s*(//.*){0,1}$", "rule line");

    fs::path fullPath = dir / (name + ".txt");
    if (!fs::exists(fullPath)) {
        throw PhonetikaError(ErrorKind::WrongFilename, "Can't find file for " + name + " rules");
    }
    std::string content = detail::readFileContent(fullPath);
    includeStack.push_back(name);

    size_t ruleCount = 0;
    std::vector<std::string> groups;
    detail::forEachContentLine(content, [&](int lineNumber, const std::string& line) {
        std::string where = name + ".txt:" + std::to_string(lineNumber);

        if (matchLine(*includeLine, line, groups)) {
            const std::string& included = groups[1];
            if (std::find(includeStack.begin(), includeStack.end(), included) != includeStack.end()) {
                throw PhonetikaError(ErrorKind::BadRule, where + ": recursive include of " + included);
            }
            try {
                parseRuleFile(dir, included, result, includeStack);
            } catch (const PhonetikaError& e) {
                throw PhonetikaError(e.kind(),
                                     "Can't include file " + included + " in " + where + ": " + e.what());
            }
            return;
        }

        if (!matchLine(*ruleLine, line, groups)) {
            throw PhonetikaError(ErrorKind::BadRule, where + ": malformed rule line: " + line);
        }
        try {
            Rule rule{detail::toUnicode(groups[1]),
                      ContextMatcher(groups[2] + "$"),
                      ContextMatcher("^" + groups[3]),
                      parsePhonemeExpr(groups[4]),
                      name,
                      lineNumber};
            UChar32 first = rule.pattern.char32At(0);
            result[first].push_back(std::move(rule));
            ruleCount++;
        } catch (const PhonetikaError& e) {
            throw PhonetikaError(e.kind(), where + ": " + e.what());
        }
    });

    includeStack.pop_back();
    detail::logger()->debug("Parsed {} rules from {}", ruleCount, fullPath.string());
}

RuleMap parseRules(const fs::path& dir, const std::string& name) {
    RuleMap result;
    std::vector<std::string> includeStack;
    parseRuleFile(dir, name, result, includeStack);
    for (auto& bucket : result) {
        std::stable_sort(bucket.second.begin(), bucket.second.end(),
                         [](const Rule& a, const Rule& b) { return a.pattern.length() > b.pattern.length(); });
    }
    return result;
}

} // namespace bm
} // namespace phonetika
