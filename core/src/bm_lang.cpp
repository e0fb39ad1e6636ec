/********************************************************************
 * bm_lang.cpp  –  language lists and language guessing.
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
#include <iterator>

namespace phonetika {
namespace bm {

// Drops a trailing "//" comment and surrounding blanks.
static std::string stripLineComment(const std::string& line) {
    size_t comment = line.find("//");
    if (comment != std::string::npos) {
        return detail::trim(line.substr(0, comment));
    }
    return line;
}

std::set<std::string> parseLanguages(const std::string& content, const std::string& location) {
    std::set<std::string> languages;
    detail::forEachContentLine(content, [&](int lineNumber, const std::string& line) {
        std::string token = stripLineComment(line);
        if (token.find_first_of(" \t") != std::string::npos) {
            throw PhonetikaError(ErrorKind::BadRule, location + ":" + std::to_string(lineNumber) +
                                                         ": Can't parse line for languages: " + line);
        }
        if (!token.empty()) {
            languages.insert(token);
        }
    });
    return languages;
}

Lang parseLang(const std::string& content, const std::string& location,
               const std::set<std::string>& languages) {
    std::vector<LangRule> rules;
    detail::forEachContentLine(content, [&](int lineNumber, const std::string& line) {
        std::string where = location + ":" + std::to_string(lineNumber);
        std::string body = stripLineComment(line);
        if (body.empty()) {
            return;
        }
        std::vector<std::string> parts = detail::splitWhitespace(body);
        if (parts.size() != 3) {
            throw PhonetikaError(ErrorKind::BadRule, where + ": Malformed line '" + line + "'");
        }

        bool accept;
        if (parts[2] == "true") {
            accept = true;
        } else if (parts[2] == "false") {
            accept = false;
        } else {
            throw PhonetikaError(ErrorKind::NotABoolean,
                                 where + ": '" + parts[2] + "' is not a boolean in '" + line + "'");
        }

        std::vector<std::string> langs = detail::split(parts[1], '+');
        rules.push_back(LangRule{compileRegex(parts[0], where),
                                 std::set<std::string>(langs.begin(), langs.end()),
                                 accept});
    });
    detail::logger()->debug("Parsed {} language rules from {}", rules.size(), location);
    return Lang(languages, std::move(rules));
}

// =============================================================================//
// Lang Implementation
// =============================================================================//

Lang::Lang(std::set<std::string> languages, std::vector<LangRule> rules)
    : languages_(std::move(languages)), rules_(std::move(rules)) {}

LanguageSet Lang::guessLanguages(const std::string& input) const {
    icu::UnicodeString text = detail::toUnicode(detail::toLowerEnglish(input));

    std::set<std::string> remaining = languages_;
    for (const auto& rule : rules_) {
        if (!regexFind(*rule.pattern, text)) {
            continue;
        }
        std::set<std::string> next;
        if (rule.acceptOnMatch) {
            std::set_intersection(remaining.begin(), remaining.end(),
                                  rule.languages.begin(), rule.languages.end(),
                                  std::inserter(next, next.begin()));
        } else {
            std::set_difference(remaining.begin(), remaining.end(),
                                rule.languages.begin(), rule.languages.end(),
                                std::inserter(next, next.begin()));
        }
        remaining = std::move(next);
    }

    LanguageSet result = LanguageSet::from(std::move(remaining));
    return result.isEmpty() ? LanguageSet::any() : result;
}

} // namespace bm
} // namespace phonetika
