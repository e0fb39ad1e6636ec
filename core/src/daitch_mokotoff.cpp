/********************************************************************
 * daitch_mokotoff.cpp  –  rule-driven Daitch-Mokotoff Soundex.
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
#include "libphonetika/encoders.h"
#include "text_utils.h"

#include <algorithm>
#include <map>

#include <unicode/uchar.h>

namespace fs = std::filesystem;

namespace phonetika {

namespace {

const size_t MAX_LENGTH = 6;
const char* const RULES_FILE = "dmrules.txt";

struct DmRule {
    icu::UnicodeString pattern;
    std::vector<std::string> atStart;
    std::vector<std::string> beforeVowel;
    std::vector<std::string> otherwise;

    const std::vector<std::string>& replacements(const icu::UnicodeString& context, bool isStart) const {
        if (isStart) {
            return atStart;
        }
        int32_t next = pattern.length();
        if (next < context.length()) {
            UChar c = context.charAt(next);
            if (c == 'a' || c == 'e' || c == 'i' || c == 'o' || c == 'u') {
                return beforeVowel;
            }
        }
        return otherwise;
    }
};

// One candidate code under construction.
struct Branch {
    std::string builder;
    std::string lastReplacement;
    bool hasLastReplacement = false;

    // A code repeating the end of the previous one is not appended, unless forced.
    void processNextReplacement(const std::string& replacement, bool force) {
        bool append = !hasLastReplacement || !detail::endsWith(lastReplacement, replacement) || force;
        if (append && builder.size() < MAX_LENGTH) {
            builder += replacement;
            if (builder.size() > MAX_LENGTH) {
                builder.resize(MAX_LENGTH);
            }
        }
        lastReplacement = replacement;
        hasLastReplacement = true;
    }

    void finish() {
        while (builder.size() < MAX_LENGTH) {
            builder += '0';
        }
    }
};

// Unquotes one field of a rule line; false if it is not "quoted".
bool unquote(const std::string& field, std::string& out) {
    if (field.size() < 2 || field.front() != '"' || field.back() != '"') {
        return false;
    }
    out = field.substr(1, field.size() - 2);
    return true;
}

bool singleCodePoint(const std::string& s, UChar32& out) {
    icu::UnicodeString u = detail::toUnicode(s);
    if (u.countChar32() != 1) {
        return false;
    }
    out = u.char32At(0);
    return true;
}

} // namespace

// =============================================================================//
// DaitchMokotoffSoundex Implementation (PImpl Idiom)
// =============================================================================//
class DaitchMokotoffSoundex::Impl {
public:
    std::map<UChar32, std::vector<DmRule>> rules_;
    std::map<UChar32, UChar32> foldings_;
    bool asciiFolding_;

    Impl(const std::string& dataDir, bool asciiFolding) : asciiFolding_(asciiFolding) {
        fs::path dir = detail::resolveDataDir(dataDir, "dm");
        parse(detail::readFileContent(dir / RULES_FILE));
    }

    void parse(const std::string& content) {
        size_t ruleCount = 0;
        detail::forEachContentLine(content, [&](int lineNumber, const std::string& rawLine) {
            std::string where = std::string(RULES_FILE) + ":" + std::to_string(lineNumber);
            std::string line = rawLine;
            size_t comment = line.find("//");
            if (comment != std::string::npos) {
                line = detail::trim(line.substr(0, comment));
            }
            if (line.empty()) {
                return;
            }

            if (line.find('=') != std::string::npos) {
                std::vector<std::string> parts = detail::split(line, '=');
                UChar32 from = 0;
                UChar32 to = 0;
                if (parts.size() != 2 || !singleCodePoint(parts[0], from) || !singleCodePoint(parts[1], to)) {
                    throw PhonetikaError(ErrorKind::BadRule,
                                         where + ": Malformed folding statement: " + rawLine);
                }
                foldings_[from] = to;
                return;
            }

            std::vector<std::string> parts = detail::splitWhitespace(line);
            std::string fields[4];
            bool quoted = parts.size() == 4;
            for (size_t i = 0; quoted && i < 4; ++i) {
                quoted = unquote(parts[i], fields[i]);
            }
            if (!quoted || fields[0].empty()) {
                throw PhonetikaError(ErrorKind::BadRule,
                                     where + ": Malformed rule statement: " + rawLine);
            }

            DmRule rule{detail::toUnicode(fields[0]), detail::split(fields[1], '|'),
                        detail::split(fields[2], '|'), detail::split(fields[3], '|')};
            UChar32 first = rule.pattern.char32At(0);
            rules_[first].push_back(std::move(rule));
            ruleCount++;
        });

        for (auto& bucket : rules_) {
            std::stable_sort(bucket.second.begin(), bucket.second.end(), [](const DmRule& a, const DmRule& b) {
                return a.pattern.length() > b.pattern.length();
            });
        }
        detail::logger()->debug("Parsed {} rules and {} foldings from {}", ruleCount, foldings_.size(),
                                RULES_FILE);
    }

    // Lower case without white space, folded when enabled.
    icu::UnicodeString cleanup(const std::string& value) const {
        icu::UnicodeString input = detail::toUnicode(value);
        icu::UnicodeString result;
        for (int32_t i = 0; i < input.length();) {
            UChar32 c = input.char32At(i);
            i += U16_LENGTH(c);
            if (u_isWhitespace(c)) {
                continue;
            }
            c = u_tolower(c);
            if (asciiFolding_) {
                auto folded = foldings_.find(c);
                if (folded != foldings_.end()) {
                    c = folded->second;
                }
            }
            result.append(c);
        }
        return result;
    }
};

//  Public DaitchMokotoffSoundex methods forwarding to Impl

DaitchMokotoffSoundex::DaitchMokotoffSoundex(const std::string& dataDir, bool asciiFolding)
    : pImpl(std::make_unique<Impl>(dataDir, asciiFolding)) {}

DaitchMokotoffSoundex::~DaitchMokotoffSoundex() = default;

bool DaitchMokotoffSoundex::isAsciiFolding() const {
    return pImpl->asciiFolding_;
}

void DaitchMokotoffSoundex::setAsciiFolding(bool asciiFolding) {
    pImpl->asciiFolding_ = asciiFolding;
}

std::string DaitchMokotoffSoundex::encode(const std::string& value) const {
    return branches(value, false).front();
}

std::string DaitchMokotoffSoundex::soundex(const std::string& value) const {
    return detail::join(branches(value, true), "|");
}

std::vector<std::string> DaitchMokotoffSoundex::branches(const std::string& value, bool branching) const {
    icu::UnicodeString input = pImpl->cleanup(value);

    std::vector<Branch> current(1);
    UChar32 lastChar = 0;
    for (int32_t index = 0; index < input.length();) {
        UChar32 ch = input.char32At(index);
        int32_t advance = U16_LENGTH(ch);

        auto bucket = pImpl->rules_.find(ch);
        if (bucket != pImpl->rules_.end()) {
            icu::UnicodeString context = input.tempSubString(index);
            for (const auto& rule : bucket->second) {
                if (!context.startsWith(rule.pattern)) {
                    continue;
                }
                const auto& replacements = rule.replacements(context, lastChar == 0);
                // "mn" and "nm" code both letters.
                bool force = (lastChar == 'm' && ch == 'n') || (lastChar == 'n' && ch == 'm');

                std::vector<Branch> next;
                for (const auto& branch : current) {
                    for (const auto& replacement : replacements) {
                        Branch candidate = branch;
                        candidate.processNextReplacement(replacement, force);
                        bool seen = std::any_of(next.begin(), next.end(), [&](const Branch& b) {
                            return b.builder == candidate.builder;
                        });
                        if (!seen) {
                            next.push_back(std::move(candidate));
                        }
                        if (!branching) {
                            break;
                        }
                    }
                }
                current = std::move(next);
                advance = rule.pattern.length();
                break;
            }
            lastChar = ch;
        }
        index += advance;
    }

    std::vector<std::string> result;
    result.reserve(current.size());
    for (auto& branch : current) {
        branch.finish();
        result.push_back(branch.builder);
    }
    return result;
}

} // namespace phonetika
