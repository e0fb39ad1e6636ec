/********************************************************************
 * metaphone.cpp  –  classic Metaphone.
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

#include <unicode/locid.h>

namespace phonetika {

namespace {

const icu::UnicodeString VOWELS = icu::UnicodeString::fromUTF8("AEIOU");
const icu::UnicodeString FRONTV = icu::UnicodeString::fromUTF8("EIY");
const icu::UnicodeString VARSON = icu::UnicodeString::fromUTF8("CSPTG");

// Word being encoded, with the bounds-checked lookups the rules need.
class Word {
public:
    explicit Word(icu::UnicodeString text) : text_(std::move(text)) {}

    int32_t size() const { return text_.length(); }
    UChar at(int32_t i) const { return text_.charAt(i); }

    bool isVowel(int32_t i) const {
        return i >= 0 && i < size() && VOWELS.indexOf(at(i)) >= 0;
    }
    bool isFrontVowel(int32_t i) const {
        return i >= 0 && i < size() && FRONTV.indexOf(at(i)) >= 0;
    }
    bool isPreviousChar(int32_t i, UChar c) const {
        return i > 0 && i < size() && at(i - 1) == c;
    }
    bool isNextChar(int32_t i, UChar c) const {
        return i >= 0 && i < size() - 1 && at(i + 1) == c;
    }
    bool isLastChar(int32_t i) const {
        return i + 1 == size();
    }
    bool regionMatch(int32_t i, const char* test) const {
        icu::UnicodeString pattern = icu::UnicodeString::fromUTF8(test);
        return i >= 0 && i + pattern.length() <= size() &&
               text_.compare(i, pattern.length(), pattern) == 0;
    }

private:
    icu::UnicodeString text_;
};

// Applies the leading-letter exceptions: KN GN PN AE WR drop the first
// letter, WH keeps only W, X sounds like S.
icu::UnicodeString initialTransform(const icu::UnicodeString& word) {
    UChar first = word.charAt(0);
    UChar second = word.charAt(1);
    switch (first) {
        case 'K': case 'G': case 'P':
            return second == 'N' ? word.tempSubString(1) : word;
        case 'A':
            return second == 'E' ? word.tempSubString(1) : word;
        case 'W':
            if (second == 'R') {
                return word.tempSubString(1);
            }
            if (second == 'H') {
                icu::UnicodeString result = word.tempSubString(1);
                result.setCharAt(0, 'W');
                return result;
            }
            return word;
        case 'X': {
            icu::UnicodeString result = word;
            result.setCharAt(0, 'S');
            return result;
        }
        default:
            return word;
    }
}

} // namespace

Metaphone::Metaphone(int maxCodeLength) : maxCodeLength_(maxCodeLength) {}

std::string Metaphone::encode(const std::string& value) const {
    icu::UnicodeString upper = detail::toUnicode(value);
    upper.toUpper(icu::Locale::getEnglish());
    if (upper.isEmpty()) {
        return "";
    }
    if (upper.length() == 1) {
        return detail::toUtf8(upper);
    }

    Word local(initialTransform(upper));
    const int32_t wdsz = local.size();
    std::string code;
    int32_t n = 0;

    while (static_cast<int>(code.size()) < maxCodeLength_ && n < wdsz) {
        UChar symb = local.at(n);
        // Doubled letters count once, except C.
        if (symb != 'C' && local.isPreviousChar(n, symb)) {
            n++;
            continue;
        }

        switch (symb) {
            case 'A': case 'E': case 'I': case 'O': case 'U':
                if (n == 0) {
                    code += static_cast<char>(symb);
                }
                break;
            case 'B':
                // Silent in "-mb".
                if (!(local.isPreviousChar(n, 'M') && local.isLastChar(n))) {
                    code += 'B';
                }
                break;
            case 'C':
                if (local.isPreviousChar(n, 'S') && !local.isLastChar(n) && local.isFrontVowel(n + 1)) {
                    break;
                }
                if (local.regionMatch(n, "CIA")) {
                    code += 'X';
                } else if (!local.isLastChar(n) && local.isFrontVowel(n + 1)) {
                    code += 'S';
                } else if (local.isPreviousChar(n, 'S') && local.isNextChar(n, 'H')) {
                    code += 'K';
                } else if (local.isNextChar(n, 'H')) {
                    code += (n == 0 && wdsz >= 3 && local.isVowel(2)) ? 'K' : 'X';
                } else {
                    code += 'K';
                }
                break;
            case 'D':
                if (!local.isLastChar(n + 1) && local.isNextChar(n, 'G') && local.isFrontVowel(n + 2)) {
                    code += 'J';
                    n += 2;
                } else {
                    code += 'T';
                }
                break;
            case 'G': {
                if (local.isLastChar(n + 1) && local.isNextChar(n, 'H')) {
                    break;
                }
                if (!local.isLastChar(n + 1) && local.isNextChar(n, 'H') && !local.isVowel(n + 2)) {
                    break;
                }
                if (n > 0 && (local.regionMatch(n, "GN") || local.regionMatch(n, "GNED"))) {
                    break;
                }
                bool hard = local.isPreviousChar(n, 'G');
                if (!local.isLastChar(n) && local.isFrontVowel(n + 1) && !hard) {
                    code += 'J';
                } else {
                    code += 'K';
                }
                break;
            }
            case 'H':
                if (local.isLastChar(n)) {
                    break;
                }
                if (n > 0 && VARSON.indexOf(local.at(n - 1)) >= 0) {
                    break;
                }
                if (local.isVowel(n + 1)) {
                    code += 'H';
                }
                break;
            case 'F': case 'J': case 'L': case 'M': case 'N': case 'R':
                code += static_cast<char>(symb);
                break;
            case 'K':
                if (!local.isPreviousChar(n, 'C')) {
                    code += 'K';
                }
                break;
            case 'P':
                code += local.isNextChar(n, 'H') ? 'F' : 'P';
                break;
            case 'Q':
                code += 'K';
                break;
            case 'S':
                if (local.regionMatch(n, "SH") || local.regionMatch(n, "SIO") || local.regionMatch(n, "SIA")) {
                    code += 'X';
                } else {
                    code += 'S';
                }
                break;
            case 'T':
                if (local.regionMatch(n, "TIA") || local.regionMatch(n, "TIO")) {
                    code += 'X';
                } else if (local.regionMatch(n, "TCH")) {
                    // Silent, the CH that follows is coded.
                } else if (local.regionMatch(n, "TH")) {
                    code += '0';
                } else {
                    code += 'T';
                }
                break;
            case 'V':
                code += 'F';
                break;
            case 'W': case 'Y':
                if (!local.isLastChar(n) && local.isVowel(n + 1)) {
                    code += static_cast<char>(symb);
                }
                break;
            case 'X':
                code += "KS";
                break;
            case 'Z':
                code += 'S';
                break;
            default:
                break;
        }
        n++;

        if (static_cast<int>(code.size()) > maxCodeLength_) {
            code.resize(maxCodeLength_);
        }
    }
    return code;
}

} // namespace phonetika
