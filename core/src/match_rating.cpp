/********************************************************************
 * match_rating.cpp  –  Match Rating Approach encoder and comparison.
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

#include <cstdlib>
#include <cstring>

#include <unicode/locid.h>
#include <unicode/uchar.h>

namespace phonetika {

namespace {

// Accented letters and their plain forms, position for position.
const char* const ACCENTED =
    "ÀàÈèÌìÒòÙù"
    "ÁáÉéÍíÓóÚúÝý"
    "ÂâÊêÎîÔôÛûŶŷ"
    "ÃãÕõÑñ"
    "ÄäËëÏïÖöÜüŸÿ"
    "ÅåÇçŐőŰű";
const char* const PLAIN_ASCII =
    "AaEeIiOoUu"
    "AaEeIiOoUuYy"
    "AaEeIiOoUuYy"
    "AaOoNn"
    "AaEeIiOoUuYy"
    "AaCcOoUu";

const char* const CHARS_TO_TRIM = "-&'.,";

icu::UnicodeString removeAccents(const icu::UnicodeString& name) {
    static const icu::UnicodeString accented = icu::UnicodeString::fromUTF8(ACCENTED);
    static const icu::UnicodeString plain = icu::UnicodeString::fromUTF8(PLAIN_ASCII);
    icu::UnicodeString result;
    for (int32_t i = 0; i < name.length(); ++i) {
        UChar c = name.charAt(i);
        int32_t position = accented.indexOf(c);
        result.append(position >= 0 ? plain.charAt(position) : c);
    }
    return result;
}

// Upper case without punctuation, blanks or accents.
icu::UnicodeString cleanName(const std::string& name) {
    icu::UnicodeString upper = detail::toUnicode(name);
    upper.toUpper(icu::Locale::getEnglish());
    icu::UnicodeString kept;
    for (int32_t i = 0; i < upper.length(); ++i) {
        UChar c = upper.charAt(i);
        bool trimmed = c < 0x80 && std::strchr(CHARS_TO_TRIM, static_cast<char>(c)) != nullptr;
        if (!trimmed && !u_isUWhiteSpace(c)) {
            kept.append(c);
        }
    }
    return removeAccents(kept);
}

// Drops every vowel except a leading one.
icu::UnicodeString removeVowels(const icu::UnicodeString& name) {
    icu::UnicodeString result;
    for (int32_t i = 0; i < name.length(); ++i) {
        UChar c = name.charAt(i);
        bool vowel = c == 'A' || c == 'E' || c == 'I' || c == 'O' || c == 'U';
        if (i == 0 || !vowel) {
            result.append(c);
        }
    }
    return result;
}

icu::UnicodeString removeDoubleConsonants(const icu::UnicodeString& name) {
    icu::UnicodeString result = name;
    result.toUpper(icu::Locale::getEnglish());
    for (const char* consonants = "BCDFGHJKLMNPQRSTVWXYZ"; *consonants != '\0'; ++consonants) {
        UChar single = static_cast<UChar>(*consonants);
        icu::UnicodeString doubled;
        doubled.append(single).append(single);
        result.findAndReplace(doubled, icu::UnicodeString(single));
    }
    return result;
}

icu::UnicodeString firstThreeLastThree(const icu::UnicodeString& name) {
    int32_t length = name.length();
    if (length <= 6) {
        return name;
    }
    icu::UnicodeString result = name.tempSubString(0, 3);
    result.append(name.tempSubString(length - 3, 3));
    return result;
}

bool isBlankOrSingle(const std::string& value) {
    icu::UnicodeString trimmed = detail::toUnicode(value);
    trimmed.trim();
    return trimmed.length() <= 1;
}

icu::UnicodeString encodeName(const std::string& value) {
    if (isBlankOrSingle(value)) {
        return icu::UnicodeString();
    }
    return firstThreeLastThree(removeDoubleConsonants(removeVowels(cleanName(value))));
}

int minimumRating(int32_t sumLength) {
    if (sumLength <= 4) return 5;
    if (sumLength <= 7) return 4;
    if (sumLength <= 11) return 3;
    if (sumLength == 12) return 2;
    return 1;
}

// Strikes out characters equal at the same position from the left, then
// from the right, and grades what remains of the longer name.
int similarity(const icu::UnicodeString& name1, const icu::UnicodeString& name2) {
    icu::UnicodeString n1 = name1;
    icu::UnicodeString n2 = name2;
    const int32_t n1Last = n1.length() - 1;
    const int32_t n2Last = n2.length() - 1;

    for (int32_t i = 0; i < n1.length() && i <= n2Last; ++i) {
        if (n1.charAt(i) == n2.charAt(i)) {
            n1.setCharAt(i, ' ');
            n2.setCharAt(i, ' ');
        }
        if (n1.charAt(n1Last - i) == n2.charAt(n2Last - i)) {
            n1.setCharAt(n1Last - i, ' ');
            n2.setCharAt(n2Last - i, ' ');
        }
    }

    auto remaining = [](const icu::UnicodeString& s) {
        int32_t count = 0;
        for (int32_t i = 0; i < s.length(); ++i) {
            if (s.charAt(i) != ' ') count++;
        }
        return count;
    };
    int32_t r1 = remaining(n1);
    int32_t r2 = remaining(n2);
    return std::abs(6 - (r1 > r2 ? r1 : r2));
}

} // namespace

std::string MatchRatingApproach::encode(const std::string& value) const {
    return detail::toUtf8(encodeName(value));
}

bool MatchRatingApproach::isEncodedEquals(const std::string& first, const std::string& second) const {
    if (isBlankOrSingle(first) || isBlankOrSingle(second)) {
        return false;
    }
    if (detail::toUnicode(first).caseCompare(detail::toUnicode(second), U_FOLD_CASE_DEFAULT) == 0) {
        return true;
    }

    icu::UnicodeString name1 = encodeName(first);
    icu::UnicodeString name2 = encodeName(second);
    if (std::abs(name1.length() - name2.length()) >= 3) {
        return false;
    }
    int32_t sumLength = name1.length() + name2.length();
    return similarity(name1, name2) >= minimumRating(sumLength);
}

} // namespace phonetika
