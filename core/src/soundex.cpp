/********************************************************************
 * soundex.cpp  –  Soundex, Refined Soundex and Phonex.
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

#include <stdexcept>

namespace phonetika {

namespace {

const char SILENT_MARKER = '-';

void checkMapping(const std::string& mapping) {
    if (mapping.size() != 26) {
        throw std::invalid_argument("Soundex mapping must have 26 codes, got " +
                                    std::to_string(mapping.size()) + ": " + mapping);
    }
}

} // namespace

// =============================================================================//
// Soundex Implementation
// =============================================================================//

const std::string Soundex::US_ENGLISH_MAPPING = "01230120022455012623010202";
const std::string Soundex::US_ENGLISH_GENEALOGY_MAPPING = "-123-12--22455-12623-1-2-2";

Soundex::Soundex() : Soundex(US_ENGLISH_MAPPING, true) {}

Soundex::Soundex(const std::string& mapping)
    : Soundex(mapping, mapping.find(SILENT_MARKER) == std::string::npos) {}

Soundex::Soundex(const std::string& mapping, bool specialCaseHW)
    : mapping_(mapping), specialCaseHW_(specialCaseHW) {
    checkMapping(mapping_);
}

char Soundex::mappingCode(char letter) const {
    return mapping_[letter - 'A'];
}

std::string Soundex::encode(const std::string& value) const {
    std::string input = detail::upperAsciiLetters(value);
    if (input.empty()) {
        return input;
    }

    std::string code = "0000";
    code[0] = input[0];
    size_t count = 1;
    char previous = mappingCode(input[0]);
    for (size_t i = 1; i < input.size() && count < code.size(); ++i) {
        char letter = input[i];
        if (specialCaseHW_ && (letter == 'H' || letter == 'W')) {
            continue;
        }
        char digit = mappingCode(letter);
        if (digit == SILENT_MARKER) {
            continue;
        }
        if (digit != '0' && digit != previous) {
            code[count++] = digit;
        }
        previous = digit;
    }
    return code;
}

int Soundex::difference(const std::string& first, const std::string& second) const {
    return soundexDifference(*this, first, second);
}

// =============================================================================//
// RefinedSoundex Implementation
// =============================================================================//

const std::string RefinedSoundex::US_ENGLISH_MAPPING = "01360240043788015936020505";

RefinedSoundex::RefinedSoundex() : mapping_(US_ENGLISH_MAPPING) {}

RefinedSoundex::RefinedSoundex(const std::string& mapping) : mapping_(mapping) {
    checkMapping(mapping_);
}

std::string RefinedSoundex::encode(const std::string& value) const {
    std::string input = detail::upperAsciiLetters(value);
    if (input.empty()) {
        return input;
    }

    std::string code(1, input[0]);
    char previous = '*';
    for (char letter : input) {
        char current = mapping_[letter - 'A'];
        if (current != previous) {
            code += current;
        }
        previous = current;
    }
    return code;
}

int RefinedSoundex::difference(const std::string& first, const std::string& second) const {
    return soundexDifference(*this, first, second);
}

// =============================================================================//
// Phonex Implementation
// =============================================================================//

namespace {

bool isPhonexVowel(char c) {
    return c == 'A' || c == 'E' || c == 'I' || c == 'O' || c == 'U' || c == 'Y';
}

std::string phonexPreprocess(const std::string& value) {
    std::string input = detail::upperAsciiLetters(value);

    while (!input.empty() && input.back() == 'S') {
        input.pop_back();
    }

    if (detail::startsWith(input, "KN")) {
        input.replace(0, 2, "N");
    } else if (detail::startsWith(input, "PH")) {
        input.replace(0, 2, "F");
    } else if (detail::startsWith(input, "WR")) {
        input.replace(0, 2, "R");
    }

    if (!input.empty() && input[0] == 'H') {
        input.erase(0, 1);
    }

    if (!input.empty()) {
        switch (input[0]) {
            case 'E': case 'I': case 'O': case 'U': case 'Y': input[0] = 'A'; break;
            case 'P': input[0] = 'B'; break;
            case 'V': input[0] = 'F'; break;
            case 'K': case 'Q': input[0] = 'C'; break;
            case 'J': input[0] = 'G'; break;
            case 'Z': input[0] = 'S'; break;
            default: break;
        }
    }
    return input;
}

// Digit for @p current; sets @p skipNext when the following letter is absorbed.
char phonexCode(char current, char next, bool isLast, bool& skipNext) {
    skipNext = false;
    switch (current) {
        case 'B': case 'P': case 'F': case 'V':
            return '1';
        case 'C': case 'S': case 'K': case 'G': case 'J': case 'Q': case 'X': case 'Z':
            return '2';
        case 'D': case 'T':
            return next == 'C' ? '0' : '3';
        case 'L':
            return isPhonexVowel(next) || isLast ? '4' : '0';
        case 'M': case 'N':
            skipNext = next == 'D' || next == 'G';
            return '5';
        case 'R':
            return isPhonexVowel(next) || isLast ? '6' : '0';
        default:
            return '0';
    }
}

} // namespace

Phonex::Phonex(int maxCodeLength) : maxCodeLength_(maxCodeLength) {}

std::string Phonex::encode(const std::string& value) const {
    std::string input = phonexPreprocess(value);
    if (input.empty()) {
        return input;
    }

    std::string result;
    char last = '0';
    size_t i = 0;
    while (i < input.size() && static_cast<int>(result.size()) < maxCodeLength_) {
        bool first = i == 0;
        char next = i + 1 < input.size() ? input[i + 1] : '\0';
        bool skipNext = false;
        char code = phonexCode(input[i], next, i + 1 == input.size(), skipNext);
        if (skipNext) {
            i++;
        }

        if (first) {
            result += input[0];
            last = code;
        } else {
            if (code != '0' && code != last) {
                result += code;
            }
            last = result.back();
        }
        i++;
    }

    while (static_cast<int>(result.size()) < maxCodeLength_) {
        result += '0';
    }
    return result;
}

} // namespace phonetika
