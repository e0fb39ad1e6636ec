/********************************************************************
 * cologne.cpp  –  Kölner Phonetik.
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

#include <cstring>

#include <unicode/locid.h>

namespace phonetika {

namespace {

const char CHAR_IGNORE = '-';

bool isOneOf(UChar32 c, const char* set) {
    return c > 0 && c < 0x80 && std::strchr(set, static_cast<char>(c)) != nullptr;
}

// Collects digits: repeats collapse and '0' is only kept in front.
class CologneOutput {
public:
    void put(char code) {
        if (code != CHAR_IGNORE && code != lastCode_ && (code != '0' || buffer_.empty())) {
            buffer_ += code;
        }
        lastCode_ = code;
    }

    bool isEmpty() const { return buffer_.empty(); }
    const std::string& str() const { return buffer_; }

private:
    std::string buffer_;
    char lastCode_ = '/';
};

void foldUmlaut(icu::UnicodeString& text, UChar umlaut, char plain) {
    text.findAndReplace(icu::UnicodeString(umlaut), icu::UnicodeString(static_cast<UChar>(plain)));
}

} // namespace

std::string Cologne::encode(const std::string& value) const {
    icu::UnicodeString text = detail::toUnicode(value);
    text.toUpper(icu::Locale::getGermany());
    foldUmlaut(text, 0x00C4, 'A');
    foldUmlaut(text, 0x00DC, 'U');
    foldUmlaut(text, 0x00D6, 'O');

    CologneOutput output;
    UChar32 lastChar = CHAR_IGNORE;
    for (int32_t i = 0; i < text.length();) {
        UChar32 c = text.char32At(i);
        i += U16_LENGTH(c);
        if (c < 'A' || c > 'Z') {
            continue;
        }
        UChar32 next = i < text.length() ? text.char32At(i) : CHAR_IGNORE;

        if (isOneOf(c, "AEIJOUY")) {
            output.put('0');
        } else if (c == 'B' || (c == 'P' && next != 'H')) {
            output.put('1');
        } else if ((c == 'D' || c == 'T') && !isOneOf(next, "CSZ")) {
            output.put('2');
        } else if (isOneOf(c, "FPVW")) {
            output.put('3');
        } else if (isOneOf(c, "GKQ")) {
            output.put('4');
        } else if (c == 'X' && !isOneOf(lastChar, "CKQ")) {
            output.put('4');
            output.put('8');
        } else if (c == 'S' || c == 'Z') {
            output.put('8');
        } else if (c == 'C') {
            if (output.isEmpty()) {
                output.put(isOneOf(next, "AHKLOQRUX") ? '4' : '8');
            } else if (isOneOf(lastChar, "SZ") || !isOneOf(next, "AHKOQUX")) {
                output.put('8');
            } else {
                output.put('4');
            }
        } else if (isOneOf(c, "DTX")) {
            output.put('8');
        } else if (c == 'R') {
            output.put('7');
        } else if (c == 'L') {
            output.put('5');
        } else if (c == 'M' || c == 'N') {
            output.put('6');
        } else if (c == 'H') {
            output.put(CHAR_IGNORE);
        }

        lastChar = c;
    }
    return output.str();
}

} // namespace phonetika
