/********************************************************************
 * double_metaphone.cpp  –  Double Metaphone.
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

#include <initializer_list>

#include <unicode/locid.h>

namespace phonetika {

namespace {

const UChar C_CEDILLA = 0x00C7;
const UChar N_TILDE = 0x00D1;

// ----------------- Result accumulator -----------------
class DoubleMetaphoneResult {
public:
    explicit DoubleMetaphoneResult(int maxLength) : maxLength_(static_cast<size_t>(maxLength)) {}

    void append(char value) {
        appendPrimary(value);
        appendAlternate(value);
    }
    void append(char primary, char alternate) {
        appendPrimary(primary);
        appendAlternate(alternate);
    }
    void append(const std::string& value) {
        appendPrimary(value);
        appendAlternate(value);
    }
    void append(const std::string& primary, const std::string& alternate) {
        appendPrimary(primary);
        appendAlternate(alternate);
    }

    void appendPrimary(char value) {
        if (primary_.size() < maxLength_) primary_ += value;
    }
    void appendAlternate(char value) {
        if (alternate_.size() < maxLength_) alternate_ += value;
    }
    void appendPrimary(const std::string& value) {
        primary_ += value.substr(0, maxLength_ - primary_.size());
    }
    void appendAlternate(const std::string& value) {
        alternate_ += value.substr(0, maxLength_ - alternate_.size());
    }

    bool isComplete() const {
        return primary_.size() >= maxLength_ && alternate_.size() >= maxLength_;
    }

    const std::string& primary() const { return primary_; }
    const std::string& alternate() const { return alternate_; }

private:
    size_t maxLength_;
    std::string primary_;
    std::string alternate_;
};

// ----------------- Input with bounds-checked lookups -----------------
class Input {
public:
    explicit Input(icu::UnicodeString value) : value_(std::move(value)) {}

    int32_t length() const { return value_.length(); }

    /// The unit at @p index, or 0 outside the string.
    UChar charAt(int32_t index) const {
        return index < 0 || index >= length() ? 0 : value_.charAt(index);
    }

    /// True when the @p length units at @p start equal one of @p criteria.
    bool contains(int32_t start, int32_t length, std::initializer_list<const char*> criteria) const {
        if (start < 0 || start + length > this->length()) {
            return false;
        }
        for (const char* element : criteria) {
            icu::UnicodeString test = icu::UnicodeString::fromUTF8(element);
            if (test.length() == length && value_.compare(start, length, test) == 0) {
                return true;
            }
        }
        return false;
    }

    bool startsWith(const char* prefix) const {
        return value_.startsWith(icu::UnicodeString::fromUTF8(prefix));
    }
    bool has(const char* part) const {
        return value_.indexOf(icu::UnicodeString::fromUTF8(part)) >= 0;
    }

private:
    icu::UnicodeString value_;
};

bool isVowel(UChar c) {
    return c == 'A' || c == 'E' || c == 'I' || c == 'O' || c == 'U' || c == 'Y';
}

bool isSlavoGermanic(const Input& value) {
    return value.has("W") || value.has("K") || value.has("CZ") || value.has("WITZ");
}

bool isSilentStart(const Input& value) {
    for (const char* start : {"GN", "KN", "PN", "WR", "PS"}) {
        if (value.startsWith(start)) {
            return true;
        }
    }
    return false;
}

// =============================================================================//
// Conditions
// =============================================================================//

bool conditionC0(const Input& value, int32_t index) {
    if (value.contains(index, 4, {"CHIA"})) {
        return true;
    }
    if (index <= 1) {
        return false;
    }
    if (isVowel(value.charAt(index - 2))) {
        return false;
    }
    if (!value.contains(index - 1, 3, {"ACH"})) {
        return false;
    }
    UChar c = value.charAt(index + 2);
    return (c != 'I' && c != 'E') || value.contains(index - 2, 6, {"BACHER", "MACHER"});
}

bool conditionCH0(const Input& value, int32_t index) {
    if (index != 0) {
        return false;
    }
    if (!value.contains(index + 1, 5, {"HARAC", "HARIS"}) &&
        !value.contains(index + 1, 3, {"HOR", "HYM", "HIA", "HEM"})) {
        return false;
    }
    return !value.contains(0, 5, {"CHORE"});
}

bool conditionCH1(const Input& value, int32_t index) {
    return value.contains(0, 4, {"VAN ", "VON "}) || value.contains(0, 3, {"SCH"}) ||
           value.contains(index - 2, 6, {"ORCHES", "ARCHIT", "ORCHID"}) ||
           value.contains(index + 2, 1, {"T", "S"}) ||
           ((value.contains(index - 1, 1, {"A", "O", "U", "E"}) || index == 0) &&
            (value.contains(index + 2, 1, {"L", "R", "N", "M", "B", "H", "F", "V", "W", " "}) ||
             index + 1 == value.length() - 1));
}

bool conditionL0(const Input& value, int32_t index) {
    if (index == value.length() - 3 && value.contains(index - 1, 4, {"ILLO", "ILLA", "ALLE"})) {
        return true;
    }
    return (value.contains(value.length() - 2, 2, {"AS", "OS"}) ||
            value.contains(value.length() - 1, 1, {"A", "O"})) &&
           value.contains(index - 1, 4, {"ALLE"});
}

bool conditionM0(const Input& value, int32_t index) {
    if (value.charAt(index + 1) == 'M') {
        return true;
    }
    return value.contains(index - 1, 3, {"UMB"}) &&
           (index + 1 == value.length() - 1 || value.contains(index + 2, 2, {"ER"}));
}

// =============================================================================//
// Letter Handlers
// =============================================================================//
// Each handler appends the codes for the letter at @p index and returns
// the index of the next letter to look at.

int32_t handleAEIOUY(DoubleMetaphoneResult& result, int32_t index) {
    if (index == 0) {
        result.append('A');
    }
    return index + 1;
}

int32_t handleCC(const Input& value, DoubleMetaphoneResult& result, int32_t index) {
    if (value.contains(index + 2, 1, {"I", "E", "H"}) && !value.contains(index + 2, 2, {"HU"})) {
        // "bellocchio" but not "bacchus"
        if ((index == 1 && value.charAt(index - 1) == 'A') ||
            value.contains(index - 1, 5, {"UCCEE", "UCCES"})) {
            // "accident", "accede", "succeed"
            result.append("KS");
        } else {
            // "bacci", "bertucci"
            result.append('X');
        }
        return index + 3;
    }
    // Pierce's rule
    result.append('K');
    return index + 2;
}

int32_t handleCH(const Input& value, DoubleMetaphoneResult& result, int32_t index) {
    if (index > 0 && value.contains(index, 4, {"CHAE"})) {
        // Michael
        result.append('K', 'X');
        return index + 2;
    }
    if (conditionCH0(value, index)) {
        // Greek roots: "chemistry", "chorus"
        result.append('K');
        return index + 2;
    }
    if (conditionCH1(value, index)) {
        // Germanic, Greek, or otherwise 'ch' for 'kh' sound
        result.append('K');
        return index + 2;
    }
    if (index > 0) {
        if (value.contains(0, 2, {"MC"})) {
            result.append('K');
        } else {
            result.append('X', 'K');
        }
    } else {
        result.append('X');
    }
    return index + 2;
}

int32_t handleC(const Input& value, DoubleMetaphoneResult& result, int32_t index) {
    if (conditionC0(value, index)) {
        result.append('K');
        return index + 2;
    }
    if (index == 0 && value.contains(index, 6, {"CAESAR"})) {
        result.append('S');
        return index + 2;
    }
    if (value.contains(index, 2, {"CH"})) {
        return handleCH(value, result, index);
    }
    if (value.contains(index, 2, {"CZ"}) && !value.contains(index - 2, 4, {"WICZ"})) {
        // "Czerny"
        result.append('S', 'X');
        return index + 2;
    }
    if (value.contains(index + 1, 3, {"CIA"})) {
        // "focaccia"
        result.append('X');
        return index + 3;
    }
    if (value.contains(index, 2, {"CC"}) && !(index == 1 && value.charAt(0) == 'M')) {
        // Double "cc" but not "McClelland"
        return handleCC(value, result, index);
    }
    if (value.contains(index, 2, {"CK", "CG", "CQ"})) {
        result.append('K');
        return index + 2;
    }
    if (value.contains(index, 2, {"CI", "CE", "CY"})) {
        // Italian vs. English
        if (value.contains(index, 3, {"CIO", "CIE", "CIA"})) {
            result.append('S', 'X');
        } else {
            result.append('S');
        }
        return index + 2;
    }

    result.append('K');
    if (value.contains(index + 1, 2, {" C", " Q", " G"})) {
        // Mac Caffrey, Mac Gregor
        return index + 3;
    }
    if (value.contains(index + 1, 1, {"C", "K", "Q"}) && !value.contains(index + 1, 2, {"CE", "CI"})) {
        return index + 2;
    }
    return index + 1;
}

int32_t handleD(const Input& value, DoubleMetaphoneResult& result, int32_t index) {
    if (value.contains(index, 2, {"DG"})) {
        if (value.contains(index + 2, 1, {"I", "E", "Y"})) {
            // "edge"
            result.append('J');
            return index + 3;
        }
        // "Edgar"
        result.append("TK");
        return index + 2;
    }
    if (value.contains(index, 2, {"DT", "DD"})) {
        result.append('T');
        return index + 2;
    }
    result.append('T');
    return index + 1;
}

int32_t handleGH(const Input& value, DoubleMetaphoneResult& result, int32_t index) {
    if (index > 0 && !isVowel(value.charAt(index - 1))) {
        result.append('K');
        return index + 2;
    }
    if (index == 0) {
        result.append(value.charAt(index + 2) == 'I' ? 'J' : 'K');
        return index + 2;
    }
    if ((index > 1 && value.contains(index - 2, 1, {"B", "H", "D"})) ||
        (index > 2 && value.contains(index - 3, 1, {"B", "H", "D"})) ||
        (index > 3 && value.contains(index - 4, 1, {"B", "H"}))) {
        // Parker's rule: "hugh"
        return index + 2;
    }
    if (index > 2 && value.charAt(index - 1) == 'U' &&
        value.contains(index - 3, 1, {"C", "G", "L", "R", "T"})) {
        // "laugh", "McLaughlin", "cough", "gough", "rough", "tough"
        result.append('F');
    } else if (index > 0 && value.charAt(index - 1) != 'I') {
        result.append('K');
    }
    return index + 2;
}

int32_t handleG(const Input& value, DoubleMetaphoneResult& result, int32_t index, bool slavoGermanic) {
    if (value.charAt(index + 1) == 'H') {
        return handleGH(value, result, index);
    }
    if (value.charAt(index + 1) == 'N') {
        if (index == 1 && isVowel(value.charAt(0)) && !slavoGermanic) {
            result.append("KN", "N");
        } else if (!value.contains(index + 2, 2, {"EY"}) && value.charAt(index + 1) != 'Y' && !slavoGermanic) {
            result.append("N", "KN");
        } else {
            result.append("KN");
        }
        return index + 2;
    }
    if (value.contains(index + 1, 2, {"LI"}) && !slavoGermanic) {
        result.append("KL", "L");
        return index + 2;
    }
    if (index == 0 && (value.charAt(index + 1) == 'Y' ||
                       value.contains(index + 1, 2, {"ES", "EP", "EB", "EL", "EY", "IB", "IL", "IN", "IE", "EI", "ER"}))) {
        // -ges-, -gep-, -gel-, -gie- at the start
        result.append('K', 'J');
        return index + 2;
    }
    if ((value.contains(index + 1, 2, {"ER"}) || value.charAt(index + 1) == 'Y') &&
        !value.contains(0, 6, {"DANGER", "RANGER", "MANGER"}) &&
        !value.contains(index - 1, 1, {"E", "I"}) &&
        !value.contains(index - 1, 3, {"RGY", "OGY"})) {
        // -ger-, -gy-
        result.append('K', 'J');
        return index + 2;
    }
    if (value.contains(index + 1, 1, {"E", "I", "Y"}) || value.contains(index - 1, 4, {"AGGI", "OGGI"})) {
        // Italian "biaggi"
        if (value.contains(0, 4, {"VAN ", "VON "}) || value.contains(0, 3, {"SCH"}) ||
            value.contains(index + 1, 2, {"ET"})) {
            // Germanic
            result.append('K');
        } else if (value.contains(index + 1, 3, {"IER"})) {
            result.append('J');
        } else {
            result.append('J', 'K');
        }
        return index + 2;
    }
    if (value.charAt(index + 1) == 'G') {
        result.append('K');
        return index + 2;
    }
    result.append('K');
    return index + 1;
}

int32_t handleH(const Input& value, DoubleMetaphoneResult& result, int32_t index) {
    // Kept only first or between vowels; also covers "HH".
    if ((index == 0 || isVowel(value.charAt(index - 1))) && isVowel(value.charAt(index + 1))) {
        result.append('H');
        return index + 2;
    }
    return index + 1;
}

int32_t handleJ(const Input& value, DoubleMetaphoneResult& result, int32_t index, bool slavoGermanic) {
    if (value.contains(index, 4, {"JOSE"}) || value.contains(0, 4, {"SAN "})) {
        // Spanish: "Jose", "San Jacinto"
        if ((index == 0 && value.charAt(index + 4) == ' ') || value.length() == 4 ||
            value.contains(0, 4, {"SAN "})) {
            result.append('H');
        } else {
            result.append('J', 'H');
        }
        return index + 1;
    }

    if (index == 0 && !value.contains(index, 4, {"JOSE"})) {
        result.append('J', 'A');
    } else if (isVowel(value.charAt(index - 1)) && !slavoGermanic &&
               (value.charAt(index + 1) == 'A' || value.charAt(index + 1) == 'O')) {
        result.append('J', 'H');
    } else if (index == value.length() - 1) {
        result.append('J', ' ');
    } else if (!value.contains(index + 1, 1, {"L", "T", "K", "S", "N", "M", "B", "Z"}) &&
               !value.contains(index - 1, 1, {"S", "K", "L"})) {
        result.append('J');
    }
    return value.charAt(index + 1) == 'J' ? index + 2 : index + 1;
}

int32_t handleL(const Input& value, DoubleMetaphoneResult& result, int32_t index) {
    if (value.charAt(index + 1) == 'L') {
        if (conditionL0(value, index)) {
            result.appendPrimary('L');
        } else {
            result.append('L');
        }
        return index + 2;
    }
    result.append('L');
    return index + 1;
}

int32_t handleP(const Input& value, DoubleMetaphoneResult& result, int32_t index) {
    if (value.charAt(index + 1) == 'H') {
        result.append('F');
        return index + 2;
    }
    result.append('P');
    return value.contains(index + 1, 1, {"P", "B"}) ? index + 2 : index + 1;
}

int32_t handleR(const Input& value, DoubleMetaphoneResult& result, int32_t index, bool slavoGermanic) {
    if (index == value.length() - 1 && !slavoGermanic && value.contains(index - 2, 2, {"IE"}) &&
        !value.contains(index - 4, 2, {"ME", "MA"})) {
        // French "Rogier"
        result.appendAlternate('R');
    } else {
        result.append('R');
    }
    return value.charAt(index + 1) == 'R' ? index + 2 : index + 1;
}

int32_t handleSC(const Input& value, DoubleMetaphoneResult& result, int32_t index) {
    if (value.charAt(index + 2) == 'H') {
        // Schlesinger's rule
        if (value.contains(index + 3, 2, {"OO", "ER", "EN", "UY", "ED", "EM"})) {
            // Dutch origin: "school", "schooner"
            if (value.contains(index + 3, 2, {"ER", "EN"})) {
                // "schermerhorn", "schenker"
                result.append("X", "SK");
            } else {
                result.append("SK");
            }
        } else if (index == 0 && !isVowel(value.charAt(3)) && value.charAt(3) != 'W') {
            result.append('X', 'S');
        } else {
            result.append('X');
        }
    } else if (value.contains(index + 2, 1, {"I", "E", "Y"})) {
        result.append('S');
    } else {
        result.append("SK");
    }
    return index + 3;
}

int32_t handleS(const Input& value, DoubleMetaphoneResult& result, int32_t index, bool slavoGermanic) {
    if (value.contains(index - 1, 3, {"ISL", "YSL"})) {
        // "island", "isle", "carlisle", "carlysle"
        return index + 1;
    }
    if (index == 0 && value.contains(index, 5, {"SUGAR"})) {
        result.append('X', 'S');
        return index + 1;
    }
    if (value.contains(index, 2, {"SH"})) {
        if (value.contains(index + 1, 4, {"HEIM", "HOEK", "HOLM", "HOLZ"})) {
            // Germanic
            result.append('S');
        } else {
            result.append('X');
        }
        return index + 2;
    }
    if (value.contains(index, 3, {"SIO", "SIA"}) || value.contains(index, 4, {"SIAN"})) {
        // Italian and Armenian
        if (slavoGermanic) {
            result.append('S');
        } else {
            result.append('S', 'X');
        }
        return index + 3;
    }
    if ((index == 0 && value.contains(index + 1, 1, {"M", "N", "L", "W"})) ||
        value.contains(index + 1, 1, {"Z"})) {
        // "smith" matches "schmidt", "snider" matches "schneider"; Slavic -sz-
        result.append('S', 'X');
        return value.contains(index + 1, 1, {"Z"}) ? index + 2 : index + 1;
    }
    if (value.contains(index, 2, {"SC"})) {
        return handleSC(value, result, index);
    }

    if (index == value.length() - 1 && value.contains(index - 2, 2, {"AI", "OI"})) {
        // French "resnais", "artois"
        result.appendAlternate('S');
    } else {
        result.append('S');
    }
    return value.contains(index + 1, 1, {"S", "Z"}) ? index + 2 : index + 1;
}

int32_t handleT(const Input& value, DoubleMetaphoneResult& result, int32_t index) {
    if (value.contains(index, 4, {"TION"})) {
        result.append('X');
        return index + 3;
    }
    if (value.contains(index, 3, {"TIA", "TCH"})) {
        result.append('X');
        return index + 3;
    }
    if (value.contains(index, 2, {"TH"}) || value.contains(index, 3, {"TTH"})) {
        if (value.contains(index + 2, 2, {"OM", "AM"}) ||
            value.contains(0, 4, {"VAN ", "VON "}) || value.contains(0, 3, {"SCH"})) {
            // "thomas", "thames" or Germanic
            result.append('T');
        } else {
            result.append('0', 'T');
        }
        return index + 2;
    }
    result.append('T');
    return value.contains(index + 1, 1, {"T", "D"}) ? index + 2 : index + 1;
}

int32_t handleW(const Input& value, DoubleMetaphoneResult& result, int32_t index) {
    if (value.contains(index, 2, {"WR"})) {
        result.append('R');
        return index + 2;
    }
    if (index == 0 && (isVowel(value.charAt(index + 1)) || value.contains(index, 2, {"WH"}))) {
        if (isVowel(value.charAt(index + 1))) {
            // "Wasserman" matches "Vasserman"
            result.append('A', 'F');
        } else {
            // "Uomo" matches "Womo"
            result.append('A');
        }
        return index + 1;
    }
    if ((index == value.length() - 1 && isVowel(value.charAt(index - 1))) ||
        value.contains(index - 1, 5, {"EWSKI", "EWSKY", "OWSKI", "OWSKY"}) ||
        value.contains(0, 3, {"SCH"})) {
        // "Arnow" matches "Arnoff"
        result.appendAlternate('F');
        return index + 1;
    }
    if (value.contains(index, 4, {"WICZ", "WITZ"})) {
        // Polish "filipowicz"
        result.append("TS", "FX");
        return index + 4;
    }
    return index + 1;
}

int32_t handleX(const Input& value, DoubleMetaphoneResult& result, int32_t index) {
    if (index == 0) {
        result.append('S');
        return index + 1;
    }
    if (!(index == value.length() - 1 &&
          (value.contains(index - 3, 3, {"IAU", "EAU"}) || value.contains(index - 2, 2, {"AU", "OU"})))) {
        // Silent in French "breaux"
        result.append("KS");
    }
    return value.contains(index + 1, 1, {"C", "X"}) ? index + 2 : index + 1;
}

int32_t handleZ(const Input& value, DoubleMetaphoneResult& result, int32_t index, bool slavoGermanic) {
    if (value.charAt(index + 1) == 'H') {
        // Chinese pinyin "zhao"
        result.append('J');
        return index + 2;
    }
    if (value.contains(index + 1, 2, {"ZO", "ZI", "ZA"}) ||
        (slavoGermanic && index > 0 && value.charAt(index - 1) != 'T')) {
        result.append("S", "TS");
    } else {
        result.append('S');
    }
    return value.charAt(index + 1) == 'Z' ? index + 2 : index + 1;
}

// Appends the code of a letter that may be doubled.
int32_t handleSingle(const Input& value, DoubleMetaphoneResult& result, int32_t index,
                     char code, UChar letter) {
    result.append(code);
    return value.charAt(index + 1) == letter ? index + 2 : index + 1;
}

} // namespace

// =============================================================================//
// DoubleMetaphone Implementation
// =============================================================================//

DoubleMetaphone::DoubleMetaphone(int maxCodeLength) : maxCodeLength_(maxCodeLength) {}

std::string DoubleMetaphone::encode(const std::string& value) const {
    return doubleMetaphone(value, false);
}

std::string DoubleMetaphone::encodeAlternate(const std::string& value) const {
    return doubleMetaphone(value, true);
}

bool DoubleMetaphone::isDoubleMetaphoneEqual(const std::string& first, const std::string& second,
                                             bool alternate) const {
    return doubleMetaphone(first, alternate) == doubleMetaphone(second, alternate);
}

std::string DoubleMetaphone::doubleMetaphone(const std::string& text, bool alternate) const {
    icu::UnicodeString cleaned = detail::toUnicode(text);
    cleaned.trim();
    if (cleaned.isEmpty()) {
        return "";
    }
    cleaned.toUpper(icu::Locale::getEnglish());

    const Input value(cleaned);
    const bool slavoGermanic = isSlavoGermanic(value);
    int32_t index = isSilentStart(value) ? 1 : 0;
    DoubleMetaphoneResult result(maxCodeLength_);

    while (!result.isComplete() && index <= value.length() - 1) {
        switch (value.charAt(index)) {
            case 'A': case 'E': case 'I': case 'O': case 'U': case 'Y':
                index = handleAEIOUY(result, index);
                break;
            case 'B':
                index = handleSingle(value, result, index, 'P', 'B');
                break;
            case C_CEDILLA:
                result.append('S');
                index++;
                break;
            case 'C':
                index = handleC(value, result, index);
                break;
            case 'D':
                index = handleD(value, result, index);
                break;
            case 'F':
                index = handleSingle(value, result, index, 'F', 'F');
                break;
            case 'G':
                index = handleG(value, result, index, slavoGermanic);
                break;
            case 'H':
                index = handleH(value, result, index);
                break;
            case 'J':
                index = handleJ(value, result, index, slavoGermanic);
                break;
            case 'K':
                index = handleSingle(value, result, index, 'K', 'K');
                break;
            case 'L':
                index = handleL(value, result, index);
                break;
            case 'M':
                result.append('M');
                index = conditionM0(value, index) ? index + 2 : index + 1;
                break;
            case 'N':
                index = handleSingle(value, result, index, 'N', 'N');
                break;
            case N_TILDE:
                result.append('N');
                index++;
                break;
            case 'P':
                index = handleP(value, result, index);
                break;
            case 'Q':
                index = handleSingle(value, result, index, 'K', 'Q');
                break;
            case 'R':
                index = handleR(value, result, index, slavoGermanic);
                break;
            case 'S':
                index = handleS(value, result, index, slavoGermanic);
                break;
            case 'T':
                index = handleT(value, result, index);
                break;
            case 'V':
                index = handleSingle(value, result, index, 'F', 'V');
                break;
            case 'W':
                index = handleW(value, result, index);
                break;
            case 'X':
                index = handleX(value, result, index);
                break;
            case 'Z':
                index = handleZ(value, result, index, slavoGermanic);
                break;
            default:
                index++;
                break;
        }
    }
    return alternate ? result.alternate() : result.primary();
}

} // namespace phonetika
