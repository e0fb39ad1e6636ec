/********************************************************************
 * phonetika_core.h  –  phonetika core header
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
#include <stdexcept>
#include <string>

namespace phonetika {

// =============================================================================//
// Standalone Functions
// =============================================================================//

/**
 * @brief Gets the version string of the libphonetika library.
 * @return A string in "MAJOR.MINOR.PATCH" format.
 */
std::string getPhonetikaVersion();

/// Verbosity levels of the library logger.
enum class LogLevel { Trace, Debug, Info, Warn, Error, Off };

/**
 * @brief Sets the level of the "phonetika" logger.
 *
 * The logger writes to stderr and defaults to Warn, so rule loading is
 * silent unless asked for.
 * @param level The new minimum level.
 */
void setPhonetikaLogLevel(LogLevel level);

// =============================================================================//
// Errors
// =============================================================================//

/// Failure categories reported while building rule tables.
enum class ErrorKind {
    UnknownNameType,
    ParseConfiguration,  ///< A resource could not be read.
    WrongFilename,       ///< A rule table or include target does not exist.
    WrongPhoneme,
    BadContextRegex,
    NotABoolean,
    BadRule
};

/**
 * @brief Exception thrown by every configuration and parse failure.
 *
 * Encoding never throws; only constructors that read rule data do.
 */
class PhonetikaError : public std::runtime_error {
public:
    PhonetikaError(ErrorKind kind, const std::string& message);

    /** @brief The failure category. */
    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// =============================================================================//
// Encoder Interface
// =============================================================================//
/**
 * @brief Common interface of every phonetic encoder.
 *
 * encode() is const: configure an encoder first, then share it freely
 * between threads.
 */
class Encoder {
public:
    virtual ~Encoder() = default;

    /**
     * @brief Encodes a word or a name.
     * @param value UTF-8 input.
     * @return The phonetic code; empty when nothing in the input is encodable.
     */
    virtual std::string encode(const std::string& value) const = 0;

    /**
     * @brief Tells whether two values sound alike.
     *
     * The default compares both encodings.
     */
    virtual bool isEncodedEquals(const std::string& first, const std::string& second) const;
};

/**
 * @brief Counts the characters found at the same position in both encodings.
 *
 * Meant for the Soundex family: 0 means no similarity, 4 is the best
 * Soundex score. Refined Soundex codes are longer and can score higher.
 * @return 0 if either encoding is empty.
 */
int soundexDifference(const Encoder& encoder, const std::string& first, const std::string& second);

} // namespace phonetika
