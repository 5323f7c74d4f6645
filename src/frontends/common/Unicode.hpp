//===----------------------------------------------------------------------===//
//
// Part of the Javelin project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/common/Unicode.hpp
// Purpose: UTF-8 transcoding and code-point classification for lexers.
//
// Key invariants:
//   - Invalid UTF-8 sequences decode to U+FFFD, one per offending byte.
//   - Classification tables are sorted, non-overlapping, inclusive ranges.
//   - The identifier tables cover the scripts in common use; code points in
//     blocks that are not listed classify as neither letter nor digit.
//
//===----------------------------------------------------------------------===//
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace javelin::frontends::common::unicode
{

/// @brief Replacement character emitted for undecodable input.
inline constexpr char32_t kReplacementChar = 0xFFFD;

/// @brief Decode one code point starting at @p pos and advance @p pos past it.
/// @details Overlong forms, truncated sequences and values above U+10FFFF
///          yield kReplacementChar and consume a single byte. Encoded
///          surrogates decode as-is; isValidUtf8 rejects them.
char32_t decodeUtf8At(std::string_view text, std::size_t &pos);

/// @brief Append the UTF-8 encoding of @p cp to @p out.
/// @details Lone surrogates are encoded as three-byte sequences so that
///          unpaired `\uD800` escapes survive a round trip.
void appendUtf8(char32_t cp, std::string &out);

/// @brief Check that @p text is well-formed UTF-8.
bool isValidUtf8(std::string_view text);

/// @brief Reinterpret ISO-8859-1 bytes as code points and encode them as UTF-8.
std::string latin1ToUtf8(std::string_view bytes);

/// @brief Unicode white space as recognised by the Java lexer.
bool isWhitespace(char32_t cp);

/// @brief Letters (L*) and letter numbers (Nl).
bool isLetter(char32_t cp);

/// @brief Decimal digit numbers (Nd).
bool isDecimalDigit(char32_t cp);

/// @brief Non-spacing and spacing combining marks (Mn, Mc).
bool isCombiningMark(char32_t cp);

/// @brief Currency symbols (Sc).
bool isCurrencySymbol(char32_t cp);

/// @brief Connector punctuation (Pc).
bool isConnectorPunctuation(char32_t cp);

/// @brief May @p cp begin a Java identifier?
bool isIdentifierStart(char32_t cp);

/// @brief May @p cp continue a Java identifier?
bool isIdentifierPart(char32_t cp);

} // namespace javelin::frontends::common::unicode
