//===----------------------------------------------------------------------===//
//
// Part of the Javelin project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/common/CharUtils.hpp
// Purpose: ASCII character classification helpers for lexers.
//
// Everything here works on single bytes. Code-point classification for
// identifiers outside ASCII lives in Unicode.hpp.
//
//===----------------------------------------------------------------------===//
#pragma once

namespace javelin::frontends::common::char_utils
{

/// @brief Check if character is an ASCII letter (A-Z, a-z).
[[nodiscard]] constexpr bool isLetter(char c) noexcept
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

/// @brief Check if character is a decimal digit (0-9).
[[nodiscard]] constexpr bool isDigit(char c) noexcept
{
    return c >= '0' && c <= '9';
}

/// @brief Check if character is a hex digit (0-9, A-F, a-f).
[[nodiscard]] constexpr bool isHexDigit(char c) noexcept
{
    return isDigit(c) || (c >= 'A' && c <= 'F') || (c >= 'a' && c <= 'f');
}

/// @brief Check if character is an octal digit (0-7).
[[nodiscard]] constexpr bool isOctalDigit(char c) noexcept
{
    return c >= '0' && c <= '7';
}

/// @brief Check if character is a binary digit (0-1).
[[nodiscard]] constexpr bool isBinaryDigit(char c) noexcept
{
    return c == '0' || c == '1';
}

/// @brief Check if the byte starts an ASCII Java identifier (letter, `_` or `$`).
[[nodiscard]] constexpr bool isIdentifierStart(char c) noexcept
{
    return isLetter(c) || c == '_' || c == '$';
}

/// @brief Check if the byte continues an ASCII Java identifier.
[[nodiscard]] constexpr bool isIdentifierContinue(char c) noexcept
{
    return isIdentifierStart(c) || isDigit(c);
}

/// @brief Check if character is ASCII whitespace, including the separator
///        controls 0x1C-0x1F.
[[nodiscard]] constexpr bool isWhitespace(char c) noexcept
{
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f' ||
           (c >= '\x1c' && c <= '\x1f');
}

/// @brief Check if character is horizontal whitespace (space, tab or form feed).
[[nodiscard]] constexpr bool isHorizontalWhitespace(char c) noexcept
{
    return c == ' ' || c == '\t' || c == '\f';
}

/// @brief Get the numeric value of a hex digit (0-15).
/// @return Value 0-15, or -1 if not a hex digit.
[[nodiscard]] constexpr int hexDigitValue(char c) noexcept
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    return -1;
}

} // namespace javelin::frontends::common::char_utils
