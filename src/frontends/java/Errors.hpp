//===----------------------------------------------------------------------===//
//
// Part of the Javelin project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Errors.hpp
/// @brief Exception types raised by the Java lexer and parser.
///
/// - LexError: malformed input at the character level.
/// - SyntaxError: token sequence does not fit the grammar; carries the
///   offending token (EndOfInput when input ran out).
/// - NestingLimitError: a SyntaxError that speculation never swallows.
/// - InternalUsageError: the parser was driven incorrectly (empty accept
///   list, unbalanced markers). Indicates a bug, not bad input.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/java/Token.hpp"
#include "support/source_location.hpp"

#include <stdexcept>
#include <string>

namespace javelin::frontends::java
{

/// @brief Character-level error reported by the lexer.
/// @details what() reads `<message> at "<char>", line <n>: <line text>`.
class LexError : public std::runtime_error
{
  public:
    LexError(std::string message,
             std::string character,
             support::SourceLoc loc,
             std::string lineText);

    /// @brief Bare message, e.g. "Unterminated block comment".
    const std::string &message() const noexcept
    {
        return message_;
    }

    /// @brief The offending character, UTF-8 encoded; empty at end of input.
    const std::string &character() const noexcept
    {
        return character_;
    }

    const support::SourceLoc &loc() const noexcept
    {
        return loc_;
    }

    /// @brief The source line containing the error, whitespace-trimmed.
    const std::string &lineText() const noexcept
    {
        return lineText_;
    }

  private:
    std::string message_;
    std::string character_;
    support::SourceLoc loc_;
    std::string lineText_;
};

/// @brief Grammar error reported by the parser.
/// @details what() is the bare description; describe() appends the token.
class SyntaxError : public std::runtime_error
{
  public:
    SyntaxError(std::string detail, Token at);

    /// @brief `<description> at <token description>`.
    std::string describe() const;

    /// @brief Token the parser was looking at when it gave up.
    const Token &token() const noexcept
    {
        return token_;
    }

    support::SourceLoc loc() const noexcept
    {
        return token_.loc;
    }

  private:
    Token token_;
};

/// @brief Raised when construct nesting exceeds ParseOptions::maxDepth.
class NestingLimitError : public SyntaxError
{
  public:
    using SyntaxError::SyntaxError;
};

/// @brief Misuse of the parser or cursor API.
class InternalUsageError : public std::logic_error
{
  public:
    using std::logic_error::logic_error;
};

} // namespace javelin::frontends::java
