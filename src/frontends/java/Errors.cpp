//===----------------------------------------------------------------------===//
//
// Part of the Javelin project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Errors.cpp
/// @brief Message formatting for lexer and parser exceptions.
///
//===----------------------------------------------------------------------===//

#include "frontends/java/Errors.hpp"

#include <utility>

namespace javelin::frontends::java
{

namespace
{

std::string formatLexError(const std::string &message,
                           const std::string &character,
                           const support::SourceLoc &loc,
                           const std::string &lineText)
{
    return message + " at \"" + character + "\", line " + std::to_string(loc.line) + ": " +
           lineText;
}

} // namespace

LexError::LexError(std::string message,
                   std::string character,
                   support::SourceLoc loc,
                   std::string lineText)
    : std::runtime_error(formatLexError(message, character, loc, lineText)),
      message_(std::move(message)), character_(std::move(character)), loc_(loc),
      lineText_(std::move(lineText))
{
}

SyntaxError::SyntaxError(std::string detail, Token at)
    : std::runtime_error(std::move(detail)), token_(std::move(at))
{
}

std::string SyntaxError::describe() const
{
    return std::string(what()) + " at " + token_.describe();
}

} // namespace javelin::frontends::java
