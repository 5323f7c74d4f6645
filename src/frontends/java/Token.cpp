//===----------------------------------------------------------------------===//
//
// Part of the Javelin project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Token.cpp
/// @brief Token kind names, kind hierarchy and token descriptions.
///
//===----------------------------------------------------------------------===//

#include "frontends/java/Token.hpp"

namespace javelin::frontends::java
{

const char *tokenKindToString(TokenKind kind)
{
    switch (kind)
    {
        case TokenKind::EndOfInput:
            return "EndOfInput";
        case TokenKind::Identifier:
            return "Identifier";
        case TokenKind::Keyword:
            return "Keyword";
        case TokenKind::Modifier:
            return "Modifier";
        case TokenKind::BasicType:
            return "BasicType";
        case TokenKind::Literal:
            return "Literal";
        case TokenKind::Integer:
            return "Integer";
        case TokenKind::DecimalInteger:
            return "DecimalInteger";
        case TokenKind::OctalInteger:
            return "OctalInteger";
        case TokenKind::BinaryInteger:
            return "BinaryInteger";
        case TokenKind::HexInteger:
            return "HexInteger";
        case TokenKind::FloatingPoint:
            return "FloatingPoint";
        case TokenKind::DecimalFloatingPoint:
            return "DecimalFloatingPoint";
        case TokenKind::HexFloatingPoint:
            return "HexFloatingPoint";
        case TokenKind::Boolean:
            return "Boolean";
        case TokenKind::Character:
            return "Character";
        case TokenKind::String:
            return "String";
        case TokenKind::Null:
            return "Null";
        case TokenKind::Separator:
            return "Separator";
        case TokenKind::Operator:
            return "Operator";
        case TokenKind::Annotation:
            return "Annotation";
    }
    return "?";
}

bool tokenIsA(TokenKind actual, TokenKind expected)
{
    if (actual == expected)
        return true;

    switch (expected)
    {
        case TokenKind::Keyword:
            return actual == TokenKind::Modifier || actual == TokenKind::BasicType;
        case TokenKind::Integer:
            return actual == TokenKind::DecimalInteger || actual == TokenKind::OctalInteger ||
                   actual == TokenKind::BinaryInteger || actual == TokenKind::HexInteger;
        case TokenKind::FloatingPoint:
            return actual == TokenKind::DecimalFloatingPoint ||
                   actual == TokenKind::HexFloatingPoint;
        case TokenKind::Literal:
            return tokenIsA(actual, TokenKind::Integer) ||
                   tokenIsA(actual, TokenKind::FloatingPoint) || actual == TokenKind::Boolean ||
                   actual == TokenKind::Character || actual == TokenKind::String ||
                   actual == TokenKind::Null;
        default:
            return false;
    }
}

std::string Token::describe() const
{
    if (kind == TokenKind::EndOfInput)
        return "end of input";
    std::string out = tokenKindToString(kind);
    out += " \"";
    out += lexeme.empty() ? text : lexeme;
    out += "\" line ";
    out += std::to_string(loc.line);
    out += ", position ";
    out += std::to_string(loc.column);
    return out;
}

bool ExpectedToken::matches(const Token &tok) const
{
    if (const auto *value = std::get_if<std::string_view>(&alt_))
    {
        // String and character literals never match a punctuation request
        // even when their decoded text happens to be equal.
        if (tok.isEnd() || tok.isA(TokenKind::Literal))
            return tok.isA(TokenKind::Literal) && tok.lexeme == *value;
        return tok.text == *value;
    }
    return tok.isA(std::get<TokenKind>(alt_));
}

std::string ExpectedToken::toString() const
{
    if (const auto *value = std::get_if<std::string_view>(&alt_))
        return "'" + std::string(*value) + "'";
    return tokenKindToString(std::get<TokenKind>(alt_));
}

} // namespace javelin::frontends::java
