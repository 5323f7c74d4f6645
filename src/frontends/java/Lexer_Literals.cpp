//===----------------------------------------------------------------------===//
//
// Part of the Javelin project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Lexer_Literals.cpp
/// @brief Numeric, character, string and text block literals.
///
/// @details Numeric tokens keep their exact spelling, underscores and
/// suffixes included. String and character tokens carry the decoded value
/// in Token::text. Text blocks go through line-terminator normalization and
/// incidental indentation stripping before their escapes are decoded.
///
//===----------------------------------------------------------------------===//

#include "frontends/common/CharUtils.hpp"
#include "frontends/common/Unicode.hpp"
#include "frontends/java/Lexer.hpp"

#include <algorithm>
#include <limits>
#include <vector>

namespace javelin::frontends::java
{

namespace
{

namespace char_utils = common::char_utils;

bool isDecimalDigitChar(char c)
{
    return char_utils::isDigit(c);
}

bool isHexDigitChar(char c)
{
    return char_utils::isHexDigit(c);
}

bool isOctalDigitChar(char c)
{
    return char_utils::isOctalDigit(c);
}

bool isBinaryDigitChar(char c)
{
    return char_utils::isBinaryDigit(c);
}

bool isFloatSuffix(char c)
{
    return c == 'f' || c == 'F' || c == 'd' || c == 'D';
}

bool isBlank(std::string_view line)
{
    return std::all_of(line.begin(), line.end(), char_utils::isHorizontalWhitespace);
}

std::size_t leadingWhitespace(std::string_view line)
{
    std::size_t n = 0;
    while (n < line.size() && char_utils::isHorizontalWhitespace(line[n]))
        ++n;
    return n;
}

std::string_view rstrip(std::string_view line)
{
    while (!line.empty() && char_utils::isHorizontalWhitespace(line.back()))
        line.remove_suffix(1);
    return line;
}

} // namespace

//===----------------------------------------------------------------------===//
// Numbers
//===----------------------------------------------------------------------===//

bool Lexer::readDigits(bool (*isDigit)(char))
{
    bool any = false;
    while (!eof())
    {
        if (isDigit(peek()))
        {
            get();
            any = true;
            continue;
        }
        if (peek() != '_')
            break;

        // Underscores only count when another digit follows them.
        std::size_t ahead = 1;
        while (peek(ahead) == '_')
            ++ahead;
        if (!isDigit(peek(ahead)))
            break;
        advance(ahead);
    }
    return any;
}

void Lexer::readLongSuffix()
{
    if (peek() == 'l' || peek() == 'L')
        get();
}

void Lexer::lexNumber(Token &tok)
{
    const char next = peek(1);
    if (peek() == '0' && (next == 'x' || next == 'X'))
    {
        lexHexNumber(tok);
        return;
    }

    if (peek() == '0' && (next == 'b' || next == 'B'))
    {
        advance(2);
        readDigits(isBinaryDigitChar);
        readLongSuffix();
        tok.kind = TokenKind::BinaryInteger;
        return;
    }

    if (peek() == '0' && (char_utils::isOctalDigit(next) || next == '_'))
    {
        // A leading zero still introduces a decimal float such as 01.5.
        std::size_t ahead = 1;
        while (char_utils::isDigit(peek(ahead)) || peek(ahead) == '_')
            ++ahead;
        const char after = peek(ahead);
        if (after != '.' && after != 'e' && after != 'E' && !isFloatSuffix(after))
        {
            get();
            readDigits(isOctalDigitChar);
            readLongSuffix();
            tok.kind = TokenKind::OctalInteger;
            return;
        }
    }

    lexDecimalNumber(tok);
}

void Lexer::lexHexNumber(Token &tok)
{
    advance(2);
    readDigits(isHexDigitChar);

    const char c = peek();
    if (c != '.' && c != 'p' && c != 'P')
    {
        readLongSuffix();
        tok.kind = TokenKind::HexInteger;
        return;
    }

    tok.kind = TokenKind::HexFloatingPoint;
    if (peek() == '.')
    {
        get();
        readDigits(isHexDigitChar);
    }

    if (peek() != 'p' && peek() != 'P')
    {
        error("Invalid hex float literal", position(), currentLoc());
        return;
    }
    get();
    if (peek() == '+' || peek() == '-')
        get();
    readDigits(isDecimalDigitChar);
    if (isFloatSuffix(peek()))
        get();
}

void Lexer::lexDecimalNumber(Token &tok)
{
    bool isFloat = false;
    readDigits(isDecimalDigitChar);

    if (peek() == 'l' || peek() == 'L')
    {
        get();
        tok.kind = TokenKind::DecimalInteger;
        return;
    }

    if (peek() == '.')
    {
        get();
        readDigits(isDecimalDigitChar);
        isFloat = true;
    }

    if (peek() == 'e' || peek() == 'E')
    {
        get();
        if (peek() == '+' || peek() == '-')
            get();
        readDigits(isDecimalDigitChar);
        isFloat = true;
    }

    if (isFloatSuffix(peek()))
    {
        get();
        isFloat = true;
    }

    tok.kind = isFloat ? TokenKind::DecimalFloatingPoint : TokenKind::DecimalInteger;
}

//===----------------------------------------------------------------------===//
// Strings and characters
//===----------------------------------------------------------------------===//

void Lexer::lexCharOrString(Token &tok)
{
    if (startsWith("\"\"\""))
    {
        lexTextBlock(tok);
        return;
    }

    const std::size_t start = position();
    const char delim = get();
    tok.kind = delim == '"' ? TokenKind::String : TokenKind::Character;

    const std::size_t bodyStart = position();
    std::size_t bodyEnd = source_.size();
    bool terminated = false;
    while (!eof())
    {
        const char c = peek();
        if (c == '\\')
        {
            get();
            if (!eof())
                get();
            continue;
        }
        if (c == delim)
        {
            bodyEnd = position();
            get();
            terminated = true;
            break;
        }
        get();
    }

    const std::string_view body = std::string_view(source_).substr(bodyStart, bodyEnd - bodyStart);
    tok.text = decodeEscapes(body, bodyStart, false);
    if (!terminated)
        error("Unterminated character/string literal", start, tok.loc);
}

void Lexer::lexTextBlock(Token &tok)
{
    tok.kind = TokenKind::String;
    const std::size_t start = position();
    advance(3);

    const std::size_t contentStart = position();
    std::size_t contentEnd = source_.size();
    bool terminated = false;
    while (!eof())
    {
        if (peek() == '\\')
        {
            get();
            if (!eof())
                get();
            continue;
        }
        if (startsWith("\"\"\""))
        {
            contentEnd = position();
            advance(3);
            terminated = true;
            break;
        }
        get();
    }

    const std::string_view raw =
        std::string_view(source_).substr(contentStart, contentEnd - contentStart);
    tok.text = decodeEscapes(stripIndentation(raw), start, true);
    if (!terminated)
        error("Unterminated text block", start, tok.loc);
}

std::string Lexer::stripIndentation(std::string_view raw)
{
    std::string normalized;
    normalized.reserve(raw.size());
    for (std::size_t i = 0; i < raw.size(); ++i)
    {
        if (raw[i] == '\r')
        {
            normalized.push_back('\n');
            if (i + 1 < raw.size() && raw[i + 1] == '\n')
                ++i;
            continue;
        }
        normalized.push_back(raw[i]);
    }

    std::vector<std::string_view> lines;
    std::string_view rest(normalized);
    while (true)
    {
        const std::size_t nl = rest.find('\n');
        if (nl == std::string_view::npos)
        {
            lines.push_back(rest);
            break;
        }
        lines.push_back(rest.substr(0, nl));
        rest.remove_prefix(nl + 1);
    }

    // Content begins on the line after the opening delimiter.
    if (lines.size() > 1 && isBlank(lines.front()))
        lines.erase(lines.begin());

    std::size_t indent = std::numeric_limits<std::size_t>::max();
    for (std::string_view line : lines)
    {
        if (!isBlank(line))
            indent = std::min(indent, leadingWhitespace(line));
    }
    if (indent == std::numeric_limits<std::size_t>::max())
        indent = 0;

    std::string out;
    out.reserve(normalized.size());
    for (std::size_t i = 0; i < lines.size(); ++i)
    {
        if (i > 0)
            out.push_back('\n');
        if (!isBlank(lines[i]))
            out.append(rstrip(lines[i].substr(indent)));
    }
    return out;
}

std::string Lexer::decodeEscapes(std::string_view body, std::size_t bodyOffset, bool textBlock)
{
    std::string out;
    out.reserve(body.size());

    std::size_t i = 0;
    while (i < body.size())
    {
        const char c = body[i];
        if (c != '\\' || i + 1 >= body.size())
        {
            out.push_back(c);
            ++i;
            continue;
        }

        const char e = body[i + 1];
        switch (e)
        {
            case 'b':
                out.push_back('\b');
                break;
            case 't':
                out.push_back('\t');
                break;
            case 'n':
                out.push_back('\n');
                break;
            case 'f':
                out.push_back('\f');
                break;
            case 'r':
                out.push_back('\r');
                break;
            case 's':
                out.push_back(' ');
                break;
            case '"':
            case '\'':
            case '\\':
                out.push_back(e);
                break;
            case 'u':
                // Left over from a malformed escape the pre-pass reported.
                out.append("\\u");
                break;
            case '\n':
                if (textBlock)
                    break;
                [[fallthrough]];
            default:
                if (char_utils::isOctalDigit(e))
                {
                    const std::size_t maxDigits = e <= '3' ? 3 : 2;
                    char32_t value = 0;
                    std::size_t n = 0;
                    while (n < maxDigits && i + 1 + n < body.size() &&
                           char_utils::isOctalDigit(body[i + 1 + n]))
                    {
                        value = value * 8 + static_cast<char32_t>(body[i + 1 + n] - '0');
                        ++n;
                    }
                    common::unicode::appendUtf8(value, out);
                    i += 1 + n;
                    continue;
                }
                error("Illegal escape character", textBlock ? bodyOffset : bodyOffset + i + 1);
                out.push_back('\\');
                out.push_back(e);
                break;
        }
        i += 2;
    }
    return out;
}

} // namespace javelin::frontends::java
