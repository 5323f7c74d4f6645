//===----------------------------------------------------------------------===//
//
// Part of the Javelin project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Lexer.cpp
/// @brief Token dispatch, whitespace, comments, identifiers and operators.
///
/// @details Keywords and operators live in sorted tables searched by binary
/// lookup. At each position the scanner tries, in order: whitespace,
/// comments, `...`, `@`, a float starting with `.`, separators, string and
/// character literals, numbers, identifiers and finally operators, longest
/// first. Literal scanning lives in Lexer_Literals.cpp.
///
/// @see Lexer.hpp for the class interface
///
//===----------------------------------------------------------------------===//

#include "frontends/java/Lexer.hpp"

#include "frontends/common/CharUtils.hpp"
#include "frontends/common/KeywordTable.hpp"
#include "frontends/common/Unicode.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace javelin::frontends::java
{

namespace
{

using common::keyword_table::isKeywordTableSorted;
using common::keyword_table::KeywordEntry;
using common::keyword_table::lookupKeywordBinary;
namespace char_utils = common::char_utils;
namespace unicode = common::unicode;

constexpr std::array<KeywordEntry<TokenKind>, 53> kKeywordTable = {{
    {"abstract", TokenKind::Modifier},
    {"assert", TokenKind::Keyword},
    {"boolean", TokenKind::BasicType},
    {"break", TokenKind::Keyword},
    {"byte", TokenKind::BasicType},
    {"case", TokenKind::Keyword},
    {"catch", TokenKind::Keyword},
    {"char", TokenKind::BasicType},
    {"class", TokenKind::Keyword},
    {"const", TokenKind::Keyword},
    {"continue", TokenKind::Keyword},
    {"default", TokenKind::Modifier},
    {"do", TokenKind::Keyword},
    {"double", TokenKind::BasicType},
    {"else", TokenKind::Keyword},
    {"enum", TokenKind::Keyword},
    {"extends", TokenKind::Keyword},
    {"false", TokenKind::Boolean},
    {"final", TokenKind::Modifier},
    {"finally", TokenKind::Keyword},
    {"float", TokenKind::BasicType},
    {"for", TokenKind::Keyword},
    {"goto", TokenKind::Keyword},
    {"if", TokenKind::Keyword},
    {"implements", TokenKind::Keyword},
    {"import", TokenKind::Keyword},
    {"instanceof", TokenKind::Keyword},
    {"int", TokenKind::BasicType},
    {"interface", TokenKind::Keyword},
    {"long", TokenKind::BasicType},
    {"native", TokenKind::Modifier},
    {"new", TokenKind::Keyword},
    {"null", TokenKind::Null},
    {"package", TokenKind::Keyword},
    {"private", TokenKind::Modifier},
    {"protected", TokenKind::Modifier},
    {"public", TokenKind::Modifier},
    {"return", TokenKind::Keyword},
    {"short", TokenKind::BasicType},
    {"static", TokenKind::Modifier},
    {"strictfp", TokenKind::Modifier},
    {"super", TokenKind::Keyword},
    {"switch", TokenKind::Keyword},
    {"synchronized", TokenKind::Modifier},
    {"this", TokenKind::Keyword},
    {"throw", TokenKind::Keyword},
    {"throws", TokenKind::Keyword},
    {"transient", TokenKind::Modifier},
    {"true", TokenKind::Boolean},
    {"try", TokenKind::Keyword},
    {"void", TokenKind::Keyword},
    {"volatile", TokenKind::Modifier},
    {"while", TokenKind::Keyword},
}};

// There is deliberately no `>>` or `>>>`: the parser builds shifts out of
// adjacent `>` tokens so that nested generics close correctly.
constexpr std::array<KeywordEntry<TokenKind>, 38> kOperatorTable = {{
    {"!", TokenKind::Operator},   {"!=", TokenKind::Operator},  {"%", TokenKind::Operator},
    {"%=", TokenKind::Operator},  {"&", TokenKind::Operator},   {"&&", TokenKind::Operator},
    {"&=", TokenKind::Operator},  {"*", TokenKind::Operator},   {"*=", TokenKind::Operator},
    {"+", TokenKind::Operator},   {"++", TokenKind::Operator},  {"+=", TokenKind::Operator},
    {"-", TokenKind::Operator},   {"--", TokenKind::Operator},  {"-=", TokenKind::Operator},
    {"->", TokenKind::Operator},  {"...", TokenKind::Operator}, {"/", TokenKind::Operator},
    {"/=", TokenKind::Operator},  {":", TokenKind::Operator},   {"::", TokenKind::Operator},
    {"<", TokenKind::Operator},   {"<<", TokenKind::Operator},  {"<<=", TokenKind::Operator},
    {"<=", TokenKind::Operator},  {"=", TokenKind::Operator},   {"==", TokenKind::Operator},
    {">", TokenKind::Operator},   {">=", TokenKind::Operator},  {">>=", TokenKind::Operator},
    {">>>=", TokenKind::Operator}, {"?", TokenKind::Operator},  {"^", TokenKind::Operator},
    {"^=", TokenKind::Operator},  {"|", TokenKind::Operator},   {"|=", TokenKind::Operator},
    {"||", TokenKind::Operator},  {"~", TokenKind::Operator},
}};

static_assert(isKeywordTableSorted(kKeywordTable), "keyword table must be sorted");
static_assert(isKeywordTableSorted(kOperatorTable), "operator table must be sorted");

constexpr std::size_t kMaxOperatorLength = 4;

bool isSeparator(char c)
{
    switch (c)
    {
        case '(':
        case ')':
        case '{':
        case '}':
        case '[':
        case ']':
        case ';':
        case ',':
        case '.':
            return true;
        default:
            return false;
    }
}

bool isAscii(char c)
{
    return (static_cast<unsigned char>(c) & 0x80) == 0;
}

std::string_view trim(std::string_view s)
{
    while (!s.empty() && char_utils::isWhitespace(s.front()))
        s.remove_prefix(1);
    while (!s.empty() && char_utils::isWhitespace(s.back()))
        s.remove_suffix(1);
    return s;
}

} // namespace

//===----------------------------------------------------------------------===//
// Construction and error reporting
//===----------------------------------------------------------------------===//

Lexer::Lexer(std::string_view input, LexerOptions options)
    : LexerCursor<Lexer>(options.fileId), options_(options)
{
    if (input.substr(0, 3) == "\xEF\xBB\xBF")
        input.remove_prefix(3);

    if (unicode::isValidUtf8(input))
        source_.assign(input);
    else
        source_ = unicode::latin1ToUtf8(input);

    translateUnicodeEscapes();
}

support::SourceLoc Lexer::locationOf(std::size_t offset) const
{
    support::SourceLoc loc{fileId(), 1, 1};
    for (std::size_t i = 0; i < offset && i < source_.size(); ++i)
    {
        const char c = source_[i];
        if (c == '\n')
        {
            ++loc.line;
            loc.column = 1;
        }
        else if ((static_cast<unsigned char>(c) & 0xC0) != 0x80)
        {
            ++loc.column;
        }
    }
    return loc;
}

void Lexer::error(const std::string &message, std::size_t offset)
{
    error(message, offset, locationOf(offset));
}

void Lexer::error(const std::string &message, std::size_t offset, support::SourceLoc loc)
{
    std::string character;
    if (offset < source_.size())
    {
        std::size_t end = offset;
        unicode::decodeUtf8At(source_, end);
        character = source_.substr(offset, end - offset);
    }

    std::size_t lineStart = source_.rfind('\n', offset == 0 ? 0 : offset - 1);
    lineStart = (lineStart == std::string::npos || offset == 0) ? 0 : lineStart + 1;
    std::size_t lineEnd = source_.find('\n', offset);
    if (lineEnd == std::string::npos)
        lineEnd = source_.size();
    std::string_view lineView(source_);
    lineView = lineView.substr(lineStart, lineEnd - lineStart);

    LexError err(message, std::move(character), loc, std::string(trim(lineView)));
    if (!options_.ignoreErrors)
        throw err;
    errors_.push_back(std::move(err));
}

//===----------------------------------------------------------------------===//
// Token dispatch
//===----------------------------------------------------------------------===//

Token Lexer::next()
{
    while (true)
    {
        if (eof())
        {
            Token tok;
            tok.kind = TokenKind::EndOfInput;
            tok.loc = currentLoc();
            return tok;
        }

        if (skipWhitespace() || skipComment())
            continue;

        Token tok;
        tok.loc = currentLoc();
        const std::size_t start = position();
        const char c = peek();
        const char n = peek(1);

        if (startsWith("..."))
        {
            advance(3);
            tok.kind = TokenKind::Operator;
        }
        else if (c == '@')
        {
            get();
            tok.kind = TokenKind::Annotation;
        }
        else if (c == '.' && char_utils::isDigit(n))
        {
            lexDecimalNumber(tok);
        }
        else if (isSeparator(c))
        {
            get();
            tok.kind = TokenKind::Separator;
        }
        else if (c == '"' || c == '\'')
        {
            lexCharOrString(tok);
        }
        else if (char_utils::isDigit(c))
        {
            lexNumber(tok);
        }
        else if (char_utils::isIdentifierStart(c))
        {
            lexIdentifier(tok);
        }
        else if (!isAscii(c))
        {
            std::size_t probe = position();
            if (!unicode::isIdentifierStart(unicode::decodeUtf8At(source_, probe)))
            {
                error("Could not process token", start, tok.loc);
                advance(probe - position());
                continue;
            }
            lexIdentifier(tok);
        }
        else if (!tryOperator(tok))
        {
            error("Could not process token", start, tok.loc);
            get();
            continue;
        }

        tok.lexeme = source_.substr(start, position() - start);
        if (tok.kind != TokenKind::String && tok.kind != TokenKind::Character)
            tok.text = tok.lexeme;
        if (pendingJavadoc_)
        {
            tok.javadoc = std::move(pendingJavadoc_);
            pendingJavadoc_.reset();
        }
        return tok;
    }
}

bool Lexer::skipWhitespace()
{
    const char c = peek();
    if (char_utils::isWhitespace(c))
    {
        get();
        return true;
    }
    if (isAscii(c))
        return false;

    std::size_t probe = position();
    if (!unicode::isWhitespace(unicode::decodeUtf8At(source_, probe)))
        return false;
    advance(probe - position());
    return true;
}

bool Lexer::skipComment()
{
    if (peek() != '/')
        return false;

    if (peek(1) == '/')
    {
        common::lexer_base::skipToEndOfLine(*this);
        return true;
    }

    if (peek(1) != '*')
        return false;

    const std::size_t start = position();
    const support::SourceLoc startLoc = currentLoc();
    const std::size_t close = source_.find("*/", start + 2);
    if (close == std::string::npos)
    {
        error("Unterminated block comment", start, startLoc);
        advance(source_.size() - start);
        return true;
    }

    const std::string_view comment = std::string_view(source_).substr(start, close + 2 - start);
    if (comment.substr(0, 3) == "/**" && comment != "/**/")
        pendingJavadoc_ = std::string(comment);
    advance(comment.size());
    return true;
}

bool Lexer::tryOperator(Token &tok)
{
    const std::string_view rest = std::string_view(source_).substr(position());
    for (std::size_t len = std::min(kMaxOperatorLength, rest.size()); len > 0; --len)
    {
        if (auto kind = lookupKeywordBinary(kOperatorTable, rest.substr(0, len)))
        {
            tok.kind = *kind;
            advance(len);
            return true;
        }
    }
    return false;
}

void Lexer::lexIdentifier(Token &tok)
{
    const std::size_t start = position();
    while (!eof())
    {
        const char c = peek();
        if (isAscii(c))
        {
            if (!char_utils::isIdentifierContinue(c))
                break;
            get();
            continue;
        }
        std::size_t probe = position();
        if (!unicode::isIdentifierPart(unicode::decodeUtf8At(source_, probe)))
            break;
        advance(probe - position());
    }

    const std::string_view word = std::string_view(source_).substr(start, position() - start);
    tok.kind = lookupKeywordBinary(kKeywordTable, word).value_or(TokenKind::Identifier);
}

//===----------------------------------------------------------------------===//
// Batch interface
//===----------------------------------------------------------------------===//

std::vector<Token> tokenize(std::string_view input, LexerOptions options)
{
    Lexer lexer(input, options);
    std::vector<Token> tokens;
    for (Token tok = lexer.next(); !tok.isEnd(); tok = lexer.next())
        tokens.push_back(std::move(tok));
    return tokens;
}

} // namespace javelin::frontends::java
