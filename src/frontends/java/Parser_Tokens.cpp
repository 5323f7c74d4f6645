//===----------------------------------------------------------------------===//
//
// Part of the Javelin project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser_Tokens.cpp
/// @brief Token matching, error reporting and tracing for the Java parser.
///
//===----------------------------------------------------------------------===//

#include "frontends/java/Parser.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <iostream>

namespace javelin::frontends::java
{

Parser::Parser(TokenSource &tokens, ParseOptions options) : cursor_(tokens), options_(options)
{
    tracing_ = options_.trace || std::getenv("JAVELIN_DEBUG_PARSE") != nullptr;
}

//===----------------------------------------------------------------------===//
// Token Handling
//===----------------------------------------------------------------------===//

const Token &Parser::peek(std::size_t offset)
{
    return cursor_.peek(offset);
}

Token Parser::advance()
{
    return cursor_.advance();
}

bool Parser::atEnd()
{
    return peek().isEnd();
}

std::string Parser::acceptSequence(std::initializer_list<ExpectedToken> expected)
{
    if (expected.size() == 0)
        throw InternalUsageError("Missing acceptable values");

    std::string text;
    for (const ExpectedToken &alt : expected)
    {
        if (!alt.matches(peek()))
            illegal("Expected " + alt.toString());
        text = advance().text;
    }
    return text;
}

bool Parser::wouldAcceptSequence(std::initializer_list<ExpectedToken> expected)
{
    if (expected.size() == 0)
        throw InternalUsageError("Missing acceptable values");

    std::size_t i = 0;
    for (const ExpectedToken &alt : expected)
    {
        if (!alt.matches(peek(i++)))
            return false;
    }
    return true;
}

bool Parser::tryAcceptSequence(std::initializer_list<ExpectedToken> expected)
{
    if (!wouldAcceptSequence(expected))
        return false;
    for (std::size_t i = 0; i < expected.size(); ++i)
        advance();
    return true;
}

void Parser::illegal(const std::string &description)
{
    lastError_ = description;
    throw SyntaxError(description, peek());
}

bool Parser::isAnnotation(std::size_t offset)
{
    return peek(offset).is(TokenKind::Annotation) && peek(offset + 1).text != "interface";
}

bool Parser::isAnnotationDeclaration(std::size_t offset)
{
    return peek(offset).is(TokenKind::Annotation) && peek(offset + 1).text == "interface";
}

bool Parser::adjacent(std::size_t offset)
{
    const support::SourceLoc first = peek(offset).loc;
    const Token &second = peek(offset + 1);
    if (second.isEnd())
        return false;
    const auto width = static_cast<uint32_t>(peek(offset).lexeme.size());
    return second.loc.line == first.line && second.loc.column == first.column + width;
}

void Parser::expectEnd()
{
    ProcedureScope scope(*this, __func__);
    if (!atEnd())
        illegal("Expected end of input");
}

//===----------------------------------------------------------------------===//
// Tracing
//===----------------------------------------------------------------------===//

std::ostream &Parser::traceStream() const
{
    return options_.traceStream ? *options_.traceStream : std::cerr;
}

void Parser::traceBacktrack(const SyntaxError &error)
{
    traceStream() << "[javelin] " << std::string(depth_ * 2, ' ') << "backtrack: " << error.describe()
                  << "\n";
}

Parser::ProcedureScope::ProcedureScope(Parser &parser, const char *name) : parser_(parser), name_(name)
{
    if (parser_.depth_ >= parser_.options_.maxDepth)
    {
        parser_.lastError_ = "Nesting too deep";
        throw NestingLimitError("Nesting too deep", parser_.peek());
    }

    if (parser_.tracing_)
    {
        const Token &tok = parser_.peek();
        startText_ = tok.isEnd() ? "" : tok.lexeme;
        char depth[8];
        std::snprintf(depth, sizeof(depth), "%02u", parser_.depth_);
        parser_.traceStream() << "[javelin] " << depth << " " << std::string(parser_.depth_ + 1, '-') << "> "
                              << name_ << "(" << tok.describe() << ")\n";
        uncaught_ = std::uncaught_exceptions();
    }
    ++parser_.depth_;
}

Parser::ProcedureScope::~ProcedureScope()
{
    --parser_.depth_;
    if (!parser_.tracing_)
        return;

    const bool failed = std::uncaught_exceptions() > uncaught_;
    char depth[8];
    std::snprintf(depth, sizeof(depth), "%02u", parser_.depth_);
    std::ostream &os = parser_.traceStream();
    os << "[javelin] " << depth << " <" << std::string(parser_.depth_ + 1, '-') << " " << name_ << "("
       << startText_ << ", " << parser_.cursor_.last().describe() << ")";
    if (failed)
        os << " " << parser_.lastError_;
    os << "\n";
}

//===----------------------------------------------------------------------===//
// Identifiers
//===----------------------------------------------------------------------===//

std::string Parser::parseIdentifier()
{
    return accept(TokenKind::Identifier);
}

std::string Parser::parseQualifiedIdentifier()
{
    ProcedureScope scope(*this, __func__);
    std::string name = parseIdentifier();
    while (tryAccept("."))
        name += "." + parseIdentifier();
    return name;
}

std::vector<std::string> Parser::parseQualifiedIdentifierList()
{
    ProcedureScope scope(*this, __func__);
    std::vector<std::string> names;
    do
    {
        names.push_back(parseQualifiedIdentifier());
    } while (tryAccept(","));
    return names;
}

} // namespace javelin::frontends::java
