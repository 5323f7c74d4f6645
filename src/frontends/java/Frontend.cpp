//===----------------------------------------------------------------------===//
//
// Part of the Javelin project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Frontend.cpp
/// @brief Lexer/parser orchestration and error conversion.
///
//===----------------------------------------------------------------------===//

#include "frontends/java/Frontend.hpp"

#include "frontends/java/Errors.hpp"
#include "frontends/java/Parser.hpp"

#include <cstdlib>
#include <iostream>
#include <optional>
#include <utility>

namespace javelin::frontends::java
{

namespace
{

support::Diag toDiag(const LexError &error)
{
    return support::makeError(error.loc(), error.what());
}

support::Diag toDiag(const SyntaxError &error)
{
    return support::makeError(error.loc(), error.describe());
}

void debugPhase(const char *phase)
{
    if (std::getenv("JAVELIN_DEBUG_PARSE"))
        std::cerr << "[javelin] " << phase << std::endl;
}

} // namespace

void dumpTokens(const std::vector<Token> &tokens, std::ostream &os)
{
    os << "=== Javelin Token Stream ===\n";
    for (const Token &tok : tokens)
    {
        os << tok.loc.line << ':' << tok.loc.column << '\t' << tokenKindToString(tok.kind) << "\t\""
           << tok.lexeme << '"';
        if (tok.text != tok.lexeme)
            os << "\tvalue=\"" << tok.text << '"';
        if (tok.javadoc)
            os << "\tjavadoc";
        os << '\n';
    }
    os << "=== End Token Stream ===\n";
}

std::unique_ptr<CompilationUnit> parse(std::vector<Token> tokens, const ParseOptions &options)
{
    TokenVectorSource source(std::move(tokens));
    Parser parser(source, options);
    return parser.parseCompilationUnit();
}

std::unique_ptr<CompilationUnit> parseSource(std::string_view source,
                                             support::DiagnosticEngine &diag,
                                             const ParseOptions &options)
{
    LexerOptions lexOptions;
    lexOptions.ignoreErrors = options.ignoreLexErrors;
    lexOptions.fileId = options.fileId;

    try
    {
        // The dump uses its own lexer so parsing still starts from the top.
        if (options.dumpTokens)
            dumpTokens(tokenize(source, lexOptions), options.traceStream ? *options.traceStream : std::cerr);

        debugPhase("Lexing");
        Lexer lexer(source, lexOptions);

        debugPhase("Parsing");
        Parser parser(lexer, options);
        std::unique_ptr<CompilationUnit> unit;
        std::optional<support::Diag> failure;
        try
        {
            unit = parser.parseCompilationUnit();
        }
        catch (const SyntaxError &e)
        {
            failure = toDiag(e);
        }

        for (const LexError &e : lexer.errors())
            diag.report(toDiag(e));
        if (failure)
        {
            diag.report(std::move(*failure));
            return nullptr;
        }
        return unit;
    }
    catch (const LexError &e)
    {
        diag.report(toDiag(e));
        return nullptr;
    }
}

support::Expected<std::unique_ptr<CompilationUnit>> parseSource(std::string_view source,
                                                                const ParseOptions &options)
{
    support::DiagnosticEngine diag;
    std::unique_ptr<CompilationUnit> unit = parseSource(source, diag, options);
    if (!unit)
        return diag.diagnostics().back();
    return unit;
}

} // namespace javelin::frontends::java
