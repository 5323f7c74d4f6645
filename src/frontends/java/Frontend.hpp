//===----------------------------------------------------------------------===//
//
// Part of the Javelin project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Frontend.hpp
/// @brief Entry points that run the lexer and parser over Java source.
///
/// @details Three layers of convenience:
///
/// **tokenize()** (Lexer.hpp) and **parse()** expose the two stages
/// separately and throw LexError / SyntaxError.
///
/// **parseSource()** runs both stages and converts every lexical or syntax
/// error into a diagnostic:
/// ```cpp
/// DiagnosticEngine diag;
/// auto unit = parseSource(text, diag);
/// if (!unit)
///     diag.printAll(std::cerr, &sm);
/// ```
///
/// Setting ParseOptions::dumpTokens prints the token stream with a separate
/// lexer before parsing starts.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/java/AST.hpp"
#include "frontends/java/Lexer.hpp"
#include "frontends/java/Options.hpp"
#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"

#include <iosfwd>
#include <memory>
#include <string_view>
#include <vector>

namespace javelin::frontends::java
{

/// @brief Parse an already tokenized compilation unit.
/// @throws SyntaxError on malformed input.
std::unique_ptr<CompilationUnit> parse(std::vector<Token> tokens, const ParseOptions &options = {});

/// @brief Tokenize and parse @p source.
/// @return The syntax tree, or the diagnostic of the error that stopped it.
support::Expected<std::unique_ptr<CompilationUnit>> parseSource(std::string_view source,
                                                                const ParseOptions &options = {});

/// @brief Tokenize and parse @p source, reporting errors into @p diag.
/// @details In best-effort lexing mode every collected lexical error is
///          reported and the tree is still returned when parsing succeeds.
/// @return The syntax tree, or nullptr after a fatal error.
std::unique_ptr<CompilationUnit> parseSource(std::string_view source,
                                             support::DiagnosticEngine &diag,
                                             const ParseOptions &options = {});

/// @brief Print one line per token: location, kind, lexeme and decoded value.
void dumpTokens(const std::vector<Token> &tokens, std::ostream &os);

} // namespace javelin::frontends::java
