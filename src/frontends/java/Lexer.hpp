//===----------------------------------------------------------------------===//
//
// Part of the Javelin project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Lexer.hpp
/// @brief Lexical analyzer for Java source text.
///
/// The lexer works in two stages. Construction decodes the input (UTF-8,
/// falling back to ISO-8859-1) and translates `\uXXXX` escapes into UTF-8.
/// Tokens are then scanned lazily, one per call to next().
///
/// ## Error handling
///
/// By default the first lexical error throws LexError. With
/// LexerOptions::ignoreErrors the error is recorded in errors() and
/// scanning resumes.
///
/// Ownership/Lifetime: The lexer owns its preprocessed copy of the source.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/common/LexerBase.hpp"
#include "frontends/java/Errors.hpp"
#include "frontends/java/Options.hpp"
#include "frontends/java/Token.hpp"
#include "frontends/java/TokenCursor.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace javelin::frontends::java
{

/// @brief Tokenizer for Java source code.
class Lexer : public common::lexer_base::LexerCursor<Lexer>, public TokenSource
{
  public:
    /// @brief Prepare @p input for scanning.
    /// @throws LexError on a malformed unicode escape unless errors are ignored.
    explicit Lexer(std::string_view input, LexerOptions options = {});

    /// @brief Scan the next token; EndOfInput once the source is exhausted.
    Token next() override;

    /// @brief Errors collected in ignoreErrors mode, in source order.
    const std::vector<LexError> &errors() const noexcept
    {
        return errors_;
    }

    /// @brief Preprocessed source, as scanned.
    std::string_view source() const noexcept
    {
        return source_;
    }

  private:
    //=== Error reporting ===//

    /// @brief Raise or record an error at byte @p offset.
    void error(const std::string &message, std::size_t offset);

    /// @brief Raise or record an error at byte @p offset with a known location.
    void error(const std::string &message, std::size_t offset, support::SourceLoc loc);

    /// @brief Line and column of byte @p offset (slow path, errors only).
    support::SourceLoc locationOf(std::size_t offset) const;

    support::SourceLoc currentLoc() const
    {
        return support::SourceLoc{fileId(), line(), column()};
    }

    //=== Preprocessing (UnicodeEscapes.cpp) ===//

    /// @brief Replace every eligible `\uXXXX` escape with its UTF-8 encoding.
    void translateUnicodeEscapes();

    //=== Scanning (Lexer.cpp) ===//

    bool skipWhitespace();
    bool skipComment();
    bool tryOperator(Token &tok);
    void lexIdentifier(Token &tok);

    //=== Literals (Lexer_Literals.cpp) ===//

    void lexNumber(Token &tok);
    void lexHexNumber(Token &tok);
    void lexDecimalNumber(Token &tok);
    void lexCharOrString(Token &tok);
    void lexTextBlock(Token &tok);

    /// @brief Consume digits accepted by @p isDigit, allowing `_` between them.
    /// @return True if at least one digit was consumed.
    bool readDigits(bool (*isDigit)(char));

    /// @brief Consume a trailing `l`/`L` suffix if present.
    void readLongSuffix();

    /// @brief Decode the escapes of a literal body.
    /// @param body Raw text between the delimiters.
    /// @param bodyOffset Byte offset of @p body in the source, for errors.
    /// @param textBlock Accept line continuations.
    std::string decodeEscapes(std::string_view body, std::size_t bodyOffset, bool textBlock);

    /// @brief Strip incidental indentation from a text block body.
    static std::string stripIndentation(std::string_view raw);

    std::string source_;
    LexerOptions options_;
    std::vector<LexError> errors_;
    std::optional<std::string> pendingJavadoc_;
};

/// @brief Tokenize all of @p input eagerly.
/// @details The returned vector does not include the EndOfInput token.
std::vector<Token> tokenize(std::string_view input, LexerOptions options = {});

} // namespace javelin::frontends::java
