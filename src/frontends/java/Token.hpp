//===----------------------------------------------------------------------===//
//
// Part of the Javelin project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Token.hpp
/// @brief Token kinds and token structure for the Java lexer.
///
/// ## Token Categories
///
/// Concrete kinds are the ones the lexer produces. A handful of abstract
/// kinds (Literal, Integer, FloatingPoint) exist only so the parser can ask
/// "is this any integer literal?" through tokenIsA():
///
///     Keyword        <- Modifier, BasicType
///     Literal        <- Integer, FloatingPoint, Boolean, Character, String, Null
///     Integer        <- DecimalInteger, OctalInteger, BinaryInteger, HexInteger
///     FloatingPoint  <- DecimalFloatingPoint, HexFloatingPoint
///
/// Contextual words (`var`, `yield`, `record`, `sealed`, `permits`, `when`)
/// are ordinary identifiers; the parser gives them meaning by position.
///
/// ## Token Lifetime
///
/// Tokens are value types that own their string data.
///
/// @invariant Tokens produced by the lexer carry a valid SourceLoc.
/// @invariant `text` is the logical value; `lexeme` is the raw source slice.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace javelin::frontends::java
{

/// @brief Enumeration of all token kinds known to the Java front end.
enum class TokenKind
{
    EndOfInput,

    Identifier,

    // Keyword family.
    Keyword,
    Modifier,
    BasicType,

    // Literal family; Literal, Integer and FloatingPoint are abstract.
    Literal,
    Integer,
    DecimalInteger,
    OctalInteger,
    BinaryInteger,
    HexInteger,
    FloatingPoint,
    DecimalFloatingPoint,
    HexFloatingPoint,
    Boolean,
    Character,
    String,
    Null,

    Separator,
    Operator,
    Annotation,
};

/// @brief Printable name of a token kind ("Identifier", "HexInteger", ...).
const char *tokenKindToString(TokenKind kind);

/// @brief Does a token of kind @p actual satisfy a request for @p expected?
/// @details Exact match, or @p actual is a descendant of the abstract or
///          family kind @p expected.
bool tokenIsA(TokenKind actual, TokenKind expected);

/// @brief A single lexical token.
struct Token
{
    /// @brief The kind of token this represents.
    TokenKind kind = TokenKind::EndOfInput;

    /// @brief Position of the first character (line and column are 1-based).
    support::SourceLoc loc{};

    /// @brief Logical value.
    /// @details Identical to the lexeme except for string, text-block and
    /// character literals, whose escapes are decoded and quotes removed.
    std::string text;

    /// @brief Exact source characters, after unicode-escape translation.
    std::string lexeme;

    /// @brief Most recent documentation comment seen before this token.
    std::optional<std::string> javadoc;

    bool is(TokenKind k) const
    {
        return kind == k;
    }

    /// @brief Kind-hierarchy aware check; see tokenIsA().
    bool isA(TokenKind k) const
    {
        return tokenIsA(kind, k);
    }

    /// @brief Check both the kind family and the value.
    bool is(TokenKind k, std::string_view value) const
    {
        return isA(k) && text == value;
    }

    bool isEnd() const
    {
        return kind == TokenKind::EndOfInput;
    }

    /// @brief Human readable form used in error messages.
    /// @details `Identifier "foo" line 3, position 7`, or `end of input`.
    std::string describe() const;
};

/// @brief One alternative in an accept/would-accept request.
/// @details Either a literal token value (`"("`, `"class"`) or a token kind.
///          Values compare against Token::text; kinds use tokenIsA().
class ExpectedToken
{
  public:
    ExpectedToken(const char *value) : alt_(std::string_view(value)) {}

    ExpectedToken(std::string_view value) : alt_(value) {}

    ExpectedToken(TokenKind kind) : alt_(kind) {}

    bool matches(const Token &tok) const;

    /// @brief `'('` for values, the kind name for kinds.
    std::string toString() const;

  private:
    std::variant<std::string_view, TokenKind> alt_;
};

} // namespace javelin::frontends::java
