//===----------------------------------------------------------------------===//
//
// Part of the Javelin project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Unit tests for the Java tokenizer: token classification, literal decoding,
// text blocks, unicode escapes, documentation comments and lexical errors.
//
//===----------------------------------------------------------------------===//

#include "frontends/java/Errors.hpp"
#include "frontends/java/Lexer.hpp"

#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <vector>

using namespace javelin::frontends::java;

namespace
{

/// @brief Kinds of every token in @p src.
std::vector<TokenKind> kindsOf(std::string_view src)
{
    std::vector<TokenKind> kinds;
    for (const Token &tok : tokenize(src))
        kinds.push_back(tok.kind);
    return kinds;
}

/// @brief Lexemes of every token in @p src.
std::vector<std::string> lexemesOf(std::string_view src)
{
    std::vector<std::string> out;
    for (const Token &tok : tokenize(src))
        out.push_back(tok.lexeme);
    return out;
}

/// @brief The single token of @p src.
Token only(std::string_view src)
{
    std::vector<Token> tokens = tokenize(src);
    EXPECT_EQ(tokens.size(), 1u) << "source: " << src;
    return tokens.empty() ? Token{} : tokens.front();
}

} // namespace

//===----------------------------------------------------------------------===//
// Classification
//===----------------------------------------------------------------------===//

TEST(JavaLexer, ClassifiesKeywordFamily)
{
    std::vector<TokenKind> expected = {
        TokenKind::Modifier,
        TokenKind::Keyword,
        TokenKind::Identifier,
        TokenKind::Separator,
        TokenKind::BasicType,
        TokenKind::Identifier,
        TokenKind::Operator,
        TokenKind::Boolean,
        TokenKind::Separator,
        TokenKind::Separator,
    };
    EXPECT_EQ(kindsOf("public class A { int x = true; }"), expected);
}

TEST(JavaLexer, ContextualWordsAreIdentifiers)
{
    for (const char *word : {"var", "record", "yield", "sealed", "permits", "when"})
        EXPECT_EQ(only(word).kind, TokenKind::Identifier) << word;
    EXPECT_EQ(only("null").kind, TokenKind::Null);
    EXPECT_EQ(only("default").kind, TokenKind::Modifier);
    EXPECT_EQ(only("void").kind, TokenKind::Keyword);
}

TEST(JavaLexer, NeverJoinsClosingAngleBrackets)
{
    std::vector<std::string> expected = {"List", "<", "List", "<", "String", ">", ">", "x"};
    EXPECT_EQ(lexemesOf("List<List<String>> x"), expected);

    expected = {"a", ">", ">", ">", "b"};
    EXPECT_EQ(lexemesOf("a >>> b"), expected);

    // Compound shift assignments stay whole.
    expected = {"a", ">>=", "b", ">>>=", "c", "<<=", "d"};
    EXPECT_EQ(lexemesOf("a >>= b >>>= c <<= d"), expected);
}

TEST(JavaLexer, LongestOperatorWins)
{
    std::vector<std::string> expected = {"a", "::", "b", "->", "c", "...", "d", "++", "+", "e"};
    EXPECT_EQ(lexemesOf("a::b->c...d+++e"), expected);
}

TEST(JavaLexer, AnnotationIntroducer)
{
    std::vector<Token> tokens = tokenize("@interface Foo");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].kind, TokenKind::Annotation);
    EXPECT_EQ(tokens[0].text, "@");
    EXPECT_EQ(tokens[1].kind, TokenKind::Keyword);
    EXPECT_EQ(tokens[1].text, "interface");
}

TEST(JavaLexer, KindHierarchy)
{
    EXPECT_TRUE(tokenIsA(TokenKind::HexInteger, TokenKind::Integer));
    EXPECT_TRUE(tokenIsA(TokenKind::HexInteger, TokenKind::Literal));
    EXPECT_TRUE(tokenIsA(TokenKind::Modifier, TokenKind::Keyword));
    EXPECT_TRUE(tokenIsA(TokenKind::BasicType, TokenKind::Keyword));
    EXPECT_TRUE(tokenIsA(TokenKind::HexFloatingPoint, TokenKind::FloatingPoint));
    EXPECT_FALSE(tokenIsA(TokenKind::DecimalFloatingPoint, TokenKind::Integer));
    EXPECT_FALSE(tokenIsA(TokenKind::Identifier, TokenKind::Keyword));
    EXPECT_STREQ(tokenKindToString(TokenKind::DecimalInteger), "DecimalInteger");
}

//===----------------------------------------------------------------------===//
// Numbers
//===----------------------------------------------------------------------===//

TEST(JavaLexer, IntegerForms)
{
    EXPECT_EQ(only("0").kind, TokenKind::DecimalInteger);
    EXPECT_EQ(only("1_000L").kind, TokenKind::DecimalInteger);
    EXPECT_EQ(only("1_000L").text, "1_000L");
    EXPECT_EQ(only("017").kind, TokenKind::OctalInteger);
    EXPECT_EQ(only("0x1F").kind, TokenKind::HexInteger);
    EXPECT_EQ(only("0b1010").kind, TokenKind::BinaryInteger);
    EXPECT_EQ(only("0xFFFF_FFFFL").kind, TokenKind::HexInteger);
}

TEST(JavaLexer, FloatingForms)
{
    EXPECT_EQ(only("3.14").kind, TokenKind::DecimalFloatingPoint);
    EXPECT_EQ(only(".5").kind, TokenKind::DecimalFloatingPoint);
    EXPECT_EQ(only("1e10").kind, TokenKind::DecimalFloatingPoint);
    EXPECT_EQ(only("2f").kind, TokenKind::DecimalFloatingPoint);
    EXPECT_EQ(only("1.5e-3d").kind, TokenKind::DecimalFloatingPoint);
    EXPECT_EQ(only("08.5").kind, TokenKind::DecimalFloatingPoint);
    EXPECT_EQ(only("0x1.8p1").kind, TokenKind::HexFloatingPoint);
}

TEST(JavaLexer, TrailingUnderscoreEndsNumber)
{
    std::vector<std::string> expected = {"1", "_"};
    EXPECT_EQ(lexemesOf("1_"), expected);
}

//===----------------------------------------------------------------------===//
// Strings, characters and text blocks
//===----------------------------------------------------------------------===//

TEST(JavaLexer, StringEscapesAreDecoded)
{
    Token tok = only(R"("a\tb\n\"q\"\\\101\s")");
    EXPECT_EQ(tok.kind, TokenKind::String);
    EXPECT_EQ(tok.text, "a\tb\n\"q\"\\A ");
    EXPECT_EQ(tok.lexeme, R"("a\tb\n\"q\"\\\101\s")");
}

TEST(JavaLexer, CharacterLiteral)
{
    Token tok = only(R"('\'')");
    EXPECT_EQ(tok.kind, TokenKind::Character);
    EXPECT_EQ(tok.text, "'");
}

TEST(JavaLexer, TextBlockStripsIncidentalIndentation)
{
    Token tok = only("\"\"\"\n    Hello\n      World\n    \"\"\"");
    EXPECT_EQ(tok.kind, TokenKind::String);
    EXPECT_EQ(tok.text, "Hello\n  World\n");
}

TEST(JavaLexer, TextBlockLineContinuationAndTrailingSpace)
{
    Token tok = only("\"\"\"\n  one \\\n  two   \n  three\\s\"\"\"");
    EXPECT_EQ(tok.text, "one two\nthree ");
}

TEST(JavaLexer, TextBlockKeepsEmbeddedQuotes)
{
    Token tok = only("\"\"\"\n  say \"hi\"\n  \"\"\"");
    EXPECT_EQ(tok.text, "say \"hi\"\n");
}

//===----------------------------------------------------------------------===//
// Unicode escapes and encodings
//===----------------------------------------------------------------------===//

TEST(JavaLexer, UnicodeEscapesTranslatedBeforeTokenizing)
{
    Token tok = only("\\u0041bc");
    EXPECT_EQ(tok.kind, TokenKind::Identifier);
    EXPECT_EQ(tok.text, "Abc");

    // Any number of 'u' is allowed.
    EXPECT_EQ(only("\\uuuu0041").text, "A");
}

TEST(JavaLexer, EscapedBackslashBlocksUnicodeEscape)
{
    Token tok = only(R"("\\u0041")");
    EXPECT_EQ(tok.text, "\\u0041");
}

TEST(JavaLexer, SurrogatePairEscapeCombines)
{
    Token tok = only(R"("\uD83D\uDE00")");
    EXPECT_EQ(tok.text, "\xF0\x9F\x98\x80");
}

TEST(JavaLexer, InvalidUnicodeEscape)
{
    try
    {
        tokenize(R"(int \u00G1;)");
        FAIL() << "expected LexError";
    }
    catch (const LexError &e)
    {
        EXPECT_EQ(e.message(), "Invalid unicode escape");
        EXPECT_EQ(e.loc().line, 1u);
        EXPECT_EQ(e.loc().column, 5u);
    }
}

TEST(JavaLexer, ColumnsCountCodePoints)
{
    std::vector<Token> tokens = tokenize("\"\xC3\xA9\" x");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[1].loc.column, 5u);
}

TEST(JavaLexer, NonAsciiIdentifier)
{
    Token tok = only("caf\xC3\xA9");
    EXPECT_EQ(tok.kind, TokenKind::Identifier);
    EXPECT_EQ(tok.text, "caf\xC3\xA9");
}

TEST(JavaLexer, InvalidUtf8FallsBackToLatin1)
{
    Token tok = only("\"\xE9\"");
    EXPECT_EQ(tok.text, "\xC3\xA9");
}

TEST(JavaLexer, ByteOrderMarkIsSkipped)
{
    std::vector<Token> tokens = tokenize("\xEF\xBB\xBF" "class");
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].loc.column, 1u);
}

//===----------------------------------------------------------------------===//
// Comments and positions
//===----------------------------------------------------------------------===//

TEST(JavaLexer, TracksLineAndColumn)
{
    std::vector<Token> tokens = tokenize("a\n  // comment\n\tb /* x\n y */ c");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].loc.line, 1u);
    EXPECT_EQ(tokens[0].loc.column, 1u);
    EXPECT_EQ(tokens[1].loc.line, 3u);
    EXPECT_EQ(tokens[1].loc.column, 2u);
    EXPECT_EQ(tokens[2].loc.line, 4u);
    EXPECT_EQ(tokens[2].loc.column, 7u);
}

TEST(JavaLexer, DocumentationCommentAttachesToNextToken)
{
    std::vector<Token> tokens = tokenize("/** Doc. */ class A /* plain */ {}");
    ASSERT_EQ(tokens.size(), 4u);
    ASSERT_TRUE(tokens[0].javadoc.has_value());
    EXPECT_EQ(*tokens[0].javadoc, "/** Doc. */");
    EXPECT_FALSE(tokens[1].javadoc.has_value());
    EXPECT_FALSE(tokens[2].javadoc.has_value());
}

TEST(JavaLexer, EmptyBlockCommentIsNotDocumentation)
{
    std::vector<Token> tokens = tokenize("/**/ x");
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_FALSE(tokens[0].javadoc.has_value());
}

TEST(JavaLexer, TokenDescribe)
{
    std::vector<Token> tokens = tokenize("\n\n      foo");
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].describe(), "Identifier \"foo\" line 3, position 7");
    EXPECT_EQ(Token{}.describe(), "end of input");
}

//===----------------------------------------------------------------------===//
// Errors
//===----------------------------------------------------------------------===//

TEST(JavaLexer, UnterminatedStringThrows)
{
    try
    {
        tokenize("String s = \"abc;");
        FAIL() << "expected LexError";
    }
    catch (const LexError &e)
    {
        EXPECT_EQ(e.message(), "Unterminated character/string literal");
        EXPECT_EQ(e.loc().column, 12u);
        EXPECT_EQ(e.character(), "\"");
        EXPECT_EQ(std::string(e.what()),
                  "Unterminated character/string literal at \"\"\", line 1: String s = \"abc;");
    }
}

TEST(JavaLexer, UnterminatedTextBlockThrows)
{
    EXPECT_THROW(tokenize("\"\"\"\n  abc"), LexError);
}

TEST(JavaLexer, UnterminatedBlockCommentThrows)
{
    try
    {
        tokenize("int x; /* open");
        FAIL() << "expected LexError";
    }
    catch (const LexError &e)
    {
        EXPECT_EQ(e.message(), "Unterminated block comment");
        EXPECT_EQ(e.loc().column, 8u);
    }
}

TEST(JavaLexer, IllegalEscapeThrows)
{
    try
    {
        tokenize(R"("a\qb")");
        FAIL() << "expected LexError";
    }
    catch (const LexError &e)
    {
        EXPECT_EQ(e.message(), "Illegal escape character");
        EXPECT_EQ(e.character(), "q");
    }
}

TEST(JavaLexer, UnknownCharacterThrows)
{
    try
    {
        tokenize("int # x;");
        FAIL() << "expected LexError";
    }
    catch (const LexError &e)
    {
        EXPECT_EQ(e.message(), "Could not process token");
        EXPECT_EQ(e.character(), "#");
        EXPECT_EQ(e.lineText(), "int # x;");
    }
}

TEST(JavaLexer, BestEffortModeCollectsErrors)
{
    LexerOptions options;
    options.ignoreErrors = true;
    Lexer lexer("int # x = \"open", options);

    std::vector<Token> tokens;
    for (Token tok = lexer.next(); !tok.isEnd(); tok = lexer.next())
        tokens.push_back(tok);

    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[1].text, "x");
    EXPECT_EQ(tokens[3].kind, TokenKind::String);
    EXPECT_EQ(tokens[3].text, "open");

    ASSERT_EQ(lexer.errors().size(), 2u);
    EXPECT_EQ(lexer.errors()[0].message(), "Could not process token");
    EXPECT_EQ(lexer.errors()[1].message(), "Unterminated character/string literal");
}

TEST(JavaLexer, FileIdStampedIntoLocations)
{
    LexerOptions options;
    options.fileId = 7;
    std::vector<Token> tokens = tokenize("a b", options);
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].loc.file_id, 7u);
    EXPECT_EQ(tokens[1].loc.file_id, 7u);
}
