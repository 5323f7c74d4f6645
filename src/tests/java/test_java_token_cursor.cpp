//===----------------------------------------------------------------------===//
//
// Part of the Javelin project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Unit tests for the lookahead cursor: peeking, marker nesting, rollback
// and buffer compaction over long token streams.
//
//===----------------------------------------------------------------------===//

#include "frontends/java/Errors.hpp"
#include "frontends/java/Lexer.hpp"
#include "frontends/java/TokenCursor.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace javelin::frontends::java;

namespace
{

/// @brief Source text `t0 t1 ... t<n-1>`.
std::string identifiers(int n)
{
    std::string src;
    for (int i = 0; i < n; ++i)
        src += "t" + std::to_string(i) + " ";
    return src;
}

} // namespace

TEST(JavaTokenCursor, PeekDoesNotConsume)
{
    Lexer lexer("a b c");
    TokenCursor cursor(lexer);

    EXPECT_EQ(cursor.peek().text, "a");
    EXPECT_EQ(cursor.peek(2).text, "c");
    EXPECT_EQ(cursor.peek().text, "a");
    EXPECT_EQ(cursor.consumed(), 0u);

    EXPECT_EQ(cursor.advance().text, "a");
    EXPECT_EQ(cursor.last().text, "a");
    EXPECT_EQ(cursor.peek().text, "b");
}

TEST(JavaTokenCursor, EndOfInputIsSticky)
{
    Lexer lexer("x");
    TokenCursor cursor(lexer);

    EXPECT_TRUE(cursor.peek(5).isEnd());
    cursor.advance();
    EXPECT_TRUE(cursor.peek().isEnd());
    EXPECT_TRUE(cursor.advance().isEnd());
    EXPECT_TRUE(cursor.advance().isEnd());
    EXPECT_EQ(cursor.consumed(), 1u);
}

TEST(JavaTokenCursor, EndTokenCarriesLocation)
{
    Lexer lexer("a\n  ");
    TokenCursor cursor(lexer);
    const Token &end = cursor.peek(1);
    EXPECT_TRUE(end.isEnd());
    EXPECT_EQ(end.loc.line, 2u);
    EXPECT_EQ(end.loc.column, 3u);
}

TEST(JavaTokenCursor, RollbackRestoresPosition)
{
    Lexer lexer("a b c d");
    TokenCursor cursor(lexer);
    cursor.advance();

    cursor.pushMarker();
    cursor.advance();
    cursor.advance();
    EXPECT_EQ(cursor.peek().text, "d");
    cursor.popMarker(false);

    EXPECT_EQ(cursor.peek().text, "b");
    EXPECT_EQ(cursor.markerDepth(), 0u);
}

TEST(JavaTokenCursor, CommitKeepsPosition)
{
    Lexer lexer("a b c");
    TokenCursor cursor(lexer);

    cursor.pushMarker();
    cursor.advance();
    cursor.popMarker(true);
    EXPECT_EQ(cursor.peek().text, "b");
}

TEST(JavaTokenCursor, NestedMarkersUnwindIndependently)
{
    Lexer lexer("a b c d e");
    TokenCursor cursor(lexer);

    cursor.pushMarker();
    cursor.advance();
    cursor.pushMarker();
    cursor.advance();
    cursor.advance();
    EXPECT_EQ(cursor.markerDepth(), 2u);

    cursor.popMarker(true);
    EXPECT_EQ(cursor.peek().text, "d");
    cursor.popMarker(false);
    EXPECT_EQ(cursor.peek().text, "a");
}

TEST(JavaTokenCursor, ScopedMarkerRollsBackUnlessCommitted)
{
    Lexer lexer("a b c");
    TokenCursor cursor(lexer);
    {
        TokenCursor::Marker marker(cursor);
        cursor.advance();
        cursor.advance();
    }
    EXPECT_EQ(cursor.peek().text, "a");

    {
        TokenCursor::Marker marker(cursor);
        cursor.advance();
        marker.commit();
    }
    EXPECT_EQ(cursor.peek().text, "b");
    EXPECT_EQ(cursor.markerDepth(), 0u);
}

TEST(JavaTokenCursor, PopWithoutMarkerIsUsageError)
{
    Lexer lexer("a");
    TokenCursor cursor(lexer);
    EXPECT_THROW(cursor.popMarker(true), InternalUsageError);
}

TEST(JavaTokenCursor, LongStreamWithoutMarkers)
{
    Lexer lexer(identifiers(1000));
    TokenCursor cursor(lexer);
    for (int i = 0; i < 999; ++i)
    {
        const Token &tok = cursor.advance();
        ASSERT_EQ(tok.text, "t" + std::to_string(i));
        ASSERT_EQ(cursor.last().text, "t" + std::to_string(i));
    }
    EXPECT_EQ(cursor.peek().text, "t999");
    EXPECT_EQ(cursor.consumed(), 999u);
}

TEST(JavaTokenCursor, LongRollbackUnderMarker)
{
    Lexer lexer(identifiers(800));
    TokenCursor cursor(lexer);
    cursor.advance();

    cursor.pushMarker();
    for (int i = 0; i < 700; ++i)
        cursor.advance();
    EXPECT_EQ(cursor.peek().text, "t701");
    cursor.popMarker(false);

    EXPECT_EQ(cursor.peek().text, "t1");
    EXPECT_EQ(cursor.last().text, "t0");
}

TEST(JavaTokenCursor, VectorSourceSkipsEndTokens)
{
    std::vector<Token> tokens = tokenize("a b");
    tokens.insert(tokens.begin() + 1, Token{});
    TokenVectorSource source(tokens);
    TokenCursor cursor(source);

    EXPECT_EQ(cursor.advance().text, "a");
    EXPECT_EQ(cursor.advance().text, "b");
    EXPECT_TRUE(cursor.peek().isEnd());
}

TEST(JavaTokenCursor, UnbalancedPopIsUsageError)
{
    Lexer lexer("a");
    TokenCursor cursor(lexer);
    EXPECT_THROW(cursor.popMarker(true), InternalUsageError);

    cursor.pushMarker();
    cursor.popMarker(true);
    EXPECT_THROW(cursor.popMarker(false), InternalUsageError);
}

TEST(JavaTokenCursor, MarkerOutlivingItsCheckpointIsHarmless)
{
    Lexer lexer("a b");
    TokenCursor cursor(lexer);
    {
        TokenCursor::Marker marker(cursor);
        cursor.advance();
        cursor.popMarker(true);
        EXPECT_EQ(cursor.markerDepth(), 0u);
    }
    EXPECT_EQ(cursor.markerDepth(), 0u);
    EXPECT_EQ(cursor.peek().text, "b");
}
