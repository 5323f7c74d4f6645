//===----------------------------------------------------------------------===//
//
// Part of the Javelin project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file TokenCursor.hpp
/// @brief Buffered lookahead over a token source, with rollback markers.
///
/// The cursor pulls tokens from a TokenSource on demand and keeps every
/// token consumed while a marker is open, so a failed speculative parse can
/// rewind and replay them in order before anything new is read.
///
/// @invariant Markers nest: popMarker() always closes the most recent one.
/// @invariant peek(n) never consumes; advance() consumes exactly one token.
/// @invariant Past the end of the source the cursor yields an EndOfInput
///            token and stays put.
///
/// References returned by peek(), advance() and last() stay valid until the
/// next call that reads from the source; copy a token to keep it longer.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/java/Token.hpp"

#include <cstddef>
#include <vector>

namespace javelin::frontends::java
{

/// @brief A forward-only producer of tokens.
class TokenSource
{
  public:
    virtual ~TokenSource() = default;

    /// @brief Produce the next token.
    /// @details Returns an EndOfInput token once exhausted, on every call.
    virtual Token next() = 0;
};

/// @brief TokenSource over an already materialized token list.
class TokenVectorSource : public TokenSource
{
  public:
    explicit TokenVectorSource(std::vector<Token> tokens);

    Token next() override;

  private:
    std::vector<Token> tokens_;
    std::size_t pos_ = 0;
};

/// @brief Lookahead cursor with nested checkpoints.
class TokenCursor
{
  public:
    /// @param source Borrowed; must outlive the cursor.
    explicit TokenCursor(TokenSource &source);

    TokenCursor(const TokenCursor &) = delete;
    TokenCursor &operator=(const TokenCursor &) = delete;

    /// @brief Look @p offset tokens ahead without consuming.
    const Token &peek(std::size_t offset = 0);

    /// @brief Consume and return the current token.
    /// @details At end of input the EndOfInput token is returned and the
    ///          cursor does not move.
    const Token &advance();

    /// @brief The most recently consumed token, or EndOfInput if none.
    const Token &last() const;

    /// @brief Open a checkpoint at the current position.
    void pushMarker();

    /// @brief Close the innermost checkpoint.
    /// @param accept Keep consumption when true; rewind to the checkpoint
    ///        when false.
    /// @throws InternalUsageError when no checkpoint is open.
    void popMarker(bool accept);

    /// @brief Number of open checkpoints.
    std::size_t markerDepth() const noexcept
    {
        return markers_.size();
    }

    /// @brief Number of tokens consumed so far.
    std::size_t consumed() const noexcept
    {
        return pos_;
    }

    /// @brief RAII checkpoint that rewinds unless committed.
    ///
    /// @code
    /// TokenCursor::Marker marker(cursor);
    /// parseSomething();
    /// marker.commit();
    /// @endcode
    class Marker
    {
      public:
        explicit Marker(TokenCursor &cursor) : cursor_(cursor), depth_(cursor.markerDepth())
        {
            cursor_.pushMarker();
        }

        Marker(const Marker &) = delete;
        Marker &operator=(const Marker &) = delete;

        /// @brief Rewind unless committed; a no-op when the cursor's markers
        ///        were already unwound past this one.
        ~Marker()
        {
            if (!done_ && cursor_.markerDepth() > depth_)
                cursor_.popMarker(false);
        }

        /// @brief Keep everything consumed since construction.
        void commit()
        {
            if (!done_)
            {
                cursor_.popMarker(true);
                done_ = true;
            }
        }

        /// @brief Rewind now rather than at scope exit.
        void rollback()
        {
            if (!done_)
            {
                cursor_.popMarker(false);
                done_ = true;
            }
        }

      private:
        TokenCursor &cursor_;
        std::size_t depth_;
        bool done_ = false;
    };

  private:
    /// @brief Ensure the buffer holds the token at absolute index @p index.
    bool fill(std::size_t index);

    /// @brief Drop consumed tokens that no marker can reach any more.
    void compact();

    TokenSource &source_;
    std::vector<Token> buffer_;     ///< Tokens from absolute index base_ on.
    std::size_t base_ = 0;          ///< Absolute index of buffer_[0].
    std::size_t pos_ = 0;           ///< Absolute index of the next token.
    std::vector<std::size_t> markers_;
    Token lastDropped_;             ///< Token at pos_ - 1 after compaction.
    Token end_;                     ///< Sentinel returned past the end.
    bool exhausted_ = false;
};

} // namespace javelin::frontends::java
