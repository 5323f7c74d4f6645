//===----------------------------------------------------------------------===//
//
// Part of the Javelin project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file TokenCursor.cpp
/// @brief Lookahead buffering and marker rollback.
///
//===----------------------------------------------------------------------===//

#include "frontends/java/TokenCursor.hpp"

#include "frontends/java/Errors.hpp"

#include <utility>

namespace javelin::frontends::java
{

namespace
{

/// Consumed tokens kept around before compaction kicks in.
constexpr std::size_t kCompactThreshold = 256;

} // namespace

TokenVectorSource::TokenVectorSource(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

Token TokenVectorSource::next()
{
    while (pos_ < tokens_.size())
    {
        Token tok = tokens_[pos_++];
        if (!tok.isEnd())
            return tok;
    }
    return Token{};
}

TokenCursor::TokenCursor(TokenSource &source) : source_(source) {}

bool TokenCursor::fill(std::size_t index)
{
    while (base_ + buffer_.size() <= index)
    {
        if (exhausted_)
            return false;
        Token tok = source_.next();
        if (tok.isEnd())
        {
            exhausted_ = true;
            end_ = std::move(tok);
            return false;
        }
        buffer_.push_back(std::move(tok));
    }
    return true;
}

const Token &TokenCursor::peek(std::size_t offset)
{
    const std::size_t index = pos_ + offset;
    if (!fill(index))
        return end_;
    return buffer_[index - base_];
}

const Token &TokenCursor::advance()
{
    if (!fill(pos_))
        return end_;
    ++pos_;
    const Token &tok = buffer_[pos_ - 1 - base_];
    if (markers_.empty() && pos_ - base_ > kCompactThreshold)
    {
        compact();
        return last();
    }
    return tok;
}

const Token &TokenCursor::last() const
{
    if (pos_ == 0)
        return end_;
    if (pos_ - 1 < base_)
        return lastDropped_;
    return buffer_[pos_ - 1 - base_];
}

void TokenCursor::pushMarker()
{
    markers_.push_back(pos_);
}

void TokenCursor::popMarker(bool accept)
{
    if (markers_.empty())
        throw InternalUsageError("popMarker called without an open marker");
    const std::size_t mark = markers_.back();
    markers_.pop_back();
    if (!accept)
        pos_ = mark;
}

void TokenCursor::compact()
{
    const std::size_t drop = pos_ - base_ - 1;
    lastDropped_ = buffer_[drop];
    buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(drop + 1));
    base_ = pos_;
}

} // namespace javelin::frontends::java
