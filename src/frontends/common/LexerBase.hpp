//===----------------------------------------------------------------------===//
//
// Part of the Javelin project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/common/LexerBase.hpp
// Purpose: Common lexer cursor management utilities.
//
// The cursor walks a UTF-8 buffer byte by byte while reporting positions in
// code points, so a column always counts characters as a reader sees them.
//
// Key Invariants:
//   - Position tracking maintains 1-based line and column numbers
//   - EOF is indicated by returning '\0' from peek operations
//   - Newlines increment line and reset column to 1
//   - UTF-8 continuation bytes never advance the column
//
//===----------------------------------------------------------------------===//
#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace javelin::frontends::common::lexer_base
{

/// @brief CRTP base class for lexer cursor management.
/// @details Provides peek(), get(), eof(), and location tracking.
/// Derived class must provide source() returning std::string_view.
///
/// Usage:
///   class MyLexer : public LexerCursor<MyLexer> {
///       std::string_view source() const { return src_; }
///   };
template <typename Derived>
class LexerCursor
{
  public:
    /// @brief Construct with initial file ID.
    explicit LexerCursor(uint32_t fileId) : fileId_(fileId) {}

    /// @brief Peek at the current byte without consuming it.
    /// @return The current byte, or '\0' if at end of source.
    [[nodiscard]] char peek() const
    {
        auto src = static_cast<const Derived *>(this)->source();
        return pos_ < src.size() ? src[pos_] : '\0';
    }

    /// @brief Peek at a byte ahead of current position.
    /// @param offset Number of bytes ahead to look.
    /// @return The byte at offset, or '\0' if beyond end.
    [[nodiscard]] char peek(std::size_t offset) const
    {
        auto src = static_cast<const Derived *>(this)->source();
        std::size_t idx = pos_ + offset;
        return idx < src.size() ? src[idx] : '\0';
    }

    /// @brief Check whether the remaining input begins with @p text.
    [[nodiscard]] bool startsWith(std::string_view text) const
    {
        auto src = static_cast<const Derived *>(this)->source();
        return src.substr(pos_ < src.size() ? pos_ : src.size()).substr(0, text.size()) == text;
    }

    /// @brief Consume and return the current byte.
    /// @return The consumed byte, or '\0' if at end of source.
    char get()
    {
        auto src = static_cast<const Derived *>(this)->source();
        if (pos_ >= src.size())
            return '\0';
        char c = src[pos_++];
        if (c == '\n')
        {
            line_++;
            column_ = 1;
        }
        else if ((static_cast<unsigned char>(c) & 0xC0) != 0x80)
        {
            column_++;
        }
        return c;
    }

    /// @brief Consume @p count bytes.
    void advance(std::size_t count)
    {
        while (count-- > 0 && !eof())
            get();
    }

    /// @brief Check whether the lexer has reached the end of the source.
    /// @return True if no characters remain, otherwise false.
    [[nodiscard]] bool eof() const
    {
        return pos_ >= static_cast<const Derived *>(this)->source().size();
    }

    /// @brief Get the current byte offset in the source.
    [[nodiscard]] std::size_t position() const noexcept { return pos_; }

    /// @brief Get the current line number (1-based).
    [[nodiscard]] uint32_t line() const noexcept { return line_; }

    /// @brief Get the current column number (1-based, in code points).
    [[nodiscard]] uint32_t column() const noexcept { return column_; }

    /// @brief Get the file ID.
    [[nodiscard]] uint32_t fileId() const noexcept { return fileId_; }

  protected:
    std::size_t pos_{0};   ///< Current byte offset in source.
    uint32_t line_{1};     ///< 1-based line number.
    uint32_t column_{1};   ///< 1-based column number.
    uint32_t fileId_;      ///< File identifier.
};

/// @brief Skip a line (until newline or EOF).
/// @details Consumes characters until a newline is seen (but does not consume the newline).
/// @tparam Lexer A lexer type with peek(), get(), eof() methods.
template <typename Lexer>
inline void skipToEndOfLine(Lexer &lex)
{
    while (!lex.eof() && lex.peek() != '\n')
        lex.get();
}

} // namespace javelin::frontends::common::lexer_base
