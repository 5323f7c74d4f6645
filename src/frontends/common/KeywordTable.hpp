//===----------------------------------------------------------------------===//
//
// Part of the Javelin project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/common/KeywordTable.hpp
// Purpose: Compile-time keyword tables with binary search lookup.
//
// Key Features:
//   - Sorted array with binary search for compile-time keyword tables
//   - constexpr verification of table sorting
//
//===----------------------------------------------------------------------===//
#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

namespace javelin::frontends::common::keyword_table
{

/// @brief A keyword entry mapping a lexeme to a token kind.
/// @tparam TokenKind The token kind enum type.
template <typename TokenKind>
struct KeywordEntry
{
    std::string_view lexeme; ///< The keyword text, exactly as spelled in source.
    TokenKind kind;          ///< The token kind for this keyword.
};

/// @brief Check if a keyword table is properly sorted.
/// @details Used for static_assert validation of compile-time tables.
/// @return True if the table is strictly lexicographically sorted.
template <typename TokenKind, std::size_t N>
[[nodiscard]] constexpr bool isKeywordTableSorted(const std::array<KeywordEntry<TokenKind>, N> &table)
{
    for (std::size_t i = 1; i < N; ++i)
    {
        if (!(table[i - 1].lexeme < table[i].lexeme))
            return false;
    }
    return true;
}

/// @brief Binary search lookup in a sorted keyword table.
/// @param table The sorted keyword table.
/// @param lexeme The lexeme to look up.
/// @return The token kind if found, std::nullopt otherwise.
template <typename TokenKind, std::size_t N>
[[nodiscard]] constexpr std::optional<TokenKind> lookupKeywordBinary(
    const std::array<KeywordEntry<TokenKind>, N> &table,
    std::string_view lexeme)
{
    auto first = table.begin();
    auto last = table.end();

    while (first < last)
    {
        auto mid = first + (last - first) / 2;
        if (mid->lexeme == lexeme)
            return mid->kind;
        if (mid->lexeme < lexeme)
            first = mid + 1;
        else
            last = mid;
    }

    return std::nullopt;
}

} // namespace javelin::frontends::common::keyword_table
