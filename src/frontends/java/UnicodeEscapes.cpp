//===----------------------------------------------------------------------===//
//
// Part of the Javelin project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file UnicodeEscapes.cpp
/// @brief Translation of `\uXXXX` escapes ahead of scanning.
///
/// @details A backslash starts a unicode escape only when it is preceded by
/// an even number of contiguous backslashes, so `\\u0041` stays as written.
/// Any number of `u` characters may follow the backslash. A high surrogate
/// escape immediately followed by a low surrogate escape is combined into
/// one code point.
///
//===----------------------------------------------------------------------===//

#include "frontends/common/CharUtils.hpp"
#include "frontends/common/Unicode.hpp"
#include "frontends/java/Lexer.hpp"

#include <optional>
#include <utility>

namespace javelin::frontends::java
{

namespace
{

namespace char_utils = common::char_utils;

/// Parse an escape whose backslash sits at @p at. On success @p end is set
/// past the last hex digit.
std::optional<char32_t> parseEscape(std::string_view text, std::size_t at, std::size_t &end)
{
    std::size_t k = at + 1;
    while (k < text.size() && text[k] == 'u')
        ++k;
    if (k + 4 > text.size())
        return std::nullopt;

    char32_t value = 0;
    for (std::size_t d = 0; d < 4; ++d)
    {
        const int digit = char_utils::hexDigitValue(text[k + d]);
        if (digit < 0)
            return std::nullopt;
        value = value * 16 + static_cast<char32_t>(digit);
    }
    end = k + 4;
    return value;
}

} // namespace

void Lexer::translateUnicodeEscapes()
{
    if (source_.find("\\u") == std::string::npos)
        return;

    const std::string_view text(source_);
    std::string out;
    out.reserve(text.size());

    std::size_t i = 0;
    while (i < text.size())
    {
        if (text[i] != '\\')
        {
            out.push_back(text[i]);
            ++i;
            continue;
        }

        std::size_t run = 0;
        while (i + run < text.size() && text[i + run] == '\\')
            ++run;
        out.append(run - 1, '\\');
        const std::size_t last = i + run - 1;
        i = last + 1;

        if (run % 2 == 0 || i >= text.size() || text[i] != 'u')
        {
            out.push_back('\\');
            continue;
        }

        std::size_t end = 0;
        std::optional<char32_t> value = parseEscape(text, last, end);
        if (!value)
        {
            error("Invalid unicode escape", last);
            out.push_back('\\');
            continue;
        }

        if (*value >= 0xD800 && *value <= 0xDBFF && end + 1 < text.size() && text[end] == '\\' &&
            text[end + 1] == 'u')
        {
            std::size_t lowEnd = 0;
            std::optional<char32_t> low = parseEscape(text, end, lowEnd);
            if (low && *low >= 0xDC00 && *low <= 0xDFFF)
            {
                value = 0x10000 + ((*value - 0xD800) << 10) + (*low - 0xDC00);
                end = lowEnd;
            }
        }

        common::unicode::appendUtf8(*value, out);
        i = end;
    }

    source_ = std::move(out);
}

} // namespace javelin::frontends::java
