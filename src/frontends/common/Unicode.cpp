//===----------------------------------------------------------------------===//
//
// Part of the Javelin project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/common/Unicode.cpp
// Purpose: UTF-8 transcoding and range-table classification.
//
//===----------------------------------------------------------------------===//

#include "frontends/common/Unicode.hpp"

#include <algorithm>
#include <array>

namespace javelin::frontends::common::unicode
{

namespace
{

struct Range
{
    char32_t lo;
    char32_t hi;
};

template <std::size_t N> constexpr bool isSortedTable(const std::array<Range, N> &table)
{
    for (std::size_t i = 0; i < N; ++i)
    {
        if (table[i].lo > table[i].hi)
            return false;
        if (i > 0 && table[i - 1].hi >= table[i].lo)
            return false;
    }
    return true;
}

template <std::size_t N> bool inTable(const std::array<Range, N> &table, char32_t cp)
{
    auto it = std::upper_bound(
        table.begin(), table.end(), cp, [](char32_t v, const Range &r) { return v < r.lo; });
    if (it == table.begin())
        return false;
    --it;
    return cp <= it->hi;
}

constexpr std::array<Range, 10> kWhitespace{{
    {0x09, 0x0D},
    {0x1C, 0x20},
    {0x85, 0x85},
    {0xA0, 0xA0},
    {0x1680, 0x1680},
    {0x2000, 0x200A},
    {0x2028, 0x2029},
    {0x202F, 0x202F},
    {0x205F, 0x205F},
    {0x3000, 0x3000},
}};

// Latin, Greek, Cyrillic, Armenian, Hebrew, Arabic, Syriac, Thaana,
// Devanagari, Bengali, Thai, Georgian, Hangul, Ethiopic, Kana, CJK and the
// full-width forms. Letter numbers (Nl) are folded in.
constexpr std::array<Range, 122> kLetters{{
    {0x41, 0x5A},       {0x61, 0x7A},       {0xAA, 0xAA},       {0xB5, 0xB5},
    {0xBA, 0xBA},       {0xC0, 0xD6},       {0xD8, 0xF6},       {0xF8, 0x2C1},
    {0x2C6, 0x2D1},     {0x2E0, 0x2E4},     {0x2EC, 0x2EC},     {0x2EE, 0x2EE},
    {0x370, 0x374},     {0x376, 0x377},     {0x37A, 0x37D},     {0x37F, 0x37F},
    {0x386, 0x386},     {0x388, 0x38A},     {0x38C, 0x38C},     {0x38E, 0x3A1},
    {0x3A3, 0x3F5},     {0x3F7, 0x481},     {0x48A, 0x52F},     {0x531, 0x556},
    {0x559, 0x559},     {0x560, 0x588},     {0x5D0, 0x5EA},     {0x5EF, 0x5F2},
    {0x620, 0x64A},     {0x66E, 0x66F},     {0x671, 0x6D3},     {0x6D5, 0x6D5},
    {0x6E5, 0x6E6},     {0x6EE, 0x6EF},     {0x6FA, 0x6FC},     {0x6FF, 0x6FF},
    {0x710, 0x710},     {0x712, 0x72F},     {0x74D, 0x7A5},     {0x7B1, 0x7B1},
    {0x904, 0x939},     {0x93D, 0x93D},     {0x950, 0x950},     {0x958, 0x961},
    {0x971, 0x980},     {0x985, 0x98C},     {0x98F, 0x990},     {0x993, 0x9A8},
    {0x9AA, 0x9B0},     {0x9B2, 0x9B2},     {0x9B6, 0x9B9},     {0xE01, 0xE30},
    {0xE32, 0xE33},     {0xE40, 0xE46},     {0x10A0, 0x10C5},   {0x10D0, 0x10FA},
    {0x10FC, 0x1248},   {0x1E00, 0x1F15},   {0x1F18, 0x1F1D},   {0x1F20, 0x1F45},
    {0x1F48, 0x1F4D},   {0x1F50, 0x1F57},   {0x1F59, 0x1F59},   {0x1F5B, 0x1F5B},
    {0x1F5D, 0x1F5D},   {0x1F5F, 0x1F7D},   {0x1F80, 0x1FB4},   {0x1FB6, 0x1FBC},
    {0x1FBE, 0x1FBE},   {0x1FC2, 0x1FC4},   {0x1FC6, 0x1FCC},   {0x1FD0, 0x1FD3},
    {0x1FD6, 0x1FDB},   {0x1FE0, 0x1FEC},   {0x1FF2, 0x1FF4},   {0x1FF6, 0x1FFC},
    {0x2071, 0x2071},   {0x207F, 0x207F},   {0x2090, 0x209C},   {0x2102, 0x2102},
    {0x2107, 0x2107},   {0x210A, 0x2113},   {0x2115, 0x2115},   {0x2119, 0x211D},
    {0x2124, 0x2124},   {0x2126, 0x2126},   {0x2128, 0x2128},   {0x212A, 0x212D},
    {0x212F, 0x2139},   {0x213C, 0x213F},   {0x2145, 0x2149},   {0x214E, 0x214E},
    {0x2160, 0x2188},   {0x2C00, 0x2CE4},   {0x2D00, 0x2D25},   {0x3005, 0x3007},
    {0x3021, 0x3029},   {0x3031, 0x3035},   {0x3038, 0x303C},   {0x3041, 0x3096},
    {0x309D, 0x309F},   {0x30A1, 0x30FA},   {0x30FC, 0x30FF},   {0x3105, 0x312F},
    {0x3131, 0x318E},   {0x31A0, 0x31BF},   {0x31F0, 0x31FF},   {0x3400, 0x4DBF},
    {0x4E00, 0x9FFF},   {0xA000, 0xA48C},   {0xAC00, 0xD7A3},   {0xF900, 0xFA6D},
    {0xFB00, 0xFB06},   {0xFF21, 0xFF3A},   {0xFF41, 0xFF5A},   {0xFF66, 0xFFBE},
    {0x10000, 0x1000B}, {0x10400, 0x1044F}, {0x1D400, 0x1D6A5}, {0x20000, 0x2A6DF},
    {0x2A700, 0x2EBE0}, {0x30000, 0x3134A},
}};

constexpr std::array<Range, 19> kDigits{{
    {0x30, 0x39},
    {0x660, 0x669},
    {0x6F0, 0x6F9},
    {0x7C0, 0x7C9},
    {0x966, 0x96F},
    {0x9E6, 0x9EF},
    {0xA66, 0xA6F},
    {0xAE6, 0xAEF},
    {0xB66, 0xB6F},
    {0xBE6, 0xBEF},
    {0xC66, 0xC6F},
    {0xCE6, 0xCEF},
    {0xD66, 0xD6F},
    {0xE50, 0xE59},
    {0xED0, 0xED9},
    {0xF20, 0xF29},
    {0x1040, 0x1049},
    {0xFF10, 0xFF19},
    {0x1D7CE, 0x1D7FF},
}};

constexpr std::array<Range, 32> kMarks{{
    {0x300, 0x36F},   {0x483, 0x487},   {0x591, 0x5BD},   {0x5BF, 0x5BF},
    {0x5C1, 0x5C2},   {0x5C4, 0x5C5},   {0x5C7, 0x5C7},   {0x610, 0x61A},
    {0x64B, 0x65F},   {0x670, 0x670},   {0x6D6, 0x6DC},   {0x6DF, 0x6E4},
    {0x6E7, 0x6E8},   {0x6EA, 0x6ED},   {0x900, 0x903},   {0x93A, 0x93C},
    {0x93E, 0x94F},   {0x951, 0x957},   {0x962, 0x963},   {0x981, 0x983},
    {0x9BC, 0x9BC},   {0x9BE, 0x9CD},   {0xE31, 0xE31},   {0xE34, 0xE3A},
    {0xE47, 0xE4E},   {0x1AB0, 0x1AFF}, {0x1DC0, 0x1DFF}, {0x20D0, 0x20F0},
    {0x302A, 0x302F}, {0x3099, 0x309A}, {0xFE00, 0xFE0F}, {0xFE20, 0xFE2F},
}};

constexpr std::array<Range, 18> kCurrency{{
    {0x24, 0x24},
    {0xA2, 0xA5},
    {0x58F, 0x58F},
    {0x60B, 0x60B},
    {0x7FE, 0x7FF},
    {0x9F2, 0x9F3},
    {0x9FB, 0x9FB},
    {0xAF1, 0xAF1},
    {0xBF9, 0xBF9},
    {0xE3F, 0xE3F},
    {0x17DB, 0x17DB},
    {0x20A0, 0x20C0},
    {0xA838, 0xA838},
    {0xFDFC, 0xFDFC},
    {0xFE69, 0xFE69},
    {0xFF04, 0xFF04},
    {0xFFE0, 0xFFE1},
    {0xFFE5, 0xFFE6},
}};

constexpr std::array<Range, 6> kConnectors{{
    {0x5F, 0x5F},
    {0x203F, 0x2040},
    {0x2054, 0x2054},
    {0xFE33, 0xFE34},
    {0xFE4D, 0xFE4F},
    {0xFF3F, 0xFF3F},
}};

static_assert(isSortedTable(kWhitespace), "whitespace table must be sorted");
static_assert(isSortedTable(kLetters), "letter table must be sorted");
static_assert(isSortedTable(kDigits), "digit table must be sorted");
static_assert(isSortedTable(kMarks), "mark table must be sorted");
static_assert(isSortedTable(kCurrency), "currency table must be sorted");
static_assert(isSortedTable(kConnectors), "connector table must be sorted");

inline bool isContinuation(unsigned char b)
{
    return (b & 0xC0) == 0x80;
}

} // namespace

char32_t decodeUtf8At(std::string_view text, std::size_t &pos)
{
    const auto lead = static_cast<unsigned char>(text[pos]);
    if (lead < 0x80)
    {
        ++pos;
        return lead;
    }

    std::size_t len = 0;
    char32_t cp = 0;
    char32_t minValue = 0;
    if ((lead & 0xE0) == 0xC0)
    {
        len = 2;
        cp = lead & 0x1F;
        minValue = 0x80;
    }
    else if ((lead & 0xF0) == 0xE0)
    {
        len = 3;
        cp = lead & 0x0F;
        minValue = 0x800;
    }
    else if ((lead & 0xF8) == 0xF0)
    {
        len = 4;
        cp = lead & 0x07;
        minValue = 0x10000;
    }
    else
    {
        ++pos;
        return kReplacementChar;
    }

    if (pos + len > text.size())
    {
        ++pos;
        return kReplacementChar;
    }
    for (std::size_t i = 1; i < len; ++i)
    {
        const auto b = static_cast<unsigned char>(text[pos + i]);
        if (!isContinuation(b))
        {
            ++pos;
            return kReplacementChar;
        }
        cp = (cp << 6) | (b & 0x3F);
    }
    if (cp < minValue || cp > 0x10FFFF)
    {
        ++pos;
        return kReplacementChar;
    }
    pos += len;
    return cp;
}

void appendUtf8(char32_t cp, std::string &out)
{
    if (cp < 0x80)
    {
        out.push_back(static_cast<char>(cp));
    }
    else if (cp < 0x800)
    {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else if (cp < 0x10000)
    {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else if (cp <= 0x10FFFF)
    {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else
    {
        appendUtf8(kReplacementChar, out);
    }
}

bool isValidUtf8(std::string_view text)
{
    std::size_t pos = 0;
    while (pos < text.size())
    {
        const std::size_t start = pos;
        const char32_t cp = decodeUtf8At(text, pos);
        if (cp == kReplacementChar && text.substr(start, 3) != "\xEF\xBF\xBD")
            return false;
        if (cp >= 0xD800 && cp <= 0xDFFF)
            return false;
    }
    return true;
}

std::string latin1ToUtf8(std::string_view bytes)
{
    std::string out;
    out.reserve(bytes.size() * 2);
    for (char c : bytes)
        appendUtf8(static_cast<unsigned char>(c), out);
    return out;
}

bool isWhitespace(char32_t cp)
{
    return inTable(kWhitespace, cp);
}

bool isLetter(char32_t cp)
{
    return inTable(kLetters, cp);
}

bool isDecimalDigit(char32_t cp)
{
    return inTable(kDigits, cp);
}

bool isCombiningMark(char32_t cp)
{
    return inTable(kMarks, cp);
}

bool isCurrencySymbol(char32_t cp)
{
    return inTable(kCurrency, cp);
}

bool isConnectorPunctuation(char32_t cp)
{
    return inTable(kConnectors, cp);
}

bool isIdentifierStart(char32_t cp)
{
    return isLetter(cp) || isCurrencySymbol(cp) || isConnectorPunctuation(cp);
}

bool isIdentifierPart(char32_t cp)
{
    return isIdentifierStart(cp) || isDecimalDigit(cp) || isCombiningMark(cp);
}

} // namespace javelin::frontends::common::unicode
