//===----------------------------------------------------------------------===//
//
// Part of the Javelin project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Options.hpp
/// @brief Options controlling the Java lexer and parser.
///
/// Ownership/Lifetime: Value types, constructed by the caller and passed by
/// const reference. ParseOptions::traceStream is borrowed, never owned.
///
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <iosfwd>

namespace javelin::frontends::java
{

/// @brief Deepest construct nesting the parser accepts before giving up.
inline constexpr unsigned kMaxParseDepth = 512;

/// @brief Options controlling tokenization.
struct LexerOptions
{
    /// @brief Collect lexical errors in Lexer::errors() instead of throwing.
    bool ignoreErrors{false};

    /// @brief File id stamped into every token location.
    uint32_t fileId{0};
};

/// @brief Options controlling parsing.
struct ParseOptions
{
    /// @brief Log entry and exit of every grammar procedure.
    /// @details Also enabled by the JAVELIN_DEBUG_PARSE environment variable.
    bool trace{false};

    /// @brief Print the token stream before parsing (parseSource only).
    bool dumpTokens{false};

    /// @brief Tokenize in best-effort mode (parseSource only).
    bool ignoreLexErrors{false};

    /// @brief Destination for trace and dump output; std::cerr when null.
    std::ostream *traceStream{nullptr};

    /// @brief File id for token locations (parseSource only).
    uint32_t fileId{0};

    /// @brief Maximum nesting of grammar procedures.
    unsigned maxDepth{kMaxParseDepth};
};

} // namespace javelin::frontends::java
