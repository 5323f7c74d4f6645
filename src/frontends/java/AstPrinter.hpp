//===----------------------------------------------------------------------===//
//
// Part of the Javelin project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AstPrinter.hpp
/// @brief Human-readable dump of a Java syntax tree.
///
/// @details Produces an indentation-based tree dump. Each node is printed
/// with its kind, identifying attributes (names, operators, literal values)
/// and source location; children follow with one more level of indentation.
///
/// Example output for `class A { int f() { return 1 + x; } }`:
/// @code
///   CompilationUnit
///     ClassDecl "A" (1:1)
///       MethodDecl "f" (1:11)
///         ReturnType: int
///         Body:
///           ReturnStmt (1:21)
///             Binary + (1:28)
///               Literal DecimalInteger 1 (1:28)
///               MemberReference "x" (1:32)
/// @endcode
///
/// @invariant Printing never mutates the tree.
/// @invariant Output is deterministic.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/java/AST.hpp"

#include <string>

namespace javelin::frontends::java
{

/// @brief Produces a human-readable dump of a Java syntax tree.
class AstPrinter
{
  public:
    /// @brief Dump a whole compilation unit.
    std::string dump(const CompilationUnit &unit);

    /// @brief Dump a single expression subtree.
    std::string dump(const Expr &expr);

    /// @brief Dump a single statement subtree.
    std::string dump(const Stmt &stmt);
};

} // namespace javelin::frontends::java
