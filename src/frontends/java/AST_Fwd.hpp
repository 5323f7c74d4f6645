//===----------------------------------------------------------------------===//
//
// Part of the Javelin project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AST_Fwd.hpp
/// @brief Forward declarations and pointer aliases for the Java syntax tree.
///
/// Every node is owned by exactly one parent through a std::unique_ptr; the
/// CompilationUnit owns the whole tree.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <memory>
#include <set>
#include <string>

namespace javelin::frontends::java
{

struct Expr;
struct Stmt;
struct TypeNode;
struct Decl;
struct ReferenceType;
struct Annotation;

using ExprPtr = std::unique_ptr<Expr>;
using StmtPtr = std::unique_ptr<Stmt>;
using TypePtr = std::unique_ptr<TypeNode>;
using DeclPtr = std::unique_ptr<Decl>;

using SourceLoc = javelin::support::SourceLoc;

/// @brief Set of modifier words; `non-sealed` is stored as one entry.
using Modifiers = std::set<std::string>;

} // namespace javelin::frontends::java
