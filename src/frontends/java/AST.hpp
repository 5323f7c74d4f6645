//===----------------------------------------------------------------------===//
//
// Part of the Javelin project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AST.hpp
/// @brief Umbrella header for the Java syntax tree.
///
/// The tree has four node families, each with its own kind enum:
/// - TypeNode: BasicType, ReferenceType
/// - Expr: primaries, operators, lambdas, patterns, annotations
/// - Stmt: blocks, control flow, local declarations
/// - Decl: packages, imports, type declarations and their members
///
/// The parser produces a CompilationUnit; nothing mutates it afterwards.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/java/AST_Base.hpp"
#include "frontends/java/AST_Decl.hpp"
#include "frontends/java/AST_Expr.hpp"
#include "frontends/java/AST_Fwd.hpp"
#include "frontends/java/AST_Stmt.hpp"
#include "frontends/java/AST_Types.hpp"
