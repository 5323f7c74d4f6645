//===----------------------------------------------------------------------===//
//
// Part of the Javelin project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AST_Base.hpp
/// @brief Node kinds and the four polymorphic node bases.
///
/// Each base carries a kind tag for downcasting and the location of the
/// node's first token. Bases are complete here so that any node may own a
/// child of any category.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/java/AST_Fwd.hpp"

#include <optional>
#include <string>
#include <vector>

namespace javelin::frontends::java
{

/// @brief Concrete type node kinds.
enum class TypeKind
{
    Basic,
    Reference,
};

/// @brief Concrete expression kinds.
enum class ExprKind
{
    // Primaries
    Literal,
    MemberReference,
    MethodInvocation,
    This,
    Super,
    SuperMethodInvocation,
    SuperMemberReference,
    SuperConstructorInvocation,
    ExplicitConstructorInvocation,
    ClassReference,
    VoidClassReference,
    ClassCreator,
    InnerClassCreator,
    ArrayCreator,
    Cast,
    Parenthesized,
    SwitchExpression,

    // Selectors
    ArraySelector,

    // Operators
    Assignment,
    Binary,
    Ternary,
    InstanceOfPattern,

    // Functional
    Lambda,
    MethodReference,

    // Patterns
    TypePattern,
    RecordPattern,

    // Initializers and annotations
    ArrayInitializer,
    Annotation,
    ElementArrayValue,
};

/// @brief Concrete statement kinds.
enum class StmtKind
{
    Block,
    Empty,
    Labeled,
    LocalVariable,
    LocalType,
    If,
    Assert,
    Switch,
    While,
    Do,
    For,
    Break,
    Continue,
    Return,
    Throw,
    Synchronized,
    Try,
    Expression,
    Yield,
};

/// @brief Concrete declaration kinds.
enum class DeclKind
{
    Package,
    Import,
    Class,
    Interface,
    Enum,
    Record,
    AnnotationType,
    Method,
    Constructor,
    Field,
    Constant,
    AnnotationMethod,
    Initializer,
};

/// @brief Base of all type nodes.
struct TypeNode
{
    TypeKind kind;
    SourceLoc loc;

    /// @brief Number of trailing `[]` pairs.
    unsigned dimensions = 0;

    TypeNode(TypeKind k, SourceLoc l) : kind(k), loc(l) {}

    virtual ~TypeNode() = default;
};

/// @brief Base of all expression nodes.
struct Expr
{
    ExprKind kind;
    SourceLoc loc;

    Expr(ExprKind k, SourceLoc l) : kind(k), loc(l) {}

    virtual ~Expr() = default;
};

/// @brief Base of all statement nodes.
struct Stmt
{
    StmtKind kind;
    SourceLoc loc;

    Stmt(StmtKind k, SourceLoc l) : kind(k), loc(l) {}

    virtual ~Stmt() = default;
};

/// @brief Base of all declarations.
/// @details Modifiers, annotations and the documentation comment are common
///          to every declaration form, so they live here.
struct Decl
{
    DeclKind kind;
    SourceLoc loc;

    Modifiers modifiers;

    /// @brief Annotations in source order (each an Annotation expression).
    std::vector<ExprPtr> annotations;

    /// @brief `/** ... */` comment preceding the declaration, verbatim.
    std::optional<std::string> documentation;

    Decl(DeclKind k, SourceLoc l) : kind(k), loc(l) {}

    virtual ~Decl() = default;
};

} // namespace javelin::frontends::java
