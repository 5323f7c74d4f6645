//===----------------------------------------------------------------------===//
//
// Part of the Javelin project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AST_Stmt.hpp
/// @brief Statement nodes and the variable/parameter records they share
///        with declarations.
///
/// Bodies that are always blocks (try, catch, finally, synchronized, method
/// bodies) are stored as plain statement vectors. A nested `{ ... }` written
/// as a statement is a BlockStmt.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/java/AST_Expr.hpp"

#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace javelin::frontends::java
{

//===----------------------------------------------------------------------===//
// Shared records
//===----------------------------------------------------------------------===//

/// @brief `name[] = initializer` in a field or local declaration.
struct VariableDeclarator
{
    SourceLoc loc;
    std::string name;

    /// @brief `[]` pairs written after the name (C-style arrays).
    unsigned dimensions = 0;

    ExprPtr initializer;
};

/// @brief Method, constructor or lambda parameter and record component.
struct FormalParameter
{
    SourceLoc loc;
    Modifiers modifiers;
    std::vector<ExprPtr> annotations;
    TypePtr type;
    std::string name;
    bool varargs = false;
};

/// @brief Modifiers, type and declarators of a local variable declaration.
struct VariableDeclaration
{
    SourceLoc loc;
    Modifiers modifiers;
    std::vector<ExprPtr> annotations;

    /// @brief Declared type; a ReferenceType named "var" for `var`.
    TypePtr type;

    std::vector<VariableDeclarator> declarators;
};

//===----------------------------------------------------------------------===//
// Statements
//===----------------------------------------------------------------------===//

/// @brief `{ statements }`.
struct BlockStmt : Stmt
{
    std::vector<StmtPtr> statements;

    explicit BlockStmt(SourceLoc l) : Stmt(StmtKind::Block, l) {}
};

/// @brief Lone `;`.
struct EmptyStmt : Stmt
{
    explicit EmptyStmt(SourceLoc l) : Stmt(StmtKind::Empty, l) {}
};

/// @brief `label: statement`.
struct LabeledStmt : Stmt
{
    std::string label;
    StmtPtr body;

    LabeledStmt(SourceLoc l, std::string lbl, StmtPtr b)
        : Stmt(StmtKind::Labeled, l), label(std::move(lbl)), body(std::move(b))
    {
    }
};

/// @brief `int a = 1, b;` inside a block.
struct LocalVariableStmt : Stmt
{
    VariableDeclaration declaration;

    explicit LocalVariableStmt(SourceLoc l) : Stmt(StmtKind::LocalVariable, l) {}
};

/// @brief Class, interface, enum or record declared inside a block.
struct LocalTypeStmt : Stmt
{
    DeclPtr declaration;

    LocalTypeStmt(SourceLoc l, DeclPtr d) : Stmt(StmtKind::LocalType, l), declaration(std::move(d)) {}
};

struct IfStmt : Stmt
{
    ExprPtr condition;
    StmtPtr thenStmt;
    StmtPtr elseStmt;

    explicit IfStmt(SourceLoc l) : Stmt(StmtKind::If, l) {}
};

/// @brief `assert condition : value;`.
struct AssertStmt : Stmt
{
    ExprPtr condition;
    ExprPtr value;

    explicit AssertStmt(SourceLoc l) : Stmt(StmtKind::Assert, l) {}
};

/// @brief `case A, B:` or `default:` followed by statements.
struct SwitchGroup
{
    SourceLoc loc;
    bool isDefault = false;
    std::vector<ExprPtr> labels;
    ExprPtr guard;
    std::vector<StmtPtr> statements;
};

/// @brief Switch statement.
/// @details A body uses either colon groups or arrow rules; the other
///          vector stays empty.
struct SwitchStmt : Stmt
{
    ExprPtr expression;
    std::vector<SwitchGroup> groups;
    std::vector<SwitchRule> rules;

    explicit SwitchStmt(SourceLoc l) : Stmt(StmtKind::Switch, l) {}
};

struct WhileStmt : Stmt
{
    ExprPtr condition;
    StmtPtr body;

    explicit WhileStmt(SourceLoc l) : Stmt(StmtKind::While, l) {}
};

struct DoStmt : Stmt
{
    ExprPtr condition;
    StmtPtr body;

    explicit DoStmt(SourceLoc l) : Stmt(StmtKind::Do, l) {}
};

/// @brief Classic `for (init; condition; update)` control.
/// @details init is either a declaration or a list of expressions.
struct ForControl
{
    std::optional<VariableDeclaration> initDeclaration;
    std::vector<ExprPtr> init;
    ExprPtr condition;
    std::vector<ExprPtr> update;
};

/// @brief `for (Type name : iterable)` control.
struct EnhancedForControl
{
    VariableDeclaration var;
    ExprPtr iterable;
};

struct ForStmt : Stmt
{
    std::variant<ForControl, EnhancedForControl> control;
    StmtPtr body;

    explicit ForStmt(SourceLoc l) : Stmt(StmtKind::For, l) {}
};

/// @brief `break;` or `break label;`.
struct BreakStmt : Stmt
{
    std::string label;

    explicit BreakStmt(SourceLoc l) : Stmt(StmtKind::Break, l) {}
};

/// @brief `continue;` or `continue label;`.
struct ContinueStmt : Stmt
{
    std::string label;

    explicit ContinueStmt(SourceLoc l) : Stmt(StmtKind::Continue, l) {}
};

struct ReturnStmt : Stmt
{
    ExprPtr expression;

    explicit ReturnStmt(SourceLoc l) : Stmt(StmtKind::Return, l) {}
};

struct ThrowStmt : Stmt
{
    ExprPtr expression;

    explicit ThrowStmt(SourceLoc l) : Stmt(StmtKind::Throw, l) {}
};

/// @brief `synchronized (lock) { block }`.
struct SynchronizedStmt : Stmt
{
    ExprPtr lock;
    std::vector<StmtPtr> block;

    explicit SynchronizedStmt(SourceLoc l) : Stmt(StmtKind::Synchronized, l) {}
};

/// @brief `catch (final A | B e) { block }`.
struct CatchClause
{
    SourceLoc loc;
    Modifiers modifiers;
    std::vector<ExprPtr> annotations;

    /// @brief Qualified names of the caught types.
    std::vector<std::string> types;

    std::string name;
    std::vector<StmtPtr> block;
};

/// @brief Resource of a try-with-resources statement.
/// @details A declaration has a type, name and value; a Java 9 reference to
///          an existing variable has only `value`.
struct TryResource
{
    SourceLoc loc;
    Modifiers modifiers;
    std::vector<ExprPtr> annotations;
    TypePtr type;
    std::string name;
    ExprPtr value;
};

struct TryStmt : Stmt
{
    /// @brief Empty optional for a plain try, possibly empty list otherwise.
    std::optional<std::vector<TryResource>> resources;

    std::vector<StmtPtr> block;
    std::vector<CatchClause> catches;
    std::optional<std::vector<StmtPtr>> finallyBlock;

    explicit TryStmt(SourceLoc l) : Stmt(StmtKind::Try, l) {}
};

/// @brief Expression used as a statement, `foo();`.
struct ExpressionStmt : Stmt
{
    ExprPtr expression;

    ExpressionStmt(SourceLoc l, ExprPtr e) : Stmt(StmtKind::Expression, l), expression(std::move(e)) {}
};

/// @brief `yield value;` inside a switch expression rule block.
struct YieldStmt : Stmt
{
    ExprPtr expression;

    YieldStmt(SourceLoc l, ExprPtr e) : Stmt(StmtKind::Yield, l), expression(std::move(e)) {}
};

} // namespace javelin::frontends::java
