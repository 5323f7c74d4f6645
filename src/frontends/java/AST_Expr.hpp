//===----------------------------------------------------------------------===//
//
// Part of the Javelin project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AST_Expr.hpp
/// @brief Expression nodes of the Java syntax tree.
///
/// ## Primaries
///
/// Operands that can carry unary operators, a dotted qualifier and a chain
/// of selectors derive from Primary. For `-a.b.c[0]++` the parser produces a
/// MemberReference with qualifier "a.b", member "c", one ArraySelector,
/// prefix "-" and postfix "++". Selectors are themselves primaries (field
/// accesses, method invocations, inner creators) or ArraySelector nodes.
///
/// ## Patterns
///
/// `x instanceof String s` becomes an InstanceOfPattern whose pattern is a
/// TypePattern; `x instanceof Point(int a, var b)` uses a RecordPattern whose
/// components are TypePattern or nested RecordPattern nodes. The pre-pattern
/// form `x instanceof String` stays a Binary node with op "instanceof".
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/java/AST_Types.hpp"
#include "frontends/java/Token.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace javelin::frontends::java
{

//===----------------------------------------------------------------------===//
// Primary base and leaf primaries
//===----------------------------------------------------------------------===//

/// @brief Operand with optional unary operators, qualifier and selectors.
struct Primary : Expr
{
    std::vector<std::string> prefixOperators;
    std::vector<std::string> postfixOperators;

    /// @brief Dotted prefix such as "java.lang" in `java.lang.Math.PI`.
    std::string qualifier;

    /// @brief Trailing `.member`, `.call()`, `[index]` ... in source order.
    std::vector<ExprPtr> selectors;

    Primary(ExprKind k, SourceLoc l) : Expr(k, l) {}
};

/// @brief Literal token; `value` is the token text (decoded for strings).
struct Literal : Primary
{
    std::string value;

    /// @brief Concrete token kind, e.g. HexInteger or String.
    TokenKind literalKind;

    Literal(SourceLoc l, std::string v, TokenKind k)
        : Primary(ExprKind::Literal, l), value(std::move(v)), literalKind(k)
    {
    }
};

/// @brief Name reference or field access: `x`, `a.b.c`, `.field`.
struct MemberReference : Primary
{
    std::string member;

    MemberReference(SourceLoc l, std::string m) : Primary(ExprKind::MemberReference, l), member(std::move(m))
    {
    }
};

/// @brief Method call: `foo(1)`, `a.b.<T>foo()`.
struct MethodInvocation : Primary
{
    std::string member;
    std::vector<ExprPtr> arguments;
    std::vector<TypeArgument> typeArguments;

    MethodInvocation(SourceLoc l, std::string m)
        : Primary(ExprKind::MethodInvocation, l), member(std::move(m))
    {
    }
};

/// @brief `this`, or `Outer.this` with qualifier "Outer".
struct This : Primary
{
    explicit This(SourceLoc l) : Primary(ExprKind::This, l) {}
};

/// @brief Bare `super`, only as the target of `super::method`.
struct Super : Primary
{
    explicit Super(SourceLoc l) : Primary(ExprKind::Super, l) {}
};

/// @brief `super.method(args)`.
struct SuperMethodInvocation : Primary
{
    std::string member;
    std::vector<ExprPtr> arguments;
    std::vector<TypeArgument> typeArguments;

    SuperMethodInvocation(SourceLoc l, std::string m)
        : Primary(ExprKind::SuperMethodInvocation, l), member(std::move(m))
    {
    }
};

/// @brief `super.field`.
struct SuperMemberReference : Primary
{
    std::string member;

    SuperMemberReference(SourceLoc l, std::string m)
        : Primary(ExprKind::SuperMemberReference, l), member(std::move(m))
    {
    }
};

/// @brief `super(args)` or `outer.super(args)` in a constructor body.
struct SuperConstructorInvocation : Primary
{
    std::vector<ExprPtr> arguments;
    std::vector<TypeArgument> typeArguments;

    explicit SuperConstructorInvocation(SourceLoc l) : Primary(ExprKind::SuperConstructorInvocation, l)
    {
    }
};

/// @brief `this(args)` in a constructor body.
struct ExplicitConstructorInvocation : Primary
{
    std::vector<ExprPtr> arguments;
    std::vector<TypeArgument> typeArguments;

    explicit ExplicitConstructorInvocation(SourceLoc l)
        : Primary(ExprKind::ExplicitConstructorInvocation, l)
    {
    }
};

/// @brief Class literal: `String.class`, `int[].class`.
struct ClassReference : Primary
{
    TypePtr type;

    ClassReference(SourceLoc l, TypePtr t) : Primary(ExprKind::ClassReference, l), type(std::move(t))
    {
    }
};

/// @brief `void.class`.
struct VoidClassReference : Primary
{
    explicit VoidClassReference(SourceLoc l) : Primary(ExprKind::VoidClassReference, l) {}
};

//===----------------------------------------------------------------------===//
// Creators
//===----------------------------------------------------------------------===//

/// @brief Shared shape of `new T(args) { body }` forms.
struct Creator : Primary
{
    std::vector<TypeArgument> constructorTypeArguments;
    std::unique_ptr<ReferenceType> type;
    std::vector<ExprPtr> arguments;

    /// @brief Anonymous class body; empty optional when absent.
    std::optional<std::vector<DeclPtr>> body;

    Creator(ExprKind k, SourceLoc l) : Primary(k, l) {}
};

/// @brief `new Foo<>(args)`, optionally with an anonymous class body.
struct ClassCreator : Creator
{
    explicit ClassCreator(SourceLoc l) : Creator(ExprKind::ClassCreator, l) {}
};

/// @brief `outer.new Inner(args)`; appears as a selector.
struct InnerClassCreator : Creator
{
    explicit InnerClassCreator(SourceLoc l) : Creator(ExprKind::InnerClassCreator, l) {}
};

/// @brief `new int[n][]` or `new int[] {1, 2}`.
struct ArrayCreator : Primary
{
    /// @brief Element type (without the creation dimensions).
    TypePtr type;

    /// @brief One entry per `[]`; null for an empty pair.
    std::vector<ExprPtr> dimensions;

    /// @brief Initializer; only when all dimensions are empty.
    ExprPtr initializer;

    explicit ArrayCreator(SourceLoc l) : Primary(ExprKind::ArrayCreator, l) {}
};

//===----------------------------------------------------------------------===//
// Other primaries
//===----------------------------------------------------------------------===//

/// @brief `(Type) expr`, including intersection casts `(A & B) expr`.
struct Cast : Primary
{
    TypePtr type;

    /// @brief Further bounds of an intersection cast.
    std::vector<TypePtr> additionalBounds;

    ExprPtr expression;

    explicit Cast(SourceLoc l) : Primary(ExprKind::Cast, l) {}
};

/// @brief `( expr )`; holds operators and selectors applied to the group.
struct Parenthesized : Primary
{
    ExprPtr expression;

    Parenthesized(SourceLoc l, ExprPtr e) : Primary(ExprKind::Parenthesized, l), expression(std::move(e))
    {
    }
};

/// @brief One `case ... ->` or `default ->` rule.
/// @details Exactly one of expression and body is set. body is a Block or a
///          Throw statement.
struct SwitchRule
{
    SourceLoc loc;
    bool isDefault = false;

    /// @brief Case labels: constants, enum names, `null`, patterns.
    std::vector<ExprPtr> labels;

    /// @brief `when` guard of a pattern label, or null.
    ExprPtr guard;

    ExprPtr expression;
    StmtPtr body;
};

/// @brief `switch (selector) { rules }` used as an expression.
/// @details Colon-form groups are represented as rules whose body is a
///          block.
struct SwitchExpression : Primary
{
    ExprPtr selector;
    std::vector<SwitchRule> rules;

    explicit SwitchExpression(SourceLoc l) : Primary(ExprKind::SwitchExpression, l) {}
};

/// @brief `[index]` selector.
struct ArraySelector : Expr
{
    ExprPtr index;

    ArraySelector(SourceLoc l, ExprPtr i) : Expr(ExprKind::ArraySelector, l), index(std::move(i)) {}
};

//===----------------------------------------------------------------------===//
// Operators
//===----------------------------------------------------------------------===//

/// @brief `target op= value`.
struct Assignment : Expr
{
    ExprPtr target;
    std::string op;
    ExprPtr value;

    Assignment(SourceLoc l, ExprPtr t, std::string o, ExprPtr v)
        : Expr(ExprKind::Assignment, l), target(std::move(t)), op(std::move(o)), value(std::move(v))
    {
    }
};

/// @brief Infix operation.
/// @details For op "instanceof" the right operand is a type: `right` is null
///          and `typeOperand` holds it.
struct Binary : Expr
{
    std::string op;
    ExprPtr left;
    ExprPtr right;
    TypePtr typeOperand;

    Binary(SourceLoc l, std::string o, ExprPtr lhs, ExprPtr rhs)
        : Expr(ExprKind::Binary, l), op(std::move(o)), left(std::move(lhs)), right(std::move(rhs))
    {
    }
};

/// @brief `condition ? ifTrue : ifFalse`.
struct Ternary : Expr
{
    ExprPtr condition;
    ExprPtr ifTrue;
    ExprPtr ifFalse;

    Ternary(SourceLoc l, ExprPtr c, ExprPtr t, ExprPtr f)
        : Expr(ExprKind::Ternary, l), condition(std::move(c)), ifTrue(std::move(t)), ifFalse(std::move(f))
    {
    }
};

/// @brief `expression instanceof <pattern>`.
struct InstanceOfPattern : Expr
{
    ExprPtr expression;

    /// @brief TypePattern or RecordPattern.
    ExprPtr pattern;

    InstanceOfPattern(SourceLoc l, ExprPtr e, ExprPtr p)
        : Expr(ExprKind::InstanceOfPattern, l), expression(std::move(e)), pattern(std::move(p))
    {
    }

    /// @brief The tested type, taken from the pattern.
    const TypeNode *type() const;
};

//===----------------------------------------------------------------------===//
// Patterns
//===----------------------------------------------------------------------===//

/// @brief `final String s`, `var x`.
struct TypePattern : Expr
{
    Modifiers modifiers;
    std::vector<ExprPtr> annotations;

    /// @brief Tested type; a ReferenceType named "var" for `var x`.
    TypePtr type;
    std::string name;

    explicit TypePattern(SourceLoc l) : Expr(ExprKind::TypePattern, l) {}
};

/// @brief `Point(int x, var y)`.
struct RecordPattern : Expr
{
    TypePtr type;

    /// @brief TypePattern or nested RecordPattern components.
    std::vector<ExprPtr> components;

    explicit RecordPattern(SourceLoc l) : Expr(ExprKind::RecordPattern, l) {}
};

inline const TypeNode *InstanceOfPattern::type() const
{
    if (!pattern)
        return nullptr;
    if (pattern->kind == ExprKind::TypePattern)
        return static_cast<const TypePattern *>(pattern.get())->type.get();
    if (pattern->kind == ExprKind::RecordPattern)
        return static_cast<const RecordPattern *>(pattern.get())->type.get();
    return nullptr;
}

//===----------------------------------------------------------------------===//
// Lambdas and method references
//===----------------------------------------------------------------------===//

/// @brief Lambda parameter; `type` is null for an inferred parameter.
struct LambdaParameter
{
    SourceLoc loc;
    Modifiers modifiers;
    std::vector<ExprPtr> annotations;
    TypePtr type;
    std::string name;
    bool varargs = false;
};

/// @brief `(params) -> body`.
/// @details Exactly one of bodyExpression and bodyBlock is set; bodyBlock is
///          a Block statement.
struct Lambda : Expr
{
    std::vector<LambdaParameter> parameters;
    ExprPtr bodyExpression;
    StmtPtr bodyBlock;

    explicit Lambda(SourceLoc l) : Expr(ExprKind::Lambda, l) {}
};

/// @brief `expression::method`, `Type::new`, `super::method`.
struct MethodReference : Expr
{
    /// @brief Left of `::` when it parses as an expression (`System.out`,
    ///        `String`, `this`, `super`).
    ExprPtr expression;

    /// @brief Left of `::` when only a type fits (`int[]`, `List<String>`).
    TypePtr type;

    /// @brief Right of `::`; a MemberReference whose member may be "new".
    ExprPtr method;

    std::vector<TypeArgument> typeArguments;

    explicit MethodReference(SourceLoc l) : Expr(ExprKind::MethodReference, l) {}
};

//===----------------------------------------------------------------------===//
// Initializers and annotations
//===----------------------------------------------------------------------===//

/// @brief `{a, b, {c}}`.
struct ArrayInitializer : Expr
{
    std::vector<ExprPtr> initializers;

    explicit ArrayInitializer(SourceLoc l) : Expr(ExprKind::ArrayInitializer, l) {}
};

/// @brief `name = value` inside an annotation.
struct ElementValuePair
{
    SourceLoc loc;
    std::string name;
    ExprPtr value;
};

/// @brief `@Name`, `@Name(value)`, `@Name(a = 1, b = 2)`.
/// @details A single unnamed value is stored in `element`; named values in
///          `pairs`. Both are empty for a marker annotation.
struct Annotation : Expr
{
    std::string name;
    std::vector<ElementValuePair> pairs;
    ExprPtr element;

    Annotation(SourceLoc l, std::string n) : Expr(ExprKind::Annotation, l), name(std::move(n)) {}
};

/// @brief `{v1, v2}` as an annotation element value.
struct ElementArrayValue : Expr
{
    std::vector<ExprPtr> values;

    explicit ElementArrayValue(SourceLoc l) : Expr(ExprKind::ElementArrayValue, l) {}
};

} // namespace javelin::frontends::java
