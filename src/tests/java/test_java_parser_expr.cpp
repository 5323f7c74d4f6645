//===----------------------------------------------------------------------===//
//
// Part of the Javelin project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Unit tests for Java expression parsing: precedence, associativity, casts,
// lambdas, method references, creators, primaries and selectors.
//
//===----------------------------------------------------------------------===//

#include "frontends/java/Errors.hpp"
#include "frontends/java/Lexer.hpp"
#include "frontends/java/Parser.hpp"

#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <vector>

using namespace javelin::frontends::java;

namespace
{

/// @brief Parse @p src as one complete expression.
ExprPtr parseExpr(std::string_view src)
{
    Lexer lexer(src);
    Parser parser(lexer);
    ExprPtr expr = parser.parseExpression();
    parser.expectEnd();
    return expr;
}

template <typename T> const T &as(const ExprPtr &expr, ExprKind kind)
{
    EXPECT_TRUE(expr != nullptr);
    EXPECT_EQ(expr->kind, kind);
    return static_cast<const T &>(*expr);
}

const Binary &binary(const ExprPtr &expr, const char *op)
{
    const auto &node = as<Binary>(expr, ExprKind::Binary);
    EXPECT_EQ(node.op, op);
    return node;
}

std::string literalValue(const ExprPtr &expr)
{
    return as<Literal>(expr, ExprKind::Literal).value;
}

std::string memberName(const ExprPtr &expr)
{
    return as<MemberReference>(expr, ExprKind::MemberReference).member;
}

} // namespace

//===----------------------------------------------------------------------===//
// Operators
//===----------------------------------------------------------------------===//

TEST(JavaParserExpr, MultiplicationBindsTighter)
{
    ExprPtr expr = parseExpr("1 + 2 * 3");
    const Binary &sum = binary(expr, "+");
    EXPECT_EQ(literalValue(sum.left), "1");
    const Binary &product = binary(sum.right, "*");
    EXPECT_EQ(literalValue(product.left), "2");
    EXPECT_EQ(literalValue(product.right), "3");
}

TEST(JavaParserExpr, SubtractionIsLeftAssociative)
{
    ExprPtr expr = parseExpr("1 - 2 - 3");
    const Binary &outer = binary(expr, "-");
    EXPECT_EQ(literalValue(outer.right), "3");
    const Binary &inner = binary(outer.left, "-");
    EXPECT_EQ(literalValue(inner.left), "1");
    EXPECT_EQ(literalValue(inner.right), "2");
}

TEST(JavaParserExpr, LogicalOperatorLevels)
{
    ExprPtr expr = parseExpr("a || b && c | d ^ e & f == g");
    const Binary &orExpr = binary(expr, "||");
    EXPECT_EQ(memberName(orExpr.left), "a");
    const Binary &andExpr = binary(orExpr.right, "&&");
    const Binary &bitOr = binary(andExpr.right, "|");
    const Binary &bitXor = binary(bitOr.right, "^");
    const Binary &bitAnd = binary(bitXor.right, "&");
    const Binary &eq = binary(bitAnd.right, "==");
    EXPECT_EQ(memberName(eq.right), "g");
}

TEST(JavaParserExpr, ShiftsRecombinedFromAdjacentTokens)
{
    ExprPtr expr = parseExpr("a >> 2 + b >>> c");
    const Binary &outer = binary(expr, ">>>");
    EXPECT_EQ(memberName(outer.right), "c");
    const Binary &shift = binary(outer.left, ">>");
    binary(shift.right, "+");
}

TEST(JavaParserExpr, SeparatedAnglesAreNotAShift)
{
    EXPECT_THROW(parseExpr("a > > 2"), SyntaxError);
}

TEST(JavaParserExpr, RelationalAfterShift)
{
    ExprPtr expr = parseExpr("a << 1 < b");
    const Binary &less = binary(expr, "<");
    binary(less.left, "<<");
}

TEST(JavaParserExpr, AssignmentIsRightAssociative)
{
    ExprPtr expr = parseExpr("a = b += c");
    const auto &outer = as<Assignment>(expr, ExprKind::Assignment);
    EXPECT_EQ(outer.op, "=");
    EXPECT_EQ(memberName(outer.target), "a");
    const auto &inner = as<Assignment>(outer.value, ExprKind::Assignment);
    EXPECT_EQ(inner.op, "+=");
    EXPECT_EQ(memberName(inner.value), "c");
}

TEST(JavaParserExpr, CompoundShiftAssignment)
{
    ExprPtr expr = parseExpr("x >>>= 3");
    EXPECT_EQ(as<Assignment>(expr, ExprKind::Assignment).op, ">>>=");
}

TEST(JavaParserExpr, NestedTernaryGroupsRight)
{
    ExprPtr expr = parseExpr("a ? b : c ? d : e");
    const auto &outer = as<Ternary>(expr, ExprKind::Ternary);
    EXPECT_EQ(memberName(outer.condition), "a");
    EXPECT_EQ(memberName(outer.ifTrue), "b");
    const auto &inner = as<Ternary>(outer.ifFalse, ExprKind::Ternary);
    EXPECT_EQ(memberName(inner.condition), "c");
    EXPECT_EQ(memberName(inner.ifFalse), "e");
}

TEST(JavaParserExpr, PrefixAndPostfixOperators)
{
    ExprPtr expr = parseExpr("-~i++");
    const auto &ref = as<MemberReference>(expr, ExprKind::MemberReference);
    EXPECT_EQ(ref.member, "i");
    EXPECT_EQ(ref.prefixOperators, (std::vector<std::string>{"-", "~"}));
    EXPECT_EQ(ref.postfixOperators, (std::vector<std::string>{"++"}));
}

TEST(JavaParserExpr, MissingOperandIsError)
{
    try
    {
        parseExpr("1 +");
        FAIL() << "expected SyntaxError";
    }
    catch (const SyntaxError &e)
    {
        EXPECT_STREQ(e.what(), "Expected expression");
        EXPECT_TRUE(e.token().isEnd());
    }
}

//===----------------------------------------------------------------------===//
// instanceof
//===----------------------------------------------------------------------===//

TEST(JavaParserExpr, InstanceOfType)
{
    ExprPtr expr = parseExpr("x instanceof String[]");
    const Binary &test = binary(expr, "instanceof");
    EXPECT_EQ(test.right, nullptr);
    ASSERT_NE(test.typeOperand, nullptr);
    EXPECT_EQ(test.typeOperand->dimensions, 1u);
}

TEST(JavaParserExpr, InstanceOfBindsLikeRelational)
{
    ExprPtr expr = parseExpr("x instanceof Foo && y");
    const Binary &andExpr = binary(expr, "&&");
    binary(andExpr.left, "instanceof");
}

TEST(JavaParserExpr, InstanceOfTypePattern)
{
    ExprPtr expr = parseExpr("o instanceof String s && s.isEmpty()");
    const Binary &andExpr = binary(expr, "&&");
    const auto &test = as<InstanceOfPattern>(andExpr.left, ExprKind::InstanceOfPattern);
    EXPECT_EQ(memberName(test.expression), "o");
    const auto &pattern = as<TypePattern>(test.pattern, ExprKind::TypePattern);
    EXPECT_EQ(pattern.name, "s");
    ASSERT_NE(test.type(), nullptr);
    EXPECT_EQ(static_cast<const ReferenceType *>(test.type())->name, "String");
}

TEST(JavaParserExpr, InstanceOfNameFollowedBySelectorHasNoBinding)
{
    for (const char *src : {"o instanceof Foo bar(1)", "o instanceof Foo bar.baz", "o instanceof Foo bar[0]"})
    {
        Lexer lexer(src);
        Parser parser(lexer);
        ExprPtr expr = parser.parseExpression();
        const Binary &test = binary(expr, "instanceof");
        ASSERT_NE(test.typeOperand, nullptr) << src;
        EXPECT_EQ(static_cast<const ReferenceType &>(*test.typeOperand).name, "Foo") << src;
        EXPECT_THROW(parser.expectEnd(), SyntaxError) << src;
    }
}

TEST(JavaParserExpr, InstanceOfFinalPattern)
{
    ExprPtr expr = parseExpr("o instanceof final String s");
    const auto &test = as<InstanceOfPattern>(expr, ExprKind::InstanceOfPattern);
    const auto &pattern = as<TypePattern>(test.pattern, ExprKind::TypePattern);
    EXPECT_EQ(pattern.modifiers.count("final"), 1u);
}

//===----------------------------------------------------------------------===//
// Casts
//===----------------------------------------------------------------------===//

TEST(JavaParserExpr, ReferenceCast)
{
    ExprPtr expr = parseExpr("(String) obj");
    const auto &cast = as<Cast>(expr, ExprKind::Cast);
    EXPECT_EQ(cast.type->kind, TypeKind::Reference);
    EXPECT_EQ(memberName(cast.expression), "obj");
}

TEST(JavaParserExpr, PrimitiveCastOfNegation)
{
    ExprPtr expr = parseExpr("(int) -x");
    const auto &cast = as<Cast>(expr, ExprKind::Cast);
    EXPECT_EQ(cast.type->kind, TypeKind::Basic);
    const auto &operand = as<MemberReference>(cast.expression, ExprKind::MemberReference);
    EXPECT_EQ(operand.prefixOperators, (std::vector<std::string>{"-"}));
}

TEST(JavaParserExpr, ParenthesizedNameMinusIsSubtraction)
{
    ExprPtr expr = parseExpr("(a) - b");
    const Binary &diff = binary(expr, "-");
    const auto &paren = as<Parenthesized>(diff.left, ExprKind::Parenthesized);
    EXPECT_EQ(memberName(paren.expression), "a");
}

TEST(JavaParserExpr, IntersectionCast)
{
    ExprPtr expr = parseExpr("(Runnable & Serializable) () -> {}");
    const auto &cast = as<Cast>(expr, ExprKind::Cast);
    EXPECT_EQ(cast.additionalBounds.size(), 1u);
    as<Lambda>(cast.expression, ExprKind::Lambda);
}

TEST(JavaParserExpr, CastOfBareParameterLambda)
{
    ExprPtr expr = parseExpr("(Predicate<String>) s -> s.isEmpty()");
    const auto &cast = as<Cast>(expr, ExprKind::Cast);
    EXPECT_EQ(static_cast<const ReferenceType &>(*cast.type).name, "Predicate");
    const auto &lambda = as<Lambda>(cast.expression, ExprKind::Lambda);
    ASSERT_EQ(lambda.parameters.size(), 1u);
    EXPECT_EQ(lambda.parameters[0].name, "s");
    const auto &call = as<MethodInvocation>(lambda.bodyExpression, ExprKind::MethodInvocation);
    EXPECT_EQ(call.member, "isEmpty");

    ExprPtr bounded = parseExpr("(Function<A, B> & Serializable) x -> x");
    const auto &boundedCast = as<Cast>(bounded, ExprKind::Cast);
    EXPECT_EQ(boundedCast.additionalBounds.size(), 1u);
    const auto &identity = as<Lambda>(boundedCast.expression, ExprKind::Lambda);
    EXPECT_EQ(identity.parameters[0].name, "x");
    EXPECT_EQ(memberName(identity.bodyExpression), "x");
}

TEST(JavaParserExpr, GenericCast)
{
    ExprPtr expr = parseExpr("(List<String>) raw");
    const auto &cast = as<Cast>(expr, ExprKind::Cast);
    const auto &type = static_cast<const ReferenceType &>(*cast.type);
    ASSERT_TRUE(type.arguments.has_value());
    EXPECT_EQ(type.arguments->size(), 1u);
}

//===----------------------------------------------------------------------===//
// Lambdas and method references
//===----------------------------------------------------------------------===//

TEST(JavaParserExpr, SingleParameterLambda)
{
    ExprPtr expr = parseExpr("x -> x + 1");
    const auto &lambda = as<Lambda>(expr, ExprKind::Lambda);
    ASSERT_EQ(lambda.parameters.size(), 1u);
    EXPECT_EQ(lambda.parameters[0].name, "x");
    EXPECT_EQ(lambda.parameters[0].type, nullptr);
    binary(lambda.bodyExpression, "+");
}

TEST(JavaParserExpr, InferredParameterList)
{
    ExprPtr expr = parseExpr("(a, b) -> a");
    const auto &lambda = as<Lambda>(expr, ExprKind::Lambda);
    EXPECT_EQ(lambda.parameters.size(), 2u);
    EXPECT_EQ(lambda.bodyBlock, nullptr);
}

TEST(JavaParserExpr, TypedParametersWithBlockBody)
{
    ExprPtr expr = parseExpr("(int a, final String... rest) -> { return a; }");
    const auto &lambda = as<Lambda>(expr, ExprKind::Lambda);
    ASSERT_EQ(lambda.parameters.size(), 2u);
    EXPECT_EQ(lambda.parameters[0].type->kind, TypeKind::Basic);
    EXPECT_TRUE(lambda.parameters[1].varargs);
    EXPECT_EQ(lambda.parameters[1].modifiers.count("final"), 1u);
    ASSERT_NE(lambda.bodyBlock, nullptr);
    const auto &block = static_cast<const BlockStmt &>(*lambda.bodyBlock);
    ASSERT_EQ(block.statements.size(), 1u);
    EXPECT_EQ(block.statements[0]->kind, StmtKind::Return);
}

TEST(JavaParserExpr, VarLambdaParameters)
{
    ExprPtr expr = parseExpr("(var a, var b) -> a");
    const auto &lambda = as<Lambda>(expr, ExprKind::Lambda);
    ASSERT_EQ(lambda.parameters.size(), 2u);
    EXPECT_EQ(static_cast<const ReferenceType &>(*lambda.parameters[0].type).name, "var");
}

TEST(JavaParserExpr, EmptyParameterLambda)
{
    ExprPtr expr = parseExpr("() -> 42");
    const auto &lambda = as<Lambda>(expr, ExprKind::Lambda);
    EXPECT_TRUE(lambda.parameters.empty());
    EXPECT_EQ(literalValue(lambda.bodyExpression), "42");
}

TEST(JavaParserExpr, LambdaAsArgument)
{
    ExprPtr expr = parseExpr("list.forEach(item -> print(item))");
    const auto &call = as<MethodInvocation>(expr, ExprKind::MethodInvocation);
    EXPECT_EQ(call.qualifier, "list");
    ASSERT_EQ(call.arguments.size(), 1u);
    as<Lambda>(call.arguments[0], ExprKind::Lambda);
}

TEST(JavaParserExpr, InvalidLambdaParameter)
{
    try
    {
        parseExpr("a.b -> 1");
        FAIL() << "expected SyntaxError";
    }
    catch (const SyntaxError &e)
    {
        EXPECT_STREQ(e.what(), "Invalid lambda parameter");
    }
}

TEST(JavaParserExpr, ExpressionMethodReference)
{
    ExprPtr expr = parseExpr("String::valueOf");
    const auto &ref = as<MethodReference>(expr, ExprKind::MethodReference);
    EXPECT_EQ(memberName(ref.expression), "String");
    EXPECT_EQ(memberName(ref.method), "valueOf");
}

TEST(JavaParserExpr, TypeMethodReferences)
{
    ExprPtr arrayNew = parseExpr("int[]::new");
    const auto &ref = as<MethodReference>(arrayNew, ExprKind::MethodReference);
    ASSERT_NE(ref.type, nullptr);
    EXPECT_EQ(ref.type->dimensions, 1u);
    EXPECT_EQ(memberName(ref.method), "new");

    ExprPtr generic = parseExpr("List<String>::size");
    const auto &genericRef = as<MethodReference>(generic, ExprKind::MethodReference);
    ASSERT_NE(genericRef.type, nullptr);
    EXPECT_EQ(memberName(genericRef.method), "size");
}

TEST(JavaParserExpr, SuperAndThisMethodReferences)
{
    ExprPtr superRef = parseExpr("super::toString");
    as<Super>(as<MethodReference>(superRef, ExprKind::MethodReference).expression, ExprKind::Super);

    ExprPtr thisRef = parseExpr("this::<T>run");
    const auto &ref = as<MethodReference>(thisRef, ExprKind::MethodReference);
    as<This>(ref.expression, ExprKind::This);
    EXPECT_EQ(ref.typeArguments.size(), 1u);
}

//===----------------------------------------------------------------------===//
// Primaries and selectors
//===----------------------------------------------------------------------===//

TEST(JavaParserExpr, Literals)
{
    ExprPtr hex = parseExpr("0x1F");
    EXPECT_EQ(as<Literal>(hex, ExprKind::Literal).literalKind, TokenKind::HexInteger);
    EXPECT_EQ(literalValue(hex), "0x1F");

    ExprPtr str = parseExpr(R"("a\n")");
    EXPECT_EQ(as<Literal>(str, ExprKind::Literal).literalKind, TokenKind::String);
    EXPECT_EQ(literalValue(str), "a\n");

    EXPECT_EQ(as<Literal>(parseExpr("null"), ExprKind::Literal).literalKind, TokenKind::Null);
    EXPECT_EQ(as<Literal>(parseExpr("true"), ExprKind::Literal).literalKind, TokenKind::Boolean);
}

TEST(JavaParserExpr, QualifiedNameBecomesQualifier)
{
    ExprPtr expr = parseExpr("a.b.c");
    const auto &ref = as<MemberReference>(expr, ExprKind::MemberReference);
    EXPECT_EQ(ref.member, "c");
    EXPECT_EQ(ref.qualifier, "a.b");
    EXPECT_TRUE(ref.selectors.empty());
}

TEST(JavaParserExpr, CallWithSelectors)
{
    ExprPtr expr = parseExpr("a.f(x, 1).g()[2].h");
    const auto &call = as<MethodInvocation>(expr, ExprKind::MethodInvocation);
    EXPECT_EQ(call.member, "f");
    EXPECT_EQ(call.qualifier, "a");
    EXPECT_EQ(call.arguments.size(), 2u);
    ASSERT_EQ(call.selectors.size(), 3u);
    EXPECT_EQ(as<MethodInvocation>(call.selectors[0], ExprKind::MethodInvocation).member, "g");
    as<ArraySelector>(call.selectors[1], ExprKind::ArraySelector);
    EXPECT_EQ(memberName(call.selectors[2]), "h");
}

TEST(JavaParserExpr, ArrayIndexIsNotATypeReference)
{
    ExprPtr expr = parseExpr("x[i + 1]");
    const auto &ref = as<MemberReference>(expr, ExprKind::MemberReference);
    ASSERT_EQ(ref.selectors.size(), 1u);
    const auto &index = as<ArraySelector>(ref.selectors[0], ExprKind::ArraySelector);
    binary(index.index, "+");
}

TEST(JavaParserExpr, ClassLiterals)
{
    ExprPtr plain = parseExpr("java.lang.String.class");
    const auto &ref = as<ClassReference>(plain, ExprKind::ClassReference);
    EXPECT_EQ(ref.qualifier, "java.lang");

    ExprPtr array = parseExpr("int[][].class");
    EXPECT_EQ(as<ClassReference>(array, ExprKind::ClassReference).type->dimensions, 2u);

    as<VoidClassReference>(parseExpr("void.class"), ExprKind::VoidClassReference);
}

TEST(JavaParserExpr, QualifiedThisAndSuper)
{
    ExprPtr self = parseExpr("Outer.this");
    EXPECT_EQ(as<This>(self, ExprKind::This).qualifier, "Outer");

    ExprPtr call = parseExpr("Outer.super.run()");
    const auto &superCall = as<SuperMethodInvocation>(call, ExprKind::SuperMethodInvocation);
    EXPECT_EQ(superCall.member, "run");
    EXPECT_EQ(superCall.qualifier, "Outer");
}

TEST(JavaParserExpr, ExplicitGenericInvocation)
{
    ExprPtr expr = parseExpr("Collections.<String>emptyList()");
    const auto &call = as<MethodInvocation>(expr, ExprKind::MethodInvocation);
    EXPECT_EQ(call.member, "emptyList");
    EXPECT_EQ(call.qualifier, "Collections");
    EXPECT_EQ(call.typeArguments.size(), 1u);
}

//===----------------------------------------------------------------------===//
// Creators
//===----------------------------------------------------------------------===//

TEST(JavaParserExpr, DiamondCreator)
{
    ExprPtr expr = parseExpr("new java.util.ArrayList<>(16)");
    const auto &creator = as<ClassCreator>(expr, ExprKind::ClassCreator);
    EXPECT_EQ(creator.type->qualifiedName(), "java.util.ArrayList");
    EXPECT_EQ(creator.arguments.size(), 1u);
    EXPECT_FALSE(creator.body.has_value());
}

TEST(JavaParserExpr, AnonymousClassCreator)
{
    ExprPtr expr = parseExpr("new Runnable() { public void run() {} }");
    const auto &creator = as<ClassCreator>(expr, ExprKind::ClassCreator);
    ASSERT_TRUE(creator.body.has_value());
    ASSERT_EQ(creator.body->size(), 1u);
    EXPECT_EQ((*creator.body)[0]->kind, DeclKind::Method);
}

TEST(JavaParserExpr, ArrayCreators)
{
    ExprPtr sized = parseExpr("new int[3][]");
    const auto &creator = as<ArrayCreator>(sized, ExprKind::ArrayCreator);
    ASSERT_EQ(creator.dimensions.size(), 2u);
    EXPECT_NE(creator.dimensions[0], nullptr);
    EXPECT_EQ(creator.dimensions[1], nullptr);
    EXPECT_EQ(creator.initializer, nullptr);

    ExprPtr init = parseExpr("new String[][] {{\"a\"}, {}}");
    const auto &withInit = as<ArrayCreator>(init, ExprKind::ArrayCreator);
    EXPECT_EQ(withInit.dimensions.size(), 2u);
    const auto &outer = as<ArrayInitializer>(withInit.initializer, ExprKind::ArrayInitializer);
    EXPECT_EQ(outer.initializers.size(), 2u);
}

TEST(JavaParserExpr, InnerCreator)
{
    ExprPtr expr = parseExpr("outer.new Inner(1)");
    const auto &creator = as<InnerClassCreator>(expr, ExprKind::InnerClassCreator);
    EXPECT_EQ(creator.qualifier, "outer");
    EXPECT_EQ(creator.type->name, "Inner");
}
