//===----------------------------------------------------------------------===//
//
// Part of the Javelin project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser_Expr.cpp
/// @brief Expression parsing for the Java parser.
///
/// @details Layers from loosest to tightest:
///   - parseExpression: assignment (right associative)
///   - parseExpressionl: conditional, lambda with one bare parameter, `::`
///   - parseExpression2: infix chain, folded by buildBinary()
///   - parseExpression3: prefix operators, casts, lambdas, primary,
///     selectors, postfix operators
///
//===----------------------------------------------------------------------===//

#include "frontends/java/Parser.hpp"

#include <algorithm>
#include <limits>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace javelin::frontends::java
{

namespace
{

/// @brief Binding level of an infix operator, or -1 if @p op is not one.
int precedenceOf(const std::string &op)
{
    static const std::unordered_map<std::string, int> kLevels = {
        {"||", 0},  {"&&", 1},  {"|", 2},  {"^", 3},  {"&", 4},          {"==", 5}, {"!=", 5},
        {"<", 6},   {">", 6},   {"<=", 6}, {">=", 6}, {"instanceof", 6}, {"<<", 7}, {">>", 7},
        {">>>", 7}, {"+", 8},   {"-", 8},  {"*", 9},  {"/", 9},          {"%", 9},
    };
    auto it = kLevels.find(op);
    return it == kLevels.end() ? -1 : it->second;
}

bool isAssignmentOperator(const std::string &op)
{
    static const std::unordered_set<std::string> kOps = {
        "=", "+=", "-=", "*=", "/=", "&=", "|=", "^=", "%=", "<<=", ">>=", ">>>=",
    };
    return kOps.count(op) != 0;
}

bool isPrefixOperator(const std::string &op)
{
    return op == "++" || op == "--" || op == "!" || op == "~" || op == "+" || op == "-";
}

/// @brief Would @p tok continue the preceding name as a selector or call?
bool isSelectorOrCall(const Token &tok)
{
    return tok.is(TokenKind::Separator) && (tok.text == "." || tok.text == "(" || tok.text == "[");
}

/// @brief Does any segment of @p type carry type arguments?
bool hasTypeArguments(const TypeNode &type)
{
    if (type.kind != TypeKind::Reference)
        return false;
    for (auto *ref = static_cast<const ReferenceType *>(&type); ref; ref = ref->subType.get())
    {
        if (ref->arguments)
            return true;
    }
    return false;
}

/// @brief Attach explicit type arguments to an invocation node.
void setInvocationTypeArguments(Expr &call, std::vector<TypeArgument> typeArguments)
{
    switch (call.kind)
    {
        case ExprKind::MethodInvocation:
            static_cast<MethodInvocation &>(call).typeArguments = std::move(typeArguments);
            break;
        case ExprKind::SuperMethodInvocation:
            static_cast<SuperMethodInvocation &>(call).typeArguments = std::move(typeArguments);
            break;
        case ExprKind::SuperConstructorInvocation:
            static_cast<SuperConstructorInvocation &>(call).typeArguments = std::move(typeArguments);
            break;
        case ExprKind::ExplicitConstructorInvocation:
            static_cast<ExplicitConstructorInvocation &>(call).typeArguments = std::move(typeArguments);
            break;
        default:
            break;
    }
}

std::string joinNames(const std::vector<std::string> &names, std::size_t count)
{
    std::string out;
    for (std::size_t i = 0; i < count; ++i)
    {
        if (i > 0)
            out += '.';
        out += names[i];
    }
    return out;
}

} // namespace

//===----------------------------------------------------------------------===//
// Assignment and Conditional
//===----------------------------------------------------------------------===//

ExprPtr Parser::parseExpression()
{
    ProcedureScope scope(*this, __func__);
    ExprPtr target = parseExpressionl();

    if (peek().is(TokenKind::Operator) && isAssignmentOperator(peek().text))
    {
        SourceLoc loc = target->loc;
        std::string op = advance().text;
        ExprPtr value = parseExpression();
        return std::make_unique<Assignment>(loc, std::move(target), std::move(op), std::move(value));
    }
    return target;
}

/// @details With @p allowLambda clear, `x -> ...` is left alone so that
///          `case X ->` and `when cond ->` keep their arrow.
ExprPtr Parser::parseExpressionl(bool allowLambda)
{
    ProcedureScope scope(*this, __func__);
    ExprPtr expr = parseExpression2();

    if (tryAccept("?"))
    {
        ExprPtr ifTrue = parseExpression();
        accept(":");
        ExprPtr ifFalse = parseExpressionl(allowLambda);
        SourceLoc loc = expr->loc;
        return std::make_unique<Ternary>(loc, std::move(expr), std::move(ifTrue), std::move(ifFalse));
    }

    if (allowLambda && wouldAccept("->"))
    {
        if (expr->kind == ExprKind::MemberReference)
        {
            auto &ref = static_cast<MemberReference &>(*expr);
            if (ref.qualifier.empty() && ref.selectors.empty() && ref.prefixOperators.empty() &&
                ref.postfixOperators.empty())
                return finishSingleParameterLambda(ref.loc, ref.member);
        }
        illegal("Invalid lambda parameter");
    }

    if (wouldAccept("::"))
    {
        auto ref = std::make_unique<MethodReference>(expr->loc);
        accept("::");
        ref->expression = std::move(expr);
        parseMethodReferenceRest(*ref);
        return ref;
    }
    return expr;
}

//===----------------------------------------------------------------------===//
// Infix Operators
//===----------------------------------------------------------------------===//

/// @brief Collect operands and operators, then fold them.
/// @details The right side of instanceof is a type or pattern kept on the
///          operator; its operand slot holds null.
ExprPtr Parser::parseExpression2()
{
    ProcedureScope scope(*this, __func__);
    std::vector<ExprPtr> operands;
    std::vector<InfixOperator> operators;
    operands.push_back(parseExpression3());

    while (true)
    {
        Token opToken = peek();
        std::string op = parseInfixOperator();
        if (op.empty())
            break;

        InfixOperator entry;
        entry.token = std::move(opToken);
        entry.op = std::move(op);

        if (entry.op != "instanceof")
        {
            operators.push_back(std::move(entry));
            operands.push_back(parseExpression3());
            continue;
        }

        if (wouldAccept("final") || isAnnotation())
        {
            entry.pattern = parsePattern();
        }
        else
        {
            SourceLoc loc = peek().loc;
            TypePtr type = parseType();
            if (wouldAccept("("))
            {
                entry.pattern = parseRecordPatternRest(loc, std::move(type));
            }
            else if (peek().is(TokenKind::Identifier) && !isSelectorOrCall(peek(1)))
            {
                auto pattern = std::make_unique<TypePattern>(loc);
                pattern->type = std::move(type);
                pattern->name = parseIdentifier();
                entry.pattern = std::move(pattern);
            }
            else
            {
                entry.type = std::move(type);
            }
        }
        operators.push_back(std::move(entry));
        operands.push_back(nullptr);
    }

    if (operators.empty())
        return std::move(operands.front());
    return buildBinary(operands, operators, 0, operators.size());
}

/// @brief Consume an infix operator and return its text, or return "".
/// @details The lexer never joins `>` characters, so touching `> >` and
///          `> > >` are the shift operators here.
std::string Parser::parseInfixOperator()
{
    if (wouldAccept("instanceof"))
        return accept("instanceof");
    if (!peek().is(TokenKind::Operator))
        return {};

    if (wouldAccept(">", ">", ">") && adjacent(0) && adjacent(1))
    {
        accept(">", ">", ">");
        return ">>>";
    }
    if (wouldAccept(">", ">") && adjacent(0))
    {
        accept(">", ">");
        return ">>";
    }

    if (precedenceOf(peek().text) < 0)
        return {};
    return advance().text;
}

/// @brief Fold operands[first..last] joined by operators[first..last).
/// @details Splits at every occurrence of the loosest operator in range
///          and combines the pieces left to right.
ExprPtr Parser::buildBinary(std::vector<ExprPtr> &operands,
                            std::vector<InfixOperator> &operators,
                            std::size_t first,
                            std::size_t last)
{
    if (first == last)
        return std::move(operands[first]);

    int lowest = std::numeric_limits<int>::max();
    for (std::size_t i = first; i < last; ++i)
        lowest = std::min(lowest, precedenceOf(operators[i].op));

    auto missingOperand = [this](const InfixOperator &op) -> void
    {
        lastError_ = "Expected expression";
        throw SyntaxError(lastError_, op.token);
    };

    ExprPtr result;
    std::size_t start = first;
    std::size_t pending = last;
    for (std::size_t i = first; i <= last; ++i)
    {
        if (i < last && precedenceOf(operators[i].op) != lowest)
            continue;

        ExprPtr piece = buildBinary(operands, operators, start, i);
        if (pending == last)
        {
            result = std::move(piece);
        }
        else
        {
            InfixOperator &op = operators[pending];
            if (!result)
                missingOperand(op);
            SourceLoc loc = result->loc;
            if (op.op == "instanceof")
            {
                if (op.pattern)
                {
                    result = std::make_unique<InstanceOfPattern>(loc, std::move(result), std::move(op.pattern));
                }
                else
                {
                    auto test = std::make_unique<Binary>(loc, op.op, std::move(result), nullptr);
                    test->typeOperand = std::move(op.type);
                    result = std::move(test);
                }
            }
            else
            {
                if (!piece)
                    missingOperand(op);
                result = std::make_unique<Binary>(loc, op.op, std::move(result), std::move(piece));
            }
        }
        pending = i;
        start = i + 1;
    }
    return result;
}

//===----------------------------------------------------------------------===//
// Unary Layer
//===----------------------------------------------------------------------===//

/// @brief Prefix operators, then a lambda, cast, method reference on a
///        type, or primary with its selectors and postfix operators.
/// @details A cast to a reference type is not taken when its operand would
///          start with `+`, `-`, `++` or `--`, so `(a) - b` stays a
///          subtraction.
ExprPtr Parser::parseExpression3()
{
    ProcedureScope scope(*this, __func__);
    SourceLoc loc = peek().loc;

    std::vector<std::string> prefix;
    while (peek().is(TokenKind::Operator) && isPrefixOperator(peek().text))
        prefix.push_back(advance().text);

    if (wouldAccept("("))
    {
        if (prefix.empty() && isLambdaStart())
            return parseLambdaExpression();

        ExprPtr cast;
        auto attempt = [&]
        {
            auto node = std::make_unique<Cast>(loc);
            accept("(");
            node->type = parseType();
            while (tryAccept("&"))
                node->additionalBounds.push_back(parseReferenceType());
            accept(")");
            if (node->type->kind == TypeKind::Reference && peek().is(TokenKind::Operator))
            {
                const std::string &next = peek().text;
                if (next == "+" || next == "-" || next == "++" || next == "--")
                    illegal("Expected expression");
            }
            if (wouldAccept(TokenKind::Identifier, "->"))
            {
                SourceLoc paramLoc = peek().loc;
                std::string name = parseIdentifier();
                node->expression = finishSingleParameterLambda(paramLoc, std::move(name));
            }
            else
            {
                node->expression = parseExpression3();
            }
            cast = std::move(node);
        };
        if (speculate(attempt))
        {
            static_cast<Cast &>(*cast).prefixOperators = std::move(prefix);
            return cast;
        }
    }

    if (prefix.empty() && (wouldAccept(TokenKind::Identifier, "<") || wouldAccept(TokenKind::Identifier, "[") ||
                           wouldAccept(TokenKind::BasicType, "[")))
    {
        ExprPtr reference;
        if (speculate([&] { reference = parseTypeMethodReference(); }))
            return reference;
    }

    ExprPtr expr = parsePrimary();
    // parsePrimary only builds Primary nodes.
    auto &primary = static_cast<Primary &>(*expr);

    while (wouldAccept(".") || wouldAccept("["))
        primary.selectors.push_back(parseSelector());

    while (wouldAccept("++") || wouldAccept("--"))
        primary.postfixOperators.push_back(advance().text);

    primary.prefixOperators = std::move(prefix);
    return expr;
}

//===----------------------------------------------------------------------===//
// Primaries
//===----------------------------------------------------------------------===//

ExprPtr Parser::parsePrimary()
{
    ProcedureScope scope(*this, __func__);
    SourceLoc loc = peek().loc;

    if (peek().isA(TokenKind::Literal))
        return parseLiteral();

    if (tryAccept("("))
    {
        ExprPtr inner = parseExpression();
        accept(")");
        return std::make_unique<Parenthesized>(loc, std::move(inner));
    }

    if (tryAccept("this"))
    {
        if (!wouldAccept("("))
            return std::make_unique<This>(loc);
        auto call = std::make_unique<ExplicitConstructorInvocation>(loc);
        call->arguments = parseArguments();
        return call;
    }

    if (tryAccept("super"))
    {
        if (wouldAccept("::"))
            return std::make_unique<Super>(loc);
        return parseSuperSuffix(loc);
    }

    if (tryAccept("new"))
        return parseCreator(loc);

    if (wouldAccept("<"))
        return parseExplicitGenericInvocation();

    if (peek().is(TokenKind::Identifier))
        return parseIdentifierPrimary();

    if (peek().is(TokenKind::BasicType))
    {
        TypePtr type = parseBasicType();
        type->dimensions = parseArrayDimension();
        accept(".", "class");
        return std::make_unique<ClassReference>(loc, std::move(type));
    }

    if (tryAccept("void"))
    {
        accept(".", "class");
        return std::make_unique<VoidClassReference>(loc);
    }

    if (wouldAccept("switch"))
        return parseSwitchExpression();

    illegal("Expected expression");
}

ExprPtr Parser::parseLiteral()
{
    if (!peek().isA(TokenKind::Literal))
        illegal("Expected literal");
    Token tok = advance();
    return std::make_unique<Literal>(tok.loc, std::move(tok.text), tok.kind);
}

/// @brief `( expression )` as used by if, while, switch and synchronized.
ExprPtr Parser::parseParExpression()
{
    ProcedureScope scope(*this, __func__);
    accept("(");
    ExprPtr expr = parseExpression();
    accept(")");
    return expr;
}

std::vector<ExprPtr> Parser::parseArguments()
{
    ProcedureScope scope(*this, __func__);
    std::vector<ExprPtr> arguments;
    accept("(");
    if (tryAccept(")"))
        return arguments;

    do
    {
        arguments.push_back(parseExpression());
    } while (tryAccept(","));
    accept(")");
    return arguments;
}

/// @brief What follows `super`: `(args)`, `.name`, `.name(args)` or
///        `.<T>name(args)`.
ExprPtr Parser::parseSuperSuffix(SourceLoc loc)
{
    ProcedureScope scope(*this, __func__);
    if (wouldAccept("("))
    {
        auto call = std::make_unique<SuperConstructorInvocation>(loc);
        call->arguments = parseArguments();
        return call;
    }

    accept(".");
    std::vector<TypeArgument> typeArguments;
    if (wouldAccept("<"))
        typeArguments = parseNonWildcardTypeArguments();
    std::string name = parseIdentifier();

    if (wouldAccept("(") || !typeArguments.empty())
    {
        auto call = std::make_unique<SuperMethodInvocation>(loc, std::move(name));
        call->typeArguments = std::move(typeArguments);
        call->arguments = parseArguments();
        return call;
    }
    return std::make_unique<SuperMemberReference>(loc, std::move(name));
}

/// @brief `<T>this(args)`, `<T>super(args)` or `<T>name(args)`.
ExprPtr Parser::parseExplicitGenericInvocation()
{
    ProcedureScope scope(*this, __func__);
    SourceLoc loc = peek().loc;
    std::vector<TypeArgument> typeArguments = parseNonWildcardTypeArguments();

    if (tryAccept("this"))
    {
        auto call = std::make_unique<ExplicitConstructorInvocation>(loc);
        call->typeArguments = std::move(typeArguments);
        call->arguments = parseArguments();
        return call;
    }
    return parseExplicitGenericInvocationSuffix(loc, std::move(typeArguments));
}

ExprPtr Parser::parseExplicitGenericInvocationSuffix(SourceLoc loc, std::vector<TypeArgument> typeArguments)
{
    ProcedureScope scope(*this, __func__);
    if (tryAccept("super"))
    {
        ExprPtr call = parseSuperSuffix(loc);
        setInvocationTypeArguments(*call, std::move(typeArguments));
        return call;
    }

    auto call = std::make_unique<MethodInvocation>(loc, parseIdentifier());
    call->typeArguments = std::move(typeArguments);
    call->arguments = parseArguments();
    return call;
}

/// @brief Primary that starts with a (qualified) name.
/// @details The dotted prefix becomes the node's qualifier:
///          - `a.b.c` is MemberReference c, qualifier "a.b"
///          - `a.b.f(x)` is MethodInvocation f, qualifier "a.b"
///          - `a.B.class`, `a.B[].class` are ClassReference, qualifier "a"
///          - `a.B.this`, `a.B.new C()`, `a.B.super.f()` and
///            `a.B.<T>f()` use the whole name "a.B" as qualifier
ExprPtr Parser::parseIdentifierPrimary()
{
    ProcedureScope scope(*this, __func__);
    SourceLoc loc = peek().loc;

    std::vector<std::string> names;
    names.push_back(parseIdentifier());
    while (wouldAccept(".", TokenKind::Identifier))
    {
        accept(".");
        names.push_back(parseIdentifier());
    }
    const std::string whole = joinNames(names, names.size());
    std::string qualifier = joinNames(names, names.size() - 1);

    if (wouldAccept("[", "]"))
    {
        auto type = std::make_unique<ReferenceType>(loc, names.back());
        type->dimensions = parseArrayDimension();
        accept(".", "class");
        auto ref = std::make_unique<ClassReference>(loc, std::move(type));
        ref->qualifier = std::move(qualifier);
        return ref;
    }

    if (wouldAccept("("))
    {
        auto call = std::make_unique<MethodInvocation>(loc, names.back());
        call->qualifier = std::move(qualifier);
        call->arguments = parseArguments();
        return call;
    }

    if (tryAccept(".", "class"))
    {
        auto ref = std::make_unique<ClassReference>(loc, std::make_unique<ReferenceType>(loc, names.back()));
        ref->qualifier = std::move(qualifier);
        return ref;
    }

    if (tryAccept(".", "this"))
    {
        auto self = std::make_unique<This>(loc);
        self->qualifier = whole;
        return self;
    }

    if (wouldAccept(".", "<"))
    {
        accept(".");
        std::vector<TypeArgument> typeArguments = parseNonWildcardTypeArguments();
        ExprPtr call = parseExplicitGenericInvocationSuffix(loc, std::move(typeArguments));
        static_cast<Primary &>(*call).qualifier = whole;
        return call;
    }

    if (tryAccept(".", "new"))
    {
        ExprPtr creator = parseInnerCreator(loc);
        static_cast<Primary &>(*creator).qualifier = whole;
        return creator;
    }

    if (tryAccept(".", "super"))
    {
        ExprPtr super;
        if (wouldAccept("::"))
            super = std::make_unique<Super>(loc);
        else
            super = parseSuperSuffix(loc);
        static_cast<Primary &>(*super).qualifier = whole;
        return super;
    }

    auto ref = std::make_unique<MemberReference>(loc, names.back());
    ref->qualifier = std::move(qualifier);
    return ref;
}

//===----------------------------------------------------------------------===//
// Creators
//===----------------------------------------------------------------------===//

/// @brief Everything after `new`.
ExprPtr Parser::parseCreator(SourceLoc loc)
{
    ProcedureScope scope(*this, __func__);
    std::vector<TypeArgument> typeArguments;
    if (wouldAccept("<"))
        typeArguments = parseNonWildcardTypeArguments();

    if (peek().is(TokenKind::BasicType))
    {
        if (!typeArguments.empty())
            illegal("Expected class type");
        return parseArrayCreatorRest(loc, parseBasicType());
    }

    std::unique_ptr<ReferenceType> type = parseCreatedName();
    if (wouldAccept("["))
    {
        if (!typeArguments.empty())
            illegal("Expected '('");
        return parseArrayCreatorRest(loc, std::move(type));
    }

    auto creator = std::make_unique<ClassCreator>(loc);
    creator->constructorTypeArguments = std::move(typeArguments);
    creator->type = std::move(type);
    creator->arguments = parseArguments();
    if (wouldAccept("{"))
        creator->body = parseClassBody();
    return creator;
}

/// @brief `a.B<T>.C<>`; every segment may carry arguments or a diamond.
std::unique_ptr<ReferenceType> Parser::parseCreatedName()
{
    ProcedureScope scope(*this, __func__);
    SourceLoc loc = peek().loc;
    auto head = std::make_unique<ReferenceType>(loc, parseIdentifier());
    ReferenceType *tail = head.get();

    while (true)
    {
        if (wouldAccept("<"))
            tail->arguments = parseTypeArgumentsOrDiamond();
        if (!tryAccept("."))
            break;
        loc = peek().loc;
        tail->subType = std::make_unique<ReferenceType>(loc, parseIdentifier());
        tail = tail->subType.get();
    }
    return head;
}

/// @brief `[n][m][]` or `[][] {initializer}` after the element type.
ExprPtr Parser::parseArrayCreatorRest(SourceLoc loc, TypePtr type)
{
    ProcedureScope scope(*this, __func__);
    auto creator = std::make_unique<ArrayCreator>(loc);
    creator->type = std::move(type);

    if (wouldAccept("[", "]"))
    {
        while (tryAccept("[", "]"))
            creator->dimensions.push_back(nullptr);
        creator->initializer = parseArrayInitializer();
        return creator;
    }

    do
    {
        accept("[");
        creator->dimensions.push_back(parseExpression());
        accept("]");
    } while (wouldAccept("[") && !wouldAccept("[", "]"));

    while (tryAccept("[", "]"))
        creator->dimensions.push_back(nullptr);
    return creator;
}

/// @brief `Inner<T>(args) { body }` after `outer.new`.
ExprPtr Parser::parseInnerCreator(SourceLoc loc)
{
    ProcedureScope scope(*this, __func__);
    auto creator = std::make_unique<InnerClassCreator>(loc);
    if (wouldAccept("<"))
        creator->constructorTypeArguments = parseNonWildcardTypeArguments();

    SourceLoc typeLoc = peek().loc;
    creator->type = std::make_unique<ReferenceType>(typeLoc, parseIdentifier());
    if (wouldAccept("<"))
        creator->type->arguments = parseTypeArgumentsOrDiamond();

    creator->arguments = parseArguments();
    if (wouldAccept("{"))
        creator->body = parseClassBody();
    return creator;
}

/// @brief `[index]`, `.name`, `.name(args)`, `.<T>name(args)`, `.this`,
///        `.new Inner()` or `.super...`.
ExprPtr Parser::parseSelector()
{
    ProcedureScope scope(*this, __func__);
    SourceLoc loc = peek().loc;

    if (tryAccept("["))
    {
        ExprPtr index = parseExpression();
        accept("]");
        return std::make_unique<ArraySelector>(loc, std::move(index));
    }

    accept(".");
    loc = peek().loc;

    if (tryAccept("new"))
        return parseInnerCreator(loc);
    if (tryAccept("this"))
        return std::make_unique<This>(loc);
    if (tryAccept("super"))
        return parseSuperSuffix(loc);
    if (wouldAccept("<"))
    {
        std::vector<TypeArgument> typeArguments = parseNonWildcardTypeArguments();
        return parseExplicitGenericInvocationSuffix(loc, std::move(typeArguments));
    }

    std::string name = parseIdentifier();
    if (wouldAccept("("))
    {
        auto call = std::make_unique<MethodInvocation>(loc, std::move(name));
        call->arguments = parseArguments();
        return call;
    }
    return std::make_unique<MemberReference>(loc, std::move(name));
}

//===----------------------------------------------------------------------===//
// Lambdas and Method References
//===----------------------------------------------------------------------===//

/// @details Only the parameter list and arrow are probed; the body is
///          parsed for real so its errors surface unchanged.
bool Parser::isLambdaStart()
{
    TokenCursor::Marker probe(cursor_);
    return speculate(
        [this]
        {
            parseLambdaParameters();
            accept("->");
        });
}

ExprPtr Parser::finishSingleParameterLambda(SourceLoc loc, std::string name)
{
    auto lambda = std::make_unique<Lambda>(loc);
    LambdaParameter parameter;
    parameter.loc = loc;
    parameter.name = std::move(name);
    lambda->parameters.push_back(std::move(parameter));
    accept("->");
    parseLambdaBody(*lambda);
    return lambda;
}

ExprPtr Parser::parseLambdaExpression()
{
    ProcedureScope scope(*this, __func__);
    auto lambda = std::make_unique<Lambda>(peek().loc);
    lambda->parameters = parseLambdaParameters();
    accept("->");
    parseLambdaBody(*lambda);
    return lambda;
}

std::vector<LambdaParameter> Parser::parseLambdaParameters()
{
    ProcedureScope scope(*this, __func__);
    std::vector<LambdaParameter> parameters;

    if (tryAccept("(", ")"))
        return parameters;

    if (wouldAccept("(", TokenKind::Identifier, ",") || wouldAccept("(", TokenKind::Identifier, ")"))
    {
        accept("(");
        do
        {
            LambdaParameter parameter;
            parameter.loc = peek().loc;
            parameter.name = parseIdentifier();
            parameters.push_back(std::move(parameter));
        } while (tryAccept(","));
        accept(")");
        return parameters;
    }

    for (FormalParameter &formal : parseFormalParameters())
    {
        LambdaParameter parameter;
        parameter.loc = formal.loc;
        parameter.modifiers = std::move(formal.modifiers);
        parameter.annotations = std::move(formal.annotations);
        parameter.type = std::move(formal.type);
        parameter.name = std::move(formal.name);
        parameter.varargs = formal.varargs;
        parameters.push_back(std::move(parameter));
    }
    return parameters;
}

void Parser::parseLambdaBody(Lambda &lambda)
{
    ProcedureScope scope(*this, __func__);
    if (!wouldAccept("{"))
    {
        lambda.bodyExpression = parseExpression();
        return;
    }

    YieldContext yield(*this, false);
    auto block = std::make_unique<BlockStmt>(peek().loc);
    block->statements = parseBlock();
    lambda.bodyBlock = std::move(block);
}

void Parser::parseMethodReferenceRest(MethodReference &ref)
{
    ProcedureScope scope(*this, __func__);
    if (wouldAccept("<"))
        ref.typeArguments = parseNonWildcardTypeArguments();

    SourceLoc loc = peek().loc;
    std::string name = wouldAccept("new") ? accept("new") : parseIdentifier();
    ref.method = std::make_unique<MemberReference>(loc, std::move(name));
}

ExprPtr Parser::parseTypeMethodReference()
{
    ProcedureScope scope(*this, __func__);
    SourceLoc loc = peek().loc;
    TypePtr type = parseType();
    if (type->dimensions == 0 && !hasTypeArguments(*type))
        illegal("Expected '::'");

    accept("::");
    auto ref = std::make_unique<MethodReference>(loc);
    ref->type = std::move(type);
    parseMethodReferenceRest(*ref);
    return ref;
}

//===----------------------------------------------------------------------===//
// Switch Expressions
//===----------------------------------------------------------------------===//

/// @details Colon groups become rules whose body is a block of the group's
///          statements.
ExprPtr Parser::parseSwitchExpression()
{
    ProcedureScope scope(*this, __func__);
    auto expr = std::make_unique<SwitchExpression>(peek().loc);
    accept("switch");
    expr->selector = parseParExpression();

    std::vector<SwitchGroup> groups;
    parseSwitchBody(groups, expr->rules, true);
    for (SwitchGroup &group : groups)
    {
        SwitchRule rule;
        rule.loc = group.loc;
        rule.isDefault = group.isDefault;
        rule.labels = std::move(group.labels);
        rule.guard = std::move(group.guard);
        auto block = std::make_unique<BlockStmt>(group.loc);
        block->statements = std::move(group.statements);
        rule.body = std::move(block);
        expr->rules.push_back(std::move(rule));
    }
    return expr;
}

} // namespace javelin::frontends::java
