//===----------------------------------------------------------------------===//
//
// Part of the Javelin project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser_Type.cpp
/// @brief Type, type argument and type parameter parsing.
///
//===----------------------------------------------------------------------===//

#include "frontends/java/Parser.hpp"

#include <utility>

namespace javelin::frontends::java
{

/// @brief Parse a primitive or reference type followed by `[]` pairs.
TypePtr Parser::parseType()
{
    ProcedureScope scope(*this, __func__);
    TypePtr type;
    if (peek().is(TokenKind::BasicType))
        type = parseBasicType();
    else if (peek().is(TokenKind::Identifier))
        type = parseReferenceType();
    else
        illegal("Expected type");

    type->dimensions = parseArrayDimension();
    return type;
}

TypePtr Parser::parseBasicType()
{
    SourceLoc loc = peek().loc;
    return std::make_unique<BasicType>(loc, accept(TokenKind::BasicType));
}

/// @brief Parse `A<X>.B<Y>.C` as a chain of ReferenceType segments.
/// @details A dot is only taken when an identifier follows, so `Foo.class`
///          and `Outer.this` leave the dot for the caller.
std::unique_ptr<ReferenceType> Parser::parseReferenceType()
{
    ProcedureScope scope(*this, __func__);
    SourceLoc loc = peek().loc;
    auto head = std::make_unique<ReferenceType>(loc, parseIdentifier());
    ReferenceType *tail = head.get();

    while (true)
    {
        if (wouldAccept("<"))
            tail->arguments = parseTypeArguments();

        if (!wouldAccept(".", TokenKind::Identifier))
            break;
        accept(".");
        loc = peek().loc;
        tail->subType = std::make_unique<ReferenceType>(loc, parseIdentifier());
        tail = tail->subType.get();
    }
    return head;
}

std::vector<TypeArgument> Parser::parseTypeArguments()
{
    ProcedureScope scope(*this, __func__);
    std::vector<TypeArgument> arguments;
    accept("<");
    while (true)
    {
        arguments.push_back(parseTypeArgument());
        if (tryAccept(">"))
            break;
        accept(",");
    }
    return arguments;
}

/// @brief `?`, `? extends T`, `? super T`, or a plain type.
/// @details A primitive type argument must be an array, `int[]`.
TypeArgument Parser::parseTypeArgument()
{
    ProcedureScope scope(*this, __func__);
    TypeArgument argument;
    argument.loc = peek().loc;

    if (tryAccept("?"))
    {
        if (!wouldAccept("extends") && !wouldAccept("super"))
        {
            argument.patternType = "?";
            return argument;
        }
        argument.patternType = advance().text;
    }

    if (peek().is(TokenKind::BasicType))
    {
        argument.type = parseBasicType();
        accept("[", "]");
        argument.type->dimensions = 1 + parseArrayDimension();
    }
    else
    {
        argument.type = parseReferenceType();
        argument.type->dimensions = parseArrayDimension();
    }
    return argument;
}

std::vector<TypeArgument> Parser::parseNonWildcardTypeArguments()
{
    ProcedureScope scope(*this, __func__);
    accept("<");
    std::vector<TypePtr> types = parseTypeList();
    accept(">");

    std::vector<TypeArgument> arguments;
    arguments.reserve(types.size());
    for (auto &type : types)
    {
        TypeArgument argument;
        argument.loc = type->loc;
        argument.type = std::move(type);
        arguments.push_back(std::move(argument));
    }
    return arguments;
}

/// @brief Type arguments, or an empty list for the diamond `<>`.
std::vector<TypeArgument> Parser::parseTypeArgumentsOrDiamond()
{
    if (tryAccept("<", ">"))
        return {};
    return parseTypeArguments();
}

std::vector<TypeArgument> Parser::parseNonWildcardTypeArgumentsOrDiamond()
{
    if (tryAccept("<", ">"))
        return {};
    return parseNonWildcardTypeArguments();
}

/// @brief Comma separated types as in `implements A, B<C>`.
std::vector<TypePtr> Parser::parseTypeList()
{
    ProcedureScope scope(*this, __func__);
    std::vector<TypePtr> types;
    do
    {
        TypePtr type;
        if (peek().is(TokenKind::BasicType))
        {
            type = parseBasicType();
            accept("[", "]");
            type->dimensions = 1 + parseArrayDimension();
        }
        else
        {
            type = parseReferenceType();
            type->dimensions = parseArrayDimension();
        }
        types.push_back(std::move(type));
    } while (tryAccept(","));
    return types;
}

std::vector<TypeParameter> Parser::parseTypeParameters()
{
    ProcedureScope scope(*this, __func__);
    std::vector<TypeParameter> parameters;
    accept("<");
    while (true)
    {
        parameters.push_back(parseTypeParameter());
        if (tryAccept(">"))
            break;
        accept(",");
    }
    return parameters;
}

/// @brief `T`, `@A T`, `T extends A & B`.
TypeParameter Parser::parseTypeParameter()
{
    ProcedureScope scope(*this, __func__);
    TypeParameter parameter;
    if (isAnnotation())
        parameter.annotations = parseAnnotations();
    parameter.loc = peek().loc;
    parameter.name = parseIdentifier();

    if (tryAccept("extends"))
    {
        do
        {
            parameter.extends.push_back(parseReferenceType());
        } while (tryAccept("&"));
    }
    return parameter;
}

/// @brief Count consecutive `[]` pairs.
unsigned Parser::parseArrayDimension()
{
    unsigned dimensions = 0;
    while (tryAccept("[", "]"))
        ++dimensions;
    return dimensions;
}

} // namespace javelin::frontends::java
