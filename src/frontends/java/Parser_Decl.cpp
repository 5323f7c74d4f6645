//===----------------------------------------------------------------------===//
//
// Part of the Javelin project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser_Decl.cpp
/// @brief Compilation unit, type declaration and member parsing.
///
//===----------------------------------------------------------------------===//

#include "frontends/java/Parser.hpp"

#include <utility>

namespace javelin::frontends::java
{

void Parser::applyModifiers(Decl &decl, ModifierList &&mods)
{
    decl.modifiers = std::move(mods.modifiers);
    decl.annotations = std::move(mods.annotations);
    decl.documentation = std::move(mods.documentation);
}

//===----------------------------------------------------------------------===//
// Compilation Unit
//===----------------------------------------------------------------------===//

/// @brief Parse package, imports and top-level declarations up to the end.
/// @details Annotations in front of `package` belong to the package; in
///          front of anything else they are re-read as part of the first
///          declaration. Stray semicolons between declarations are skipped.
std::unique_ptr<CompilationUnit> Parser::parseCompilationUnit()
{
    ProcedureScope scope(*this, __func__);
    auto unit = std::make_unique<CompilationUnit>();

    {
        TokenCursor::Marker marker(cursor_);
        std::optional<std::string> documentation = peek().javadoc;
        std::vector<ExprPtr> annotations;
        if (isAnnotation())
            annotations = parseAnnotations();

        if (wouldAccept("package"))
        {
            marker.commit();
            auto package = std::make_unique<PackageDecl>(peek().loc);
            accept("package");
            package->name = parseQualifiedIdentifier();
            package->annotations = std::move(annotations);
            package->documentation = std::move(documentation);
            accept(";");
            unit->package = std::move(package);
        }
    }

    while (wouldAccept("import"))
        unit->imports.push_back(parseImportDeclaration());

    while (!atEnd())
    {
        if (tryAccept(";"))
            continue;

        ModifierList mods = parseModifiers();
        if (isTypeDeclarationStart())
            unit->types.push_back(parseTypeDeclarationRest(std::move(mods)));
        else
            unit->types.push_back(parseTopLevelMethodDeclaration(std::move(mods)));
    }
    return unit;
}

std::unique_ptr<ImportDecl> Parser::parseImportDeclaration()
{
    ProcedureScope scope(*this, __func__);
    auto decl = std::make_unique<ImportDecl>(peek().loc);
    accept("import");
    decl->isStatic = tryAccept("static");

    decl->path = parseIdentifier();
    while (tryAccept("."))
    {
        if (tryAccept("*"))
        {
            decl->wildcard = true;
            break;
        }
        decl->path += "." + parseIdentifier();
    }
    accept(";");
    return decl;
}

/// @brief Method declared outside any class (unnamed class form).
DeclPtr Parser::parseTopLevelMethodDeclaration(ModifierList mods)
{
    ProcedureScope scope(*this, __func__);
    SourceLoc loc = peek().loc;

    std::vector<TypeParameter> typeParameters;
    if (wouldAccept("<"))
        typeParameters = parseTypeParameters();

    TypePtr returnType;
    if (!tryAccept("void"))
    {
        if (!peek().is(TokenKind::Identifier) && !peek().is(TokenKind::BasicType))
            illegal("Expected type or method declaration");
        returnType = parseType();
    }

    std::string name = parseIdentifier();
    auto method = parseMethodDeclaratorRest(loc, std::move(returnType), std::move(name));
    method->typeParameters = std::move(typeParameters);
    applyModifiers(*method, std::move(mods));
    return method;
}

//===----------------------------------------------------------------------===//
// Modifiers and Annotations
//===----------------------------------------------------------------------===//

/// @brief Collect modifier keywords and annotations in any order.
/// @details The documentation comment of the first token becomes the
///          declaration's documentation.
Parser::ModifierList Parser::parseModifiers()
{
    ProcedureScope scope(*this, __func__);
    ModifierList mods;
    mods.documentation = peek().javadoc;

    while (true)
    {
        if (peek().is(TokenKind::Modifier))
        {
            mods.modifiers.insert(advance().text);
        }
        else if (isNonSealedModifier())
        {
            accept("non", "-", "sealed");
            mods.modifiers.insert("non-sealed");
        }
        else if (isSealedModifier())
        {
            accept("sealed");
            mods.modifiers.insert("sealed");
        }
        else if (isAnnotation())
        {
            mods.annotations.push_back(parseAnnotation());
        }
        else
        {
            break;
        }
    }
    return mods;
}

/// @brief `sealed` followed by something that can only continue a
///        declaration header.
bool Parser::isSealedModifier()
{
    if (!wouldAccept(TokenKind::Identifier) || peek().text != "sealed")
        return false;
    const Token &next = peek(1);
    if (next.is(TokenKind::Modifier) || next.is(TokenKind::Annotation))
        return true;
    return wouldAccept("sealed", "class") || wouldAccept("sealed", "interface") ||
           wouldAccept("sealed", "non", "-", "sealed");
}

/// @brief `non-sealed` written as three touching tokens.
bool Parser::isNonSealedModifier()
{
    return wouldAccept("non", "-", "sealed") && peek().is(TokenKind::Identifier) && adjacent(0) && adjacent(1);
}

std::vector<ExprPtr> Parser::parseAnnotations()
{
    ProcedureScope scope(*this, __func__);
    std::vector<ExprPtr> annotations;
    do
    {
        annotations.push_back(parseAnnotation());
    } while (isAnnotation());
    return annotations;
}

/// @brief `@Name`, `@Name(value)` or `@Name(key = value, ...)`.
ExprPtr Parser::parseAnnotation()
{
    ProcedureScope scope(*this, __func__);
    SourceLoc loc = peek().loc;
    accept("@");
    auto annotation = std::make_unique<Annotation>(loc, parseQualifiedIdentifier());

    if (tryAccept("("))
    {
        if (wouldAccept(TokenKind::Identifier, "="))
        {
            do
            {
                ElementValuePair pair;
                pair.loc = peek().loc;
                pair.name = parseIdentifier();
                accept("=");
                pair.value = parseElementValue();
                annotation->pairs.push_back(std::move(pair));
            } while (tryAccept(","));
        }
        else if (!wouldAccept(")"))
        {
            annotation->element = parseElementValue();
        }
        accept(")");
    }
    return annotation;
}

ExprPtr Parser::parseElementValue()
{
    ProcedureScope scope(*this, __func__);
    if (isAnnotation())
        return parseAnnotation();
    if (wouldAccept("{"))
        return parseElementValueArrayInitializer();
    return parseExpressionl(false);
}

/// @brief `{v1, v2,}` inside an annotation; a trailing comma is allowed.
ExprPtr Parser::parseElementValueArrayInitializer()
{
    ProcedureScope scope(*this, __func__);
    auto array = std::make_unique<ElementArrayValue>(peek().loc);
    accept("{");
    if (tryAccept("}"))
        return array;

    while (true)
    {
        array->values.push_back(parseElementValue());
        if (wouldAccept("}") || wouldAccept(",", "}"))
            break;
        accept(",");
    }
    tryAccept(",");
    accept("}");
    return array;
}

//===----------------------------------------------------------------------===//
// Type Declarations
//===----------------------------------------------------------------------===//

bool Parser::isTypeDeclarationStart()
{
    return wouldAccept("class") || wouldAccept("enum") || wouldAccept("interface") || isAnnotationDeclaration() ||
           wouldAccept("record", TokenKind::Identifier, "(") || wouldAccept("record", TokenKind::Identifier, "<");
}

DeclPtr Parser::parseClassOrInterfaceDeclaration()
{
    ProcedureScope scope(*this, __func__);
    return parseTypeDeclarationRest(parseModifiers());
}

/// @brief Dispatch on the introducing keyword once modifiers are read.
DeclPtr Parser::parseTypeDeclarationRest(ModifierList mods)
{
    ProcedureScope scope(*this, __func__);
    DeclPtr decl;
    if (wouldAccept("class"))
        decl = parseNormalClassDeclaration();
    else if (wouldAccept("enum"))
        decl = parseEnumDeclaration();
    else if (wouldAccept("interface"))
        decl = parseNormalInterfaceDeclaration();
    else if (isAnnotationDeclaration())
        decl = parseAnnotationTypeDeclaration();
    else if (wouldAccept("record", TokenKind::Identifier))
        decl = parseRecordDeclaration();
    else
        illegal("Expected type declaration");

    applyModifiers(*decl, std::move(mods));
    return decl;
}

DeclPtr Parser::parseNormalClassDeclaration()
{
    ProcedureScope scope(*this, __func__);
    auto decl = std::make_unique<ClassDecl>(peek().loc);
    accept("class");
    decl->name = parseIdentifier();

    if (wouldAccept("<"))
        decl->typeParameters = parseTypeParameters();
    if (tryAccept("extends"))
        decl->extends = parseType();
    if (tryAccept("implements"))
        decl->implements = parseTypeList();
    if (tryAccept("permits"))
        decl->permits = parseTypeList();

    decl->body = parseClassBody();
    return decl;
}

DeclPtr Parser::parseEnumDeclaration()
{
    ProcedureScope scope(*this, __func__);
    auto decl = std::make_unique<EnumDecl>(peek().loc);
    accept("enum");
    decl->name = parseIdentifier();

    if (tryAccept("implements"))
        decl->implements = parseTypeList();

    parseEnumBody(*decl);
    return decl;
}

DeclPtr Parser::parseNormalInterfaceDeclaration()
{
    ProcedureScope scope(*this, __func__);
    auto decl = std::make_unique<InterfaceDecl>(peek().loc);
    accept("interface");
    decl->name = parseIdentifier();

    if (wouldAccept("<"))
        decl->typeParameters = parseTypeParameters();
    if (tryAccept("extends"))
        decl->extends = parseTypeList();
    if (tryAccept("permits"))
        decl->permits = parseTypeList();

    decl->body = parseInterfaceBody();
    return decl;
}

DeclPtr Parser::parseAnnotationTypeDeclaration()
{
    ProcedureScope scope(*this, __func__);
    auto decl = std::make_unique<AnnotationTypeDecl>(peek().loc);
    accept("@", "interface");
    decl->name = parseIdentifier();
    decl->body = parseAnnotationTypeBody();
    return decl;
}

/// @brief `record Name<T>(components) implements I { body }`.
DeclPtr Parser::parseRecordDeclaration()
{
    ProcedureScope scope(*this, __func__);
    auto decl = std::make_unique<RecordDecl>(peek().loc);
    accept("record");
    decl->name = parseIdentifier();

    if (wouldAccept("<"))
        decl->typeParameters = parseTypeParameters();
    decl->components = parseRecordComponents();
    if (tryAccept("implements"))
        decl->implements = parseTypeList();

    if (wouldAccept("{"))
        decl->body = parseClassBody();
    return decl;
}

/// @brief Record header; the last component may be variable arity.
std::vector<FormalParameter> Parser::parseRecordComponents()
{
    ProcedureScope scope(*this, __func__);
    std::vector<FormalParameter> components;
    accept("(");
    if (tryAccept(")"))
        return components;

    while (true)
    {
        FormalParameter component;
        ModifierList mods = parseVariableModifiers();
        component.modifiers = std::move(mods.modifiers);
        component.annotations = std::move(mods.annotations);
        component.loc = peek().loc;
        component.type = parseType();
        component.varargs = tryAccept("...");
        component.name = parseIdentifier();

        const bool last = component.varargs;
        components.push_back(std::move(component));
        if (last || !tryAccept(","))
            break;
    }
    accept(")");
    return components;
}

//===----------------------------------------------------------------------===//
// Class and Interface Bodies
//===----------------------------------------------------------------------===//

std::vector<DeclPtr> Parser::parseClassBody()
{
    ProcedureScope scope(*this, __func__);
    YieldContext yield(*this, false);
    std::vector<DeclPtr> body;
    accept("{");
    while (!tryAccept("}"))
    {
        if (atEnd())
            illegal("Expected '}'");
        if (DeclPtr member = parseClassBodyDeclaration())
            body.push_back(std::move(member));
    }
    return body;
}

/// @brief One class member; returns null for a lone `;`.
DeclPtr Parser::parseClassBodyDeclaration()
{
    ProcedureScope scope(*this, __func__);
    if (tryAccept(";"))
        return nullptr;

    if (wouldAccept("static", "{") || wouldAccept("{"))
    {
        auto init = std::make_unique<InitializerDecl>(peek().loc);
        init->documentation = peek().javadoc;
        init->isStatic = tryAccept("static");
        if (init->isStatic)
            init->modifiers.insert("static");
        init->body = parseBlock();
        return init;
    }

    return parseMemberDeclaration(false);
}

std::vector<DeclPtr> Parser::parseInterfaceBody()
{
    ProcedureScope scope(*this, __func__);
    YieldContext yield(*this, false);
    std::vector<DeclPtr> body;
    accept("{");
    while (!tryAccept("}"))
    {
        if (atEnd())
            illegal("Expected '}'");
        if (tryAccept(";"))
            continue;
        body.push_back(parseMemberDeclaration(true));
    }
    return body;
}

/// @brief Nested type, method, constructor or field.
/// @details Interface members never declare constructors, and their
///          fields are constants that must be initialized.
DeclPtr Parser::parseMemberDeclaration(bool interfaceMember)
{
    ProcedureScope scope(*this, __func__);
    ModifierList mods = parseModifiers();

    if (isTypeDeclarationStart())
        return parseTypeDeclarationRest(std::move(mods));

    SourceLoc loc = peek().loc;
    DeclPtr member;

    if (tryAccept("void"))
    {
        std::string name = parseIdentifier();
        member = parseMethodDeclaratorRest(loc, nullptr, std::move(name));
    }
    else if (wouldAccept("<"))
    {
        std::vector<TypeParameter> typeParameters = parseTypeParameters();
        if (!interfaceMember && wouldAccept(TokenKind::Identifier, "("))
        {
            auto ctor = parseConstructorDeclaratorRest(loc, parseIdentifier());
            ctor->typeParameters = std::move(typeParameters);
            member = std::move(ctor);
        }
        else
        {
            TypePtr returnType;
            if (!tryAccept("void"))
                returnType = parseType();
            std::string name = parseIdentifier();
            auto method = parseMethodDeclaratorRest(loc, std::move(returnType), std::move(name));
            method->typeParameters = std::move(typeParameters);
            member = std::move(method);
        }
    }
    else if (!interfaceMember && wouldAccept(TokenKind::Identifier, "("))
    {
        member = parseConstructorDeclaratorRest(loc, parseIdentifier());
    }
    else if (!interfaceMember && wouldAccept(TokenKind::Identifier, "{"))
    {
        // Compact canonical constructor of a record.
        auto ctor = std::make_unique<ConstructorDecl>(loc);
        ctor->name = parseIdentifier();
        ctor->compact = true;
        ctor->body = parseBlock();
        member = std::move(ctor);
    }
    else
    {
        TypePtr type = parseType();
        SourceLoc nameLoc = peek().loc;
        std::string name = parseIdentifier();
        if (wouldAccept("("))
            member = parseMethodDeclaratorRest(loc, std::move(type), std::move(name));
        else
            member = parseFieldDeclaratorsRest(loc, std::move(type), nameLoc, std::move(name), interfaceMember);
    }

    applyModifiers(*member, std::move(mods));
    return member;
}

/// @brief `(params) [] throws X, Y { body }` or `... ;`.
/// @details Dimensions after the parameter list belong to the return type.
std::unique_ptr<MethodDecl> Parser::parseMethodDeclaratorRest(SourceLoc loc, TypePtr returnType, std::string name)
{
    ProcedureScope scope(*this, __func__);
    auto method = std::make_unique<MethodDecl>(loc);
    method->name = std::move(name);
    method->parameters = parseFormalParameters();
    if (returnType)
        returnType->dimensions += parseArrayDimension();
    method->returnType = std::move(returnType);

    if (tryAccept("throws"))
        method->throws = parseQualifiedIdentifierList();

    if (wouldAccept("{"))
        method->body = parseBlock();
    else
        accept(";");
    return method;
}

std::unique_ptr<ConstructorDecl> Parser::parseConstructorDeclaratorRest(SourceLoc loc, std::string name)
{
    ProcedureScope scope(*this, __func__);
    auto ctor = std::make_unique<ConstructorDecl>(loc);
    ctor->name = std::move(name);
    ctor->parameters = parseFormalParameters();
    if (tryAccept("throws"))
        ctor->throws = parseQualifiedIdentifierList();
    ctor->body = parseBlock();
    return ctor;
}

/// @brief Remaining declarators of a field and the closing `;`.
/// @param constant Interface or annotation constant; every declarator
///        needs an initializer.
DeclPtr Parser::parseFieldDeclaratorsRest(
    SourceLoc loc, TypePtr type, SourceLoc nameLoc, std::string name, bool constant)
{
    ProcedureScope scope(*this, __func__);
    std::unique_ptr<FieldDecl> field;
    if (constant)
        field = std::make_unique<ConstantDecl>(loc);
    else
        field = std::make_unique<FieldDecl>(loc);
    field->type = std::move(type);

    VariableDeclarator first;
    first.loc = nameLoc;
    first.name = std::move(name);
    first.dimensions = parseArrayDimension();
    if (constant)
        accept("=");
    if (constant || tryAccept("="))
        first.initializer = parseVariableInitializer();
    field->declarators.push_back(std::move(first));

    while (tryAccept(","))
    {
        VariableDeclarator next = parseVariableDeclarator();
        if (constant && !next.initializer)
            illegal("Expected '='");
        field->declarators.push_back(std::move(next));
    }
    accept(";");
    return field;
}

//===----------------------------------------------------------------------===//
// Enum and Annotation Bodies
//===----------------------------------------------------------------------===//

/// @brief `{ A, B(1), C { ... }; members }`.
void Parser::parseEnumBody(EnumDecl &decl)
{
    ProcedureScope scope(*this, __func__);
    YieldContext yield(*this, false);
    accept("{");

    if (!tryAccept(","))
    {
        while (!wouldAccept(";") && !wouldAccept("}"))
        {
            if (atEnd())
                illegal("Expected '}'");
            decl.constants.push_back(parseEnumConstant());
            if (!tryAccept(","))
                break;
        }
    }

    if (tryAccept(";"))
    {
        while (!wouldAccept("}"))
        {
            if (atEnd())
                illegal("Expected '}'");
            if (DeclPtr member = parseClassBodyDeclaration())
                decl.body.push_back(std::move(member));
        }
    }
    accept("}");
}

EnumConstant Parser::parseEnumConstant()
{
    ProcedureScope scope(*this, __func__);
    EnumConstant constant;
    constant.documentation = peek().javadoc;
    if (isAnnotation())
        constant.annotations = parseAnnotations();

    constant.loc = peek().loc;
    constant.name = parseIdentifier();
    if (wouldAccept("("))
        constant.arguments = parseArguments();
    if (wouldAccept("{"))
        constant.body = parseClassBody();
    return constant;
}

std::vector<DeclPtr> Parser::parseAnnotationTypeBody()
{
    ProcedureScope scope(*this, __func__);
    YieldContext yield(*this, false);
    std::vector<DeclPtr> body;
    accept("{");
    while (!tryAccept("}"))
    {
        if (atEnd())
            illegal("Expected '}'");
        if (tryAccept(";"))
            continue;
        body.push_back(parseAnnotationTypeElementDeclaration());
    }
    return body;
}

/// @brief Annotation element `Type name() [] default value;`, a constant,
///        or a nested type.
DeclPtr Parser::parseAnnotationTypeElementDeclaration()
{
    ProcedureScope scope(*this, __func__);
    ModifierList mods = parseModifiers();

    if (isTypeDeclarationStart())
        return parseTypeDeclarationRest(std::move(mods));

    SourceLoc loc = peek().loc;
    TypePtr type = parseType();
    SourceLoc nameLoc = peek().loc;
    std::string name = parseIdentifier();

    if (!tryAccept("("))
    {
        DeclPtr constant = parseFieldDeclaratorsRest(loc, std::move(type), nameLoc, std::move(name), true);
        applyModifiers(*constant, std::move(mods));
        return constant;
    }

    accept(")");
    auto element = std::make_unique<AnnotationMethodDecl>(loc);
    element->returnType = std::move(type);
    element->name = std::move(name);
    element->dimensions = parseArrayDimension();
    if (tryAccept("default"))
        element->defaultValue = parseElementValue();
    accept(";");
    applyModifiers(*element, std::move(mods));
    return element;
}

//===----------------------------------------------------------------------===//
// Parameters and Variables
//===----------------------------------------------------------------------===//

/// @brief `(final int a, String... rest)`; a varargs parameter ends the list.
std::vector<FormalParameter> Parser::parseFormalParameters()
{
    ProcedureScope scope(*this, __func__);
    std::vector<FormalParameter> parameters;
    accept("(");
    if (tryAccept(")"))
        return parameters;

    while (true)
    {
        FormalParameter parameter;
        ModifierList mods = parseVariableModifiers();
        parameter.modifiers = std::move(mods.modifiers);
        parameter.annotations = std::move(mods.annotations);
        parameter.loc = peek().loc;
        parameter.type = parseType();
        parameter.varargs = tryAccept("...");

        // Receiver parameter, `Outer this`.
        if (wouldAccept("this"))
            parameter.name = advance().text;
        else
            parameter.name = parseIdentifier();
        parameter.type->dimensions += parseArrayDimension();

        const bool last = parameter.varargs;
        parameters.push_back(std::move(parameter));
        if (last || !tryAccept(","))
            break;
    }
    accept(")");
    return parameters;
}

/// @brief `final` and annotations in front of a variable or parameter.
Parser::ModifierList Parser::parseVariableModifiers()
{
    ProcedureScope scope(*this, __func__);
    ModifierList mods;
    while (true)
    {
        if (tryAccept("final"))
            mods.modifiers.insert("final");
        else if (isAnnotation())
            mods.annotations.push_back(parseAnnotation());
        else
            break;
    }
    return mods;
}

std::vector<VariableDeclarator> Parser::parseVariableDeclarators()
{
    ProcedureScope scope(*this, __func__);
    std::vector<VariableDeclarator> declarators;
    do
    {
        declarators.push_back(parseVariableDeclarator());
    } while (tryAccept(","));
    return declarators;
}

VariableDeclarator Parser::parseVariableDeclarator()
{
    ProcedureScope scope(*this, __func__);
    VariableDeclarator declarator;
    declarator.loc = peek().loc;
    declarator.name = parseIdentifier();
    declarator.dimensions = parseArrayDimension();
    if (tryAccept("="))
        declarator.initializer = parseVariableInitializer();
    return declarator;
}

ExprPtr Parser::parseVariableInitializer()
{
    if (wouldAccept("{"))
        return parseArrayInitializer();
    return parseExpression();
}

/// @brief `{a, b, {c}}`; a trailing comma and the empty `{,}` are allowed.
ExprPtr Parser::parseArrayInitializer()
{
    ProcedureScope scope(*this, __func__);
    auto init = std::make_unique<ArrayInitializer>(peek().loc);
    accept("{");
    if (tryAccept(","))
    {
        accept("}");
        return init;
    }

    while (!tryAccept("}"))
    {
        if (atEnd())
            illegal("Expected '}'");
        init->initializers.push_back(parseVariableInitializer());
        if (!wouldAccept("}"))
            accept(",");
    }
    return init;
}

} // namespace javelin::frontends::java
