//===----------------------------------------------------------------------===//
//
// Part of the Javelin project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AST_Decl.hpp
/// @brief Declaration nodes and the compilation unit root.
///
/// Type declarations keep their members in `body` in source order. Enum
/// constants are kept apart from the enum's other members.
///
/// Ownership/Lifetime: CompilationUnit owns every node below it.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/java/AST_Stmt.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace javelin::frontends::java
{

/// @brief `package a.b.c;`, possibly annotated.
struct PackageDecl : Decl
{
    std::string name;

    explicit PackageDecl(SourceLoc l) : Decl(DeclKind::Package, l) {}
};

/// @brief `import static a.b.*;`.
struct ImportDecl : Decl
{
    /// @brief Dotted path without the trailing `.*`.
    std::string path;
    bool isStatic = false;
    bool wildcard = false;

    explicit ImportDecl(SourceLoc l) : Decl(DeclKind::Import, l) {}
};

/// @brief Common shape of class-like declarations.
struct TypeDecl : Decl
{
    std::string name;
    std::vector<DeclPtr> body;

    using Decl::Decl;
};

struct ClassDecl : TypeDecl
{
    std::vector<TypeParameter> typeParameters;
    TypePtr extends;
    std::vector<TypePtr> implements;
    std::vector<TypePtr> permits;

    explicit ClassDecl(SourceLoc l) : TypeDecl(DeclKind::Class, l) {}
};

struct InterfaceDecl : TypeDecl
{
    std::vector<TypeParameter> typeParameters;
    std::vector<TypePtr> extends;
    std::vector<TypePtr> permits;

    explicit InterfaceDecl(SourceLoc l) : TypeDecl(DeclKind::Interface, l) {}
};

/// @brief One enum constant, `RED(1) { ... }`.
struct EnumConstant
{
    SourceLoc loc;
    std::vector<ExprPtr> annotations;
    std::optional<std::string> documentation;
    std::string name;
    std::optional<std::vector<ExprPtr>> arguments;
    std::optional<std::vector<DeclPtr>> body;
};

/// @brief `enum` declaration; `body` holds the members after the constants.
struct EnumDecl : TypeDecl
{
    std::vector<TypePtr> implements;
    std::vector<EnumConstant> constants;

    explicit EnumDecl(SourceLoc l) : TypeDecl(DeclKind::Enum, l) {}
};

/// @brief `record Name<T>(components) implements I { body }`.
struct RecordDecl : TypeDecl
{
    std::vector<TypeParameter> typeParameters;
    std::vector<FormalParameter> components;
    std::vector<TypePtr> implements;

    explicit RecordDecl(SourceLoc l) : TypeDecl(DeclKind::Record, l) {}
};

/// @brief `@interface Name { ... }`.
struct AnnotationTypeDecl : TypeDecl
{
    explicit AnnotationTypeDecl(SourceLoc l) : TypeDecl(DeclKind::AnnotationType, l) {}
};

/// @brief Method declaration. A null returnType means `void`.
struct MethodDecl : Decl
{
    std::vector<TypeParameter> typeParameters;
    TypePtr returnType;
    std::string name;
    std::vector<FormalParameter> parameters;
    std::vector<std::string> throws;

    /// @brief Empty optional for abstract and native methods.
    std::optional<std::vector<StmtPtr>> body;

    explicit MethodDecl(SourceLoc l) : Decl(DeclKind::Method, l) {}
};

/// @brief Constructor; `compact` for a record's `Name { ... }` form.
struct ConstructorDecl : Decl
{
    std::vector<TypeParameter> typeParameters;
    std::string name;
    std::vector<FormalParameter> parameters;
    std::vector<std::string> throws;
    std::vector<StmtPtr> body;
    bool compact = false;

    explicit ConstructorDecl(SourceLoc l) : Decl(DeclKind::Constructor, l) {}
};

/// @brief Field declaration; ConstantDecl inside interfaces and annotations.
struct FieldDecl : Decl
{
    TypePtr type;
    std::vector<VariableDeclarator> declarators;

    explicit FieldDecl(SourceLoc l) : Decl(DeclKind::Field, l) {}

  protected:
    FieldDecl(DeclKind k, SourceLoc l) : Decl(k, l) {}
};

struct ConstantDecl : FieldDecl
{
    explicit ConstantDecl(SourceLoc l) : FieldDecl(DeclKind::Constant, l) {}
};

/// @brief Element of an annotation type: `String value() default "";`.
struct AnnotationMethodDecl : Decl
{
    TypePtr returnType;
    std::string name;
    unsigned dimensions = 0;
    ExprPtr defaultValue;

    explicit AnnotationMethodDecl(SourceLoc l) : Decl(DeclKind::AnnotationMethod, l) {}
};

/// @brief `static { ... }` or an instance initializer `{ ... }`.
struct InitializerDecl : Decl
{
    bool isStatic = false;
    std::vector<StmtPtr> body;

    explicit InitializerDecl(SourceLoc l) : Decl(DeclKind::Initializer, l) {}
};

/// @brief Root of a parsed source file.
struct CompilationUnit
{
    std::unique_ptr<PackageDecl> package;
    std::vector<std::unique_ptr<ImportDecl>> imports;

    /// @brief Top-level types, and methods written at top level.
    std::vector<DeclPtr> types;
};

} // namespace javelin::frontends::java
