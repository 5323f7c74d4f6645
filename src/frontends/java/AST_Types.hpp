//===----------------------------------------------------------------------===//
//
// Part of the Javelin project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AST_Types.hpp
/// @brief Type nodes: primitive and reference types, type arguments and
///        type parameters.
///
/// A qualified reference type such as `Map.Entry<K, V>[]` is a chain of
/// ReferenceType nodes linked through subType, one per dotted segment, each
/// with its own type arguments. Array dimensions are recorded on the head.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/java/AST_Base.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace javelin::frontends::java
{

/// @brief Primitive type: `int`, `boolean`, ...
struct BasicType : TypeNode
{
    std::string name;

    BasicType(SourceLoc l, std::string n) : TypeNode(TypeKind::Basic, l), name(std::move(n)) {}
};

/// @brief One entry of a `<...>` type argument list.
/// @details `?` has no type and patternType "?"; `? extends T` and
///          `? super T` carry the bound with patternType "extends" or
///          "super"; a plain argument has an empty patternType.
struct TypeArgument
{
    SourceLoc loc;
    TypePtr type;
    std::string patternType;
};

/// @brief Class or interface type, one dotted segment per node.
struct ReferenceType : TypeNode
{
    std::string name;

    /// @brief Type arguments; empty optional when no `<...>` was written,
    ///        empty vector for the diamond `<>`.
    std::optional<std::vector<TypeArgument>> arguments;

    /// @brief Next segment of a qualified name, or null.
    std::unique_ptr<ReferenceType> subType;

    ReferenceType(SourceLoc l, std::string n) : TypeNode(TypeKind::Reference, l), name(std::move(n))
    {
    }

    /// @brief All segment names joined with '.', e.g. "java.io.Serializable".
    std::string qualifiedName() const
    {
        std::string out = name;
        for (const ReferenceType *t = subType.get(); t; t = t->subType.get())
            out += "." + t->name;
        return out;
    }
};

/// @brief Generic type parameter: `T extends Comparable<T> & Serializable`.
struct TypeParameter
{
    SourceLoc loc;
    std::string name;

    /// @brief Bounds after `extends`; empty when unbounded.
    std::vector<std::unique_ptr<ReferenceType>> extends;

    /// @brief Type annotations written before the name.
    std::vector<ExprPtr> annotations;
};

} // namespace javelin::frontends::java
