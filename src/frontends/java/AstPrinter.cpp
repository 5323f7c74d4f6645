//===----------------------------------------------------------------------===//
//
// Part of the Javelin project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AstPrinter.cpp
/// @brief Implements the Java syntax tree printer.
///
/// @details Types are rendered inline (`Map<String, List<int[]>>`) rather
/// than as subtrees; every other node gets its own line.
///
//===----------------------------------------------------------------------===//

#include "frontends/java/AstPrinter.hpp"

#include <sstream>
#include <variant>

namespace javelin::frontends::java
{

namespace
{

// ---------------------------------------------------------------------------
// Printer helper -- manages indentation and line output.
// ---------------------------------------------------------------------------

struct Printer
{
    std::ostream &os;
    int indent = 0;

    void line(const std::string &text)
    {
        for (int i = 0; i < indent; ++i)
            os << "  ";
        os << text << '\n';
    }

    void push()
    {
        ++indent;
    }

    void pop()
    {
        --indent;
    }
};

void printDecl(const Decl &decl, Printer &p);
void printStmt(const Stmt &stmt, Printer &p);
void printExpr(const Expr &expr, Printer &p);

// ---------------------------------------------------------------------------
// Formatting helpers
// ---------------------------------------------------------------------------

std::string locStr(const SourceLoc &loc)
{
    std::ostringstream s;
    s << "(" << loc.line << ":" << loc.column << ")";
    return s.str();
}

std::string quoted(const std::string &text)
{
    return "\"" + text + "\"";
}

std::string typeStr(const TypeNode *type);

std::string typeArgumentStr(const TypeArgument &arg)
{
    if (arg.patternType == "?")
        return "?";
    std::string out;
    if (!arg.patternType.empty())
        out = "? " + arg.patternType + " ";
    return out + typeStr(arg.type.get());
}

std::string typeArgumentsStr(const std::vector<TypeArgument> &args)
{
    std::string out = "<";
    for (std::size_t i = 0; i < args.size(); ++i)
    {
        if (i > 0)
            out += ", ";
        out += typeArgumentStr(args[i]);
    }
    return out + ">";
}

/// @brief Inline rendering of a type, `a.B<C>.D[][]`.
std::string typeStr(const TypeNode *type)
{
    if (!type)
        return "<null>";

    std::string out;
    if (type->kind == TypeKind::Basic)
    {
        out = static_cast<const BasicType *>(type)->name;
    }
    else
    {
        for (auto *ref = static_cast<const ReferenceType *>(type); ref; ref = ref->subType.get())
        {
            if (!out.empty())
                out += ".";
            out += ref->name;
            if (ref->arguments)
                out += typeArgumentsStr(*ref->arguments);
        }
    }
    for (unsigned i = 0; i < type->dimensions; ++i)
        out += "[]";
    return out;
}

std::string modifiersStr(const Modifiers &mods)
{
    std::string out;
    for (const std::string &mod : mods)
        out += " " + mod;
    return out.empty() ? out : " [" + out.substr(1) + "]";
}

std::string joined(const std::vector<std::string> &names, const char *sep)
{
    std::string out;
    for (std::size_t i = 0; i < names.size(); ++i)
    {
        if (i > 0)
            out += sep;
        out += names[i];
    }
    return out;
}

void printExprList(const char *title, const std::vector<ExprPtr> &exprs, Printer &p)
{
    if (exprs.empty())
        return;
    p.line(title);
    p.push();
    for (const auto &expr : exprs)
    {
        if (expr)
            printExpr(*expr, p);
        else
            p.line("<null>");
    }
    p.pop();
}

void printStmtList(const char *title, const std::vector<StmtPtr> &stmts, Printer &p)
{
    p.line(title);
    p.push();
    for (const auto &stmt : stmts)
        printStmt(*stmt, p);
    p.pop();
}

void printDeclList(const char *title, const std::vector<DeclPtr> &decls, Printer &p)
{
    p.line(title);
    p.push();
    for (const auto &decl : decls)
        printDecl(*decl, p);
    p.pop();
}

void printChild(const char *title, const Expr *expr, Printer &p)
{
    if (!expr)
        return;
    p.line(title);
    p.push();
    printExpr(*expr, p);
    p.pop();
}

void printChild(const char *title, const Stmt *stmt, Printer &p)
{
    if (!stmt)
        return;
    p.line(title);
    p.push();
    printStmt(*stmt, p);
    p.pop();
}

void printParameters(const std::vector<FormalParameter> &params, Printer &p, const char *title = "Params:")
{
    if (params.empty())
        return;
    p.line(title);
    p.push();
    for (const auto &param : params)
    {
        p.line("Param " + quoted(param.name) + " " + typeStr(param.type.get()) + (param.varargs ? "..." : "") +
               modifiersStr(param.modifiers) + " " + locStr(param.loc));
        p.push();
        printExprList("Annotations:", param.annotations, p);
        p.pop();
    }
    p.pop();
}

void printTypeParameters(const std::vector<TypeParameter> &params, Printer &p)
{
    if (params.empty())
        return;
    p.line("TypeParams:");
    p.push();
    for (const auto &param : params)
    {
        std::string text = "TypeParam " + quoted(param.name);
        for (std::size_t i = 0; i < param.extends.size(); ++i)
            text += (i == 0 ? " extends " : " & ") + typeStr(param.extends[i].get());
        p.line(text + " " + locStr(param.loc));
    }
    p.pop();
}

void printTypeList(const char *title, const std::vector<TypePtr> &types, Printer &p)
{
    if (types.empty())
        return;
    std::vector<std::string> names;
    for (const auto &type : types)
        names.push_back(typeStr(type.get()));
    p.line(std::string(title) + " " + joined(names, ", "));
}

void printDeclarators(const std::vector<VariableDeclarator> &declarators, Printer &p)
{
    for (const auto &declarator : declarators)
    {
        std::string dims;
        for (unsigned i = 0; i < declarator.dimensions; ++i)
            dims += "[]";
        p.line("Declarator " + quoted(declarator.name) + dims + " " + locStr(declarator.loc));
        p.push();
        if (declarator.initializer)
            printExpr(*declarator.initializer, p);
        p.pop();
    }
}

void printVariableDeclaration(const VariableDeclaration &decl, Printer &p)
{
    p.line("Type: " + typeStr(decl.type.get()) + modifiersStr(decl.modifiers));
    printExprList("Annotations:", decl.annotations, p);
    printDeclarators(decl.declarators, p);
}

// ---------------------------------------------------------------------------
// Expression printing
// ---------------------------------------------------------------------------

/// @brief Qualifier and unary operators of a primary, appended to its line.
std::string primaryStr(const Primary &primary)
{
    std::string out;
    if (!primary.qualifier.empty())
        out += " qualifier=" + primary.qualifier;
    if (!primary.prefixOperators.empty())
        out += " prefix=" + joined(primary.prefixOperators, "");
    if (!primary.postfixOperators.empty())
        out += " postfix=" + joined(primary.postfixOperators, "");
    return out;
}

void printSwitchRules(const std::vector<SwitchRule> &rules, Printer &p)
{
    for (const auto &rule : rules)
    {
        p.line(std::string("Rule") + (rule.isDefault ? " default" : "") + " " + locStr(rule.loc));
        p.push();
        printExprList("Labels:", rule.labels, p);
        printChild("Guard:", rule.guard.get(), p);
        printChild("Expression:", rule.expression.get(), p);
        printChild("Body:", rule.body.get(), p);
        p.pop();
    }
}

void printExpr(const Expr &expr, Printer &p)
{
    const std::string at = " " + locStr(expr.loc);
    switch (expr.kind)
    {
        case ExprKind::Literal:
        {
            const auto &e = static_cast<const Literal &>(expr);
            const bool text = e.literalKind == TokenKind::String || e.literalKind == TokenKind::Character;
            p.line(std::string("Literal ") + tokenKindToString(e.literalKind) + " " +
                   (text ? quoted(e.value) : e.value) + primaryStr(e) + at);
            break;
        }
        case ExprKind::MemberReference:
        {
            const auto &e = static_cast<const MemberReference &>(expr);
            p.line("MemberReference " + quoted(e.member) + primaryStr(e) + at);
            break;
        }
        case ExprKind::MethodInvocation:
        {
            const auto &e = static_cast<const MethodInvocation &>(expr);
            std::string typeArgs = e.typeArguments.empty() ? "" : " " + typeArgumentsStr(e.typeArguments);
            p.line("MethodInvocation " + quoted(e.member) + typeArgs + primaryStr(e) + at);
            p.push();
            printExprList("Args:", e.arguments, p);
            p.pop();
            break;
        }
        case ExprKind::This:
            p.line("This" + primaryStr(static_cast<const Primary &>(expr)) + at);
            break;
        case ExprKind::Super:
            p.line("Super" + primaryStr(static_cast<const Primary &>(expr)) + at);
            break;
        case ExprKind::SuperMethodInvocation:
        {
            const auto &e = static_cast<const SuperMethodInvocation &>(expr);
            p.line("SuperMethodInvocation " + quoted(e.member) + primaryStr(e) + at);
            p.push();
            printExprList("Args:", e.arguments, p);
            p.pop();
            break;
        }
        case ExprKind::SuperMemberReference:
        {
            const auto &e = static_cast<const SuperMemberReference &>(expr);
            p.line("SuperMemberReference " + quoted(e.member) + primaryStr(e) + at);
            break;
        }
        case ExprKind::SuperConstructorInvocation:
        {
            const auto &e = static_cast<const SuperConstructorInvocation &>(expr);
            p.line("SuperConstructorInvocation" + primaryStr(e) + at);
            p.push();
            printExprList("Args:", e.arguments, p);
            p.pop();
            break;
        }
        case ExprKind::ExplicitConstructorInvocation:
        {
            const auto &e = static_cast<const ExplicitConstructorInvocation &>(expr);
            p.line("ExplicitConstructorInvocation" + primaryStr(e) + at);
            p.push();
            printExprList("Args:", e.arguments, p);
            p.pop();
            break;
        }
        case ExprKind::ClassReference:
        {
            const auto &e = static_cast<const ClassReference &>(expr);
            p.line("ClassReference " + typeStr(e.type.get()) + primaryStr(e) + at);
            break;
        }
        case ExprKind::VoidClassReference:
            p.line("VoidClassReference" + primaryStr(static_cast<const Primary &>(expr)) + at);
            break;
        case ExprKind::ClassCreator:
        case ExprKind::InnerClassCreator:
        {
            const auto &e = static_cast<const Creator &>(expr);
            const char *name = expr.kind == ExprKind::ClassCreator ? "ClassCreator " : "InnerClassCreator ";
            p.line(name + typeStr(e.type.get()) + primaryStr(e) + at);
            p.push();
            printExprList("Args:", e.arguments, p);
            if (e.body)
                printDeclList("Body:", *e.body, p);
            p.pop();
            break;
        }
        case ExprKind::ArrayCreator:
        {
            const auto &e = static_cast<const ArrayCreator &>(expr);
            p.line("ArrayCreator " + typeStr(e.type.get()) + primaryStr(e) + at);
            p.push();
            if (!e.dimensions.empty())
            {
                p.line("Dimensions:");
                p.push();
                for (const auto &dim : e.dimensions)
                {
                    if (dim)
                        printExpr(*dim, p);
                    else
                        p.line("[]");
                }
                p.pop();
            }
            printChild("Initializer:", e.initializer.get(), p);
            p.pop();
            break;
        }
        case ExprKind::Cast:
        {
            const auto &e = static_cast<const Cast &>(expr);
            std::string type = typeStr(e.type.get());
            for (const auto &bound : e.additionalBounds)
                type += " & " + typeStr(bound.get());
            p.line("Cast " + type + primaryStr(e) + at);
            p.push();
            printExpr(*e.expression, p);
            p.pop();
            break;
        }
        case ExprKind::Parenthesized:
        {
            const auto &e = static_cast<const Parenthesized &>(expr);
            p.line("Parenthesized" + primaryStr(e) + at);
            p.push();
            printExpr(*e.expression, p);
            p.pop();
            break;
        }
        case ExprKind::SwitchExpression:
        {
            const auto &e = static_cast<const SwitchExpression &>(expr);
            p.line("SwitchExpression" + primaryStr(e) + at);
            p.push();
            printChild("Selector:", e.selector.get(), p);
            printSwitchRules(e.rules, p);
            p.pop();
            break;
        }
        case ExprKind::ArraySelector:
        {
            const auto &e = static_cast<const ArraySelector &>(expr);
            p.line("ArraySelector" + at);
            p.push();
            printExpr(*e.index, p);
            p.pop();
            break;
        }
        case ExprKind::Assignment:
        {
            const auto &e = static_cast<const Assignment &>(expr);
            p.line("Assignment " + e.op + at);
            p.push();
            printExpr(*e.target, p);
            printExpr(*e.value, p);
            p.pop();
            break;
        }
        case ExprKind::Binary:
        {
            const auto &e = static_cast<const Binary &>(expr);
            p.line("Binary " + e.op + at);
            p.push();
            printExpr(*e.left, p);
            if (e.right)
                printExpr(*e.right, p);
            else
                p.line("Type: " + typeStr(e.typeOperand.get()));
            p.pop();
            break;
        }
        case ExprKind::Ternary:
        {
            const auto &e = static_cast<const Ternary &>(expr);
            p.line("Ternary" + at);
            p.push();
            printExpr(*e.condition, p);
            printExpr(*e.ifTrue, p);
            printExpr(*e.ifFalse, p);
            p.pop();
            break;
        }
        case ExprKind::InstanceOfPattern:
        {
            const auto &e = static_cast<const InstanceOfPattern &>(expr);
            p.line("InstanceOfPattern" + at);
            p.push();
            printExpr(*e.expression, p);
            printExpr(*e.pattern, p);
            p.pop();
            break;
        }
        case ExprKind::Lambda:
        {
            const auto &e = static_cast<const Lambda &>(expr);
            p.line("Lambda" + at);
            p.push();
            for (const auto &param : e.parameters)
            {
                std::string type = param.type ? " " + typeStr(param.type.get()) : "";
                p.line("Param " + quoted(param.name) + type + (param.varargs ? "..." : "") + " " +
                       locStr(param.loc));
            }
            printChild("Body:", e.bodyExpression.get(), p);
            printChild("Body:", e.bodyBlock.get(), p);
            p.pop();
            break;
        }
        case ExprKind::MethodReference:
        {
            const auto &e = static_cast<const MethodReference &>(expr);
            p.line("MethodReference" + at);
            p.push();
            if (e.type)
                p.line("Type: " + typeStr(e.type.get()));
            printChild("Target:", e.expression.get(), p);
            printChild("Method:", e.method.get(), p);
            p.pop();
            break;
        }
        case ExprKind::TypePattern:
        {
            const auto &e = static_cast<const TypePattern &>(expr);
            p.line("TypePattern " + typeStr(e.type.get()) + " " + quoted(e.name) + modifiersStr(e.modifiers) + at);
            break;
        }
        case ExprKind::RecordPattern:
        {
            const auto &e = static_cast<const RecordPattern &>(expr);
            p.line("RecordPattern " + typeStr(e.type.get()) + at);
            p.push();
            for (const auto &component : e.components)
                printExpr(*component, p);
            p.pop();
            break;
        }
        case ExprKind::ArrayInitializer:
        {
            const auto &e = static_cast<const ArrayInitializer &>(expr);
            p.line("ArrayInitializer" + at);
            p.push();
            for (const auto &init : e.initializers)
                printExpr(*init, p);
            p.pop();
            break;
        }
        case ExprKind::Annotation:
        {
            const auto &e = static_cast<const Annotation &>(expr);
            p.line("Annotation " + quoted(e.name) + at);
            p.push();
            if (e.element)
                printExpr(*e.element, p);
            for (const auto &pair : e.pairs)
            {
                p.line("Pair " + quoted(pair.name) + " " + locStr(pair.loc));
                p.push();
                printExpr(*pair.value, p);
                p.pop();
            }
            p.pop();
            break;
        }
        case ExprKind::ElementArrayValue:
        {
            const auto &e = static_cast<const ElementArrayValue &>(expr);
            p.line("ElementArrayValue" + at);
            p.push();
            for (const auto &value : e.values)
                printExpr(*value, p);
            p.pop();
            break;
        }
    }

    // Selectors hang off every primary.
    switch (expr.kind)
    {
        case ExprKind::ArraySelector:
        case ExprKind::Assignment:
        case ExprKind::Binary:
        case ExprKind::Ternary:
        case ExprKind::InstanceOfPattern:
        case ExprKind::Lambda:
        case ExprKind::MethodReference:
        case ExprKind::TypePattern:
        case ExprKind::RecordPattern:
        case ExprKind::ArrayInitializer:
        case ExprKind::Annotation:
        case ExprKind::ElementArrayValue:
            break;
        default:
            p.push();
            printExprList("Selectors:", static_cast<const Primary &>(expr).selectors, p);
            p.pop();
            break;
    }
}

// ---------------------------------------------------------------------------
// Statement printing
// ---------------------------------------------------------------------------

void printStmt(const Stmt &stmt, Printer &p)
{
    const std::string at = " " + locStr(stmt.loc);
    switch (stmt.kind)
    {
        case StmtKind::Block:
            printStmtList(("BlockStmt" + at).c_str(), static_cast<const BlockStmt &>(stmt).statements, p);
            break;
        case StmtKind::Empty:
            p.line("EmptyStmt" + at);
            break;
        case StmtKind::Labeled:
        {
            const auto &s = static_cast<const LabeledStmt &>(stmt);
            p.line("LabeledStmt " + quoted(s.label) + at);
            p.push();
            printStmt(*s.body, p);
            p.pop();
            break;
        }
        case StmtKind::LocalVariable:
        {
            const auto &s = static_cast<const LocalVariableStmt &>(stmt);
            p.line("LocalVariableStmt" + at);
            p.push();
            printVariableDeclaration(s.declaration, p);
            p.pop();
            break;
        }
        case StmtKind::LocalType:
        {
            const auto &s = static_cast<const LocalTypeStmt &>(stmt);
            p.line("LocalTypeStmt" + at);
            p.push();
            printDecl(*s.declaration, p);
            p.pop();
            break;
        }
        case StmtKind::If:
        {
            const auto &s = static_cast<const IfStmt &>(stmt);
            p.line("IfStmt" + at);
            p.push();
            printChild("Condition:", s.condition.get(), p);
            printChild("Then:", s.thenStmt.get(), p);
            printChild("Else:", s.elseStmt.get(), p);
            p.pop();
            break;
        }
        case StmtKind::Assert:
        {
            const auto &s = static_cast<const AssertStmt &>(stmt);
            p.line("AssertStmt" + at);
            p.push();
            printExpr(*s.condition, p);
            printChild("Value:", s.value.get(), p);
            p.pop();
            break;
        }
        case StmtKind::Switch:
        {
            const auto &s = static_cast<const SwitchStmt &>(stmt);
            p.line("SwitchStmt" + at);
            p.push();
            printChild("Selector:", s.expression.get(), p);
            for (const auto &group : s.groups)
            {
                p.line(std::string("Group") + (group.isDefault ? " default" : "") + " " + locStr(group.loc));
                p.push();
                printExprList("Labels:", group.labels, p);
                printChild("Guard:", group.guard.get(), p);
                printStmtList("Body:", group.statements, p);
                p.pop();
            }
            printSwitchRules(s.rules, p);
            p.pop();
            break;
        }
        case StmtKind::While:
        {
            const auto &s = static_cast<const WhileStmt &>(stmt);
            p.line("WhileStmt" + at);
            p.push();
            printChild("Condition:", s.condition.get(), p);
            printChild("Body:", s.body.get(), p);
            p.pop();
            break;
        }
        case StmtKind::Do:
        {
            const auto &s = static_cast<const DoStmt &>(stmt);
            p.line("DoStmt" + at);
            p.push();
            printChild("Body:", s.body.get(), p);
            printChild("Condition:", s.condition.get(), p);
            p.pop();
            break;
        }
        case StmtKind::For:
        {
            const auto &s = static_cast<const ForStmt &>(stmt);
            p.line("ForStmt" + at);
            p.push();
            if (const auto *enhanced = std::get_if<EnhancedForControl>(&s.control))
            {
                p.line("Var:");
                p.push();
                printVariableDeclaration(enhanced->var, p);
                p.pop();
                printChild("Iterable:", enhanced->iterable.get(), p);
            }
            else
            {
                const auto &control = std::get<ForControl>(s.control);
                if (control.initDeclaration)
                {
                    p.line("Init:");
                    p.push();
                    printVariableDeclaration(*control.initDeclaration, p);
                    p.pop();
                }
                printExprList("Init:", control.init, p);
                printChild("Condition:", control.condition.get(), p);
                printExprList("Update:", control.update, p);
            }
            printChild("Body:", s.body.get(), p);
            p.pop();
            break;
        }
        case StmtKind::Break:
        {
            const auto &s = static_cast<const BreakStmt &>(stmt);
            p.line("BreakStmt" + (s.label.empty() ? "" : " " + quoted(s.label)) + at);
            break;
        }
        case StmtKind::Continue:
        {
            const auto &s = static_cast<const ContinueStmt &>(stmt);
            p.line("ContinueStmt" + (s.label.empty() ? "" : " " + quoted(s.label)) + at);
            break;
        }
        case StmtKind::Return:
        {
            const auto &s = static_cast<const ReturnStmt &>(stmt);
            p.line("ReturnStmt" + at);
            p.push();
            if (s.expression)
                printExpr(*s.expression, p);
            p.pop();
            break;
        }
        case StmtKind::Throw:
        {
            const auto &s = static_cast<const ThrowStmt &>(stmt);
            p.line("ThrowStmt" + at);
            p.push();
            printExpr(*s.expression, p);
            p.pop();
            break;
        }
        case StmtKind::Synchronized:
        {
            const auto &s = static_cast<const SynchronizedStmt &>(stmt);
            p.line("SynchronizedStmt" + at);
            p.push();
            printChild("Lock:", s.lock.get(), p);
            printStmtList("Body:", s.block, p);
            p.pop();
            break;
        }
        case StmtKind::Try:
        {
            const auto &s = static_cast<const TryStmt &>(stmt);
            p.line("TryStmt" + at);
            p.push();
            if (s.resources)
            {
                p.line("Resources:");
                p.push();
                for (const auto &res : *s.resources)
                {
                    std::string decl = res.type ? " " + typeStr(res.type.get()) + " " + quoted(res.name) : "";
                    p.line("Resource" + decl + " " + locStr(res.loc));
                    p.push();
                    printExpr(*res.value, p);
                    p.pop();
                }
                p.pop();
            }
            printStmtList("Body:", s.block, p);
            for (const auto &clause : s.catches)
            {
                p.line("Catch " + joined(clause.types, " | ") + " " + quoted(clause.name) + " " +
                       locStr(clause.loc));
                p.push();
                printStmtList("Body:", clause.block, p);
                p.pop();
            }
            if (s.finallyBlock)
                printStmtList("Finally:", *s.finallyBlock, p);
            p.pop();
            break;
        }
        case StmtKind::Expression:
        {
            const auto &s = static_cast<const ExpressionStmt &>(stmt);
            p.line("ExpressionStmt" + at);
            p.push();
            printExpr(*s.expression, p);
            p.pop();
            break;
        }
        case StmtKind::Yield:
        {
            const auto &s = static_cast<const YieldStmt &>(stmt);
            p.line("YieldStmt" + at);
            p.push();
            printExpr(*s.expression, p);
            p.pop();
            break;
        }
    }
}

// ---------------------------------------------------------------------------
// Declaration printing
// ---------------------------------------------------------------------------

void printDecl(const Decl &decl, Printer &p)
{
    const std::string at = modifiersStr(decl.modifiers) + " " + locStr(decl.loc);
    auto header = [&](const std::string &text)
    {
        p.line(text + at);
        p.push();
        printExprList("Annotations:", decl.annotations, p);
        if (decl.documentation)
            p.line("Documentation: " + quoted(*decl.documentation));
    };

    switch (decl.kind)
    {
        case DeclKind::Package:
            header("PackageDecl " + quoted(static_cast<const PackageDecl &>(decl).name));
            break;
        case DeclKind::Import:
        {
            const auto &d = static_cast<const ImportDecl &>(decl);
            header(std::string("ImportDecl ") + (d.isStatic ? "static " : "") + quoted(d.path) +
                   (d.wildcard ? " .*" : ""));
            break;
        }
        case DeclKind::Class:
        {
            const auto &d = static_cast<const ClassDecl &>(decl);
            header("ClassDecl " + quoted(d.name));
            printTypeParameters(d.typeParameters, p);
            if (d.extends)
                p.line("Extends: " + typeStr(d.extends.get()));
            printTypeList("Implements:", d.implements, p);
            printTypeList("Permits:", d.permits, p);
            for (const auto &member : d.body)
                printDecl(*member, p);
            break;
        }
        case DeclKind::Interface:
        {
            const auto &d = static_cast<const InterfaceDecl &>(decl);
            header("InterfaceDecl " + quoted(d.name));
            printTypeParameters(d.typeParameters, p);
            printTypeList("Extends:", d.extends, p);
            printTypeList("Permits:", d.permits, p);
            for (const auto &member : d.body)
                printDecl(*member, p);
            break;
        }
        case DeclKind::Enum:
        {
            const auto &d = static_cast<const EnumDecl &>(decl);
            header("EnumDecl " + quoted(d.name));
            printTypeList("Implements:", d.implements, p);
            for (const auto &constant : d.constants)
            {
                p.line("Constant " + quoted(constant.name) + " " + locStr(constant.loc));
                p.push();
                if (constant.arguments)
                    printExprList("Args:", *constant.arguments, p);
                if (constant.body)
                    printDeclList("Body:", *constant.body, p);
                p.pop();
            }
            for (const auto &member : d.body)
                printDecl(*member, p);
            break;
        }
        case DeclKind::Record:
        {
            const auto &d = static_cast<const RecordDecl &>(decl);
            header("RecordDecl " + quoted(d.name));
            printTypeParameters(d.typeParameters, p);
            printParameters(d.components, p, "Components:");
            printTypeList("Implements:", d.implements, p);
            for (const auto &member : d.body)
                printDecl(*member, p);
            break;
        }
        case DeclKind::AnnotationType:
        {
            const auto &d = static_cast<const AnnotationTypeDecl &>(decl);
            header("AnnotationTypeDecl " + quoted(d.name));
            for (const auto &member : d.body)
                printDecl(*member, p);
            break;
        }
        case DeclKind::Method:
        {
            const auto &d = static_cast<const MethodDecl &>(decl);
            header("MethodDecl " + quoted(d.name));
            printTypeParameters(d.typeParameters, p);
            p.line("ReturnType: " + (d.returnType ? typeStr(d.returnType.get()) : std::string("void")));
            printParameters(d.parameters, p);
            if (!d.throws.empty())
                p.line("Throws: " + joined(d.throws, ", "));
            if (d.body)
                printStmtList("Body:", *d.body, p);
            break;
        }
        case DeclKind::Constructor:
        {
            const auto &d = static_cast<const ConstructorDecl &>(decl);
            header(std::string("ConstructorDecl ") + quoted(d.name) + (d.compact ? " compact" : ""));
            printTypeParameters(d.typeParameters, p);
            printParameters(d.parameters, p);
            if (!d.throws.empty())
                p.line("Throws: " + joined(d.throws, ", "));
            printStmtList("Body:", d.body, p);
            break;
        }
        case DeclKind::Field:
        case DeclKind::Constant:
        {
            const auto &d = static_cast<const FieldDecl &>(decl);
            header(std::string(decl.kind == DeclKind::Field ? "FieldDecl " : "ConstantDecl ") +
                   typeStr(d.type.get()));
            printDeclarators(d.declarators, p);
            break;
        }
        case DeclKind::AnnotationMethod:
        {
            const auto &d = static_cast<const AnnotationMethodDecl &>(decl);
            header("AnnotationMethodDecl " + quoted(d.name) + " " + typeStr(d.returnType.get()));
            printChild("Default:", d.defaultValue.get(), p);
            break;
        }
        case DeclKind::Initializer:
        {
            const auto &d = static_cast<const InitializerDecl &>(decl);
            header(d.isStatic ? "StaticInitializer" : "Initializer");
            printStmtList("Body:", d.body, p);
            break;
        }
    }
    p.pop();
}

} // namespace

std::string AstPrinter::dump(const CompilationUnit &unit)
{
    std::ostringstream os;
    Printer p{os};
    p.line("CompilationUnit");
    p.push();
    if (unit.package)
        printDecl(*unit.package, p);
    for (const auto &import : unit.imports)
        printDecl(*import, p);
    for (const auto &type : unit.types)
        printDecl(*type, p);
    return os.str();
}

std::string AstPrinter::dump(const Expr &expr)
{
    std::ostringstream os;
    Printer p{os};
    printExpr(expr, p);
    return os.str();
}

std::string AstPrinter::dump(const Stmt &stmt)
{
    std::ostringstream os;
    Printer p{os};
    printStmt(stmt, p);
    return os.str();
}

} // namespace javelin::frontends::java
