//===----------------------------------------------------------------------===//
//
// Part of the Javelin project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser_Stmt.cpp
/// @brief Statement parsing for the Java parser.
///
/// @details Block statements are classified in this order: labeled,
/// synchronized and yield statements; local type declarations (detected by
/// scanning past modifiers and annotations); local variable declarations
/// (detected by probing for `Type name`); everything else is a statement.
///
//===----------------------------------------------------------------------===//

#include "frontends/java/Parser.hpp"

#include <optional>
#include <utility>

namespace javelin::frontends::java
{

//===----------------------------------------------------------------------===//
// Blocks
//===----------------------------------------------------------------------===//

std::vector<StmtPtr> Parser::parseBlock()
{
    ProcedureScope scope(*this, __func__);
    std::vector<StmtPtr> statements;
    accept("{");
    while (!tryAccept("}"))
    {
        if (atEnd())
            illegal("Expected '}'");
        statements.push_back(parseBlockStatement());
    }
    return statements;
}

StmtPtr Parser::parseBlockStatement()
{
    ProcedureScope scope(*this, __func__);
    SourceLoc loc = peek().loc;

    if (wouldAccept(TokenKind::Identifier, ":") || wouldAccept("synchronized") || isYieldStatement())
        return parseStatement();

    auto tokenAt = [this](std::size_t offset, const char *value) { return ExpectedToken(value).matches(peek(offset)); };

    // Look past modifiers and annotations to see what they introduce.
    std::size_t i = 0;
    bool annotated = false;
    bool classModifier = isSealedModifier() || isNonSealedModifier();
    while (true)
    {
        if (peek(i).is(TokenKind::Modifier))
        {
            if (peek(i).text != "final")
                classModifier = true;
            ++i;
        }
        else if (isAnnotation(i))
        {
            annotated = true;
            ++i;
            while (peek(i).is(TokenKind::Identifier))
            {
                ++i;
                if (!tokenAt(i, "."))
                    break;
                ++i;
            }
            if (tokenAt(i, "("))
            {
                unsigned nesting = 0;
                do
                {
                    if (peek(i).isEnd())
                        illegal("Expected ')'");
                    if (tokenAt(i, "("))
                        ++nesting;
                    else if (tokenAt(i, ")"))
                        --nesting;
                    ++i;
                } while (nesting > 0);
            }
        }
        else
        {
            break;
        }
    }

    const bool localType = classModifier || tokenAt(i, "class") || tokenAt(i, "enum") || tokenAt(i, "interface") ||
                           isAnnotationDeclaration(i) ||
                           (tokenAt(i, "record") && peek(i + 1).is(TokenKind::Identifier) &&
                            (tokenAt(i + 2, "(") || tokenAt(i + 2, "<")));
    if (localType)
        return std::make_unique<LocalTypeStmt>(loc, parseClassOrInterfaceDeclaration());

    if (annotated || i > 0 || isLocalVariableDeclaration())
        return parseLocalVariableDeclarationStatement();

    return parseStatement();
}

//===----------------------------------------------------------------------===//
// Local Variables
//===----------------------------------------------------------------------===//

bool Parser::isLocalVariableDeclaration()
{
    if (!peek().is(TokenKind::Identifier) && !peek().is(TokenKind::BasicType) && !wouldAccept("final") &&
        !isAnnotation())
        return false;

    TokenCursor::Marker probe(cursor_);
    return speculate(
        [this]
        {
            parseVariableModifiers();
            parseType();
            parseIdentifier();
        });
}

VariableDeclaration Parser::parseLocalVariableDeclaration()
{
    ProcedureScope scope(*this, __func__);
    VariableDeclaration decl;
    decl.loc = peek().loc;
    ModifierList mods = parseVariableModifiers();
    decl.modifiers = std::move(mods.modifiers);
    decl.annotations = std::move(mods.annotations);
    decl.type = parseType();
    decl.declarators = parseVariableDeclarators();
    return decl;
}

StmtPtr Parser::parseLocalVariableDeclarationStatement()
{
    ProcedureScope scope(*this, __func__);
    auto stmt = std::make_unique<LocalVariableStmt>(peek().loc);
    stmt->declaration = parseLocalVariableDeclaration();
    accept(";");
    return stmt;
}

//===----------------------------------------------------------------------===//
// Statements
//===----------------------------------------------------------------------===//

/// @brief `yield` followed by something that can only start its operand.
/// @details `yield = 1;`, `yield.foo();` and `yield++;` keep treating
///          yield as a name.
bool Parser::isYieldStatement()
{
    if (!yieldAllowed_ || !wouldAccept(TokenKind::Identifier) || peek().text != "yield")
        return false;

    const Token next = peek(1);
    if (next.isEnd() || next.is(TokenKind::Annotation))
        return false;
    if (next.is(TokenKind::Separator))
        return next.text == "(";
    if (next.is(TokenKind::Operator))
    {
        if (next.text == "++" || next.text == "--")
            return !ExpectedToken(";").matches(peek(2));
        return next.text == "!" || next.text == "~" || next.text == "+" || next.text == "-";
    }
    return true;
}

StmtPtr Parser::parseStatement()
{
    ProcedureScope scope(*this, __func__);
    SourceLoc loc = peek().loc;

    if (wouldAccept("{"))
    {
        auto block = std::make_unique<BlockStmt>(loc);
        block->statements = parseBlock();
        return block;
    }

    if (tryAccept(";"))
        return std::make_unique<EmptyStmt>(loc);

    if (tryAccept("if"))
    {
        auto stmt = std::make_unique<IfStmt>(loc);
        stmt->condition = parseParExpression();
        stmt->thenStmt = parseStatement();
        if (tryAccept("else"))
            stmt->elseStmt = parseStatement();
        return stmt;
    }

    if (tryAccept("assert"))
    {
        auto stmt = std::make_unique<AssertStmt>(loc);
        stmt->condition = parseExpression();
        if (tryAccept(":"))
            stmt->value = parseExpression();
        accept(";");
        return stmt;
    }

    if (wouldAccept("switch"))
        return parseSwitchStatement();

    if (tryAccept("while"))
    {
        auto stmt = std::make_unique<WhileStmt>(loc);
        stmt->condition = parseParExpression();
        stmt->body = parseStatement();
        return stmt;
    }

    if (tryAccept("do"))
    {
        auto stmt = std::make_unique<DoStmt>(loc);
        stmt->body = parseStatement();
        accept("while");
        stmt->condition = parseParExpression();
        accept(";");
        return stmt;
    }

    if (wouldAccept("for"))
        return parseForStatement();

    if (tryAccept("break"))
    {
        auto stmt = std::make_unique<BreakStmt>(loc);
        if (peek().is(TokenKind::Identifier))
            stmt->label = parseIdentifier();
        accept(";");
        return stmt;
    }

    if (tryAccept("continue"))
    {
        auto stmt = std::make_unique<ContinueStmt>(loc);
        if (peek().is(TokenKind::Identifier))
            stmt->label = parseIdentifier();
        accept(";");
        return stmt;
    }

    if (tryAccept("return"))
    {
        auto stmt = std::make_unique<ReturnStmt>(loc);
        if (!wouldAccept(";"))
            stmt->expression = parseExpression();
        accept(";");
        return stmt;
    }

    if (tryAccept("synchronized"))
    {
        auto stmt = std::make_unique<SynchronizedStmt>(loc);
        stmt->lock = parseParExpression();
        stmt->block = parseBlock();
        return stmt;
    }

    if (tryAccept("throw"))
    {
        auto stmt = std::make_unique<ThrowStmt>(loc);
        stmt->expression = parseExpression();
        accept(";");
        return stmt;
    }

    if (wouldAccept("try"))
        return parseTryStatement();

    if (isYieldStatement())
    {
        accept("yield");
        ExprPtr value = parseExpression();
        accept(";");
        return std::make_unique<YieldStmt>(loc, std::move(value));
    }

    if (wouldAccept(TokenKind::Identifier, ":"))
    {
        std::string label = parseIdentifier();
        accept(":");
        return std::make_unique<LabeledStmt>(loc, std::move(label), parseStatement());
    }

    ExprPtr expression = parseExpression();
    accept(";");
    return std::make_unique<ExpressionStmt>(loc, std::move(expression));
}

//===----------------------------------------------------------------------===//
// Switch
//===----------------------------------------------------------------------===//

StmtPtr Parser::parseSwitchStatement()
{
    ProcedureScope scope(*this, __func__);
    auto stmt = std::make_unique<SwitchStmt>(peek().loc);
    accept("switch");
    stmt->expression = parseParExpression();
    parseSwitchBody(stmt->groups, stmt->rules, false);
    return stmt;
}

/// @details The first label fixes the form of the whole body. Consecutive
///          colon labels share one group. `yield` is enabled in every body
///          of a switch expression and inherited by nested switch
///          statements.
void Parser::parseSwitchBody(std::vector<SwitchGroup> &groups, std::vector<SwitchRule> &rules, bool expressionBody)
{
    ProcedureScope scope(*this, __func__);
    YieldContext yield(*this, expressionBody || yieldAllowed_);
    accept("{");

    std::optional<bool> arrowForm;
    bool sawDefault = false;
    auto noteDefault = [&]
    {
        if (sawDefault)
            illegal("Multiple default labels");
        sawDefault = true;
    };

    while (!tryAccept("}"))
    {
        if (atEnd())
            illegal("Expected '}'");

        SourceLoc loc = peek().loc;
        std::vector<ExprPtr> labels;
        bool isDefault = false;
        parseSwitchLabel(labels, isDefault);

        ExprPtr guard;
        if (tryAccept("when"))
            guard = parseExpressionl(false);

        const bool arrow = wouldAccept("->");
        if (!arrow && !wouldAccept(":"))
            illegal("Expected ':' or '->'");
        if (!arrowForm)
            arrowForm = arrow;
        else if (*arrowForm != arrow)
            illegal("Cannot mix colon and arrow labels");
        if (isDefault)
            noteDefault();

        if (arrow)
        {
            accept("->");
            SwitchRule rule = parseSwitchRuleAction(loc, expressionBody);
            rule.isDefault = isDefault;
            rule.labels = std::move(labels);
            rule.guard = std::move(guard);
            rules.push_back(std::move(rule));
            continue;
        }

        accept(":");
        SwitchGroup group;
        group.loc = loc;
        group.isDefault = isDefault;
        group.labels = std::move(labels);
        group.guard = std::move(guard);

        while (wouldAccept("case") || wouldAccept("default"))
        {
            bool moreDefault = false;
            parseSwitchLabel(group.labels, moreDefault);
            if (wouldAccept("when"))
            {
                if (group.guard)
                    illegal("Multiple 'when' clauses");
                accept("when");
                group.guard = parseExpressionl(false);
            }
            if (wouldAccept("->"))
                illegal("Cannot mix colon and arrow labels");
            accept(":");
            if (moreDefault)
            {
                noteDefault();
                group.isDefault = true;
            }
        }

        while (!wouldAccept("case") && !wouldAccept("default") && !wouldAccept("}"))
        {
            if (atEnd())
                illegal("Expected '}'");
            group.statements.push_back(parseBlockStatement());
        }
        groups.push_back(std::move(group));
    }
}

/// @details `case null, default` sets @p isDefault and keeps the null label.
void Parser::parseSwitchLabel(std::vector<ExprPtr> &labels, bool &isDefault)
{
    ProcedureScope scope(*this, __func__);
    if (tryAccept("default"))
    {
        isDefault = true;
        return;
    }

    accept("case");
    do
    {
        if (tryAccept("default"))
            isDefault = true;
        else
            labels.push_back(parseCaseLabel());
    } while (tryAccept(","));
}

/// @brief Constant expression or pattern after `case`.
/// @details A pattern is tried first; `case FOO ->` and `case a.B:` fall
///          back to an expression once no binding name follows the type.
ExprPtr Parser::parseCaseLabel()
{
    ProcedureScope scope(*this, __func__);
    if (peek().is(TokenKind::Identifier) || peek().is(TokenKind::BasicType) || wouldAccept("final") ||
        isAnnotation())
    {
        ExprPtr pattern;
        if (speculate([&] { pattern = parsePattern(); }))
            return pattern;
    }
    return parseExpressionl(false);
}

SwitchRule Parser::parseSwitchRuleAction(SourceLoc loc, bool expressionBody)
{
    ProcedureScope scope(*this, __func__);
    YieldContext yield(*this, expressionBody || yieldAllowed_);
    SwitchRule rule;
    rule.loc = loc;

    if (wouldAccept("{"))
    {
        auto block = std::make_unique<BlockStmt>(peek().loc);
        block->statements = parseBlock();
        rule.body = std::move(block);
    }
    else if (wouldAccept("throw"))
    {
        rule.body = parseStatement();
    }
    else
    {
        rule.expression = parseExpression();
        accept(";");
    }
    return rule;
}

//===----------------------------------------------------------------------===//
// Patterns
//===----------------------------------------------------------------------===//

ExprPtr Parser::parsePattern()
{
    ProcedureScope scope(*this, __func__);
    ModifierList mods = parseVariableModifiers();
    SourceLoc loc = peek().loc;
    TypePtr type = parseType();

    if (wouldAccept("("))
    {
        if (!mods.modifiers.empty() || !mods.annotations.empty())
            illegal("Unexpected modifiers on record pattern");
        return parseRecordPatternRest(loc, std::move(type));
    }

    auto pattern = std::make_unique<TypePattern>(loc);
    pattern->modifiers = std::move(mods.modifiers);
    pattern->annotations = std::move(mods.annotations);
    pattern->type = std::move(type);
    pattern->name = parseIdentifier();
    return pattern;
}

ExprPtr Parser::parseRecordPatternRest(SourceLoc loc, TypePtr type)
{
    ProcedureScope scope(*this, __func__);
    auto pattern = std::make_unique<RecordPattern>(loc);
    pattern->type = std::move(type);
    accept("(");
    if (tryAccept(")"))
        return pattern;

    do
    {
        pattern->components.push_back(parsePattern());
    } while (tryAccept(","));
    accept(")");
    return pattern;
}

//===----------------------------------------------------------------------===//
// For
//===----------------------------------------------------------------------===//

StmtPtr Parser::parseForStatement()
{
    ProcedureScope scope(*this, __func__);
    auto stmt = std::make_unique<ForStmt>(peek().loc);
    accept("for", "(");

    ForControl control;
    if (isLocalVariableDeclaration())
    {
        VariableDeclaration var = parseLocalVariableDeclaration();
        if (wouldAccept(":"))
        {
            if (var.declarators.size() != 1 || var.declarators.front().initializer)
                illegal("Expected ';'");
            accept(":");
            EnhancedForControl enhanced;
            enhanced.var = std::move(var);
            enhanced.iterable = parseExpression();
            accept(")");
            stmt->control = std::move(enhanced);
            stmt->body = parseStatement();
            return stmt;
        }
        control.initDeclaration = std::move(var);
    }
    else if (!wouldAccept(";"))
    {
        control.init = parseForInitOrUpdate();
    }
    accept(";");

    if (!wouldAccept(";"))
        control.condition = parseExpression();
    accept(";");

    if (!wouldAccept(")"))
        control.update = parseForInitOrUpdate();
    accept(")");

    stmt->control = std::move(control);
    stmt->body = parseStatement();
    return stmt;
}

std::vector<ExprPtr> Parser::parseForInitOrUpdate()
{
    ProcedureScope scope(*this, __func__);
    std::vector<ExprPtr> expressions;
    do
    {
        expressions.push_back(parseExpression());
    } while (tryAccept(","));
    return expressions;
}

//===----------------------------------------------------------------------===//
// Try
//===----------------------------------------------------------------------===//

StmtPtr Parser::parseTryStatement()
{
    ProcedureScope scope(*this, __func__);
    auto stmt = std::make_unique<TryStmt>(peek().loc);
    accept("try");

    if (wouldAccept("("))
        stmt->resources = parseResourceSpecification();
    stmt->block = parseBlock();

    while (wouldAccept("catch"))
        stmt->catches.push_back(parseCatchClause());
    if (tryAccept("finally"))
        stmt->finallyBlock = parseBlock();

    if (!stmt->resources && stmt->catches.empty() && !stmt->finallyBlock)
        illegal("Expected catch/finally block");
    return stmt;
}

/// @brief `catch (final IOException | RuntimeException e) { ... }`.
CatchClause Parser::parseCatchClause()
{
    ProcedureScope scope(*this, __func__);
    CatchClause clause;
    clause.loc = peek().loc;
    accept("catch", "(");

    ModifierList mods = parseVariableModifiers();
    clause.modifiers = std::move(mods.modifiers);
    clause.annotations = std::move(mods.annotations);
    do
    {
        clause.types.push_back(parseQualifiedIdentifier());
    } while (tryAccept("|"));
    clause.name = parseIdentifier();
    accept(")");

    clause.block = parseBlock();
    return clause;
}

/// @brief `(Res a = open(); b;)`; a trailing `;` is allowed.
std::vector<TryResource> Parser::parseResourceSpecification()
{
    ProcedureScope scope(*this, __func__);
    std::vector<TryResource> resources;
    accept("(");
    resources.push_back(parseResource());
    while (tryAccept(";"))
    {
        if (wouldAccept(")"))
            break;
        resources.push_back(parseResource());
    }
    accept(")");
    return resources;
}

/// @brief Declared resource, or an existing variable or field.
TryResource Parser::parseResource()
{
    ProcedureScope scope(*this, __func__);
    TryResource resource;
    resource.loc = peek().loc;

    if (isLocalVariableDeclaration())
    {
        ModifierList mods = parseVariableModifiers();
        resource.modifiers = std::move(mods.modifiers);
        resource.annotations = std::move(mods.annotations);
        resource.type = parseType();
        resource.name = parseIdentifier();
        accept("=");
    }
    resource.value = parseExpression();
    return resource;
}

} // namespace javelin::frontends::java
