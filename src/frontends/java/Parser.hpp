//===----------------------------------------------------------------------===//
//
// Part of the Javelin project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser.hpp
/// @brief Recursive descent parser for Java source.
///
/// @details The parser pulls tokens through a TokenCursor and builds the
/// syntax tree declared in AST.hpp. Each grammar production is one member
/// function; productions call each other directly.
///
/// ## Parsing Strategy
///
/// **Bounded lookahead:**
/// Most decisions look one or two tokens ahead with wouldAccept(), which
/// matches a whole sequence of expected tokens without consuming any.
///
/// **Speculation:**
/// Where Java's grammar is ambiguous on a prefix (local declaration versus
/// expression statement, cast versus parenthesized expression, lambda
/// parameters, patterns in case labels) the parser tries one production
/// inside speculate(). A SyntaxError rewinds the cursor to where the attempt
/// started and the next alternative runs as if nothing had been read.
///
/// **Flat binary folding:**
/// Infix operands and operators are collected left to right and then folded
/// into a tree by splitting on the loosest operator present:
///
/// | Level | Operators                      |
/// |-------|--------------------------------|
/// |   0   | `||`                           |
/// |   1   | `&&`                           |
/// |   2   | `|`                            |
/// |   3   | `^`                            |
/// |   4   | `&`                            |
/// |   5   | `==` `!=`                      |
/// |   6   | `<` `>` `<=` `>=` `instanceof` |
/// |   7   | `<<` `>>` `>>>`                |
/// |   8   | `+` `-`                        |
/// |   9   | `*` `/` `%`                    |
///
/// Every level is left associative.
///
/// ## Contextual Words
///
/// `var`, `yield`, `record`, `sealed`, `permits` and `when` reach the parser
/// as identifiers. `yield` starts a statement only while a switch expression
/// body is being parsed; YieldContext sets and restores that state.
///
/// ## Errors
///
/// Malformed input raises SyntaxError; there is no recovery and no partial
/// tree. Nesting deeper than ParseOptions::maxDepth raises NestingLimitError,
/// which speculation never catches.
///
/// ## Usage Example
///
/// ```cpp
/// Lexer lexer(source);
/// Parser parser(lexer);
/// auto unit = parser.parseCompilationUnit();
/// ```
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/java/AST.hpp"
#include "frontends/java/Errors.hpp"
#include "frontends/java/Options.hpp"
#include "frontends/java/TokenCursor.hpp"

#include <cstddef>
#include <initializer_list>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace javelin::frontends::java
{

/// @brief Recursive descent parser for Java.
///
/// ## Ownership
///
/// The token source is borrowed and must outlive the parser. Every node the
/// parser returns is owned by the caller.
class Parser
{
  public:
    /// @brief Create a parser reading from @p tokens.
    Parser(TokenSource &tokens, ParseOptions options = {});

    /// @brief Parse a whole source file.
    /// @throws SyntaxError on malformed input.
    std::unique_ptr<CompilationUnit> parseCompilationUnit();

    /// @brief Parse one expression, assignments included.
    ExprPtr parseExpression();

    /// @brief Parse one statement or local declaration as found in a block.
    StmtPtr parseBlockStatement();

    /// @brief Parse a type with its array dimensions.
    TypePtr parseType();

    /// @brief Fail unless every token has been consumed.
    void expectEnd();

    /// @brief Number of tokens consumed so far.
    std::size_t consumed() const noexcept
    {
        return cursor_.consumed();
    }

  private:
    /// @brief Modifiers, annotations and documentation read before a
    ///        declaration or variable.
    struct ModifierList
    {
        Modifiers modifiers;
        std::vector<ExprPtr> annotations;
        std::optional<std::string> documentation;
    };

    /// @brief Infix operator collected while reading a binary expression.
    /// @details An instanceof entry carries its type or pattern; the operand
    ///          slot after it stays empty.
    struct InfixOperator
    {
        Token token;
        std::string op;
        TypePtr type;
        ExprPtr pattern;
    };

    //=========================================================================
    /// @name Token Handling
    /// @{
    //=========================================================================

    /// @brief Look @p offset tokens ahead.
    /// @details The reference is invalidated by the next peek or advance.
    const Token &peek(std::size_t offset = 0);

    /// @brief Consume the current token.
    Token advance();

    bool atEnd();

    /// @brief Consume one token per entry of @p expected, failing on the
    ///        first mismatch.
    /// @return Text of the last consumed token.
    std::string acceptSequence(std::initializer_list<ExpectedToken> expected);

    /// @brief Do the next tokens match @p expected, in order?
    bool wouldAcceptSequence(std::initializer_list<ExpectedToken> expected);

    /// @brief Consume the tokens only when all of them match.
    bool tryAcceptSequence(std::initializer_list<ExpectedToken> expected);

    template <typename... Alts>
    std::string accept(const Alts &...alts)
    {
        return acceptSequence({ExpectedToken(alts)...});
    }

    template <typename... Alts>
    bool wouldAccept(const Alts &...alts)
    {
        return wouldAcceptSequence({ExpectedToken(alts)...});
    }

    template <typename... Alts>
    bool tryAccept(const Alts &...alts)
    {
        return tryAcceptSequence({ExpectedToken(alts)...});
    }

    /// @brief Throw a SyntaxError describing the current token.
    [[noreturn]] void illegal(const std::string &description);

    /// @brief `@` starting an annotation use rather than `@interface`.
    bool isAnnotation(std::size_t offset = 0);

    bool isAnnotationDeclaration(std::size_t offset = 0);

    /// @brief Tokens @p offset and @p offset + 1 touch on the same line.
    bool adjacent(std::size_t offset);

    /// @}
    //=========================================================================
    /// @name Speculation and Tracing
    /// @{
    //=========================================================================

    /// @brief Run @p attempt; rewind and return false if it raises a
    ///        SyntaxError.
    template <typename Fn>
    bool speculate(Fn &&attempt)
    {
        TokenCursor::Marker marker(cursor_);
        try
        {
            attempt();
            marker.commit();
            return true;
        }
        catch (const NestingLimitError &)
        {
            throw;
        }
        catch (const SyntaxError &e)
        {
            if (tracing_)
                traceBacktrack(e);
            return false;
        }
    }

    /// @brief Entry/exit bookkeeping for one grammar procedure.
    /// @details Enforces ParseOptions::maxDepth and writes the trace.
    class ProcedureScope
    {
      public:
        ProcedureScope(Parser &parser, const char *name);
        ~ProcedureScope();

        ProcedureScope(const ProcedureScope &) = delete;
        ProcedureScope &operator=(const ProcedureScope &) = delete;

      private:
        Parser &parser_;
        const char *name_;
        std::string startText_;
        int uncaught_{0};
    };

    /// @brief Enables `yield` statements for one switch expression body.
    class YieldContext
    {
      public:
        YieldContext(Parser &parser, bool enabled) : parser_(parser), saved_(parser.yieldAllowed_)
        {
            parser_.yieldAllowed_ = enabled;
        }

        ~YieldContext()
        {
            parser_.yieldAllowed_ = saved_;
        }

        YieldContext(const YieldContext &) = delete;
        YieldContext &operator=(const YieldContext &) = delete;

      private:
        Parser &parser_;
        bool saved_;
    };

    std::ostream &traceStream() const;

    void traceBacktrack(const SyntaxError &error);

    /// @}
    //=========================================================================
    /// @name Identifiers and Types
    /// @{
    //=========================================================================

    std::string parseIdentifier();
    std::string parseQualifiedIdentifier();
    std::vector<std::string> parseQualifiedIdentifierList();

    TypePtr parseBasicType();
    std::unique_ptr<ReferenceType> parseReferenceType();
    std::vector<TypeArgument> parseTypeArguments();
    TypeArgument parseTypeArgument();
    std::vector<TypeArgument> parseNonWildcardTypeArguments();
    std::vector<TypeArgument> parseTypeArgumentsOrDiamond();
    std::vector<TypeArgument> parseNonWildcardTypeArgumentsOrDiamond();
    std::vector<TypePtr> parseTypeList();
    std::vector<TypeParameter> parseTypeParameters();
    TypeParameter parseTypeParameter();
    unsigned parseArrayDimension();

    /// @}
    //=========================================================================
    /// @name Declarations
    /// @{
    //=========================================================================

    ModifierList parseModifiers();
    static void applyModifiers(Decl &decl, ModifierList &&mods);
    bool isSealedModifier();
    bool isNonSealedModifier();
    std::vector<ExprPtr> parseAnnotations();
    ExprPtr parseAnnotation();
    ExprPtr parseElementValue();
    ExprPtr parseElementValueArrayInitializer();

    std::unique_ptr<ImportDecl> parseImportDeclaration();

    /// @brief class, enum, interface, `@interface` or `record Name`.
    bool isTypeDeclarationStart();

    DeclPtr parseClassOrInterfaceDeclaration();
    DeclPtr parseTypeDeclarationRest(ModifierList mods);
    DeclPtr parseNormalClassDeclaration();
    DeclPtr parseEnumDeclaration();
    DeclPtr parseNormalInterfaceDeclaration();
    DeclPtr parseAnnotationTypeDeclaration();
    DeclPtr parseRecordDeclaration();
    std::vector<FormalParameter> parseRecordComponents();
    DeclPtr parseTopLevelMethodDeclaration(ModifierList mods);

    std::vector<DeclPtr> parseClassBody();
    DeclPtr parseClassBodyDeclaration();
    std::vector<DeclPtr> parseInterfaceBody();

    /// @brief Member of a class or interface body after `;` and initializer
    ///        blocks were ruled out.
    DeclPtr parseMemberDeclaration(bool interfaceMember);

    /// @brief Parameters, dimensions, throws and body of a method whose
    ///        return type and name were already read.
    std::unique_ptr<MethodDecl> parseMethodDeclaratorRest(SourceLoc loc, TypePtr returnType, std::string name);

    std::unique_ptr<ConstructorDecl> parseConstructorDeclaratorRest(SourceLoc loc, std::string name);

    /// @brief Declarators of a field whose type and first name were read.
    DeclPtr parseFieldDeclaratorsRest(
        SourceLoc loc, TypePtr type, SourceLoc nameLoc, std::string name, bool constant);

    void parseEnumBody(EnumDecl &decl);
    EnumConstant parseEnumConstant();
    std::vector<DeclPtr> parseAnnotationTypeBody();
    DeclPtr parseAnnotationTypeElementDeclaration();

    std::vector<FormalParameter> parseFormalParameters();
    ModifierList parseVariableModifiers();
    std::vector<VariableDeclarator> parseVariableDeclarators();
    VariableDeclarator parseVariableDeclarator();
    ExprPtr parseVariableInitializer();
    ExprPtr parseArrayInitializer();

    /// @}
    //=========================================================================
    /// @name Statements
    /// @{
    //=========================================================================

    std::vector<StmtPtr> parseBlock();
    StmtPtr parseStatement();

    /// @brief Do the next tokens start `[final] Type name`?
    /// @details Probes without consuming anything.
    bool isLocalVariableDeclaration();

    /// @brief `[final] Type name = init, ...` without the trailing `;`.
    VariableDeclaration parseLocalVariableDeclaration();

    StmtPtr parseLocalVariableDeclarationStatement();

    /// @brief `yield` in statement position inside a switch expression.
    bool isYieldStatement();

    StmtPtr parseSwitchStatement();

    /// @brief `{ case ... }` of a switch statement or expression.
    /// @details Fills @p groups for colon labels or @p rules for arrow rules.
    void parseSwitchBody(std::vector<SwitchGroup> &groups, std::vector<SwitchRule> &rules, bool expressionBody);

    /// @brief `case a, b` or `default`, without guard or terminator.
    void parseSwitchLabel(std::vector<ExprPtr> &labels, bool &isDefault);

    ExprPtr parseCaseLabel();
    SwitchRule parseSwitchRuleAction(SourceLoc loc, bool expressionBody);

    /// @brief Type pattern or record pattern, `final String s`, `Point(var x)`.
    ExprPtr parsePattern();

    ExprPtr parseRecordPatternRest(SourceLoc loc, TypePtr type);

    StmtPtr parseForStatement();
    std::vector<ExprPtr> parseForInitOrUpdate();

    StmtPtr parseTryStatement();
    CatchClause parseCatchClause();
    std::vector<TryResource> parseResourceSpecification();
    TryResource parseResource();

    /// @}
    //=========================================================================
    /// @name Expressions
    /// @{
    //=========================================================================

    /// @brief Conditional expression, plus a trailing lambda arrow or `::`
    ///        when @p allowLambda is set.
    ExprPtr parseExpressionl(bool allowLambda = true);

    /// @brief Infix chain, folded by precedence.
    ExprPtr parseExpression2();

    /// @brief Prefix operators, primary, selectors and postfix operators.
    ExprPtr parseExpression3();

    std::string parseInfixOperator();

    ExprPtr buildBinary(std::vector<ExprPtr> &operands,
                        std::vector<InfixOperator> &operators,
                        std::size_t first,
                        std::size_t last);

    ExprPtr parsePrimary();
    ExprPtr parseLiteral();
    ExprPtr parseParExpression();
    std::vector<ExprPtr> parseArguments();
    ExprPtr parseSuperSuffix(SourceLoc loc);
    ExprPtr parseExplicitGenericInvocation();
    ExprPtr parseExplicitGenericInvocationSuffix(SourceLoc loc, std::vector<TypeArgument> typeArguments);
    ExprPtr parseIdentifierPrimary();

    ExprPtr parseCreator(SourceLoc loc);
    std::unique_ptr<ReferenceType> parseCreatedName();
    ExprPtr parseArrayCreatorRest(SourceLoc loc, TypePtr type);
    ExprPtr parseInnerCreator(SourceLoc loc);
    ExprPtr parseSelector();

    /// @brief `(params) -> body` starting at `(`.
    ExprPtr parseLambdaExpression();

    /// @brief `-> body` for a single untyped parameter already read as @p name.
    ExprPtr finishSingleParameterLambda(SourceLoc loc, std::string name);

    /// @brief `()`, `(a, b)` or `(int a, final String... b)`.
    std::vector<LambdaParameter> parseLambdaParameters();

    /// @brief Does `(` start a lambda parameter list followed by `->`?
    bool isLambdaStart();

    void parseLambdaBody(Lambda &lambda);

    /// @brief Right of `::`: optional type arguments, then a name or `new`.
    void parseMethodReferenceRest(MethodReference &ref);

    /// @brief `List<String>::size`, `int[]::new`: a method reference whose
    ///        left side only parses as a type.
    ExprPtr parseTypeMethodReference();

    ExprPtr parseSwitchExpression();

    /// @}

    TokenCursor cursor_;
    ParseOptions options_;
    bool tracing_{false};
    unsigned depth_{0};
    bool yieldAllowed_{false};

    /// @brief Message of the most recent SyntaxError, for trace output.
    std::string lastError_;
};

} // namespace javelin::frontends::java
