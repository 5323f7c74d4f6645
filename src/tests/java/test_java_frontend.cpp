//===----------------------------------------------------------------------===//
//
// Part of the Javelin project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Tests for the parse entry points: syntax error reporting, diagnostics,
// the nesting limit, trace and token dump output, backtracking, and the
// tree printer.
//
//===----------------------------------------------------------------------===//

#include "frontends/java/AstPrinter.hpp"
#include "frontends/java/Errors.hpp"
#include "frontends/java/Frontend.hpp"
#include "frontends/java/Lexer.hpp"
#include "frontends/java/Parser.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

using namespace javelin::frontends::java;
namespace support = javelin::support;

namespace
{

/// @brief Build `class A { int x = (((...1...))); }` with @p depth parens.
std::string nestedParens(int depth)
{
    std::string src = "class A { int x = ";
    src += std::string(static_cast<std::size_t>(depth), '(');
    src += "1";
    src += std::string(static_cast<std::size_t>(depth), ')');
    src += "; }";
    return src;
}

bool contains(const std::string &haystack, const std::string &needle)
{
    return haystack.find(needle) != std::string::npos;
}

} // namespace

//===----------------------------------------------------------------------===//
// Syntax errors
//===----------------------------------------------------------------------===//

TEST(JavaFrontend, MissingBraceReportsEndOfInput)
{
    Lexer lexer("class A {\n  int x;\n");
    Parser parser(lexer);
    try
    {
        parser.parseCompilationUnit();
        FAIL() << "expected SyntaxError";
    }
    catch (const SyntaxError &e)
    {
        EXPECT_STREQ(e.what(), "Expected '}'");
        EXPECT_TRUE(e.token().isEnd());
        EXPECT_EQ(e.describe(), "Expected '}' at end of input");
    }
}

TEST(JavaFrontend, ErrorNamesOffendingToken)
{
    Lexer lexer("class A { void f() { int = 3; } }");
    Parser parser(lexer);
    try
    {
        parser.parseCompilationUnit();
        FAIL() << "expected SyntaxError";
    }
    catch (const SyntaxError &e)
    {
        EXPECT_EQ(e.token().text, "=");
        EXPECT_EQ(e.loc().line, 1u);
        EXPECT_TRUE(contains(e.describe(), "line 1"));
    }
}

TEST(JavaFrontend, ParseSourceReturnsUnitOrDiagnostic)
{
    auto ok = parseSource("package p; class A {}");
    ASSERT_TRUE(ok.hasValue());
    ASSERT_NE(ok.value()->package, nullptr);
    EXPECT_EQ(ok.value()->package->name, "p");

    auto bad = parseSource("class A { void f( }");
    ASSERT_FALSE(bad.hasValue());
    EXPECT_EQ(bad.error().severity, support::Severity::Error);
    EXPECT_TRUE(contains(bad.error().message, "Expected"));
    EXPECT_EQ(bad.error().loc.line, 1u);
}

TEST(JavaFrontend, LexErrorsSurfaceThroughParseSource)
{
    auto result = parseSource("class A { String s = \"open; }");
    ASSERT_FALSE(result.hasValue());
    EXPECT_TRUE(contains(result.error().message, "Unterminated character/string literal"));
}

TEST(JavaFrontend, BestEffortLexingReportsAndContinues)
{
    support::DiagnosticEngine diag;
    ParseOptions options;
    options.ignoreLexErrors = true;
    options.fileId = 3;

    auto unit = parseSource("class A { int # x = 1; }", diag, options);
    ASSERT_NE(unit, nullptr);
    ASSERT_EQ(unit->types.size(), 1u);
    EXPECT_EQ(diag.errorCount(), 1u);
    ASSERT_EQ(diag.diagnostics().size(), 1u);
    EXPECT_TRUE(contains(diag.diagnostics()[0].message, "Could not process token"));
    EXPECT_EQ(diag.diagnostics()[0].loc.file_id, 3u);
}

TEST(JavaFrontend, DiagnosticEngineCollectsSyntaxError)
{
    support::DiagnosticEngine diag;
    auto unit = parseSource("interface I { int X; }", diag);
    EXPECT_EQ(unit, nullptr);
    ASSERT_EQ(diag.errorCount(), 1u);
    EXPECT_TRUE(contains(diag.diagnostics()[0].message, "Expected '='"));

    std::ostringstream out;
    diag.printAll(out);
    EXPECT_TRUE(contains(out.str(), "Expected '='"));
}

TEST(JavaFrontend, ParsePreTokenizedInput)
{
    std::vector<Token> tokens = tokenize("enum E { A, B }");
    auto unit = parse(std::move(tokens));
    ASSERT_EQ(unit->types.size(), 1u);
    EXPECT_EQ(unit->types[0]->kind, DeclKind::Enum);
}

//===----------------------------------------------------------------------===//
// Backtracking
//===----------------------------------------------------------------------===//

TEST(JavaFrontend, SpeculationLeavesStreamIntact)
{
    // Each statement forces at least one failed speculative parse.
    auto result = parseSource("class A {\n"
                              "  void f() {\n"
                              "    a < b;\n"
                              "    x = (a) - b;\n"
                              "    foo.bar(1);\n"
                              "    List<String> names = (List<String>) raw;\n"
                              "    Runnable r = () -> run();\n"
                              "    int[] xs = new int[] {1, 2};\n"
                              "  }\n"
                              "}\n");
    ASSERT_TRUE(result.hasValue());
    const auto &cls = static_cast<const ClassDecl &>(*result.value()->types[0]);
    const auto &f = static_cast<const MethodDecl &>(*cls.body[0]);
    ASSERT_TRUE(f.body.has_value());
    ASSERT_EQ(f.body->size(), 6u);
    EXPECT_EQ((*f.body)[0]->kind, StmtKind::Expression);
    EXPECT_EQ((*f.body)[1]->kind, StmtKind::Expression);
    EXPECT_EQ((*f.body)[2]->kind, StmtKind::Expression);
    EXPECT_EQ((*f.body)[3]->kind, StmtKind::LocalVariable);
    EXPECT_EQ((*f.body)[4]->kind, StmtKind::LocalVariable);
    EXPECT_EQ((*f.body)[5]->kind, StmtKind::LocalVariable);
}

//===----------------------------------------------------------------------===//
// Nesting limit
//===----------------------------------------------------------------------===//

TEST(JavaFrontend, ModerateNestingParses)
{
    auto result = parseSource(nestedParens(40));
    EXPECT_TRUE(result.hasValue());
}

TEST(JavaFrontend, DeepNestingIsRejected)
{
    auto result = parseSource(nestedParens(300));
    ASSERT_FALSE(result.hasValue());
    EXPECT_TRUE(contains(result.error().message, "Nesting too deep"));
}

TEST(JavaFrontend, NestingLimitIsConfigurable)
{
    ParseOptions options;
    options.maxDepth = 5;
    Lexer lexer("class A { int x = 1; }");
    Parser parser(lexer, options);
    EXPECT_THROW(parser.parseCompilationUnit(), NestingLimitError);
}

//===----------------------------------------------------------------------===//
// Trace and token dump
//===----------------------------------------------------------------------===//

TEST(JavaFrontend, TraceWritesProcedureEntryAndExit)
{
    std::ostringstream trace;
    ParseOptions options;
    options.trace = true;
    options.traceStream = &trace;

    auto result = parseSource("class A {}", options);
    ASSERT_TRUE(result.hasValue());
    const std::string out = trace.str();
    EXPECT_TRUE(contains(out, "[javelin] 00 -> parseCompilationUnit("));
    EXPECT_TRUE(contains(out, "[javelin] 00 <- parseCompilationUnit("));
    EXPECT_TRUE(contains(out, "parseNormalClassDeclaration"));
}

TEST(JavaFrontend, TraceMarksFailedProcedures)
{
    std::ostringstream trace;
    ParseOptions options;
    options.trace = true;
    options.traceStream = &trace;

    auto result = parseSource("class A {", options);
    ASSERT_FALSE(result.hasValue());
    EXPECT_TRUE(contains(trace.str(), "Expected '}'"));
}

TEST(JavaFrontend, TokenDump)
{
    std::ostringstream out;
    dumpTokens(tokenize("int x = 'a';"), out);
    const std::string text = out.str();
    EXPECT_EQ(text.rfind("=== Javelin Token Stream ===\n", 0), 0u);
    EXPECT_TRUE(contains(text, "1:1\tBasicType\t\"int\""));
    EXPECT_TRUE(contains(text, "=== End Token Stream ==="));

    std::ostringstream viaOptions;
    ParseOptions options;
    options.dumpTokens = true;
    options.traceStream = &viaOptions;
    EXPECT_TRUE(parseSource("class A {}", options).hasValue());
    EXPECT_TRUE(contains(viaOptions.str(), "\"class\""));
}

//===----------------------------------------------------------------------===//
// Tree printer
//===----------------------------------------------------------------------===//

TEST(JavaFrontend, AstPrinterDumpsCompilationUnit)
{
    auto result = parseSource("class A { int f() { return 1 + x; } }");
    ASSERT_TRUE(result.hasValue());
    const std::string dump = AstPrinter().dump(*result.value());
    EXPECT_EQ(dump.rfind("CompilationUnit\n", 0), 0u);
    EXPECT_TRUE(contains(dump, "ClassDecl \"A\" (1:1)"));
    EXPECT_TRUE(contains(dump, "MethodDecl \"f\""));
    EXPECT_TRUE(contains(dump, "ReturnStmt"));
    EXPECT_TRUE(contains(dump, "Binary +"));
    EXPECT_TRUE(contains(dump, "MemberReference \"x\""));
}

TEST(JavaFrontend, AstPrinterShowsModifiersAndQualifiers)
{
    auto result = parseSource("public final class B { void g() { a.b.c(); } }");
    ASSERT_TRUE(result.hasValue());
    const std::string dump = AstPrinter().dump(*result.value());
    EXPECT_TRUE(contains(dump, "ClassDecl \"B\" [final public]"));
    EXPECT_TRUE(contains(dump, "qualifier=a.b"));
}
