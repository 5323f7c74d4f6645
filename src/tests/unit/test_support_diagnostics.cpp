//===----------------------------------------------------------------------===//
//
// Part of the Javelin project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Unit tests for the support layer: file registration in SourceManager,
// diagnostic formatting and DiagnosticEngine counters.
//
//===----------------------------------------------------------------------===//

#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <string>

using namespace javelin::support;

TEST(SupportSourceManager, RegistersNormalizedPathsOnce)
{
    SourceManager sm;
    uint32_t first = sm.addFile("src/./Main.java");
    uint32_t again = sm.addFile("src/Main.java");
    uint32_t other = sm.addFile("src/Other.java");

    EXPECT_NE(first, 0u);
    EXPECT_EQ(first, again);
    EXPECT_NE(first, other);
    EXPECT_EQ(sm.getPath(first), "src/Main.java");
    EXPECT_TRUE(sm.getPath(0).empty());
    EXPECT_TRUE(sm.getPath(99).empty());
    EXPECT_TRUE(sm.getText(first).empty());
}

TEST(SupportSourceManager, MissingFileIsNotRegistered)
{
    SourceManager sm;
    EXPECT_FALSE(sm.loadFile("/nonexistent/dir/Missing.java").has_value());
    EXPECT_TRUE(sm.getPath(1).empty());
}

TEST(SupportDiagnostics, PrintDiagFormatsLocation)
{
    SourceManager sm;
    uint32_t id = sm.addFile("pkg/A.java");

    std::ostringstream withFile;
    printDiag(makeError({id, 3, 7}, "Expected ';'"), withFile, &sm);
    EXPECT_EQ(withFile.str(), "pkg/A.java:3:7: error: Expected ';'\n");

    std::ostringstream noFile;
    printDiag(makeError({0, 2, 1}, "bad"), noFile);
    EXPECT_EQ(noFile.str(), "2:1: error: bad\n");

    std::ostringstream noLocation;
    printDiag(makeError({}, "bad"), noLocation);
    EXPECT_EQ(noLocation.str(), "error: bad\n");
}

TEST(SupportDiagnostics, EngineCountsBySeverity)
{
    DiagnosticEngine diag;
    diag.report(makeError({0, 1, 1}, "first"));
    diag.report(Diagnostic{Severity::Warning, "careful", {}});
    diag.report(Diagnostic{Severity::Note, "see here", {}});
    diag.report(makeError({0, 4, 2}, "second"));

    EXPECT_EQ(diag.errorCount(), 2u);
    EXPECT_EQ(diag.warningCount(), 1u);
    ASSERT_EQ(diag.diagnostics().size(), 4u);

    std::ostringstream out;
    diag.printAll(out);
    EXPECT_EQ(out.str(), "1:1: error: first\nwarning: careful\nnote: see here\n4:2: error: second\n");
}

TEST(SupportDiagnostics, ExpectedHoldsValueOrDiagnostic)
{
    Expected<int> ok(42);
    ASSERT_TRUE(ok.hasValue());
    EXPECT_EQ(ok.value(), 42);

    Expected<int> failed(makeError({0, 5, 9}, "nope"));
    EXPECT_FALSE(failed);
    EXPECT_EQ(failed.error().message, "nope");
    EXPECT_EQ(failed.error().loc.column, 9u);
}
