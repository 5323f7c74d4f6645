//===----------------------------------------------------------------------===//
//
// Part of the Javelin project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the `javelin-parse` developer utility. The program loads Java
// source filess, runs the lexer and parser over it and reports the outcome.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Entry point for the Java parse checker CLI.

#include "frontends/java/AstPrinter.hpp"
#include "frontends/java/Frontend.hpp"
#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace javelin::frontends::java;
using namespace javelin::support;

namespace
{

void printUsage()
{
    std::cerr << "Usage: javelin-parse [options] <file.java>...\n"
              << "\n"
              << "Options:\n"
              << "  --tokens             Print the token stream before parsing\n"
              << "  --trace              Log every grammar procedure entered\n"
              << "  --ignore-lex-errors  Report lexical errors but keep parsing\n"
              << "  --ast                Print the syntax tree on success\n"
              << "  -h, --help           Show this help\n";
}

} // namespace

/// @brief Parse each Java file named on the command line.
/// @return 0 when every file parses, 1 on any failure, 2 on a usage error.
int main(int argc, char **argv)
{
    ParseOptions options;
    bool printAst = false;
    std::vector<std::string> paths;

    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg = argv[i];
        if (arg == "--tokens")
            options.dumpTokens = true;
        else if (arg == "--trace")
            options.trace = true;
        else if (arg == "--ignore-lex-errors")
            options.ignoreLexErrors = true;
        else if (arg == "--ast")
            printAst = true;
        else if (arg == "-h" || arg == "--help")
        {
            printUsage();
            return 0;
        }
        else if (!arg.empty() && arg.front() == '-')
        {
            std::cerr << "javelin-parse: unknown option '" << arg << "'\n";
            printUsage();
            return 2;
        }
        else
            paths.emplace_back(arg);
    }

    if (paths.empty())
    {
        printUsage();
        return 2;
    }

    SourceManager sm;
    DiagnosticEngine diag;
    bool failed = false;
    for (const std::string &path : paths)
    {
        std::optional<uint32_t> fileId = sm.loadFile(path);
        if (!fileId)
        {
            std::cerr << "javelin-parse: cannot read '" << path << "'\n";
            failed = true;
            continue;
        }
        options.fileId = *fileId;

        auto unit = parseSource(sm.getText(*fileId), diag, options);
        if (!unit)
        {
            failed = true;
            continue;
        }
        if (printAst)
        {
            AstPrinter printer;
            std::cout << printer.dump(*unit);
        }
    }

    diag.printAll(std::cerr, &sm);
    return failed || diag.errorCount() > 0 ? 1 : 0;
}
