//===----------------------------------------------------------------------===//
//
// Part of the Javelin project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements severity names and the single-diagnostic printer shared by
// DiagnosticEngine and the command line tool.
//
//===----------------------------------------------------------------------===//

#include "support/diag_expected.hpp"

namespace javelin::support
{
namespace detail
{
const char *diagSeverityToString(Severity severity)
{
    switch (severity)
    {
        case Severity::Note:
            return "note";
        case Severity::Warning:
            return "warning";
        case Severity::Error:
            return "error";
    }
    return "";
}
} // namespace detail

Diag makeError(SourceLoc loc, std::string msg)
{
    return Diag{Severity::Error, std::move(msg), loc};
}

/// @brief Print a diagnostic to the provided output stream.
/// @details When a SourceManager resolves the file id, the message is
///          prefixed with the path. A positioned diagnostic then adds
///          `:<line>:<column>`. The output always ends with a newline.
void printDiag(const Diag &diag, std::ostream &os, const SourceManager *sm)
{
    bool wrotePrefix = false;
    if (sm && diag.loc.hasFile())
    {
        auto path = sm->getPath(diag.loc.file_id);
        if (!path.empty())
        {
            os << path;
            wrotePrefix = true;
        }
    }
    if (diag.loc.isValid())
    {
        if (wrotePrefix)
            os << ':';
        os << diag.loc.line;
        if (diag.loc.hasColumn())
            os << ':' << diag.loc.column;
        wrotePrefix = true;
    }
    if (wrotePrefix)
        os << ": ";
    os << detail::diagSeverityToString(diag.severity) << ": " << diag.message << '\n';
}
} // namespace javelin::support
