//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the Expected<void> specialisation together with the helpers that
// build and print diagnostics.  All user-facing errors of the assembler, the
// bytecode reader and the command-line tool are rendered through printDiag so
// they share the "path:line:col: severity: message" layout.
//
//===----------------------------------------------------------------------===//

#include "support/diag_expected.hpp"

namespace regvm::support
{

Expected<void>::Expected(Diag diag) : error_(std::move(diag)) {}

bool Expected<void>::hasValue() const
{
    return !error_.has_value();
}

Expected<void>::operator bool() const
{
    return hasValue();
}

const Diag &Expected<void>::error() const &
{
    return *error_;
}

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

Diag makeNote(std::string msg)
{
    return Diag{Severity::Note, std::move(msg), {}};
}

/// @brief Print a diagnostic to the provided output stream.
///
/// @details When a source manager is supplied and the location names a known
///          file, the message is prefixed with "<path>:<line>:<column>: ".
///          Missing line or column components are omitted.  A trailing newline
///          is always written.
void printDiag(const Diag &diag, std::ostream &os, const SourceManager *sm)
{
    if (sm && diag.loc.isValid())
    {
        auto path = sm->getPath(diag.loc.file_id);
        if (!path.empty())
        {
            os << path;
            if (diag.loc.hasLine())
            {
                os << ':' << diag.loc.line;
                if (diag.loc.hasColumn())
                    os << ':' << diag.loc.column;
            }
            os << ": ";
        }
    }
    os << detail::diagSeverityToString(diag.severity) << ": " << diag.message << '\n';
}

} // namespace regvm::support
