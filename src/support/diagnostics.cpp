/**
 * @file diagnostics.cpp
 * @brief Implements the diagnostic engine used by the assembler front end.
 * @copyright
 *     GNU GPL v3. See the LICENSE file in the project root for full terms.
 * @details
 *     The parser keeps going after a malformed line so that one run reports
 *     every problem in a file.  Each problem is recorded here and printed by
 *     the command-line driver once parsing finishes.
 */

#include "support/diagnostics.hpp"
#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"

namespace regvm::support
{

/**
 * @brief Adds a diagnostic to the engine and updates severity counters.
 *
 * @param d Diagnostic to record; moved into the engine's storage.
 */
void DiagnosticEngine::report(Diagnostic d)
{
    if (d.severity == Severity::Error)
        ++errors_;
    else if (d.severity == Severity::Warning)
        ++warnings_;
    diags_.push_back(std::move(d));
}

/**
 * @brief Writes all stored diagnostics to the provided output stream.
 *
 * Formatting is delegated to `printDiag` so engine output and single
 * diagnostics look the same.
 *
 * @param os Output stream that receives the formatted diagnostics.
 * @param sm Optional source manager used to translate file identifiers.
 */
void DiagnosticEngine::printAll(std::ostream &os, const SourceManager *sm) const
{
    for (const auto &d : diags_)
    {
        printDiag(d, os, sm);
    }
}

size_t DiagnosticEngine::errorCount() const
{
    return errors_;
}

size_t DiagnosticEngine::warningCount() const
{
    return warnings_;
}

} // namespace regvm::support
