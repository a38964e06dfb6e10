//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/assembler/Compiler.cpp
// Purpose: Chains the parser and the two symbol passes.
// Key invariants: Later phases only run when earlier ones reported no error.
//
//===----------------------------------------------------------------------===//

#include "assembler/Compiler.hpp"

#include "assembler/Parser.hpp"
#include "assembler/SymbolTable.hpp"

namespace regvm::assembler
{

using support::Expected;

Expected<Program> compileProgram(std::string_view source,
                                 uint32_t fileId,
                                 support::DiagnosticEngine &diags)
{
    const size_t firstNew = diags.diagnostics().size();
    const size_t errorsBefore = diags.errorCount();
    Program parsed = Parser::parseProgram(source, fileId, diags);
    if (diags.errorCount() != errorsBefore)
    {
        for (size_t i = firstNew; i < diags.diagnostics().size(); ++i)
        {
            if (diags.diagnostics()[i].severity == support::Severity::Error)
                return Expected<Program>{diags.diagnostics()[i]};
        }
    }

    auto stripped = stripSymbols(parsed);
    if (!stripped)
    {
        diags.report(stripped.error());
        return Expected<Program>{stripped.error()};
    }

    auto resolved = replaceSymbols(stripped.value().program, stripped.value().symbols);
    if (!resolved)
    {
        diags.report(resolved.error());
        return Expected<Program>{resolved.error()};
    }
    return resolved;
}

Expected<Program> compileProgram(std::string_view source)
{
    support::DiagnosticEngine diags;
    return compileProgram(source, 0, diags);
}

} // namespace regvm::assembler
