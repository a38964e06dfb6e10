//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/assembler/Compiler.hpp
// Purpose: Assembly pipeline entry point: parse, strip labels, resolve labels.
// Key invariants: A successful result contains no Label instructions/operands.
// Ownership/Lifetime: Returns the program by value.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "assembler/Ast.hpp"
#include "support/diag_expected.hpp"

#include <cstdint>
#include <string_view>

namespace regvm::assembler
{

/// @brief Compile assembly text into a resolved program.
/// @param source Assembly text.
/// @param fileId SourceManager id of the text, 0 when anonymous.
/// @param diags Receives every diagnostic produced by the pipeline.
/// @return Resolved program, or the first error reported to @p diags.
support::Expected<Program> compileProgram(std::string_view source,
                                          uint32_t fileId,
                                          support::DiagnosticEngine &diags);

/// @brief Compile anonymous assembly text, discarding all but the first error.
support::Expected<Program> compileProgram(std::string_view source);

} // namespace regvm::assembler
