//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/assembler/SymbolTable.hpp
// Purpose: Label resolution: collect label addresses, then rewrite label
//          operands into 12-bit addresses.
// Key invariants: A label's address is the index of the next real instruction.
// Ownership/Lifetime: Passes return new programs; inputs are not modified.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "assembler/Ast.hpp"
#include "support/diag_expected.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>

namespace regvm::assembler
{

/// @brief Mapping between label names and instruction addresses.
using SymbolTable = std::unordered_map<std::string, uint16_t>;

/// @brief Output of stripSymbols().
struct StrippedProgram
{
    Program program;     ///< Input without Label pseudo-instructions.
    SymbolTable symbols; ///< Address of every label defined in the input.
};

/// @brief Remove Label pseudo-instructions and record their addresses.
/// @return Stripped program and table, or a diagnostic for a duplicate label
///         or a program exceeding kMaxProgramSize instructions.
support::Expected<StrippedProgram> stripSymbols(const Program &prg);

/// @brief Replace Label operands with Imm12 addresses taken from @p symbols.
/// @return Resolved program, or a diagnostic for an undefined label or a Label
///         instruction left in @p prg.
support::Expected<Program> replaceSymbols(const Program &prg, const SymbolTable &symbols);

} // namespace regvm::assembler
