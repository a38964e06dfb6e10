//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/assembler/Parser.hpp
// Purpose: Declares the assembly text parser producing an unresolved Program.
// Key invariants: Returned programs may still contain Label instructions and
//                 Label operands; SymbolTable resolves them.
// Ownership/Lifetime: Parsed instructions are returned by value.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "assembler/Ast.hpp"
#include "assembler/Lexer.hpp"
#include "support/diag_expected.hpp"

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace regvm::assembler
{

/// @brief Parser for the line-oriented assembly language.
class Parser
{
  public:
    /// @brief Parse a whole source buffer.
    /// @details Every malformed line is reported to @p diags; parsing continues
    ///          with the next line so one run surfaces all errors.
    /// @param source Assembly text.
    /// @param fileId SourceManager id stamped on instruction locations.
    /// @param diags Engine receiving one error per malformed line.
    /// @return Parsed statements; meaningful only when no error was reported.
    static Program parseProgram(std::string_view source,
                                uint32_t fileId,
                                support::DiagnosticEngine &diags);

    /// @brief Parse a single line.
    /// @param line Raw line text.
    /// @param loc Location of the line (file id and line number).
    /// @return Zero, one or two statements (label and instruction), or a diagnostic.
    static support::Expected<std::vector<Instr>> parseLine(std::string_view line,
                                                           support::SourceLoc loc = {});

    /// @brief Parse a numeric literal: decimal, optionally negative, or 0x hex.
    /// @return Parsed value, or std::nullopt when @p text is not a number.
    static std::optional<long long> parseNumber(std::string_view text);

    /// @brief Parse a register token such as "r3".
    static support::Expected<Operand> parseRegister(const Token &tok, support::SourceLoc loc);

    /// @brief Parse an 8-bit immediate; negative decimals wrap to two's complement.
    static support::Expected<Operand> parseImm8(const Token &tok, support::SourceLoc loc);

    /// @brief Parse a branch target: a label reference or a 12-bit address.
    static support::Expected<Operand> parseTarget(const Token &tok, support::SourceLoc loc);
};

} // namespace regvm::assembler
