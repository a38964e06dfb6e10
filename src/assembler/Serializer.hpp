//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/assembler/Serializer.hpp
// Purpose: Renders operands, instructions and programs back to assembly text.
// Key invariants: Output of a resolved program parses back to an equal program.
// Ownership/Lifetime: Writes into caller-provided streams.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "assembler/Ast.hpp"

#include <ostream>
#include <string>

namespace regvm::assembler
{

/// @brief Format @p operand as "r3", "255" or a label name.
std::string formatOperand(const Operand &operand);

/// @brief Format @p in as "add r3, r1, r2" or "loop:" for labels.
std::string formatInstr(const Instr &in);

/// @brief Serializer for whole programs.
class Serializer
{
  public:
    /// @brief Output options.
    enum class Mode
    {
        Plain,        ///< Statement text only.
        WithAddresses ///< Append "; 0003" address comments.
    };

    /// @brief Write @p program, one statement per line, instructions indented.
    static void write(const Program &program, std::ostream &os, Mode mode = Mode::Plain);

    /// @brief Return the text write() would produce.
    static std::string toString(const Program &program, Mode mode = Mode::Plain);
};

std::ostream &operator<<(std::ostream &os, const Operand &operand);
std::ostream &operator<<(std::ostream &os, const Instr &in);

} // namespace regvm::assembler
