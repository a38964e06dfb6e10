//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bytecode/Encoder.hpp
// Purpose: Translate resolved assembly instructions into 24-bit words.
// Key invariants: Only resolved programs (no labels) can be encoded.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "assembler/Ast.hpp"
#include "support/diag_expected.hpp"

#include <cstdint>
#include <vector>

namespace regvm::bytecode
{

/// @brief Encoded instruction word (low 24 bits used).
using MachineCode = uint32_t;

/// @brief Encode a single instruction.
/// @return The instruction word, or a diagnostic when the instruction is a
///         Label, still references a label, or has ill-shaped operands.
support::Expected<MachineCode> encode(const assembler::Instr &in);

/// @brief Encode every instruction of @p program in order.
/// @return Words, or the diagnostic of the first instruction that failed.
support::Expected<std::vector<MachineCode>> encodeProgram(const assembler::Program &program);

} // namespace regvm::bytecode
