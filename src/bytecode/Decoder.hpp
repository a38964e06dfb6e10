//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bytecode/Decoder.hpp
// Purpose: Instruction decoder turning 24-bit words back into resolved
//          assembler::Instr values for the interpreter and disassembler.
// Key invariants: Decoded instructions carry no source location.
//                 decode(encode(x)) executes identically to x.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "assembler/Ast.hpp"
#include "support/diag_expected.hpp"

#include <cstdint>
#include <vector>

namespace regvm::bytecode
{

/// @brief Decode one instruction word.
/// @param word Encoded instruction.
/// @param address Position of the word, used in diagnostics.
/// @return Instruction, or a diagnostic for unknown opcodes, bad branch
///         conditions, non-zero reserved bits or bits above bit 23.
support::Expected<assembler::Instr> decode(uint32_t word, uint16_t address = 0);

/// @brief Decode a whole instruction stream.
support::Expected<assembler::Program> decodeProgram(const std::vector<uint32_t> &words);

} // namespace regvm::bytecode
