//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/assembler/OpcodeInfo.hpp
// Purpose: Static metadata describing each assembly opcode's spelling and
//          operand shape.
// Key invariants: Table is indexed by Opcode and covers every enumerator.
// Ownership/Lifetime: Table entries have static storage duration.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "assembler/Ast.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace regvm::assembler
{

/// @brief Operand slot accepted by an opcode.
enum class OperandShape : uint8_t
{
    None,  ///< Slot unused.
    Reg,   ///< Register.
    Imm8,  ///< 8-bit immediate.
    Target ///< Branch target: Imm12 address or Label reference.
};

/// @brief Spelling and operand layout of one opcode.
struct OpcodeInfo
{
    const char *name;                      ///< Lowercase mnemonic.
    uint8_t numOperands;                   ///< Number of operands required.
    std::array<OperandShape, 3> operands;  ///< Shape of each operand slot.
    bool isBranch;                         ///< Transfers control to a target.
};

/// @brief Look up metadata for @p op.
const OpcodeInfo &getOpcodeInfo(Opcode op);

/// @brief Resolve a mnemonic spelling (case-insensitive) to its opcode.
/// @return Opcode, or std::nullopt for unknown spellings and for "label".
std::optional<Opcode> lookupMnemonic(std::string_view name);

/// @brief Check whether operand @p operand satisfies slot @p shape.
bool operandMatches(OperandShape shape, const Operand &operand);

/// @brief Human-readable description of @p shape for diagnostics.
const char *shapeName(OperandShape shape);

} // namespace regvm::assembler
