//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/assembler/Ast.hpp
// Purpose: In-memory form of an assembly program: operands, instructions and
//          the Label pseudo-instruction consumed by the symbol pass.
// Key invariants: A resolved Program contains no Label instructions and no
//                 Label operands.
// Ownership/Lifetime: Instructions own their operands and label text.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace regvm::assembler
{

/// @brief Number of architectural registers (r0 is hard-wired to zero).
constexpr uint8_t kNumRegisters = 16;

/// @brief Largest value representable by an imm12 field (branch targets).
constexpr uint16_t kMaxImm12 = 0xFFF;

/// @brief Maximum number of instructions addressable by a 12-bit target.
constexpr size_t kMaxProgramSize = static_cast<size_t>(kMaxImm12) + 1;

/// @brief Classification of instruction operands.
enum class OperandKind : uint8_t
{
    Reg,   ///< Register index.
    Imm8,  ///< 8-bit immediate.
    Imm12, ///< 12-bit immediate (instruction address).
    Label  ///< Symbolic address, replaced by Imm12 during symbol resolution.
};

/// @brief Single instruction operand.
struct Operand
{
    OperandKind kind = OperandKind::Imm8;
    uint16_t value = 0; ///< Register index or immediate; unused for labels.
    std::string label;  ///< Referenced label name for OperandKind::Label.

    static Operand reg(uint8_t index)
    {
        return Operand{OperandKind::Reg, index, {}};
    }

    static Operand imm8(uint8_t v)
    {
        return Operand{OperandKind::Imm8, v, {}};
    }

    static Operand imm12(uint16_t v)
    {
        return Operand{OperandKind::Imm12, v, {}};
    }

    static Operand labelRef(std::string name)
    {
        return Operand{OperandKind::Label, 0, std::move(name)};
    }

    bool operator==(const Operand &other) const = default;
};

/// @brief Assembly mnemonics plus the Label pseudo-instruction.
enum class Opcode : uint8_t
{
    Label, ///< Symbol placeholder, stripped before encoding.
    Halt,  ///< Terminate the program.
    Nop,   ///< No operation.
    Mv,    ///< rd = rs1
    Not,   ///< rd = ~rs1
    Add,   ///< rd = rs1 + rs2
    Sub,   ///< rd = rs1 - rs2
    And,   ///< rd = rs1 & rs2
    Or,    ///< rd = rs1 | rs2
    Xor,   ///< rd = rs1 ^ rs2
    Addi,  ///< rd = rs1 + imm8
    Andi,  ///< rd = rs1 & imm8
    Ori,   ///< rd = rs1 | imm8
    Xori,  ///< rd = rs1 ^ imm8
    Jmp,   ///< pc = target
    Bz,    ///< pc = target if the zero flag is set
    Bnz,   ///< pc = target if the zero flag is clear
};

/// @brief Number of enumerators in Opcode.
constexpr size_t kNumOpcodes = static_cast<size_t>(Opcode::Bnz) + 1;

/// @brief One assembly statement.
/// @details Equality ignores the source location so that parsed and
///          hand-built instructions compare equal.
struct Instr
{
    Opcode op = Opcode::Nop;
    std::vector<Operand> operands;
    std::string label;      ///< Defined name for Opcode::Label.
    support::SourceLoc loc; ///< Origin in the source file, when known.

    /// @brief Build a Label pseudo-instruction defining @p name.
    static Instr makeLabel(std::string name, support::SourceLoc loc = {})
    {
        Instr in;
        in.op = Opcode::Label;
        in.label = std::move(name);
        in.loc = loc;
        return in;
    }

    bool operator==(const Instr &other) const
    {
        return op == other.op && operands == other.operands && label == other.label;
    }
};

/// @brief A program is the ordered list of its statements.
using Program = std::vector<Instr>;

} // namespace regvm::assembler
