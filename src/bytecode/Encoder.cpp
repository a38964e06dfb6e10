//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bytecode/Encoder.cpp
// Purpose: Lowers assembler::Instr values into instruction words.
// Key invariants: mv and nop share the ADDI encoding with a zero immediate.
//
//===----------------------------------------------------------------------===//

#include "bytecode/Encoder.hpp"

#include "assembler/OpcodeInfo.hpp"
#include "assembler/Serializer.hpp"
#include "bytecode/Bytecode.hpp"

#include <sstream>

namespace regvm::bytecode
{
namespace
{
using assembler::Instr;
using assembler::Opcode;
using assembler::OperandKind;
using support::Expected;
using support::makeError;

/// @brief Check operand count, shapes and register range against OpcodeInfo.
Expected<void> validateShape(const Instr &in)
{
    const auto &info = assembler::getOpcodeInfo(in.op);
    if (in.operands.size() != info.numOperands)
    {
        std::ostringstream oss;
        oss << "'" << info.name << "' expects " << static_cast<unsigned>(info.numOperands)
            << " operands, got " << in.operands.size();
        return Expected<void>{makeError(in.loc, oss.str())};
    }

    for (size_t i = 0; i < in.operands.size(); ++i)
    {
        const auto &operand = in.operands[i];
        if (operand.kind == OperandKind::Label)
        {
            return Expected<void>{makeError(
                in.loc, "cannot encode unresolved label '" + operand.label + "'")};
        }
        if (!assembler::operandMatches(info.operands[i], operand))
        {
            std::ostringstream oss;
            oss << "invalid operand '" << assembler::formatOperand(operand) << "' in '"
                << assembler::formatInstr(in) << "': expected "
                << assembler::shapeName(info.operands[i]);
            return Expected<void>{makeError(in.loc, oss.str())};
        }
        if (operand.kind == OperandKind::Reg && operand.value >= assembler::kNumRegisters)
        {
            return Expected<void>{makeError(
                in.loc, "invalid register r" + std::to_string(operand.value))};
        }
        if (operand.kind == OperandKind::Imm8 && operand.value > 0xFF)
        {
            return Expected<void>{makeError(
                in.loc, "immediate " + std::to_string(operand.value) + " does not fit in 8 bits")};
        }
        if (operand.kind == OperandKind::Imm12 && operand.value > assembler::kMaxImm12)
        {
            return Expected<void>{makeError(
                in.loc, "address " + std::to_string(operand.value) + " does not fit in 12 bits")};
        }
    }
    return {};
}

uint8_t reg(const Instr &in, size_t i)
{
    return static_cast<uint8_t>(in.operands[i].value);
}

MachineCode encodeRRR(BCOpcode op, const Instr &in)
{
    return InstrBuilder().opcode(op).rd(reg(in, 0)).rs1(reg(in, 1)).rs2(reg(in, 2)).finalize();
}

MachineCode encodeRRI(BCOpcode op, const Instr &in)
{
    return InstrBuilder()
        .opcode(op)
        .rd(reg(in, 0))
        .rs1(reg(in, 1))
        .imm8(static_cast<uint8_t>(in.operands[2].value))
        .finalize();
}

MachineCode encodeBranch(BranchCond cond, const Instr &in)
{
    return InstrBuilder()
        .opcode(BCOpcode::BRANCH)
        .fun2(static_cast<uint8_t>(cond))
        .imm12(in.operands[0].value)
        .finalize();
}
} // namespace

Expected<MachineCode> encode(const Instr &in)
{
    if (in.op == Opcode::Label)
        return Expected<MachineCode>{makeError(in.loc, "cannot encode label '" + in.label + "'")};

    if (auto ok = validateShape(in); !ok)
        return Expected<MachineCode>{ok.error()};

    switch (in.op)
    {
        case Opcode::Halt:
            return InstrBuilder().opcode(BCOpcode::HALT).finalize();
        case Opcode::Nop:
            return InstrBuilder().opcode(BCOpcode::ADDI).rd(0).rs1(0).imm8(0).finalize();
        case Opcode::Mv:
            return InstrBuilder().opcode(BCOpcode::ADDI).rd(reg(in, 0)).rs1(reg(in, 1)).finalize();
        case Opcode::Not:
            return InstrBuilder().opcode(BCOpcode::NOT).rd(reg(in, 0)).rs1(reg(in, 1)).finalize();
        case Opcode::Add:
            return encodeRRR(BCOpcode::ADD, in);
        case Opcode::Sub:
            return encodeRRR(BCOpcode::SUB, in);
        case Opcode::And:
            return encodeRRR(BCOpcode::AND, in);
        case Opcode::Or:
            return encodeRRR(BCOpcode::OR, in);
        case Opcode::Xor:
            return encodeRRR(BCOpcode::XOR, in);
        case Opcode::Addi:
            return encodeRRI(BCOpcode::ADDI, in);
        case Opcode::Andi:
            return encodeRRI(BCOpcode::ANDI, in);
        case Opcode::Ori:
            return encodeRRI(BCOpcode::ORI, in);
        case Opcode::Xori:
            return encodeRRI(BCOpcode::XORI, in);
        case Opcode::Jmp:
            return encodeBranch(BranchCond::Always, in);
        case Opcode::Bz:
            return encodeBranch(BranchCond::Zero, in);
        case Opcode::Bnz:
            return encodeBranch(BranchCond::NotZero, in);
        case Opcode::Label:
            break;
    }
    return Expected<MachineCode>{
        makeError(in.loc, "unknown instruction '" + assembler::formatInstr(in) + "'")};
}

Expected<std::vector<MachineCode>> encodeProgram(const assembler::Program &program)
{
    std::vector<MachineCode> out;
    out.reserve(program.size());
    for (const Instr &in : program)
    {
        auto word = encode(in);
        if (!word)
            return Expected<std::vector<MachineCode>>{word.error()};
        out.push_back(word.value());
    }
    return out;
}

} // namespace regvm::bytecode
