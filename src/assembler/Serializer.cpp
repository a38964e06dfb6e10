//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/assembler/Serializer.cpp
// Purpose: Implements textual rendering of assembly programs, used by the
//          disassembler, the trace sink and test failure messages.
//
//===----------------------------------------------------------------------===//

#include "assembler/Serializer.hpp"

#include "assembler/OpcodeInfo.hpp"

#include <iomanip>
#include <sstream>

namespace regvm::assembler
{

std::string formatOperand(const Operand &operand)
{
    switch (operand.kind)
    {
        case OperandKind::Reg:
            return "r" + std::to_string(operand.value);
        case OperandKind::Imm8:
        case OperandKind::Imm12:
            return std::to_string(operand.value);
        case OperandKind::Label:
            return operand.label;
    }
    return {};
}

std::string formatInstr(const Instr &in)
{
    if (in.op == Opcode::Label)
        return in.label + ":";

    std::string text = getOpcodeInfo(in.op).name;
    for (size_t i = 0; i < in.operands.size(); ++i)
    {
        text += i == 0 ? " " : ", ";
        text += formatOperand(in.operands[i]);
    }
    return text;
}

void Serializer::write(const Program &program, std::ostream &os, Mode mode)
{
    constexpr int kCommentColumn = 24;
    unsigned address = 0;
    for (const Instr &in : program)
    {
        if (in.op == Opcode::Label)
        {
            os << formatInstr(in) << '\n';
            continue;
        }

        const std::string text = "  " + formatInstr(in);
        if (mode == Mode::WithAddresses)
        {
            os << std::left << std::setw(kCommentColumn) << text << "; " << std::right
               << std::setw(4) << std::setfill('0') << address << std::setfill(' ') << '\n';
        }
        else
        {
            os << text << '\n';
        }
        ++address;
    }
}

std::string Serializer::toString(const Program &program, Mode mode)
{
    std::ostringstream oss;
    write(program, oss, mode);
    return oss.str();
}

std::ostream &operator<<(std::ostream &os, const Operand &operand)
{
    return os << formatOperand(operand);
}

std::ostream &operator<<(std::ostream &os, const Instr &in)
{
    return os << formatInstr(in);
}

} // namespace regvm::assembler
