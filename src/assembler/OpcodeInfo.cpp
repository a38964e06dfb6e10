//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Opcode metadata table shared by the parser (operand parsing), the encoder
// (shape validation) and the serializer (mnemonic spelling).
//
//===----------------------------------------------------------------------===//

#include "assembler/OpcodeInfo.hpp"

#include <cctype>
#include <string>

namespace regvm::assembler
{
namespace
{
using S = OperandShape;

constexpr std::array<OpcodeInfo, kNumOpcodes> kOpcodeTable = {{
    {"label", 0, {S::None, S::None, S::None}, false},
    {"halt", 0, {S::None, S::None, S::None}, false},
    {"nop", 0, {S::None, S::None, S::None}, false},
    {"mv", 2, {S::Reg, S::Reg, S::None}, false},
    {"not", 2, {S::Reg, S::Reg, S::None}, false},
    {"add", 3, {S::Reg, S::Reg, S::Reg}, false},
    {"sub", 3, {S::Reg, S::Reg, S::Reg}, false},
    {"and", 3, {S::Reg, S::Reg, S::Reg}, false},
    {"or", 3, {S::Reg, S::Reg, S::Reg}, false},
    {"xor", 3, {S::Reg, S::Reg, S::Reg}, false},
    {"addi", 3, {S::Reg, S::Reg, S::Imm8}, false},
    {"andi", 3, {S::Reg, S::Reg, S::Imm8}, false},
    {"ori", 3, {S::Reg, S::Reg, S::Imm8}, false},
    {"xori", 3, {S::Reg, S::Reg, S::Imm8}, false},
    {"jmp", 1, {S::Target, S::None, S::None}, true},
    {"bz", 1, {S::Target, S::None, S::None}, true},
    {"bnz", 1, {S::Target, S::None, S::None}, true},
}};
} // namespace

const OpcodeInfo &getOpcodeInfo(Opcode op)
{
    return kOpcodeTable[static_cast<size_t>(op)];
}

std::optional<Opcode> lookupMnemonic(std::string_view name)
{
    std::string lowered;
    lowered.reserve(name.size());
    for (char c : name)
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

    // Start after Label: it has no source spelling.
    for (size_t i = static_cast<size_t>(Opcode::Halt); i < kNumOpcodes; ++i)
    {
        if (lowered == kOpcodeTable[i].name)
            return static_cast<Opcode>(i);
    }
    return std::nullopt;
}

bool operandMatches(OperandShape shape, const Operand &operand)
{
    switch (shape)
    {
        case OperandShape::None:
            return false;
        case OperandShape::Reg:
            return operand.kind == OperandKind::Reg;
        case OperandShape::Imm8:
            return operand.kind == OperandKind::Imm8;
        case OperandShape::Target:
            return operand.kind == OperandKind::Imm12 || operand.kind == OperandKind::Label;
    }
    return false;
}

const char *shapeName(OperandShape shape)
{
    switch (shape)
    {
        case OperandShape::None:
            return "nothing";
        case OperandShape::Reg:
            return "register";
        case OperandShape::Imm8:
            return "8-bit immediate";
        case OperandShape::Target:
            return "branch target";
    }
    return "operand";
}

} // namespace regvm::assembler
