//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bytecode/Decoder.cpp
// Purpose: Implements the instruction decoder.
// Key invariants: Reserved bits must be zero; ADDI with a zero immediate is
//                 reported as mv (or nop when every field is zero) because the
//                 encodings are shared and the behaviour is identical.
//
//===----------------------------------------------------------------------===//

#include "bytecode/Decoder.hpp"

#include "bytecode/Bytecode.hpp"

#include <iomanip>
#include <sstream>
#include <string>

namespace regvm::bytecode
{
namespace
{
using assembler::Instr;
using assembler::Opcode;
using assembler::Operand;
using support::Expected;
using support::makeError;

std::string describe(uint32_t word, uint16_t address, const std::string &problem)
{
    std::ostringstream oss;
    oss << "word " << address << " (0x" << std::hex << std::setw(6) << std::setfill('0') << word
        << "): " << problem;
    return oss.str();
}

Instr make(Opcode op, std::vector<Operand> operands)
{
    Instr in;
    in.op = op;
    in.operands = std::move(operands);
    return in;
}

Instr decodeRRR(Opcode op, uint32_t word)
{
    return make(op,
                {Operand::reg(decodeRd(word)),
                 Operand::reg(decodeRs1(word)),
                 Operand::reg(decodeRs2(word))});
}

Instr decodeRRI(Opcode op, uint32_t word)
{
    return make(op,
                {Operand::reg(decodeRd(word)),
                 Operand::reg(decodeRs1(word)),
                 Operand::imm8(decodeImm8(word))});
}
} // namespace

Expected<Instr> decode(uint32_t word, uint16_t address)
{
    if ((word & ~kWordMask) != 0)
        return Expected<Instr>{makeError({}, describe(word, address, "word exceeds 24 bits"))};

    const uint8_t raw = decodeOpcodeBits(word);
    if (raw >= static_cast<uint8_t>(BCOpcode::OPCODE_COUNT))
    {
        return Expected<Instr>{
            makeError({}, describe(word, address, "unknown opcode " + std::to_string(raw)))};
    }

    const auto op = static_cast<BCOpcode>(raw);
    if (op != BCOpcode::BRANCH && decodeFun2(word) != 0)
    {
        return Expected<Instr>{makeError(
            {}, describe(word, address, std::string("reserved bits set for ") + opcodeName(op)))};
    }

    switch (op)
    {
        case BCOpcode::HALT:
            if (word != 0)
            {
                return Expected<Instr>{
                    makeError({}, describe(word, address, "reserved bits set for HALT"))};
            }
            return make(Opcode::Halt, {});

        case BCOpcode::ADDI:
            if (decodeImm8(word) == 0)
            {
                if (decodeRd(word) == 0 && decodeRs1(word) == 0)
                    return make(Opcode::Nop, {});
                return make(Opcode::Mv,
                            {Operand::reg(decodeRd(word)), Operand::reg(decodeRs1(word))});
            }
            return decodeRRI(Opcode::Addi, word);
        case BCOpcode::ANDI:
            return decodeRRI(Opcode::Andi, word);
        case BCOpcode::ORI:
            return decodeRRI(Opcode::Ori, word);
        case BCOpcode::XORI:
            return decodeRRI(Opcode::Xori, word);

        case BCOpcode::ADD:
        case BCOpcode::SUB:
        case BCOpcode::AND:
        case BCOpcode::OR:
        case BCOpcode::XOR:
        {
            if (decodeHighNibble(word) != 0)
            {
                return Expected<Instr>{makeError(
                    {}, describe(word, address, std::string("reserved bits set for ") + opcodeName(op)))};
            }
            const Opcode asmOp = op == BCOpcode::ADD   ? Opcode::Add
                                 : op == BCOpcode::SUB ? Opcode::Sub
                                 : op == BCOpcode::AND ? Opcode::And
                                 : op == BCOpcode::OR  ? Opcode::Or
                                                       : Opcode::Xor;
            return decodeRRR(asmOp, word);
        }

        case BCOpcode::NOT:
            if (decodeImm8(word) != 0)
            {
                return Expected<Instr>{
                    makeError({}, describe(word, address, "reserved bits set for NOT"))};
            }
            return make(Opcode::Not, {Operand::reg(decodeRd(word)), Operand::reg(decodeRs1(word))});

        case BCOpcode::BRANCH:
        {
            if (decodeRd(word) != 0)
            {
                return Expected<Instr>{
                    makeError({}, describe(word, address, "reserved bits set for BRANCH"))};
            }
            const auto target = Operand::imm12(decodeImm12(word));
            switch (static_cast<BranchCond>(decodeFun2(word)))
            {
                case BranchCond::Always:
                    return make(Opcode::Jmp, {target});
                case BranchCond::Zero:
                    return make(Opcode::Bz, {target});
                case BranchCond::NotZero:
                    return make(Opcode::Bnz, {target});
            }
            return Expected<Instr>{makeError(
                {}, describe(word, address, "invalid branch condition " + std::to_string(decodeFun2(word))))};
        }

        case BCOpcode::OPCODE_COUNT:
            break;
    }
    return Expected<Instr>{
        makeError({}, describe(word, address, "unknown opcode " + std::to_string(raw)))};
}

Expected<assembler::Program> decodeProgram(const std::vector<uint32_t> &words)
{
    assembler::Program program;
    program.reserve(words.size());
    for (size_t i = 0; i < words.size(); ++i)
    {
        auto in = decode(words[i], static_cast<uint16_t>(i));
        if (!in)
            return Expected<assembler::Program>{in.error()};
        program.push_back(std::move(in.value()));
    }
    return program;
}

} // namespace regvm::bytecode
