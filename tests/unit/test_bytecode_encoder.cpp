// File: tests/unit/test_bytecode_encoder.cpp
// Purpose: Verify the 24-bit instruction layout produced by the encoder and
//          the instruction builder.
// Key invariants: HALT is the all-zero word; mv and nop share ADDI with a zero
//                 immediate; unresolved or malformed instructions are rejected.
// Ownership/Lifetime: N/A (test).
// Links: src/bytecode/Bytecode.hpp, src/bytecode/Encoder.hpp

#include <gtest/gtest.h>

#include "assembler/Parser.hpp"
#include "bytecode/Bytecode.hpp"
#include "bytecode/Encoder.hpp"

using namespace regvm;
using namespace regvm::bytecode;
using assembler::Instr;
using assembler::Opcode;
using assembler::Operand;

namespace
{
uint32_t encodeLine(const char *line)
{
    auto parsed = assembler::Parser::parseLine(line);
    EXPECT_TRUE(parsed) << line;
    if (!parsed || parsed.value().size() != 1)
        return 0xFFFFFFFF;
    auto word = encode(parsed.value().front());
    EXPECT_TRUE(word) << line;
    return word ? word.value() : 0xFFFFFFFF;
}
} // namespace

TEST(BytecodeEncoder, BuilderFieldsAndMask)
{
    static_assert(InstrBuilder().finalize() == 0);
    static_assert(InstrBuilder().opcode(BCOpcode::ADDI).finalize() == 0b000001);
    EXPECT_EQ(InstrBuilder().imm12(0xFFF).finalize(), 0xFFF000u);
    EXPECT_EQ(InstrBuilder().rd(0xF).rd(0x2).finalize(), 0x200u);
    EXPECT_EQ(InstrBuilder().rs2(0x3).imm8(0xA5).finalize(), 0xA50000u);
}

TEST(BytecodeEncoder, KnownEncodings)
{
    EXPECT_EQ(encodeLine("halt"), 0u);
    EXPECT_EQ(encodeLine("addi r0, r0, 0"), 1u);
    EXPECT_EQ(encodeLine("nop"), encodeLine("addi r0, r0, 0"));
    EXPECT_EQ(encodeLine("add r3, r1, r2"), 0x021302u);
    EXPECT_EQ(encodeLine("addi r4, r4, 0xff"), 0xFF4401u);
    EXPECT_EQ(encodeLine("mv r1, r2"), 0x002101u);
    EXPECT_EQ(encodeLine("not r5, r6"), 0x006507u);
    EXPECT_EQ(encodeLine("jmp 0"), 0x00000Bu);
    EXPECT_EQ(encodeLine("bz 5"), 0x00504Bu);
    EXPECT_EQ(encodeLine("bnz 3"), 0x00308Bu);
}

TEST(BytecodeEncoder, RejectsUnencodableInstructions)
{
    auto label = encode(Instr::makeLabel("loop"));
    ASSERT_FALSE(label);
    EXPECT_EQ(label.error().message, "cannot encode label 'loop'");

    Instr unresolved;
    unresolved.op = Opcode::Bnz;
    unresolved.operands = {Operand::labelRef("loop")};
    auto target = encode(unresolved);
    ASSERT_FALSE(target);
    EXPECT_EQ(target.error().message, "cannot encode unresolved label 'loop'");

    Instr badReg;
    badReg.op = Opcode::Mv;
    badReg.operands = {Operand::reg(16), Operand::reg(1)};
    auto reg = encode(badReg);
    ASSERT_FALSE(reg);
    EXPECT_EQ(reg.error().message, "invalid register r16");

    Instr mvImm;
    mvImm.op = Opcode::Mv;
    mvImm.operands = {Operand::reg(0), Operand::imm8(0)};
    EXPECT_FALSE(encode(mvImm));

    Instr arity;
    arity.op = Opcode::Add;
    arity.operands = {Operand::reg(1)};
    auto count = encode(arity);
    ASSERT_FALSE(count);
    EXPECT_EQ(count.error().message, "'add' expects 3 operands, got 1");
}

TEST(BytecodeEncoder, ProgramStopsAtFirstError)
{
    Instr halt;
    halt.op = Opcode::Halt;
    auto ok = encodeProgram({halt, halt});
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok.value(), (std::vector<MachineCode>{0, 0}));

    EXPECT_FALSE(encodeProgram({halt, Instr::makeLabel("x")}));
}
