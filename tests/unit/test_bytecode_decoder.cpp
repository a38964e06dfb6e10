// File: tests/unit/test_bytecode_decoder.cpp
// Purpose: Verify instruction word decoding, including the mv/nop aliases of
//          ADDI and rejection of malformed words.
// Key invariants: decode(encode(x)) executes identically to x.
// Ownership/Lifetime: N/A (test).
// Links: src/bytecode/Decoder.hpp

#include <gtest/gtest.h>

#include "assembler/Compiler.hpp"
#include "assembler/Serializer.hpp"
#include "bytecode/Decoder.hpp"
#include "bytecode/Encoder.hpp"

using namespace regvm;
using namespace regvm::bytecode;
using assembler::Opcode;
using assembler::Operand;

TEST(BytecodeDecoder, DecodesEachFormat)
{
    auto halt = decode(0);
    ASSERT_TRUE(halt);
    EXPECT_EQ(halt.value().op, Opcode::Halt);

    auto nop = decode(1);
    ASSERT_TRUE(nop);
    EXPECT_EQ(nop.value().op, Opcode::Nop);

    auto add = decode(0x021302);
    ASSERT_TRUE(add);
    EXPECT_EQ(assembler::formatInstr(add.value()), "add r3, r1, r2");

    auto addi = decode(0xFF4401);
    ASSERT_TRUE(addi);
    EXPECT_EQ(assembler::formatInstr(addi.value()), "addi r4, r4, 255");

    auto mv = decode(0x002101);
    ASSERT_TRUE(mv);
    EXPECT_EQ(assembler::formatInstr(mv.value()), "mv r1, r2");

    auto bnz = decode(0x00308B);
    ASSERT_TRUE(bnz);
    EXPECT_EQ(bnz.value().op, Opcode::Bnz);
    EXPECT_EQ(bnz.value().operands[0], Operand::imm12(3));

    auto notInstr = decode(0x006507);
    ASSERT_TRUE(notInstr);
    EXPECT_EQ(assembler::formatInstr(notInstr.value()), "not r5, r6");
}

TEST(BytecodeDecoder, RejectsMalformedWords)
{
    EXPECT_FALSE(decode(0x1000000));  // beyond 24 bits
    EXPECT_FALSE(decode(0x00000C));   // first unassigned opcode
    EXPECT_FALSE(decode(0x0000CB));   // branch condition 3
    EXPECT_FALSE(decode(0x000041));   // fun2 on ADDI
    EXPECT_FALSE(decode(0x000100));   // HALT with rd set
    EXPECT_FALSE(decode(0x100002));   // ADD with bits 20-23 set
    EXPECT_FALSE(decode(0x010007));   // NOT with imm8 bits set
    EXPECT_FALSE(decode(0x00010B));   // BRANCH with rd set

    auto bad = decode(0x00000C, 7);
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().message, "word 7 (0x00000c): unknown opcode 12");
}

TEST(BytecodeDecoder, EncodedProgramDecodesToSameText)
{
    auto compiled = assembler::compileProgram("  addi r1, r0, 1\n"
                                              "loop: sub r2, r1, r3\n"
                                              "  xori r2, r2, 0x0f\n"
                                              "  or r4, r2, r1\n"
                                              "  bz loop\n"
                                              "  jmp 0\n"
                                              "  halt\n");
    ASSERT_TRUE(compiled);
    auto words = encodeProgram(compiled.value());
    ASSERT_TRUE(words);
    auto decoded = decodeProgram(words.value());
    ASSERT_TRUE(decoded);
    EXPECT_EQ(assembler::Serializer::toString(decoded.value()),
              assembler::Serializer::toString(compiled.value()));
}

TEST(BytecodeDecoder, ProgramReportsFailingAddress)
{
    auto decoded = decodeProgram({0x000001, 0x000000, 0x00003F});
    ASSERT_FALSE(decoded);
    EXPECT_EQ(decoded.error().message, "word 2 (0x00003f): unknown opcode 63");
}
