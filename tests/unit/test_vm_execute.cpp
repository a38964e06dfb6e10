// File: tests/unit/test_vm_execute.cpp
// Purpose: Verify single-instruction semantics, flag updates and traps of the
//          register-machine interpreter.
// Key invariants: Arithmetic wraps at 8 bits; r0 reads zero; executeInstr
//                 never writes pc; traps leave the machine state untouched.
// Ownership/Lifetime: N/A (test).
// Links: src/vm/VM.hpp, src/vm/State.hpp

#include <gtest/gtest.h>

#include "assembler/Compiler.hpp"
#include "vm/VM.hpp"

#include <initializer_list>
#include <sstream>
#include <utility>

using namespace regvm;
using namespace regvm::vm;
using assembler::Instr;
using assembler::Opcode;
using assembler::Operand;

namespace
{
Instr make(Opcode op, std::vector<Operand> operands = {})
{
    Instr in;
    in.op = op;
    in.operands = std::move(operands);
    return in;
}

Instr rrr(Opcode op, uint8_t rd, uint8_t rs1, uint8_t rs2)
{
    return make(op, {Operand::reg(rd), Operand::reg(rs1), Operand::reg(rs2)});
}

Instr rri(Opcode op, uint8_t rd, uint8_t rs1, uint8_t imm)
{
    return make(op, {Operand::reg(rd), Operand::reg(rs1), Operand::imm8(imm)});
}

State withRegs(std::initializer_list<std::pair<uint8_t, uint8_t>> values)
{
    State s;
    for (const auto &[reg, value] : values)
        EXPECT_TRUE(s.regs.write(reg, value));
    return s;
}

RunResult runSource(const char *source, RunConfig config = {})
{
    auto compiled = assembler::compileProgram(source);
    EXPECT_TRUE(compiled) << source;
    if (!compiled)
        return {};
    return interpretProgram(compiled.value(), std::nullopt, config);
}
} // namespace

TEST(VmState, RegisterFile)
{
    Registers regs;
    EXPECT_EQ(regs.read(0), 0);
    EXPECT_TRUE(regs.write(0, 42));
    EXPECT_EQ(regs.read(0), 0);
    EXPECT_TRUE(regs.write(15, 7));
    EXPECT_EQ(regs.read(15), 7);
    EXPECT_FALSE(regs.read(16));
    EXPECT_FALSE(regs.write(16, 1));

    State s;
    EXPECT_EQ(s.pc, 0);
    EXPECT_TRUE(s.flags.zero);
    EXPECT_FALSE(s.flags.overflow);
}

TEST(VmExecute, AddiThenHalt)
{
    State s;
    StepResult r = executeInstr(rri(Opcode::Addi, 1, 0, 2), s);
    EXPECT_EQ(r.kind, StepResult::Kind::Next);
    EXPECT_EQ(r.nextPc, 1);
    EXPECT_EQ(s.pc, 0) << "executeInstr must not write pc";
    EXPECT_EQ(s.regs.read(1), 2);

    State fresh;
    EXPECT_EQ(executeInstr(make(Opcode::Halt), fresh).kind, StepResult::Kind::Halt);
}

TEST(VmExecute, AddWrapsAndSetsFlags)
{
    State s = withRegs({{1, 200}, {2, 56}});
    executeInstr(rrr(Opcode::Add, 3, 1, 2), s);
    EXPECT_EQ(s.regs.read(3), 0);
    EXPECT_TRUE(s.flags.zero);
    EXPECT_TRUE(s.flags.overflow);

    s = withRegs({{1, 2}, {2, 2}});
    executeInstr(rrr(Opcode::Add, 3, 1, 2), s);
    EXPECT_EQ(s.regs.read(3), 4);
    EXPECT_FALSE(s.flags.zero);
    EXPECT_FALSE(s.flags.overflow);
}

TEST(VmExecute, AddiByAllOnesDecrements)
{
    State s = withRegs({{4, 1}});
    executeInstr(rri(Opcode::Addi, 4, 4, 0xFF), s);
    EXPECT_EQ(s.regs.read(4), 0);
    EXPECT_TRUE(s.flags.zero);
    EXPECT_TRUE(s.flags.overflow);

    s = withRegs({{4, 0}});
    executeInstr(rri(Opcode::Addi, 4, 4, 0xFF), s);
    EXPECT_EQ(s.regs.read(4), 255);
    EXPECT_FALSE(s.flags.zero);
    EXPECT_FALSE(s.flags.overflow);
}

TEST(VmExecute, SubBorrows)
{
    State s = withRegs({{1, 3}, {2, 5}});
    executeInstr(rrr(Opcode::Sub, 3, 1, 2), s);
    EXPECT_EQ(s.regs.read(3), 254);
    EXPECT_TRUE(s.flags.overflow);
    EXPECT_FALSE(s.flags.zero);

    executeInstr(rrr(Opcode::Sub, 3, 2, 2), s);
    EXPECT_EQ(s.regs.read(3), 0);
    EXPECT_TRUE(s.flags.zero);
    EXPECT_FALSE(s.flags.overflow);
}

TEST(VmExecute, LogicalOps)
{
    State s = withRegs({{1, 0xF0}, {2, 0x3C}});
    s.flags.overflow = true;
    executeInstr(rrr(Opcode::And, 3, 1, 2), s);
    EXPECT_EQ(s.regs.read(3), 0x30);
    EXPECT_FALSE(s.flags.overflow);
    executeInstr(rrr(Opcode::Or, 3, 1, 2), s);
    EXPECT_EQ(s.regs.read(3), 0xFC);
    executeInstr(rrr(Opcode::Xor, 3, 1, 1), s);
    EXPECT_EQ(s.regs.read(3), 0);
    EXPECT_TRUE(s.flags.zero);
    executeInstr(rri(Opcode::Andi, 3, 1, 0x0F), s);
    EXPECT_EQ(s.regs.read(3), 0);
    executeInstr(rri(Opcode::Ori, 3, 1, 0x0F), s);
    EXPECT_EQ(s.regs.read(3), 0xFF);
    executeInstr(rri(Opcode::Xori, 3, 1, 0xFF), s);
    EXPECT_EQ(s.regs.read(3), 0x0F);
    executeInstr(make(Opcode::Not, {Operand::reg(4), Operand::reg(1)}), s);
    EXPECT_EQ(s.regs.read(4), 0x0F);
    EXPECT_FALSE(s.flags.zero);
}

TEST(VmExecute, MvAndNopFlags)
{
    State s = withRegs({{2, 9}});
    s.flags.overflow = true;
    executeInstr(make(Opcode::Mv, {Operand::reg(1), Operand::reg(2)}), s);
    EXPECT_EQ(s.regs.read(1), 9);
    EXPECT_FALSE(s.flags.zero);
    EXPECT_FALSE(s.flags.overflow);

    s.flags = Flags{false, true};
    executeInstr(make(Opcode::Nop), s);
    EXPECT_EQ(s.flags, Flags{});
}

TEST(VmExecute, BranchesUseZeroFlag)
{
    State s;
    s.pc = 5;
    s.flags = Flags{true, true};
    EXPECT_EQ(executeInstr(make(Opcode::Bz, {Operand::imm12(9)}), s).nextPc, 9);
    EXPECT_EQ(executeInstr(make(Opcode::Bnz, {Operand::imm12(9)}), s).nextPc, 6);
    EXPECT_TRUE(s.flags.overflow) << "conditional branches keep flags";

    s.flags.zero = false;
    EXPECT_EQ(executeInstr(make(Opcode::Bz, {Operand::imm12(9)}), s).nextPc, 6);
    EXPECT_EQ(executeInstr(make(Opcode::Bnz, {Operand::imm12(9)}), s).nextPc, 9);

    EXPECT_EQ(executeInstr(make(Opcode::Jmp, {Operand::imm12(2)}), s).nextPc, 2);
    EXPECT_EQ(s.flags, Flags{});
}

TEST(VmExecute, InvalidInstructionsTrap)
{
    State s;
    const State before = s;

    StepResult mvImm = executeInstr(make(Opcode::Mv, {Operand::reg(0), Operand::imm8(3)}), s);
    EXPECT_EQ(mvImm.kind, StepResult::Kind::Trap);
    EXPECT_EQ(mvImm.trap, TrapKind::InvalidOperand);

    StepResult badReg = executeInstr(rri(Opcode::Addi, 16, 0, 1), s);
    EXPECT_EQ(badReg.trap, TrapKind::InvalidRegister);
    EXPECT_EQ(badReg.message, "invalid register r16");

    StepResult label = executeInstr(Instr::makeLabel("loop"), s);
    EXPECT_EQ(label.trap, TrapKind::InvalidInstruction);

    StepResult unresolved = executeInstr(make(Opcode::Jmp, {Operand::labelRef("loop")}), s);
    EXPECT_EQ(unresolved.trap, TrapKind::InvalidOperand);

    EXPECT_EQ(s, before);
}

TEST(VmRun, TwoPlusTwo)
{
    RunResult r = runSource("addi r1, r0, 2\n"
                            "addi r2, r0, 2\n"
                            "add r3, r1, r2\n"
                            "halt\n");
    EXPECT_FALSE(r.error);
    EXPECT_EQ(r.state.regs.read(3), 4);
    EXPECT_EQ(r.state.pc, 3);
    EXPECT_EQ(r.steps, 4u);
}

TEST(VmRun, FallingOffTheEndTraps)
{
    RunResult r = runSource("addi r1, r0, 1\n");
    ASSERT_TRUE(r.error);
    EXPECT_EQ(r.error->kind, TrapKind::PcOutOfBounds);
    EXPECT_EQ(r.error->pc, 1);
    EXPECT_EQ(r.steps, 1u);
    EXPECT_EQ(formatTrap(*r.error),
              "trap: PcOutOfBounds at pc 1: attempt to execute out-of-bounds address 1");
}

TEST(VmRun, StepLimit)
{
    RunConfig config;
    config.maxSteps = 10;
    RunResult r = runSource("loop: jmp loop\n", config);
    ASSERT_TRUE(r.error);
    EXPECT_EQ(r.error->kind, TrapKind::StepLimitExceeded);
    EXPECT_EQ(r.steps, 10u);

    config.maxSteps = 4;
    RunResult exact = runSource("nop\nnop\nnop\nhalt\n", config);
    EXPECT_FALSE(exact.error);
}

TEST(VmRun, StepByStep)
{
    auto compiled = assembler::compileProgram("addi r1, r0, 7\nhalt\n");
    ASSERT_TRUE(compiled);
    VM vm;
    vm.load(&compiled.value());
    EXPECT_EQ(vm.state(), VMState::Ready);
    EXPECT_EQ(vm.step(), VMState::Running);
    EXPECT_EQ(vm.machineState().pc, 1);
    EXPECT_EQ(vm.step(), VMState::Halted);
    EXPECT_EQ(vm.step(), VMState::Halted);
    EXPECT_EQ(vm.instrCount(), 2u);
    EXPECT_EQ(vm.machineState().regs.read(1), 7);
    EXPECT_FALSE(vm.error());
}

TEST(VmRun, InitialStateIsHonoured)
{
    auto compiled = assembler::compileProgram("add r3, r1, r2\nhalt\n");
    ASSERT_TRUE(compiled);
    State init = withRegs({{1, 40}, {2, 2}});
    RunResult r = interpretProgram(compiled.value(), init);
    EXPECT_FALSE(r.error);
    EXPECT_EQ(r.state.regs.read(3), 42);
}

TEST(VmState, PrintState)
{
    State s = withRegs({{3, 13}});
    s.pc = 8;
    std::ostringstream os;
    printState(s, os);
    const std::string text = os.str();
    EXPECT_NE(text.find("pc = 8\n"), std::string::npos);
    EXPECT_NE(text.find("zero = 1\n"), std::string::npos);
    EXPECT_NE(text.find("overflow = 0\n"), std::string::npos);
    EXPECT_NE(text.find("r3 = 13\n"), std::string::npos);
    EXPECT_NE(text.find("r15 = 0\n"), std::string::npos);
}
