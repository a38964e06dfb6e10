// File: tests/unit/test_vm_fib.cpp
// Purpose: End-to-end check of examples/fib.asm through both execution paths:
//          assembled source and encoded bytecode.
// Key invariants: Both paths reach the same final state and step count.
// Ownership/Lifetime: Reads the example from REGVM_EXAMPLES_DIR.
// Links: examples/fib.asm

#include <gtest/gtest.h>

#include "assembler/Compiler.hpp"
#include "bytecode/BytecodeModule.hpp"
#include "bytecode/Decoder.hpp"
#include "bytecode/Encoder.hpp"
#include "vm/VM.hpp"

#include <fstream>
#include <sstream>
#include <string>

using namespace regvm;

namespace
{
std::string readExample(const std::string &name)
{
    std::ifstream in(std::string(REGVM_EXAMPLES_DIR) + "/" + name, std::ios::binary);
    EXPECT_TRUE(in) << "missing example " << name;
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void expectFibResult(const vm::RunResult &r)
{
    EXPECT_FALSE(r.error);
    EXPECT_EQ(r.state.regs.read(1), 8);
    EXPECT_EQ(r.state.regs.read(2), 13);
    EXPECT_EQ(r.state.regs.read(3), 13);
    EXPECT_EQ(r.state.regs.read(4), 0);
    EXPECT_EQ(r.state.pc, 8);
    EXPECT_EQ(r.state.flags, vm::Flags{});
    EXPECT_EQ(r.steps, 29u);
}
} // namespace

TEST(VmFib, RunsFromSource)
{
    auto program = assembler::compileProgram(readExample("fib.asm"));
    ASSERT_TRUE(program);
    EXPECT_EQ(program.value().size(), 9u);
    expectFibResult(vm::interpretProgram(program.value()));
}

TEST(VmFib, RunsFromBytecode)
{
    auto program = assembler::compileProgram(readExample("fib.asm"));
    ASSERT_TRUE(program);
    auto words = bytecode::encodeProgram(program.value());
    ASSERT_TRUE(words);

    bytecode::BytecodeModule module;
    module.code = words.value();
    std::ostringstream os;
    ASSERT_TRUE(bytecode::writeModule(module, os));

    auto read = bytecode::readModule(os.str());
    ASSERT_TRUE(read);
    auto decoded = bytecode::decodeProgram(read.value().code);
    ASSERT_TRUE(decoded);
    expectFibResult(vm::interpretProgram(decoded.value()));
}
