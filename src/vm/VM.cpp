//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/VM.cpp
// Purpose: Instruction semantics and the fetch/execute loop.
// Key invariants: A trap leaves registers and flags as they were before the
//                 failing instruction; pc points at the failing instruction.
//
//===----------------------------------------------------------------------===//

#include "vm/VM.hpp"

#include "assembler/OpcodeInfo.hpp"
#include "assembler/Serializer.hpp"

#include <utility>

namespace regvm::vm
{
namespace
{
using assembler::Instr;
using assembler::Opcode;
using assembler::OperandKind;

StepResult trapResult(TrapKind kind, std::string message)
{
    StepResult r;
    r.kind = StepResult::Kind::Trap;
    r.trap = kind;
    r.message = std::move(message);
    return r;
}

StepResult next(uint16_t pc)
{
    StepResult r;
    r.nextPc = pc;
    return r;
}

/// @brief Check operand count and kinds against the opcode table.
std::optional<StepResult> checkOperands(const Instr &in)
{
    const auto &info = assembler::getOpcodeInfo(in.op);
    if (in.operands.size() != info.numOperands)
    {
        return trapResult(TrapKind::InvalidOperand,
                          "'" + assembler::formatInstr(in) + "' has " +
                              std::to_string(in.operands.size()) + " operands, expected " +
                              std::to_string(info.numOperands));
    }
    for (size_t i = 0; i < in.operands.size(); ++i)
    {
        const auto &operand = in.operands[i];
        if (operand.kind == OperandKind::Label)
        {
            return trapResult(TrapKind::InvalidOperand,
                              "unresolved label '" + operand.label + "' in '" +
                                  assembler::formatInstr(in) + "'");
        }
        if (!assembler::operandMatches(info.operands[i], operand))
        {
            return trapResult(TrapKind::InvalidOperand,
                              "invalid operands in '" + assembler::formatInstr(in) + "'");
        }
        if (operand.kind == OperandKind::Reg && operand.value >= assembler::kNumRegisters)
        {
            return trapResult(TrapKind::InvalidRegister,
                              "invalid register r" + std::to_string(operand.value));
        }
    }
    return std::nullopt;
}

uint8_t regOf(const Instr &in, size_t i)
{
    return static_cast<uint8_t>(in.operands[i].value);
}

/// @brief Write an ALU result to rd and set both flags.
StepResult commit(const Instr &in, State &state, uint8_t value, bool overflow)
{
    if (!state.regs.write(regOf(in, 0), value))
        return trapResult(TrapKind::InvalidRegister,
                          "invalid register r" + std::to_string(regOf(in, 0)));
    state.flags.zero = value == 0;
    state.flags.overflow = overflow;
    return next(static_cast<uint16_t>(state.pc + 1));
}
} // namespace

StepResult executeInstr(const Instr &in, State &state)
{
    if (in.op == Opcode::Label)
        return trapResult(TrapKind::InvalidInstruction, "cannot execute label '" + in.label + "'");
    if (auto bad = checkOperands(in))
        return std::move(*bad);

    // Register operands were validated above, so reads cannot fail.
    const auto r = [&](size_t i) { return *state.regs.read(regOf(in, i)); };
    const auto imm = [&](size_t i) { return static_cast<uint8_t>(in.operands[i].value); };
    const uint16_t fallthrough = static_cast<uint16_t>(state.pc + 1);

    switch (in.op)
    {
        case Opcode::Halt:
        {
            state.flags = Flags{};
            StepResult res;
            res.kind = StepResult::Kind::Halt;
            res.nextPc = state.pc;
            return res;
        }
        case Opcode::Nop:
            state.flags = Flags{};
            return next(fallthrough);
        case Opcode::Mv:
            return commit(in, state, r(1), false);
        case Opcode::Not:
            return commit(in, state, static_cast<uint8_t>(~r(1)), false);
        case Opcode::Add:
        {
            const unsigned sum = unsigned{r(1)} + unsigned{r(2)};
            return commit(in, state, static_cast<uint8_t>(sum), sum > 0xFF);
        }
        case Opcode::Addi:
        {
            const unsigned sum = unsigned{r(1)} + unsigned{imm(2)};
            return commit(in, state, static_cast<uint8_t>(sum), sum > 0xFF);
        }
        case Opcode::Sub:
        {
            const uint8_t a = r(1);
            const uint8_t b = r(2);
            return commit(in, state, static_cast<uint8_t>(a - b), a < b);
        }
        case Opcode::And:
            return commit(in, state, static_cast<uint8_t>(r(1) & r(2)), false);
        case Opcode::Or:
            return commit(in, state, static_cast<uint8_t>(r(1) | r(2)), false);
        case Opcode::Xor:
            return commit(in, state, static_cast<uint8_t>(r(1) ^ r(2)), false);
        case Opcode::Andi:
            return commit(in, state, static_cast<uint8_t>(r(1) & imm(2)), false);
        case Opcode::Ori:
            return commit(in, state, static_cast<uint8_t>(r(1) | imm(2)), false);
        case Opcode::Xori:
            return commit(in, state, static_cast<uint8_t>(r(1) ^ imm(2)), false);
        case Opcode::Jmp:
            state.flags = Flags{};
            return next(in.operands[0].value);
        case Opcode::Bz:
            return next(state.flags.zero ? in.operands[0].value : fallthrough);
        case Opcode::Bnz:
            return next(!state.flags.zero ? in.operands[0].value : fallthrough);
        case Opcode::Label:
            break;
    }
    return trapResult(TrapKind::InvalidInstruction,
                      "cannot execute '" + assembler::formatInstr(in) + "'");
}

VM::VM(RunConfig config) : config_(config), tracer_(config.trace) {}

void VM::load(const assembler::Program *program, State initial)
{
    program_ = program;
    machine_ = initial;
    state_ = VMState::Ready;
    trapKind_ = TrapKind::None;
    trapMessage_.clear();
    instrCount_ = 0;
}

void VM::trap(TrapKind kind, std::string message)
{
    state_ = VMState::Trapped;
    trapKind_ = kind;
    trapMessage_ = std::move(message);
}

VMState VM::step()
{
    if (state_ == VMState::Halted || state_ == VMState::Trapped)
        return state_;
    state_ = VMState::Running;

    if (!program_ || machine_.pc >= program_->size())
    {
        trap(TrapKind::PcOutOfBounds,
             "attempt to execute out-of-bounds address " + std::to_string(machine_.pc));
        return state_;
    }
    if (config_.maxSteps != 0 && instrCount_ >= config_.maxSteps)
    {
        trap(TrapKind::StepLimitExceeded,
             "step limit of " + std::to_string(config_.maxSteps) + " reached");
        return state_;
    }

    const Instr &in = (*program_)[machine_.pc];
    tracer_.onStep(in, machine_);

    State scratch = machine_;
    StepResult result = executeInstr(in, scratch);
    switch (result.kind)
    {
        case StepResult::Kind::Trap:
            trap(result.trap, std::move(result.message));
            return state_;
        case StepResult::Kind::Halt:
            machine_ = scratch;
            ++instrCount_;
            state_ = VMState::Halted;
            return state_;
        case StepResult::Kind::Next:
            machine_ = scratch;
            machine_.pc = result.nextPc;
            ++instrCount_;
            return state_;
    }
    return state_;
}

VMState VM::run()
{
    while (step() == VMState::Running)
    {
    }
    return state_;
}

std::optional<VmError> VM::error() const
{
    if (state_ != VMState::Trapped)
        return std::nullopt;
    return VmError{trapKind_, machine_.pc, trapMessage_};
}

RunResult interpretProgram(const assembler::Program &program,
                           std::optional<State> initial,
                           RunConfig config)
{
    VM vm(config);
    vm.load(&program, initial.value_or(State{}));
    vm.run();

    RunResult result;
    result.error = vm.error();
    result.state = vm.machineState();
    result.steps = vm.instrCount();
    return result;
}

} // namespace regvm::vm
