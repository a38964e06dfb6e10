//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/VM.hpp
// Purpose: Register-machine interpreter executing resolved programs.
// Key invariants: executeInstr() never writes the program counter; the run
//                 loop commits the next pc after each successful step.
//                 On halt the pc stays at the halt instruction.
// Ownership: VM borrows the Program (non-owning pointer) and owns its State.
// Lifetime: The program must outlive the VM. A VM can be reloaded with
//           load() and run again.
// Links: State.hpp, Trap.hpp, Trace.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "assembler/Ast.hpp"
#include "vm/State.hpp"
#include "vm/Trace.hpp"
#include "vm/Trap.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace regvm::vm
{

/// @brief Outcome of executing a single instruction.
struct StepResult
{
    /// @brief What the run loop should do next.
    enum class Kind
    {
        Next, ///< Continue at nextPc.
        Halt, ///< Stop normally.
        Trap  ///< Stop with trap and message.
    };

    Kind kind = Kind::Next;
    uint16_t nextPc = 0;
    TrapKind trap = TrapKind::None;
    std::string message;
};

/// @brief Execute @p in against @p state.
/// @details Updates registers and flags, but not state.pc. Arithmetic wraps
///          at 8 bits; the zero flag reflects the result and the overflow
///          flag records unsigned carry (add, addi) or borrow (sub).
/// @return Next pc, a halt, or a trap describing why @p in cannot execute.
StepResult executeInstr(const assembler::Instr &in, State &state);

/// @brief VM execution state.
enum class VMState
{
    Ready,   ///< Program loaded, ready to execute.
    Running, ///< Currently executing.
    Halted,  ///< Execution completed normally.
    Trapped  ///< Execution stopped due to a trap.
};

/// @brief Execution limits and tracing for a run.
struct RunConfig
{
    uint64_t maxSteps = 0; ///< Step budget; 0 means unlimited.
    TraceConfig trace;     ///< Trace settings.
};

/// @brief Interpreter over a resolved assembler::Program.
class VM
{
  public:
    /// @brief Construct a VM with configuration @p config.
    explicit VM(RunConfig config = {});

    /// @brief Load @p program and reset to @p initial.
    void load(const assembler::Program *program, State initial = {});

    /// @brief Run until halt or trap.
    /// @return Final VM state (Halted or Trapped).
    VMState run();

    /// @brief Execute one instruction.
    /// @return VM state after the step.
    VMState step();

    /// @brief Current VM execution state.
    VMState state() const
    {
        return state_;
    }

    /// @brief Architectural machine state.
    const State &machineState() const
    {
        return machine_;
    }

    /// @brief Get the last trap kind.
    TrapKind trapKind() const
    {
        return trapKind_;
    }

    /// @brief Get the last trap message.
    const std::string &trapMessage() const
    {
        return trapMessage_;
    }

    /// @brief Number of instructions executed since load().
    uint64_t instrCount() const
    {
        return instrCount_;
    }

    /// @brief Trap record, when the VM is Trapped.
    std::optional<VmError> error() const;

  private:
    void trap(TrapKind kind, std::string message);

    const assembler::Program *program_ = nullptr;
    RunConfig config_;
    TraceSink tracer_;
    State machine_;
    VMState state_ = VMState::Ready;
    TrapKind trapKind_ = TrapKind::None;
    std::string trapMessage_;
    uint64_t instrCount_ = 0;
};

/// @brief Result of interpretProgram().
struct RunResult
{
    std::optional<VmError> error; ///< Trap, when execution did not halt.
    State state;                  ///< Final machine state.
    uint64_t steps = 0;           ///< Instructions executed.
};

/// @brief Run @p program to completion.
/// @param program Resolved program.
/// @param initial Starting state; a reset state when empty.
/// @param config Step limit and tracing.
RunResult interpretProgram(const assembler::Program &program,
                           std::optional<State> initial = std::nullopt,
                           RunConfig config = {});

} // namespace regvm::vm
