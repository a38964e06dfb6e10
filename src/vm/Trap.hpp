//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Trap.hpp
// Purpose: Trap classification and error records for the interpreter.
// Key invariants: Enum values map directly to trap categories used in
//                 diagnostics; toString() names are stable.
// Ownership/Lifetime: Not applicable.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace regvm::vm
{

/// @brief Categorises runtime traps for diagnostic reporting.
enum class TrapKind : uint8_t
{
    None = 0,           ///< No trap (normal execution).
    InvalidInstruction, ///< Instruction cannot be executed (e.g. a label).
    InvalidOperand,     ///< Operand kind does not match the instruction.
    InvalidRegister,    ///< Register index above r15.
    PcOutOfBounds,      ///< Fetch past the end of the program.
    StepLimitExceeded,  ///< Configured step budget exhausted.
};

/// @brief Structured representation of a VM error record.
struct VmError
{
    TrapKind kind = TrapKind::None; ///< Trap classification.
    uint16_t pc = 0;                ///< Program counter of the failing fetch.
    std::string message;            ///< Human-readable detail.
};

/// @brief Convert trap kind to canonical diagnostic string.
constexpr std::string_view toString(TrapKind kind) noexcept
{
    switch (kind)
    {
        case TrapKind::None:
            return "None";
        case TrapKind::InvalidInstruction:
            return "InvalidInstruction";
        case TrapKind::InvalidOperand:
            return "InvalidOperand";
        case TrapKind::InvalidRegister:
            return "InvalidRegister";
        case TrapKind::PcOutOfBounds:
            return "PcOutOfBounds";
        case TrapKind::StepLimitExceeded:
            return "StepLimitExceeded";
    }
    return "Unknown";
}

/// @brief Format @p error as "trap: <Kind> at pc <n>: <message>".
std::string formatTrap(const VmError &error);

} // namespace regvm::vm
