//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/State.hpp
// Purpose: Architectural state of the register machine: program counter,
//          register file and ALU flags.
// Key invariants: r0 always reads as zero and discards writes.
//                 Register indices above 15 are rejected, never clamped.
// Ownership/Lifetime: Plain value types; copied freely.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <ostream>

namespace regvm::vm
{

/// @brief Register file r0-r15; only r1-r15 have storage.
class Registers
{
  public:
    /// @brief Check whether @p reg names an architectural register.
    static constexpr bool isValid(uint8_t reg)
    {
        return reg < 16;
    }

    /// @brief Read register @p reg.
    /// @return Register value, or std::nullopt when @p reg is invalid.
    std::optional<uint8_t> read(uint8_t reg) const;

    /// @brief Write @p value to register @p reg; writes to r0 are ignored.
    /// @return False when @p reg is invalid.
    bool write(uint8_t reg, uint8_t value);

    bool operator==(const Registers &other) const = default;

  private:
    std::array<uint8_t, 15> regs_{};
};

/// @brief ALU flags produced by arithmetic and logical instructions.
struct Flags
{
    bool zero = true;
    bool overflow = false;

    bool operator==(const Flags &other) const = default;
};

/// @brief Complete machine state.
struct State
{
    uint16_t pc = 0;
    Registers regs;
    Flags flags;

    bool operator==(const State &other) const = default;
};

/// @brief Print @p state as "name = value" lines (pc, flags, r0-r15).
void printState(const State &state, std::ostream &os);

} // namespace regvm::vm
