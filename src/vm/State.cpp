//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/State.cpp
// Purpose: Register file access and state printing.
//
//===----------------------------------------------------------------------===//

#include "vm/State.hpp"

namespace regvm::vm
{

std::optional<uint8_t> Registers::read(uint8_t reg) const
{
    if (!isValid(reg))
        return std::nullopt;
    if (reg == 0)
        return uint8_t{0};
    return regs_[reg - 1];
}

bool Registers::write(uint8_t reg, uint8_t value)
{
    if (!isValid(reg))
        return false;
    if (reg != 0)
        regs_[reg - 1] = value;
    return true;
}

void printState(const State &state, std::ostream &os)
{
    os << "pc = " << state.pc << '\n';
    os << "zero = " << (state.flags.zero ? 1 : 0) << '\n';
    os << "overflow = " << (state.flags.overflow ? 1 : 0) << '\n';
    for (uint8_t r = 0; r < 16; ++r)
        os << 'r' << static_cast<unsigned>(r) << " = " << static_cast<unsigned>(*state.regs.read(r))
           << '\n';
}

} // namespace regvm::vm
