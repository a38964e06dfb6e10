//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Trap.cpp
// Purpose: Formatting of trap records for command-line diagnostics.
//
//===----------------------------------------------------------------------===//

#include "vm/Trap.hpp"

#include <sstream>

namespace regvm::vm
{

std::string formatTrap(const VmError &error)
{
    std::ostringstream os;
    os << "trap: " << toString(error.kind) << " at pc " << error.pc;
    if (!error.message.empty())
        os << ": " << error.message;
    return os.str();
}

} // namespace regvm::vm
