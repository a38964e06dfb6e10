// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.

#include "bytecode/Bytecode.hpp"

namespace regvm::bytecode
{

const char *opcodeName(BCOpcode op)
{
    switch (op)
    {
        case BCOpcode::HALT:
            return "HALT";
        case BCOpcode::ADDI:
            return "ADDI";
        case BCOpcode::ADD:
            return "ADD";
        case BCOpcode::SUB:
            return "SUB";
        case BCOpcode::AND:
            return "AND";
        case BCOpcode::OR:
            return "OR";
        case BCOpcode::XOR:
            return "XOR";
        case BCOpcode::NOT:
            return "NOT";
        case BCOpcode::ANDI:
            return "ANDI";
        case BCOpcode::ORI:
            return "ORI";
        case BCOpcode::XORI:
            return "XORI";
        case BCOpcode::BRANCH:
            return "BRANCH";
        case BCOpcode::OPCODE_COUNT:
            break;
    }
    return "UNKNOWN";
}

} // namespace regvm::bytecode
