//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Two-pass label resolution.  The first pass assigns each label the address of
// the instruction that follows it; several labels may share an address and a
// label at the very end of the program names the address one past the last
// instruction.  The second pass substitutes those addresses into branch
// operands.
//
//===----------------------------------------------------------------------===//

#include "assembler/SymbolTable.hpp"

#include <sstream>

namespace regvm::assembler
{

using support::Expected;
using support::makeError;

Expected<StrippedProgram> stripSymbols(const Program &prg)
{
    StrippedProgram out;
    out.program.reserve(prg.size());
    uint16_t pc = 0;

    for (const Instr &in : prg)
    {
        if (in.op == Opcode::Label)
        {
            if (!out.symbols.emplace(in.label, pc).second)
            {
                return Expected<StrippedProgram>{
                    makeError(in.loc, "duplicate label '" + in.label + "'")};
            }
            continue;
        }

        if (out.program.size() >= kMaxProgramSize)
        {
            std::ostringstream oss;
            oss << "program exceeds " << kMaxProgramSize << " instructions";
            return Expected<StrippedProgram>{makeError(in.loc, oss.str())};
        }
        out.program.push_back(in);
        ++pc;
    }

    return out;
}

Expected<Program> replaceSymbols(const Program &prg, const SymbolTable &symbols)
{
    Program out;
    out.reserve(prg.size());

    for (const Instr &in : prg)
    {
        if (in.op == Opcode::Label)
        {
            return Expected<Program>{
                makeError(in.loc, "encountered unstripped label '" + in.label + "'")};
        }

        Instr resolved = in;
        for (Operand &operand : resolved.operands)
        {
            if (operand.kind != OperandKind::Label)
                continue;
            const auto it = symbols.find(operand.label);
            if (it == symbols.end())
            {
                return Expected<Program>{
                    makeError(in.loc, "undefined label '" + operand.label + "'")};
            }
            if (it->second > kMaxImm12)
            {
                return Expected<Program>{makeError(
                    in.loc, "label '" + operand.label + "' resolves beyond the 12-bit address range")};
            }
            operand = Operand::imm12(it->second);
        }
        out.push_back(std::move(resolved));
    }

    return out;
}

} // namespace regvm::assembler
