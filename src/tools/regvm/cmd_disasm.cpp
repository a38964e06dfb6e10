//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements `regvm disasm`: print a bytecode module as assembly text with
// address comments. The output reassembles to the same words.
//
//===----------------------------------------------------------------------===//

#include "cli.hpp"

#include "assembler/Serializer.hpp"
#include "bytecode/BytecodeModule.hpp"
#include "bytecode/Decoder.hpp"
#include "support/diag_expected.hpp"
#include "tools/common/source_loader.hpp"

#include <fstream>
#include <iostream>

namespace regvm::tools
{

int cmdDisasm(int argc, char **argv, SharedCliOptions shared)
{
    auto parsed = parseCommandArgs("disasm", argc, argv, shared, /*allowRunOptions=*/false);
    if (!parsed)
    {
        support::printDiag(parsed.error(), std::cerr);
        return 1;
    }
    const CommandArgs &args = parsed.value();

    auto bytes = common::loadSourceFile(args.input);
    if (!bytes)
    {
        support::printDiag(bytes.error(), std::cerr);
        return 1;
    }

    auto module = bytecode::readModule(bytes.value());
    if (!module)
    {
        support::printDiag(module.error(), std::cerr);
        return 1;
    }
    auto program = bytecode::decodeProgram(module.value().code);
    if (!program)
    {
        support::printDiag(program.error(), std::cerr);
        return 1;
    }

    std::ofstream file;
    if (!args.output.empty())
    {
        file.open(args.output);
        if (!file)
        {
            support::printDiag(
                support::makeError({}, "unable to open " + args.output + " for writing"),
                std::cerr);
            return 1;
        }
    }
    std::ostream &out = args.output.empty() ? std::cout : file;
    assembler::Serializer::write(program.value(), out, assembler::Serializer::Mode::WithAddresses);
    out.flush();

    verboseNote(args.shared,
                "disassembled " + std::to_string(program.value().size()) + " instructions");
    return 0;
}

} // namespace regvm::tools
