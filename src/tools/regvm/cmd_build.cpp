//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements `regvm build`: assemble a source file and write a bytecode
// module next to it (or to the path given with -o).
//
//===----------------------------------------------------------------------===//

#include "cli.hpp"

#include "assembler/Compiler.hpp"
#include "bytecode/BytecodeModule.hpp"
#include "bytecode/Encoder.hpp"
#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"
#include "tools/common/source_loader.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace regvm::tools
{

int cmdBuild(int argc, char **argv, SharedCliOptions shared)
{
    auto parsed = parseCommandArgs("build", argc, argv, shared, /*allowRunOptions=*/false);
    if (!parsed)
    {
        support::printDiag(parsed.error(), std::cerr);
        return 1;
    }
    const CommandArgs &args = parsed.value();

    support::SourceManager sm;
    auto source = common::loadSourceBuffer(args.input, sm);
    if (!source)
    {
        support::printDiag(source.error(), std::cerr);
        return 1;
    }

    support::DiagnosticEngine diags;
    auto program = assembler::compileProgram(source.value().buffer, source.value().fileId, diags);
    if (!program)
    {
        diags.printAll(std::cerr, &sm);
        return 1;
    }

    auto words = bytecode::encodeProgram(program.value());
    if (!words)
    {
        support::printDiag(words.error(), std::cerr, &sm);
        return 1;
    }

    std::string outPath = args.output;
    if (outPath.empty())
        outPath = std::filesystem::path(args.input).replace_extension(".rvm").string();

    std::ofstream out(outPath, std::ios::binary);
    if (!out)
    {
        support::printDiag(support::makeError({}, "unable to open " + outPath + " for writing"),
                           std::cerr);
        return 1;
    }

    bytecode::BytecodeModule module;
    module.code = std::move(words.value());
    if (auto written = bytecode::writeModule(module, out); !written)
    {
        support::printDiag(written.error(), std::cerr);
        return 1;
    }

    verboseNote(args.shared,
                "assembled " + std::to_string(module.code.size()) + " instructions from " +
                    args.input + " to " + outPath);
    return 0;
}

} // namespace regvm::tools
