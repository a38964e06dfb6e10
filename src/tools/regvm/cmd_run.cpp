//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements `regvm run`. The input may be assembly text or a bytecode
// module; modules are recognised by their magic number, everything else is
// assembled first. The final machine state is printed to stdout or to the
// file given with -o.
//
//===----------------------------------------------------------------------===//

#include "cli.hpp"

#include "assembler/Compiler.hpp"
#include "bytecode/BytecodeModule.hpp"
#include "bytecode/Decoder.hpp"
#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"
#include "tools/common/source_loader.hpp"
#include "vm/VM.hpp"

#include <fstream>
#include <iostream>
#include <optional>
#include <string>

namespace regvm::tools
{
namespace
{

/// @brief Build a resolved program from @p source, reporting failures.
std::optional<assembler::Program> loadProgram(const CommandArgs &args,
                                              const common::LoadedSource &source,
                                              const support::SourceManager &sm)
{
    if (bytecode::hasBytecodeMagic(source.buffer))
    {
        verboseNote(args.shared, "loading bytecode module " + args.input);
        auto module = bytecode::readModule(source.buffer);
        if (!module)
        {
            support::printDiag(module.error(), std::cerr);
            return std::nullopt;
        }
        auto program = bytecode::decodeProgram(module.value().code);
        if (!program)
        {
            support::printDiag(program.error(), std::cerr);
            return std::nullopt;
        }
        return std::move(program.value());
    }

    verboseNote(args.shared, "assembling " + args.input);
    support::DiagnosticEngine diags;
    auto program = assembler::compileProgram(source.buffer, source.fileId, diags);
    if (!program)
    {
        diags.printAll(std::cerr, &sm);
        return std::nullopt;
    }
    return std::move(program.value());
}

} // namespace

int cmdRun(int argc, char **argv, SharedCliOptions shared)
{
    auto parsed = parseCommandArgs("run", argc, argv, shared, /*allowRunOptions=*/true);
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

    auto program = loadProgram(args, source.value(), sm);
    if (!program)
        return 1;

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

    vm::RunConfig config;
    config.maxSteps = args.shared.maxSteps;
    config.trace = args.shared.trace;
    config.trace.sm = &sm;

    const vm::RunResult result = vm::interpretProgram(*program, std::nullopt, config);
    vm::printState(result.state, out);
    out << "steps = " << result.steps << '\n';
    out.flush();

    if (result.error)
    {
        std::cerr << vm::formatTrap(*result.error) << '\n';
        return 1;
    }
    verboseNote(args.shared, "halted after " + std::to_string(result.steps) + " steps");
    return 0;
}

} // namespace regvm::tools
