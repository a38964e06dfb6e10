//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/regvm/cli.cpp
// Purpose: Shared option parsing for the regvm subcommands.
//
//===----------------------------------------------------------------------===//

#include "cli.hpp"

#include <charconv>
#include <iostream>
#include <string_view>
#include <system_error>

namespace regvm::tools
{

SharedOptionParseResult parseSharedOption(int &index, int argc, char **argv, SharedCliOptions &opts)
{
    const std::string_view arg = argv[index];
    if (arg == "-v" || arg == "--verbose")
    {
        opts.verbose = true;
        return SharedOptionParseResult::Parsed;
    }
    if (arg == "--trace" || arg == "--trace=instr")
    {
        opts.trace.mode = vm::TraceConfig::Instr;
        return SharedOptionParseResult::Parsed;
    }
    if (arg == "--trace=src")
    {
        opts.trace.mode = vm::TraceConfig::Src;
        return SharedOptionParseResult::Parsed;
    }
    if (arg.rfind("--trace=", 0) == 0)
    {
        return SharedOptionParseResult::Error;
    }
    if (arg == "--max-steps")
    {
        if (index + 1 >= argc)
        {
            return SharedOptionParseResult::Error;
        }
        std::string_view value(argv[index + 1]);
        std::uint64_t parsed = 0;
        const char *const begin = value.data();
        const char *const end = begin + value.size();
        const auto fc = std::from_chars(begin, end, parsed);
        if (fc.ec != std::errc() || fc.ptr != end)
        {
            return SharedOptionParseResult::Error;
        }
        ++index;
        opts.maxSteps = parsed;
        return SharedOptionParseResult::Parsed;
    }
    return SharedOptionParseResult::NotMatched;
}

support::Expected<CommandArgs> parseCommandArgs(
    const char *name, int argc, char **argv, SharedCliOptions shared, bool allowRunOptions)
{
    CommandArgs args;
    args.shared = shared;
    bool hasInput = false;

    for (int i = 0; i < argc; ++i)
    {
        const std::string_view arg = argv[i];
        if (arg == "-o" || arg == "--output")
        {
            if (i + 1 >= argc)
            {
                return support::Expected<CommandArgs>(
                    support::makeError({}, "missing output path after " + std::string(arg)));
            }
            args.output = argv[++i];
            continue;
        }

        const bool runOnly = arg == "--max-steps" || arg.rfind("--trace", 0) == 0;
        if (runOnly && !allowRunOptions)
        {
            return support::Expected<CommandArgs>(support::makeError(
                {}, std::string(arg) + " is only valid with 'run', not '" + name + "'"));
        }

        switch (parseSharedOption(i, argc, argv, args.shared))
        {
            case SharedOptionParseResult::Parsed:
                continue;
            case SharedOptionParseResult::Error:
                return support::Expected<CommandArgs>(
                    support::makeError({}, "malformed option: " + std::string(arg)));
            case SharedOptionParseResult::NotMatched:
                if (!arg.empty() && arg[0] != '-' && !hasInput)
                {
                    args.input = std::string(arg);
                    hasInput = true;
                }
                else if (!arg.empty() && arg[0] != '-')
                {
                    return support::Expected<CommandArgs>(
                        support::makeError({}, "unexpected argument: " + std::string(arg)));
                }
                else
                {
                    return support::Expected<CommandArgs>(
                        support::makeError({}, "unknown flag: " + std::string(arg)));
                }
                break;
        }
    }

    if (!hasInput)
    {
        return support::Expected<CommandArgs>(
            support::makeError({}, std::string("missing input file for '") + name + "'"));
    }
    return support::Expected<CommandArgs>(std::move(args));
}

void verboseNote(const SharedCliOptions &opts, const std::string &message)
{
    if (opts.verbose)
        support::printDiag(support::makeNote(message), std::cerr);
}

} // namespace regvm::tools
