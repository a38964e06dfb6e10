//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/regvm/cli.hpp
// Purpose: Command-line option parsing and subcommand entry points for the
//          regvm tool.
// Key invariants: Commands return 0 on success and 1 on any failure; every
//                 failure is reported on std::cerr before returning.
// Ownership/Lifetime: Options are plain values copied into each command.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"
#include "vm/Trace.hpp"

#include <cstdint>
#include <string>

namespace regvm::tools
{

/// @brief Options understood by more than one subcommand.
struct SharedCliOptions
{
    /// @brief Trace settings requested via --trace flags.
    vm::TraceConfig trace{};

    /// @brief Maximum number of interpreter steps (0 means unlimited).
    std::uint64_t maxSteps = 0;

    /// @brief Print progress notes on std::cerr.
    bool verbose = false;
};

/// @brief Outcome of attempting to parse a shared option.
enum class SharedOptionParseResult
{
    NotMatched, ///< Argument does not correspond to a shared option.
    Parsed,     ///< Argument consumed and reflected in the configuration.
    Error       ///< Argument looked like a shared option but was malformed.
};

/// @brief Try to consume the shared option at @p argv[index].
/// @param index Current position; advanced past any option value consumed.
SharedOptionParseResult parseSharedOption(int &index,
                                          int argc,
                                          char **argv,
                                          SharedCliOptions &opts);

/// @brief Positional input, optional output path and shared options of a command.
struct CommandArgs
{
    std::string input;
    std::string output;
    SharedCliOptions shared;
};

/// @brief Parse "<input> [-o out] [shared options]" for subcommand @p name.
/// @param allowRunOptions Accept --trace and --max-steps.
support::Expected<CommandArgs> parseCommandArgs(const char *name,
                                                int argc,
                                                char **argv,
                                                SharedCliOptions shared,
                                                bool allowRunOptions);

/// @brief Print @p message as a note when verbose output is enabled.
void verboseNote(const SharedCliOptions &opts, const std::string &message);

/// @brief `regvm build <input.asm> [-o out.rvm]`.
int cmdBuild(int argc, char **argv, SharedCliOptions shared = {});

/// @brief `regvm run <input> [-o state.txt] [--trace[=instr|src]] [--max-steps N]`.
int cmdRun(int argc, char **argv, SharedCliOptions shared = {});

/// @brief `regvm disasm <input.rvm> [-o out.asm]`.
int cmdDisasm(int argc, char **argv, SharedCliOptions shared = {});

/// @brief Dispatch a full command line; argv[0] is the program name.
int runRegvmTool(int argc, char **argv);

} // namespace regvm::tools
