//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Top-level dispatch for the regvm tool: global flags, then one subcommand
// and its arguments.
//
//===----------------------------------------------------------------------===//

#include "cli.hpp"
#include "tools/common/ArgvView.hpp"
#include "usage.hpp"

#include <iostream>
#include <string>
#include <string_view>

namespace regvm::tools
{

int runRegvmTool(int argc, char **argv)
{
    ArgvView args = ArgvView{argc, argv}.drop_front();
    SharedCliOptions global;

    while (!args.empty() && (args.front() == "-v" || args.front() == "--verbose"))
    {
        global.verbose = true;
        args = args.drop_front();
    }

    if (args.empty())
    {
        printUsage();
        return 1;
    }

    const std::string_view cmd = args.front();
    if (cmd == "-h" || cmd == "--help")
    {
        printUsage();
        return 0;
    }
    if (cmd == "--version")
    {
        printVersion();
        return 0;
    }

    const ArgvView rest = args.drop_front();
    if (cmd == "build" || cmd == "b")
        return cmdBuild(rest.argc, rest.argv, global);
    if (cmd == "run" || cmd == "r")
        return cmdRun(rest.argc, rest.argv, global);
    if (cmd == "disasm" || cmd == "d")
        return cmdDisasm(rest.argc, rest.argv, global);

    std::cerr << "error: unknown command '" << cmd << "'\n";
    printUsage();
    return 1;
}

} // namespace regvm::tools
