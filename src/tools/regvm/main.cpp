//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "cli.hpp"

int main(int argc, char **argv)
{
    return regvm::tools::runRegvmTool(argc, argv);
}
