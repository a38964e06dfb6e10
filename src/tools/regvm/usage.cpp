//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "usage.hpp"
#include "regvm/version.hpp"
#include <iostream>

namespace regvm::tools
{

void printVersion()
{
    std::cout << "regvm v" << REGVM_VERSION_STR << "\n";
    std::cout << "Bytecode format version: " << REGVM_BYTECODE_VERSION_STR << "\n";
}

void printUsage()
{
    std::cerr << "regvm v" << REGVM_VERSION_STR << " - register machine assembler and VM\n"
              << "\n"
              << "Usage: regvm [-v|--verbose] <command> [options]\n"
              << "\n"
              << "Commands:\n"
              << "  build, b <in.asm> [-o out.rvm]     Assemble to bytecode\n"
              << "  run, r <input> [-o state.txt]      Run assembly or bytecode\n"
              << "  disasm, d <in.rvm> [-o out.asm]    Print bytecode as assembly\n"
              << "\n"
              << "Run options:\n"
              << "  --trace[=instr|src]                Trace each executed instruction\n"
              << "  --max-steps N                      Trap after N instructions\n"
              << "\n"
              << "Options:\n"
              << "  -o, --output FILE                  Output file\n"
              << "  -v, --verbose                      Print progress notes\n"
              << "  -h, --help                         Show this help message\n"
              << "  --version                          Show version information\n"
              << "\n"
              << "Examples:\n"
              << "  regvm build fib.asm                Write fib.rvm\n"
              << "  regvm run fib.rvm --trace          Run with an instruction trace\n"
              << "\n";
}

} // namespace regvm::tools
