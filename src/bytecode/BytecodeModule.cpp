//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bytecode/BytecodeModule.cpp
// Purpose: Reader and writer for .rvm bytecode files.
// Key invariants: The reader consumes exactly the bytes described by the
//                 header; anything else is rejected.
//
//===----------------------------------------------------------------------===//

#include "bytecode/BytecodeModule.hpp"

#include "assembler/Ast.hpp"
#include "bytecode/Bytecode.hpp"

#include <string>

namespace regvm::bytecode
{
namespace
{
using support::Expected;
using support::makeError;

void putU32(std::string &out, uint32_t v)
{
    for (int i = 0; i < 4; ++i)
        out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
}

uint32_t getLE(std::string_view bytes, size_t offset, size_t width)
{
    uint32_t v = 0;
    for (size_t i = 0; i < width; ++i)
        v |= static_cast<uint32_t>(static_cast<unsigned char>(bytes[offset + i])) << (8 * i);
    return v;
}
} // namespace

Expected<void> writeModule(const BytecodeModule &module, std::ostream &os)
{
    if (module.code.size() > assembler::kMaxProgramSize)
    {
        return makeError({},
                         "program has " + std::to_string(module.code.size()) +
                             " instructions; the limit is " +
                             std::to_string(assembler::kMaxProgramSize));
    }

    std::string out;
    out.reserve(kBytecodeHeaderSize + module.code.size() * kWordBytes);
    putU32(out, module.magic);
    putU32(out, module.version);
    putU32(out, static_cast<uint32_t>(module.code.size()));
    for (size_t i = 0; i < module.code.size(); ++i)
    {
        const uint32_t word = module.code[i];
        if ((word & ~kWordMask) != 0)
            return makeError({}, "word " + std::to_string(i) + " exceeds 24 bits");
        for (uint32_t b = 0; b < kWordBytes; ++b)
            out.push_back(static_cast<char>((word >> (8 * b)) & 0xFF));
    }

    os.write(out.data(), static_cast<std::streamsize>(out.size()));
    if (!os)
        return makeError({}, "failed to write bytecode");
    return {};
}

Expected<BytecodeModule> readModule(std::string_view bytes)
{
    if (bytes.size() < kBytecodeHeaderSize)
        return Expected<BytecodeModule>{makeError({}, "truncated bytecode header")};

    BytecodeModule module;
    module.magic = getLE(bytes, 0, 4);
    if (module.magic != kBytecodeModuleMagic)
        return Expected<BytecodeModule>{makeError({}, "not a regvm bytecode file (bad magic)")};

    module.version = getLE(bytes, 4, 4);
    if (module.version != kBytecodeVersion)
    {
        return Expected<BytecodeModule>{
            makeError({}, "unsupported bytecode version " + std::to_string(module.version))};
    }

    const uint32_t count = getLE(bytes, 8, 4);
    if (count > assembler::kMaxProgramSize)
    {
        return Expected<BytecodeModule>{
            makeError({}, "instruction count " + std::to_string(count) + " exceeds limit")};
    }

    const size_t expected = kBytecodeHeaderSize + static_cast<size_t>(count) * kWordBytes;
    if (bytes.size() < expected)
        return Expected<BytecodeModule>{makeError({}, "truncated bytecode body")};
    if (bytes.size() > expected)
    {
        return Expected<BytecodeModule>{makeError(
            {}, std::to_string(bytes.size() - expected) + " trailing bytes after bytecode")};
    }

    module.code.reserve(count);
    for (uint32_t i = 0; i < count; ++i)
        module.code.push_back(getLE(bytes, kBytecodeHeaderSize + i * kWordBytes, kWordBytes));
    return module;
}

bool hasBytecodeMagic(std::string_view bytes)
{
    return bytes.size() >= 4 && getLE(bytes, 0, 4) == kBytecodeModuleMagic;
}

} // namespace regvm::bytecode
