//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bytecode/BytecodeModule.hpp
// Purpose: In-memory bytecode module and its on-disk .rvm representation.
// Key invariants: Module magic and version are set at construction time.
//                 A module never holds more than 4096 instruction words.
// Ownership: BytecodeModule owns its instruction words.
// Links: Bytecode.hpp, Encoder.hpp, Decoder.hpp
//
//===----------------------------------------------------------------------===//
//
// File layout (all integers little-endian):
//
//   offset 0   u32 magic    "RVM\x01"
//   offset 4   u32 version  1
//   offset 8   u32 count    number of instruction words
//   offset 12  count x 3-byte instruction words

#pragma once

#include "support/diag_expected.hpp"

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string_view>
#include <vector>

namespace regvm::bytecode
{

/// @brief File magic, "RVM\x01" read as a little-endian u32.
constexpr uint32_t kBytecodeModuleMagic = 0x014D5652;

/// @brief Current file format version.
constexpr uint32_t kBytecodeVersion = 1;

/// @brief Size of the fixed header in bytes.
constexpr size_t kBytecodeHeaderSize = 12;

/// @brief A bytecode program ready to be decoded and executed.
struct BytecodeModule
{
    uint32_t magic = kBytecodeModuleMagic;
    uint32_t version = kBytecodeVersion;
    std::vector<uint32_t> code; ///< 24-bit instruction words.
};

/// @brief Serialize @p module to @p os.
/// @return Error when the module is too large or a word exceeds 24 bits.
support::Expected<void> writeModule(const BytecodeModule &module, std::ostream &os);

/// @brief Parse a module from raw file contents.
/// @return Error on bad magic, unsupported version, oversize count,
///         truncated input or trailing bytes.
support::Expected<BytecodeModule> readModule(std::string_view bytes);

/// @brief Check whether @p bytes starts with the bytecode file magic.
bool hasBytecodeMagic(std::string_view bytes);

} // namespace regvm::bytecode
