//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bytecode/Bytecode.hpp
// Purpose: 24-bit instruction word layout, opcode numbers and the chainable
//          InstrBuilder used by the encoder.
// Key invariants: Encoded words never use bits above bit 23.
//                 The all-zero word is HALT.
// Ownership: Header-only constants and helpers; opcodeName() is defined in
//            Bytecode.cpp.
// Links: Encoder.hpp, Decoder.hpp, BytecodeModule.hpp
//
//===----------------------------------------------------------------------===//
//
// Instruction Encoding (bit 0 is the least significant bit):
//
//   [23..20][19..16][15..12][11..8][7..6][5..0]
//   |     rs2      |  rs1  |  rd  | fun2 | opcode |
//   |     imm8     |       |      |      |        |
//   |          imm12       |      |      |        |
//
// - imm8 (bits 16-23) overlaps rs2.
// - imm12 (bits 12-23) overlaps rs1 and rs2; used only by BRANCH.
// - fun2 selects the branch condition and must be zero elsewhere.

#pragma once

#include <cstdint>

namespace regvm::bytecode
{

/// @brief Mask of the bits an instruction word may use.
constexpr uint32_t kWordMask = 0xFFFFFF;

/// @brief Number of bytes an instruction word occupies in a bytecode file.
constexpr uint32_t kWordBytes = 3;

/// @brief Primary opcode field values (bits 0-5).
enum class BCOpcode : uint8_t
{
    HALT = 0x00,   ///< Stop execution; the whole word is zero.
    ADDI = 0x01,   ///< rd = rs1 + imm8 (also mv and nop).
    ADD = 0x02,    ///< rd = rs1 + rs2.
    SUB = 0x03,    ///< rd = rs1 - rs2.
    AND = 0x04,    ///< rd = rs1 & rs2.
    OR = 0x05,     ///< rd = rs1 | rs2.
    XOR = 0x06,    ///< rd = rs1 ^ rs2.
    NOT = 0x07,    ///< rd = ~rs1.
    ANDI = 0x08,   ///< rd = rs1 & imm8.
    ORI = 0x09,    ///< rd = rs1 | imm8.
    XORI = 0x0A,   ///< rd = rs1 ^ imm8.
    BRANCH = 0x0B, ///< Conditional or unconditional jump to imm12.

    OPCODE_COUNT ///< Sentinel; first unassigned opcode value.
};

/// @brief BRANCH condition carried in fun2.
enum class BranchCond : uint8_t
{
    Always = 0,  ///< jmp
    Zero = 1,    ///< bz
    NotZero = 2, ///< bnz
};

/// @brief Get the human-readable name for an opcode ("ADDI", "BRANCH", ...).
/// @return "UNKNOWN" for values outside the enumeration.
const char *opcodeName(BCOpcode op);

/// @brief Chainable builder assembling one instruction word field by field.
/// @details Each setter clears its field before inserting the masked value,
///          so setting a field twice keeps only the last value.
class InstrBuilder
{
  public:
    constexpr InstrBuilder() = default;

    /// @brief Set the 6-bit opcode (bits 0-5).
    constexpr InstrBuilder opcode(BCOpcode op) const
    {
        return with(0x3F, 0, static_cast<uint32_t>(op));
    }

    /// @brief Set the 2-bit fun2 field (bits 6-7).
    constexpr InstrBuilder fun2(uint8_t fun) const
    {
        return with(0x03, 6, fun);
    }

    /// @brief Set rd (bits 8-11).
    constexpr InstrBuilder rd(uint8_t reg) const
    {
        return with(0x0F, 8, reg);
    }

    /// @brief Set rs1 (bits 12-15).
    constexpr InstrBuilder rs1(uint8_t reg) const
    {
        return with(0x0F, 12, reg);
    }

    /// @brief Set rs2 (bits 16-19).
    constexpr InstrBuilder rs2(uint8_t reg) const
    {
        return with(0x0F, 16, reg);
    }

    /// @brief Set imm8 (bits 16-23).
    constexpr InstrBuilder imm8(uint8_t imm) const
    {
        return with(0xFF, 16, imm);
    }

    /// @brief Set imm12 (bits 12-23).
    constexpr InstrBuilder imm12(uint16_t imm) const
    {
        return with(0xFFF, 12, imm);
    }

    /// @brief Return the final 24-bit word.
    constexpr uint32_t finalize() const
    {
        return word_ & kWordMask;
    }

  private:
    constexpr explicit InstrBuilder(uint32_t word) : word_(word) {}

    constexpr InstrBuilder with(uint32_t mask, unsigned shift, uint32_t value) const
    {
        return InstrBuilder((word_ & ~(mask << shift)) | ((value & mask) << shift));
    }

    uint32_t word_ = 0;
};

//==============================================================================
// Field Decoding Helpers
//==============================================================================

inline constexpr uint8_t decodeOpcodeBits(uint32_t word)
{
    return static_cast<uint8_t>(word & 0x3F);
}

inline constexpr uint8_t decodeFun2(uint32_t word)
{
    return static_cast<uint8_t>((word >> 6) & 0x03);
}

inline constexpr uint8_t decodeRd(uint32_t word)
{
    return static_cast<uint8_t>((word >> 8) & 0x0F);
}

inline constexpr uint8_t decodeRs1(uint32_t word)
{
    return static_cast<uint8_t>((word >> 12) & 0x0F);
}

inline constexpr uint8_t decodeRs2(uint32_t word)
{
    return static_cast<uint8_t>((word >> 16) & 0x0F);
}

/// @brief Bits 20-23, which must be zero for register-register forms.
inline constexpr uint8_t decodeHighNibble(uint32_t word)
{
    return static_cast<uint8_t>((word >> 20) & 0x0F);
}

inline constexpr uint8_t decodeImm8(uint32_t word)
{
    return static_cast<uint8_t>((word >> 16) & 0xFF);
}

inline constexpr uint16_t decodeImm12(uint32_t word)
{
    return static_cast<uint16_t>((word >> 12) & 0xFFF);
}

} // namespace regvm::bytecode
