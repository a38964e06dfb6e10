//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/assembler/Lexer.hpp
// Purpose: Splits one line of assembly into an optional label definition, a
//          mnemonic and its comma-separated operand tokens.
// Key invariants: Token columns are 1-based offsets into the original line.
// Ownership/Lifetime: Tokens own copies of their text.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"
#include "support/source_location.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace regvm::assembler
{

/// @brief A lexeme and the column where it starts.
struct Token
{
    std::string text;
    uint32_t column = 0;
};

/// @brief Lexical parts of one source line.
struct LineTokens
{
    std::optional<Token> label;    ///< "name" of a leading "name:" definition.
    std::optional<Token> mnemonic; ///< Instruction spelling, if any.
    std::vector<Token> operands;   ///< Operand tokens in order, trimmed.

    /// @brief True when the line holds neither a label nor an instruction.
    [[nodiscard]] bool empty() const
    {
        return !label && !mnemonic;
    }
};

/// @brief Line-oriented tokeniser for the assembly language.
class Lexer
{
  public:
    /// @brief Comment introducer; the rest of the line is ignored.
    static constexpr char kCommentChar = ';';

    /// @brief Drop a trailing comment from @p line.
    [[nodiscard]] static std::string_view stripComment(std::string_view line);

    /// @brief Remove leading and trailing whitespace from @p text.
    [[nodiscard]] static std::string trim(std::string_view text);

    /// @brief Check whether @p text spells a valid label name.
    /// @details Names match [A-Za-z_][A-Za-z0-9_]*.
    [[nodiscard]] static bool isIdentifier(std::string_view text);

    /// @brief Tokenise one line.
    /// @param line Raw line text without the newline.
    /// @param loc Location of the line; the column is filled per diagnostic.
    /// @return Line parts, or a diagnostic for malformed labels or empty operands.
    [[nodiscard]] static support::Expected<LineTokens> splitLine(std::string_view line,
                                                                 support::SourceLoc loc);
};

} // namespace regvm::assembler
