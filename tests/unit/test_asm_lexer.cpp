// File: tests/unit/test_asm_lexer.cpp
// Purpose: Verify line splitting for the assembly language: comments, labels,
//          mnemonics and comma separated operands with their columns.
// Key invariants: Comment text never reaches the parser; columns are 1-based.
// Ownership/Lifetime: N/A (test).
// Links: src/assembler/Lexer.hpp

#include <gtest/gtest.h>

#include "assembler/Lexer.hpp"

using regvm::assembler::Lexer;
using regvm::support::SourceLoc;

TEST(AsmLexer, StripsCommentsAndWhitespace)
{
    EXPECT_EQ(Lexer::stripComment("add r1, r2, r3 ; sum"), "add r1, r2, r3 ");
    EXPECT_EQ(Lexer::stripComment("; only a comment"), "");
    EXPECT_EQ(Lexer::trim("  \tmv r1, r2  "), "mv r1, r2");
}

TEST(AsmLexer, BlankAndCommentLinesAreEmpty)
{
    for (const char *line : {"", "   ", "; Basic fibonacci", "\t; indented comment"})
    {
        auto parts = Lexer::splitLine(line, SourceLoc{1, 1, 0});
        ASSERT_TRUE(parts) << line;
        EXPECT_TRUE(parts.value().empty()) << line;
    }
}

TEST(AsmLexer, SplitsInstructionOperands)
{
    auto parts = Lexer::splitLine("  add  r3, r1, r2   ; c = a + b", SourceLoc{1, 6, 0});
    ASSERT_TRUE(parts);
    const auto &tokens = parts.value();
    EXPECT_FALSE(tokens.label);
    ASSERT_TRUE(tokens.mnemonic);
    EXPECT_EQ(tokens.mnemonic->text, "add");
    EXPECT_EQ(tokens.mnemonic->column, 3u);
    ASSERT_EQ(tokens.operands.size(), 3u);
    EXPECT_EQ(tokens.operands[0].text, "r3");
    EXPECT_EQ(tokens.operands[0].column, 8u);
    EXPECT_EQ(tokens.operands[1].text, "r1");
    EXPECT_EQ(tokens.operands[2].text, "r2");
    EXPECT_EQ(tokens.operands[2].column, 16u);
}

TEST(AsmLexer, LabelMayShareLineWithInstruction)
{
    auto parts = Lexer::splitLine("loop: bnz loop", {});
    ASSERT_TRUE(parts);
    ASSERT_TRUE(parts.value().label);
    EXPECT_EQ(parts.value().label->text, "loop");
    ASSERT_TRUE(parts.value().mnemonic);
    EXPECT_EQ(parts.value().mnemonic->text, "bnz");
    ASSERT_EQ(parts.value().operands.size(), 1u);
    EXPECT_EQ(parts.value().operands[0].text, "loop");

    auto bare = Lexer::splitLine("start:", {});
    ASSERT_TRUE(bare);
    EXPECT_TRUE(bare.value().label);
    EXPECT_FALSE(bare.value().mnemonic);
}

TEST(AsmLexer, IdentifierRules)
{
    EXPECT_TRUE(Lexer::isIdentifier("loop"));
    EXPECT_TRUE(Lexer::isIdentifier("_L1"));
    EXPECT_FALSE(Lexer::isIdentifier("1loop"));
    EXPECT_FALSE(Lexer::isIdentifier("lo-op"));
    EXPECT_FALSE(Lexer::isIdentifier(""));
}

TEST(AsmLexer, RejectsMalformedLines)
{
    auto badLabel = Lexer::splitLine("9lives: halt", SourceLoc{1, 4, 0});
    ASSERT_FALSE(badLabel);
    EXPECT_EQ(badLabel.error().message, "invalid label name '9lives'");
    EXPECT_EQ(badLabel.error().loc.line, 4u);
    EXPECT_EQ(badLabel.error().loc.column, 1u);

    auto emptyOperand = Lexer::splitLine("add r1, , r2", SourceLoc{1, 2, 0});
    ASSERT_FALSE(emptyOperand);
    EXPECT_EQ(emptyOperand.error().message, "expected operand");

    auto trailingComma = Lexer::splitLine("mv r1,", {});
    ASSERT_FALSE(trailingComma);
    EXPECT_EQ(trailingComma.error().message, "expected operand");
}
