//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/assembler/Parser.cpp
// Purpose: Implements parsing of assembly statements into Instr values.
// Key invariants: Operand shapes of every parsed instruction match its
//                 OpcodeInfo entry.
// Ownership/Lifetime: Stateless; diagnostics are written to the caller's engine.
//
//===----------------------------------------------------------------------===//

#include "assembler/Parser.hpp"

#include "assembler/OpcodeInfo.hpp"

#include <cctype>
#include <charconv>
#include <sstream>
#include <system_error>

namespace regvm::assembler
{
namespace
{
using support::Expected;
using support::makeError;
using support::SourceLoc;

SourceLoc at(SourceLoc loc, uint32_t column)
{
    loc.column = column;
    return loc;
}

std::string quoted(std::string_view text)
{
    return "'" + std::string(text) + "'";
}

Expected<Operand> parseOperand(OperandShape shape, const Token &tok, SourceLoc loc)
{
    switch (shape)
    {
        case OperandShape::Reg:
            return Parser::parseRegister(tok, loc);
        case OperandShape::Imm8:
            return Parser::parseImm8(tok, loc);
        case OperandShape::Target:
            return Parser::parseTarget(tok, loc);
        case OperandShape::None:
            break;
    }
    return Expected<Operand>{makeError(at(loc, tok.column), "unexpected operand " + quoted(tok.text))};
}
} // namespace

std::optional<long long> Parser::parseNumber(std::string_view text)
{
    if (text.empty())
        return std::nullopt;

    bool negative = false;
    if (text.front() == '-')
    {
        negative = true;
        text.remove_prefix(1);
        if (text.empty() || text.front() == '-')
            return std::nullopt;
    }

    int base = 10;
    if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X'))
    {
        // Hex literals are unsigned only.
        if (negative)
            return std::nullopt;
        base = 16;
        text.remove_prefix(2);
    }
    if (text.empty())
        return std::nullopt;

    long long value = 0;
    const char *const begin = text.data();
    const char *const end = begin + text.size();
    const auto fc = std::from_chars(begin, end, value, base);
    if (fc.ec != std::errc() || fc.ptr != end)
        return std::nullopt;
    return negative ? -value : value;
}

Expected<Operand> Parser::parseRegister(const Token &tok, SourceLoc loc)
{
    const std::string_view text = tok.text;
    if (text.size() < 2 || (text[0] != 'r' && text[0] != 'R') ||
        !std::isdigit(static_cast<unsigned char>(text[1])))
    {
        return Expected<Operand>{
            makeError(at(loc, tok.column), "expected register, got " + quoted(text))};
    }

    const auto index = parseNumber(text.substr(1));
    if (!index || text.substr(1).find_first_of("xX-") != std::string_view::npos)
    {
        return Expected<Operand>{
            makeError(at(loc, tok.column), "expected register, got " + quoted(text))};
    }
    if (*index >= kNumRegisters)
    {
        return Expected<Operand>{
            makeError(at(loc, tok.column), "invalid register " + quoted(text) + " (r0-r15)")};
    }
    return Operand::reg(static_cast<uint8_t>(*index));
}

Expected<Operand> Parser::parseImm8(const Token &tok, SourceLoc loc)
{
    const auto value = parseNumber(tok.text);
    if (!value)
    {
        return Expected<Operand>{
            makeError(at(loc, tok.column), "expected immediate, got " + quoted(tok.text))};
    }
    if (*value < -128 || *value > 0xFF)
    {
        return Expected<Operand>{makeError(
            at(loc, tok.column), "immediate " + quoted(tok.text) + " does not fit in 8 bits")};
    }
    return Operand::imm8(static_cast<uint8_t>(*value & 0xFF));
}

Expected<Operand> Parser::parseTarget(const Token &tok, SourceLoc loc)
{
    if (Lexer::isIdentifier(tok.text))
        return Operand::labelRef(tok.text);

    const auto value = parseNumber(tok.text);
    if (!value)
    {
        return Expected<Operand>{
            makeError(at(loc, tok.column), "expected label or address, got " + quoted(tok.text))};
    }
    if (*value < 0 || *value > kMaxImm12)
    {
        return Expected<Operand>{makeError(
            at(loc, tok.column), "branch target " + quoted(tok.text) + " does not fit in 12 bits")};
    }
    return Operand::imm12(static_cast<uint16_t>(*value));
}

Expected<std::vector<Instr>> Parser::parseLine(std::string_view line, SourceLoc loc)
{
    auto split = Lexer::splitLine(line, loc);
    if (!split)
        return Expected<std::vector<Instr>>{split.error()};

    const LineTokens &parts = split.value();
    std::vector<Instr> out;

    if (parts.label)
        out.push_back(Instr::makeLabel(parts.label->text, at(loc, parts.label->column)));

    if (!parts.mnemonic)
        return out;

    const Token &mnemonic = *parts.mnemonic;
    const auto op = lookupMnemonic(mnemonic.text);
    if (!op)
    {
        return Expected<std::vector<Instr>>{makeError(
            at(loc, mnemonic.column), "unknown instruction " + quoted(mnemonic.text))};
    }

    const OpcodeInfo &info = getOpcodeInfo(*op);
    if (parts.operands.size() != info.numOperands)
    {
        std::ostringstream oss;
        oss << quoted(info.name) << " expects " << static_cast<unsigned>(info.numOperands)
            << " operand" << (info.numOperands == 1 ? "" : "s") << ", got "
            << parts.operands.size();
        return Expected<std::vector<Instr>>{makeError(at(loc, mnemonic.column), oss.str())};
    }

    Instr in;
    in.op = *op;
    in.loc = at(loc, mnemonic.column);
    for (size_t i = 0; i < parts.operands.size(); ++i)
    {
        auto operand = parseOperand(info.operands[i], parts.operands[i], loc);
        if (!operand)
            return Expected<std::vector<Instr>>{operand.error()};
        in.operands.push_back(std::move(operand.value()));
    }
    out.push_back(std::move(in));
    return out;
}

Program Parser::parseProgram(std::string_view source,
                             uint32_t fileId,
                             support::DiagnosticEngine &diags)
{
    Program program;
    uint32_t lineNo = 0;
    size_t pos = 0;
    while (pos <= source.size())
    {
        const size_t nl = source.find('\n', pos);
        const size_t end = nl == std::string_view::npos ? source.size() : nl;
        std::string_view line = source.substr(pos, end - pos);
        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);
        ++lineNo;

        auto parsed = parseLine(line, SourceLoc{fileId, lineNo, 0});
        if (!parsed)
            diags.report(parsed.error());
        else
        {
            for (auto &in : parsed.value())
                program.push_back(std::move(in));
        }

        if (nl == std::string_view::npos)
            break;
        pos = nl + 1;
    }
    return program;
}

} // namespace regvm::assembler
