//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/assembler/Lexer.cpp
// Purpose: Implements line tokenisation for the assembler.
// Key invariants: Operates on ASCII text; columns count bytes from 1.
//
//===----------------------------------------------------------------------===//

#include "assembler/Lexer.hpp"

#include <cctype>

namespace regvm::assembler
{
namespace
{
bool isSpace(char c)
{
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

size_t skipSpaces(std::string_view text, size_t pos)
{
    while (pos < text.size() && isSpace(text[pos]))
        ++pos;
    return pos;
}

support::SourceLoc at(support::SourceLoc loc, size_t pos)
{
    loc.column = static_cast<uint32_t>(pos + 1);
    return loc;
}
} // namespace

std::string_view Lexer::stripComment(std::string_view line)
{
    const auto pos = line.find(kCommentChar);
    if (pos == std::string_view::npos)
        return line;
    return line.substr(0, pos);
}

std::string Lexer::trim(std::string_view text)
{
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && isSpace(text[begin]))
        ++begin;
    while (end > begin && isSpace(text[end - 1]))
        --end;
    return std::string{text.substr(begin, end - begin)};
}

bool Lexer::isIdentifier(std::string_view text)
{
    if (text.empty())
        return false;
    const auto first = static_cast<unsigned char>(text.front());
    if (!std::isalpha(first) && first != '_')
        return false;
    for (char c : text.substr(1))
    {
        const auto uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && uc != '_')
            return false;
    }
    return true;
}

support::Expected<LineTokens> Lexer::splitLine(std::string_view line, support::SourceLoc loc)
{
    using support::Expected;
    using support::makeError;

    const std::string_view text = stripComment(line);
    LineTokens out;

    size_t pos = skipSpaces(text, 0);
    if (pos == text.size())
        return out;

    // First word: either a label definition or the mnemonic.
    size_t wordEnd = pos;
    while (wordEnd < text.size() && !isSpace(text[wordEnd]) && text[wordEnd] != ':' &&
           text[wordEnd] != ',')
        ++wordEnd;

    if (wordEnd < text.size() && text[wordEnd] == ':')
    {
        const std::string_view name = text.substr(pos, wordEnd - pos);
        if (!isIdentifier(name))
        {
            return Expected<LineTokens>{
                makeError(at(loc, pos), "invalid label name '" + std::string(name) + "'")};
        }
        out.label = Token{std::string(name), static_cast<uint32_t>(pos + 1)};
        pos = skipSpaces(text, wordEnd + 1);
        if (pos == text.size())
            return out;

        wordEnd = pos;
        while (wordEnd < text.size() && !isSpace(text[wordEnd]) && text[wordEnd] != ',')
            ++wordEnd;
    }

    if (wordEnd == pos)
        return Expected<LineTokens>{makeError(at(loc, pos), "expected instruction mnemonic")};

    out.mnemonic = Token{std::string(text.substr(pos, wordEnd - pos)),
                         static_cast<uint32_t>(pos + 1)};

    pos = skipSpaces(text, wordEnd);
    if (pos == text.size())
        return out;

    // Comma separated operand list; every slot must be non-empty.
    size_t start = pos;
    while (true)
    {
        const size_t comma = text.find(',', start);
        const size_t end = comma == std::string_view::npos ? text.size() : comma;
        const std::string_view raw = text.substr(start, end - start);
        const size_t lead = skipSpaces(raw, 0);
        std::string piece = trim(raw);
        if (piece.empty())
            return Expected<LineTokens>{makeError(at(loc, start + lead), "expected operand")};
        out.operands.push_back(Token{std::move(piece), static_cast<uint32_t>(start + lead + 1)});
        if (comma == std::string_view::npos)
            break;
        start = comma + 1;
    }
    return out;
}

} // namespace regvm::assembler
