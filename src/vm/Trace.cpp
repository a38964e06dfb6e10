//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Trace.cpp
// Purpose: Emit one trace line per executed instruction.
// Key invariants: Each executed instruction produces at most one flushed line;
//                 source files are read at most once per sink.
//
//===----------------------------------------------------------------------===//

#include "vm/Trace.hpp"

#include "assembler/Serializer.hpp"
#include "support/source_manager.hpp"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <utility>

namespace regvm::vm
{

TraceSink::TraceSink(TraceConfig cfg) : cfg(cfg) {}

std::ostream &TraceSink::out() const
{
    return cfg.os ? *cfg.os : std::cerr;
}

/// @brief Retrieve cached file contents, loading from disk if necessary.
/// @details Returns null when no source manager is configured or the id is
///          unknown; an unreadable file yields an entry with no lines so the
///          lookup is not retried.
const TraceSink::FileCacheEntry *TraceSink::getOrLoadFile(uint32_t file_id)
{
    if (!cfg.sm || file_id == 0)
        return nullptr;
    auto it = fileCache.find(file_id);
    if (it != fileCache.end())
        return &it->second;

    FileCacheEntry entry;
    entry.path = std::string(cfg.sm->getPath(file_id));
    if (entry.path.empty())
        return nullptr;

    std::ifstream f(entry.path);
    if (f)
    {
        std::string line;
        while (std::getline(f, line))
        {
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            entry.lines.push_back(std::move(line));
        }
    }

    auto [pos, inserted] = fileCache.emplace(file_id, std::move(entry));
    (void)inserted;
    return &pos->second;
}

/// @brief Emit a trace line for a single executed instruction.
/// @details Instr mode prints the program counter and the instruction text.
///          Src mode prints "path:line: text" and falls back to the
///          instruction form when the instruction has no source location
///          (for example when running decoded bytecode).
void TraceSink::onStep(const assembler::Instr &in, const State &state)
{
    if (!cfg.enabled())
        return;
    std::ostream &os = out();

    if (cfg.mode == TraceConfig::Src && in.loc.isValid())
    {
        const auto *entry = getOrLoadFile(in.loc.file_id);
        if (entry)
        {
            os << "[trace] " << entry->path;
            if (in.loc.hasLine())
            {
                os << ':' << in.loc.line << ": ";
                if (in.loc.line <= entry->lines.size())
                {
                    const std::string &line = entry->lines[in.loc.line - 1];
                    const size_t start = line.find_first_not_of(" \t");
                    if (start != std::string::npos)
                        os << line.substr(start);
                }
            }
            os << '\n' << std::flush;
            return;
        }
    }

    const auto flags = os.flags();
    const auto fill = os.fill();
    os << "[trace] pc=" << std::dec << std::setw(4) << std::setfill('0') << state.pc;
    os.flags(flags);
    os.fill(fill);
    os << ' ' << assembler::formatInstr(in) << '\n' << std::flush;
}

} // namespace regvm::vm
