//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Trace.hpp
// Purpose: Tracing configuration and sink for interpreter steps.
// Key invariants: Trace output is deterministic and line-oriented.
// Ownership/Lifetime: Sink holds configuration by value and borrows the
//                     source manager and output stream it names.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "assembler/Ast.hpp"
#include "vm/State.hpp"

#include <cstdint>
#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace regvm::support
{
class SourceManager;
} // namespace regvm::support

namespace regvm::vm
{

/// @brief Configuration for interpreter tracing.
struct TraceConfig
{
    /// @brief Tracing modes.
    enum Mode
    {
        Off,   ///< Tracing disabled
        Instr, ///< Trace decoded instructions
        Src    ///< Trace source lines
    } mode{Off};

    /// @brief Optional source manager for resolving file paths.
    const support::SourceManager *sm = nullptr;

    /// @brief Destination stream; std::cerr when null.
    std::ostream *os = nullptr;

    /// @brief Check whether tracing is enabled.
    bool enabled() const
    {
        return mode != Off;
    }
};

/// @brief Sink that formats and emits trace lines.
class TraceSink
{
  public:
    /// @brief Create sink with configuration @p cfg.
    explicit TraceSink(TraceConfig cfg = {});

    /// @brief Record execution of @p in at @p state.pc, before it runs.
    void onStep(const assembler::Instr &in, const State &state);

  private:
    /// @brief Cache entry describing a traced source file.
    struct FileCacheEntry
    {
        std::string path;               ///< File path as registered.
        std::vector<std::string> lines; ///< File contents split into lines.
    };

    /// @brief Retrieve cached file for @p file_id, loading it on first access.
    /// @return Pointer to cache entry or nullptr if unavailable.
    const FileCacheEntry *getOrLoadFile(uint32_t file_id);

    std::ostream &out() const;

    TraceConfig cfg; ///< Active configuration
    std::unordered_map<uint32_t, FileCacheEntry> fileCache; ///< Cached source text.
};

} // namespace regvm::vm
