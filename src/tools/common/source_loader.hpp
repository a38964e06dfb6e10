//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/common/source_loader.hpp
// Purpose: Shared helpers for reading input files and registering them with
//          the SourceManager.
// Key invariants: Successful loads return a non-zero file id.
// Ownership/Lifetime: Returned buffers are owned by the caller.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"

#include <cstdint>
#include <string>

namespace regvm::tools::common
{

/// @brief File contents plus the id assigned by the SourceManager.
struct LoadedSource
{
    std::string buffer; ///< Full contents of the file.
    uint32_t fileId{0}; ///< Identifier assigned by SourceManager (0 indicates failure).
};

/// @brief Read @p path in binary mode and register it with @p sm.
/// @return Loaded buffer, or an error when the file cannot be opened, is too
///         large, or the SourceManager has run out of ids.
support::Expected<LoadedSource> loadSourceBuffer(const std::string &path,
                                                 support::SourceManager &sm);

/// @brief Read @p path without registering it.
support::Expected<std::string> loadSourceFile(const std::string &path);

} // namespace regvm::tools::common
