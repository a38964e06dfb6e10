//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_manager.hpp
// Purpose: Declares the registry mapping file identifiers to paths.
// Key invariants: File ID 0 is invalid; identical normalized paths share an id.
// Ownership/Lifetime: Manager owns file path strings.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>

namespace regvm::support
{

inline constexpr std::string_view kSourceManagerFileIdOverflowMessage =
    "source manager exhausted file identifier space";

/// @brief Maintains the mapping between numeric file identifiers and the
///        normalized paths they were registered with.
class SourceManager
{
  public:
    /// @brief Register file path @p path and return its id.
    /// @param path File system path.
    /// @return New or existing file identifier (>0 on success, 0 on overflow).
    uint32_t addFile(std::string path);

    /// @brief Retrieve path for @p file_id.
    /// @param file_id Identifier returned by addFile().
    /// @return File path view, empty when @p file_id is unknown.
    std::string_view getPath(uint32_t file_id) const;

  private:
    /// Stored paths; index i holds file id i + 1. A deque keeps references stable.
    std::deque<std::string> files_;

    /// Next identifier to assign; 64-bit so overflow is detectable.
    uint64_t next_file_id_ = 1;

    std::unordered_map<std::string, uint32_t> path_to_id_;
};

} // namespace regvm::support
