//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_location.hpp
// Purpose: Declares the source location value attached to assembly statements
//          and diagnostics.
// Key invariants: file_id == 0 denotes an unknown location; line/column are
//                 1-based when known.
// Ownership/Lifetime: Value type with no dynamic ownership.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

namespace regvm::support
{

/// @brief Position within a source file registered with SourceManager.
/// @invariant file_id == 0 indicates an unknown location.
struct SourceLoc
{
    /// @brief Identifier assigned by SourceManager; 0 denotes invalid location.
    uint32_t file_id = 0;

    /// @brief One-based line number within the file; 0 when unknown.
    uint32_t line = 0;

    /// @brief One-based column number within the line; 0 when unknown.
    uint32_t column = 0;

    /// @brief Check whether the location references a registered file.
    [[nodiscard]] bool isValid() const;

    /// @brief Determine whether a 1-based line number is available.
    [[nodiscard]] bool hasLine() const
    {
        return line != 0;
    }

    /// @brief Determine whether a 1-based column number is available.
    [[nodiscard]] bool hasColumn() const
    {
        return column != 0;
    }
};

} // namespace regvm::support
