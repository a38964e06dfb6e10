//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Out-of-line validity query for SourceLoc.  Locations synthesised by the
// decoder (bytecode carries no source) keep file_id zero, which printers use to
// elide the "path:line:col:" prefix.
//
//===----------------------------------------------------------------------===//

#include "support/source_location.hpp"

namespace regvm::support
{

/// @brief Determine whether the location carries a real source attachment.
/// @return True when the location originated from a tracked source file.
bool SourceLoc::isValid() const
{
    return file_id != 0;
}

} // namespace regvm::support
