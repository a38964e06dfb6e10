//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the SourceManager used by the assembler and the trace sink.  Paths
// are normalised so that "./examples/fib.asm" and "examples/fib.asm" print the
// same way and resolve to one identifier.
//
//===----------------------------------------------------------------------===//

#include "support/source_manager.hpp"

#include "support/diag_expected.hpp"

#include <filesystem>
#include <iostream>
#include <limits>

namespace regvm::support
{
namespace
{
std::string normalizePath(std::string path)
{
    std::filesystem::path p(std::move(path));
    return p.lexically_normal().generic_string();
}
} // namespace

/// @brief Register a file path and assign it a stable identifier.
///
/// @details Identifiers start at one, leaving zero to represent an unknown
///          location.  Registering a path twice returns the original id.
///          When the identifier space is exhausted an error is printed and zero
///          is returned.
uint32_t SourceManager::addFile(std::string path)
{
    std::string normalized = normalizePath(std::move(path));

    if (auto it = path_to_id_.find(normalized); it != path_to_id_.end())
        return it->second;

    if (next_file_id_ > std::numeric_limits<uint32_t>::max())
    {
        printDiag(makeError({}, std::string{kSourceManagerFileIdOverflowMessage}), std::cerr);
        return 0;
    }

    const uint32_t file_id = static_cast<uint32_t>(next_file_id_++);
    files_.push_back(std::move(normalized));
    path_to_id_.emplace(files_.back(), file_id);
    return file_id;
}

std::string_view SourceManager::getPath(uint32_t file_id) const
{
    if (file_id == 0 || file_id > files_.size())
        return {};
    return files_[file_id - 1];
}

} // namespace regvm::support
