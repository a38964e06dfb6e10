//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/common/source_loader.cpp
// Purpose: Implements file loading for the regvm commands.
//
//===----------------------------------------------------------------------===//

#include "tools/common/source_loader.hpp"

#include <fstream>
#include <new>
#include <sstream>
#include <utility>

namespace regvm::tools::common
{
namespace
{
/// Inputs above this size cannot be a valid program or bytecode file.
constexpr std::streamoff kMaxInputSize = 16LL * 1024 * 1024;

support::Expected<std::string> readAll(const std::string &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        return support::Expected<std::string>(
            support::Diagnostic{support::Severity::Error, "unable to open " + path, {}});
    }

    in.seekg(0, std::ios::end);
    const auto fileSize = in.tellg();
    in.seekg(0, std::ios::beg);
    if (fileSize < 0 || fileSize > kMaxInputSize)
    {
        return support::Expected<std::string>(support::Diagnostic{
            support::Severity::Error, "input file too large: " + path + " (limit: 16 MB)", {}});
    }

    try
    {
        std::ostringstream ss;
        ss << in.rdbuf();
        return support::Expected<std::string>(ss.str());
    }
    catch (const std::bad_alloc &)
    {
        return support::Expected<std::string>(
            support::Diagnostic{support::Severity::Error, "out of memory reading " + path, {}});
    }
}
} // namespace

support::Expected<LoadedSource> loadSourceBuffer(const std::string &path,
                                                 support::SourceManager &sm)
{
    auto contents = readAll(path);
    if (!contents)
        return support::Expected<LoadedSource>(contents.error());

    const uint32_t fileId = sm.addFile(path);
    if (fileId == 0)
    {
        return support::Expected<LoadedSource>(
            support::makeError({}, std::string{support::kSourceManagerFileIdOverflowMessage}));
    }

    LoadedSource source{};
    source.buffer = std::move(contents.value());
    source.fileId = fileId;
    return support::Expected<LoadedSource>(std::move(source));
}

support::Expected<std::string> loadSourceFile(const std::string &path)
{
    return readAll(path);
}

} // namespace regvm::tools::common
