//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/common/ArgvView.hpp
// Purpose: Lightweight non-owning view over argc/argv used by the command
//          dispatcher.
// Ownership/Lifetime: Borrows the argv array from main().
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string_view>

namespace regvm::tools
{

/// @brief Non-owning view over a suffix of the process arguments.
struct ArgvView
{
    int argc;
    char **argv;

    /// @brief Determine whether the view contains no arguments.
    [[nodiscard]] bool empty() const
    {
        return argc <= 0 || argv == nullptr;
    }

    /// @brief Access the first argument, or an empty view when there is none.
    [[nodiscard]] std::string_view front() const
    {
        return empty() ? std::string_view{} : std::string_view(argv[0]);
    }

    /// @brief Read the argument at @p index, returning an empty view on overflow.
    [[nodiscard]] std::string_view at(int index) const
    {
        if (index < 0 || index >= argc || argv == nullptr)
        {
            return std::string_view{};
        }
        return std::string_view(argv[index]);
    }

    /// @brief Produce a suffix view that skips the first @p count entries.
    [[nodiscard]] ArgvView drop_front(int count = 1) const
    {
        if (count >= argc)
        {
            return ArgvView{0, nullptr};
        }
        return ArgvView{argc - count, argv + count};
    }
};

} // namespace regvm::tools
