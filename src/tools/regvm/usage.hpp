//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/regvm/usage.hpp
// Purpose: Help and version banners for the regvm tool.
//
//===----------------------------------------------------------------------===//

#pragma once

namespace regvm::tools
{

/// @brief Print the version banner to std::cout.
void printVersion();

/// @brief Print command-line help to std::cerr.
void printUsage();

} // namespace regvm::tools
