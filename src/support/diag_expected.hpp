//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diag_expected.hpp
// Purpose: Provides diagnostic helpers and a lightweight Expected container
//          used by every fallible operation in the toolchain.
// Key invariants: An Expected holds either a value or exactly one diagnostic.
// Ownership/Lifetime: Expected owns its value or diagnostic.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>

namespace regvm::support
{
using Diag = Diagnostic;

/// @brief Expected-style container pairing a value with a diagnostic on error.
/// @tparam T Stored value type when the operation succeeds.
template <class T> class Expected
{
  public:
    /// @brief Construct a successful result containing @p value.
    /// @details Disabled for arguments decaying to Diag so the error
    ///          constructor below is selected for diagnostics, and for
    ///          Expected itself so copies use the copy constructor.
    template <class U = T,
              class = std::enable_if_t<!std::is_same_v<std::decay_t<U>, Diag> &&
                                       !std::is_same_v<std::decay_t<U>, Expected>>>
    Expected(U &&value) : value_(std::forward<U>(value))
    {
    }

    /// @brief Construct an error result holding diagnostic @p diag.
    Expected(Diag diag) : error_(std::move(diag)) {}

    /// @brief Check whether a value is present.
    [[nodiscard]] bool hasValue() const
    {
        return value_.has_value();
    }

    /// @brief Allow use in boolean contexts to test success.
    explicit operator bool() const
    {
        return hasValue();
    }

    /// @brief Access the stored value; requires hasValue().
    T &value()
    {
        return *value_;
    }

    /// @brief Access the stored value; requires hasValue().
    const T &value() const
    {
        return *value_;
    }

    /// @brief Access the diagnostic describing the failure.
    const Diag &error() const &
    {
        return *error_;
    }

  private:
    std::optional<T> value_;
    std::optional<Diag> error_;
};

/// @brief Expected specialization for void success type.
template <> class Expected<void>
{
  public:
    /// @brief Construct a successful result with no payload.
    Expected() = default;

    /// @brief Construct an error result holding diagnostic @p diag.
    Expected(Diag diag);

    /// @brief Check whether the Expected represents success.
    [[nodiscard]] bool hasValue() const;

    /// @brief Allow use in boolean contexts to test success.
    explicit operator bool() const;

    /// @brief Access the diagnostic describing the failure.
    const Diag &error() const &;

  private:
    std::optional<Diag> error_;
};

namespace detail
{
/// @brief Convert diagnostic severity to lowercase string.
const char *diagSeverityToString(Severity severity);
} // namespace detail

/// @brief Create an error diagnostic with location and message.
Diag makeError(SourceLoc loc, std::string msg);

/// @brief Create a note diagnostic without location.
Diag makeNote(std::string msg);

/// @brief Print a single diagnostic to the provided stream.
/// @param diag Diagnostic to format.
/// @param os Output stream receiving the text.
/// @param sm Optional source manager to resolve file paths.
void printDiag(const Diag &diag, std::ostream &os, const SourceManager *sm = nullptr);

} // namespace regvm::support
