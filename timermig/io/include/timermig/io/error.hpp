#pragma once

/// @file error.hpp
/// @brief Errors raised while reading fact files.
/// @ingroup io

#include <stdexcept>
#include <string>

namespace timermig::io {

/// @brief A fact file could not be turned into migration units.
///
/// Covers unreadable files, JSON syntax errors and schema violations such
/// as a unit without a name, a duplicated name, a flag that is not a
/// boolean or an unrecognised `timerPattern`. One bad unit rejects the
/// whole file; classification never sees partial input.
///
/// @ingroup io
/// @see load_units, load_units_from_string
class LoaderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

    /// @brief Prefix @p message with where in the input it was found.
    ///
    /// Produces `"units[2].timer: field 'usesTimerInfo' must be a boolean"`
    /// style messages.
    ///
    /// @param message  What is wrong.
    /// @param context  Path of the offending file, or a JSON path such as
    ///                 `units[0].schedule`.
    LoaderError(const std::string& message, const std::string& context)
        : std::runtime_error(context + ": " + message) {}
};

} // namespace timermig::io
