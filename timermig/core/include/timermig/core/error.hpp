#pragma once

#include <stdexcept>
#include <string>

namespace timermig::core {

/// @brief Base exception for all migration-engine errors.
///
/// Per-unit classification problems are never thrown: they end up in the
/// unit's verdict. Exceptions are reserved for misuse of the API and for
/// malformed values handed in by a caller.
///
/// @see InvalidCronError
/// @ingroup core
class MigrationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// @brief Thrown when a cron string cannot be parsed back into its fields.
///
/// For example, a string with the wrong number of fields or an empty
/// field between two separators.
///
/// @see parse_cron, MigrationError
/// @ingroup core
class InvalidCronError : public MigrationError {
public:
    using MigrationError::MigrationError;
};

} // namespace timermig::core
